#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

/**
 * @brief RAII wrapper for non-blocking TCP client socket
 */
class TCPClient {
	int m_socket = -1;

public:
	/**
	 * @brief Construct a new TCPClient object without opening a socket
	 */
	TCPClient() = default;
	/**
	 * @brief Opens a new socket and starts connecting it to the endpoint
	 *
	 * @param hostname The hostname (IPv4 or IPv6 address, or domain name) of the server
	 * @param port The port on the server
	 * @throws std::runtime_error If the address can't be resolved or no socket could be opened
	 */
	TCPClient(const std::string &hostname, const std::string &port);

	TCPClient(const TCPClient &other) = delete;
	TCPClient &operator=(const TCPClient &other) = delete;

	TCPClient(TCPClient &&other) noexcept;
	TCPClient &operator=(TCPClient &&other) noexcept;
	/**
	 * @brief Opens a new socket and starts connecting it to the endpoint
	 *
	 * The connection is established in background, use connect_error() once
	 * the socket becomes writable to learn the outcome.
	 * @throws std::runtime_error If the address can't be resolved or no socket could be opened
	 */
	void connect(const std::string &hostname, const std::string &port);
	/**
	 * @brief Result of a background connect
	 *
	 * @return std::nullopt if the socket is connected
	 * @return a description of the error otherwise
	 */
	[[nodiscard]] std::optional<std::string> connect_error() const;
	/**
	 * @brief Sends data to the peer
	 *
	 * This function may send the data partially. In which case the caller should call the function
	 * until the sum of all bytes sent is equal to the size of the initial span.
	 * @param buffer The span that contains data to send
	 * @return The non-negative value indicating the number of bytes successfully sent
	 * @return -1 indicating that the call would normally block and no data was sent
	 * @throws std::runtime_error If send() returned an error
	 */
	[[nodiscard]] long send(std::span<const uint8_t> buffer) const;
	/**
	 * @brief Receives data from the peer
	 *
	 * @param buffer The span where the data will be written to
	 * @return The positive value indicating the number of bytes successfully recved
	 * @return -1 indicating that the call would normally block and no data was recved
	 * @return 0 if connection was terminated by the peer
	 * @throws std::runtime_error If recv() returned an error
	 */
	[[nodiscard]] long recv(std::span<uint8_t> buffer) const;

	/**
	 * @brief Terminates the connection if it was open
	 */
	void disconnect();

	/**
	 * @brief Returns the underlying file descriptor
	 *
	 * @return The file descriptor integer or -1 if socket is not open
	 * @note The caller should not close the descriptor manually
	 */
	[[nodiscard]] int get_fd() const;

	~TCPClient();
};
