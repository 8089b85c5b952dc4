#pragma once

#include "socket.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct PeerAddress {
	std::string host;
	uint16_t port = 0;

	auto operator<=>(const PeerAddress &other) const = default;

	/**
	 * @brief Parses "host:port", IPv6 hosts are written in brackets: "[::1]:6881"
	 */
	[[nodiscard]] static std::optional<PeerAddress> parse(std::string_view text);
	[[nodiscard]] std::string to_string() const;
};

/**
 * @brief Supplies peer addresses, polled repeatedly during a download
 */
class PeerSource {
public:
	[[nodiscard]] virtual std::vector<PeerAddress> poll_peers() = 0;
	virtual ~PeerSource() = default;
};

/**
 * @brief Fixed list of peers, e.g. given on the command line
 */
class StaticPeerSource final : public PeerSource {
	std::vector<PeerAddress> m_peers;

public:
	explicit StaticPeerSource(std::vector<PeerAddress> peers);

	[[nodiscard]] std::vector<PeerAddress> poll_peers() override;
};

enum class ChannelStatus {
	CONNECTING,
	CONNECTED,
	FAILED,
};

/**
 * @brief Byte stream to one peer
 */
class PeerChannel {
public:
	/**
	 * @brief Progress of the connection, checked without blocking
	 */
	[[nodiscard]] virtual ChannelStatus status() = 0;
	/**
	 * @brief Why the channel failed, empty if it didn't
	 */
	[[nodiscard]] virtual std::string error() const = 0;
	/**
	 * @return number of bytes sent, -1 if the call would block
	 * @throws std::runtime_error on transport errors
	 */
	[[nodiscard]] virtual long send(std::span<const uint8_t> bytes) = 0;
	/**
	 * @return number of bytes received, -1 if the call would block, 0 if the peer closed
	 * @throws std::runtime_error on transport errors
	 */
	[[nodiscard]] virtual long recv(std::span<uint8_t> buffer) = 0;
	/**
	 * @brief Descriptor to poll on, -1 if the channel is not backed by one
	 */
	[[nodiscard]] virtual int fd() const = 0;
	virtual ~PeerChannel() = default;
};

/**
 * @brief Creates channels and waits for them to become ready
 */
class Connector {
public:
	struct Interest {
		PeerChannel *channel;
		bool want_write;
	};

	/**
	 * @brief Starts connecting, never blocks
	 *
	 * Failures are reported through the returned channel's status().
	 */
	[[nodiscard]] virtual std::unique_ptr<PeerChannel> open(const PeerAddress &address) = 0;
	/**
	 * @brief Waits until one of the channels can make progress or the timeout expires
	 */
	virtual void wait(std::span<const Interest> channels, std::chrono::milliseconds timeout) = 0;
	virtual ~Connector() = default;
};

/**
 * @brief Non-blocking TCP channel
 */
class TcpChannel final : public PeerChannel {
	TCPClient m_client;
	bool m_connected = false;
	std::string m_error;

public:
	explicit TcpChannel(const PeerAddress &address);

	[[nodiscard]] ChannelStatus status() override;
	[[nodiscard]] std::string error() const override;
	[[nodiscard]] long send(std::span<const uint8_t> bytes) override;
	[[nodiscard]] long recv(std::span<uint8_t> buffer) override;
	[[nodiscard]] int fd() const override;
};

/**
 * @brief Opens TcpChannels and multiplexes them with ::poll
 */
class TcpConnector final : public Connector {
public:
	[[nodiscard]] std::unique_ptr<PeerChannel> open(const PeerAddress &address) override;
	void wait(std::span<const Interest> channels, std::chrono::milliseconds timeout) override;
};
