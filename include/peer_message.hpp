#pragma once

#include "utils.hpp"

#include <tl/expected.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace message
{

enum class Id : uint8_t {
	CHOKE = 0,
	UNCHOKE = 1,
	INTERESTED = 2,
	NOT_INTERESTED = 3,
	HAVE = 4,
	BITFIELD = 5,
	REQUEST = 6,
	PIECE = 7,
	CANCEL = 8,
	PORT = 9,
};

inline constexpr size_t handshake_length = 68;
inline constexpr size_t length_prefix_size = 4;
/**
 * Largest frame we accept. A piece message carries one block, blocks are 16 KiB,
 * but some clients serve bigger ones when asked, so allow up to 1 MiB of data.
 */
inline constexpr uint32_t max_message_length = (1u << 20) + 9;

enum class ParseError {
	BAD_LENGTH,
	UNKNOWN_ID,
	BAD_BITFIELD,
	BAD_HANDSHAKE,
};

[[nodiscard]] std::string to_string(ParseError err);

class Message {
public:
	[[nodiscard]] virtual std::span<const uint8_t> serialized() const & = 0;
	[[nodiscard]] virtual std::span<const uint8_t> serialized() const && = delete;
	virtual ~Message() = default;
};

struct Handshake final : public Message {
private:
	std::array<uint8_t, handshake_length> m_data{ "\x13"
						      "BitTorrent protocol" };

public:
	Handshake() = default;
	Handshake(std::span<const uint8_t> info_hash, std::span<const uint8_t> peer_id);
	/**
	 * @brief Creates handshake from received bytes
	 *
	 * @throws std::invalid_argument if the span is not exactly 68 bytes long
	 */
	explicit Handshake(std::span<const uint8_t> handshake);

	[[nodiscard]] std::span<const uint8_t> get_reserved() const;
	[[nodiscard]] std::span<const uint8_t> get_info_hash() const;
	[[nodiscard]] std::span<const uint8_t> get_peer_id() const;

	[[nodiscard]] std::span<const uint8_t> serialized() const & override;
	/**
	 * @brief Checks protocol string and info hash
	 */
	[[nodiscard]] bool is_valid(std::span<const uint8_t> info_hash) const;
};

struct KeepAlive final : public Message {
private:
	std::array<uint8_t, 4> m_data{ 0, 0, 0, 0 };

public:
	KeepAlive() = default;
	[[nodiscard]] std::span<const uint8_t> serialized() const & override;
};

/**
 * @brief Messages with an id and no payload
 */
template <Id id>
struct Flag final : public Message {
private:
	std::array<uint8_t, 5> m_data{ 0, 0, 0, 1, static_cast<uint8_t>(id) };

public:
	Flag() = default;
	[[nodiscard]] std::span<const uint8_t> serialized() const & override
	{
		return m_data;
	}
};

using Choke = Flag<Id::CHOKE>;
using Unchoke = Flag<Id::UNCHOKE>;
using Interested = Flag<Id::INTERESTED>;
using NotInterested = Flag<Id::NOT_INTERESTED>;

struct Have final : public Message {
private:
	std::array<uint8_t, 9> m_data{ 0, 0, 0, 5, 4 };

public:
	explicit Have(uint32_t index);

	[[nodiscard]] uint32_t get_index() const;

	[[nodiscard]] std::span<const uint8_t> serialized() const & override;
};

struct Bitfield final : public Message {
private:
	/**
	 * @brief an exact number of fields in bitfield
	 *
	 * This number is equal to number of SHA1 hashes in a torrent file and
	 * to number of pieces in a given download. If it is not a multiple of 8,
	 * then all spare fields must be set to 0
	 */
	size_t m_bitfield_length = 0;
	std::vector<uint8_t> m_data = { 0, 0, 0, 1, 5 };

	[[nodiscard]] std::span<const uint8_t> get_bf() const;

public:
	Bitfield() = default;

	/**
	 * @brief Create empty bitfield ctor
	 *
	 * @param length an amount of pieces
	 */
	explicit Bitfield(size_t length);

	/**
	 * @brief Creates bitfield from received frame
	 *
	 * @return ParseError::BAD_BITFIELD if the size doesn't match or spare bits are set
	 */
	[[nodiscard]] static tl::expected<Bitfield, ParseError>
	from_frame(std::span<const uint8_t> frame, size_t length);

	void set_index(size_t index, bool value);
	[[nodiscard]] bool get_index(size_t index) const;
	/**
	 * @brief Get the bitfield length (in bits)
	 */
	[[nodiscard]] size_t get_bf_size() const;
	[[nodiscard]] size_t count() const;
	[[nodiscard]] bool none() const;
	[[nodiscard]] bool all() const;

	[[nodiscard]] std::span<const uint8_t> serialized() const & override;
};

struct Cancel;

/**
 * @brief Common layout of request and cancel: index, begin, length
 */
template <Id id>
struct BlockFields : public Message {
private:
	std::array<uint8_t, 17> m_data{ 0, 0, 0, 13, static_cast<uint8_t>(id) };

public:
	BlockFields() = default;
	BlockFields(uint32_t index, uint32_t begin, uint32_t length);

	[[nodiscard]] uint32_t get_index() const;
	[[nodiscard]] uint32_t get_begin() const;
	[[nodiscard]] uint32_t get_length() const;

	[[nodiscard]] std::span<const uint8_t> serialized() const & override;
};

struct Request final : public BlockFields<Id::REQUEST> {
	using BlockFields::BlockFields;

	[[nodiscard]] message::Cancel create_cancel() const;
};

struct Cancel final : public BlockFields<Id::CANCEL> {
	using BlockFields::BlockFields;
};

struct Piece final : public Message {
private:
	std::vector<uint8_t> m_data;

public:
	// creates piece from received frame, which must be at least 13 bytes long
	explicit Piece(std::vector<uint8_t> &&frame);
	Piece(uint32_t index, uint32_t begin, std::span<const uint8_t> block);

	Piece(const Piece &) = delete; // make it non-copyable so any possible copy
	Piece &operator=(const Piece &) = delete; // will not go silent

	Piece(Piece &&other) noexcept = default;
	Piece &operator=(Piece &&) noexcept = default;

	[[nodiscard]] uint32_t get_index() const;
	[[nodiscard]] uint32_t get_begin() const;
	[[nodiscard]] uint32_t get_length() const;
	[[nodiscard]] std::span<const uint8_t> get_data() const;

	[[nodiscard]] std::span<const uint8_t> serialized() const & override;
};

struct Port final : public Message {
private:
	std::array<uint8_t, 7> m_data{ 0, 0, 0, 3, 9 };

public:
	explicit Port(uint16_t port);

	[[nodiscard]] uint16_t get_port() const;

	[[nodiscard]] std::span<const uint8_t> serialized() const & override;
};

using Inbound = std::variant<KeepAlive, Choke, Unchoke, Interested, NotInterested, Have, Bitfield,
			     Request, Piece, Cancel, Port>;

/**
 * @brief Parses one complete frame (length prefix included)
 *
 * @param pieces number of pieces in the torrent, needed to validate bitfields
 */
[[nodiscard]] tl::expected<Inbound, ParseError> parse(std::vector<uint8_t> &&frame, size_t pieces);

/**
 * @brief Cuts a byte stream into a handshake followed by length-prefixed frames
 *
 * Bytes may be fed in chunks of any size. Each call to next() returns at most
 * one complete frame.
 */
class FrameReader {
	std::vector<uint8_t> m_buffer;
	size_t m_read_offset = 0;
	bool m_expect_handshake = true;

public:
	FrameReader() = default;

	void feed(std::span<const uint8_t> bytes);

	/**
	 * @return the next frame, std::nullopt if it hasn't fully arrived yet
	 * @return ParseError::BAD_LENGTH if the length prefix exceeds max_message_length
	 * @return ParseError::BAD_HANDSHAKE if the stream doesn't start with a handshake
	 */
	[[nodiscard]] tl::expected<std::optional<std::vector<uint8_t>>, ParseError> next();

	[[nodiscard]] size_t buffered() const;
};

} // namespace message
