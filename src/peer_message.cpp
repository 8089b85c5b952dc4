#include "peer_message.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace message
{

static void write_u32(uint8_t *dst, uint32_t value)
{
	value = htonl(value);
	memcpy(dst, &value, sizeof value);
}

static uint32_t read_u32(const uint8_t *src)
{
	uint32_t value = 0;
	memcpy(&value, src, sizeof value);
	return ntohl(value);
}

std::string to_string(ParseError err)
{
	switch (err)
	{
	case ParseError::BAD_LENGTH:
		return "bad message length";
	case ParseError::UNKNOWN_ID:
		return "unknown message id";
	case ParseError::BAD_BITFIELD:
		return "malformed bitfield";
	case ParseError::BAD_HANDSHAKE:
		return "malformed handshake";
	}
	return "unknown error";
}

// Handshake

static constexpr size_t pstr_end = 1 + 19;
static constexpr size_t info_hash_begin = pstr_end + 8;
static constexpr size_t peer_id_begin = info_hash_begin + 20;

Handshake::Handshake(const std::span<const uint8_t> info_hash,
		     const std::span<const uint8_t> peer_id)
{
	std::copy_n(info_hash.begin(), std::min<size_t>(info_hash.size(), 20),
		    m_data.begin() + info_hash_begin);
	std::copy_n(peer_id.begin(), std::min<size_t>(peer_id.size(), 20),
		    m_data.begin() + peer_id_begin);
}

Handshake::Handshake(std::span<const uint8_t> handshake)
{
	if (handshake.size() != handshake_length)
	{
		throw std::invalid_argument("Handshake must be 68 bytes long");
	}
	std::copy(handshake.begin(), handshake.end(), m_data.begin());
}

std::span<const uint8_t> Handshake::serialized() const &
{
	return m_data;
}

std::span<const uint8_t> Handshake::get_reserved() const
{
	return { m_data.begin() + pstr_end, 8 };
}

std::span<const uint8_t> Handshake::get_info_hash() const
{
	return { m_data.begin() + info_hash_begin, 20 };
}

std::span<const uint8_t> Handshake::get_peer_id() const
{
	return { m_data.begin() + peer_id_begin, 20 };
}

bool Handshake::is_valid(std::span<const uint8_t> info_hash) const
{
	const char *boilerplate = "\x13"
				  "BitTorrent protocol";
	const bool pstr_ok = std::equal(m_data.begin(), m_data.begin() + pstr_end,
					reinterpret_cast<const uint8_t *>(boilerplate));
	const bool hash_ok = info_hash.size() == 20 &&
			     std::equal(info_hash.begin(), info_hash.end(),
					m_data.begin() + info_hash_begin);
	return pstr_ok && hash_ok;
}

// KeepAlive

std::span<const uint8_t> KeepAlive::serialized() const &
{
	return m_data;
}

// Have

Have::Have(uint32_t index)
{
	write_u32(m_data.data() + 5, index);
}

uint32_t Have::get_index() const
{
	return read_u32(m_data.data() + 5);
}

std::span<const uint8_t> Have::serialized() const &
{
	return m_data;
}

// Bitfield

Bitfield::Bitfield(const size_t length)
	: m_bitfield_length(length)
	, m_data(5 + (length + 7) / 8, 0)
{
	write_u32(m_data.data(), static_cast<uint32_t>(m_data.size() - 4));
	m_data[4] = static_cast<uint8_t>(Id::BITFIELD);
}

tl::expected<Bitfield, ParseError> Bitfield::from_frame(std::span<const uint8_t> frame,
							size_t length)
{
	Bitfield ret(length);
	if (frame.size() != ret.m_data.size())
	{
		return tl::make_unexpected(ParseError::BAD_BITFIELD);
	}
	std::copy(frame.begin() + 5, frame.end(), ret.m_data.begin() + 5);

	for (size_t i = length; i < ret.get_bf().size() * 8; ++i)
	{
		if (ret.get_index(i))
		{
			return tl::make_unexpected(ParseError::BAD_BITFIELD);
		}
	}
	return ret;
}

std::span<const uint8_t> Bitfield::get_bf() const
{
	return { m_data.data() + 5, m_data.size() - 5 };
}

void Bitfield::set_index(const size_t index, const bool value)
{
	if (index >= m_bitfield_length)
	{
		throw std::out_of_range("Bitfield index out of range");
	}
	if (value)
	{
		m_data[5 + index / 8] |= static_cast<uint8_t>(1) << (7 - index % 8);
	}
	else
	{
		m_data[5 + index / 8] &= ~(static_cast<uint8_t>(1) << (7 - index % 8));
	}
}

bool Bitfield::get_index(const size_t index) const
{
	if (5 + index / 8 >= m_data.size())
	{
		return false;
	}
	return (m_data[5 + index / 8] & static_cast<uint8_t>(1) << (7 - index % 8)) != 0;
}

size_t Bitfield::get_bf_size() const
{
	return m_bitfield_length;
}

size_t Bitfield::count() const
{
	size_t ret = 0;
	for (const uint8_t byte : get_bf())
	{
		ret += static_cast<size_t>(std::popcount(byte));
	}
	return ret;
}

bool Bitfield::none() const
{
	return count() == 0;
}

bool Bitfield::all() const
{
	return count() == m_bitfield_length;
}

std::span<const uint8_t> Bitfield::serialized() const &
{
	return m_data;
}

// Request and Cancel

template <Id id>
BlockFields<id>::BlockFields(uint32_t index, uint32_t begin, uint32_t length)
{
	write_u32(m_data.data() + 5, index);
	write_u32(m_data.data() + 9, begin);
	write_u32(m_data.data() + 13, length);
}

template <Id id>
uint32_t BlockFields<id>::get_index() const
{
	return read_u32(m_data.data() + 5);
}

template <Id id>
uint32_t BlockFields<id>::get_begin() const
{
	return read_u32(m_data.data() + 9);
}

template <Id id>
uint32_t BlockFields<id>::get_length() const
{
	return read_u32(m_data.data() + 13);
}

template <Id id>
std::span<const uint8_t> BlockFields<id>::serialized() const &
{
	return m_data;
}

template struct BlockFields<Id::REQUEST>;
template struct BlockFields<Id::CANCEL>;

message::Cancel Request::create_cancel() const
{
	return { get_index(), get_begin(), get_length() };
}

// Piece

Piece::Piece(std::vector<uint8_t> &&frame)
	: m_data(std::move(frame))
{
	if (m_data.size() < 13)
	{
		throw std::invalid_argument("Piece frame is too short");
	}
}

Piece::Piece(uint32_t index, uint32_t begin, std::span<const uint8_t> block)
	: m_data(13 + block.size())
{
	write_u32(m_data.data(), static_cast<uint32_t>(9 + block.size()));
	m_data[4] = static_cast<uint8_t>(Id::PIECE);
	write_u32(m_data.data() + 5, index);
	write_u32(m_data.data() + 9, begin);
	std::copy(block.begin(), block.end(), m_data.begin() + 13);
}

uint32_t Piece::get_index() const
{
	return read_u32(m_data.data() + 5);
}

uint32_t Piece::get_begin() const
{
	return read_u32(m_data.data() + 9);
}

uint32_t Piece::get_length() const
{
	return m_data.size() - 13;
}

std::span<const uint8_t> Piece::get_data() const
{
	return { m_data.data() + 13, m_data.size() - 13 };
}

std::span<const uint8_t> Piece::serialized() const &
{
	return m_data;
}

// Port

Port::Port(uint16_t port)
{
	port = htons(port);
	memcpy(m_data.data() + 5, &port, sizeof port);
}

uint16_t Port::get_port() const
{
	uint16_t port = 0;
	memcpy(&port, m_data.data() + 5, sizeof port);
	return ntohs(port);
}

std::span<const uint8_t> Port::serialized() const &
{
	return m_data;
}

// parse

tl::expected<Inbound, ParseError> parse(std::vector<uint8_t> &&frame, size_t pieces)
{
	if (frame.size() < length_prefix_size ||
	    read_u32(frame.data()) != frame.size() - length_prefix_size)
	{
		return tl::make_unexpected(ParseError::BAD_LENGTH);
	}
	if (frame.size() == length_prefix_size)
	{
		return KeepAlive();
	}

	const size_t payload = frame.size() - length_prefix_size - 1;
	const auto expect_payload = [payload](size_t size) { return payload == size; };

	switch (static_cast<Id>(frame[4]))
	{
	case Id::CHOKE:
		if (!expect_payload(0))
		{
			break;
		}
		return Choke();
	case Id::UNCHOKE:
		if (!expect_payload(0))
		{
			break;
		}
		return Unchoke();
	case Id::INTERESTED:
		if (!expect_payload(0))
		{
			break;
		}
		return Interested();
	case Id::NOT_INTERESTED:
		if (!expect_payload(0))
		{
			break;
		}
		return NotInterested();
	case Id::HAVE:
		if (!expect_payload(4))
		{
			break;
		}
		return Have(read_u32(frame.data() + 5));
	case Id::BITFIELD:
		return Bitfield::from_frame(frame, pieces).map([](Bitfield &&bf) {
			return Inbound(std::move(bf));
		});
	case Id::REQUEST:
		if (!expect_payload(12))
		{
			break;
		}
		return Request(read_u32(frame.data() + 5), read_u32(frame.data() + 9),
			       read_u32(frame.data() + 13));
	case Id::PIECE:
		if (payload < 8)
		{
			break;
		}
		return Inbound(std::in_place_type<Piece>, std::move(frame));
	case Id::CANCEL:
		if (!expect_payload(12))
		{
			break;
		}
		return Cancel(read_u32(frame.data() + 5), read_u32(frame.data() + 9),
			      read_u32(frame.data() + 13));
	case Id::PORT:
		if (!expect_payload(2))
		{
			break;
		}
		return Port(static_cast<uint16_t>(frame[5] << 8 | frame[6]));
	default:
		return tl::make_unexpected(ParseError::UNKNOWN_ID);
	}
	return tl::make_unexpected(ParseError::BAD_LENGTH);
}

// FrameReader

void FrameReader::feed(std::span<const uint8_t> bytes)
{
	// drop what was already handed out once it dominates the buffer
	if (m_read_offset > 0 && m_read_offset >= m_buffer.size() / 2)
	{
		m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_read_offset));
		m_read_offset = 0;
	}
	m_buffer.insert(m_buffer.end(), bytes.begin(), bytes.end());
}

tl::expected<std::optional<std::vector<uint8_t>>, ParseError> FrameReader::next()
{
	const size_t available = m_buffer.size() - m_read_offset;
	const uint8_t *begin = m_buffer.data() + m_read_offset;

	if (m_expect_handshake)
	{
		if (available > 0 && begin[0] != 19)
		{
			return tl::make_unexpected(ParseError::BAD_HANDSHAKE);
		}
		if (available < handshake_length)
		{
			return std::nullopt;
		}
		m_expect_handshake = false;
		m_read_offset += handshake_length;
		return std::vector<uint8_t>(begin, begin + handshake_length);
	}

	if (available < length_prefix_size)
	{
		return std::nullopt;
	}
	const uint32_t length = read_u32(begin);
	if (length > max_message_length)
	{
		return tl::make_unexpected(ParseError::BAD_LENGTH);
	}
	if (available < length_prefix_size + length)
	{
		return std::nullopt;
	}
	m_read_offset += length_prefix_size + length;
	return std::vector<uint8_t>(begin, begin + length_prefix_size + length);
}

size_t FrameReader::buffered() const
{
	return m_buffer.size() - m_read_offset;
}

} // namespace message
