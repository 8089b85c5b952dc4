#include "bencode.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bencode
{

// Buffer ------------------------------------------------------------------------------

Buffer::Buffer(std::vector<uint8_t> bytes)
	: m_bytes(std::move(bytes))
{
}

Buffer::Buffer(std::string_view bytes)
	: m_bytes(bytes.begin(), bytes.end())
{
}

std::span<const uint8_t> Buffer::bytes() const
{
	return m_bytes;
}

size_t Buffer::size() const
{
	return m_bytes.size();
}

// ByteString --------------------------------------------------------------------------

ByteString::ByteString(const char *text)
	: ByteString(std::string_view(text))
{
}

ByteString::ByteString(std::string_view text)
	: m_owned(std::make_shared<const std::vector<uint8_t>>(text.begin(), text.end()))
{
	m_view = *m_owned;
}

ByteString::ByteString(const std::string &text)
	: ByteString(std::string_view(text))
{
}

ByteString::ByteString(std::span<const uint8_t> bytes)
	: m_owned(std::make_shared<const std::vector<uint8_t>>(bytes.begin(), bytes.end()))
{
	m_view = *m_owned;
}

ByteString ByteString::borrow(const Buffer &source, size_t offset, size_t length)
{
	ByteString ret;
	ret.m_view = source.bytes().subspan(offset, length);
	ret.m_offset = offset;
	ret.m_borrowed = true;
	return ret;
}

std::span<const uint8_t> ByteString::bytes() const
{
	return m_view;
}

std::string_view ByteString::view() const
{
	return { reinterpret_cast<const char *>(m_view.data()), m_view.size() };
}

size_t ByteString::size() const
{
	return m_view.size();
}

bool ByteString::empty() const
{
	return m_view.empty();
}

size_t ByteString::offset() const
{
	return m_offset;
}

bool ByteString::is_borrowed() const
{
	return m_borrowed;
}

static bool is_valid_utf8(std::span<const uint8_t> bytes)
{
	size_t i = 0;
	while (i < bytes.size())
	{
		const uint8_t lead = bytes[i];
		size_t extra = 0;
		uint32_t code_point = 0;
		if (lead < 0x80)
		{
			++i;
			continue;
		}
		if ((lead & 0xe0) == 0xc0)
		{
			extra = 1;
			code_point = lead & 0x1f;
		}
		else if ((lead & 0xf0) == 0xe0)
		{
			extra = 2;
			code_point = lead & 0x0f;
		}
		else if ((lead & 0xf8) == 0xf0)
		{
			extra = 3;
			code_point = lead & 0x07;
		}
		else
		{
			return false;
		}
		if (i + extra >= bytes.size())
		{
			return false;
		}
		for (size_t j = 1; j <= extra; ++j)
		{
			if ((bytes[i + j] & 0xc0) != 0x80)
			{
				return false;
			}
			code_point = (code_point << 6) | (bytes[i + j] & 0x3f);
		}
		// overlong forms, surrogates and values past U+10FFFF
		static constexpr uint32_t min_value[] = { 0, 0x80, 0x800, 0x10000 };
		if (code_point < min_value[extra] || code_point > 0x10ffff ||
		    (code_point >= 0xd800 && code_point <= 0xdfff))
		{
			return false;
		}
		i += extra + 1;
	}
	return true;
}

std::optional<std::string_view> ByteString::as_text() const
{
	if (!is_valid_utf8(m_view))
	{
		return std::nullopt;
	}
	return view();
}

bool operator==(const ByteString &lhs, const ByteString &rhs)
{
	return std::ranges::equal(lhs.m_view, rhs.m_view);
}

std::strong_ordering operator<=>(const ByteString &lhs, const ByteString &rhs)
{
	return std::lexicographical_compare_three_way(lhs.m_view.begin(), lhs.m_view.end(),
						      rhs.m_view.begin(), rhs.m_view.end());
}

// Value -------------------------------------------------------------------------------

Value::Value(integer value)
	: m_data(value)
{
}

Value::Value(int value)
	: m_data(static_cast<integer>(value))
{
}

Value::Value(ByteString value)
	: m_data(std::move(value))
{
}

Value::Value(const char *value)
	: m_data(ByteString(value))
{
}

Value::Value(list value)
	: m_data(std::move(value))
{
}

Value::Value(dict value)
	: m_data(std::move(value))
{
}

Value::Type Value::type() const
{
	return static_cast<Type>(m_data.index());
}

bool Value::is_integer() const
{
	return std::holds_alternative<integer>(m_data);
}

bool Value::is_string() const
{
	return std::holds_alternative<ByteString>(m_data);
}

bool Value::is_list() const
{
	return std::holds_alternative<list>(m_data);
}

bool Value::is_dict() const
{
	return std::holds_alternative<dict>(m_data);
}

integer Value::as_integer() const
{
	return std::get<integer>(m_data);
}

const ByteString &Value::as_string() const
{
	return std::get<ByteString>(m_data);
}

const list &Value::as_list() const
{
	return std::get<list>(m_data);
}

const dict &Value::as_dict() const
{
	return std::get<dict>(m_data);
}

list &Value::as_list()
{
	return std::get<list>(m_data);
}

dict &Value::as_dict()
{
	return std::get<dict>(m_data);
}

const Value *Value::find(std::string_view key) const
{
	const auto *entries = std::get_if<dict>(&m_data);
	if (entries == nullptr)
	{
		return nullptr;
	}
	const auto it = std::find_if(entries->begin(), entries->end(),
				     [key](const DictEntry &entry) { return entry.key.view() == key; });
	return it == entries->end() ? nullptr : &it->value;
}

Value &Value::insert(ByteString key, Value value)
{
	auto &entries = std::get<dict>(m_data);
	for (auto &entry : entries)
	{
		if (entry.key == key)
		{
			entry.value = std::move(value);
			return entry.value;
		}
	}
	return entries.emplace_back(DictEntry{ std::move(key), std::move(value) }).value;
}

// entries sorted by key, a repeated key keeps its last value like insert() does
static std::vector<const DictEntry *> canonical_entries(const dict &entries)
{
	std::vector<const DictEntry *> sorted;
	sorted.reserve(entries.size());
	for (const auto &entry : entries)
	{
		sorted.push_back(&entry);
	}
	std::stable_sort(sorted.begin(), sorted.end(),
			 [](const DictEntry *lhs, const DictEntry *rhs) { return lhs->key < rhs->key; });

	std::vector<const DictEntry *> ret;
	ret.reserve(sorted.size());
	for (const DictEntry *entry : sorted)
	{
		if (!ret.empty() && ret.back()->key == entry->key)
		{
			ret.back() = entry;
		}
		else
		{
			ret.push_back(entry);
		}
	}
	return ret;
}

bool operator==(const Value &lhs, const Value &rhs)
{
	if (!lhs.is_dict() || !rhs.is_dict())
	{
		return lhs.m_data == rhs.m_data;
	}
	// maps compare by content, not by the order their entries were added in
	const auto lhs_entries = canonical_entries(lhs.as_dict());
	const auto rhs_entries = canonical_entries(rhs.as_dict());
	return std::equal(lhs_entries.begin(), lhs_entries.end(), rhs_entries.begin(),
			  rhs_entries.end(), [](const DictEntry *l, const DictEntry *r) {
				  return l->key == r->key && l->value == r->value;
			  });
}

// MalformedEncoding -------------------------------------------------------------------

std::string MalformedEncoding::describe() const
{
	std::string reason;
	switch (kind)
	{
	case ErrorKind::UNEXPECTED_END:
		reason = "unexpected end of input";
		break;
	case ErrorKind::INVALID_PREFIX:
		reason = "unknown value type prefix";
		break;
	case ErrorKind::INVALID_INTEGER:
		reason = "integer contains non digit character";
		break;
	case ErrorKind::LEADING_ZERO:
		reason = "number contains leading zeroes";
		break;
	case ErrorKind::NEGATIVE_ZERO:
		reason = "negative zero";
		break;
	case ErrorKind::INTEGER_OVERFLOW:
		reason = "integer does not fit in 64 bits";
		break;
	case ErrorKind::INVALID_LENGTH:
		reason = "invalid string length";
		break;
	case ErrorKind::NON_STRING_KEY:
		reason = "dictionary key is not a byte string";
		break;
	case ErrorKind::UNSORTED_KEYS:
		reason = "dictionary keys are not sorted";
		break;
	case ErrorKind::DUPLICATE_KEY:
		reason = "duplicate dictionary key";
		break;
	case ErrorKind::NESTING_TOO_DEEP:
		reason = "nesting is too deep";
		break;
	case ErrorKind::TRAILING_DATA:
		reason = "trailing data after value";
		break;
	}
	return reason + " at offset " + std::to_string(position);
}

// Decoder -----------------------------------------------------------------------------

namespace
{

constexpr uint8_t int_prefix = 'i';
constexpr uint8_t list_prefix = 'l';
constexpr uint8_t dict_prefix = 'd';
constexpr uint8_t end_suffix = 'e';

bool is_digit(uint8_t ch)
{
	return ch >= '0' && ch <= '9';
}

/**
 * @brief Recursive descent over a borrowed buffer
 *
 * The decoder only moves forward. It never writes anywhere except into the
 * values it returns, so a failure leaves nothing behind.
 */
class Decoder {
	const Buffer &m_source;
	std::span<const uint8_t> m_input;
	size_t m_pos = 0;
	size_t m_depth = 0;

	[[nodiscard]] tl::unexpected<MalformedEncoding> fail(ErrorKind kind) const
	{
		return tl::make_unexpected(MalformedEncoding{ kind, m_pos });
	}

	[[nodiscard]] bool at_end() const
	{
		return m_pos >= m_input.size();
	}

	tl::expected<integer, MalformedEncoding> parse_integer()
	{
		++m_pos; // 'i'
		bool negative = false;
		if (!at_end() && m_input[m_pos] == '-')
		{
			negative = true;
			++m_pos;
		}
		if (at_end())
		{
			return fail(ErrorKind::UNEXPECTED_END);
		}
		if (!is_digit(m_input[m_pos]))
		{
			return fail(ErrorKind::INVALID_INTEGER);
		}
		if (m_input[m_pos] == '0')
		{
			if (negative)
			{
				return fail(ErrorKind::NEGATIVE_ZERO);
			}
			if (m_pos + 1 < m_input.size() && is_digit(m_input[m_pos + 1]))
			{
				return fail(ErrorKind::LEADING_ZERO);
			}
		}

		const uint64_t limit = negative ? uint64_t{ 1 } << 63 :
						  static_cast<uint64_t>(std::numeric_limits<integer>::max());
		uint64_t magnitude = 0;
		while (!at_end() && is_digit(m_input[m_pos]))
		{
			const uint64_t digit = m_input[m_pos] - '0';
			if (magnitude > (limit - digit) / 10)
			{
				return fail(ErrorKind::INTEGER_OVERFLOW);
			}
			magnitude = magnitude * 10 + digit;
			++m_pos;
		}
		if (at_end())
		{
			return fail(ErrorKind::UNEXPECTED_END);
		}
		if (m_input[m_pos] != end_suffix)
		{
			return fail(ErrorKind::INVALID_INTEGER);
		}
		++m_pos;

		if (negative)
		{
			// -2^63 has no positive counterpart, negate in unsigned arithmetic
			return static_cast<integer>(~magnitude + 1);
		}
		return static_cast<integer>(magnitude);
	}

	tl::expected<ByteString, MalformedEncoding> parse_string()
	{
		if (m_input[m_pos] == '-')
		{
			return fail(ErrorKind::INVALID_LENGTH);
		}
		if (m_input[m_pos] == '0' && m_pos + 1 < m_input.size() &&
		    is_digit(m_input[m_pos + 1]))
		{
			return fail(ErrorKind::LEADING_ZERO);
		}

		size_t length = 0;
		while (!at_end() && is_digit(m_input[m_pos]))
		{
			length = length * 10 + (m_input[m_pos] - '0');
			// the payload can't be longer than what is left
			if (length > m_input.size())
			{
				return fail(ErrorKind::UNEXPECTED_END);
			}
			++m_pos;
		}
		if (at_end())
		{
			return fail(ErrorKind::UNEXPECTED_END);
		}
		if (m_input[m_pos] != ':')
		{
			return fail(ErrorKind::INVALID_LENGTH);
		}
		++m_pos;

		if (length > m_input.size() - m_pos)
		{
			return fail(ErrorKind::UNEXPECTED_END);
		}
		ByteString ret = ByteString::borrow(m_source, m_pos, length);
		m_pos += length;
		return ret;
	}

	tl::expected<list, MalformedEncoding> parse_list()
	{
		++m_pos; // 'l'
		list ret;
		while (true)
		{
			if (at_end())
			{
				return fail(ErrorKind::UNEXPECTED_END);
			}
			if (m_input[m_pos] == end_suffix)
			{
				++m_pos;
				return ret;
			}
			auto item = parse_value();
			if (!item)
			{
				return tl::make_unexpected(item.error());
			}
			ret.emplace_back(std::move(*item));
		}
	}

	tl::expected<dict, MalformedEncoding> parse_dict()
	{
		++m_pos; // 'd'
		dict ret;
		while (true)
		{
			if (at_end())
			{
				return fail(ErrorKind::UNEXPECTED_END);
			}
			if (m_input[m_pos] == end_suffix)
			{
				++m_pos;
				return ret;
			}
			if (!is_digit(m_input[m_pos]))
			{
				return fail(ErrorKind::NON_STRING_KEY);
			}

			const size_t key_pos = m_pos;
			auto key = parse_string();
			if (!key)
			{
				return tl::make_unexpected(key.error());
			}
			if (!ret.empty())
			{
				const auto order = ret.back().key <=> *key;
				if (order == std::strong_ordering::equal)
				{
					return tl::make_unexpected(
						MalformedEncoding{ ErrorKind::DUPLICATE_KEY, key_pos });
				}
				if (order == std::strong_ordering::greater)
				{
					return tl::make_unexpected(
						MalformedEncoding{ ErrorKind::UNSORTED_KEYS, key_pos });
				}
			}

			if (at_end())
			{
				return fail(ErrorKind::UNEXPECTED_END);
			}
			auto value = parse_value();
			if (!value)
			{
				return tl::make_unexpected(value.error());
			}
			ret.push_back(DictEntry{ std::move(*key), std::move(*value) });
		}
	}

public:
	explicit Decoder(const Buffer &source)
		: m_source(source)
		, m_input(source.bytes())
	{
	}

	[[nodiscard]] size_t position() const
	{
		return m_pos;
	}

	tl::expected<Value, MalformedEncoding> parse_value()
	{
		if (at_end())
		{
			return fail(ErrorKind::UNEXPECTED_END);
		}

		const uint8_t prefix = m_input[m_pos];
		if (is_digit(prefix) || prefix == '-')
		{
			return parse_string().map([](ByteString &&str) { return Value(std::move(str)); });
		}
		if (prefix == int_prefix)
		{
			return parse_integer().map([](integer i) { return Value(i); });
		}
		if (prefix != list_prefix && prefix != dict_prefix)
		{
			return fail(ErrorKind::INVALID_PREFIX);
		}

		if (m_depth == max_nesting_depth)
		{
			return fail(ErrorKind::NESTING_TOO_DEEP);
		}
		++m_depth;
		tl::expected<Value, MalformedEncoding> ret =
			prefix == list_prefix ?
				parse_list().map([](list &&l) { return Value(std::move(l)); }) :
				parse_dict().map([](dict &&d) { return Value(std::move(d)); });
		--m_depth;
		return ret;
	}
};

// Encoder -----------------------------------------------------------------------------

void encode_into(const Value &value, std::vector<uint8_t> &out);

void encode_length_prefixed(std::span<const uint8_t> bytes, std::vector<uint8_t> &out)
{
	const std::string length = std::to_string(bytes.size());
	out.insert(out.end(), length.begin(), length.end());
	out.push_back(':');
	out.insert(out.end(), bytes.begin(), bytes.end());
}

void encode_into(const Value &value, std::vector<uint8_t> &out)
{
	switch (value.type())
	{
	case Value::Type::INTEGER: {
		std::array<char, 24> digits{};
		const auto [end, ec] =
			std::to_chars(digits.data(), digits.data() + digits.size(), value.as_integer());
		out.push_back(int_prefix);
		out.insert(out.end(), digits.data(), end);
		out.push_back(end_suffix);
		break;
	}
	case Value::Type::STRING:
		encode_length_prefixed(value.as_string().bytes(), out);
		break;
	case Value::Type::LIST:
		out.push_back(list_prefix);
		for (const auto &item : value.as_list())
		{
			encode_into(item, out);
		}
		out.push_back(end_suffix);
		break;
	case Value::Type::DICT: {
		out.push_back(dict_prefix);
		for (const DictEntry *entry : canonical_entries(value.as_dict()))
		{
			encode_length_prefixed(entry->key.bytes(), out);
			encode_into(entry->value, out);
		}
		out.push_back(end_suffix);
		break;
	}
	}
}

} // namespace

tl::expected<Decoded, MalformedEncoding> decode(const Buffer &source)
{
	Decoder decoder(source);
	auto value = decoder.parse_value();
	if (!value)
	{
		return tl::make_unexpected(value.error());
	}
	return Decoded{ std::move(*value), decoder.position() };
}

tl::expected<Value, MalformedEncoding> decode_all(const Buffer &source)
{
	auto decoded = decode(source);
	if (!decoded)
	{
		return tl::make_unexpected(decoded.error());
	}
	if (decoded->consumed != source.size())
	{
		return tl::make_unexpected(
			MalformedEncoding{ ErrorKind::TRAILING_DATA, decoded->consumed });
	}
	return std::move(decoded->value);
}

std::vector<uint8_t> encode(const Value &value)
{
	std::vector<uint8_t> out;
	encode_into(value, out);
	return out;
}

} // namespace bencode
