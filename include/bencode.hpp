#pragma once

#include <tl/expected.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bencode
{

/**
 * @brief Owner of the bytes that decoded values point into
 *
 * Decoding never copies string payloads: every decoded ByteString is a view into
 * the Buffer that was passed to decode(). The Buffer must therefore outlive every
 * Value obtained from it. It is non-copyable so that a view can't silently end up
 * pointing into a copy that is destroyed earlier. Moving keeps the heap storage,
 * so views stay valid after a move.
 */
class Buffer {
	std::vector<uint8_t> m_bytes;

public:
	Buffer() = default;
	explicit Buffer(std::vector<uint8_t> bytes);
	explicit Buffer(std::string_view bytes);

	Buffer(const Buffer &) = delete;
	Buffer &operator=(const Buffer &) = delete;
	Buffer(Buffer &&) noexcept = default;
	Buffer &operator=(Buffer &&) noexcept = default;

	[[nodiscard]] std::span<const uint8_t> bytes() const;
	[[nodiscard]] size_t size() const;
};

/**
 * @brief Raw byte string, either borrowed from a Buffer or owned
 *
 * Strings produced by decode() borrow (buffer, offset, length). Strings created in
 * code own a shared copy of their bytes. Both behave the same for comparison and
 * encoding. Bytes are never assumed to be text, see as_text().
 */
class ByteString {
	std::span<const uint8_t> m_view;
	std::shared_ptr<const std::vector<uint8_t>> m_owned;
	size_t m_offset = 0;
	bool m_borrowed = false;

public:
	ByteString() = default;
	ByteString(const char *text);
	ByteString(std::string_view text);
	ByteString(const std::string &text);
	explicit ByteString(std::span<const uint8_t> bytes);

	/**
	 * @brief Creates a view of length bytes starting at offset inside source
	 */
	[[nodiscard]] static ByteString borrow(const Buffer &source, size_t offset, size_t length);

	[[nodiscard]] std::span<const uint8_t> bytes() const;
	[[nodiscard]] std::string_view view() const;
	[[nodiscard]] size_t size() const;
	[[nodiscard]] bool empty() const;
	/**
	 * @brief Position of the payload in the source buffer (0 for owned strings)
	 */
	[[nodiscard]] size_t offset() const;
	[[nodiscard]] bool is_borrowed() const;

	/**
	 * @brief Returns the bytes as text if they form valid UTF-8
	 */
	[[nodiscard]] std::optional<std::string_view> as_text() const;

	friend bool operator==(const ByteString &lhs, const ByteString &rhs);
	friend std::strong_ordering operator<=>(const ByteString &lhs, const ByteString &rhs);
};

class Value;
struct DictEntry;

using integer = int64_t;
using list = std::vector<Value>;
/**
 * Entries keep the order they were decoded or inserted in.
 * encode() always emits them sorted by key.
 */
using dict = std::vector<DictEntry>;

class Value {
public:
	enum class Type {
		INTEGER,
		STRING,
		LIST,
		DICT,
	};

private:
	std::variant<integer, ByteString, list, dict> m_data;

public:
	Value() = default;
	Value(integer value);
	Value(int value);
	Value(ByteString value);
	Value(const char *value);
	Value(list value);
	Value(dict value);

	[[nodiscard]] Type type() const;

	[[nodiscard]] bool is_integer() const;
	[[nodiscard]] bool is_string() const;
	[[nodiscard]] bool is_list() const;
	[[nodiscard]] bool is_dict() const;

	// these throw std::bad_variant_access on type mismatch
	[[nodiscard]] integer as_integer() const;
	[[nodiscard]] const ByteString &as_string() const;
	[[nodiscard]] const list &as_list() const;
	[[nodiscard]] const dict &as_dict() const;
	[[nodiscard]] list &as_list();
	[[nodiscard]] dict &as_dict();

	/**
	 * @brief Looks up a key in a dictionary
	 *
	 * @return nullptr if this is not a dictionary or the key is absent
	 */
	[[nodiscard]] const Value *find(std::string_view key) const;

	/**
	 * @brief Sets key to value, replacing an existing entry with the same key
	 *
	 * @throws std::bad_variant_access if this is not a dictionary
	 */
	Value &insert(ByteString key, Value value);

	friend bool operator==(const Value &lhs, const Value &rhs);
};

struct DictEntry {
	ByteString key;
	Value value;

	friend bool operator==(const DictEntry &lhs, const DictEntry &rhs) = default;
};

enum class ErrorKind {
	UNEXPECTED_END,
	INVALID_PREFIX,
	INVALID_INTEGER,
	LEADING_ZERO,
	NEGATIVE_ZERO,
	INTEGER_OVERFLOW,
	INVALID_LENGTH,
	NON_STRING_KEY,
	UNSORTED_KEYS,
	DUPLICATE_KEY,
	NESTING_TOO_DEEP,
	TRAILING_DATA,
};

/**
 * @brief Decoding failure: what went wrong and at which byte of the input
 */
struct MalformedEncoding {
	ErrorKind kind;
	size_t position;

	[[nodiscard]] std::string describe() const;
};

struct Decoded {
	Value value;
	size_t consumed;
};

inline constexpr size_t max_nesting_depth = 256;

/**
 * @brief Decodes the first value of the buffer
 *
 * Trailing bytes after the value are allowed; their start is reported as
 * Decoded::consumed. Map keys must be strictly ascending.
 */
[[nodiscard]] tl::expected<Decoded, MalformedEncoding> decode(const Buffer &source);
tl::expected<Decoded, MalformedEncoding> decode(Buffer &&source) = delete;

/**
 * @brief Decodes a buffer that must contain exactly one value
 */
[[nodiscard]] tl::expected<Value, MalformedEncoding> decode_all(const Buffer &source);
tl::expected<Value, MalformedEncoding> decode_all(Buffer &&source) = delete;

/**
 * @brief Produces the canonical encoding of a value
 */
[[nodiscard]] std::vector<uint8_t> encode(const Value &value);

} // namespace bencode
