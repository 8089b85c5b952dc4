#pragma once

#include <openssl/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace utils
{

inline constexpr size_t sha1_length = 20;
inline constexpr size_t id_length = 20;

using Sha1Digest = std::array<uint8_t, sha1_length>;
using PeerId = std::array<uint8_t, id_length>;

/**
 * @brief Compute SHA1 from a continuous array of memory
 *
 * SHA1 is a hash value that is 20 bytes long. This function takes a *single* chunk of data,
 * computes the hash, creates and returns an array that stores the value.
 */
[[nodiscard]] Sha1Digest compute_sha1(std::span<const uint8_t> input);

/**
 * @brief Incremental SHA1 for data that arrives in several chunks
 */
class Sha1 {
	std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX *)> m_ctx;

public:
	Sha1();

	void update(std::span<const uint8_t> chunk);
	/**
	 * @brief Finishes the digest, the object must not be updated afterwards
	 */
	[[nodiscard]] Sha1Digest finish();
};

/**
 * @brief Generates random peer id
 *
 * The id starts with the client prefix "-BS0100-" followed by 12 random letters
 * or numbers. Apart from the prefix it does not store any information about client.
 */
[[nodiscard]] PeerId generate_peer_id();

/**
 * @brief Converts binary data to lowercase hex string (for logs)
 */
[[nodiscard]] std::string to_hex(std::span<const uint8_t> input);

// helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
	using Ts::operator()...;
};

} // namespace utils
