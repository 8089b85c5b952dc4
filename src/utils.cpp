#include "utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstring>
#include <random>
#include <span>
#include <stdexcept>
#include <string>

namespace utils
{

Sha1Digest compute_sha1(std::span<const uint8_t> input)
{
	Sha1 sha1;
	sha1.update(input);
	return sha1.finish();
}

Sha1::Sha1()
	: m_ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free)
{
	if (m_ctx == nullptr)
	{
		throw std::runtime_error("EVP_MD_CTX_new() has failed");
	}
	if (EVP_DigestInit_ex2(m_ctx.get(), EVP_sha1(), nullptr) == 0)
	{
		throw std::runtime_error("EVP_DigestInit_ex2() has failed");
	}
}

void Sha1::update(std::span<const uint8_t> chunk)
{
	if (EVP_DigestUpdate(m_ctx.get(), chunk.data(), chunk.size()) == 0)
	{
		throw std::runtime_error("EVP_DigestUpdate() has failed");
	}
}

Sha1Digest Sha1::finish()
{
	Sha1Digest hash{};

	if (EVP_DigestFinal_ex(m_ctx.get(), hash.data(), nullptr) == 0)
	{
		throw std::runtime_error("EVP_DigestFinal_ex() has failed");
	}

	return hash;
}

PeerId generate_peer_id()
{
	static constexpr char prefix[] = "-BS0100-";
	static constexpr char alphabet[] = "0123456789"
					   "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
					   "abcdefghijklmnopqrstuvwxyz";

	std::random_device rd;
	std::mt19937 mt(rd());
	std::uniform_int_distribution<size_t> dist(0, sizeof alphabet - 2);

	PeerId ret{ 0 };
	std::memcpy(ret.data(), prefix, sizeof prefix - 1);

	for (size_t i = sizeof prefix - 1; i < ret.size(); ++i)
	{
		ret[i] = static_cast<uint8_t>(alphabet[dist(mt)]);
	}
	return ret;
}

std::string to_hex(std::span<const uint8_t> input)
{
	static constexpr char digits[] = "0123456789abcdef";

	std::string ret;
	ret.reserve(input.size() * 2);
	for (const uint8_t ch : input)
	{
		ret += digits[ch >> 4];
		ret += digits[ch & 0x0f];
	}
	return ret;
}

} // namespace utils
