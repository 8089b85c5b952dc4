#pragma once

#include "bencode.hpp"
#include "metainfo_file.hpp"
#include "storage.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace testing_utils
{

// deterministic, non-repeating content so that swapped blocks fail verification
inline std::vector<uint8_t> make_payload(size_t length, uint32_t seed = 1)
{
	std::vector<uint8_t> ret(length);
	uint32_t state = seed * 2654435761u + 1;
	for (auto &byte : ret)
	{
		state = state * 1664525u + 1013904223u;
		byte = static_cast<uint8_t>(state >> 24);
	}
	return ret;
}

inline bencode::ByteString concat_hashes(std::span<const uint8_t> data, size_t piece_length)
{
	std::vector<uint8_t> hashes;
	for (size_t offset = 0; offset < data.size(); offset += piece_length)
	{
		const size_t size = std::min(piece_length, data.size() - offset);
		const auto digest = utils::compute_sha1(data.subspan(offset, size));
		hashes.insert(hashes.end(), digest.begin(), digest.end());
	}
	return bencode::ByteString(std::span<const uint8_t>(hashes));
}

/**
 * @brief Root dictionary of a single-file torrent that describes data
 */
inline bencode::Value make_torrent(std::span<const uint8_t> data, size_t piece_length,
				   const std::string &name = "payload.bin")
{
	bencode::Value info{ bencode::dict{} };
	info.insert("length", bencode::Value(static_cast<bencode::integer>(data.size())));
	info.insert("name", bencode::Value(bencode::ByteString(name)));
	info.insert("piece length", bencode::Value(static_cast<bencode::integer>(piece_length)));
	info.insert("pieces", bencode::Value(concat_hashes(data, piece_length)));

	bencode::Value root{ bencode::dict{} };
	root.insert("announce", bencode::Value("http://tracker.example/announce"));
	root.insert("info", std::move(info));
	return root;
}

inline TorrentDescriptor make_descriptor(std::span<const uint8_t> data, size_t piece_length)
{
	return parse_metainfo(make_torrent(data, piece_length));
}

/**
 * @brief Storage backed by memory that remembers every write
 */
class MemoryStorage final : public Storage {
public:
	std::vector<uint8_t> data;
	std::map<uint64_t, size_t> writes; // offset -> number of writes
	size_t failures_left = 0;

	explicit MemoryStorage(size_t size)
		: data(size, 0)
	{
	}

	void write(uint64_t offset, std::span<const uint8_t> bytes) override
	{
		if (failures_left > 0)
		{
			--failures_left;
			throw std::runtime_error("disk full");
		}
		std::copy(bytes.begin(), bytes.end(), data.begin() + static_cast<std::ptrdiff_t>(offset));
		++writes[offset];
	}

	[[nodiscard]] std::vector<uint8_t> read(uint64_t offset, size_t length) const override
	{
		const auto begin = data.begin() + static_cast<std::ptrdiff_t>(offset);
		return { begin, begin + static_cast<std::ptrdiff_t>(length) };
	}
};

} // namespace testing_utils
