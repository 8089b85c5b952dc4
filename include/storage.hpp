#pragma once

#include "metainfo_file.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

/**
 * @brief Destination of verified pieces
 *
 * Offsets are absolute positions in the concatenation of all files of a torrent.
 * Implementations report failures by throwing std::runtime_error.
 */
class Storage {
public:
	virtual void write(uint64_t offset, std::span<const uint8_t> bytes) = 0;
	[[nodiscard]] virtual std::vector<uint8_t> read(uint64_t offset, size_t length) const = 0;
	virtual ~Storage() = default;
};

/**
 * @brief Storage that maps absolute offsets onto the files of a torrent
 *
 * Single-file torrents are stored as root/name, multi-file torrents as
 * root/name/<path>. A write that spans several files is split between them.
 */
class FileStorage final : public Storage {
	struct Extent {
		std::filesystem::path path;
		uint64_t begin;
		uint64_t length;
	};

	std::filesystem::path m_root;
	std::vector<Extent> m_extents;
	uint64_t m_total_length = 0;

	template <typename Fn>
	void for_each_extent(uint64_t offset, size_t length, Fn &&fn) const;

public:
	FileStorage(const TorrentDescriptor &descriptor, std::filesystem::path root);

	/**
	 * @brief Creates directories and allocates every file at its full length
	 *
	 * Existing files are left as they are.
	 * @throws std::runtime_error if a file can't be created or allocated
	 */
	void preallocate() const;

	/**
	 * @throws std::out_of_range if the range doesn't fit into the torrent
	 * @throws std::runtime_error on i/o errors
	 */
	void write(uint64_t offset, std::span<const uint8_t> bytes) override;
	[[nodiscard]] std::vector<uint8_t> read(uint64_t offset, size_t length) const override;

	[[nodiscard]] const std::filesystem::path &root() const;
};
