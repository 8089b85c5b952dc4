#pragma once

#include "bencode.hpp"
#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Thrown when a metainfo file can't describe a download
 *
 * Missing required keys, wrong value types, malformed piece hashes and
 * negative file lengths all end up here. It is fatal for that torrent.
 */
class InvalidMetainfo : public std::runtime_error {
public:
	explicit InvalidMetainfo(const std::string &what);
};

/**
 * @brief One entry of the files list in the info dictionary
 *
 * Single-file torrents are represented as one entry whose path is the torrent name
 */
struct FileInfo {
	std::filesystem::path path;
	long long length;
};

/**
 * @brief Typed view of a .torrent file
 *
 * It is immutable once parsed. It doesn't borrow anything from the decoded
 * value, so the source buffer may be released after parsing.
 */
struct TorrentDescriptor {
	// SHA1 of the bencoded info dictionary, needed in peer handshakes
	utils::Sha1Digest info_hash{};
	long long piece_length = 0;
	std::vector<utils::Sha1Digest> piece_hashes;
	long long total_length = 0;
	std::vector<FileInfo> files;

	std::filesystem::path name;
	std::string announce; // empty if absent
	bool is_private = false;
	// files of a multi-file torrent live in a directory called name
	bool multi_file = false;

	[[nodiscard]] size_t number_of_pieces() const;
	/**
	 * @brief Length of the piece, the last one may be shorter than piece_length
	 */
	[[nodiscard]] size_t piece_size(size_t index) const;
	/**
	 * @brief Absolute position of the piece in the concatenation of all files
	 */
	[[nodiscard]] uint64_t piece_offset(size_t index) const;
};

/**
 * @brief Builds a descriptor from the root dictionary of a .torrent file
 *
 * @throws InvalidMetainfo
 */
[[nodiscard]] TorrentDescriptor parse_metainfo(const bencode::Value &root);

/**
 * @brief Reads, decodes and parses a .torrent file
 *
 * @throws InvalidMetainfo if the file can't be read, decoded or parsed
 */
[[nodiscard]] TorrentDescriptor load_metainfo_file(const std::filesystem::path &path);
