#include "metainfo_file.hpp"

#include "bencode.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

InvalidMetainfo::InvalidMetainfo(const std::string &what)
	: std::runtime_error("invalid metainfo: " + what)
{
}

// helpers -----------------------------------------------------------------------------

static const bencode::Value &require(const bencode::Value &source, std::string_view key)
{
	const bencode::Value *value = source.find(key);
	if (value == nullptr)
	{
		throw InvalidMetainfo("missing key \"" + std::string(key) + "\"");
	}
	return *value;
}

static long long require_int(const bencode::Value &source, std::string_view key)
{
	const bencode::Value &value = require(source, key);
	if (!value.is_integer())
	{
		throw InvalidMetainfo("\"" + std::string(key) + "\" is not an integer");
	}
	return value.as_integer();
}

static const bencode::ByteString &require_bytes(const bencode::Value &source,
						std::string_view key)
{
	const bencode::Value &value = require(source, key);
	if (!value.is_string())
	{
		throw InvalidMetainfo("\"" + std::string(key) + "\" is not a byte string");
	}
	return value.as_string();
}

static std::string require_text(const bencode::Value &source, std::string_view key)
{
	const auto text = require_bytes(source, key).as_text();
	if (!text.has_value())
	{
		throw InvalidMetainfo("\"" + std::string(key) + "\" is not valid UTF-8");
	}
	return std::string(*text);
}

static std::optional<std::string> decode_optional_text(const bencode::Value &source,
						       std::string_view key)
{
	const bencode::Value *value = source.find(key);
	if (value == nullptr || !value->is_string())
	{
		return std::nullopt;
	}
	const auto text = value->as_string().as_text();
	if (!text.has_value())
	{
		return std::nullopt;
	}
	return std::string(*text);
}

static std::optional<long long> decode_optional_int(const bencode::Value &source,
						    std::string_view key)
{
	const bencode::Value *value = source.find(key);
	if (value == nullptr || !value->is_integer())
	{
		return std::nullopt;
	}
	return value->as_integer();
}

// a path component must not escape the download directory
static void check_path_component(std::string_view part)
{
	if (part.empty() || part == "." || part == ".." ||
	    part.find_first_of("/\\") != std::string_view::npos ||
	    part.find('\0') != std::string_view::npos)
	{
		throw InvalidMetainfo("illegal path component \"" + std::string(part) + "\"");
	}
}

static std::vector<FileInfo> parse_files(const bencode::Value &info, const std::string &name)
{
	std::vector<FileInfo> files;

	const bencode::Value *files_value = info.find("files");
	// single file mode is treated as multifile, but with a single file
	if (files_value == nullptr)
	{
		const long long length = require_int(info, "length");
		if (length < 0)
		{
			throw InvalidMetainfo("negative file length");
		}
		files.push_back({ name, length });
		return files;
	}

	if (!files_value->is_list() || files_value->as_list().empty())
	{
		throw InvalidMetainfo("\"files\" is not a non-empty list");
	}
	for (const auto &file : files_value->as_list())
	{
		if (!file.is_dict())
		{
			throw InvalidMetainfo("file entry is not a dictionary");
		}
		const long long length = require_int(file, "length");
		if (length < 0)
		{
			throw InvalidMetainfo("negative file length");
		}

		const bencode::Value &path_value = require(file, "path");
		if (!path_value.is_list() || path_value.as_list().empty())
		{
			throw InvalidMetainfo("\"path\" is not a non-empty list");
		}
		std::filesystem::path path;
		for (const auto &part : path_value.as_list())
		{
			const auto text = part.is_string() ? part.as_string().as_text() : std::nullopt;
			if (!text.has_value())
			{
				throw InvalidMetainfo("path component is not valid UTF-8 text");
			}
			check_path_component(*text);
			path /= std::string(*text);
		}
		files.push_back({ std::move(path), length });
	}
	return files;
}

// TorrentDescriptor -------------------------------------------------------------------

size_t TorrentDescriptor::number_of_pieces() const
{
	return piece_hashes.size();
}

size_t TorrentDescriptor::piece_size(size_t index) const
{
	const uint64_t offset = piece_offset(index);
	const auto remaining = static_cast<uint64_t>(total_length) - offset;
	return static_cast<size_t>(std::min<uint64_t>(remaining, piece_length));
}

uint64_t TorrentDescriptor::piece_offset(size_t index) const
{
	return static_cast<uint64_t>(index) * static_cast<uint64_t>(piece_length);
}

TorrentDescriptor parse_metainfo(const bencode::Value &root)
{
	if (!root.is_dict())
	{
		throw InvalidMetainfo("root is not a dictionary");
	}
	const bencode::Value &info = require(root, "info");
	if (!info.is_dict())
	{
		throw InvalidMetainfo("\"info\" is not a dictionary");
	}

	TorrentDescriptor ret;

	// the info dictionary is hashed as received, with every key it carries,
	// the decoder only accepts canonical input so re-encoding reproduces it
	const std::vector<uint8_t> info_encoded = bencode::encode(info);
	ret.info_hash = utils::compute_sha1(info_encoded);

	ret.piece_length = require_int(info, "piece length");
	if (ret.piece_length <= 0)
	{
		throw InvalidMetainfo("\"piece length\" is not positive");
	}

	const std::string name = require_text(info, "name");
	check_path_component(name);
	ret.name = name;
	ret.files = parse_files(info, name);
	ret.multi_file = info.find("files") != nullptr;
	for (const auto &file : ret.files)
	{
		if (file.length > std::numeric_limits<long long>::max() - ret.total_length)
		{
			throw InvalidMetainfo("total length does not fit in 64 bits");
		}
		ret.total_length += file.length;
	}

	const bencode::ByteString &pieces = require_bytes(info, "pieces");
	if (pieces.size() % utils::sha1_length != 0)
	{
		throw InvalidMetainfo("\"pieces\" length is not a multiple of 20");
	}
	const std::span<const uint8_t> hashes = pieces.bytes();
	for (size_t i = 0; i < hashes.size(); i += utils::sha1_length)
	{
		auto &digest = ret.piece_hashes.emplace_back();
		std::memcpy(digest.data(), hashes.data() + i, utils::sha1_length);
	}

	const auto expected_pieces = static_cast<size_t>(
		ret.total_length / ret.piece_length + (ret.total_length % ret.piece_length != 0 ? 1 : 0));
	if (expected_pieces != ret.piece_hashes.size())
	{
		throw InvalidMetainfo("number of piece hashes does not match total length");
	}

	ret.announce = decode_optional_text(root, "announce").value_or("");
	// private trackers are not supported, the flag is kept for completeness
	ret.is_private = decode_optional_int(info, "private").value_or(0) == 1;

	return ret;
}

TorrentDescriptor load_metainfo_file(const std::filesystem::path &path)
{
	std::ifstream tor(path, std::ios_base::binary);
	if (!tor)
	{
		throw InvalidMetainfo("can't open " + path.string());
	}
	std::vector<uint8_t> torrent_bytes;
	torrent_bytes.assign(std::istreambuf_iterator<char>(tor), std::istreambuf_iterator<char>());

	const bencode::Buffer buffer(std::move(torrent_bytes));
	const auto root = bencode::decode_all(buffer);
	if (!root)
	{
		throw InvalidMetainfo(root.error().describe());
	}
	return parse_metainfo(*root);
}
