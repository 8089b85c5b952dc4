#include "storage.hpp"

// assume Linux
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

static void preallocate_file(const std::filesystem::path &path, const long long size)
{
	int fd = open(path.c_str(), O_WRONLY | O_CREAT, S_IRUSR | S_IWUSR);
	if (fd == -1)
	{
		throw std::runtime_error(std::string("preallocate_file(): open(): ") +
					 strerror(errno));
	}
	// posix_fallocate() rejects empty ranges
	if (size > 0)
	{
		const int rc = posix_fallocate(fd, 0, size);
		if (rc != 0)
		{
			close(fd);
			throw std::runtime_error(std::string("preallocate_file(): posix_fallocate(): ") +
						 strerror(rc));
		}
	}
	fsync(fd);
	close(fd);
}

FileStorage::FileStorage(const TorrentDescriptor &descriptor, std::filesystem::path root)
	: m_root(std::move(root))
{
	const std::filesystem::path base = descriptor.multi_file ? m_root / descriptor.name : m_root;
	for (const auto &file : descriptor.files)
	{
		const auto length = static_cast<uint64_t>(file.length);
		m_extents.push_back({ base / file.path, m_total_length, length });
		m_total_length += length;
	}
}

template <typename Fn>
void FileStorage::for_each_extent(const uint64_t offset, const size_t length, Fn &&fn) const
{
	if (offset > m_total_length || length > m_total_length - offset)
	{
		throw std::out_of_range("range [" + std::to_string(offset) + ", " +
					std::to_string(offset + length) + ") is outside of the torrent");
	}

	const uint64_t end = offset + length;
	for (const auto &extent : m_extents)
	{
		const uint64_t extent_end = extent.begin + extent.length;
		if (extent_end <= offset || extent.length == 0)
		{
			continue;
		}
		if (extent.begin >= end)
		{
			break;
		}
		const uint64_t from = std::max(offset, extent.begin);
		const uint64_t to = std::min(end, extent_end);
		// (path, position in file, position in the caller's buffer, length)
		fn(extent.path, from - extent.begin, static_cast<size_t>(from - offset),
		   static_cast<size_t>(to - from));
	}
}

void FileStorage::preallocate() const
{
	namespace fs = std::filesystem;
	for (const auto &extent : m_extents)
	{
		if (fs::exists(extent.path))
		{
			continue;
		}
		fs::create_directories(extent.path.parent_path());
		preallocate_file(extent.path, static_cast<long long>(extent.length));
	}
}

void FileStorage::write(const uint64_t offset, const std::span<const uint8_t> bytes)
{
	for_each_extent(offset, bytes.size(),
			[&](const std::filesystem::path &path, uint64_t file_pos, size_t buf_pos,
			    size_t length) {
				if (!std::filesystem::exists(path))
				{
					std::filesystem::create_directories(path.parent_path());
					std::ofstream create(path, std::ios::binary);
				}
				std::fstream fout(path, std::ios::in | std::ios::out | std::ios::binary);
				fout.seekp(static_cast<std::streamoff>(file_pos), std::ios::beg);
				fout.write(reinterpret_cast<const char *>(bytes.data() + buf_pos),
					   static_cast<std::streamsize>(length));
				fout.flush();
				if (!fout)
				{
					throw std::runtime_error("failed to write " + path.string());
				}
			});
}

std::vector<uint8_t> FileStorage::read(const uint64_t offset, const size_t length) const
{
	std::vector<uint8_t> ret(length, 0);
	for_each_extent(offset, length,
			[&](const std::filesystem::path &path, uint64_t file_pos, size_t buf_pos,
			    size_t part) {
				std::ifstream fin(path, std::ios::binary);
				fin.seekg(static_cast<std::streamoff>(file_pos), std::ios::beg);
				fin.read(reinterpret_cast<char *>(ret.data() + buf_pos),
					 static_cast<std::streamsize>(part));
				if (!fin)
				{
					throw std::runtime_error("failed to read " + path.string());
				}
			});
	return ret;
}

const std::filesystem::path &FileStorage::root() const
{
	return m_root;
}
