#include "bencode.hpp"
#include "metainfo_file.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using testing_utils::make_payload;
using testing_utils::make_torrent;

class MetainfoTest : public ::testing::Test {
protected:
	static constexpr size_t piece_length = 32 * 1024;
	std::vector<uint8_t> payload = make_payload(3 * piece_length + 100);
	bencode::Value root = make_torrent(payload, piece_length);

	bencode::Value &info()
	{
		for (auto &entry : root.as_dict())
		{
			if (entry.key == bencode::ByteString("info"))
			{
				return entry.value;
			}
		}
		throw std::logic_error("no info dictionary");
	}
};

TEST_F(MetainfoTest, SingleFile)
{
	const TorrentDescriptor desc = parse_metainfo(root);

	EXPECT_EQ(desc.name, "payload.bin");
	EXPECT_EQ(desc.announce, "http://tracker.example/announce");
	EXPECT_EQ(desc.piece_length, piece_length);
	EXPECT_EQ(desc.total_length, payload.size());
	EXPECT_FALSE(desc.multi_file);
	EXPECT_FALSE(desc.is_private);

	ASSERT_EQ(desc.files.size(), 1);
	EXPECT_EQ(desc.files[0].path, "payload.bin");
	EXPECT_EQ(desc.files[0].length, payload.size());

	ASSERT_EQ(desc.number_of_pieces(), 4);
	EXPECT_EQ(desc.piece_size(0), piece_length);
	EXPECT_EQ(desc.piece_size(3), 100);
	EXPECT_EQ(desc.piece_offset(3), 3 * piece_length);
	EXPECT_EQ(desc.piece_hashes[1],
		  utils::compute_sha1(std::span(payload).subspan(piece_length, piece_length)));
}

TEST_F(MetainfoTest, MultiFile)
{
	bencode::Value first{ bencode::dict{} };
	first.insert("length", bencode::Value(static_cast<bencode::integer>(piece_length)));
	first.insert("path", bencode::Value(bencode::list{ bencode::Value("a.txt") }));

	bencode::Value second{ bencode::dict{} };
	second.insert("length",
		      bencode::Value(static_cast<bencode::integer>(payload.size() - piece_length)));
	second.insert("path",
		      bencode::Value(bencode::list{ bencode::Value("sub"), bencode::Value("b.txt") }));

	info().as_dict().erase(std::find_if(
		info().as_dict().begin(), info().as_dict().end(),
		[](const bencode::DictEntry &entry) { return entry.key == bencode::ByteString("length"); }));
	info().insert("files", bencode::Value(bencode::list{ first, second }));
	info().insert("name", bencode::Value("album"));

	const TorrentDescriptor desc = parse_metainfo(root);
	EXPECT_TRUE(desc.multi_file);
	EXPECT_EQ(desc.name, "album");
	EXPECT_EQ(desc.total_length, payload.size());
	ASSERT_EQ(desc.files.size(), 2);
	EXPECT_EQ(desc.files[0].path, "a.txt");
	EXPECT_EQ(desc.files[1].path, std::filesystem::path("sub") / "b.txt");
	EXPECT_EQ(desc.files[1].length, payload.size() - piece_length);
}

TEST_F(MetainfoTest, InfoHashCoversEveryKey)
{
	const TorrentDescriptor plain = parse_metainfo(root);
	EXPECT_EQ(plain.info_hash, utils::compute_sha1(bencode::encode(info())));

	info().insert("x-comment", bencode::Value("kept verbatim"));
	const TorrentDescriptor extended = parse_metainfo(root);
	EXPECT_NE(plain.info_hash, extended.info_hash);
	EXPECT_EQ(extended.info_hash, utils::compute_sha1(bencode::encode(info())));
}

TEST_F(MetainfoTest, InfoHashOfReceivedBytes)
{
	const std::vector<uint8_t> encoded = bencode::encode(root);
	const std::vector<uint8_t> info_encoded = bencode::encode(info());

	const bencode::Buffer buffer(encoded);
	const auto decoded = bencode::decode_all(buffer);
	ASSERT_TRUE(decoded.has_value());

	// the info dictionary appears verbatim in the file
	const std::string file(encoded.begin(), encoded.end());
	const std::string sub(info_encoded.begin(), info_encoded.end());
	ASSERT_NE(file.find(sub), std::string::npos);

	EXPECT_EQ(parse_metainfo(*decoded).info_hash, utils::compute_sha1(info_encoded));
}

TEST_F(MetainfoTest, PrivateFlag)
{
	info().insert("private", bencode::Value(1));
	EXPECT_TRUE(parse_metainfo(root).is_private);
}

TEST_F(MetainfoTest, MissingKeys)
{
	for (const char *key : { "piece length", "pieces", "name", "length" })
	{
		bencode::Value copy = root;
		auto &entries = copy.as_dict();
		for (auto &entry : entries)
		{
			if (entry.key == bencode::ByteString("info"))
			{
				std::erase_if(entry.value.as_dict(), [key](const bencode::DictEntry &e) {
					return e.key == bencode::ByteString(key);
				});
			}
		}
		EXPECT_THROW((void)parse_metainfo(copy), InvalidMetainfo) << key;
	}

	bencode::Value no_info{ bencode::dict{} };
	no_info.insert("announce", bencode::Value("x"));
	EXPECT_THROW((void)parse_metainfo(no_info), InvalidMetainfo);
	EXPECT_THROW((void)parse_metainfo(bencode::Value(1)), InvalidMetainfo);
}

TEST_F(MetainfoTest, WrongTypes)
{
	info().insert("piece length", bencode::Value("big"));
	EXPECT_THROW((void)parse_metainfo(root), InvalidMetainfo);
}

TEST_F(MetainfoTest, NonPositivePieceLength)
{
	info().insert("piece length", bencode::Value(0));
	EXPECT_THROW((void)parse_metainfo(root), InvalidMetainfo);
}

TEST_F(MetainfoTest, PiecesNotMultipleOf20)
{
	info().insert("pieces", bencode::Value("0123456789012345678901234"));
	EXPECT_THROW((void)parse_metainfo(root), InvalidMetainfo);
}

TEST_F(MetainfoTest, PieceCountMismatch)
{
	info().insert("length", bencode::Value(static_cast<bencode::integer>(payload.size() * 2)));
	EXPECT_THROW((void)parse_metainfo(root), InvalidMetainfo);
}

TEST_F(MetainfoTest, NegativeLength)
{
	info().insert("length", bencode::Value(-1));
	EXPECT_THROW((void)parse_metainfo(root), InvalidMetainfo);
}

TEST_F(MetainfoTest, HugeLengths)
{
	bencode::Value file{ bencode::dict{} };
	file.insert("length", bencode::Value(INT64_MAX));
	file.insert("path", bencode::Value(bencode::list{ bencode::Value("big") }));

	bencode::Value copy = root;
	for (auto &entry : copy.as_dict())
	{
		if (entry.key == bencode::ByteString("info"))
		{
			entry.value.insert("files", bencode::Value(bencode::list{ file, file }));
		}
	}
	EXPECT_THROW((void)parse_metainfo(copy), InvalidMetainfo);

	// one file at the limit still needs a matching piece count
	info().insert("length", bencode::Value(INT64_MAX));
	info().insert("piece length", bencode::Value(INT64_MAX - 1));
	EXPECT_THROW((void)parse_metainfo(root), InvalidMetainfo);
}

TEST_F(MetainfoTest, UnsafePaths)
{
	for (const char *bad : { "..", "a/b", "" })
	{
		bencode::Value copy = root;
		for (auto &entry : copy.as_dict())
		{
			if (entry.key == bencode::ByteString("info"))
			{
				entry.value.insert("name", bencode::Value(bad));
			}
		}
		EXPECT_THROW((void)parse_metainfo(copy), InvalidMetainfo) << bad;
	}

	const std::vector<uint8_t> not_utf8 = { 0xff, 0xfe };
	info().insert("name", bencode::Value(bencode::ByteString(std::span<const uint8_t>(not_utf8))));
	EXPECT_THROW((void)parse_metainfo(root), InvalidMetainfo);
}

TEST_F(MetainfoTest, LoadFile)
{
	const auto path = std::filesystem::temp_directory_path() / "bitswarm_metainfo_test.torrent";
	const std::vector<uint8_t> encoded = bencode::encode(root);
	{
		std::ofstream out(path, std::ios::binary);
		out.write(reinterpret_cast<const char *>(encoded.data()),
			  static_cast<std::streamsize>(encoded.size()));
	}
	EXPECT_EQ(load_metainfo_file(path).info_hash, parse_metainfo(root).info_hash);

	{
		std::ofstream out(path, std::ios::binary | std::ios::app);
		out << "garbage";
	}
	EXPECT_THROW((void)load_metainfo_file(path), InvalidMetainfo);
	std::filesystem::remove(path);

	EXPECT_THROW((void)load_metainfo_file(path), InvalidMetainfo);
}
