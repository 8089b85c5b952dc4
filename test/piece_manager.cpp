#include "peer_message.hpp"
#include "piece.hpp"
#include "piece_manager.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <set>
#include <span>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using testing_utils::make_descriptor;
using testing_utils::make_payload;
using testing_utils::MemoryStorage;

class PieceManagerTest : public ::testing::Test {
protected:
	static constexpr size_t piece_length = 2 * block_size;
	static constexpr size_t pieces = 5;
	// four full pieces and a short one made of a single block
	std::vector<uint8_t> payload = make_payload(4 * piece_length + 100);
	TorrentDescriptor descriptor = make_descriptor(payload, piece_length);
	MemoryStorage storage{ payload.size() };
	PieceManager::Clock::time_point t0 = PieceManager::Clock::now();

	static PieceManagerSettings no_endgame()
	{
		PieceManagerSettings ret;
		ret.request_timeout = 1000ms;
		ret.endgame_threshold = 0;
		return ret;
	}

	static message::Bitfield all_pieces()
	{
		message::Bitfield ret(pieces);
		for (size_t i = 0; i < pieces; ++i)
		{
			ret.set_index(i, true);
		}
		return ret;
	}

	static message::Bitfield only(std::initializer_list<size_t> indices)
	{
		message::Bitfield ret(pieces);
		for (const size_t i : indices)
		{
			ret.set_index(i, true);
		}
		return ret;
	}

	[[nodiscard]] std::span<const uint8_t> block_data(const BlockInfo &block) const
	{
		return std::span(payload).subspan(block.piece * piece_length + block.offset, block.length);
	}

	BlockReport deliver(PieceManager &manager, PeerKey peer, const BlockInfo &block)
	{
		auto report = manager.report_block_received(peer, block.piece, block.offset,
							     block_data(block));
		EXPECT_TRUE(report.has_value());
		return report.value_or(BlockReport{});
	}

	void deliver_piece(PieceManager &manager, PeerKey peer, uint32_t index)
	{
		const size_t size = descriptor.piece_size(index);
		for (uint32_t offset = 0; offset < size; offset += block_size)
		{
			const auto length = static_cast<uint32_t>(std::min<size_t>(block_size, size - offset));
			(void)deliver(manager, peer, { index, offset, length });
		}
	}
};

TEST_F(PieceManagerTest, RarestFirstLowestIndexFirst)
{
	PieceManager manager(descriptor, storage, no_endgame());
	manager.add_peer_availability(all_pieces());
	manager.add_peer_availability(only({ 0, 1, 3 }));
	ASSERT_EQ(manager.availability(2), 1);
	ASSERT_EQ(manager.availability(0), 2);

	const auto first = manager.next_block_to_request(1, all_pieces(), t0);
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(first->block, (BlockInfo{ 2, 0, block_size }));
	EXPECT_FALSE(first->duplicate);

	const auto second = manager.next_block_to_request(1, all_pieces(), t0);
	EXPECT_EQ(second->block, (BlockInfo{ 2, block_size, block_size }));

	// piece 4 is as rare as piece 2 and only 100 bytes long
	const auto third = manager.next_block_to_request(1, all_pieces(), t0);
	EXPECT_EQ(third->block, (BlockInfo{ 4, 0, 100 }));

	const auto fourth = manager.next_block_to_request(1, all_pieces(), t0);
	EXPECT_EQ(fourth->block, (BlockInfo{ 0, 0, block_size }));
	EXPECT_EQ(manager.block_state(0, 0), BlockState::REQUESTED);
}

TEST_F(PieceManagerTest, OnlyPiecesThePeerHas)
{
	PieceManager manager(descriptor, storage, no_endgame());
	const auto assignment = manager.next_block_to_request(1, only({ 3 }), t0);
	ASSERT_TRUE(assignment.has_value());
	EXPECT_EQ(assignment->block.piece, 3);
	EXPECT_FALSE(manager.next_block_to_request(2, message::Bitfield(pieces), t0).has_value());
}

TEST_F(PieceManagerTest, NoDuplicatesOutsideEndgame)
{
	PieceManager manager(descriptor, storage, no_endgame());
	std::set<BlockInfo> assigned;
	while (const auto next = manager.next_block_to_request(1, all_pieces(), t0))
	{
		EXPECT_TRUE(assigned.insert(next->block).second);
	}
	EXPECT_EQ(assigned.size(), 9);
	EXPECT_FALSE(manager.next_block_to_request(2, all_pieces(), t0).has_value());
}

TEST_F(PieceManagerTest, ConcurrentRequestsNeverOverlap)
{
	PieceManager manager(descriptor, storage, no_endgame());
	std::vector<BlockInfo> first;
	std::vector<BlockInfo> second;
	const auto worker = [&manager, this](PeerKey peer, std::vector<BlockInfo> &out) {
		while (const auto next = manager.next_block_to_request(peer, all_pieces(), t0))
		{
			out.push_back(next->block);
		}
	};
	std::thread a(worker, 1, std::ref(first));
	std::thread b(worker, 2, std::ref(second));
	a.join();
	b.join();

	std::set<BlockInfo> all(first.begin(), first.end());
	all.insert(second.begin(), second.end());
	EXPECT_EQ(all.size(), first.size() + second.size());
	EXPECT_EQ(all.size(), 9);
}

TEST_F(PieceManagerTest, EndgameDuplicatesAndCancels)
{
	PieceManagerSettings settings = no_endgame();
	settings.endgame_threshold = pieces + 1;
	settings.max_endgame_holders = 2;
	PieceManager manager(descriptor, storage, settings);

	while (manager.next_block_to_request(1, all_pieces(), t0).has_value())
	{
	}
	ASSERT_EQ(manager.holders(0, 0), 1);

	const auto duplicate = manager.next_block_to_request(2, all_pieces(), t0);
	ASSERT_TRUE(duplicate.has_value());
	EXPECT_TRUE(duplicate->duplicate);
	EXPECT_EQ(duplicate->block, (BlockInfo{ 0, 0, block_size }));
	EXPECT_EQ(manager.holders(0, 0), 2);

	// block 0 is full, the third peer gets the next one
	const auto third = manager.next_block_to_request(3, all_pieces(), t0);
	EXPECT_EQ(third->block, (BlockInfo{ 0, block_size, block_size }));

	const BlockReport report = deliver(manager, 2, duplicate->block);
	EXPECT_TRUE(report.accepted);
	EXPECT_EQ(report.cancel_peers, std::vector<PeerKey>{ 1 });
	EXPECT_EQ(manager.holders(0, 0), 0);

	// the late copy from the first peer is dropped
	const BlockReport late = deliver(manager, 1, duplicate->block);
	EXPECT_FALSE(late.accepted);
}

TEST_F(PieceManagerTest, CompletedPieceIsWrittenOnce)
{
	PieceManager manager(descriptor, storage, no_endgame());
	const BlockInfo last{ 4, 0, 100 };

	const BlockReport report = deliver(manager, 1, last);
	EXPECT_TRUE(report.accepted);
	ASSERT_TRUE(report.piece_completed.has_value());
	EXPECT_EQ(*report.piece_completed, 4);
	EXPECT_EQ(manager.piece_state(4), PieceState::COMPLETE);
	EXPECT_EQ(storage.writes.at(4 * piece_length), 1);
	EXPECT_TRUE(std::equal(payload.begin() + 4 * piece_length, payload.end(),
			       storage.data.begin() + 4 * piece_length));

	const BlockReport again = deliver(manager, 2, last);
	EXPECT_FALSE(again.accepted);
	EXPECT_FALSE(again.piece_completed.has_value());
	EXPECT_EQ(storage.writes.at(4 * piece_length), 1);

	EXPECT_EQ(manager.completed_pieces(), 1);
	EXPECT_DOUBLE_EQ(manager.progress(), 100.0 / static_cast<double>(payload.size()));
	EXPECT_TRUE(manager.completed_bitfield().get_index(4));
}

TEST_F(PieceManagerTest, SingleCorruptByteFailsVerification)
{
	PieceManager manager(descriptor, storage, no_endgame());
	(void)deliver(manager, 1, { 0, 0, block_size });

	std::vector<uint8_t> corrupt(block_data({ 0, block_size, block_size }).begin(),
				     block_data({ 0, block_size, block_size }).end());
	corrupt[1234] ^= 0x01;
	const auto report = manager.report_block_received(2, 0, block_size, corrupt);
	ASSERT_TRUE(report.has_value());
	EXPECT_TRUE(report->accepted);
	EXPECT_TRUE(report->hash_mismatch);
	EXPECT_FALSE(report->piece_completed.has_value());

	std::vector<PeerKey> blamed = report->blamed_peers;
	std::sort(blamed.begin(), blamed.end());
	EXPECT_EQ(blamed, (std::vector<PeerKey>{ 1, 2 }));
	EXPECT_EQ(manager.hash_failures(1), 1);
	EXPECT_EQ(manager.hash_failures(2), 1);
	EXPECT_EQ(manager.hash_failures(3), 0);

	EXPECT_EQ(manager.piece_state(0), PieceState::PENDING);
	EXPECT_EQ(manager.block_state(0, 0), BlockState::MISSING);
	EXPECT_EQ(manager.block_state(0, block_size), BlockState::MISSING);
	EXPECT_TRUE(storage.writes.empty());
	EXPECT_EQ(manager.completed_pieces(), 0);

	// the piece can be downloaded again
	const auto retry = manager.next_block_to_request(3, only({ 0 }), t0);
	ASSERT_TRUE(retry.has_value());
	EXPECT_EQ(retry->block, (BlockInfo{ 0, 0, block_size }));
}

TEST_F(PieceManagerTest, AnyCorruptByteFailsVerification)
{
	std::vector<size_t> positions;
	for (size_t pos = 0; pos < block_size; pos += 997)
	{
		positions.push_back(pos);
	}
	positions.push_back(block_size - 1);

	for (uint32_t corrupt_block = 0; corrupt_block < 2; ++corrupt_block)
	{
		for (const size_t pos : positions)
		{
			PieceManager manager(descriptor, storage, no_endgame());
			BlockReport last;
			for (uint32_t b = 0; b < 2; ++b)
			{
				const BlockInfo block{ 1, b * static_cast<uint32_t>(block_size), block_size };
				std::vector<uint8_t> bytes(block_data(block).begin(), block_data(block).end());
				if (b == corrupt_block)
				{
					bytes[pos] ^= 0x80;
				}
				last = manager.report_block_received(7, block.piece, block.offset, bytes)
					       .value_or(BlockReport{});
			}
			EXPECT_TRUE(last.hash_mismatch) << "block " << corrupt_block << " byte " << pos;
			EXPECT_EQ(manager.piece_state(1), PieceState::PENDING);
			EXPECT_EQ(manager.completed_pieces(), 0);
		}
	}
	EXPECT_TRUE(storage.writes.empty());
}

TEST_F(PieceManagerTest, ExpiredRequestsAreReassigned)
{
	PieceManager manager(descriptor, storage, no_endgame());
	const auto assignment = manager.next_block_to_request(1, only({ 1 }), t0);
	ASSERT_TRUE(assignment.has_value());

	EXPECT_TRUE(manager.expired_requests(t0 + 1000ms).empty());
	const auto expired = manager.expired_requests(t0 + 1001ms);
	ASSERT_EQ(expired.size(), 1);
	EXPECT_EQ(expired[0].peer, 1);
	EXPECT_EQ(expired[0].block, assignment->block);
	// listing doesn't release anything
	EXPECT_EQ(manager.block_state(1, 0), BlockState::REQUESTED);

	manager.report_request_timed_out(1, expired[0].block.piece, expired[0].block.offset,
					 t0 + 1001ms);
	EXPECT_EQ(manager.block_state(1, 0), BlockState::MISSING);

	const auto reassigned = manager.next_block_to_request(2, only({ 1 }), t0 + 1001ms);
	ASSERT_TRUE(reassigned.has_value());
	EXPECT_EQ(reassigned->block, assignment->block);
}

TEST_F(PieceManagerTest, TimedOutBlockGoesToAnotherPeerFirst)
{
	PieceManager manager(descriptor, storage, no_endgame());
	const auto first = manager.next_block_to_request(1, only({ 1 }), t0);
	ASSERT_TRUE(first.has_value());
	manager.report_request_timed_out(1, first->block.piece, first->block.offset, t0 + 1001ms);

	// the silent peer moves on to the next block of the piece
	const auto second = manager.next_block_to_request(1, only({ 1 }), t0 + 1001ms);
	ASSERT_TRUE(second.has_value());
	EXPECT_EQ(second->block, (BlockInfo{ 1, block_size, block_size }));
	EXPECT_FALSE(manager.next_block_to_request(1, only({ 1 }), t0 + 1002ms).has_value());

	const auto reassigned = manager.next_block_to_request(2, only({ 1 }), t0 + 1002ms);
	ASSERT_TRUE(reassigned.has_value());
	EXPECT_EQ(reassigned->block, first->block);
}

TEST_F(PieceManagerTest, TimedOutPeerGetsTheBlockAgainLater)
{
	PieceManager manager(descriptor, storage, no_endgame());
	const auto first = manager.next_block_to_request(1, only({ 4 }), t0);
	ASSERT_TRUE(first.has_value());
	manager.report_request_timed_out(1, 4, 0, t0 + 1001ms);

	// nobody else took it within a request timeout
	EXPECT_FALSE(manager.next_block_to_request(1, only({ 4 }), t0 + 2000ms).has_value());
	const auto retry = manager.next_block_to_request(1, only({ 4 }), t0 + 2001ms);
	ASSERT_TRUE(retry.has_value());
	EXPECT_EQ(retry->block, first->block);
}

TEST_F(PieceManagerTest, TimedOutPeerIsNotGivenADuplicate)
{
	PieceManagerSettings settings = no_endgame();
	settings.endgame_threshold = pieces + 1;
	PieceManager manager(descriptor, storage, settings);

	(void)manager.next_block_to_request(1, only({ 4 }), t0);
	(void)manager.next_block_to_request(2, only({ 4 }), t0);
	manager.report_request_timed_out(1, 4, 0, t0 + 1001ms);
	ASSERT_EQ(manager.holders(4, 0), 1);

	EXPECT_FALSE(manager.next_block_to_request(1, only({ 4 }), t0 + 1001ms).has_value());
	EXPECT_TRUE(manager.next_block_to_request(3, only({ 4 }), t0 + 1001ms).has_value());
}

TEST_F(PieceManagerTest, TimeoutOfOneHolderKeepsTheOther)
{
	PieceManagerSettings settings = no_endgame();
	settings.endgame_threshold = pieces + 1;
	PieceManager manager(descriptor, storage, settings);

	(void)manager.next_block_to_request(1, only({ 4 }), t0);
	const auto duplicate = manager.next_block_to_request(2, only({ 4 }), t0);
	ASSERT_TRUE(duplicate.has_value());
	ASSERT_TRUE(duplicate->duplicate);

	manager.report_request_timed_out(1, 4, 0, t0);
	EXPECT_EQ(manager.block_state(4, 0), BlockState::REQUESTED);
	EXPECT_EQ(manager.holders(4, 0), 1);
	manager.report_request_timed_out(2, 4, 0, t0);
	EXPECT_EQ(manager.block_state(4, 0), BlockState::MISSING);
}

TEST_F(PieceManagerTest, WriteFailureRevertsPiece)
{
	PieceManager manager(descriptor, storage, no_endgame());
	storage.failures_left = 1;

	const BlockReport failed = deliver(manager, 1, { 4, 0, 100 });
	EXPECT_TRUE(failed.write_failed);
	EXPECT_FALSE(failed.piece_completed.has_value());
	EXPECT_EQ(manager.piece_state(4), PieceState::PENDING);
	EXPECT_EQ(manager.block_state(4, 0), BlockState::MISSING);
	EXPECT_EQ(manager.completed_pieces(), 0);
	EXPECT_DOUBLE_EQ(manager.progress(), 0.0);
	// a failed write is not the peer's fault
	EXPECT_EQ(manager.hash_failures(1), 0);

	const BlockReport retried = deliver(manager, 1, { 4, 0, 100 });
	EXPECT_EQ(retried.piece_completed, std::optional<uint32_t>(4));
	EXPECT_EQ(manager.piece_state(4), PieceState::COMPLETE);
}

TEST_F(PieceManagerTest, RejectsMalformedBlocks)
{
	PieceManager manager(descriptor, storage, no_endgame());
	const std::vector<uint8_t> block(block_size, 0);

	EXPECT_EQ(manager.report_block_received(1, pieces, 0, block).error(),
		  BlockRejection::UNKNOWN_PIECE);
	EXPECT_EQ(manager.report_block_received(1, 0, 100, block).error(),
		  BlockRejection::MISALIGNED_OFFSET);
	EXPECT_EQ(manager.report_block_received(1, 0, 2 * block_size, block).error(),
		  BlockRejection::MISALIGNED_OFFSET);
	EXPECT_EQ(manager.report_block_received(1, 0, 0, std::span(block).first(100)).error(),
		  BlockRejection::WRONG_LENGTH);
	EXPECT_EQ(manager.report_block_received(1, 4, 0, block).error(), BlockRejection::WRONG_LENGTH);
	EXPECT_EQ(manager.block_state(0, 0), BlockState::MISSING);
}

TEST_F(PieceManagerTest, UnrequestedBlockIsAccepted)
{
	PieceManager manager(descriptor, storage, no_endgame());
	const BlockReport report = deliver(manager, 7, { 2, block_size, block_size });
	EXPECT_TRUE(report.accepted);
	EXPECT_TRUE(report.cancel_peers.empty());
	EXPECT_EQ(manager.block_state(2, block_size), BlockState::RECEIVED);

	// the remaining block of the piece is still handed out
	const auto next = manager.next_block_to_request(1, only({ 2 }), t0);
	ASSERT_TRUE(next.has_value());
	EXPECT_EQ(next->block, (BlockInfo{ 2, 0, block_size }));
	EXPECT_FALSE(manager.next_block_to_request(1, only({ 2 }), t0).has_value());
}

TEST_F(PieceManagerTest, ReleaseAllForPeer)
{
	PieceManager manager(descriptor, storage, no_endgame());
	std::vector<BlockInfo> held;
	for (int i = 0; i < 3; ++i)
	{
		held.push_back(manager.next_block_to_request(1, all_pieces(), t0)->block);
	}
	const auto other = manager.next_block_to_request(2, all_pieces(), t0);
	ASSERT_TRUE(other.has_value());

	manager.release_all_for(1);
	for (const auto &block : held)
	{
		EXPECT_EQ(manager.block_state(block.piece, block.offset), BlockState::MISSING);
	}
	EXPECT_EQ(manager.block_state(other->block.piece, other->block.offset),
		  BlockState::REQUESTED);
	EXPECT_TRUE(manager.expired_requests(t0 + 1h).size() == 1);
}

TEST_F(PieceManagerTest, CanSupply)
{
	PieceManager manager(descriptor, storage, no_endgame());
	EXPECT_FALSE(manager.can_supply(message::Bitfield(pieces)));
	EXPECT_TRUE(manager.can_supply(only({ 4 })));
	deliver_piece(manager, 1, 4);
	EXPECT_FALSE(manager.can_supply(only({ 4 })));
	EXPECT_TRUE(manager.can_supply(only({ 3, 4 })));
}

TEST_F(PieceManagerTest, AvailabilityFollowsPeers)
{
	PieceManager manager(descriptor, storage, no_endgame());
	manager.add_peer_availability(only({ 1, 2 }));
	manager.add_peer_have(2);
	manager.add_peer_have(pieces);
	EXPECT_EQ(manager.availability(1), 1);
	EXPECT_EQ(manager.availability(2), 2);

	manager.remove_peer_availability(only({ 1, 2 }));
	manager.remove_peer_availability(only({ 1 }));
	EXPECT_EQ(manager.availability(1), 0);
	EXPECT_EQ(manager.availability(2), 1);
}

TEST_F(PieceManagerTest, FullDownload)
{
	PieceManager manager(descriptor, storage, no_endgame());
	while (const auto next = manager.next_block_to_request(1, all_pieces(), t0))
	{
		(void)deliver(manager, 1, next->block);
	}
	EXPECT_TRUE(manager.is_complete());
	EXPECT_DOUBLE_EQ(manager.progress(), 1.0);
	EXPECT_TRUE(manager.completed_bitfield().all());
	EXPECT_EQ(storage.data, payload);
	EXPECT_EQ(storage.writes.size(), pieces);
	for (const auto &[offset, count] : storage.writes)
	{
		EXPECT_EQ(count, 1) << "offset " << offset;
	}
	EXPECT_FALSE(manager.can_supply(all_pieces()));
}
