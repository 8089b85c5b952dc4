#pragma once

#include "metainfo_file.hpp"
#include "peer_message.hpp"
#include "piece.hpp"
#include "storage.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

enum class PieceState {
	PENDING,
	VERIFYING,
	COMPLETE,
};

enum class BlockState {
	MISSING,
	REQUESTED,
	RECEIVED,
};

struct PieceManagerSettings {
	std::chrono::milliseconds request_timeout{ 30000 };
	// endgame starts once fewer pieces than this are incomplete
	size_t endgame_threshold = 4;
	// how many peers may be asked for the same block in endgame
	size_t max_endgame_holders = 2;
};

struct BlockAssignment {
	BlockInfo block;
	// the block is already requested from another peer (endgame)
	bool duplicate = false;
};

/**
 * @brief Why a received block was refused, the sender violated the protocol
 */
enum class BlockRejection {
	UNKNOWN_PIECE,
	MISALIGNED_OFFSET,
	WRONG_LENGTH,
};

[[nodiscard]] const char *to_string(BlockRejection rejection);

struct BlockReport {
	// false if the block was a duplicate or the piece is no longer needed
	bool accepted = false;
	// other peers the block was requested from, they should get a cancel
	std::vector<PeerKey> cancel_peers;
	// set when the block finished its piece and the piece passed verification
	std::optional<uint32_t> piece_completed;
	bool hash_mismatch = false;
	// peers that contributed blocks to a piece that failed verification
	std::vector<PeerKey> blamed_peers;
	bool write_failed = false;
};

struct ExpiredRequest {
	PeerKey peer;
	BlockInfo block;
};

/**
 * @brief Authoritative table of pieces and blocks of one download
 *
 * It decides which block every peer asks for next (rarest piece first, ties
 * go to the lowest index), collects block data, verifies finished pieces
 * against their SHA1 and forwards them to storage exactly once.
 *
 * Every public method is serialized by one mutex, so two peers are never
 * given the same missing block unless endgame duplication allows it.
 */
class PieceManager {
public:
	using Clock = std::chrono::steady_clock;

private:
	struct Holder {
		PeerKey peer;
		Clock::time_point requested_at;
	};

	struct Block {
		BlockState state = BlockState::MISSING;
		std::vector<Holder> holders;
		std::vector<uint8_t> data;
		PeerKey contributor = 0;
		// last peer that gave the block back, others get it first for one request timeout
		std::optional<PeerKey> returned_by;
		Clock::time_point returned_at;
	};

	struct Piece {
		PieceState state = PieceState::PENDING;
		std::vector<Block> blocks;
		size_t missing = 0;
		size_t received = 0;
	};

	TorrentDescriptor m_descriptor;
	Storage &m_storage;
	PieceManagerSettings m_settings;

	mutable std::mutex m_mutex;
	std::vector<Piece> m_pieces;
	// number of connected peers advertising each piece
	std::vector<size_t> m_availability;
	std::map<PeerKey, size_t> m_hash_failures;
	size_t m_complete = 0;
	uint64_t m_verified_bytes = 0;

	[[nodiscard]] bool in_endgame() const;
	[[nodiscard]] uint32_t block_length(size_t piece, size_t block) const;
	[[nodiscard]] bool backing_off(const Block &block, PeerKey peer, Clock::time_point now) const;
	[[nodiscard]] std::optional<size_t> first_missing(const Piece &piece, PeerKey peer,
							  Clock::time_point now) const;
	[[nodiscard]] std::optional<BlockAssignment>
	pick_missing(PeerKey peer, const message::Bitfield &availability, Clock::time_point now);
	[[nodiscard]] std::optional<BlockAssignment>
	pick_duplicate(PeerKey peer, const message::Bitfield &availability, Clock::time_point now);
	void reset_piece(Piece &piece);
	void revert_completed(uint32_t index);

public:
	PieceManager(const TorrentDescriptor &descriptor, Storage &storage,
		     PieceManagerSettings settings = {});

	PieceManager(const PieceManager &) = delete;
	PieceManager &operator=(const PieceManager &) = delete;

	/**
	 * @brief Picks the block the peer should be asked for next and marks it requested
	 *
	 * @param availability pieces the peer advertised
	 * @return std::nullopt if the peer has nothing we need right now
	 */
	[[nodiscard]] std::optional<BlockAssignment>
	next_block_to_request(PeerKey peer, const message::Bitfield &availability,
			      Clock::time_point now);

	/**
	 * @brief Stores a block, verifies and writes out its piece once all blocks are in
	 *
	 * Blocks that nobody asked for are accepted too as long as they are still
	 * missing, verification protects the data.
	 */
	[[nodiscard]] tl::expected<BlockReport, BlockRejection>
	report_block_received(PeerKey peer, uint32_t piece, uint32_t offset,
			      std::span<const uint8_t> bytes);

	/**
	 * @brief Takes the block back from the peer
	 *
	 * Until the request timeout passes again the block is not handed to the same
	 * peer, so a peer that stopped answering can't keep it away from the others.
	 */
	void report_request_timed_out(PeerKey peer, uint32_t piece, uint32_t offset,
				      Clock::time_point now);
	/**
	 * @brief Drops every request held by the peer, used when its session ends
	 */
	void release_all_for(PeerKey peer);
	/**
	 * @brief Requests older than the request timeout
	 *
	 * They are only listed, the caller reports them back with
	 * report_request_timed_out() after it cancelled them.
	 */
	[[nodiscard]] std::vector<ExpiredRequest> expired_requests(Clock::time_point now) const;

	void add_peer_availability(const message::Bitfield &bitfield);
	void add_peer_have(uint32_t index);
	void remove_peer_availability(const message::Bitfield &bitfield);

	/**
	 * @brief Fraction of verified bytes, 1.0 when done
	 */
	[[nodiscard]] double progress() const;
	[[nodiscard]] bool is_complete() const;
	[[nodiscard]] size_t completed_pieces() const;
	[[nodiscard]] message::Bitfield completed_bitfield() const;
	/**
	 * @brief Whether the peer has at least one piece that isn't complete yet
	 */
	[[nodiscard]] bool can_supply(const message::Bitfield &availability) const;
	[[nodiscard]] size_t hash_failures(PeerKey peer) const;

	[[nodiscard]] PieceState piece_state(uint32_t piece) const;
	[[nodiscard]] BlockState block_state(uint32_t piece, uint32_t offset) const;
	[[nodiscard]] size_t holders(uint32_t piece, uint32_t offset) const;
	[[nodiscard]] size_t availability(uint32_t piece) const;
};
