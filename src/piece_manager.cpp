#include "piece_manager.hpp"

#include "utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <vector>

const char *to_string(BlockRejection rejection)
{
	switch (rejection)
	{
	case BlockRejection::UNKNOWN_PIECE:
		return "unknown piece";
	case BlockRejection::MISALIGNED_OFFSET:
		return "misaligned block offset";
	case BlockRejection::WRONG_LENGTH:
		return "wrong block length";
	}
	return "unknown";
}

PieceManager::PieceManager(const TorrentDescriptor &descriptor, Storage &storage,
			   PieceManagerSettings settings)
	: m_descriptor(descriptor)
	, m_storage(storage)
	, m_settings(settings)
	, m_pieces(descriptor.number_of_pieces())
	, m_availability(descriptor.number_of_pieces(), 0)
{
	for (size_t i = 0; i < m_pieces.size(); ++i)
	{
		m_pieces[i].blocks.resize(blocks_in_piece(m_descriptor.piece_size(i)));
		m_pieces[i].missing = m_pieces[i].blocks.size();
	}
}

bool PieceManager::in_endgame() const
{
	return m_pieces.size() - m_complete < m_settings.endgame_threshold;
}

uint32_t PieceManager::block_length(const size_t piece, const size_t block) const
{
	const size_t piece_size = m_descriptor.piece_size(piece);
	const size_t begin = block * block_size;
	return static_cast<uint32_t>(std::min<size_t>(block_size, piece_size - begin));
}

bool PieceManager::backing_off(const Block &block, const PeerKey peer,
			       const Clock::time_point now) const
{
	return block.returned_by == peer && now - block.returned_at < m_settings.request_timeout;
}

std::optional<size_t> PieceManager::first_missing(const Piece &piece, const PeerKey peer,
						  const Clock::time_point now) const
{
	for (size_t b = 0; b < piece.blocks.size(); ++b)
	{
		const Block &block = piece.blocks[b];
		if (block.state == BlockState::MISSING && !backing_off(block, peer, now))
		{
			return b;
		}
	}
	return std::nullopt;
}

std::optional<BlockAssignment> PieceManager::pick_missing(const PeerKey peer,
							  const message::Bitfield &availability,
							  const Clock::time_point now)
{
	std::optional<size_t> best;
	size_t best_block = 0;
	for (size_t i = 0; i < m_pieces.size(); ++i)
	{
		const Piece &piece = m_pieces[i];
		if (piece.state != PieceState::PENDING || piece.missing == 0 ||
		    !availability.get_index(i))
		{
			continue;
		}
		// strict comparison keeps the lowest index among equally rare pieces
		if (best.has_value() && m_availability[i] >= m_availability[*best])
		{
			continue;
		}
		if (const auto b = first_missing(piece, peer, now); b.has_value())
		{
			best = i;
			best_block = *b;
		}
	}
	if (!best.has_value())
	{
		return std::nullopt;
	}

	Piece &piece = m_pieces[*best];
	Block &block = piece.blocks[best_block];
	block.state = BlockState::REQUESTED;
	block.holders.push_back({ peer, now });
	block.returned_by.reset();
	--piece.missing;
	return BlockAssignment{ { static_cast<uint32_t>(*best),
				  static_cast<uint32_t>(best_block * block_size),
				  block_length(*best, best_block) },
				false };
}

std::optional<BlockAssignment> PieceManager::pick_duplicate(const PeerKey peer,
							    const message::Bitfield &availability,
							    const Clock::time_point now)
{
	std::vector<size_t> candidates;
	for (size_t i = 0; i < m_pieces.size(); ++i)
	{
		if (m_pieces[i].state == PieceState::PENDING && availability.get_index(i))
		{
			candidates.push_back(i);
		}
	}
	std::stable_sort(candidates.begin(), candidates.end(), [this](size_t lhs, size_t rhs) {
		return m_availability[lhs] < m_availability[rhs];
	});

	for (const size_t index : candidates)
	{
		Piece &piece = m_pieces[index];
		for (size_t b = 0; b < piece.blocks.size(); ++b)
		{
			Block &block = piece.blocks[b];
			if (block.state != BlockState::REQUESTED ||
			    block.holders.size() >= m_settings.max_endgame_holders ||
			    backing_off(block, peer, now))
			{
				continue;
			}
			const bool held_by_peer =
				std::any_of(block.holders.begin(), block.holders.end(),
					    [peer](const Holder &holder) { return holder.peer == peer; });
			if (held_by_peer)
			{
				continue;
			}
			block.holders.push_back({ peer, now });
			return BlockAssignment{ { static_cast<uint32_t>(index),
						  static_cast<uint32_t>(b * block_size),
						  block_length(index, b) },
						true };
		}
	}
	return std::nullopt;
}

std::optional<BlockAssignment>
PieceManager::next_block_to_request(const PeerKey peer, const message::Bitfield &availability,
				    const Clock::time_point now)
{
	const std::lock_guard lock(m_mutex);

	if (auto ret = pick_missing(peer, availability, now); ret.has_value())
	{
		return ret;
	}
	if (in_endgame())
	{
		return pick_duplicate(peer, availability, now);
	}
	return std::nullopt;
}

void PieceManager::reset_piece(Piece &piece)
{
	piece.state = PieceState::PENDING;
	for (auto &block : piece.blocks)
	{
		block = Block{};
	}
	piece.missing = piece.blocks.size();
	piece.received = 0;
}

void PieceManager::revert_completed(const uint32_t index)
{
	const std::lock_guard lock(m_mutex);
	reset_piece(m_pieces[index]);
	--m_complete;
	m_verified_bytes -= m_descriptor.piece_size(index);
}

tl::expected<BlockReport, BlockRejection>
PieceManager::report_block_received(const PeerKey peer, const uint32_t index,
				    const uint32_t offset, const std::span<const uint8_t> bytes)
{
	BlockReport report;
	std::vector<uint8_t> assembled;
	std::vector<PeerKey> contributors;

	{
		const std::lock_guard lock(m_mutex);

		if (index >= m_pieces.size())
		{
			return tl::make_unexpected(BlockRejection::UNKNOWN_PIECE);
		}
		Piece &piece = m_pieces[index];
		if (offset % block_size != 0 || offset / block_size >= piece.blocks.size())
		{
			return tl::make_unexpected(BlockRejection::MISALIGNED_OFFSET);
		}
		const size_t b = offset / block_size;
		if (bytes.size() != block_length(index, b))
		{
			return tl::make_unexpected(BlockRejection::WRONG_LENGTH);
		}

		Block &block = piece.blocks[b];
		if (piece.state != PieceState::PENDING || block.state == BlockState::RECEIVED)
		{
			return report;
		}

		for (const auto &holder : block.holders)
		{
			if (holder.peer != peer)
			{
				report.cancel_peers.push_back(holder.peer);
			}
		}
		if (block.state == BlockState::MISSING)
		{
			--piece.missing;
		}
		block.holders.clear();
		block.state = BlockState::RECEIVED;
		block.data.assign(bytes.begin(), bytes.end());
		block.contributor = peer;
		++piece.received;
		report.accepted = true;

		if (piece.received < piece.blocks.size())
		{
			return report;
		}

		// no block of a verifying piece is handed out, so hashing can run unlocked
		piece.state = PieceState::VERIFYING;
		assembled.reserve(m_descriptor.piece_size(index));
		for (auto &received : piece.blocks)
		{
			assembled.insert(assembled.end(), received.data.begin(), received.data.end());
			received.data = {};
			if (std::find(contributors.begin(), contributors.end(), received.contributor) ==
			    contributors.end())
			{
				contributors.push_back(received.contributor);
			}
		}
	}

	const bool hash_ok = utils::compute_sha1(assembled) == m_descriptor.piece_hashes[index];

	{
		const std::lock_guard lock(m_mutex);
		Piece &piece = m_pieces[index];
		if (!hash_ok)
		{
			reset_piece(piece);
			for (const PeerKey contributor : contributors)
			{
				++m_hash_failures[contributor];
			}
			report.hash_mismatch = true;
			report.blamed_peers = std::move(contributors);
			std::cerr << "Piece " << index << " failed hash check" << '\n';
			return report;
		}
		piece.state = PieceState::COMPLETE;
		++m_complete;
		m_verified_bytes += assembled.size();
	}

	try
	{
		m_storage.write(m_descriptor.piece_offset(index), assembled);
	}
	catch (const std::exception &e)
	{
		std::cerr << "Failed to write piece " << index << ": " << e.what() << '\n';
		revert_completed(index);
		report.write_failed = true;
		return report;
	}
	report.piece_completed = index;
	return report;
}

void PieceManager::report_request_timed_out(const PeerKey peer, const uint32_t index,
					    const uint32_t offset, const Clock::time_point now)
{
	const std::lock_guard lock(m_mutex);

	if (index >= m_pieces.size() || offset % block_size != 0 ||
	    offset / block_size >= m_pieces[index].blocks.size())
	{
		return;
	}
	Piece &piece = m_pieces[index];
	Block &block = piece.blocks[offset / block_size];
	if (block.state != BlockState::REQUESTED)
	{
		return;
	}
	if (std::erase_if(block.holders,
			  [peer](const Holder &holder) { return holder.peer == peer; }) == 0)
	{
		return;
	}
	block.returned_by = peer;
	block.returned_at = now;
	if (block.holders.empty())
	{
		block.state = BlockState::MISSING;
		++piece.missing;
	}
}

void PieceManager::release_all_for(const PeerKey peer)
{
	const std::lock_guard lock(m_mutex);

	for (auto &piece : m_pieces)
	{
		if (piece.state != PieceState::PENDING)
		{
			continue;
		}
		for (auto &block : piece.blocks)
		{
			if (block.state != BlockState::REQUESTED)
			{
				continue;
			}
			std::erase_if(block.holders,
				      [peer](const Holder &holder) { return holder.peer == peer; });
			if (block.holders.empty())
			{
				block.state = BlockState::MISSING;
				++piece.missing;
			}
		}
	}
}

std::vector<ExpiredRequest> PieceManager::expired_requests(const Clock::time_point now) const
{
	const std::lock_guard lock(m_mutex);

	std::vector<ExpiredRequest> ret;
	for (size_t i = 0; i < m_pieces.size(); ++i)
	{
		const Piece &piece = m_pieces[i];
		if (piece.state != PieceState::PENDING)
		{
			continue;
		}
		for (size_t b = 0; b < piece.blocks.size(); ++b)
		{
			for (const auto &holder : piece.blocks[b].holders)
			{
				if (now - holder.requested_at > m_settings.request_timeout)
				{
					ret.push_back({ holder.peer,
							{ static_cast<uint32_t>(i),
							  static_cast<uint32_t>(b * block_size),
							  block_length(i, b) } });
				}
			}
		}
	}
	return ret;
}

void PieceManager::add_peer_availability(const message::Bitfield &bitfield)
{
	const std::lock_guard lock(m_mutex);
	for (size_t i = 0; i < m_availability.size(); ++i)
	{
		if (bitfield.get_index(i))
		{
			++m_availability[i];
		}
	}
}

void PieceManager::add_peer_have(const uint32_t index)
{
	const std::lock_guard lock(m_mutex);
	if (index < m_availability.size())
	{
		++m_availability[index];
	}
}

void PieceManager::remove_peer_availability(const message::Bitfield &bitfield)
{
	const std::lock_guard lock(m_mutex);
	for (size_t i = 0; i < m_availability.size(); ++i)
	{
		if (bitfield.get_index(i) && m_availability[i] > 0)
		{
			--m_availability[i];
		}
	}
}

double PieceManager::progress() const
{
	const std::lock_guard lock(m_mutex);
	if (m_descriptor.total_length <= 0)
	{
		return 1.0;
	}
	return static_cast<double>(m_verified_bytes) /
	       static_cast<double>(m_descriptor.total_length);
}

bool PieceManager::is_complete() const
{
	const std::lock_guard lock(m_mutex);
	return m_complete == m_pieces.size();
}

size_t PieceManager::completed_pieces() const
{
	const std::lock_guard lock(m_mutex);
	return m_complete;
}

message::Bitfield PieceManager::completed_bitfield() const
{
	const std::lock_guard lock(m_mutex);
	message::Bitfield ret(m_pieces.size());
	for (size_t i = 0; i < m_pieces.size(); ++i)
	{
		if (m_pieces[i].state == PieceState::COMPLETE)
		{
			ret.set_index(i, true);
		}
	}
	return ret;
}

bool PieceManager::can_supply(const message::Bitfield &availability) const
{
	const std::lock_guard lock(m_mutex);
	for (size_t i = 0; i < m_pieces.size(); ++i)
	{
		if (m_pieces[i].state != PieceState::COMPLETE && availability.get_index(i))
		{
			return true;
		}
	}
	return false;
}

size_t PieceManager::hash_failures(const PeerKey peer) const
{
	const std::lock_guard lock(m_mutex);
	const auto it = m_hash_failures.find(peer);
	return it == m_hash_failures.end() ? 0 : it->second;
}

PieceState PieceManager::piece_state(const uint32_t piece) const
{
	const std::lock_guard lock(m_mutex);
	return m_pieces.at(piece).state;
}

BlockState PieceManager::block_state(const uint32_t piece, const uint32_t offset) const
{
	const std::lock_guard lock(m_mutex);
	const Piece &entry = m_pieces.at(piece);
	if (entry.state == PieceState::COMPLETE)
	{
		return BlockState::RECEIVED;
	}
	return entry.blocks.at(offset / block_size).state;
}

size_t PieceManager::holders(const uint32_t piece, const uint32_t offset) const
{
	const std::lock_guard lock(m_mutex);
	return m_pieces.at(piece).blocks.at(offset / block_size).holders.size();
}

size_t PieceManager::availability(const uint32_t piece) const
{
	const std::lock_guard lock(m_mutex);
	return m_availability.at(piece);
}
