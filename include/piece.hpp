#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>

inline constexpr uint32_t block_size = 16384;

/**
 * @brief A block as it appears in request, cancel and piece messages
 */
struct BlockInfo {
	uint32_t piece = 0;
	uint32_t offset = 0;
	uint32_t length = 0;

	auto operator<=>(const BlockInfo &other) const = default;
};

/**
 * @brief Identifies a connection for the lifetime of a download
 *
 * Ids are never reused, so stale reports from a closed session can't be
 * mistaken for reports from a new one.
 */
using PeerKey = uint64_t;

/**
 * @brief Number of blocks in a piece of the given size
 */
[[nodiscard]] constexpr size_t blocks_in_piece(size_t piece_size)
{
	// ceiling rounding division
	return (piece_size + block_size - 1) / block_size;
}
