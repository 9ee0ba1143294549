#pragma once

// =============================================================================
// BITBOARDS
// =============================================================================
//
// A bitboard is a 64-bit set of squares: bit 0 = A1, bit 7 = H1, bit 63 = H8.
// The board keeps one per piece and one per colour next to its mailbox so that
// "how many white knights are left?" is a popcount and "is anything between
// the king and the rook?" is a single AND against a path mask.
//
// Move generation itself walks squares one at a time; bitboards are only used
// for occupancy and material queries.
//
// =============================================================================

#include <cstdint>

namespace gambit {

using Bitboard = std::uint64_t;

// Ranks 1 and 8: where pawns promote.
inline constexpr Bitboard BACK_RANKS = 0xFF00'0000'0000'00FFull;

// The four corner squares (A1, H1, A8, H8): where rooks start for castling.
inline constexpr Bitboard CORNERS = 0x8100'0000'0000'0081ull;

} // namespace gambit
