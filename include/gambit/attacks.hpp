#pragma once

#include <array>
#include <span>

#include "gambit/bitboard.hpp"
#include "gambit/board.hpp"
#include "gambit/colour.hpp"
#include "gambit/piece.hpp"
#include "gambit/square.hpp"

namespace gambit {

struct Offset {
  int file;
  int rank;
};

inline constexpr std::array<Offset, 8> KNIGHT_OFFSETS = {{
    {1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2},
}};

inline constexpr std::array<Offset, 8> KING_OFFSETS = {{
    {0, 1}, {1, 1}, {1, 0}, {1, -1}, {0, -1}, {-1, -1}, {-1, 0}, {-1, 1},
}};

inline constexpr std::array<Offset, 4> ROOK_DIRECTIONS = {{{0, 1}, {1, 0}, {0, -1}, {-1, 0}}};
inline constexpr std::array<Offset, 4> BISHOP_DIRECTIONS = {{{1, 1}, {1, -1}, {-1, -1}, {-1, 1}}};
inline constexpr std::array<Offset, 8> QUEEN_DIRECTIONS = {{
    {0, 1}, {1, 0}, {0, -1}, {-1, 0}, {1, 1}, {1, -1}, {-1, -1}, {-1, 1},
}};

/// Ray directions for a sliding piece; empty for pawns, knights and kings.
std::span<const Offset> slider_directions(PieceKind kind);

/// Forward rank step for a pawn of `colour`.
constexpr int pawn_direction(Colour colour) {
  return colour == Colour::White ? 1 : -1;
}

// Every square `piece` standing on `square` attacks. Sliders stop at the first
// occupied square (which is included). Pawns attack both forward diagonals
// whether or not anything stands there, and never the square straight ahead.
Bitboard attacks_for(Piece piece, Square square, const Board& board);

// Whether the piece on `attacker` attacks `target`. False for an empty square.
bool attacks(const Board& board, Square attacker, Square target);

// Squares holding `colour` pieces that attack `square`.
Bitboard get_attackers(Square square, Colour colour, const Board& board);
bool is_attacked(Square square, Colour colour, const Board& board);
bool is_in_check(Colour colour, const Board& board);

} // namespace gambit
