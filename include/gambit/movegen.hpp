#pragma once

#include <cstddef>
#include <cstdint>

#include "gambit/attacks.hpp"
#include "gambit/move.hpp"
#include "gambit/position.hpp"

namespace gambit {

inline constexpr std::size_t MAX_LEGAL_MOVES = 128;

// Pseudo-legal moves obey each piece's movement and occupancy rules but may
// leave the mover's own king attacked. Castling is the exception: its
// attacked-square conditions are checked during generation.
MoveList pseudo_legal_moves(const Position& pos);
MoveList pseudo_legal_moves_from(const Position& pos, Square from);

// Legality trial: plays `mv` on a scratch copy of `pos` and reports whether the
// mover's king is attacked afterwards. `pos` itself is never touched.
bool leaves_king_in_check(const Position& pos, const Move& mv);

MoveList legal_moves(const Position& pos);
MoveList legal_moves_from(const Position& pos, Square from);

// Stops at the first legal move found.
bool has_legal_move(const Position& pos);

std::uint64_t perft(const Position& pos, std::uint8_t depth);

} // namespace gambit
