#pragma once

#include <cstdint>
#include <string_view>

#include "gambit/board.hpp"
#include "gambit/position.hpp"

namespace gambit {

enum class GameStatus : std::uint8_t { Active, Check, Checkmate, Stalemate, Draw };

/// Checkmate, stalemate and draws end the game.
constexpr bool is_terminal(GameStatus status) {
  return status == GameStatus::Checkmate || status == GameStatus::Stalemate ||
         status == GameStatus::Draw;
}

std::string_view to_string(GameStatus status);

// Lone king against lone king, or lone king against king and one minor piece.
// Other dead positions (opposite-coloured bishops, two knights) are not
// recognised.
bool is_insufficient_material(const Board& board);

// Classifies `pos` from the point of view of the side to move. Mate and
// stalemate take precedence over the fifty-move rule, which takes precedence
// over insufficient material.
GameStatus evaluate_status(const Position& pos);

} // namespace gambit
