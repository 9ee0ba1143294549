#include "gambit/status.hpp"

#include <bit>

#include "gambit/attacks.hpp"
#include "gambit/movegen.hpp"

namespace gambit {

namespace {

bool is_lone_king(const Board& board, Colour colour) {
  return board.count_pieces_by_colour(colour) == 1;
}

bool is_king_and_minor(const Board& board, Colour colour) {
  Bitboard others = board.pieces_by_colour(colour) & ~Bitboard(board.king_square(colour));
  if (std::popcount(others) != 1) {
    return false;
  }
  const auto piece = board.piece_at(Square::pop_first_occupied(others));
  return piece.has_value() && is_minor(*piece);
}

} // namespace

std::string_view to_string(GameStatus status) {
  switch (status) {
  case GameStatus::Active:
    return "active";
  case GameStatus::Check:
    return "check";
  case GameStatus::Checkmate:
    return "checkmate";
  case GameStatus::Stalemate:
    return "stalemate";
  case GameStatus::Draw:
    return "draw";
  }
  return "unknown";
}

bool is_insufficient_material(const Board& board) {
  const bool white_bare = is_lone_king(board, Colour::White);
  const bool black_bare = is_lone_king(board, Colour::Black);

  if (white_bare && black_bare) {
    return true;
  }

  return (white_bare && is_king_and_minor(board, Colour::Black)) ||
         (black_bare && is_king_and_minor(board, Colour::White));
}

GameStatus evaluate_status(const Position& pos) {
  const bool in_check = is_in_check(pos.colour_to_move, pos.board);

  if (!has_legal_move(pos)) {
    return in_check ? GameStatus::Checkmate : GameStatus::Stalemate;
  }

  if (pos.is_fifty_move_draw() || is_insufficient_material(pos.board)) {
    return GameStatus::Draw;
  }

  return in_check ? GameStatus::Check : GameStatus::Active;
}

} // namespace gambit
