// =============================================================================
// ATTACK ORACLE
// =============================================================================
//
// "Is this square attacked?" underlies check detection, castling legality and
// therefore the whole legality filter. The board is small enough that a plain
// scan is fine: for each piece of the attacking colour, walk its pattern and
// see whether it reaches the square.
//
// =============================================================================

#include "gambit/attacks.hpp"

namespace gambit {

namespace {

Bitboard step_attacks(Square square, std::span<const Offset> offsets) {
  Bitboard result = 0;
  for (const Offset offset : offsets) {
    if (const auto target = square.offset(offset.file, offset.rank)) {
      result |= *target;
    }
  }
  return result;
}

Bitboard slider_attacks(Square square, std::span<const Offset> directions, const Board& board) {
  Bitboard result = 0;

  for (const Offset direction : directions) {
    auto current = square.offset(direction.file, direction.rank);

    while (current.has_value()) {
      result |= *current;

      if (board.has_piece_at(*current)) {
        break;
      }

      current = current->offset(direction.file, direction.rank);
    }
  }

  return result;
}

Bitboard pawn_attacks(Square square, Colour colour) {
  const int forward = pawn_direction(colour);
  const std::array<Offset, 2> diagonals = {{{-1, forward}, {1, forward}}};
  return step_attacks(square, diagonals);
}

} // namespace

std::span<const Offset> slider_directions(PieceKind kind) {
  switch (kind) {
  case PieceKind::Bishop:
    return BISHOP_DIRECTIONS;
  case PieceKind::Rook:
    return ROOK_DIRECTIONS;
  case PieceKind::Queen:
    return QUEEN_DIRECTIONS;
  case PieceKind::Pawn:
  case PieceKind::Knight:
  case PieceKind::King:
    break;
  }
  return {};
}

Bitboard attacks_for(Piece piece, Square square, const Board& board) {
  switch (kind(piece)) {
  case PieceKind::Pawn:
    return pawn_attacks(square, colour(piece));
  case PieceKind::Knight:
    return step_attacks(square, KNIGHT_OFFSETS);
  case PieceKind::King:
    return step_attacks(square, KING_OFFSETS);
  case PieceKind::Bishop:
  case PieceKind::Rook:
  case PieceKind::Queen:
    return slider_attacks(square, slider_directions(kind(piece)), board);
  }
  return 0;
}

bool attacks(const Board& board, Square attacker, Square target) {
  const auto piece = board.piece_at(attacker);
  if (!piece.has_value()) {
    return false;
  }
  return (attacks_for(*piece, attacker, board) & target) != 0;
}

Bitboard get_attackers(Square square, Colour colour, const Board& board) {
  Bitboard attackers = 0;
  Bitboard candidates = board.pieces_by_colour(colour);

  while (candidates != 0) {
    const Square from = Square::pop_first_occupied(candidates);
    if (attacks(board, from, square)) {
      attackers |= from;
    }
  }

  return attackers;
}

bool is_attacked(Square square, Colour colour, const Board& board) {
  Bitboard candidates = board.pieces_by_colour(colour);

  while (candidates != 0) {
    if (attacks(board, Square::pop_first_occupied(candidates), square)) {
      return true;
    }
  }

  return false;
}

// Check if a side's king is in check. Used for move legality filtering.
bool is_in_check(Colour colour, const Board& board) {
  return is_attacked(board.king_square(colour), !colour, board);
}

} // namespace gambit
