// =============================================================================
// POSITION STATE AND MOVE EXECUTION
// =============================================================================
//
// A chess position is more than just piece placement. It also includes:
//   - Side to move (white or black)
//   - Castling rights (which castles are still available)
//   - En passant square (if a pawn just moved two squares)
//   - Move clocks (for the fifty-move rule and move numbering)
//
// make_move applies a move and every side effect that follows from it.
// unmake_move reverses one, using the IrreversibleState the caller saved
// beforehand: castling rights, en passant square and the clocks cannot be
// reconstructed from the move alone.
//
// =============================================================================

#include "gambit/position.hpp"

#include "gambit/piece.hpp"

namespace gambit {

Position::Position(Board board_, Colour colour_to_move_, CastlingRights castling_rights_,
                   std::optional<Square> en_passant_square_, std::uint16_t half_move_clock_,
                   std::uint16_t full_move_counter_)
    : board(board_), colour_to_move(colour_to_move_), castling_rights(castling_rights_),
      en_passant_square(en_passant_square_), half_move_clock(half_move_clock_),
      full_move_counter(full_move_counter_) {}

Position Position::startpos() {
  return Position{Board::standard(), Colour::White, CastlingRights::all(), std::nullopt, 0, 1};
}

// =============================================================================
// MAKE MOVE
// =============================================================================
// Order matters: the en passant victim is lifted before anything lands, and
// castling rights are updated from the move's squares rather than from what is
// on them afterwards, so a rook captured on its home corner still costs its
// owner the right.
// =============================================================================

void Position::make_move(const Move& mv) {
  const Colour mover = colour_to_move;

  if (const auto capture_square = mv.capture_square()) {
    board.remove_piece(*capture_square);
  }

  if (mv.is_castling()) {
    const CastlingSquares squares = castling_squares(mover, *mv.castling_side);
    board.move_piece(squares.king_from, squares.king_to);
    board.move_piece(squares.rook_from, squares.rook_to);
  } else {
    board.remove_piece(mv.from);
    board.put_piece(mv.promotion_piece.value_or(mv.piece), mv.to);
  }

  if (is_king(mv.piece)) {
    castling_rights.remove_for_colour(mover);
  }
  castling_rights.remove_for_square(mv.from);
  castling_rights.remove_for_square(mv.to);

  en_passant_square = std::nullopt;
  if (is_pawn(mv.piece) && mv.rank_diff() == 2) {
    en_passant_square = mv.from.advance(mover);
  }

  if (mv.is_capture() || is_pawn(mv.piece)) {
    half_move_clock = 0;
  } else if (half_move_clock < MAX_COUNTER) {
    ++half_move_clock;
  }

  if (mover == Colour::Black && full_move_counter < MAX_COUNTER) {
    ++full_move_counter;
  }

  colour_to_move = !mover;
}

void Position::unmake_move(const Move& mv, const IrreversibleState& previous) {
  const Colour mover = !colour_to_move;

  if (mv.is_castling()) {
    const CastlingSquares squares = castling_squares(mover, *mv.castling_side);
    board.move_piece(squares.king_to, squares.king_from);
    board.move_piece(squares.rook_to, squares.rook_from);
  } else {
    // mv.piece is the pawn for a promotion, so this also undoes the promotion.
    board.remove_piece(mv.to);
    board.put_piece(mv.piece, mv.from);

    if (const auto capture_square = mv.capture_square()) {
      board.put_piece(*mv.captured_piece, *capture_square);
    }
  }

  castling_rights = previous.castling_rights;
  en_passant_square = previous.en_passant_square;
  half_move_clock = previous.half_move_clock;
  full_move_counter = previous.full_move_counter;

  colour_to_move = mover;
}

} // namespace gambit
