// =============================================================================
// MOVE GENERATION: Pseudo-Legal Moves, Then Filter
// =============================================================================
//
// Each piece kind has its own routine. Knights and kings step through a fixed
// offset table, sliders walk each ray until something blocks them, and pawns
// handle pushes, captures, en passant and promotion by hand.
//
// The result is pseudo-legal: a move may still expose the mover's king. The
// legality filter plays every candidate on a scratch copy of the position and
// throws away the ones that leave the king attacked. That costs one position
// copy per candidate, which is nothing at the scale of a single interactive
// game.
//
// =============================================================================

#include "gambit/movegen.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <optional>
#include <span>

namespace gambit {

namespace {

constexpr std::array<std::uint8_t, 2> PAWN_START_RANKS = {1, 6};

constexpr std::array<CastlingSide, 2> CASTLING_SIDES = {CastlingSide::King, CastlingSide::Queen};

// Adds a move to `to` unless it is blocked by a friendly piece. The enemy king
// is never a capture target.
void add_step(const Position& pos, Piece piece, Square from, Square to, MoveList& moves) {
  const auto occupant = pos.board.piece_at(to);

  if (occupant.has_value() && (colour(*occupant) == colour(piece) || is_king(*occupant))) {
    return;
  }

  moves.push_back(Move{
      .piece = piece,
      .from = from,
      .to = to,
      .captured_piece = occupant,
  });
}

// A pawn arriving on the back rank becomes one move per promotion choice.
void add_pawn_move(Piece piece, Square from, Square to, std::optional<Piece> captured,
                   MoveList& moves) {
  if (!to.is_back_rank()) {
    moves.push_back(Move{
        .piece = piece,
        .from = from,
        .to = to,
        .captured_piece = captured,
    });
    return;
  }

  for (const Piece promo : promotions_for(colour(piece))) {
    moves.push_back(Move{
        .piece = piece,
        .from = from,
        .to = to,
        .captured_piece = captured,
        .promotion_piece = promo,
    });
  }
}

void pawn_moves(const Position& pos, Piece piece, Square from, MoveList& moves) {
  const Colour mover = colour(piece);
  const int forward = pawn_direction(mover);

  if (const auto one_ahead = from.offset(0, forward);
      one_ahead.has_value() && !pos.board.has_piece_at(*one_ahead)) {
    add_pawn_move(piece, from, *one_ahead, std::nullopt, moves);

    if (from.rank() == PAWN_START_RANKS[colour_index(mover)]) {
      const auto two_ahead = one_ahead->offset(0, forward);
      if (two_ahead.has_value() && !pos.board.has_piece_at(*two_ahead)) {
        moves.push_back(Move{.piece = piece, .from = from, .to = *two_ahead});
      }
    }
  }

  for (const int side : {-1, 1}) {
    const auto target = from.offset(side, forward);
    if (!target.has_value()) {
      continue;
    }

    const auto occupant = pos.board.piece_at(*target);

    if (occupant.has_value()) {
      if (colour(*occupant) != mover && !is_king(*occupant)) {
        add_pawn_move(piece, from, *target, occupant, moves);
      }
      continue;
    }

    // En passant: the victim stands beside us, on the target's file.
    if (pos.en_passant_square == *target) {
      const auto victim_square = target->offset(0, -forward);
      if (victim_square.has_value() && pos.board.piece_at(*victim_square) == pawn(!mover)) {
        moves.push_back(Move{
            .piece = piece,
            .from = from,
            .to = *target,
            .captured_piece = pawn(!mover),
            .is_en_passant = true,
        });
      }
    }
  }
}

void step_moves(const Position& pos, Piece piece, Square from, std::span<const Offset> offsets,
                MoveList& moves) {
  for (const Offset offset : offsets) {
    if (const auto to = from.offset(offset.file, offset.rank)) {
      add_step(pos, piece, from, *to, moves);
    }
  }
}

void slider_moves(const Position& pos, Piece piece, Square from, MoveList& moves) {
  for (const Offset direction : slider_directions(kind(piece))) {
    auto current = from.offset(direction.file, direction.rank);

    while (current.has_value()) {
      add_step(pos, piece, from, *current, moves);

      if (pos.board.has_piece_at(*current)) {
        break;
      }

      current = current->offset(direction.file, direction.rank);
    }
  }
}

// =============================================================================
// CASTLING
// =============================================================================
// Castling has strict requirements:
//   1. The right is still held (king and that rook have not moved)
//   2. The king is not currently in check
//   3. The rook is still on its corner
//   4. Squares between king and rook are empty
//   5. The king does not pass through or land on an attacked square
//
// The rook may pass through an attacked square (b1/b8 on the queen side).
// =============================================================================

bool can_castle(const Position& pos, Colour colour, CastlingSide side) {
  if (!pos.castling_rights.has(castling_right(colour, side))) {
    return false;
  }

  const CastlingSquares squares = castling_squares(colour, side);

  if (pos.board.piece_at(squares.king_from) != king(colour) ||
      pos.board.piece_at(squares.rook_from) != rook(colour)) {
    return false;
  }

  if (pos.board.has_occupancy_at(squares.between)) {
    return false;
  }

  if (is_in_check(colour, pos.board)) {
    return false;
  }

  Bitboard path = squares.king_path;
  while (path != 0) {
    if (is_attacked(Square::pop_first_occupied(path), !colour, pos.board)) {
      return false;
    }
  }

  return true;
}

void king_moves(const Position& pos, Piece piece, Square from, MoveList& moves) {
  step_moves(pos, piece, from, KING_OFFSETS, moves);

  const Colour mover = colour(piece);
  for (const CastlingSide side : CASTLING_SIDES) {
    if (can_castle(pos, mover, side)) {
      moves.push_back(Move{
          .piece = piece,
          .from = from,
          .to = castling_squares(mover, side).king_to,
          .castling_side = side,
      });
    }
  }
}

void moves_for_piece(const Position& pos, Piece piece, Square from, MoveList& moves) {
  switch (kind(piece)) {
  case PieceKind::Pawn:
    pawn_moves(pos, piece, from, moves);
    break;
  case PieceKind::Knight:
    step_moves(pos, piece, from, KNIGHT_OFFSETS, moves);
    break;
  case PieceKind::Bishop:
  case PieceKind::Rook:
  case PieceKind::Queen:
    slider_moves(pos, piece, from, moves);
    break;
  case PieceKind::King:
    king_moves(pos, piece, from, moves);
    break;
  }
}

} // namespace

MoveList pseudo_legal_moves_from(const Position& pos, Square from) {
  MoveList moves;

  const auto piece = pos.board.piece_at(from);
  if (!piece.has_value() || colour(*piece) != pos.colour_to_move) {
    return moves;
  }

  moves_for_piece(pos, *piece, from, moves);
  return moves;
}

MoveList pseudo_legal_moves(const Position& pos) {
  MoveList moves;
  moves.reserve(MAX_LEGAL_MOVES);

  Bitboard own = pos.board.pieces_by_colour(pos.colour_to_move);
  while (own != 0) {
    const Square from = Square::pop_first_occupied(own);
    moves_for_piece(pos, *pos.board.piece_at(from), from, moves);
  }

  return moves;
}

bool leaves_king_in_check(const Position& pos, const Move& mv) {
  Position scratch = pos;
  scratch.make_move(mv);
  return is_in_check(pos.colour_to_move, scratch.board);
}

MoveList legal_moves_from(const Position& pos, Square from) {
  MoveList moves = pseudo_legal_moves_from(pos, from);
  std::erase_if(moves, [&pos](const Move& mv) { return leaves_king_in_check(pos, mv); });
  return moves;
}

MoveList legal_moves(const Position& pos) {
  MoveList moves = pseudo_legal_moves(pos);
  std::erase_if(moves, [&pos](const Move& mv) { return leaves_king_in_check(pos, mv); });
  return moves;
}

bool has_legal_move(const Position& pos) {
  Bitboard own = pos.board.pieces_by_colour(pos.colour_to_move);

  while (own != 0) {
    const auto moves = pseudo_legal_moves_from(pos, Square::pop_first_occupied(own));
    if (std::ranges::any_of(moves, [&pos](const Move& mv) {
          return !leaves_king_in_check(pos, mv);
        })) {
      return true;
    }
  }

  return false;
}

// =============================================================================
// PERFT: Move Generation Validation
// =============================================================================
// Perft counts the leaf nodes of the legal move tree to a fixed depth. Known
// counts for standard test positions pin down generation bugs exactly.
// =============================================================================

std::uint64_t perft(const Position& pos, std::uint8_t depth) {
  if (depth == 0) {
    return 1;
  }

  const MoveList moves = legal_moves(pos);
  if (depth == 1) {
    return moves.size();
  }

  std::uint64_t nodes = 0;

  for (const auto& mv : moves) {
    Position next = pos;
    next.make_move(mv);
    nodes += perft(next, static_cast<std::uint8_t>(depth - 1));
  }

  return nodes;
}

} // namespace gambit
