#include "gambit/board.hpp"

#include <array>

namespace gambit {

namespace {

constexpr std::array<PieceKind, 8> BACK_RANK_ORDER = {
    PieceKind::Rook,  PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
    PieceKind::King,  PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook,
};

} // namespace

Board Board::standard() noexcept {
  Board board = Board::empty();

  for (int file = 0; file < 8; ++file) {
    const PieceKind piece_kind = BACK_RANK_ORDER[static_cast<std::size_t>(file)];
    const Square white_home = *Square::A1.offset(file, 0);
    const Square black_home = *Square::A8.offset(file, 0);

    board.put_piece(make_piece(piece_kind, Colour::White), white_home);
    board.put_piece(Piece::WP, white_home.advance(Colour::White));
    board.put_piece(Piece::BP, black_home.advance(Colour::Black));
    board.put_piece(make_piece(piece_kind, Colour::Black), black_home);
  }

  return board;
}

} // namespace gambit
