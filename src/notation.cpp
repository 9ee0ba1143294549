#include "gambit/notation.hpp"

namespace gambit {

std::string to_notation(const Move& mv) {
  if (mv.is_castling()) {
    return *mv.castling_side == CastlingSide::King ? "O-O" : "O-O-O";
  }

  std::string out;

  if (!is_pawn(mv.piece)) {
    out.push_back(kind_letter(kind(mv.piece)));
  }

  if (mv.is_capture()) {
    if (is_pawn(mv.piece)) {
      out.push_back(static_cast<char>('a' + mv.from.file()));
    }
    out.push_back('x');
  }

  out += mv.to.to_string();

  if (mv.is_promotion()) {
    out.push_back('=');
    out.push_back(kind_letter(kind(*mv.promotion_piece)));
  }

  if (mv.is_en_passant) {
    out += " e.p.";
  }

  return out;
}

} // namespace gambit
