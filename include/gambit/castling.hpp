#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>

#include "gambit/colour.hpp"
#include "gambit/square.hpp"

namespace gambit {

enum class CastlingSide : std::uint8_t { King, Queen };

enum class CastlingRight : std::uint8_t {
  WhiteKing = 1,
  WhiteQueen = 2,
  BlackKing = 4,
  BlackQueen = 8,
};

constexpr CastlingRight castling_right(Colour colour, CastlingSide side) {
  if (colour == Colour::White) {
    return side == CastlingSide::King ? CastlingRight::WhiteKing : CastlingRight::WhiteQueen;
  }
  return side == CastlingSide::King ? CastlingRight::BlackKing : CastlingRight::BlackQueen;
}

/// Fixed squares involved in one castling move.
struct CastlingSquares {
  Square king_from;
  Square king_to;
  Square rook_from;
  Square rook_to;
  Bitboard between; // must be empty: every square strictly between king and rook
  Bitboard king_path; // must not be attacked: king's origin, crossing and landing squares
};

constexpr CastlingSquares castling_squares(Colour colour, CastlingSide side) {
  const Square home_corner = colour == Colour::White ? Square::A1 : Square::A8;
  const auto at = [home_corner](int file) { return *home_corner.offset(file, 0); };

  if (side == CastlingSide::King) {
    return CastlingSquares{
        .king_from = at(4),
        .king_to = at(6),
        .rook_from = at(7),
        .rook_to = at(5),
        .between = at(5) | at(6),
        .king_path = at(4) | at(5) | at(6),
    };
  }

  return CastlingSquares{
      .king_from = at(4),
      .king_to = at(2),
      .rook_from = at(0),
      .rook_to = at(3),
      .between = at(1) | at(2) | at(3),
      .king_path = at(4) | at(3) | at(2),
  };
}

class CastlingRights {
public:
  constexpr CastlingRights() = default;

  static constexpr CastlingRights none() { return CastlingRights(0); }
  static constexpr CastlingRights all() { return CastlingRights(0b1111); }

  static constexpr CastlingRights from(std::initializer_list<CastlingRight> rights) {
    auto result = CastlingRights::none();
    for (auto right : rights) {
      result.add(right);
    }
    return result;
  }

  constexpr bool has(CastlingRight right) const {
    return (mask_ & static_cast<std::uint8_t>(right)) != 0;
  }

  constexpr void add(CastlingRight right) { mask_ |= static_cast<std::uint8_t>(right); }

  constexpr void remove(CastlingRight right) {
    mask_ &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(right));
  }

  constexpr void remove_for_colour(Colour colour) {
    remove(castling_right(colour, CastlingSide::King));
    remove(castling_right(colour, CastlingSide::Queen));
  }

  // Any move from or onto a rook's home corner: the rook has moved or been taken.
  constexpr void remove_for_square(Square square) {
    if (square == Square::A1) {
      remove(CastlingRight::WhiteQueen);
    } else if (square == Square::H1) {
      remove(CastlingRight::WhiteKing);
    } else if (square == Square::A8) {
      remove(CastlingRight::BlackQueen);
    } else if (square == Square::H8) {
      remove(CastlingRight::BlackKing);
    }
  }

  constexpr std::uint8_t value() const { return mask_; }

  friend constexpr bool operator==(CastlingRights lhs, CastlingRights rhs) = default;

  friend constexpr bool operator&(CastlingRights lhs, CastlingRight rhs) { return lhs.has(rhs); }

private:
  explicit constexpr CastlingRights(std::uint8_t mask) : mask_{mask} {}

  std::uint8_t mask_{0};
};

} // namespace gambit
