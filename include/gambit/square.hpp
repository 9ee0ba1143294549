#pragma once

// =============================================================================
// SQUARES
// =============================================================================
//
// Files a..h map to 0..7 and ranks 1..8 map to 0..7. A square's index is
// rank * 8 + file, so a1 is 0, h1 is 7 and h8 is 63, and the index doubles as
// the bit position of the square in a Bitboard.
//
// Moving across the board is done with offset(), which refuses to wrap from
// the h-file to the a-file or to run off either end.
//
// =============================================================================

#include <bit>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "gambit/bitboard.hpp"
#include "gambit/colour.hpp"

namespace gambit {

class Square {
public:
  static const Square A1, B1, C1, D1, E1, F1, G1, H1;
  static const Square A2, B2, C2, D2, E2, F2, G2, H2;
  static const Square A3, B3, C3, D3, E3, F3, G3, H3;
  static const Square A4, B4, C4, D4, E4, F4, G4, H4;
  static const Square A5, B5, C5, D5, E5, F5, G5, H5;
  static const Square A6, B6, C6, D6, E6, F6, G6, H6;
  static const Square A7, B7, C7, D7, E7, F7, G7, H7;
  static const Square A8, B8, C8, D8, E8, F8, G8, H8;

  constexpr Square() noexcept = default;

  /// The square at `file` and `rank`, or nothing when either is outside 0..7.
  [[nodiscard]] static constexpr std::optional<Square> from_coords(int file, int rank) noexcept {
    if (file < 0 || file > 7 || rank < 0 || rank > 7) {
      return std::nullopt;
    }
    return from_file_and_rank(static_cast<std::uint8_t>(file), static_cast<std::uint8_t>(rank));
  }

  /// Clears the lowest set bit of `bitboard` and returns its square.
  /// Precondition: bitboard != 0.
  [[nodiscard]] static Square pop_first_occupied(Bitboard& bitboard) {
    const auto index = static_cast<std::uint8_t>(std::countr_zero(bitboard));
    bitboard &= bitboard - 1;
    return Square(index);
  }

  /// Parses "a1".."h8". Anything else, including upper-case files, is rejected.
  [[nodiscard]] static std::optional<Square> parse(std::string_view text) noexcept {
    if (text.size() != 2 || text[0] < 'a' || text[0] > 'h' || text[1] < '1' || text[1] > '8') {
      return std::nullopt;
    }
    return from_file_and_rank(static_cast<std::uint8_t>(text[0] - 'a'),
                              static_cast<std::uint8_t>(text[1] - '1'));
  }

  [[nodiscard]] constexpr std::uint8_t index() const noexcept { return index_; }
  [[nodiscard]] constexpr std::uint8_t file() const noexcept {
    return static_cast<std::uint8_t>(index_ % 8);
  }
  [[nodiscard]] constexpr std::uint8_t rank() const noexcept {
    return static_cast<std::uint8_t>(index_ / 8);
  }

  constexpr operator Bitboard() const noexcept { return Bitboard{1} << index_; }

  /// Number of ranks between this square and `other`, ignoring direction.
  [[nodiscard]] constexpr std::uint8_t rank_diff(Square other) const noexcept {
    const int diff = rank() - other.rank();
    return static_cast<std::uint8_t>(diff < 0 ? -diff : diff);
  }

  /// The square `file_delta` files and `rank_delta` ranks away, or nothing when
  /// that falls off the board.
  [[nodiscard]] constexpr std::optional<Square> offset(int file_delta,
                                                       int rank_delta) const noexcept {
    return from_coords(file() + file_delta, rank() + rank_delta);
  }

  // One rank towards `colour`'s opponent. Precondition: not on that far rank.
  [[nodiscard]] constexpr Square advance(Colour colour) const noexcept {
    return Square(static_cast<std::uint8_t>(colour == Colour::White ? index_ + 8 : index_ - 8));
  }

  // Rank 1 or 8: where pawns promote.
  [[nodiscard]] constexpr bool is_back_rank() const noexcept {
    return (BACK_RANKS & *this) != 0;
  }

  // a1, h1, a8, h8: where the castling rooks start.
  [[nodiscard]] constexpr bool is_corner() const noexcept { return (CORNERS & *this) != 0; }

  [[nodiscard]] std::string to_string() const {
    return {static_cast<char>('a' + file()), static_cast<char>('1' + rank())};
  }

  friend constexpr bool operator==(Square, Square) noexcept = default;

private:
  explicit constexpr Square(std::uint8_t index) noexcept : index_(index) {}

  // Unchecked: both arguments must already be in 0..7.
  static constexpr Square from_file_and_rank(std::uint8_t file, std::uint8_t rank) noexcept {
    return Square(static_cast<std::uint8_t>(rank * 8 + file));
  }

  std::uint8_t index_{0};
};

inline std::ostream& operator<<(std::ostream& os, Square square) {
  return os << square.to_string();
}

} // namespace gambit

inline constexpr gambit::Square gambit::Square::A1 = from_file_and_rank(0, 0);
inline constexpr gambit::Square gambit::Square::B1 = from_file_and_rank(1, 0);
inline constexpr gambit::Square gambit::Square::C1 = from_file_and_rank(2, 0);
inline constexpr gambit::Square gambit::Square::D1 = from_file_and_rank(3, 0);
inline constexpr gambit::Square gambit::Square::E1 = from_file_and_rank(4, 0);
inline constexpr gambit::Square gambit::Square::F1 = from_file_and_rank(5, 0);
inline constexpr gambit::Square gambit::Square::G1 = from_file_and_rank(6, 0);
inline constexpr gambit::Square gambit::Square::H1 = from_file_and_rank(7, 0);

inline constexpr gambit::Square gambit::Square::A2 = from_file_and_rank(0, 1);
inline constexpr gambit::Square gambit::Square::B2 = from_file_and_rank(1, 1);
inline constexpr gambit::Square gambit::Square::C2 = from_file_and_rank(2, 1);
inline constexpr gambit::Square gambit::Square::D2 = from_file_and_rank(3, 1);
inline constexpr gambit::Square gambit::Square::E2 = from_file_and_rank(4, 1);
inline constexpr gambit::Square gambit::Square::F2 = from_file_and_rank(5, 1);
inline constexpr gambit::Square gambit::Square::G2 = from_file_and_rank(6, 1);
inline constexpr gambit::Square gambit::Square::H2 = from_file_and_rank(7, 1);

inline constexpr gambit::Square gambit::Square::A3 = from_file_and_rank(0, 2);
inline constexpr gambit::Square gambit::Square::B3 = from_file_and_rank(1, 2);
inline constexpr gambit::Square gambit::Square::C3 = from_file_and_rank(2, 2);
inline constexpr gambit::Square gambit::Square::D3 = from_file_and_rank(3, 2);
inline constexpr gambit::Square gambit::Square::E3 = from_file_and_rank(4, 2);
inline constexpr gambit::Square gambit::Square::F3 = from_file_and_rank(5, 2);
inline constexpr gambit::Square gambit::Square::G3 = from_file_and_rank(6, 2);
inline constexpr gambit::Square gambit::Square::H3 = from_file_and_rank(7, 2);

inline constexpr gambit::Square gambit::Square::A4 = from_file_and_rank(0, 3);
inline constexpr gambit::Square gambit::Square::B4 = from_file_and_rank(1, 3);
inline constexpr gambit::Square gambit::Square::C4 = from_file_and_rank(2, 3);
inline constexpr gambit::Square gambit::Square::D4 = from_file_and_rank(3, 3);
inline constexpr gambit::Square gambit::Square::E4 = from_file_and_rank(4, 3);
inline constexpr gambit::Square gambit::Square::F4 = from_file_and_rank(5, 3);
inline constexpr gambit::Square gambit::Square::G4 = from_file_and_rank(6, 3);
inline constexpr gambit::Square gambit::Square::H4 = from_file_and_rank(7, 3);

inline constexpr gambit::Square gambit::Square::A5 = from_file_and_rank(0, 4);
inline constexpr gambit::Square gambit::Square::B5 = from_file_and_rank(1, 4);
inline constexpr gambit::Square gambit::Square::C5 = from_file_and_rank(2, 4);
inline constexpr gambit::Square gambit::Square::D5 = from_file_and_rank(3, 4);
inline constexpr gambit::Square gambit::Square::E5 = from_file_and_rank(4, 4);
inline constexpr gambit::Square gambit::Square::F5 = from_file_and_rank(5, 4);
inline constexpr gambit::Square gambit::Square::G5 = from_file_and_rank(6, 4);
inline constexpr gambit::Square gambit::Square::H5 = from_file_and_rank(7, 4);

inline constexpr gambit::Square gambit::Square::A6 = from_file_and_rank(0, 5);
inline constexpr gambit::Square gambit::Square::B6 = from_file_and_rank(1, 5);
inline constexpr gambit::Square gambit::Square::C6 = from_file_and_rank(2, 5);
inline constexpr gambit::Square gambit::Square::D6 = from_file_and_rank(3, 5);
inline constexpr gambit::Square gambit::Square::E6 = from_file_and_rank(4, 5);
inline constexpr gambit::Square gambit::Square::F6 = from_file_and_rank(5, 5);
inline constexpr gambit::Square gambit::Square::G6 = from_file_and_rank(6, 5);
inline constexpr gambit::Square gambit::Square::H6 = from_file_and_rank(7, 5);

inline constexpr gambit::Square gambit::Square::A7 = from_file_and_rank(0, 6);
inline constexpr gambit::Square gambit::Square::B7 = from_file_and_rank(1, 6);
inline constexpr gambit::Square gambit::Square::C7 = from_file_and_rank(2, 6);
inline constexpr gambit::Square gambit::Square::D7 = from_file_and_rank(3, 6);
inline constexpr gambit::Square gambit::Square::E7 = from_file_and_rank(4, 6);
inline constexpr gambit::Square gambit::Square::F7 = from_file_and_rank(5, 6);
inline constexpr gambit::Square gambit::Square::G7 = from_file_and_rank(6, 6);
inline constexpr gambit::Square gambit::Square::H7 = from_file_and_rank(7, 6);

inline constexpr gambit::Square gambit::Square::A8 = from_file_and_rank(0, 7);
inline constexpr gambit::Square gambit::Square::B8 = from_file_and_rank(1, 7);
inline constexpr gambit::Square gambit::Square::C8 = from_file_and_rank(2, 7);
inline constexpr gambit::Square gambit::Square::D8 = from_file_and_rank(3, 7);
inline constexpr gambit::Square gambit::Square::E8 = from_file_and_rank(4, 7);
inline constexpr gambit::Square gambit::Square::F8 = from_file_and_rank(5, 7);
inline constexpr gambit::Square gambit::Square::G8 = from_file_and_rank(6, 7);
inline constexpr gambit::Square gambit::Square::H8 = from_file_and_rank(7, 7);
