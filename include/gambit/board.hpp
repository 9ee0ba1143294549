#pragma once

// =============================================================================
// BOARD REPRESENTATION: Mailbox + Bitboards + King Cache
// =============================================================================
//
// squares_[64] answers "what is on e4?" in O(1). pieces_[12] and colours_[2]
// answer "which squares hold white pieces?" and "how many black bishops are
// left?" without a scan. king_squares_[2] remembers where each king stands so
// check detection never has to search for it.
//
// All four are kept in sync by put_piece/remove_piece. A board copy is a plain
// value copy, which is what the legality filter relies on.
//
// =============================================================================

#include <array>
#include <bit>
#include <cstdint>
#include <optional>

#include "gambit/bitboard.hpp"
#include "gambit/colour.hpp"
#include "gambit/piece.hpp"
#include "gambit/square.hpp"

namespace gambit {

class Board {
public:
  [[nodiscard]] static constexpr Board empty() noexcept { return Board{}; }

  /// The standard initial arrangement.
  [[nodiscard]] static Board standard() noexcept;

  [[nodiscard]] Bitboard pieces(Piece piece) const noexcept { return pieces_[piece_index(piece)]; }
  [[nodiscard]] Bitboard pieces_by_colour(Colour colour) const noexcept {
    return colours_[colour_index(colour)];
  }

  [[nodiscard]] std::uint32_t count_pieces(Piece piece) const noexcept {
    return static_cast<std::uint32_t>(std::popcount(pieces(piece)));
  }

  [[nodiscard]] std::uint32_t count_pieces_by_colour(Colour colour) const noexcept {
    return static_cast<std::uint32_t>(std::popcount(pieces_by_colour(colour)));
  }

  /// Places `piece` on an empty square. Placing a king moves that side's king cache.
  void put_piece(Piece piece, Square square) noexcept {
    squares_[square.index()] = piece;
    pieces_[piece_index(piece)] |= square;
    colours_[colour_index(colour(piece))] |= square;

    if (is_king(piece)) {
      king_squares_[colour_index(colour(piece))] = square;
    }
  }

  [[nodiscard]] std::optional<Piece> piece_at(Square square) const noexcept {
    return squares_[square.index()];
  }
  [[nodiscard]] bool has_piece_at(Square square) const noexcept {
    return piece_at(square).has_value();
  }

  void remove_piece(Square square) noexcept {
    const auto maybe_piece = piece_at(square);
    if (!maybe_piece.has_value()) {
      return;
    }

    squares_[square.index()] = std::nullopt;
    pieces_[piece_index(*maybe_piece)] &= ~Bitboard(square);
    colours_[colour_index(colour(*maybe_piece))] &= ~Bitboard(square);
  }

  /// Lifts whatever stands on `from` and drops it on `to`, which must be empty.
  void move_piece(Square from, Square to) noexcept {
    if (const auto piece = piece_at(from)) {
      remove_piece(from);
      put_piece(*piece, to);
    }
  }

  /// Cached location of `colour`'s king. Meaningful once a king has been placed.
  [[nodiscard]] Square king_square(Colour colour) const noexcept {
    return king_squares_[colour_index(colour)];
  }

  [[nodiscard]] Bitboard occupancy() const noexcept { return colours_[0] | colours_[1]; }
  [[nodiscard]] bool has_occupancy_at(Bitboard squares) const noexcept {
    return (occupancy() & squares) != 0;
  }

  friend bool operator==(const Board& lhs, const Board& rhs) = default;

private:
  static constexpr std::size_t piece_index(Piece piece) noexcept {
    return static_cast<std::size_t>(piece);
  }

  std::array<std::optional<Piece>, 64> squares_{}; // Mailbox: square → piece
  std::array<Bitboard, 12> pieces_{};              // Bitboard per piece type
  std::array<Bitboard, 2> colours_{};              // Bitboard per colour
  std::array<Square, 2> king_squares_{};           // King location per colour
};

} // namespace gambit
