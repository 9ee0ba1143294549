#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "gambit/castling.hpp"
#include "gambit/piece.hpp"
#include "gambit/square.hpp"

namespace gambit {

struct Move {
  Piece piece{};
  Square from{};
  Square to{};
  std::optional<Piece> captured_piece{};
  std::optional<Piece> promotion_piece{};
  bool is_en_passant{false};
  std::optional<CastlingSide> castling_side{};

  [[nodiscard]] bool is_capture() const noexcept { return captured_piece.has_value(); }
  [[nodiscard]] bool is_castling() const noexcept { return castling_side.has_value(); }
  [[nodiscard]] bool is_promotion() const noexcept { return promotion_piece.has_value(); }

  /// Where the captured piece stood. Differs from `to` only for en passant, where
  /// the victim sits beside the capturing pawn's origin, on the destination file.
  [[nodiscard]] std::optional<Square> capture_square() const noexcept {
    if (!captured_piece.has_value()) {
      return std::nullopt;
    }

    if (is_en_passant) {
      return to.offset(0, from.rank() - to.rank());
    }

    return to;
  }

  [[nodiscard]] std::uint8_t rank_diff() const noexcept { return from.rank_diff(to); }

  friend constexpr bool operator==(const Move& lhs, const Move& rhs) noexcept {
    return lhs.piece == rhs.piece && lhs.from == rhs.from && lhs.to == rhs.to &&
           lhs.captured_piece == rhs.captured_piece &&
           lhs.promotion_piece == rhs.promotion_piece && lhs.is_en_passant == rhs.is_en_passant &&
           lhs.castling_side == rhs.castling_side;
  }

  friend constexpr bool operator!=(const Move& lhs, const Move& rhs) noexcept {
    return !(lhs == rhs);
  }
};

using MoveList = std::vector<Move>;

} // namespace gambit
