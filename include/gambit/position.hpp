#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "gambit/board.hpp"
#include "gambit/castling.hpp"
#include "gambit/colour.hpp"
#include "gambit/move.hpp"
#include "gambit/square.hpp"

namespace gambit {

/// The part of a position a move cannot be reversed from: saved before each
/// move and handed back to unmake_move. The counters are included because they
/// stop at their maximum instead of wrapping.
struct IrreversibleState {
  CastlingRights castling_rights;
  std::optional<Square> en_passant_square;
  std::uint16_t half_move_clock;
  std::uint16_t full_move_counter;

  friend bool operator==(const IrreversibleState&, const IrreversibleState&) = default;
};

// FEN-aware position container.
class Position {
public:
  Board board{};
  Colour colour_to_move{Colour::White};
  CastlingRights castling_rights{CastlingRights::none()};
  std::optional<Square> en_passant_square{};
  std::uint16_t half_move_clock{0};
  std::uint16_t full_move_counter{1};

  Position() = default;

  Position(Board board, Colour colour_to_move, CastlingRights castling_rights,
           std::optional<Square> en_passant_square, std::uint16_t half_move_clock,
           std::uint16_t full_move_counter);

  // Parse a FEN string into a Position, throwing std::runtime_error on error.
  static Position from_fen(std::string_view fen);

  // Standard starting arrangement, white to move, all rights.
  static Position startpos();

  // Serialise position back to FEN.
  std::string to_fen() const;

  [[nodiscard]] IrreversibleState irreversible_state() const {
    return IrreversibleState{
        .castling_rights = castling_rights,
        .en_passant_square = en_passant_square,
        .half_move_clock = half_move_clock,
        .full_move_counter = full_move_counter,
    };
  }

  // Apply a move already known to be pseudo-legal. Does not validate.
  void make_move(const Move& mv);

  // Reverse `mv`, which must be the last move made, restoring `previous`.
  void unmake_move(const Move& mv, const IrreversibleState& previous);

  bool is_fifty_move_draw() const { return half_move_clock >= 100; }

  // Both counters saturate here.
  inline static constexpr std::uint16_t MAX_COUNTER = std::numeric_limits<std::uint16_t>::max();

  Colour opponent_colour() const { return !colour_to_move; }

  friend bool operator==(const Position&, const Position&) = default;

  // Standard starting position FEN.
  inline static constexpr std::string_view START_POS_FEN =
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
};

std::string castling_rights_to_fen(CastlingRights rights);

} // namespace gambit
