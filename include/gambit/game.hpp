#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gambit/move.hpp"
#include "gambit/position.hpp"
#include "gambit/status.hpp"

namespace gambit {

enum class Rejection : std::uint8_t {
  IllegalMove,   // no legal move joins the two squares
  NothingToUndo, // history is empty
  GameOver,      // the game has ended; moves and undo are blocked
};

std::string_view to_string(Rejection rejection);

/// One executed move and what is needed to take it back.
struct HistoryEntry {
  Move move;
  std::string notation;
  std::optional<Piece> captured;
  IrreversibleState previous;
};

/// Result of attempt_move or undo. On success `move` is the move applied or
/// reverted; on rejection nothing changed and `rejection` says why.
struct MoveOutcome {
  std::optional<Move> move{};
  GameStatus status{GameStatus::Active};
  std::optional<Rejection> rejection{};

  [[nodiscard]] bool accepted() const noexcept { return !rejection.has_value(); }
};

// Game façade that owns one position, its move history and the captured
// pieces. Front ends talk to this; every call runs to completion and mutates
// nothing but this object. Independent games need independent Game objects.
class Game {
public:
  Game();
  explicit Game(const Position& start);

  void new_game();

  // Start over from an arbitrary position. History and captures are cleared.
  void set_position(const Position& pos);

  const Position& position() const { return pos_; }

  // The position the game was started or last set from; history begins here.
  const Position& start_position() const { return start_; }
  const Board& board() const { return pos_.board; }
  Colour colour_to_move() const { return pos_.colour_to_move; }
  GameStatus status() const { return status_; }
  bool is_over() const { return is_terminal(status_); }

  // The side that delivered mate, while the status is Checkmate.
  std::optional<Colour> winner() const;

  // Pieces of `colour` taken so far, in capture order.
  const std::vector<Piece>& captured(Colour colour) const {
    return captured_[colour_index(colour)];
  }

  const std::vector<HistoryEntry>& history() const { return history_; }
  std::optional<Move> last_move() const;

  // The side to move's king square, only while that king is in check.
  std::optional<Square> check_square() const;

  // Legal moves from `square`, in generation order. Empty for an empty or
  // opponent-owned square, and once the game is over.
  MoveList valid_moves(Square square) const;

  // Plays the legal move joining `from` and `to`. When several promotion moves
  // share both squares, `promotion` picks one; without it the first generated
  // (the queen) is played.
  MoveOutcome attempt_move(Square from, Square to,
                           std::optional<PieceKind> promotion = std::nullopt);

  MoveOutcome undo();

private:
  void apply(const Move& mv);
  MoveOutcome rejected(Rejection rejection) const;

  Position start_;
  Position pos_;
  std::vector<HistoryEntry> history_{};
  std::array<std::vector<Piece>, 2> captured_{};
  GameStatus status_{GameStatus::Active};
};

} // namespace gambit
