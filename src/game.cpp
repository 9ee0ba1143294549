#include "gambit/game.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "gambit/attacks.hpp"
#include "gambit/movegen.hpp"
#include "gambit/notation.hpp"

namespace gambit {

namespace {

bool matches_promotion(const Move& mv, std::optional<PieceKind> promotion) {
  if (!mv.is_promotion() || !promotion.has_value()) {
    return true;
  }
  return kind(*mv.promotion_piece) == *promotion;
}

} // namespace

std::string_view to_string(Rejection rejection) {
  switch (rejection) {
  case Rejection::IllegalMove:
    return "illegal-move";
  case Rejection::NothingToUndo:
    return "nothing-to-undo";
  case Rejection::GameOver:
    return "game-over";
  }
  return "unknown";
}

Game::Game() : Game(Position::startpos()) {}

Game::Game(const Position& start) {
  set_position(start);
}

void Game::new_game() {
  set_position(Position::startpos());
}

void Game::set_position(const Position& pos) {
  start_ = pos;
  pos_ = pos;
  history_.clear();
  for (auto& pieces : captured_) {
    pieces.clear();
  }
  status_ = evaluate_status(pos_);
}

std::optional<Colour> Game::winner() const {
  if (status_ != GameStatus::Checkmate) {
    return std::nullopt;
  }
  return pos_.opponent_colour();
}

std::optional<Move> Game::last_move() const {
  if (history_.empty()) {
    return std::nullopt;
  }
  return history_.back().move;
}

std::optional<Square> Game::check_square() const {
  if (status_ != GameStatus::Check) {
    return std::nullopt;
  }
  return pos_.board.king_square(pos_.colour_to_move);
}

MoveList Game::valid_moves(Square square) const {
  if (is_over()) {
    return {};
  }
  return legal_moves_from(pos_, square);
}

MoveOutcome Game::attempt_move(Square from, Square to, std::optional<PieceKind> promotion) {
  if (is_over()) {
    return rejected(Rejection::GameOver);
  }

  const MoveList moves = legal_moves_from(pos_, from);
  const auto match = std::ranges::find_if(moves, [&](const Move& mv) {
    return mv.to == to && matches_promotion(mv, promotion);
  });

  if (match == moves.end()) {
    return rejected(Rejection::IllegalMove);
  }

  apply(*match);
  return MoveOutcome{.move = *match, .status = status_};
}

void Game::apply(const Move& mv) {
  HistoryEntry entry{
      .move = mv,
      .notation = to_notation(mv),
      .captured = mv.captured_piece,
      .previous = pos_.irreversible_state(),
  };

  pos_.make_move(mv);

  if (mv.captured_piece.has_value()) {
    captured_[colour_index(colour(*mv.captured_piece))].push_back(*mv.captured_piece);
  }

  history_.push_back(std::move(entry));
  status_ = evaluate_status(pos_);
}

MoveOutcome Game::undo() {
  if (history_.empty()) {
    return rejected(Rejection::NothingToUndo);
  }

  if (is_over()) {
    return rejected(Rejection::GameOver);
  }

  const HistoryEntry entry = std::move(history_.back());
  history_.pop_back();

  pos_.unmake_move(entry.move, entry.previous);

  if (entry.captured.has_value()) {
    auto& pieces = captured_[colour_index(colour(*entry.captured))];
    const auto last = std::ranges::find(pieces.rbegin(), pieces.rend(), *entry.captured);
    if (last != pieces.rend()) {
      pieces.erase(std::next(last).base());
    }
  }

  status_ = evaluate_status(pos_);
  return MoveOutcome{.move = entry.move, .status = status_};
}

MoveOutcome Game::rejected(Rejection rejection) const {
  return MoveOutcome{.status = status_, .rejection = rejection};
}

} // namespace gambit
