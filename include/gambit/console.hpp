#pragma once

#include <iosfwd>
#include <istream>
#include <optional>
#include <string>

#include "gambit/game.hpp"
#include "gambit/piece.hpp"
#include "gambit/position.hpp"
#include "gambit/square.hpp"

namespace gambit::console {

enum class CommandType {
  About,
  NewGame,
  Position,
  Moves,
  Move,
  Undo,
  Board,
  Fen,
  Status,
  History,
  Captured,
  SetOption,
  Quit
};

struct MoveCommand {
  Square from{};
  Square to{};
  std::optional<PieceKind> promotion{};

  friend constexpr bool operator==(const MoveCommand&, const MoveCommand&) = default;
};

struct SetOptionCommand {
  std::string name;
  std::optional<std::string> value;
};

struct Command {
  CommandType type{CommandType::About};
  std::optional<std::string> fen{};
  std::optional<Square> square{};
  std::optional<MoveCommand> move{};
  std::optional<SetOptionCommand> option{};
};

// "e2e4", "e7e8q". Returns nothing for anything else.
[[nodiscard]] std::optional<MoveCommand> parse_move(const std::string& str);

// Throws std::runtime_error describing the first problem found.
Command parse_command(const std::string& line);

struct Options {
  PieceKind promotion{PieceKind::Queen}; // used when a move names no promotion
  bool verbose{false};                   // write "info" lines on status changes
};

// One game driven by text commands. Every response goes to the stream given at
// construction.
class Session {
public:
  explicit Session(std::ostream& out, const Position& start = Position::startpos());

  // Runs one command. Returns false when the session should end.
  bool execute(const Command& cmd);

  const Game& game() const { return game_; }
  const Options& options() const { return options_; }

private:
  void write_line(const std::string& line);
  void report_status_change(GameStatus before);
  void set_option(const SetOptionCommand& option);

  std::ostream* out_;
  Game game_;
  Options options_{};
};

std::string render_board(const Board& board);
std::string describe_status(const Game& game);

void run_loop(std::istream& in, std::ostream& out, const Position& start = Position::startpos());

} // namespace gambit::console
