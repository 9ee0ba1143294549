#include "gambit/console.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gambit/about.hpp"
#include "gambit/notation.hpp"

namespace gambit::console {

namespace {

std::string to_lower(std::string str) {
  std::ranges::transform(str, str.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return str;
}

std::vector<std::string> split_tokens(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> parts;
  std::string token;
  while (iss >> token) {
    parts.push_back(token);
  }
  return parts;
}

std::string join(const std::vector<std::string>& parts, std::size_t first) {
  std::string out;
  for (std::size_t i = first; i < parts.size(); ++i) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += parts[i];
  }
  return out;
}

std::string parse_position(const std::vector<std::string>& args) {
  if (args.empty()) {
    throw std::runtime_error("missing position");
  }

  if (args[0] == "startpos") {
    return std::string(Position::START_POS_FEN);
  }

  if (args[0] == "fen") {
    if (args.size() < 2) {
      throw std::runtime_error("missing FEN in position command");
    }
    return join(args, 1);
  }

  throw std::runtime_error("unknown position type '" + args[0] + "'");
}

SetOptionCommand parse_setoption(const std::vector<std::string>& args) {
  if (args.size() < 2 || args[0] != "name") {
    throw std::runtime_error("missing option name");
  }

  SetOptionCommand option{.name = to_lower(args[1]), .value = std::nullopt};

  if (args.size() >= 3) {
    if (args[2] != "value" || args.size() < 4) {
      throw std::runtime_error("missing value for '" + option.name + "' option");
    }
    option.value = join(args, 3);
  }

  return option;
}

std::string captured_letters(const std::vector<Piece>& pieces) {
  std::string out;
  for (const Piece piece : pieces) {
    out.push_back(' ');
    out.push_back(to_char(piece));
  }
  return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Command parsing
// ---------------------------------------------------------------------------

std::optional<MoveCommand> parse_move(const std::string& str) {
  if (str.size() != 4 && str.size() != 5) {
    return std::nullopt;
  }

  const auto from = Square::parse(std::string_view{str}.substr(0, 2));
  const auto to = Square::parse(std::string_view{str}.substr(2, 2));

  if (!from.has_value() || !to.has_value()) {
    return std::nullopt;
  }

  std::optional<PieceKind> promotion = std::nullopt;

  if (str.size() == 5) {
    promotion = kind_from_letter(str[4]);
    if (!promotion.has_value() || *promotion == PieceKind::Pawn ||
        *promotion == PieceKind::King) {
      return std::nullopt;
    }
  }

  return MoveCommand{
      .from = *from,
      .to = *to,
      .promotion = promotion,
  };
}

Command parse_command(const std::string& line) {
  const std::vector<std::string> parts = split_tokens(line);
  if (parts.empty()) {
    throw std::runtime_error("empty command");
  }

  const std::string& head = parts[0];
  const std::vector<std::string> args(parts.begin() + 1, parts.end());

  Command result{};

  if (head == "about") {
    result.type = CommandType::About;
  } else if (head == "newgame") {
    result.type = CommandType::NewGame;
  } else if (head == "position") {
    result.type = CommandType::Position;
    result.fen = parse_position(args);
  } else if (head == "moves") {
    if (args.empty()) {
      throw std::runtime_error("missing square");
    }
    result.type = CommandType::Moves;
    result.square = Square::parse(args[0]);
    if (!result.square.has_value()) {
      throw std::runtime_error("invalid square '" + args[0] + "'");
    }
  } else if (head == "move") {
    if (args.empty()) {
      throw std::runtime_error("missing move");
    }
    result.type = CommandType::Move;
    result.move = parse_move(args[0]);
    if (!result.move.has_value()) {
      throw std::runtime_error("invalid move '" + args[0] + "'");
    }
  } else if (head == "undo") {
    result.type = CommandType::Undo;
  } else if (head == "board") {
    result.type = CommandType::Board;
  } else if (head == "fen") {
    result.type = CommandType::Fen;
  } else if (head == "status") {
    result.type = CommandType::Status;
  } else if (head == "history") {
    result.type = CommandType::History;
  } else if (head == "captured") {
    result.type = CommandType::Captured;
  } else if (head == "setoption") {
    result.type = CommandType::SetOption;
    result.option = parse_setoption(args);
  } else if (head == "quit") {
    result.type = CommandType::Quit;
  } else {
    throw std::runtime_error("unknown command '" + head + "'");
  }

  return result;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string render_board(const Board& board) {
  std::string out;
  out.reserve(72);

  for (int rank = 7; rank >= 0; --rank) {
    for (int file = 0; file < 8; ++file) {
      const auto piece = board.piece_at(*Square::from_coords(file, rank));
      out.push_back(piece.has_value() ? to_char(*piece) : '.');
    }
    if (rank > 0) {
      out.push_back('\n');
    }
  }

  return out;
}

std::string describe_status(const Game& game) {
  std::string out(to_string(game.status()));

  if (const auto square = game.check_square()) {
    out += " " + square->to_string();
  } else if (const auto winner = game.winner()) {
    out += " ";
    out += to_string(*winner);
  }

  return out;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

Session::Session(std::ostream& out, const Position& start) : out_(&out), game_(start) {}

void Session::write_line(const std::string& line) {
  *out_ << line << '\n' << std::flush;
}

void Session::report_status_change(GameStatus before) {
  if (options_.verbose && game_.status() != before) {
    write_line("info status " + describe_status(game_));
  }
}

void Session::set_option(const SetOptionCommand& option) {
  if (!option.value.has_value()) {
    throw std::runtime_error("missing value for '" + option.name + "' option");
  }

  if (option.name == "promotion") {
    const std::string& value = *option.value;
    const auto promotion = value.size() == 1 ? kind_from_letter(value[0]) : std::nullopt;
    if (!promotion.has_value() || *promotion == PieceKind::Pawn ||
        *promotion == PieceKind::King) {
      throw std::runtime_error("invalid value for 'promotion' option");
    }
    options_.promotion = *promotion;
  } else if (option.name == "verbose") {
    const std::string value = to_lower(*option.value);
    if (value != "true" && value != "false") {
      throw std::runtime_error("invalid value for 'verbose' option");
    }
    options_.verbose = value == "true";
  } else {
    throw std::runtime_error("unknown option '" + option.name + "'");
  }
}

bool Session::execute(const Command& cmd) {
  const GameStatus before = game_.status();

  switch (cmd.type) {
  case CommandType::About:
    write_line(about_message());
    break;

  case CommandType::NewGame:
    game_.new_game();
    report_status_change(before);
    break;

  case CommandType::Position:
    if (!cmd.fen.has_value()) {
      throw std::runtime_error("missing position payload");
    }
    game_.set_position(Position::from_fen(*cmd.fen));
    report_status_change(before);
    break;

  case CommandType::Moves: {
    if (!cmd.square.has_value()) {
      throw std::runtime_error("missing square");
    }
    std::string line;
    for (const auto& mv : game_.valid_moves(*cmd.square)) {
      if (!line.empty()) {
        line.push_back(' ');
      }
      line += to_notation(mv);
    }
    write_line(line);
    break;
  }

  case CommandType::Move: {
    if (!cmd.move.has_value()) {
      throw std::runtime_error("missing move");
    }
    const auto promotion = cmd.move->promotion.value_or(options_.promotion);
    const auto outcome = game_.attempt_move(cmd.move->from, cmd.move->to, promotion);
    if (!outcome.accepted()) {
      write_line("rejected " + std::string(to_string(*outcome.rejection)));
      break;
    }
    write_line("ok " + game_.history().back().notation + " " +
               std::string(to_string(outcome.status)));
    report_status_change(before);
    break;
  }

  case CommandType::Undo: {
    const auto outcome = game_.undo();
    if (!outcome.accepted()) {
      write_line("rejected " + std::string(to_string(*outcome.rejection)));
      break;
    }
    write_line("undone " + to_notation(*outcome.move) + " " +
               std::string(to_string(outcome.status)));
    report_status_change(before);
    break;
  }

  case CommandType::Board:
    write_line(render_board(game_.board()));
    break;

  case CommandType::Fen:
    write_line(game_.position().to_fen());
    break;

  case CommandType::Status:
    write_line(describe_status(game_));
    break;

  case CommandType::History: {
    const auto& history = game_.history();
    const Position& start = game_.start_position();
    std::size_t number = start.full_move_counter;
    std::size_t i = 0;

    // A game set up with black to move opens with "N... <move>".
    if (start.colour_to_move == Colour::Black && !history.empty()) {
      write_line(std::to_string(number) + "... " + history[0].notation);
      ++number;
      i = 1;
    }

    for (; i < history.size(); i += 2, ++number) {
      std::string line = std::to_string(number) + ". " + history[i].notation;
      if (i + 1 < history.size()) {
        line += " " + history[i + 1].notation;
      }
      write_line(line);
    }
    break;
  }

  case CommandType::Captured:
    write_line("white:" + captured_letters(game_.captured(Colour::White)));
    write_line("black:" + captured_letters(game_.captured(Colour::Black)));
    break;

  case CommandType::SetOption:
    if (!cmd.option.has_value()) {
      throw std::runtime_error("missing option payload");
    }
    set_option(*cmd.option);
    break;

  case CommandType::Quit:
    return false;
  }

  return true;
}

void run_loop(std::istream& in, std::ostream& out, const Position& start) {
  Session session(out, start);
  std::string line;

  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    try {
      if (!session.execute(parse_command(line))) {
        return;
      }
    } catch (const std::exception& ex) {
      out << "error: " << ex.what() << '\n' << std::flush;
    }
  }
}

} // namespace gambit::console
