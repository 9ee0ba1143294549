// =============================================================================
// FEN: Forsyth-Edwards Notation
// =============================================================================
//
// Six whitespace-separated fields:
//   1. placement, rank 8 first, '/' between ranks, digits for empty runs
//   2. side to move ("w" or "b")
//   3. castling rights ("KQkq" subset, or "-")
//   4. en passant target square, or "-"
//   5. half-move clock
//   6. full-move number (starts at 1)
//
// Parsing throws std::runtime_error naming the first field found at fault.
//
// =============================================================================

#include "gambit/position.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "gambit/piece.hpp"

namespace gambit {
namespace {

constexpr std::size_t FEN_FIELDS = 6;

constexpr std::array<CastlingSide, 2> FEN_CASTLING_ORDER = {CastlingSide::King,
                                                            CastlingSide::Queen};

[[noreturn]] void fail(const std::string& msg) {
  throw std::runtime_error(msg);
}

std::vector<std::string_view> split_fields(std::string_view fen) {
  std::vector<std::string_view> fields;
  fields.reserve(FEN_FIELDS);

  std::size_t pos = 0;
  while (pos <= fen.size()) {
    const auto next = fen.find(' ', pos);
    const auto end = next == std::string_view::npos ? fen.size() : next;
    fields.push_back(fen.substr(pos, end - pos));
    if (next == std::string_view::npos) {
      break;
    }
    pos = next + 1;
  }

  return fields;
}

// One rank of the placement field, written onto `board` at `rank`.
void parse_rank(std::string_view row, int rank, Board& board) {
  int file = 0;

  for (const char c : row) {
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      file += c - '0';
      if (file > 8) {
        fail("board must contain 64 squares");
      }
      continue;
    }

    const auto piece = piece_from_char(c);
    if (!piece.has_value()) {
      fail(std::string("invalid piece '") + c + "'");
    }
    const auto square = Square::from_coords(file, rank);
    if (!square.has_value()) {
      fail("board must contain 64 squares");
    }

    board.put_piece(*piece, *square);
    ++file;
  }

  if (file != 8) {
    fail("board must contain 64 squares");
  }
}

Board parse_placement(std::string_view placement) {
  std::vector<std::string_view> rows;
  std::size_t start = 0;
  for (;;) {
    const auto slash = placement.find('/', start);
    rows.push_back(placement.substr(start, slash == std::string_view::npos ? placement.size() - start
                                                                           : slash - start));
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }

  if (rows.size() != 8) {
    std::ostringstream oss;
    oss << "board must contain 8 rows, got " << rows.size();
    fail(oss.str());
  }

  Board board = Board::empty();
  for (std::size_t i = 0; i < rows.size(); ++i) {
    parse_rank(rows[i], 7 - static_cast<int>(i), board);
  }

  for (const Colour colour : ALL_COLOURS) {
    if (board.count_pieces(king(colour)) != 1) {
      fail("board must contain exactly one king per side");
    }
  }

  return board;
}

Colour parse_side_to_move(std::string_view field) {
  if (field == "w") {
    return Colour::White;
  }
  if (field == "b") {
    return Colour::Black;
  }
  fail("invalid colour to move '" + std::string(field) + "'");
}

CastlingRights parse_castling(std::string_view field) {
  CastlingRights rights = CastlingRights::none();
  if (field == "-") {
    return rights;
  }

  for (const char c : field) {
    const Colour colour = std::isupper(static_cast<unsigned char>(c)) != 0 ? Colour::White
                                                                            : Colour::Black;
    const auto letter_kind = kind_from_letter(c);

    if (letter_kind == PieceKind::King) {
      rights.add(castling_right(colour, CastlingSide::King));
    } else if (letter_kind == PieceKind::Queen) {
      rights.add(castling_right(colour, CastlingSide::Queen));
    } else {
      fail("invalid castling rights");
    }
  }

  return rights;
}

// The target square sits behind a pawn of the side that just moved, so it lies
// on the sixth rank when white is to move and the third when black is.
std::optional<Square> parse_en_passant(std::string_view field, Colour side_to_move) {
  if (field == "-") {
    return std::nullopt;
  }

  const auto square = Square::parse(field);
  const std::uint8_t expected_rank = side_to_move == Colour::White ? 5 : 2;

  if (!square.has_value() || square->rank() != expected_rank) {
    fail("invalid en passant square");
  }

  return square;
}

std::uint16_t parse_counter(std::string_view field) {
  std::uint16_t value = 0;
  const auto [end, ec] = std::from_chars(field.data(), field.data() + field.size(), value);

  if (field.empty() || ec != std::errc{} || end != field.data() + field.size()) {
    fail("invalid move counters");
  }

  return value;
}

std::string placement_to_fen(const Board& board) {
  std::string out;

  for (int rank = 7; rank >= 0; --rank) {
    int gap = 0;

    for (int file = 0; file < 8; ++file) {
      const auto piece = board.piece_at(*Square::from_coords(file, rank));
      if (!piece.has_value()) {
        ++gap;
        continue;
      }
      if (gap != 0) {
        out += std::to_string(gap);
        gap = 0;
      }
      out.push_back(to_char(*piece));
    }

    if (gap != 0) {
      out += std::to_string(gap);
    }
    if (rank != 0) {
      out.push_back('/');
    }
  }

  return out;
}

} // namespace

Position Position::from_fen(std::string_view fen) {
  const auto fields = split_fields(fen);

  if (fields.size() != FEN_FIELDS) {
    std::ostringstream oss;
    oss << "FEN must contain " << FEN_FIELDS << " parts, got " << fields.size();
    fail(oss.str());
  }

  const Colour side_to_move = parse_side_to_move(fields[1]);

  Position pos{parse_placement(fields[0]),
               side_to_move,
               parse_castling(fields[2]),
               parse_en_passant(fields[3], side_to_move),
               parse_counter(fields[4]),
               parse_counter(fields[5])};

  if (pos.full_move_counter == 0) {
    fail("invalid move counters");
  }

  return pos;
}

std::string Position::to_fen() const {
  std::ostringstream oss;
  oss << placement_to_fen(board) << ' ' << (colour_to_move == Colour::White ? 'w' : 'b') << ' '
      << castling_rights_to_fen(castling_rights) << ' '
      << (en_passant_square.has_value() ? en_passant_square->to_string() : "-") << ' '
      << half_move_clock << ' ' << full_move_counter;
  return oss.str();
}

std::string castling_rights_to_fen(CastlingRights rights) {
  std::string out;

  for (const Colour colour : ALL_COLOURS) {
    for (const CastlingSide side : FEN_CASTLING_ORDER) {
      if (rights.has(castling_right(colour, side))) {
        const char letter = side == CastlingSide::King ? 'K' : 'Q';
        out.push_back(colour == Colour::White
                          ? letter
                          : static_cast<char>(std::tolower(static_cast<unsigned char>(letter))));
      }
    }
  }

  return out.empty() ? "-" : out;
}

} // namespace gambit
