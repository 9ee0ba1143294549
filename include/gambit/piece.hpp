#pragma once

#include <array>
#include <optional>
#include <ostream>
#include <string>

#include "gambit/colour.hpp"

namespace gambit {

/// Chess pieces enumeration.
/// Naming convention: [Colour][Piece]
/// Colours: W = White, B = Black
/// Pieces: P = Pawn, N = Knight (N to avoid confusion with King),
///         B = Bishop, R = Rook, Q = Queen, K = King
enum class Piece : int {
  WP, // White Pawn
  WN, // White Knight
  WB, // White Bishop
  WR, // White Rook
  WQ, // White Queen
  WK, // White King
  BP, // Black Pawn
  BN, // Black Knight
  BB, // Black Bishop
  BR, // Black Rook
  BQ, // Black Queen
  BK, // Black King
};

/// The colourless half of a piece. Ordered to match Piece within each colour.
enum class PieceKind : int { Pawn, Knight, Bishop, Rook, Queen, King };

constexpr Piece make_piece(PieceKind kind, Colour colour) {
  const int offset = colour == Colour::White ? 0 : 6;
  return static_cast<Piece>(static_cast<int>(kind) + offset);
}

// Factories by colour.
constexpr Piece pawn(Colour colour) {
  return make_piece(PieceKind::Pawn, colour);
}
constexpr Piece knight(Colour colour) {
  return make_piece(PieceKind::Knight, colour);
}
constexpr Piece bishop(Colour colour) {
  return make_piece(PieceKind::Bishop, colour);
}
constexpr Piece rook(Colour colour) {
  return make_piece(PieceKind::Rook, colour);
}
constexpr Piece queen(Colour colour) {
  return make_piece(PieceKind::Queen, colour);
}
constexpr Piece king(Colour colour) {
  return make_piece(PieceKind::King, colour);
}

// Promotion choices in generation order: the first one wins when a caller does
// not name a piece.
inline constexpr std::array<std::array<Piece, 4>, 2> PROMOTION_PIECES = {{
    {Piece::WQ, Piece::WR, Piece::WB, Piece::WN},
    {Piece::BQ, Piece::BR, Piece::BB, Piece::BN},
}};

constexpr const std::array<Piece, 4>& promotions_for(Colour colour) {
  return PROMOTION_PIECES[colour_index(colour)];
}

constexpr PieceKind kind(Piece piece) {
  return static_cast<PieceKind>(static_cast<int>(piece) % 6);
}

constexpr Colour colour(Piece piece) {
  return static_cast<int>(piece) <= static_cast<int>(Piece::WK) ? Colour::White : Colour::Black;
}

constexpr bool is_pawn(Piece piece) {
  return kind(piece) == PieceKind::Pawn;
}

constexpr bool is_king(Piece piece) {
  return kind(piece) == PieceKind::King;
}

constexpr bool is_minor(Piece piece) {
  return kind(piece) == PieceKind::Knight || kind(piece) == PieceKind::Bishop;
}

/// Upper-case letter used by notation: P, N, B, R, Q, K.
constexpr char kind_letter(PieceKind piece_kind) {
  switch (piece_kind) {
  case PieceKind::Pawn:
    return 'P';
  case PieceKind::Knight:
    return 'N';
  case PieceKind::Bishop:
    return 'B';
  case PieceKind::Rook:
    return 'R';
  case PieceKind::Queen:
    return 'Q';
  case PieceKind::King:
    return 'K';
  }
  return '?';
}

/// Parses a notation letter in either case. Used for promotion suffixes.
constexpr std::optional<PieceKind> kind_from_letter(char letter) {
  switch (letter) {
  case 'P':
  case 'p':
    return PieceKind::Pawn;
  case 'N':
  case 'n':
    return PieceKind::Knight;
  case 'B':
  case 'b':
    return PieceKind::Bishop;
  case 'R':
  case 'r':
    return PieceKind::Rook;
  case 'Q':
  case 'q':
    return PieceKind::Queen;
  case 'K':
  case 'k':
    return PieceKind::King;
  default:
    return std::nullopt;
  }
}

/// FEN letter: upper case for white, lower case for black.
constexpr char to_char(Piece piece) {
  const char letter = kind_letter(kind(piece));
  return colour(piece) == Colour::White ? letter : static_cast<char>(letter - 'A' + 'a');
}

constexpr std::optional<Piece> piece_from_char(char c) {
  const auto piece_kind = kind_from_letter(c);
  if (!piece_kind.has_value()) {
    return std::nullopt;
  }
  return make_piece(*piece_kind, c >= 'a' ? Colour::Black : Colour::White);
}

inline std::string to_string(Piece piece) {
  return std::string(1, to_char(piece));
}

inline std::ostream& operator<<(std::ostream& os, Piece piece) {
  os << to_char(piece);
  return os;
}

} // namespace gambit
