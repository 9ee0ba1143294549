#include <gtest/gtest.h>

#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

#include "gambit/game.hpp"

using namespace gambit;

namespace {

Game game_from(std::string_view fen) {
  return Game(Position::from_fen(fen));
}

// Plays each (from, to) pair, expecting all of them to be accepted.
void play(Game& game, std::initializer_list<std::pair<Square, Square>> moves) {
  for (const auto& [from, to] : moves) {
    const auto outcome = game.attempt_move(from, to);
    ASSERT_TRUE(outcome.accepted()) << from << to;
  }
}

void expect_kings_cached(const Game& game) {
  for (const Colour colour : ALL_COLOURS) {
    EXPECT_EQ(game.board().piece_at(game.board().king_square(colour)), king(colour));
  }
}

} // namespace

TEST(Game, StartsFromTheStandardPosition) {
  const Game game;

  EXPECT_EQ(game.position(), Position::startpos());
  EXPECT_EQ(game.colour_to_move(), Colour::White);
  EXPECT_EQ(game.status(), GameStatus::Active);
  EXPECT_TRUE(game.history().empty());
  EXPECT_FALSE(game.last_move().has_value());
  EXPECT_FALSE(game.is_over());
}

TEST(Game, AcceptsALegalMove) {
  Game game;

  const auto outcome = game.attempt_move(Square::E2, Square::E4);

  ASSERT_TRUE(outcome.accepted());
  EXPECT_EQ(outcome.move->to, Square::E4);
  EXPECT_EQ(outcome.status, GameStatus::Active);
  EXPECT_EQ(game.colour_to_move(), Colour::Black);
  EXPECT_EQ(game.position().en_passant_square, Square::E3);
  EXPECT_EQ(game.last_move(), outcome.move);
  ASSERT_EQ(game.history().size(), 1U);
  EXPECT_EQ(game.history()[0].notation, "e4");
}

TEST(Game, RejectsAnIllegalMoveWithoutChangingAnything) {
  Game game;
  const Position before = game.position();

  const auto outcome = game.attempt_move(Square::E2, Square::E5);

  EXPECT_FALSE(outcome.accepted());
  EXPECT_EQ(outcome.rejection, Rejection::IllegalMove);
  EXPECT_FALSE(outcome.move.has_value());
  EXPECT_EQ(game.position(), before);
  EXPECT_TRUE(game.history().empty());
}

TEST(Game, RejectsMovingTheOpponentsPiece) {
  Game game;

  EXPECT_EQ(game.attempt_move(Square::E7, Square::E5).rejection, Rejection::IllegalMove);
  EXPECT_EQ(game.attempt_move(Square::E4, Square::E5).rejection, Rejection::IllegalMove);
}

TEST(Game, ValidMovesForEmptyOrOpponentSquareIsEmpty) {
  const Game game;

  EXPECT_TRUE(game.valid_moves(Square::E4).empty());
  EXPECT_TRUE(game.valid_moves(Square::D7).empty());
  EXPECT_EQ(game.valid_moves(Square::G1).size(), 2U);
}

TEST(Game, FoolsMate) {
  Game game;

  play(game, {{Square::F2, Square::F3},
              {Square::E7, Square::E5},
              {Square::G2, Square::G4},
              {Square::D8, Square::H4}});

  EXPECT_EQ(game.status(), GameStatus::Checkmate);
  EXPECT_TRUE(game.is_over());
  EXPECT_EQ(game.winner(), Colour::Black);
  EXPECT_FALSE(game.check_square().has_value());
  EXPECT_TRUE(game.valid_moves(Square::E1).empty());
  EXPECT_TRUE(game.valid_moves(Square::A2).empty());
}

TEST(Game, NothingIsAcceptedAfterTheGameEnds) {
  Game game;
  play(game, {{Square::F2, Square::F3},
              {Square::E7, Square::E5},
              {Square::G2, Square::G4},
              {Square::D8, Square::H4}});
  const Position final_position = game.position();

  EXPECT_EQ(game.attempt_move(Square::A2, Square::A3).rejection, Rejection::GameOver);
  EXPECT_EQ(game.undo().rejection, Rejection::GameOver);
  EXPECT_EQ(game.position(), final_position);
  EXPECT_EQ(game.history().size(), 4U);
}

TEST(Game, NewGameResets) {
  Game game;
  play(game, {{Square::E2, Square::E4}, {Square::D7, Square::D5}, {Square::E4, Square::D5}});

  game.new_game();

  EXPECT_EQ(game.position(), Position::startpos());
  EXPECT_TRUE(game.history().empty());
  EXPECT_TRUE(game.captured(Colour::Black).empty());
}

TEST(Game, CheckSquareIsTheCheckedKing) {
  Game game;
  play(game, {{Square::E2, Square::E4},
              {Square::F7, Square::F6},
              {Square::D1, Square::H5}});

  EXPECT_EQ(game.status(), GameStatus::Check);
  EXPECT_EQ(game.check_square(), Square::E8);
  EXPECT_FALSE(game.winner().has_value());
}

TEST(Game, UndoWithEmptyHistory) {
  Game game;

  const auto outcome = game.undo();

  EXPECT_EQ(outcome.rejection, Rejection::NothingToUndo);
  EXPECT_EQ(game.position(), Position::startpos());
}

TEST(Game, UndoRestoresThePosition) {
  Game game;
  play(game, {{Square::E2, Square::E4}, {Square::D7, Square::D5}});
  const Position before = game.position();

  play(game, {{Square::E4, Square::D5}});
  ASSERT_EQ(game.captured(Colour::Black).size(), 1U);

  const auto outcome = game.undo();

  ASSERT_TRUE(outcome.accepted());
  EXPECT_EQ(outcome.move->from, Square::E4);
  EXPECT_EQ(game.position(), before);
  EXPECT_TRUE(game.captured(Colour::Black).empty());
  EXPECT_EQ(game.history().size(), 2U);
}

TEST(Game, UndoEverythingReturnsToTheStart) {
  Game game;
  play(game, {{Square::E2, Square::E4},
              {Square::D7, Square::D5},
              {Square::E4, Square::D5},
              {Square::D8, Square::D5},
              {Square::B1, Square::C3}});

  while (game.undo().accepted()) {
  }

  EXPECT_EQ(game.position(), Position::startpos());
  EXPECT_TRUE(game.history().empty());
  EXPECT_TRUE(game.captured(Colour::White).empty());
  EXPECT_TRUE(game.captured(Colour::Black).empty());
}

TEST(Game, EnPassant) {
  Game game;
  play(game, {{Square::E2, Square::E4},
              {Square::A7, Square::A6},
              {Square::E4, Square::E5},
              {Square::D7, Square::D5}});
  EXPECT_EQ(game.position().en_passant_square, Square::D6);

  const auto outcome = game.attempt_move(Square::E5, Square::D6);

  ASSERT_TRUE(outcome.accepted());
  EXPECT_TRUE(outcome.move->is_en_passant);
  EXPECT_FALSE(game.board().has_piece_at(Square::D5));
  EXPECT_EQ(game.board().piece_at(Square::D6), Piece::WP);
  EXPECT_EQ(game.captured(Colour::Black), std::vector<Piece>{Piece::BP});
  EXPECT_FALSE(game.position().en_passant_square.has_value());
  EXPECT_EQ(game.history().back().notation, "exd6 e.p.");
}

TEST(Game, EnPassantExpiresAfterOneMove) {
  Game game;
  play(game, {{Square::E2, Square::E4},
              {Square::A7, Square::A6},
              {Square::E4, Square::E5},
              {Square::D7, Square::D5},
              {Square::H2, Square::H3},
              {Square::A6, Square::A5}});

  EXPECT_EQ(game.attempt_move(Square::E5, Square::D6).rejection, Rejection::IllegalMove);
}

TEST(Game, UndoEnPassantRestoresTheCapturedPawn) {
  auto game = game_from("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 1");
  const Position before = game.position();

  play(game, {{Square::E5, Square::D6}});
  ASSERT_TRUE(game.undo().accepted());

  EXPECT_EQ(game.position(), before);
  EXPECT_EQ(game.board().piece_at(Square::D5), Piece::BP);
  EXPECT_TRUE(game.captured(Colour::Black).empty());
}

TEST(Game, CastlingAndUndo) {
  auto game = game_from("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  const Position before = game.position();

  const auto outcome = game.attempt_move(Square::E1, Square::G1);

  ASSERT_TRUE(outcome.accepted());
  EXPECT_EQ(outcome.move->castling_side, CastlingSide::King);
  EXPECT_EQ(game.board().piece_at(Square::F1), Piece::WR);
  EXPECT_EQ(game.history().back().notation, "O-O");
  EXPECT_FALSE(game.position().castling_rights.has(CastlingRight::WhiteQueen));
  expect_kings_cached(game);

  ASSERT_TRUE(game.undo().accepted());
  EXPECT_EQ(game.position(), before);
  expect_kings_cached(game);
}

TEST(Game, PromotionDefaultsToQueen) {
  auto game = game_from("4k3/1P6/8/8/8/8/8/4K3 w - - 0 1");

  const auto outcome = game.attempt_move(Square::B7, Square::B8);

  ASSERT_TRUE(outcome.accepted());
  EXPECT_EQ(game.board().piece_at(Square::B8), Piece::WQ);
  EXPECT_EQ(game.history().back().notation, "b8=Q");
  EXPECT_EQ(game.status(), GameStatus::Check);
}

TEST(Game, PromotionChoice) {
  auto game = game_from("4k3/1P6/8/8/8/8/8/4K3 w - - 0 1");

  const auto outcome = game.attempt_move(Square::B7, Square::B8, PieceKind::Knight);

  ASSERT_TRUE(outcome.accepted());
  EXPECT_EQ(game.board().piece_at(Square::B8), Piece::WN);
  EXPECT_EQ(game.status(), GameStatus::Draw);
}

TEST(Game, InvalidPromotionChoiceIsRejected) {
  auto game = game_from("4k3/1P6/8/8/8/8/8/4K3 w - - 0 1");

  EXPECT_EQ(game.attempt_move(Square::B7, Square::B8, PieceKind::King).rejection,
            Rejection::IllegalMove);
  EXPECT_EQ(game.board().piece_at(Square::B7), Piece::WP);
}

TEST(Game, PromotionChoiceIsIgnoredForOrdinaryMoves) {
  Game game;

  EXPECT_TRUE(game.attempt_move(Square::E2, Square::E4, PieceKind::Rook).accepted());
}

TEST(Game, UndoPromotionRestoresThePawn) {
  auto game = game_from("1r2k3/P7/8/8/8/8/8/4K3 w - - 0 1");
  const Position before = game.position();

  play(game, {{Square::A7, Square::B8}});
  EXPECT_EQ(game.captured(Colour::Black), std::vector<Piece>{Piece::BR});

  ASSERT_TRUE(game.undo().accepted());
  EXPECT_EQ(game.position(), before);
  EXPECT_TRUE(game.captured(Colour::Black).empty());
}

TEST(Game, CapturedPiecesAreListedByOwner) {
  Game game;
  play(game, {{Square::E2, Square::E4},
              {Square::D7, Square::D5},
              {Square::E4, Square::D5},
              {Square::D8, Square::D5},
              {Square::B1, Square::C3},
              {Square::D5, Square::A2}});

  EXPECT_EQ(game.captured(Colour::Black), std::vector<Piece>{Piece::BP});
  EXPECT_EQ(game.captured(Colour::White), (std::vector<Piece>{Piece::WP, Piece::WP}));
}

TEST(Game, HalfMoveClock) {
  Game game;
  play(game, {{Square::G1, Square::F3}, {Square::G8, Square::F6}});
  EXPECT_EQ(game.position().half_move_clock, 2);
  EXPECT_EQ(game.position().full_move_counter, 2);

  play(game, {{Square::E2, Square::E4}});
  EXPECT_EQ(game.position().half_move_clock, 0);
}

TEST(Game, FiftyMoveRuleEndsTheGame) {
  auto game = game_from("4k3/8/8/8/8/8/8/R3K3 w - - 99 80");
  EXPECT_EQ(game.status(), GameStatus::Active);

  play(game, {{Square::A1, Square::A2}});

  EXPECT_EQ(game.status(), GameStatus::Draw);
  EXPECT_TRUE(game.is_over());
  EXPECT_FALSE(game.winner().has_value());
}

TEST(Game, CaptureBeforeFiftyMovesResetsTheClock) {
  auto game = game_from("4k3/8/8/8/8/8/p7/R3K3 w - - 99 80");

  play(game, {{Square::A1, Square::A2}});

  EXPECT_EQ(game.position().half_move_clock, 0);
  EXPECT_EQ(game.status(), GameStatus::Active);
}

TEST(Game, Stalemate) {
  auto game = game_from("7k/8/6K1/8/8/8/8/5Q2 w - - 0 1");

  play(game, {{Square::F1, Square::F7}});

  EXPECT_EQ(game.status(), GameStatus::Stalemate);
  EXPECT_TRUE(game.is_over());
  EXPECT_FALSE(game.winner().has_value());
}

TEST(Game, KingCacheFollowsTheGame) {
  Game game;
  play(game, {{Square::E2, Square::E4},
              {Square::E7, Square::E5},
              {Square::E1, Square::E2},
              {Square::E8, Square::E7},
              {Square::E2, Square::D3},
              {Square::E7, Square::F6}});

  expect_kings_cached(game);
  EXPECT_EQ(game.board().king_square(Colour::White), Square::D3);
  EXPECT_EQ(game.board().king_square(Colour::Black), Square::F6);

  while (game.undo().accepted()) {
    expect_kings_cached(game);
  }
  EXPECT_EQ(game.board().king_square(Colour::White), Square::E1);
}

TEST(Game, SetPositionClearsHistory) {
  Game game;
  play(game, {{Square::E2, Square::E4}});
  EXPECT_EQ(game.start_position(), Position::startpos());

  const auto bare_kings = Position::from_fen("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
  game.set_position(bare_kings);

  EXPECT_EQ(game.start_position(), bare_kings);
  EXPECT_TRUE(game.history().empty());
  EXPECT_EQ(game.status(), GameStatus::Draw);
}

TEST(Game, RejectionNames) {
  EXPECT_EQ(to_string(Rejection::IllegalMove), "illegal-move");
  EXPECT_EQ(to_string(Rejection::NothingToUndo), "nothing-to-undo");
  EXPECT_EQ(to_string(Rejection::GameOver), "game-over");
}
