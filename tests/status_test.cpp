#include <gtest/gtest.h>

#include <string_view>

#include "gambit/position.hpp"
#include "gambit/status.hpp"

using namespace gambit;

namespace {

GameStatus status_of(std::string_view fen) {
  return evaluate_status(Position::from_fen(fen));
}

bool insufficient(std::string_view fen) {
  return is_insufficient_material(Position::from_fen(fen).board);
}

} // namespace

TEST(Status, StartPositionIsActive) {
  EXPECT_EQ(evaluate_status(Position::startpos()), GameStatus::Active);
}

TEST(Status, Check) {
  EXPECT_EQ(status_of("4k3/8/8/8/8/8/8/4R1K1 b - - 0 1"), GameStatus::Check);
}

TEST(Status, Checkmate) {
  EXPECT_EQ(status_of("rnb1kbnr/pppp1ppp/8/4p3/6Pq/5P2/PPPPP2P/RNBQKBNR w KQkq - 1 3"),
            GameStatus::Checkmate);
  EXPECT_EQ(status_of("R5k1/5ppp/8/8/8/8/8/6K1 b - - 0 1"), GameStatus::Checkmate);
}

TEST(Status, Stalemate) {
  EXPECT_EQ(status_of("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"), GameStatus::Stalemate);
}

TEST(Status, FiftyMoveRule) {
  EXPECT_EQ(status_of("4k3/8/8/8/8/8/8/R3K3 w - - 99 80"), GameStatus::Active);
  EXPECT_EQ(status_of("4k3/8/8/8/8/8/8/R3K3 w - - 100 80"), GameStatus::Draw);
}

TEST(Status, CheckmateTakesPrecedenceOverFiftyMoveRule) {
  EXPECT_EQ(status_of("R5k1/5ppp/8/8/8/8/8/6K1 b - - 100 80"), GameStatus::Checkmate);
}

TEST(Status, StalemateTakesPrecedenceOverInsufficientMaterial) {
  EXPECT_EQ(status_of("k7/2K5/8/8/8/8/8/6B1 b - - 0 1"), GameStatus::Stalemate);
}

TEST(Status, InsufficientMaterialIsADraw) {
  EXPECT_EQ(status_of("8/8/8/4k3/8/8/8/4K3 w - - 0 1"), GameStatus::Draw);
  EXPECT_EQ(status_of("8/8/8/4k3/8/8/8/2B1K3 w - - 0 1"), GameStatus::Draw);
  EXPECT_EQ(status_of("8/8/3n4/4k3/8/8/8/4K3 w - - 0 1"), GameStatus::Draw);
}

TEST(Status, InsufficientMaterialIsADrawEvenInCheck) {
  EXPECT_EQ(status_of("4k3/8/8/1B6/8/8/8/4K3 b - - 0 1"), GameStatus::Draw);
  EXPECT_EQ(status_of("4k3/8/3N4/8/8/8/8/4K3 b - - 0 1"), GameStatus::Draw);
  EXPECT_EQ(status_of("4k3/8/8/8/8/5n2/8/4K3 w - - 0 1"), GameStatus::Draw);
}

TEST(Status, InsufficientMaterial) {
  EXPECT_TRUE(insufficient("8/8/8/4k3/8/8/8/4K3 w - - 0 1"));
  EXPECT_TRUE(insufficient("8/8/8/4k3/8/8/8/2B1K3 w - - 0 1"));
  EXPECT_TRUE(insufficient("8/8/8/4k3/8/8/8/1N2K3 w - - 0 1"));
  EXPECT_TRUE(insufficient("8/8/2b5/4k3/8/8/8/4K3 w - - 0 1"));
}

TEST(Status, SufficientMaterial) {
  EXPECT_FALSE(insufficient(Position::START_POS_FEN));
  EXPECT_FALSE(insufficient("8/8/2b5/4k3/8/8/8/2B1K3 w - - 0 1"));
  EXPECT_FALSE(insufficient("8/8/8/4k3/8/8/8/1NN1K3 w - - 0 1"));
  EXPECT_FALSE(insufficient("8/8/8/4k3/8/8/8/R3K3 w - - 0 1"));
  EXPECT_FALSE(insufficient("8/8/8/4k3/8/8/4P3/4K3 w - - 0 1"));
  EXPECT_FALSE(insufficient("8/8/8/4k3/8/8/8/3QK3 w - - 0 1"));
}

TEST(Status, IsTerminal) {
  EXPECT_FALSE(is_terminal(GameStatus::Active));
  EXPECT_FALSE(is_terminal(GameStatus::Check));
  EXPECT_TRUE(is_terminal(GameStatus::Checkmate));
  EXPECT_TRUE(is_terminal(GameStatus::Stalemate));
  EXPECT_TRUE(is_terminal(GameStatus::Draw));
}

TEST(Status, Names) {
  EXPECT_EQ(to_string(GameStatus::Active), "active");
  EXPECT_EQ(to_string(GameStatus::Check), "check");
  EXPECT_EQ(to_string(GameStatus::Checkmate), "checkmate");
  EXPECT_EQ(to_string(GameStatus::Stalemate), "stalemate");
  EXPECT_EQ(to_string(GameStatus::Draw), "draw");
}
