#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include "gambit/console.hpp"
#include "gambit/position.hpp"

int main(int argc, char* argv[]) {
  gambit::Position start = gambit::Position::startpos();

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];

    if (arg == "--fen" && i + 1 < argc) {
      try {
        start = gambit::Position::from_fen(argv[++i]);
      } catch (const std::exception& ex) {
        std::cerr << "invalid FEN: " << ex.what() << "\n";
        return 1;
      }
      continue;
    }

    std::cerr << "Usage: " << argv[0] << " [--fen \"<fen>\"]\n";
    return 1;
  }

  gambit::console::run_loop(std::cin, std::cout, start);
  return 0;
}
