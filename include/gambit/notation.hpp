#pragma once

#include <string>

#include "gambit/move.hpp"

namespace gambit {

// Short algebraic-style text for a move: "Nf3", "exd5", "e8=Q", "O-O",
// "exd6 e.p.". There is no disambiguation between two like pieces that can
// reach the same square, and no check or mate suffix.
std::string to_notation(const Move& mv);

} // namespace gambit
