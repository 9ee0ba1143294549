#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace gambit {

enum class Colour : std::uint8_t { White = 0, Black = 1 };

inline constexpr std::array<Colour, 2> ALL_COLOURS = {Colour::White, Colour::Black};

constexpr Colour operator!(Colour colour) {
  return colour == Colour::White ? Colour::Black : Colour::White;
}

constexpr std::size_t colour_index(Colour colour) {
  return static_cast<std::size_t>(colour);
}

constexpr std::string_view to_string(Colour colour) {
  return colour == Colour::White ? "white" : "black";
}

} // namespace gambit
