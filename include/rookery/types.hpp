#pragma once
#include <cstdint>


namespace rookery {


using U64 = std::uint64_t;


enum class Color : int { White = 0, Black = 1 };


enum class PieceKind : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5 };


constexpr int COLOR_N = 2;
constexpr int KIND_N = 6;


inline constexpr Color opposite(Color c) {
  return c == Color::White ? Color::Black : Color::White;
}


} // namespace rookery
