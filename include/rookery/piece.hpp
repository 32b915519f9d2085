#pragma once
#include <cstdint>
#include <optional>
#include "rookery/types.hpp"

namespace rookery {

// Contents of one mailbox cell: one of the 12 pieces, an empty playable
// square, or a sentinel outside the board.
enum class Cell : std::uint8_t {
  Empty = 0,
  OffBoard = 1,
  WhitePawn, WhiteKnight, WhiteBishop, WhiteRook, WhiteQueen, WhiteKing,
  BlackPawn, BlackKnight, BlackBishop, BlackRook, BlackQueen, BlackKing,
};

constexpr int CELL_N = 14;

inline constexpr Cell make_cell(Color c, PieceKind k) {
  return static_cast<Cell>(2 + static_cast<int>(c) * KIND_N + static_cast<int>(k));
}

inline constexpr bool is_piece(Cell c) {
  return c != Cell::Empty && c != Cell::OffBoard;
}

// Both throw std::invalid_argument for Empty / OffBoard
Color color_of(Cell c);
PieceKind kind_of(Cell c);

// FEN letter (white uppercase, black lowercase), '.' for Empty, '#' for OffBoard
char ascii_glyph(Cell c);

// UTF-8 filled chess symbol of the piece kind; "." for Empty, "#" for OffBoard
const char* display_glyph(Cell c);

// Inverse of ascii_glyph for the 12 piece letters
std::optional<Cell> cell_from_char(char ch);

} // namespace rookery
