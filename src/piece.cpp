#include "rookery/piece.hpp"

#include <stdexcept>

namespace rookery {

static inline int piece_ordinal(Cell c) {
  if (!is_piece(c)) throw std::invalid_argument("cell does not hold a piece");
  return static_cast<int>(c) - 2;
}

Color color_of(Cell c) {
  return piece_ordinal(c) < KIND_N ? Color::White : Color::Black;
}

PieceKind kind_of(Cell c) {
  return static_cast<PieceKind>(piece_ordinal(c) % KIND_N);
}

char ascii_glyph(Cell c) {
  if (c == Cell::Empty) return '.';
  if (c == Cell::OffBoard) return '#';
  const char* W = "PNBRQK";
  const char* B = "pnbrqk";
  const int k = static_cast<int>(kind_of(c));
  return color_of(c) == Color::White ? W[k] : B[k];
}

const char* display_glyph(Cell c) {
  if (c == Cell::Empty) return ".";
  if (c == Cell::OffBoard) return "#";
  switch (kind_of(c)) {
    case PieceKind::Pawn:   return "\xE2\x99\x9F"; // U+265F
    case PieceKind::Knight: return "\xE2\x99\x9E"; // U+265E
    case PieceKind::Bishop: return "\xE2\x99\x9D"; // U+265D
    case PieceKind::Rook:   return "\xE2\x99\x9C"; // U+265C
    case PieceKind::Queen:  return "\xE2\x99\x9B"; // U+265B
    case PieceKind::King:   return "\xE2\x99\x9A"; // U+265A
  }
  return "?";
}

std::optional<Cell> cell_from_char(char ch) {
  switch (ch) {
    case 'P': return Cell::WhitePawn;
    case 'N': return Cell::WhiteKnight;
    case 'B': return Cell::WhiteBishop;
    case 'R': return Cell::WhiteRook;
    case 'Q': return Cell::WhiteQueen;
    case 'K': return Cell::WhiteKing;
    case 'p': return Cell::BlackPawn;
    case 'n': return Cell::BlackKnight;
    case 'b': return Cell::BlackBishop;
    case 'r': return Cell::BlackRook;
    case 'q': return Cell::BlackQueen;
    case 'k': return Cell::BlackKing;
    default:  return std::nullopt;
  }
}

} // namespace rookery
