#include "rookery/position.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace rookery {

namespace {

constexpr std::array<PieceKind, 8> BACK_RANK = {
  PieceKind::Rook, PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
  PieceKind::King, PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook };

} // namespace

Position Position::empty() { return Position{}; }

Position Position::standard_start() {
  Position p;
  for (File f : ALL_FILES) {
    const PieceKind k = BACK_RANK[static_cast<std::size_t>(file_index(f))];
    p.place(Square(f, Rank::One),   make_cell(Color::White, k));
    p.place(Square(f, Rank::Two),   make_cell(Color::White, PieceKind::Pawn));
    p.place(Square(f, Rank::Seven), make_cell(Color::Black, PieceKind::Pawn));
    p.place(Square(f, Rank::Eight), make_cell(Color::Black, k));
  }
  p.castling_ = CastlingRights::all();
  return p;
}

void Position::set_halfmove_clock(int n) {
  if (n < 0) throw std::invalid_argument("halfmove clock must be >= 0, got " + std::to_string(n));
  halfmove_clock_ = n;
}

void Position::set_fullmove_number(int n) {
  if (n < 1) throw std::invalid_argument("fullmove number must be >= 1, got " + std::to_string(n));
  fullmove_number_ = n;
}

std::optional<Square> Position::king_square(Color c) const {
  const Cell king = make_cell(c, PieceKind::King);
  for (Rank r : ALL_RANKS)
    for (File f : ALL_FILES)
      if (at(Square(f, r)) == king) return Square(f, r);
  return std::nullopt;
}

int Position::count(Cell c) const {
  int n = 0;
  for (Rank r : ALL_RANKS)
    for (File f : ALL_FILES)
      if (at(Square(f, r)) == c) ++n;
  return n;
}

} // namespace rookery
