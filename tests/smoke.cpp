#include <cassert>
#include <cstddef>
#include "rookery/fen.hpp"
#include "rookery/position.hpp"
#include "rookery/zobrist.hpp"


int main() {
using namespace rookery;
Position a = Position::standard_start(), b = Position::standard_start();
// Same position yields same key
assert(position_key(a) == position_key(b));
assert(position_key(a) == position_key(position_from_fen(STARTPOS_FEN)));
assert(position_key(Position::empty()) == 0ULL);

const U64 k0 = position_key(a);

a.place(Square(File::E, Rank::Four), Cell::WhitePawn);
assert(position_key(a) != k0);
a.place(Square(File::E, Rank::Four), Cell::Empty);
assert(position_key(a) == k0);

a.set_side_to_move(Color::Black);
assert(position_key(a) != k0);
a.set_side_to_move(Color::White);

CastlingRights cr = CastlingRights::all();
cr.black_queenside = false;
a.set_castling(cr);
assert(position_key(a) != k0);
a.set_castling(CastlingRights::all());

a.set_en_passant(Square(File::C, Rank::Three));
const U64 k_ep = position_key(a);
assert(k_ep != k0);
// Only the en-passant file is hashed
a.set_en_passant(Square(File::C, Rank::Six));
assert(position_key(a) == k_ep);
a.set_en_passant(std::nullopt);
assert(position_key(a) == k0);

// Counters are not part of the key
a.set_halfmove_clock(9);
a.set_fullmove_number(30);
assert(position_key(a) == k0);

// Same piece kind, different color
Position w = Position::empty(), bl = Position::empty();
w.place(Square(File::D, Rank::Four), Cell::WhiteKnight);
bl.place(Square(File::D, Rank::Four), Cell::BlackKnight);
assert(position_key(w) != position_key(bl));

// Table layout: only piece cells on playable squares carry a key
const Zobrist& Z = Zobrist::instance();
const Square e2(File::E, Rank::Two);
assert(Z.cell_key(Cell::Empty, e2) == 0ULL);
assert(Z.cell_key(Cell::OffBoard, e2) == 0ULL);
assert(Z.cell_key(Cell::WhitePawn, e2) != 0ULL);
assert(Z.cell_key(Cell::WhitePawn, e2) != Z.cell_key(Cell::BlackPawn, e2));
for (int i = 0; i < MAILBOX_SIZE; ++i)
if (!from_mailbox_index(i))
assert(Z.cell_on[static_cast<std::size_t>(Cell::WhiteKing)][static_cast<std::size_t>(i)] == 0ULL);

// Seeded: same seed, same table; another seed, another table
Zobrist t1, t2, t3;
t1.init(7); t2.init(7); t3.init(8);
assert(t1.cell_key(Cell::BlackQueen, e2) == t2.cell_key(Cell::BlackQueen, e2));
assert(t1.black_to_move == t2.black_to_move);
assert(t1.cell_key(Cell::BlackQueen, e2) != t3.cell_key(Cell::BlackQueen, e2));
return 0;
}
