#include <cassert>
#include <string>
#include "rookery/fen.hpp"
#include "rookery/position.hpp"


int main() {
using namespace rookery;


// Round-trip startpos
Position p1 = position_from_fen(STARTPOS_FEN);
assert(p1 == Position::standard_start());
assert(to_fen(p1) == STARTPOS_FEN);
assert(to_fen(Position::standard_start()) == STARTPOS_FEN);


// Castling rights only on white and an EP square
const char* kEp = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b K e3 0 1";
Position p2 = position_from_fen(kEp);
assert(p2.side_to_move() == Color::Black);
assert(p2.castling().white_kingside && !p2.castling().white_queenside);
assert(!p2.castling().black_kingside && !p2.castling().black_queenside);
assert(p2.en_passant() == Square(File::E, Rank::Three));
assert(p2.at(Square(File::E, Rank::Four)) == Cell::WhitePawn);
assert(p2.at(Square(File::E, Rank::Two)) == Cell::Empty);
assert(to_fen(p2) == kEp);


// Counters and no castling
Position p3;
set_from_fen(p3, "8/8/8/3k4/8/8/8/4K3 w - - 17 63");
assert(!p3.castling().any());
assert(p3.halfmove_clock() == 17);
assert(p3.fullmove_number() == 63);
assert(p3.king_square(Color::Black) == Square(File::D, Rank::Five));
assert(to_fen(p3) == "8/8/8/3k4/8/8/8/4K3 w - - 17 63");


// Black's double push target on rank 6
Position p4 = position_from_fen("rnbqkbnr/ppp1pppp/8/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");
assert(p4.en_passant() == Square(File::D, Rank::Six));


// Bad input throws and leaves the target untouched
const char* bad[] = {
  "",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq -",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 extra",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR/8 w KQkq - 0 1",
  "rnbqkbnr/ppppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
  "rnbqkbnr/ppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
  "rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
  "rnbqkbnx/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkx - 0 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq e9 0 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - -1 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - a 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 0",
  "44/8/8/8/8/8/8/K6k w - - 0 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KKK - 0 1",
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkqK - 0 1",
  "8/8/8/8/8/8/8/K6k w - e4 0 1",
  "8/8/8/8/8/8/8/K6k b - a1 0 1",
};
for (const char* fen : bad) {
  Position p = p3;
  bool threw = false;
  try { set_from_fen(p, fen); } catch (const FenError&) { threw = true; }
  assert(threw);
  assert(p == p3);
}


return 0;
}
