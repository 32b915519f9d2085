#pragma once
#include <optional>
#include "rookery/board.hpp"
#include "rookery/types.hpp"


namespace rookery {


struct CastlingRights {
bool white_kingside = false;
bool white_queenside = false;
bool black_kingside = false;
bool black_queenside = false;

static CastlingRights all() { return {true, true, true, true}; }
bool any() const { return white_kingside || white_queenside || black_kingside || black_queenside; }

bool operator==(const CastlingRights&) const = default;
};


// Board plus the game state that is not visible on the board. Storage and
// direct manipulation only; applying moves is the caller's business.
// Flat value type: copy it per search task rather than sharing it.
class Position {
public:
Position() = default; // same as empty()

static Position standard_start();
static Position empty();

Cell at(Square s) const { return board_.get(s); }
const Board& board() const { return board_; }

Color side_to_move() const { return stm_; }
CastlingRights castling() const { return castling_; }
std::optional<Square> en_passant() const { return ep_square_; }
int halfmove_clock() const { return halfmove_clock_; }
int fullmove_number() const { return fullmove_number_; }

// Raw placement; Cell::Empty clears. Throws std::invalid_argument for OffBoard.
void place(Square s, Cell c) { board_.set(s, c); }

void set_side_to_move(Color c) { stm_ = c; }
void set_castling(CastlingRights cr) { castling_ = cr; }
void set_en_passant(std::optional<Square> s) { ep_square_ = s; }
void set_halfmove_clock(int n);   // >= 0
void set_fullmove_number(int n);  // >= 1

// First square holding this side's king, scanning a1..h8
std::optional<Square> king_square(Color c) const;
int count(Cell c) const;

bool operator==(const Position&) const = default;


private:
Board board_{};
Color stm_ = Color::White;
CastlingRights castling_{};
std::optional<Square> ep_square_{};
int halfmove_clock_ = 0;
int fullmove_number_ = 1;
};


} // namespace rookery
