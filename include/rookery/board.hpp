#pragma once
#include <array>
#include <cstddef>
#include "rookery/piece.hpp"
#include "rookery/square.hpp"


namespace rookery {


// 10x12 mailbox. Playable squares are addressed through Square; the
// sentinel border is only visible through get_raw().
class Board {
public:
Board();

// back to the empty board: 64 Empty cells inside an OffBoard border
void clear();

Cell get(Square s) const { return cells_[static_cast<std::size_t>(to_mailbox_index(s))]; }

// Throws std::invalid_argument for Cell::OffBoard
void set(Square s, Cell c);
void clear(Square s) { set(s, Cell::Empty); }

// OffBoard for sentinels and for any index outside [0, 120)
Cell get_raw(int index) const;

bool operator==(const Board&) const = default;


private:
std::array<Cell, MAILBOX_SIZE> cells_{};
};


} // namespace rookery
