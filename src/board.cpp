#include "rookery/board.hpp"
#include <stdexcept>


namespace rookery {


Board::Board() { clear(); }


void Board::clear() {
cells_.fill(Cell::OffBoard);
for (Rank r : ALL_RANKS)
for (File f : ALL_FILES)
cells_[static_cast<std::size_t>(to_mailbox_index(Square(f, r)))] = Cell::Empty;
}


void Board::set(Square s, Cell c) {
if (c == Cell::OffBoard)
throw std::invalid_argument("cannot mark playable square " + square_name(s) + " off-board");
cells_[static_cast<std::size_t>(to_mailbox_index(s))] = c;
}


Cell Board::get_raw(int index) const {
if (index < 0 || index >= MAILBOX_SIZE) return Cell::OffBoard;
return cells_[static_cast<std::size_t>(index)];
}


} // namespace rookery
