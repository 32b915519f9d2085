#include "rookery/square.hpp"

#include <stdexcept>
#include <string>

namespace rookery {

File file_from_index(int i) {
  if (i < 0 || i > 7) throw std::out_of_range("file index out of range: " + std::to_string(i));
  return static_cast<File>(i);
}

Rank rank_from_index(int i) {
  if (i < 0 || i > 7) throw std::out_of_range("rank index out of range: " + std::to_string(i));
  return static_cast<Rank>(i);
}

std::string square_name(Square s) {
  std::string out;
  out.reserve(2);
  out.push_back(file_to_char(s.file()));
  out.push_back(rank_to_char(s.rank()));
  return out;
}

Square parse_square(std::string_view text) {
  if (text.size() != 2)
    throw std::invalid_argument("bad square length: " + std::string(text));

  const char f = text[0];
  const char r = text[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8')
    throw std::invalid_argument("bad square: " + std::string(text));

  return Square(file_from_index(f - 'a'), rank_from_index(r - '1'));
}

std::optional<Square> from_mailbox_index(int index) {
  if (index < 0 || index >= MAILBOX_SIZE) return std::nullopt;

  const int col = index % MAILBOX_WIDTH;
  const int row = index / MAILBOX_WIDTH;
  if (col < 1 || col > 8) return std::nullopt;   // border columns
  if (row < 2 || row > 9) return std::nullopt;   // border rows

  return Square(file_from_index(col - 1), rank_from_index(row - 2));
}

} // namespace rookery
