#include "rookery/fen.hpp"
#include <optional>
#include <sstream>
#include <string>

namespace rookery {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static int parse_counter(const std::string& s, const char* what) {
  if (s.empty() || s.size() > 9) throw FenError(std::string("Invalid ") + what + " in FEN: " + s);
  for (char c : s)
    if (!is_digit(c)) throw FenError(std::string("Invalid ") + what + " in FEN: " + s);
  return std::stoi(s);
}

Position position_from_fen(std::string_view fen) {
  Position p = Position::empty();

  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active, castling, ep, half, full, extra;
  if (!(ss >> placement >> active >> castling >> ep >> half >> full))
    throw FenError("Malformed FEN: expected 6 fields");
  if (ss >> extra)
    throw FenError("Malformed FEN: trailing field '" + extra + "'");

  // 1) Piece placement, rank 8 first
  int r = 7, f = 0;
  bool after_digit = false;
  for (char ch : placement) {
    const bool digit = is_digit(ch);
    if (digit && after_digit) throw FenError("Adjacent empty-run digits in FEN");
    after_digit = digit;
    if (ch == '/') {
      if (f != 8) throw FenError("FEN rank does not cover 8 files");
      if (--r < 0) throw FenError("Too many ranks in FEN");
      f = 0;
      continue;
    }
    if (digit) {
      if (ch == '0' || ch == '9') throw FenError("Invalid empty-run digit in FEN");
      f += ch - '0';
      if (f > 8) throw FenError("FEN rank overflows 8 files");
      continue;
    }
    const auto cell = cell_from_char(ch);
    if (!cell) throw FenError(std::string("Invalid piece character in FEN: ") + ch);
    if (f > 7) throw FenError("FEN rank overflows 8 files");
    p.place(Square(file_from_index(f), rank_from_index(r)), *cell);
    ++f;
  }
  if (r != 0 || f != 8) throw FenError("FEN placement must describe 8 full ranks");

  // 2) Active color
  if (active == "w") p.set_side_to_move(Color::White);
  else if (active == "b") p.set_side_to_move(Color::Black);
  else throw FenError("Invalid active color in FEN");

  // 3) Castling rights
  CastlingRights cr{};
  if (castling != "-") {
    for (char cch : castling) {
      bool* right = nullptr;
      if (cch == 'K') right = &cr.white_kingside;
      else if (cch == 'Q') right = &cr.white_queenside;
      else if (cch == 'k') right = &cr.black_kingside;
      else if (cch == 'q') right = &cr.black_queenside;
      else throw FenError("Invalid castling char in FEN");
      if (*right) throw FenError(std::string("Repeated castling char in FEN: ") + cch);
      *right = true;
    }
  }
  p.set_castling(cr);

  // 4) En-passant square
  if (ep == "-") {
    p.set_en_passant(std::nullopt);
  } else {
    std::optional<Square> target;
    try {
      target = parse_square(ep);
    } catch (const std::invalid_argument&) {
      throw FenError("Invalid en-passant square in FEN: " + ep);
    }
    // the skipped square of a double push is always on rank 3 or 6
    if (target->rank() != Rank::Three && target->rank() != Rank::Six)
      throw FenError("En-passant square in FEN must be on rank 3 or 6: " + ep);
    p.set_en_passant(target);
  }

  // 5) Halfmove & 6) Fullmove clocks
  p.set_halfmove_clock(parse_counter(half, "halfmove clock"));
  const int fm = parse_counter(full, "fullmove number");
  if (fm < 1) throw FenError("Fullmove number in FEN must be >= 1");
  p.set_fullmove_number(fm);

  return p;
}

void set_from_fen(Position& p, std::string_view fen) {
  p = position_from_fen(fen);
}

std::string to_fen(const Position& p) {
  std::string out;

  // 1) Piece placement
  for (int r = 7; r >= 0; --r) {
    int empties = 0;
    for (File f : ALL_FILES) {
      const Cell c = p.at(Square(f, rank_from_index(r)));
      if (c == Cell::Empty) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += ascii_glyph(c);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  out += ' ';

  // 2) Active color
  out += (p.side_to_move() == Color::White ? 'w' : 'b');
  out += ' ';

  // 3) Castling
  const CastlingRights cr = p.castling();
  if (!cr.any()) out += '-';
  else {
    if (cr.white_kingside) out += 'K';
    if (cr.white_queenside) out += 'Q';
    if (cr.black_kingside) out += 'k';
    if (cr.black_queenside) out += 'q';
  }
  out += ' ';

  // 4) En-passant square
  if (const auto ep = p.en_passant()) out += square_name(*ep);
  else out += '-';
  out += ' ';

  // 5) Halfmove & 6) Fullmove
  out += std::to_string(p.halfmove_clock());
  out += ' ';
  out += std::to_string(p.fullmove_number());

  return out;
}

} // namespace rookery
