#include "rookery/render.hpp"

#include <sstream>
#include <utility>

namespace rookery {

static inline std::string glyph(Cell c, GlyphStyle style) {
  if (style == GlyphStyle::Ascii) return std::string(1, ascii_glyph(c));
  return display_glyph(c);
}

// ---- ANSI truecolor helpers ----
static inline void ansi_bg(std::ostream& os, int r, int g, int b) {
  os << "\x1b[48;2;" << r << ';' << g << ';' << b << 'm';
}
static inline void ansi_fg_bold(std::ostream& os, int r, int g, int b) {
  os << "\x1b[1;38;2;" << r << ';' << g << ';' << b << 'm';
}
static inline void ansi_reset(std::ostream& os) { os << "\x1b[0m"; }

std::vector<std::string> render(const Position& p, GlyphStyle style) {
  std::vector<std::string> lines;
  lines.reserve(8);
  for (int r = 7; r >= 0; --r) {
    const Rank rank = rank_from_index(r);
    std::string line;
    for (File f : ALL_FILES) {
      if (f != File::A) line.push_back(' ');
      const Cell c = p.at(Square(f, rank));
      line += (c == Cell::Empty) ? std::string(".") : glyph(c, style);
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

std::string render_diagram(const Position& p, const DiagramOptions& opt) {
  std::ostringstream os;
  for (int r = 7; r >= 0; --r) {
    const Rank rank = rank_from_index(r);
    os << rank_to_char(rank) << ' ';

    for (File f : ALL_FILES) {
      const Cell c = p.at(Square(f, rank));
      // without color only the letter case tells the sides apart
      if (!opt.ansi_color) {
        os << ' ' << ascii_glyph(c) << ' ';
        continue;
      }

      const std::string content = (c == Cell::Empty) ? std::string(" ") : glyph(c, opt.style);
      const bool light = (file_index(f) + r) % 2 != 0;
      if (light) ansi_bg(os, 180, 180, 180);
      else       ansi_bg(os, 120, 120, 120);
      if (is_piece(c)) {
        if (color_of(c) == Color::White) ansi_fg_bold(os, 255, 255, 255);
        else                             ansi_fg_bold(os, 0, 0, 0);
      }
      os << ' ' << content << ' ';
      ansi_reset(os);
    }
    os << '\n';
  }

  os << "  ";
  for (File f : ALL_FILES) os << ' ' << file_to_char(f) << ' ';
  os << '\n';
  return os.str();
}

} // namespace rookery
