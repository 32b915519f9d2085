#pragma once
#include <string>
#include <vector>
#include "rookery/position.hpp"

namespace rookery {

enum class GlyphStyle { Unicode, Ascii };

// One line per rank, rank 8 first. Each line is 8 space-separated cells:
// the piece glyph or "." for an empty square. Reads board contents only.
std::vector<std::string> render(const Position& p, GlyphStyle style = GlyphStyle::Unicode);

struct DiagramOptions {
  GlyphStyle style = GlyphStyle::Unicode; // only honoured with ansi_color
  bool ansi_color = false; // 24-bit background squares and piece colors
};

// Terminal diagram with rank labels on the left and a file footer
std::string render_diagram(const Position& p, const DiagramOptions& opt = {});

} // namespace rookery
