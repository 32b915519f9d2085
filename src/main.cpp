#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "rookery/fen.hpp"
#include "rookery/position.hpp"
#include "rookery/render.hpp"
#include "rookery/zobrist.hpp"

using namespace rookery;

static void usage(std::ostream& os) {
  os <<
    "Rookery CLI\n"
    "Usage:\n"
    "  rookery_cli show [--color] [--ascii] [fen...]\n"
    "  rookery_cli lines [--ascii] [fen...]\n"
    "  rookery_cli fen [fen...]\n"
    "  rookery_cli key [fen...]\n"
    "If FEN omitted, uses startpos. With no command, shows startpos in color.\n"
    "Without --color, show prints FEN letters (white uppercase).\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static Position position_from_args(const std::vector<std::string>& a, size_t fenStart) {
  if (fenStart < a.size()) return position_from_fen(join_from(a, fenStart));
  return Position::standard_start();
}

// Consumes leading --color / --ascii flags, returns index of first non-flag
static size_t parse_flags(const std::vector<std::string>& a, size_t i, DiagramOptions& opt) {
  for (; i < a.size(); ++i) {
    if (a[i] == "--color")      opt.ansi_color = true;
    else if (a[i] == "--ascii") opt.style = GlyphStyle::Ascii;
    else break;
  }
  return i;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) {
    DiagramOptions opt;
    opt.ansi_color = true;
    std::cout << render_diagram(Position::standard_start(), opt);
    return 0;
  }

  const std::string cmd = args[0];

  try {
    // show [--color] [--ascii] [fen...]
    if (cmd == "show") {
      DiagramOptions opt;
      const size_t fenStart = parse_flags(args, 1, opt);
      std::cout << render_diagram(position_from_args(args, fenStart), opt);
      return 0;
    }

    // lines [--ascii] [fen...]
    if (cmd == "lines") {
      DiagramOptions opt;
      const size_t fenStart = parse_flags(args, 1, opt);
      for (const auto& line : render(position_from_args(args, fenStart), opt.style))
        std::cout << line << "\n";
      return 0;
    }

    // fen [fen...]
    if (cmd == "fen") {
      std::cout << to_fen(position_from_args(args, 1)) << "\n";
      return 0;
    }

    // key [fen...]
    if (cmd == "key") {
      const U64 key = position_key(position_from_args(args, 1));
      std::cout << "0x" << std::hex << std::setw(16) << std::setfill('0') << key << std::dec << "\n";
      return 0;
    }
  } catch (const FenError& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  usage(std::cerr);
  return 1;
}
