#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "rookery/position.hpp"

namespace rookery {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

inline constexpr char STARTPOS_FEN[] =
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// Both throw FenError; set_from_fen leaves p untouched on failure.
void set_from_fen(Position& p, std::string_view fen);
Position position_from_fen(std::string_view fen);

std::string to_fen(const Position& p);

} // namespace rookery
