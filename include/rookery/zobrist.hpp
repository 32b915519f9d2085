#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include "rookery/piece.hpp"
#include "rookery/position.hpp"
#include "rookery/square.hpp"


namespace rookery {


// splitmix64 stream; fixed seed so keys are stable across runs
class KeyStream {
public:
explicit KeyStream(U64 seed) : state_(seed) {}

U64 next() {
state_ += 0x9e3779b97f4a7c15ULL;
U64 z = state_;
z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
return z ^ (z >> 31);
}

private:
U64 state_;
};


struct Zobrist {
// cell_on[cell][mailbox index]; rows for Empty/OffBoard and the sentinel
// columns stay zero, so XOR-ing them in is a no-op
std::array<std::array<U64, MAILBOX_SIZE>, CELL_N> cell_on{};
// castling rights: K, Q, k, q
std::array<U64, 4> castling{};
// en-passant file A..H (only meaningful when an EP square exists)
std::array<U64, 8> ep_file{};
U64 black_to_move{};


// Built once on first use, read-only afterwards
static const Zobrist& instance();
void init(U64 seed = 0x9E3779B97F4A7C15ULL);

U64 cell_key(Cell c, Square s) const {
return cell_on[static_cast<std::size_t>(c)][static_cast<std::size_t>(to_mailbox_index(s))];
}
};


// Full recomputation from the position; nothing is cached
U64 position_key(const Position& p);


} // namespace rookery
