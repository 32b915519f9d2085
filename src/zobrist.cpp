#include "rookery/zobrist.hpp"
#include <cstddef>


namespace rookery {


const Zobrist& Zobrist::instance() {
static const Zobrist z = [] { Zobrist t; t.init(); return t; }();
return z;
}


void Zobrist::init(U64 seed) {
KeyStream keys(seed);
*this = Zobrist{};

for (int v = 0; v < CELL_N; ++v) {
const Cell c = static_cast<Cell>(v);
if (!is_piece(c)) continue;
auto& row = cell_on[static_cast<std::size_t>(v)];
for (Rank r : ALL_RANKS)
for (File f : ALL_FILES)
row[static_cast<std::size_t>(to_mailbox_index(Square(f, r)))] = keys.next();
}

for (auto& k : castling) k = keys.next();
for (auto& k : ep_file) k = keys.next();
black_to_move = keys.next();
}


U64 position_key(const Position& p) {
const auto& Z = Zobrist::instance();
U64 h = 0ULL;
for (Rank r : ALL_RANKS)
for (File f : ALL_FILES) {
const Square s(f, r);
h ^= Z.cell_key(p.at(s), s);
}

if (p.side_to_move() == Color::Black) h ^= Z.black_to_move;
const CastlingRights cr = p.castling();
if (cr.white_kingside)  h ^= Z.castling[0];
if (cr.white_queenside) h ^= Z.castling[1];
if (cr.black_kingside)  h ^= Z.castling[2];
if (cr.black_queenside) h ^= Z.castling[3];
if (const auto ep = p.en_passant())
h ^= Z.ep_file[static_cast<std::size_t>(file_index(ep->file()))];
return h;
}


} // namespace rookery
