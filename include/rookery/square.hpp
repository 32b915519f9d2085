#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace rookery {

enum class File : int { A = 0, B, C, D, E, F, G, H };
enum class Rank : int { One = 0, Two, Three, Four, Five, Six, Seven, Eight };

inline constexpr std::array<File, 8> ALL_FILES = {
  File::A, File::B, File::C, File::D, File::E, File::F, File::G, File::H };
inline constexpr std::array<Rank, 8> ALL_RANKS = {
  Rank::One, Rank::Two, Rank::Three, Rank::Four,
  Rank::Five, Rank::Six, Rank::Seven, Rank::Eight };

// 0-based ordinals; only the mailbox formula should need these
inline constexpr int file_index(File f) { return static_cast<int>(f); }
inline constexpr int rank_index(Rank r) { return static_cast<int>(r); }

// Throw std::out_of_range outside 0..7
File file_from_index(int i);
Rank rank_from_index(int i);

inline constexpr char file_to_char(File f) { return char('a' + file_index(f)); }
inline constexpr char rank_to_char(Rank r) { return char('1' + rank_index(r)); }

class Square {
public:
  constexpr Square(File f, Rank r) : file_(f), rank_(r) {}

  constexpr File file() const { return file_; }
  constexpr Rank rank() const { return rank_; }

  bool operator==(const Square&) const = default;

private:
  File file_;
  Rank rank_;
};

// "e4"
std::string square_name(Square s);

// Inverse of square_name. Throws std::invalid_argument on malformed text.
Square parse_square(std::string_view text);

// ---- 10x12 mailbox addressing ----
//
// Two sentinel rows above and below the board and one sentinel column on
// each side. Any knight, king or slider step from a playable square lands
// either on another playable square or on a sentinel inside [0, 120).
constexpr int MAILBOX_WIDTH = 10;
constexpr int MAILBOX_SIZE = 120;

inline constexpr int to_mailbox_index(Square s) {
  return (rank_index(s.rank()) + 2) * MAILBOX_WIDTH + (file_index(s.file()) + 1);
}

// Empty for sentinel cells and for anything outside [0, 120)
std::optional<Square> from_mailbox_index(int index);

// Direction offsets in mailbox units
inline constexpr std::array<int, 8> KNIGHT_OFFSETS = { -21, -19, -12, -8, 8, 12, 19, 21 };
inline constexpr std::array<int, 8> KING_OFFSETS   = { -11, -10, -9, -1, 1, 9, 10, 11 };
inline constexpr std::array<int, 4> ROOK_OFFSETS   = { -10, -1, 1, 10 };
inline constexpr std::array<int, 4> BISHOP_OFFSETS = { -11, -9, 9, 11 };

constexpr int WHITE_PAWN_PUSH = 10;
constexpr int BLACK_PAWN_PUSH = -10;
inline constexpr std::array<int, 2> WHITE_PAWN_CAPTURES = { 9, 11 };
inline constexpr std::array<int, 2> BLACK_PAWN_CAPTURES = { -9, -11 };

} // namespace rookery
