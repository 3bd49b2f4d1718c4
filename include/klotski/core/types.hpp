#pragma once
#include <array>
#include <cstdint>

#if defined(_MSC_VER)
#define KLOTSKI_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define KLOTSKI_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define KLOTSKI_ALWAYS_INLINE inline
#endif

namespace klotski::core {

constexpr int BOARD_WIDTH = 4;
constexpr int BOARD_HEIGHT = 5;
constexpr int CELL_COUNT = BOARD_WIDTH * BOARD_HEIGHT;

using PieceId = int;
constexpr PieceId NO_PIECE = -1;
constexpr PieceId PRIMARY_PIECE = 0;
constexpr int PIECE_COUNT = 10;

struct Coord {
  int row = 0;
  int col = 0;

  friend constexpr bool operator==(const Coord& a, const Coord& b) noexcept {
    return a.row == b.row && a.col == b.col;
  }
  friend constexpr bool operator!=(const Coord& a, const Coord& b) noexcept { return !(a == b); }
};

// Top-left of an absent piece.
constexpr Coord OFF_BOARD{-1, -1};
constexpr Coord WIN_CELL{3, 1};

struct Direction {
  int dRow = 0;
  int dCol = 0;

  friend constexpr bool operator==(const Direction& a, const Direction& b) noexcept {
    return a.dRow == b.dRow && a.dCol == b.dCol;
  }
};

constexpr Direction UP{-1, 0};
constexpr Direction DOWN{1, 0};
constexpr Direction LEFT{0, -1};
constexpr Direction RIGHT{0, 1};

// Enumeration order of every move list.
constexpr std::array<Direction, 4> DIRECTIONS{UP, DOWN, LEFT, RIGHT};

[[nodiscard]] KLOTSKI_ALWAYS_INLINE constexpr bool inBounds(Coord c) noexcept {
  return c.row >= 0 && c.row < BOARD_HEIGHT && c.col >= 0 && c.col < BOARD_WIDTH;
}

[[nodiscard]] KLOTSKI_ALWAYS_INLINE constexpr Coord offset(Coord c, Direction d) noexcept {
  return Coord{c.row + d.dRow, c.col + d.dCol};
}

[[nodiscard]] KLOTSKI_ALWAYS_INLINE constexpr int cellIndex(Coord c) noexcept {
  // Caller responsibility: c must be in bounds.
  return c.row * BOARD_WIDTH + c.col;
}

[[nodiscard]] KLOTSKI_ALWAYS_INLINE constexpr Coord cellCoord(int index) noexcept {
  return Coord{index / BOARD_WIDTH, index % BOARD_WIDTH};
}

}  // namespace klotski::core
