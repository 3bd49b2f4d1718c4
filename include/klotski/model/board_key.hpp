#pragma once
#include <cstdint>

#include "../core/types.hpp"
#include "board.hpp"

namespace klotski::model {

// 3 bits per cell, row-major, 60 bits in total. Equal for boards with equal text form,
// so same-class pieces are interchangeable under this key.
using BoardKey = std::uint64_t;

namespace detail {

[[nodiscard]] constexpr std::uint64_t cellCode(char abbreviation) noexcept {
  switch (abbreviation) {
    case 'C':
      return 1;
    case 'Y':
      return 2;
    case 'G':
      return 3;
    case 'S':
      return 4;
    default:
      return 0;
  }
}

}  // namespace detail

static_assert(core::CELL_COUNT * 3 <= 64, "board key must fit in 64 bits");

[[nodiscard]] inline BoardKey computeKey(const Board& b) noexcept {
  BoardKey key = 0;
  for (const auto& p : b.pieces()) {
    if (!p.isPresent()) continue;
    const std::uint64_t code = detail::cellCode(p.abbreviation());
    for (int r = 0; r < p.height(); ++r) {
      for (int c = 0; c < p.width(); ++c) {
        const core::Coord cell{p.row() + r, p.col() + c};
        if (!core::inBounds(cell)) continue;
        key |= code << (3 * core::cellIndex(cell));
      }
    }
  }
  return key;
}

}  // namespace klotski::model
