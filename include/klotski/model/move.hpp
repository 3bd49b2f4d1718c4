#pragma once
#include <type_traits>

#include "../core/types.hpp"

namespace klotski::model {

// One orthogonal single-cell step. `from` may be any cell of the moving piece;
// the piece's top-left is translated by the same delta.
struct Move {
  core::Coord from{};
  core::Coord to{};

  constexpr Move() noexcept = default;
  constexpr Move(core::Coord f, core::Coord t) noexcept : from(f), to(t) {}

  [[nodiscard]] constexpr core::Direction delta() const noexcept {
    return core::Direction{to.row - from.row, to.col - from.col};
  }

  // Exactly one orthogonal step (Manhattan distance 1).
  [[nodiscard]] constexpr bool isStep() const noexcept {
    const int dr = to.row - from.row;
    const int dc = to.col - from.col;
    return (dr == 0 && (dc == 1 || dc == -1)) || (dc == 0 && (dr == 1 || dr == -1));
  }

  [[nodiscard]] constexpr Move reversed() const noexcept { return Move{to, from}; }

  friend constexpr bool operator==(const Move& a, const Move& b) noexcept {
    return a.from == b.from && a.to == b.to;
  }
  friend constexpr bool operator!=(const Move& a, const Move& b) noexcept { return !(a == b); }
};

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");

}  // namespace klotski::model
