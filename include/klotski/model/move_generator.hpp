#pragma once

#include <vector>

#include "../core/types.hpp"
#include "board.hpp"
#include "move.hpp"

namespace klotski::model {

class MoveGenerator {
 public:
  // Legality of translating the piece under `from` by (to - from): both cells in bounds,
  // a piece under `from`, one orthogonal step, translated rectangle in bounds and free.
  [[nodiscard]] bool isLegal(const Board& b, core::Coord from, core::Coord to) const noexcept;

  // Destinations reachable in one step from `cell`, in DIRECTIONS order.
  void generateForCell(const Board& b, core::Coord cell, std::vector<core::Coord>& out) const;

  // One candidate per piece (from its top-left) for a single fixed delta.
  void generateByDirection(const Board& b, core::Direction dir, std::vector<Move>& out) const;

  // Every legal single step, piece by piece, each piece in DIRECTIONS order.
  void generateAll(const Board& b, std::vector<Move>& out) const;

  // As generateAll(), skipping the piece with id `excluded`.
  void generateAllExcept(const Board& b, core::PieceId excluded, std::vector<Move>& out) const;
};

}  // namespace klotski::model
