#include "klotski/model/move_generator.hpp"

namespace klotski::model {

bool MoveGenerator::isLegal(const Board& b, core::Coord from, core::Coord to) const noexcept {
  if (!core::inBounds(from) || !core::inBounds(to)) return false;

  const Piece* piece = b.getPieceAt(from);
  if (!piece) return false;

  const Move m{from, to};
  if (!m.isStep()) return false;

  const core::Coord target = core::offset(piece->position(), m.delta());
  if (!Board::fits(target, piece->width(), piece->height())) return false;

  return !b.collides(*piece, target);
}

void MoveGenerator::generateForCell(const Board& b, core::Coord cell,
                                    std::vector<core::Coord>& out) const {
  for (const auto& dir : core::DIRECTIONS) {
    const core::Coord to = core::offset(cell, dir);
    if (isLegal(b, cell, to)) out.push_back(to);
  }
}

void MoveGenerator::generateByDirection(const Board& b, core::Direction dir,
                                        std::vector<Move>& out) const {
  for (const auto& p : b.pieces()) {
    const core::Coord from = p.position();
    const core::Coord to = core::offset(from, dir);
    if (isLegal(b, from, to)) out.emplace_back(from, to);
  }
}

void MoveGenerator::generateAll(const Board& b, std::vector<Move>& out) const {
  generateAllExcept(b, core::NO_PIECE, out);
}

void MoveGenerator::generateAllExcept(const Board& b, core::PieceId excluded,
                                      std::vector<Move>& out) const {
  for (const auto& p : b.pieces()) {
    if (excluded != core::NO_PIECE && p.id() == excluded) continue;
    const core::Coord from = p.position();
    for (const auto& dir : core::DIRECTIONS) {
      const core::Coord to = core::offset(from, dir);
      if (isLegal(b, from, to)) out.emplace_back(from, to);
    }
  }
}

}  // namespace klotski::model
