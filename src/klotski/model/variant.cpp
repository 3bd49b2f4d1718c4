#include "klotski/model/variant.hpp"

namespace klotski::model {

namespace {

constexpr core::Coord OFF = core::OFF_BOARD;

}  // namespace

// Every enhanced layout leaves General 4 out and is solvable without touching its
// blocked piece.
const std::array<Variant, VARIANT_COUNT> VARIANTS{{
    {0,
     "classic",
     core::NO_PIECE,
     {{{0, 1}, {3, 1}, {0, 0}, {0, 3}, {2, 0}, {2, 3}, {4, 0}, {4, 1}, {4, 2}, {4, 3}}}},
    {1,
     "enhanced-1",
     9,
     {{{0, 1}, {3, 1}, {0, 0}, {0, 3}, {2, 0}, OFF, {4, 0}, {4, 1}, {4, 2}, {4, 3}}}},
    {2,
     "enhanced-2",
     2,
     {{{0, 1}, {3, 1}, {0, 0}, {0, 3}, {2, 0}, OFF, {4, 0}, {4, 1}, {4, 2}, {4, 3}}}},
    {3,
     "enhanced-3",
     3,
     {{{0, 1}, {2, 1}, {0, 0}, {0, 3}, {2, 0}, OFF, {3, 1}, {3, 2}, {4, 1}, {4, 2}}}},
    {4,
     "enhanced-4",
     8,
     {{{0, 1}, {3, 0}, {0, 0}, {0, 3}, {2, 3}, OFF, {2, 1}, {2, 2}, {4, 0}, {4, 1}}}},
    {5,
     "enhanced-5",
     4,
     {{{0, 1}, {2, 1}, {0, 0}, {0, 3}, {3, 0}, OFF, {2, 0}, {2, 3}, {3, 3}, {4, 3}}}},
}};

const Variant& classicVariant() noexcept {
  return VARIANTS[0];
}

const Variant* findVariant(int id) noexcept {
  for (const auto& v : VARIANTS)
    if (v.id == id) return &v;
  return nullptr;
}

const Variant* findVariant(std::string_view nameOrId) noexcept {
  for (const auto& v : VARIANTS)
    if (v.name == nameOrId) return &v;

  if (nameOrId.empty() || nameOrId.size() > 3) return nullptr;
  int id = 0;
  for (char c : nameOrId) {
    if (c < '0' || c > '9') return nullptr;
    id = id * 10 + (c - '0');
  }
  return findVariant(id);
}

std::vector<Piece> buildPieces(const Variant& variant) {
  std::vector<Piece> pieces;
  pieces.reserve(core::PIECE_COUNT);
  for (core::PieceId id = 0; id < core::PIECE_COUNT; ++id)
    pieces.push_back(Piece::fromCatalogue(id, variant.positions[static_cast<std::size_t>(id)]));
  return pieces;
}

}  // namespace klotski::model
