#pragma once
#include <array>
#include <string_view>
#include <vector>

#include "../core/types.hpp"
#include "piece.hpp"

namespace klotski::model {

// Starting layout: one top-left per catalogue slot (OFF_BOARD for an absent piece)
// plus the piece the player may not move.
struct Variant {
  int id;
  std::string_view name;
  core::PieceId blockedId;
  std::array<core::Coord, core::PIECE_COUNT> positions;
};

inline constexpr int VARIANT_COUNT = 6;

extern const std::array<Variant, VARIANT_COUNT> VARIANTS;

const Variant& classicVariant() noexcept;

// nullptr if unknown.
const Variant* findVariant(int id) noexcept;
// Accepts the name ("enhanced-3") or the decimal id ("3").
const Variant* findVariant(std::string_view nameOrId) noexcept;

std::vector<Piece> buildPieces(const Variant& variant);

}  // namespace klotski::model
