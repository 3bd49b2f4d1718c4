#include "klotski/model/klotski_game.hpp"

#ifndef KLOTSKI_LOG
#define KLOTSKI_LOG 1
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string_view>

#include "klotski/model/board_codec.hpp"
#include "klotski/model/core/random.hpp"

namespace klotski::model {

namespace {

// Parses "(r,c)"; digits only, no spaces.
inline std::optional<core::Coord> parseCoord(std::string_view sv) noexcept {
  if (sv.size() < 5 || sv.front() != '(' || sv.back() != ')') return std::nullopt;
  sv = sv.substr(1, sv.size() - 2);
  const std::size_t comma = sv.find(',');
  if (comma == std::string_view::npos) return std::nullopt;

  // Board coordinates never need more than two digits.
  auto parseInt = [](std::string_view s, int& out) {
    if (s.empty() || s.size() > 2) return false;
    int val = 0;
    for (char c : s) {
      if (c < '0' || c > '9') return false;
      val = val * 10 + (c - '0');
    }
    out = val;
    return true;
  };

  core::Coord c;
  if (!parseInt(sv.substr(0, comma), c.row) || !parseInt(sv.substr(comma + 1), c.col))
    return std::nullopt;
  return c;
}

inline std::string coordText(core::Coord c) {
  return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}

}  // namespace

// ---------------- Public API ----------------

KlotskiGame::KlotskiGame() {
  m_legal_moves.reserve(4 * core::PIECE_COUNT);
  initialize();
}

KlotskiGame::KlotskiGame(const Variant& variant) {
  m_legal_moves.reserve(4 * core::PIECE_COUNT);
  initialize(variant);
}

void KlotskiGame::initialize(const Variant& variant) {
  m_board = Board(buildPieces(variant));
  m_blocked_id = variant.blockedId;
  m_variant_id = variant.id;
  m_move_count = 0;
  m_legal_moves.clear();
}

void KlotskiGame::initialize() {
  initialize(classicVariant());
}

bool KlotskiGame::initialize(int variantId) {
  const Variant* v = findVariant(variantId);
  if (!v) return false;
  initialize(*v);
  return true;
}

bool KlotskiGame::isLegalMove(core::Coord from, core::Coord to) const {
  return m_move_gen.isLegal(m_board, from, to);
}

bool KlotskiGame::applyAction(core::Coord from, core::Coord to) {
  if (!isLegalMove(from, to)) return false;

  Piece* piece = m_board.getPieceAt(from);
  const Move m{from, to};
  piece->setPosition(core::offset(piece->position(), m.delta()));
  ++m_move_count;
  return true;
}

std::optional<std::vector<core::Coord>> KlotskiGame::getLegalMovesForPiece(
    core::Coord cell) const {
  const Piece* piece = m_board.getPieceAt(cell);
  if (!piece) return std::nullopt;
  if (!core::inBounds(piece->position())) return std::nullopt;
  if (piece->id() == m_blocked_id) return std::nullopt;

  std::vector<core::Coord> out;
  out.reserve(core::DIRECTIONS.size());
  m_move_gen.generateForCell(m_board, cell, out);
  return out;
}

const std::vector<Move>& KlotskiGame::getLegalMovesByDirection(core::Direction dir) {
  m_legal_moves.clear();
  m_move_gen.generateByDirection(m_board, dir, m_legal_moves);
  return m_legal_moves;
}

const std::vector<Move>& KlotskiGame::getLegalMoves() {
  m_legal_moves.clear();
  m_move_gen.generateAll(m_board, m_legal_moves);
  return m_legal_moves;
}

const std::vector<Move>& KlotskiGame::getPlayableMoves() {
  m_legal_moves.clear();
  m_move_gen.generateAllExcept(m_board, m_blocked_id, m_legal_moves);
  return m_legal_moves;
}

std::vector<Move> KlotskiGame::getLegalMovesByDirection(core::Direction dir) const {
  std::vector<Move> out;
  m_move_gen.generateByDirection(m_board, dir, out);
  return out;
}

std::vector<Move> KlotskiGame::getLegalMoves() const {
  std::vector<Move> out;
  m_move_gen.generateAll(m_board, out);
  return out;
}

std::vector<Move> KlotskiGame::getPlayableMoves() const {
  std::vector<Move> out;
  m_move_gen.generateAllExcept(m_board, m_blocked_id, out);
  return out;
}

bool KlotskiGame::isTerminal() const {
  const Piece* piece = m_board.getPieceAtPrecise(core::WIN_CELL);
  return piece && piece->id() == core::PRIMARY_PIECE;
}

std::string KlotskiGame::toString() const {
  return boardToText(m_board);
}

bool KlotskiGame::fromString(std::string_view text, std::string* err) {
  const Piece* locked = m_board.findById(m_blocked_id);
  const core::Coord lockedAt = locked ? locked->position() : core::OFF_BOARD;

  if (!boardFromText(text, m_board, err)) return false;
  m_legal_moves.clear();

  // First fit may hand the locked cell to a twin of the blocked piece; give it back.
  Piece* blocked = m_board.findById(m_blocked_id);
  if (!blocked || lockedAt == core::OFF_BOARD || blocked->position() == lockedAt) return true;
  for (auto& twin : m_board.pieces()) {
    if (&twin == blocked || twin.position() != lockedAt) continue;
    if (twin.abbreviation() != blocked->abbreviation() || twin.width() != blocked->width() ||
        twin.height() != blocked->height())
      continue;
    twin.setPosition(blocked->position());
    blocked->setPosition(lockedAt);
    break;
  }
  return true;
}

void KlotskiGame::randomShuffle(std::int64_t seed) {
  random::SplitMix64 rng(static_cast<std::uint64_t>(seed));

  for (int i = 0; i < core::SHUFFLE_STEPS; ++i) {
    const auto& moves = getLegalMoves();
    if (moves.empty()) break;

    const Move m = moves[rng.nextIndex(moves.size())];
    applyAction(m.from, m.to);
  }

#if KLOTSKI_LOG
  std::cerr << "[KlotskiGame] Shuffled the game (seed=" << seed << "):\n" << toString();
#endif
}

void KlotskiGame::randomShuffle() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  randomShuffle(static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count()));
}

void KlotskiGame::setPieces(const std::vector<Piece>& pieces) {
  if (pieces.size() != m_board.pieceCount()) {
    throw std::invalid_argument(
        "Invalid pieces array. It must have the same length as the current one.");
  }
  for (std::size_t i = 0; i < pieces.size(); ++i) {
    if (!pieces[i].sameIdentity(m_board.piece(i))) {
      throw std::invalid_argument("Piece at index " + std::to_string(i) +
                                  " does not match the piece catalogue.");
    }
  }
  m_board.pieces() = pieces;
  m_legal_moves.clear();
}

std::string KlotskiGame::describeMove(const Move& m) const {
  const Piece* piece = m_board.getPieceAt(m.from);
  std::string out = "Move ";
  out.append(piece ? piece->name() : std::string("?"));
  out.append(" from ");
  out.append(coordText(m.from));
  out.append(" to ");
  out.append(coordText(m.to));
  return out;
}

std::optional<Move> parseMoveDescription(std::string_view text) {
  constexpr std::string_view kPrefix = "Move ";
  constexpr std::string_view kFrom = " from ";
  constexpr std::string_view kTo = " to ";

  if (text.substr(0, kPrefix.size()) != kPrefix) return std::nullopt;
  const std::size_t fromIdx = text.find(kFrom);
  if (fromIdx == std::string_view::npos) return std::nullopt;
  const std::size_t toIdx = text.find(kTo, fromIdx + kFrom.size());
  if (toIdx == std::string_view::npos) return std::nullopt;

  const auto from = parseCoord(text.substr(fromIdx + kFrom.size(), toIdx - fromIdx - kFrom.size()));
  const auto to = parseCoord(text.substr(toIdx + kTo.size()));
  if (!from || !to) return std::nullopt;
  return Move{*from, *to};
}

}  // namespace klotski::model
