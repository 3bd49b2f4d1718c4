#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "klotski/engine/config.hpp"
#include "klotski/engine/hint_engine.hpp"
#include "klotski/model/klotski_game.hpp"
#include "klotski/model/move.hpp"

namespace klotski::app
{
  // One player's puzzle: the engine plus an undo/redo history. The history cursor is the
  // "Moves: N" counter shown to the player; the engine's own move count only grows.
  class GameSession
  {
  public:
    GameSession();
    explicit GameSession(const engine::SolverConfig &cfg);

    // Returns false (session unchanged) for an unknown variant id.
    bool start(int variantId);
    void restart();
    void shuffle(std::int64_t seed);
    void shuffle();

    bool play(core::Coord from, core::Coord to);
    bool play(const model::Move &m) { return play(m.from, m.to); }
    bool undo();
    bool redo();

    [[nodiscard]] std::size_t historyIndex() const noexcept { return m_history_index; }
    const std::vector<model::Move> &history() const noexcept { return m_history; }
    [[nodiscard]] bool canUndo() const noexcept { return m_history_index > 0; }
    [[nodiscard]] bool canRedo() const noexcept { return m_history_index < m_history.size(); }

    std::optional<model::Move> hint();
    // Plays the hint; false if there is none.
    bool autoStep();
    engine::SolveResult solve();

    bool saveToFile(const std::string &path, std::string *err = nullptr) const;
    bool loadFromFile(const std::string &path, std::string *err = nullptr);
    bool loadLevelFile(const std::string &path, std::string *err = nullptr);
    // Board snapshot given as text (same format as the files).
    bool loadSnapshot(std::string_view text, std::string *err = nullptr);

    std::string snapshot() const { return m_game.toString(); }
    [[nodiscard]] bool isSolved() const { return m_game.isTerminal(); }

    model::KlotskiGame &game() noexcept { return m_game; }
    const model::KlotskiGame &game() const noexcept { return m_game; }

    void setSolverConfig(const engine::SolverConfig &cfg) { m_hints.setConfig(cfg); }
    const engine::SolverConfig &getSolverConfig() const { return m_hints.getConfig(); }
    void setThinkMillis(int ms) noexcept { m_think_ms = ms; }
    [[nodiscard]] int getThinkMillis() const noexcept { return m_think_ms; }

  private:
    void clearHistory();

    model::KlotskiGame m_game;
    engine::HintEngine m_hints;
    int m_think_ms{engine::DEFAULT_THINK_MS};

    std::vector<model::Move> m_history;
    std::size_t m_history_index{0};
  };

} // namespace klotski::app
