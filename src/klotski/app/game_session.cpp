#include "klotski/app/game_session.hpp"

#ifndef KLOTSKI_LOG
#define KLOTSKI_LOG 1
#endif

#include <fstream>
#include <iostream>
#include <sstream>


namespace klotski::app
{
  namespace
  {
    void report(std::string *err, const std::string &msg)
    {
#if KLOTSKI_LOG
      std::cerr << "[GameSession] " << msg << "\n";
#endif
      if (err)
        *err = msg;
    }
  } // namespace

  GameSession::GameSession() : GameSession(engine::SolverConfig{}) {}

  GameSession::GameSession(const engine::SolverConfig &cfg) : m_hints(cfg)
  {
    m_history.reserve(256);
  }

  void GameSession::clearHistory()
  {
    m_history.clear();
    m_history_index = 0;
  }

  bool GameSession::start(int variantId)
  {
    if (!m_game.initialize(variantId))
    {
      report(nullptr, "Unknown variant " + std::to_string(variantId));
      return false;
    }
    clearHistory();
    return true;
  }

  void GameSession::restart()
  {
    if (!m_game.initialize(m_game.getVariantId()))
      m_game.initialize();
    clearHistory();
  }

  void GameSession::shuffle(std::int64_t seed)
  {
    m_game.randomShuffle(seed);
    clearHistory();
  }

  void GameSession::shuffle()
  {
    m_game.randomShuffle();
    clearHistory();
  }

  bool GameSession::play(core::Coord from, core::Coord to)
  {
    // The blocked piece is locked for the player even though the engine would move it.
    const model::Piece *piece = m_game.getBoard().getPieceAt(from);
    if (!piece || piece->id() == m_game.getBlockedId())
      return false;
    if (!m_game.applyAction(from, to))
      return false;

    m_history.resize(m_history_index);
    m_history.emplace_back(from, to);
    ++m_history_index;
    return true;
  }

  bool GameSession::undo()
  {
    if (!canUndo())
      return false;
    const model::Move back = m_history[m_history_index - 1].reversed();
    if (!m_game.applyAction(back))
      return false;
    --m_history_index;
    return true;
  }

  bool GameSession::redo()
  {
    if (!canRedo())
      return false;
    if (!m_game.applyAction(m_history[m_history_index]))
      return false;
    ++m_history_index;
    return true;
  }

  std::optional<model::Move> GameSession::hint()
  {
    return m_hints.findHint(m_game, m_think_ms);
  }

  bool GameSession::autoStep()
  {
    const auto mv = hint();
    return mv && play(*mv);
  }

  engine::SolveResult GameSession::solve()
  {
    return m_hints.findSolution(m_game, m_think_ms);
  }

  bool GameSession::saveToFile(const std::string &path, std::string *err) const
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
      report(err, "Could not open '" + path + "' for writing.");
      return false;
    }
    out << m_game.toString();
    out.flush();
    if (!out)
    {
      report(err, "Could not write '" + path + "'.");
      return false;
    }
    return true;
  }

  bool GameSession::loadFromFile(const std::string &path, std::string *err)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
      report(err, "Could not open '" + path + "' for reading.");
      return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string perr;
    if (!loadSnapshot(ss.str(), &perr))
    {
      report(err, "Could not load '" + path + "': " + perr);
      return false;
    }
    return true;
  }

  bool GameSession::loadLevelFile(const std::string &path, std::string *err)
  {
    return loadFromFile(path, err);
  }

  bool GameSession::loadSnapshot(std::string_view text, std::string *err)
  {
    if (!m_game.fromString(text, err))
      return false;
    clearHistory();
    return true;
  }

} // namespace klotski::app
