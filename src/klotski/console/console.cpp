#include "klotski/console/console.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "klotski/constants.hpp"
#include "klotski/model/variant.hpp"

namespace klotski {

static std::vector<std::string> split_ws(const std::string& s) {
  std::istringstream iss(s);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static bool to_bool(std::string v) {
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return (unsigned char)std::tolower(c); });
  return (v == "true" || v == "1" || v == "on" || v == "yes");
}

static std::string join_tokens(const std::vector<std::string>& t, size_t from, size_t to_excl) {
  std::ostringstream oss;
  for (size_t i = from; i < to_excl; ++i) {
    if (oss.tellp() > 0) oss << ' ';
    oss << t[i];
  }
  return oss.str();
}

// "r c" tokens starting at `i`; std::stoi throws on garbage.
static core::Coord parse_coord(const std::vector<std::string>& t, size_t i) {
  return core::Coord{std::stoi(t.at(i)), std::stoi(t.at(i + 1))};
}

static std::string coord_text(core::Coord c) {
  return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}

Console::Console(const Options& opts) : m_options(opts) {
  m_session.setSolverConfig(m_options.cfg);
  m_session.setThinkMillis(m_options.thinkMillis);
}

void Console::showHelp(std::ostream& out) const {
  out << "commands:\n"
      << "  board | moves [r c] | move fr fc tr tc | undo | redo\n"
      << "  hint | auto | solve | restart | shuffle [seed] | variant <name|id>\n"
      << "  position <20 cells> | save <path> | load <path>\n"
      << "  setoption name <Max States|Think Time|Verbose> value <v> | quit\n";
  out << "variants:";
  for (const auto& v : model::VARIANTS) out << ' ' << v.id << '=' << v.name;
  out << "\n";
}

void Console::showOptions(std::ostream& out) const {
  const auto& c = m_options.cfg;
  out << "option name Max States type spin default " << c.maxStates << " min 0 max 100000000\n";
  out << "option name Think Time type spin default " << m_options.thinkMillis
      << " min 0 max 3600000\n";
  out << "option name Verbose type check default " << (c.verbose ? "true" : "false") << "\n";
}

void Console::setOption(const std::string& line, std::ostream& out) {
  auto tokens = split_ws(line);
  std::string name;
  std::string value;

  // setoption name <id> [value <x>]
  for (size_t i = 1; i < tokens.size(); ++i) {
    if (tokens[i] == "name") {
      size_t j = i + 1;
      std::ostringstream n;
      while (j < tokens.size() && tokens[j] != "value") {
        if (n.tellp() > 0) n << ' ';
        n << tokens[j++];
      }
      name = n.str();
      i = j - 1;
    } else if (tokens[i] == "value") {
      value = join_tokens(tokens, i + 1, tokens.size());
      break;
    }
  }
  if (name.empty()) {
    showOptions(out);
    return;
  }

  try {
    if (name == "Max States") {
      if (value.empty()) return;
      std::uint64_t v = std::stoull(value);
      if (v > 100000000ULL) v = 100000000ULL;
      m_options.cfg.maxStates = v;
    } else if (name == "Think Time") {
      if (value.empty()) return;
      int v = std::stoi(value);
      m_options.thinkMillis = std::max(0, std::min(3600000, v));
    } else if (name == "Verbose") {
      m_options.cfg.verbose = to_bool(value);
    } else {
      out << "unknown option " << name << "\n";
      return;
    }
  } catch (const std::logic_error&) {
    out << "invalid value for " << name << "\n";
    return;
  }

  m_session.setSolverConfig(m_options.cfg);
  m_session.setThinkMillis(m_options.thinkMillis);
}

void Console::printBoard(std::ostream& out) const {
  const auto& game = m_session.game();
  out << game.toString();
  out << "Moves: " << m_session.historyIndex();
  const model::Variant* v = model::findVariant(game.getVariantId());
  if (v) out << "  Variant: " << v->name;
  if (game.getBlockedId() != core::NO_PIECE)
    out << "  Blocked: " << model::PIECE_CATALOGUE[static_cast<size_t>(game.getBlockedId())].name;
  out << "\n";
}

void Console::announceIfSolved(std::ostream& out) const {
  if (m_session.isSolved())
    out << "solved in " << m_session.historyIndex() << " moves\n";
}

int Console::run(std::istream& in, std::ostream& out) {
  std::string line;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;

    auto tokens = split_ws(line);
    if (tokens.empty()) continue;

    const std::string& cmd = tokens[0];

    if (cmd == "quit" || cmd == "exit") break;

    if (cmd == "help") {
      out << core::KLOTSKI_VERSION << "\n";
      showHelp(out);
      continue;
    }

    if (cmd == "setoption") {
      setOption(line, out);
      continue;
    }

    if (cmd == "board") {
      printBoard(out);
      continue;
    }

    if (cmd == "variant") {
      const model::Variant* v =
          tokens.size() > 1 ? model::findVariant(std::string_view(tokens[1])) : nullptr;
      if (!v || !m_session.start(v->id)) {
        out << "unknown variant\n";
        continue;
      }
      printBoard(out);
      continue;
    }

    if (cmd == "restart") {
      m_session.restart();
      printBoard(out);
      continue;
    }

    if (cmd == "shuffle") {
      if (tokens.size() > 1) {
        try {
          m_session.shuffle(static_cast<std::int64_t>(std::stoll(tokens[1])));
        } catch (const std::logic_error&) {
          out << "invalid seed\n";
          continue;
        }
      } else {
        m_session.shuffle();
      }
      printBoard(out);
      continue;
    }

    if (cmd == "moves") {
      auto& game = m_session.game();
      if (tokens.size() >= 3) {
        core::Coord cell;
        try {
          cell = parse_coord(tokens, 1);
        } catch (const std::logic_error&) {
          out << "usage: moves <r> <c>\n";
          continue;
        }
        const auto dests = game.getLegalMovesForPiece(cell);
        if (!dests) {
          out << "none\n";
        } else if (dests->empty()) {
          out << "stuck\n";
        } else {
          bool first = true;
          for (const auto& d : *dests) {
            if (!first) out << ' ';
            first = false;
            out << coord_text(d);
          }
          out << "\n";
        }
        continue;
      }
      const auto& moves = game.getPlayableMoves();
      for (const auto& m : moves) out << game.describeMove(m) << "\n";
      out << moves.size() << " moves\n";
      continue;
    }

    if (cmd == "move") {
      model::Move m;
      try {
        m = model::Move{parse_coord(tokens, 1), parse_coord(tokens, 3)};
      } catch (const std::logic_error&) {
        out << "usage: move <fr> <fc> <tr> <tc>\n";
        continue;
      }
      if (!m_session.play(m)) {
        out << "illegal move\n";
        continue;
      }
      printBoard(out);
      announceIfSolved(out);
      continue;
    }

    if (cmd == "undo") {
      out << (m_session.undo() ? "ok" : "nothing to undo") << "\n";
      continue;
    }

    if (cmd == "redo") {
      out << (m_session.redo() ? "ok" : "nothing to redo") << "\n";
      continue;
    }

    if (cmd == "hint") {
      const auto mv = m_session.hint();
      if (mv)
        out << "hint " << m_session.game().describeMove(*mv) << "\n";
      else
        out << "no hint\n";
      continue;
    }

    if (cmd == "auto") {
      if (!m_session.autoStep()) {
        out << "no hint\n";
        continue;
      }
      printBoard(out);
      announceIfSolved(out);
      continue;
    }

    if (cmd == "solve") {
      const auto res = m_session.solve();
      if (!res.path) {
        out << "no solution";
        if (res.stats.stopped) out << " (stopped)";
        if (res.stats.limitReached) out << " (state limit)";
        out << "\n";
        continue;
      }
      out << "solution " << res.path->size() << " moves\n";
      model::KlotskiGame replay = m_session.game();
      for (const auto& m : *res.path) {
        out << replay.describeMove(m) << "\n";
        replay.applyAction(m);
      }
      continue;
    }

    if (cmd == "position") {
      // Cells in row-major order; rows are rebuilt every BOARD_WIDTH tokens.
      std::string text;
      for (size_t i = 1; i < tokens.size(); ++i) {
        text += tokens[i];
        text += ((i % core::BOARD_WIDTH) == 0) ? '\n' : ' ';
      }
      std::string err;
      if (!m_session.loadSnapshot(text, &err)) {
        out << "error: " << err << "\n";
        continue;
      }
      printBoard(out);
      continue;
    }

    if (cmd == "save" || cmd == "load") {
      if (tokens.size() < 2) {
        out << "usage: " << cmd << " <path>\n";
        continue;
      }
      const std::string path = join_tokens(tokens, 1, tokens.size());
      std::string err;
      const bool ok = (cmd == "save") ? m_session.saveToFile(path, &err)
                                      : m_session.loadFromFile(path, &err);
      if (!ok) {
        out << "error: " << err << "\n";
        continue;
      }
      out << "ok\n";
      continue;
    }

    out << "unknown command: " << cmd << "\n";
  }

  out.flush();
  return 0;
}

}  // namespace klotski
