#include "glyph/engine/uci/uci_info.hpp"

#include <cstdlib>
#include <sstream>

#include "glyph/constants.hpp"

namespace glyph::engine::uci {

namespace {

inline bool starts_with(const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; }

inline bool to_int(const std::string& s, int& out) {
  char* end = nullptr;
  const long v = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  out = static_cast<int>(v);
  return true;
}

inline std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> v;
  std::istringstream is(s);
  std::string t;
  while (is >> t) v.push_back(std::move(t));
  return v;
}

}  // namespace

bool parseInfoLine(const std::string& line, InfoLine& out) {
  out = InfoLine{};
  if (!starts_with(line, "info ")) return false;

  const auto tok = split_ws(line);
  for (size_t i = 1; i + 1 < tok.size(); ++i) {
    if (tok[i] == "depth") {
      if (!to_int(tok[i + 1], out.depth)) out.depth = -1;
    } else if (tok[i] == "score" && i + 2 < tok.size()) {
      int v = 0;
      if (!to_int(tok[i + 2], v)) continue;
      if (tok[i + 1] == "cp") {
        out.hasScore = true;
        out.value = v;
      } else if (tok[i + 1] == "mate") {
        out.hasScore = true;
        out.isMate = true;
        out.value = v;
      }
      if (i + 3 < tok.size() && (tok[i + 3] == "lowerbound" || tok[i + 3] == "upperbound"))
        out.isBound = true;
    } else if (tok[i] == "pv") {
      out.pvFirst = tok[i + 1];
      break;
    } else if (tok[i] == "string") {
      break;  // free text follows
    }
  }
  return true;
}

int mateToScore(int mateIn) {
  if (mateIn > 0) return core::MATE_SCORE - mateIn;
  // mate 0 and negative distances: the side to move is getting mated
  return -(core::MATE_SCORE - (-mateIn));
}

SearchResult summarizeSearch(const std::vector<std::string>& infoLines, const std::string& bestmoveLine) {
  SearchResult res;

  for (const auto& line : infoLines) {
    InfoLine info;
    if (!parseInfoLine(line, info) || !info.hasScore || info.isBound) continue;
    if (info.depth < res.depth) continue;
    res.depth = info.depth;
    res.score = info.isMate ? mateToScore(info.value) : info.value;
  }

  std::istringstream is(bestmoveLine);
  std::string kw, best;
  is >> kw >> best;
  if (kw == "bestmove" && !best.empty() && best != "(none)" && best != "0000") res.bestmove = best;
  return res;
}

}  // namespace glyph::engine::uci
