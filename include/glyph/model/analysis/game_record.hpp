#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "../move.hpp"

namespace glyph::model::analysis
{

  struct PlyRecord
  {
    model::Move move;
    std::string san; // as rendered from the position it was played in
  };

  struct GameRecord
  {
    std::unordered_map<std::string, std::string> tags;
    std::string startFen; // START_FEN unless a FEN tag says otherwise
    std::vector<PlyRecord> plies; // ply order
    std::string result{"*"};      // "1-0", "0-1", "1/2-1/2", "*"

    std::string tag(const std::string &key) const
    {
      auto it = tags.find(key);
      return it == tags.end() ? std::string{} : it->second;
    }
  };

} // namespace glyph::model::analysis
