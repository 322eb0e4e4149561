#pragma once
#include <optional>
#include <string>

namespace glyph::engine {
// Settings for one external UCI engine instance used to score positions.
struct EvalEngineConfig {
  std::string path;              // engine executable
  int depth = 18;                // "go depth N"
  int threads = 1;               // one search thread per instance; parallelism comes from the pool
  int hashMb = 64;               // per instance
  std::optional<int> skillLevel; // Stockfish "Skill Level" 0..20
  std::optional<int> elo;        // UCI_LimitStrength + UCI_Elo
  int handshakeTimeoutMs = 10000;
  int searchTimeoutMs = 60000;   // per position
};
}  // namespace glyph::engine
