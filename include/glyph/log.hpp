#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <string_view>

namespace glyph::log {

enum class Level : int { Quiet = 0, Normal = 1, Verbose = 2 };

namespace detail {
inline std::atomic<int>& level_ref() {
  static std::atomic<int> lvl{static_cast<int>(Level::Normal)};
  return lvl;
}
inline std::mutex& out_mutex() {
  static std::mutex mu;
  return mu;
}
inline void write(std::string_view tag, std::string_view msg) {
  std::lock_guard<std::mutex> lk(out_mutex());
  std::cerr << '[' << tag << "] " << msg << '\n';
}
}  // namespace detail

inline void set_level(Level l) { detail::level_ref().store(static_cast<int>(l)); }
inline Level level() { return static_cast<Level>(detail::level_ref().load()); }

// Progress and detail lines, shown with --verbose.
inline void info(std::string_view tag, std::string_view msg) {
  if (level() >= Level::Verbose) detail::write(tag, msg);
}

// Degraded results (failed evaluations, missing book). Silenced by --quiet.
inline void warn(std::string_view tag, std::string_view msg) {
  if (level() >= Level::Normal) detail::write(tag, msg);
}

}  // namespace glyph::log
