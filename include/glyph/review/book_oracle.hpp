#pragma once
#include <string>
#include <unordered_map>

#include "glyph/model/analysis/opening_book.hpp"
#include "glyph/model/position.hpp"

namespace glyph::review
{
  // Per-game view of the opening book. Answers are memoized by fingerprint.
  class BookOracle
  {
  public:
    // 'book' may be null: every query then answers false (reported once).
    BookOracle(const model::analysis::OpeningBook *book, int plyLimit) : m_book(book), m_plyLimit(plyLimit) {}

    // 'ply' is 0-based; 'reached' is the position the move led to.
    bool isBookMove(int ply, const model::Position &reached);

    // Name of the opening line ending in 'reached', if any.
    const model::analysis::OpeningBook::Opening *openingAt(const model::Position &reached) const;

  private:
    const model::analysis::OpeningBook *m_book;
    int m_plyLimit;
    std::unordered_map<std::string, bool> m_memo;
    bool m_reported = false;
  };
} // namespace glyph::review
