#include "glyph/review/book_oracle.hpp"

#include <exception>

#include "glyph/log.hpp"

namespace glyph::review
{
  bool BookOracle::isBookMove(int ply, const model::Position &reached)
  {
    if (ply < 0 || ply >= m_plyLimit)
      return false;
    if (!m_book)
    {
      if (!m_reported)
        log::warn("BookOracle", "no opening book available, book detection disabled");
      m_reported = true;
      return false;
    }

    std::string fp = reached.fingerprint();
    auto it = m_memo.find(fp);
    if (it != m_memo.end())
      return it->second;

    bool hit = false;
    try
    {
      hit = m_book->contains(fp);
    }
    catch (const std::exception &e)
    {
      if (!m_reported)
        log::warn("BookOracle", std::string("book lookup failed: ") + e.what());
      m_reported = true;
    }
    m_memo.emplace(std::move(fp), hit);
    return hit;
  }

  const model::analysis::OpeningBook::Opening *BookOracle::openingAt(const model::Position &reached) const
  {
    return m_book ? m_book->openingAt(reached.fingerprint()) : nullptr;
  }
} // namespace glyph::review
