#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  // fingerprint -> EvaluationRecord, written at most once per key. Safe for concurrent writers.
  class EvaluationCache
  {
  public:
    // Returns false (and keeps the existing record) if the key is already present.
    bool insert(const std::string &fingerprint, const EvaluationRecord &rec)
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      return m_records.emplace(fingerprint, rec).second;
    }

    std::optional<EvaluationRecord> find(const std::string &fingerprint) const
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      auto it = m_records.find(fingerprint);
      if (it == m_records.end())
        return std::nullopt;
      return it->second;
    }

    // Score only; empty if the position is missing or its evaluation failed.
    std::optional<int> score(const std::string &fingerprint) const
    {
      auto rec = find(fingerprint);
      return rec ? rec->score : std::nullopt;
    }

    std::size_t size() const
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      return m_records.size();
    }

  private:
    mutable std::mutex m_mtx;
    std::unordered_map<std::string, EvaluationRecord> m_records;
  };
} // namespace glyph::review
