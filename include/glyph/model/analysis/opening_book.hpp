#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace glyph::model::analysis
{
  // Known opening positions, keyed by position fingerprint.
  // - Built-in table of named main lines (every prefix of every line is "in book").
  // - Optional extension via TSV file.
  //
  // TSV format:
  //   B28<TAB>Sicilian Defense: O'Kelly Variation<TAB>e4 c5 Nf3 a6
  //
  class OpeningBook final
  {
  public:
    struct Opening
    {
      std::string eco;
      std::string name;
    };

    OpeningBook() = default;

    // Shared copy of the built-in lines, parsed on first use.
    static const OpeningBook &builtin();

    // Replays 'sanLine' from the standard start and indexes every position on the way.
    // The final position carries the opening name; later lines overwrite earlier names.
    bool addLine(std::string_view eco, std::string_view name, std::string_view sanLine,
                 std::string *err = nullptr);

    // Lines that fail to parse are reported through 'err' and skipped.
    // Returns false only if the file cannot be read or holds no valid line.
    bool loadFromTsvFile(const std::string &path, std::string *err = nullptr);

    bool contains(const std::string &fingerprint) const;

    // Name of the opening whose line ends in this position, or nullptr.
    const Opening *openingAt(const std::string &fingerprint) const;

    std::size_t size() const { return m_positions.size(); }

  private:
    // fingerprint -> index into m_openings, or -1 for an unnamed prefix position
    std::unordered_map<std::string, int> m_positions;
    std::vector<Opening> m_openings;
  };

} // namespace glyph::model::analysis
