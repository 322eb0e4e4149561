#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "glyph/constants.hpp"
#include "glyph/model/analysis/san_notation.hpp"
#include "glyph/model/move.hpp"
#include "glyph/model/position.hpp"

// The rules oracle used by the review pipeline. Review code talks to chess rules only
// through these operations.
namespace glyph::model::rules
{
  std::vector<Move> legalMoves(const Position &pos);

  // Returns the position after 'm', or nothing if 'm' is not legal in 'pos'.
  std::optional<Position> applyMove(const Position &pos, const Move &m);

  bool isCheck(const Position &pos);
  bool isCheckmate(const Position &pos);
  bool isStalemate(const Position &pos);
  core::GameResult gameResult(const Position &pos);

  // Pieces of 'side' attacking 'sq' (pins ignored).
  bb::Bitboard attackers(const Position &pos, core::Square sq, core::Color side);

  std::optional<bb::Piece> pieceAt(const Position &pos, core::Square sq);
  std::string squareName(core::Square sq);
  std::string pieceName(core::PieceType pt);

  inline std::string fingerprint(const Position &pos) { return pos.fingerprint(); }

  std::string toUci(const Move &m);
  bool fromUci(const Position &pos, std::string_view uci, Move &out);

  using notation::fromSan;
  using notation::toSan;
} // namespace glyph::model::rules
