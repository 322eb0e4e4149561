#pragma once
#include "../chess_types.hpp"
#include "board.hpp"
#include "core/bitboard.hpp"

namespace glyph::model {

// ---------------- Attack queries ----------------

// Every piece of colour 'by' that attacks 'sq' given occupancy 'occ'. The occupant of 'sq'
// never blocks a ray towards itself. Pins are ignored.
inline bb::Bitboard attackersTo(const Board& b, core::Square sq, core::Color by,
                                bb::Bitboard occ) noexcept {
  const bb::Bitboard occ2 = occ & ~bb::sq_bb(sq);

  // A pawn of 'by' attacks sq from where a pawn of the other colour on sq would attack.
  bb::Bitboard atk = bb::pawn_attacks_from(~by, sq) & b.getPieces(by, core::PieceType::Pawn);
  atk |= bb::knight_attacks_from(sq) & b.getPieces(by, core::PieceType::Knight);
  atk |= bb::king_attacks_from(sq) & b.getPieces(by, core::PieceType::King);

  const bb::Bitboard q = b.getPieces(by, core::PieceType::Queen);
  const bb::Bitboard bq = b.getPieces(by, core::PieceType::Bishop) | q;
  if (bq) atk |= bb::bishop_attacks(sq, occ2) & bq;
  const bb::Bitboard rq = b.getPieces(by, core::PieceType::Rook) | q;
  if (rq) atk |= bb::rook_attacks(sq, occ2) & rq;

  return atk & occ;
}

inline bool attackedBy(const Board& b, core::Square sq, core::Color by, bb::Bitboard occ) noexcept {
  return attackersTo(b, sq, by, occ) != 0;
}

// Squares attacked by the piece standing on 'from' (empty if none).
inline bb::Bitboard attacksFrom(const Board& b, core::Square from) noexcept {
  const auto p = b.getPiece(from);
  if (!p) return 0;
  const bb::Bitboard occ = b.getAllPieces();
  switch (p->type) {
    case core::PieceType::Pawn:
      return bb::pawn_attacks_from(p->color, from);
    case core::PieceType::Knight:
      return bb::knight_attacks_from(from);
    case core::PieceType::Bishop:
      return bb::bishop_attacks(from, occ);
    case core::PieceType::Rook:
      return bb::rook_attacks(from, occ);
    case core::PieceType::Queen:
      return bb::queen_attacks(from, occ);
    case core::PieceType::King:
      return bb::king_attacks_from(from);
    default:
      return 0;
  }
}

}  // namespace glyph::model
