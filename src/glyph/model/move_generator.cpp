#include "glyph/model/move_generator.hpp"

#include <initializer_list>

#include "glyph/model/move_helper.hpp"
#include "glyph/model/position.hpp"

namespace glyph::model {

namespace {

constexpr core::PieceType PROMOS[4] = {core::PieceType::Queen, core::PieceType::Rook,
                                       core::PieceType::Bishop, core::PieceType::Knight};

inline void addPawnMove(std::vector<Move>& out, core::Square from, core::Square to, bool cap,
                        bool promo) {
  if (promo) {
    for (auto pt : PROMOS) out.emplace_back(from, to, pt, cap);
  } else {
    out.emplace_back(from, to, core::PieceType::None, cap);
  }
}

void genPawns(const Board& b, const GameState& st, std::vector<Move>& out) {
  const core::Color us = st.sideToMove;
  const core::Color them = ~us;
  const bool white = (us == core::Color::White);
  const bb::Bitboard occ = b.getAllPieces();
  const bb::Bitboard enemies = b.getPieces(them) & ~b.getPieces(them, core::PieceType::King);
  const int fwd = white ? 8 : -8;
  const int startRank = white ? 1 : 6;
  const int promoRank = white ? 7 : 0;

  bb::Bitboard pawns = b.getPieces(us, core::PieceType::Pawn);
  while (pawns) {
    const core::Square from = bb::pop_lsb(pawns);

    // Pushes
    const int one = from + fwd;
    if (one >= 0 && one < 64 && !(occ & bb::sq_bb(static_cast<core::Square>(one)))) {
      const auto to = static_cast<core::Square>(one);
      addPawnMove(out, from, to, false, bb::rank_of(to) == promoRank);
      const int two = one + fwd;
      if (bb::rank_of(from) == startRank && !(occ & bb::sq_bb(static_cast<core::Square>(two))))
        out.emplace_back(from, static_cast<core::Square>(two));
    }

    // Captures
    bb::Bitboard caps = bb::pawn_attacks_from(us, from) & enemies;
    while (caps) {
      const core::Square to = bb::pop_lsb(caps);
      addPawnMove(out, from, to, true, bb::rank_of(to) == promoRank);
    }

    // En passant
    if (st.enPassantSquare != core::NO_SQUARE &&
        (bb::pawn_attacks_from(us, from) & bb::sq_bb(st.enPassantSquare)))
      out.emplace_back(from, st.enPassantSquare, core::PieceType::None, true, true);
  }
}

void genPieces(const Board& b, const GameState& st, core::PieceType pt, std::vector<Move>& out) {
  const core::Color us = st.sideToMove;
  const core::Color them = ~us;
  const bb::Bitboard own = b.getPieces(us);
  const bb::Bitboard enemyKing = b.getPieces(them, core::PieceType::King);
  const bb::Bitboard enemies = b.getPieces(them);

  bb::Bitboard pieces = b.getPieces(us, pt);
  while (pieces) {
    const core::Square from = bb::pop_lsb(pieces);
    bb::Bitboard targets = attacksFrom(b, from) & ~own & ~enemyKing;
    while (targets) {
      const core::Square to = bb::pop_lsb(targets);
      out.emplace_back(from, to, core::PieceType::None, (enemies & bb::sq_bb(to)) != 0);
    }
  }
}

void genCastling(const Board& b, const GameState& st, std::vector<Move>& out) {
  const core::Color us = st.sideToMove;
  const core::Color them = ~us;
  const bb::Bitboard occ = b.getAllPieces();
  const bool white = (us == core::Color::White);
  const core::Square k = white ? bb::E1 : bb::E8;
  const std::uint8_t kingSide = white ? bb::Castling::WK : bb::Castling::BK;
  const std::uint8_t queenSide = white ? bb::Castling::WQ : bb::Castling::BQ;

  if (!(st.castlingRights & (kingSide | queenSide))) return;
  if (attackedBy(b, k, them, occ)) return;

  auto empty = [&](std::initializer_list<int> offs) {
    for (int o : offs)
      if (occ & bb::sq_bb(static_cast<core::Square>(k + o))) return false;
    return true;
  };
  auto safe = [&](std::initializer_list<int> offs) {
    for (int o : offs)
      if (attackedBy(b, static_cast<core::Square>(k + o), them, occ)) return false;
    return true;
  };

  if ((st.castlingRights & kingSide) && empty({1, 2}) && safe({1, 2}))
    out.emplace_back(k, static_cast<core::Square>(k + 2), core::PieceType::None, false, false,
                     CastleSide::KingSide);
  if ((st.castlingRights & queenSide) && empty({-1, -2, -3}) && safe({-1, -2}))
    out.emplace_back(k, static_cast<core::Square>(k - 2), core::PieceType::None, false, false,
                     CastleSide::QueenSide);
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Board& b, const GameState& st,
                                             std::vector<Move>& out) const {
  genPawns(b, st, out);
  genPieces(b, st, core::PieceType::Knight, out);
  genPieces(b, st, core::PieceType::Bishop, out);
  genPieces(b, st, core::PieceType::Rook, out);
  genPieces(b, st, core::PieceType::Queen, out);
  genPieces(b, st, core::PieceType::King, out);
  genCastling(b, st, out);
}

void MoveGenerator::generateLegalMoves(const Position& pos, std::vector<Move>& out) const {
  std::vector<Move> pseudo;
  pseudo.reserve(64);
  generatePseudoLegalMoves(pos.getBoard(), pos.getState(), pseudo);

  for (const auto& m : pseudo) {
    Position scratch = pos;
    if (scratch.doMove(m)) out.push_back(m);
  }
}

}  // namespace glyph::model
