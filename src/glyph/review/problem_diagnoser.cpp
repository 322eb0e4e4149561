#include "glyph/review/problem_diagnoser.hpp"

#include "glyph/model/core/bitboard.hpp"
#include "glyph/model/rules.hpp"
#include "glyph/review/material.hpp"

namespace glyph::review
{
  namespace
  {
    namespace rules = model::rules;

    // SAN of the legal move from 'from' to 'to' in 'pos', if there is one.
    std::string sanOf(const model::Position &pos, core::Square from, core::Square to)
    {
      for (const auto &mv : rules::legalMoves(pos))
        if (mv.from() == from && mv.to() == to)
          return rules::toSan(pos, mv);
      return {};
    }

    std::optional<ProblemDiagnosis> allowsCheckmate(const model::Position &after)
    {
      for (const auto &reply : rules::legalMoves(after))
      {
        const auto next = rules::applyMove(after, reply);
        if (!next || !rules::isCheckmate(*next))
          continue;
        ProblemDiagnosis d;
        d.kind = ProblemKind::AllowsCheckmate;
        d.culprit = rules::toSan(after, reply);
        d.square = reply.to();
        d.description = "This allows checkmate with " + d.culprit + ".";
        return d;
      }
      return std::nullopt;
    }

    std::optional<ProblemDiagnosis> walkedIntoCheck(const model::Position &after, core::Color us)
    {
      const core::Square ksq = after.kingSquare(us);
      model::bb::Bitboard checkers = rules::attackers(after, ksq, ~us);
      if (!checkers)
        return std::nullopt;

      const core::Square from = model::bb::pop_lsb(checkers);
      ProblemDiagnosis d;
      d.kind = ProblemKind::WalkedIntoCheck;
      d.square = from;
      d.description = "The king walks into check from the " + describePiece(after, from) + ".";
      return d;
    }

    std::optional<ProblemDiagnosis> hangingPiece(const model::Position &before, const model::Move &m,
                                                 const model::Position &after)
    {
      if (!hangsMovedPiece(before, m, after))
        return std::nullopt;

      const int moved = movedValue(before, m);
      const int captured = capturedValue(before, m);
      const SquareControl c = squareControl(after, m.to(), before.sideToMove());

      ProblemDiagnosis d;
      d.kind = ProblemKind::HangingPiece;
      d.square = m.to();
      d.materialLost = moved - captured;
      d.offsetByCapture = captured > 0;
      d.culprit = sanOf(after, c.minAttackerSq, m.to());
      d.description = "The " + describePiece(after, m.to()) + " is left hanging";
      if (d.offsetByCapture)
        d.description += "; the capture only wins back " + std::to_string(captured);
      d.description += " (net loss " + std::to_string(d.materialLost) + ").";
      return d;
    }

    std::optional<ProblemDiagnosis> badTrade(const model::Position &before, const model::Move &m,
                                             const model::Position &after)
    {
      const int moved = movedValue(before, m);
      const SquareControl c = squareControl(after, m.to(), before.sideToMove());
      if (!c.attackers || !c.defenders || c.minAttacker >= moved)
        return std::nullopt;

      // what we took is already in hand when the cheaper piece recaptures
      const int net = moved - c.minAttacker - capturedValue(before, m);
      if (net < 2)
        return std::nullopt;

      ProblemDiagnosis d;
      d.kind = ProblemKind::BadTrade;
      d.square = m.to();
      d.materialLost = net;
      d.offsetByCapture = capturedValue(before, m) > 0;
      d.culprit = sanOf(after, c.minAttackerSq, m.to());
      d.description = "The " + describePiece(after, m.to()) + " can be taken by the " +
                      describePiece(after, c.minAttackerSq) + "; recapturing still loses " +
                      std::to_string(d.materialLost) + ".";
      return d;
    }

    std::optional<ProblemDiagnosis> leavesPieceHanging(const model::Position &before, const model::Move &m,
                                                       const model::Position &after)
    {
      const core::Color us = before.sideToMove();
      std::optional<ProblemDiagnosis> worst;

      model::bb::Bitboard own = after.getBoard().getPieces(us);
      while (own)
      {
        const core::Square s = model::bb::pop_lsb(own);
        if (s == m.to() || s == m.from())
          continue;
        const auto p = rules::pieceAt(after, s);
        if (!p || p->type == core::PieceType::King)
          continue;
        const int v = core::materialValue(p->type);
        if (v < 3)
          continue;

        // must be the same piece, untouched by the move (castling rook moves)
        const auto was = rules::pieceAt(before, s);
        if (!was || !(*was == *p))
          continue;

        if (!rules::attackers(before, s, us))
          continue;
        const SquareControl now = squareControl(after, s, us);
        if (!now.attackers || now.defenders)
          continue;

        if (!worst || v > worst->materialLost)
        {
          ProblemDiagnosis d;
          d.kind = ProblemKind::LeavesPieceHanging;
          d.square = s;
          d.materialLost = v;
          d.culprit = sanOf(after, now.minAttackerSq, s);
          d.description = "This leaves the " + describePiece(after, s) + " undefended and under attack.";
          worst = std::move(d);
        }
      }
      return worst;
    }

    std::optional<ProblemDiagnosis> missedCapture(const model::Position &before, const model::Move &m)
    {
      const core::Color us = before.sideToMove();
      const int captured = capturedValue(before, m);

      std::optional<ProblemDiagnosis> best;
      for (const auto &alt : rules::legalMoves(before))
      {
        if (alt.from() != m.from() || alt == m || !alt.isCapture())
          continue;
        const int v = capturedValue(before, alt);
        const core::Square target =
            alt.isEnPassant() ? model::bb::make_square(model::bb::file_of(alt.to()), model::bb::rank_of(alt.from()))
                              : alt.to();
        if (v <= captured || rules::attackers(before, target, ~us))
          continue;
        if (best && v - captured <= best->materialLost)
          continue;

        ProblemDiagnosis d;
        d.kind = ProblemKind::MissedCapture;
        d.square = target;
        d.materialLost = v - captured;
        d.culprit = rules::toSan(before, alt);
        d.description = "Missed a free " + describePiece(before, target) + " with " + d.culprit + ".";
        best = std::move(d);
      }
      return best;
    }
  } // namespace

  std::optional<ProblemDiagnosis> diagnose(const model::Position &before, const model::Move &m,
                                           const model::Position &after)
  {
    if (auto d = allowsCheckmate(after))
      return d;
    if (auto d = walkedIntoCheck(after, before.sideToMove()))
      return d;
    if (auto d = hangingPiece(before, m, after))
      return d;
    if (auto d = badTrade(before, m, after))
      return d;
    if (auto d = leavesPieceHanging(before, m, after))
      return d;
    if (auto d = missedCapture(before, m))
      return d;
    return std::nullopt;
  }
} // namespace glyph::review
