#include "glyph/review/review_types.hpp"

namespace glyph::review
{
  const char *toString(ProblemKind k)
  {
    switch (k)
    {
    case ProblemKind::AllowsCheckmate:
      return "allows_checkmate";
    case ProblemKind::WalkedIntoCheck:
      return "walked_into_check";
    case ProblemKind::HangingPiece:
      return "hanging_piece";
    case ProblemKind::BadTrade:
      return "bad_trade";
    case ProblemKind::LeavesPieceHanging:
      return "leaves_piece_hanging";
    case ProblemKind::MissedCapture:
      return "missed_capture";
    }
    return "unknown";
  }

  const char *toString(MoveQuality q)
  {
    switch (q)
    {
    case MoveQuality::Brilliant:
      return "brilliant";
    case MoveQuality::Best:
      return "best";
    case MoveQuality::Excellent:
      return "excellent";
    case MoveQuality::Good:
      return "good";
    case MoveQuality::Book:
      return "book";
    case MoveQuality::Forced:
      return "forced";
    case MoveQuality::Miss:
      return "miss";
    case MoveQuality::Inaccuracy:
      return "inaccuracy";
    case MoveQuality::Mistake:
      return "mistake";
    case MoveQuality::Blunder:
      return "blunder";
    case MoveQuality::Unknown:
      return "unknown";
    }
    return "unknown";
  }
} // namespace glyph::review
