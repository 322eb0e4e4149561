#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "glyph/chess_types.hpp"
#include "glyph/model/move.hpp"

namespace glyph::review
{
  // Malformed game input. Raised before any evaluation work starts.
  class ParseError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // The caller's stop flag fired while positions were being evaluated.
  class AnalysisCancelled : public std::runtime_error
  {
  public:
    AnalysisCancelled() : std::runtime_error("analysis cancelled") {}
  };

  // Engine verdict for one position. A null score means the evaluation failed.
  struct EvaluationRecord
  {
    std::optional<int> score; // centipawns, White POV
    std::optional<model::Move> bestMove;

    bool operator==(const EvaluationRecord &) const = default;
  };

  enum class ProblemKind
  {
    AllowsCheckmate,
    WalkedIntoCheck,
    HangingPiece,
    BadTrade,
    LeavesPieceHanging,
    MissedCapture
  };

  const char *toString(ProblemKind k);

  struct ProblemDiagnosis
  {
    ProblemKind kind{};
    std::string description;
    int materialLost = 0;
    bool offsetByCapture = false;
    core::Square square = core::NO_SQUARE; // the square the problem is about
    std::string culprit;                   // SAN of the mating reply or capturing move, if any
  };

  enum class MoveQuality
  {
    Brilliant,
    Best,
    Excellent,
    Good,
    Book,
    Forced,
    Miss,
    Inaccuracy,
    Mistake,
    Blunder,
    Unknown
  };

  const char *toString(MoveQuality q);

  struct AnalysisEntry
  {
    int ply = 0; // 1-based
    std::string san;
    MoveQuality quality = MoveQuality::Unknown;
    bool isBook = false;
    std::string comment;
    std::optional<double> evalAfter;  // pawns, White POV
    std::optional<double> evalBefore; // pawns, White POV
    std::optional<std::string> bestMoveSan; // only when it differs from the played move
    int centipawnLoss = 0;
    std::optional<ProblemKind> problem;
    core::Color side = core::Color::White;

    bool operator==(const AnalysisEntry &) const = default;
  };
} // namespace glyph::review
