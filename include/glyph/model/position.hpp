#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace glyph::model {

// A board snapshot with its side to move, castling rights and en-passant state.
// Positions are values: applying a move to a copy leaves the original untouched.
class Position {
 public:
  Position() = default;

  static bool fromFen(std::string_view fen, Position& out, std::string* err = nullptr);
  static Position startpos();

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  [[nodiscard]] core::Color sideToMove() const noexcept { return m_state.sideToMove; }

  // Applies m if it is pseudo-legal in shape and does not leave the mover's king attacked.
  // On failure the position is left unchanged.
  bool doMove(const Move& m);

  bool inCheck() const;
  core::Square kingSquare(core::Color c) const;

  std::string toFen() const;
  // Placement, side, castling and en passant (only when a capture is possible). Clocks ignored.
  std::string fingerprint() const;

  // True if the side to move has a pawn that could capture en passant right now.
  bool epCapturable() const;

 private:
  Board m_board;
  GameState m_state;

  void applyMove(const Move& m);
};

}  // namespace glyph::model
