#pragma once
#include <cstdint>
#include <type_traits>

#include "core/model_types.hpp"

namespace glyph::model {

struct GameState {
  std::uint32_t fullmoveNumber = 1;
  std::uint16_t halfmoveClock = 0;
  std::uint8_t castlingRights =
      bb::Castling::WK | bb::Castling::WQ | bb::Castling::BK | bb::Castling::BQ;
  core::Color sideToMove = core::Color::White;
  core::Square enPassantSquare = core::NO_SQUARE;
};

static_assert(std::is_trivially_copyable_v<GameState>, "GameState should be POD");

}  // namespace glyph::model
