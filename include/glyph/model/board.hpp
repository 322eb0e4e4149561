#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/model_types.hpp"

namespace glyph::model {

// Piece-centric bitboards plus a square-centric lookup kept in sync.
class Board {
 public:
  Board() { clear(); }

  void clear() noexcept {
    for (auto& byColor : m_bb) byColor.fill(0);
    m_color_occ = {0, 0};
    m_all_occ = 0;
    m_piece_on.fill(0);
  }

  void setPiece(core::Square sq, bb::Piece p) noexcept {
    removePiece(sq);
    if (p.isNone()) return;

    const bb::Bitboard mask = bb::sq_bb(sq);
    const int ti = core::idx(p.type);
    const int c = bb::ci(p.color);
    m_bb[c][ti] |= mask;
    m_color_occ[c] |= mask;
    m_all_occ |= mask;
    m_piece_on[sq] = pack(p);
  }

  void removePiece(core::Square sq) noexcept {
    const std::uint8_t packed = m_piece_on[sq];
    if (!packed) return;

    const bb::Piece p = unpack(packed);
    const bb::Bitboard mask = ~bb::sq_bb(sq);
    m_bb[bb::ci(p.color)][core::idx(p.type)] &= mask;
    m_color_occ[bb::ci(p.color)] &= mask;
    m_all_occ &= mask;
    m_piece_on[sq] = 0;
  }

  // Moves whatever stands on 'from' to 'to', replacing any occupant of 'to'.
  void movePiece(core::Square from, core::Square to) noexcept {
    const auto p = getPiece(from);
    if (!p) return;
    removePiece(from);
    setPiece(to, *p);
  }

  [[nodiscard]] std::optional<bb::Piece> getPiece(core::Square sq) const noexcept {
    const std::uint8_t packed = m_piece_on[sq];
    if (!packed) return std::nullopt;
    return unpack(packed);
  }

  [[nodiscard]] bb::Bitboard getPieces(core::Color c) const noexcept {
    return m_color_occ[bb::ci(c)];
  }
  [[nodiscard]] bb::Bitboard getAllPieces() const noexcept { return m_all_occ; }

  [[nodiscard]] bb::Bitboard getPieces(core::Color c, core::PieceType t) const noexcept {
    if (t == core::PieceType::None) return 0;
    return m_bb[bb::ci(c)][core::idx(t)];
  }

  friend bool operator==(const Board& a, const Board& b) noexcept {
    return a.m_piece_on == b.m_piece_on;
  }

 private:
  // [color][type]
  std::array<std::array<bb::Bitboard, 6>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;

  // 0 = empty, else (type+1) | (color<<3)
  std::array<std::uint8_t, 64> m_piece_on{};

  static constexpr std::uint8_t pack(bb::Piece p) noexcept {
    return static_cast<std::uint8_t>((core::idx(p.type) + 1) | (bb::ci(p.color) << 3));
  }
  static constexpr bb::Piece unpack(std::uint8_t packed) noexcept {
    return bb::Piece{static_cast<core::PieceType>((packed & 0x7) - 1),
                     (packed >> 3) & 1u ? core::Color::Black : core::Color::White};
  }
};

}  // namespace glyph::model
