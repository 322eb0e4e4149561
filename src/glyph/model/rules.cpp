#include "glyph/model/rules.hpp"

#include "glyph/model/move_generator.hpp"
#include "glyph/model/move_helper.hpp"

namespace glyph::model::rules
{
  namespace
  {
    inline char tolower_ascii(char c) noexcept
    {
      return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
    }

    inline int squareFromUci(std::string_view sq) noexcept
    {
      // expects "e2", returns 0..63 or -1
      if (sq.size() < 2)
        return -1;
      const int file = sq[0] - 'a';
      const int rank = sq[1] - '1';
      return (static_cast<unsigned>(file) < 8u && static_cast<unsigned>(rank) < 8u) ? (rank * 8 + file)
                                                                                    : -1;
    }
  } // namespace

  std::vector<Move> legalMoves(const Position &pos)
  {
    std::vector<Move> out;
    out.reserve(64);
    MoveGenerator{}.generateLegalMoves(pos, out);
    return out;
  }

  std::optional<Position> applyMove(const Position &pos, const Move &m)
  {
    for (const auto &legal : legalMoves(pos))
    {
      if (legal == m)
      {
        Position next = pos;
        if (!next.doMove(legal))
          return std::nullopt;
        return next;
      }
    }
    return std::nullopt;
  }

  bool isCheck(const Position &pos)
  {
    return pos.inCheck();
  }

  bool isCheckmate(const Position &pos)
  {
    return pos.inCheck() && legalMoves(pos).empty();
  }

  bool isStalemate(const Position &pos)
  {
    return !pos.inCheck() && legalMoves(pos).empty();
  }

  core::GameResult gameResult(const Position &pos)
  {
    if (!legalMoves(pos).empty())
      return core::GameResult::ONGOING;
    return pos.inCheck() ? core::GameResult::CHECKMATE : core::GameResult::STALEMATE;
  }

  bb::Bitboard attackers(const Position &pos, core::Square sq, core::Color side)
  {
    const Board &b = pos.getBoard();
    return attackersTo(b, sq, side, b.getAllPieces());
  }

  std::optional<bb::Piece> pieceAt(const Position &pos, core::Square sq)
  {
    if (!core::validSquare(sq))
      return std::nullopt;
    return pos.getBoard().getPiece(sq);
  }

  std::string squareName(core::Square sq)
  {
    if (!core::validSquare(sq))
      return "-";
    std::string s;
    s.push_back(static_cast<char>('a' + bb::file_of(sq)));
    s.push_back(static_cast<char>('1' + bb::rank_of(sq)));
    return s;
  }

  std::string pieceName(core::PieceType pt)
  {
    switch (pt)
    {
    case core::PieceType::Pawn:
      return "pawn";
    case core::PieceType::Knight:
      return "knight";
    case core::PieceType::Bishop:
      return "bishop";
    case core::PieceType::Rook:
      return "rook";
    case core::PieceType::Queen:
      return "queen";
    case core::PieceType::King:
      return "king";
    default:
      return "piece";
    }
  }

  std::string toUci(const Move &m)
  {
    std::string s = squareName(m.from()) + squareName(m.to());
    switch (m.promotion())
    {
    case core::PieceType::Queen:
      s.push_back('q');
      break;
    case core::PieceType::Rook:
      s.push_back('r');
      break;
    case core::PieceType::Bishop:
      s.push_back('b');
      break;
    case core::PieceType::Knight:
      s.push_back('n');
      break;
    default:
      break;
    }
    return s;
  }

  bool fromUci(const Position &pos, std::string_view uci, Move &out)
  {
    if (uci.size() < 4 || uci.size() > 5)
      return false;
    const int from = squareFromUci(uci.substr(0, 2));
    const int to = squareFromUci(uci.substr(2, 2));
    if (from < 0 || to < 0)
      return false;

    core::PieceType promo = core::PieceType::None;
    if (uci.size() == 5)
    {
      switch (tolower_ascii(uci[4]))
      {
      case 'q':
        promo = core::PieceType::Queen;
        break;
      case 'r':
        promo = core::PieceType::Rook;
        break;
      case 'b':
        promo = core::PieceType::Bishop;
        break;
      case 'n':
        promo = core::PieceType::Knight;
        break;
      default:
        return false;
      }
    }

    for (const auto &m : legalMoves(pos))
    {
      if (m.from() == from && m.to() == to && m.promotion() == promo)
      {
        out = m;
        return true;
      }
    }
    return false;
  }
} // namespace glyph::model::rules
