#include "glyph/model/position.hpp"

#include <array>
#include <cctype>

#include "glyph/constants.hpp"
#include "glyph/model/move_helper.hpp"

namespace glyph::model {

namespace {

// Castling rights lost when a move touches these squares (from or to).
constexpr std::array<std::uint8_t, 64> CR_CLEAR = [] {
  std::array<std::uint8_t, 64> a{};
  a[bb::E1] |= bb::Castling::WK | bb::Castling::WQ;
  a[bb::E8] |= bb::Castling::BK | bb::Castling::BQ;
  a[bb::H1] |= bb::Castling::WK;
  a[bb::A1] |= bb::Castling::WQ;
  a[bb::H8] |= bb::Castling::BK;
  a[bb::A8] |= bb::Castling::BQ;
  return a;
}();

inline char tolower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
}

inline core::PieceType typeFromLetter(char lo) noexcept {
  switch (lo) {
    case 'k':
      return core::PieceType::King;
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    case 'p':
      return core::PieceType::Pawn;
    default:
      return core::PieceType::None;
  }
}

inline char letterFromType(core::PieceType t) noexcept {
  switch (t) {
    case core::PieceType::King:
      return 'k';
    case core::PieceType::Queen:
      return 'q';
    case core::PieceType::Rook:
      return 'r';
    case core::PieceType::Bishop:
      return 'b';
    case core::PieceType::Knight:
      return 'n';
    case core::PieceType::Pawn:
      return 'p';
    default:
      return '?';
  }
}

inline bool parseUnsigned(std::string_view sv, int& out) noexcept {
  if (sv.empty()) return false;
  int val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return false;
    val = val * 10 + (c - '0');
  }
  out = val;
  return true;
}

inline bool fail(std::string* err, const std::string& msg) {
  if (err) *err = msg;
  return false;
}

}  // namespace

Position Position::startpos() {
  Position p;
  fromFen(core::START_FEN, p);
  return p;
}

bool Position::fromFen(std::string_view fen, Position& out, std::string* err) {
  // Split into up to 6 fields.
  std::string_view fields[6]{};
  int count = 0;
  std::size_t i = 0;
  while (i < fen.size() && count < 6) {
    while (i < fen.size() && fen[i] == ' ') ++i;
    if (i >= fen.size()) break;
    const std::size_t start = i;
    while (i < fen.size() && fen[i] != ' ') ++i;
    fields[count++] = fen.substr(start, i - start);
  }
  if (count < 2) return fail(err, "FEN needs at least placement and side to move");

  Position p;
  p.m_board.clear();

  // Board placement
  int rank = 7, file = 0;
  for (char ch : fields[0]) {
    if (ch == '/') {
      if (file != 8 || rank == 0) return fail(err, "Malformed FEN placement");
      file = 0;
      --rank;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) return fail(err, "Malformed FEN placement");
      continue;
    }
    const char lo = tolower_ascii(ch);
    const core::PieceType type = typeFromLetter(lo);
    if (type == core::PieceType::None || file > 7)
      return fail(err, std::string("Bad FEN piece character: ") + ch);
    const core::Color col = (ch == lo) ? core::Color::Black : core::Color::White;
    p.m_board.setPiece(bb::make_square(file, rank), {type, col});
    ++file;
  }
  if (rank != 0 || file != 8) return fail(err, "FEN placement does not cover 8 ranks");

  for (auto c : {core::Color::White, core::Color::Black}) {
    if (bb::popcount(p.m_board.getPieces(c, core::PieceType::King)) != 1)
      return fail(err, "FEN must contain exactly one king per side");
  }

  // Active color
  if (fields[1] == "w")
    p.m_state.sideToMove = core::Color::White;
  else if (fields[1] == "b")
    p.m_state.sideToMove = core::Color::Black;
  else
    return fail(err, "Bad FEN side to move: " + std::string(fields[1]));

  // Castling rights
  std::uint8_t rights = 0;
  for (char c : fields[2]) {
    switch (c) {
      case 'K':
        rights |= bb::Castling::WK;
        break;
      case 'Q':
        rights |= bb::Castling::WQ;
        break;
      case 'k':
        rights |= bb::Castling::BK;
        break;
      case 'q':
        rights |= bb::Castling::BQ;
        break;
      case '-':
        break;
      default:
        return fail(err, "Bad FEN castling field: " + std::string(fields[2]));
    }
  }
  // Drop rights the placement cannot support.
  auto has = [&](core::Square s, core::PieceType t, core::Color c) {
    const auto pc = p.m_board.getPiece(s);
    return pc && pc->type == t && pc->color == c;
  };
  if (!has(bb::E1, core::PieceType::King, core::Color::White))
    rights &= ~(bb::Castling::WK | bb::Castling::WQ);
  if (!has(bb::E8, core::PieceType::King, core::Color::Black))
    rights &= ~(bb::Castling::BK | bb::Castling::BQ);
  if (!has(bb::H1, core::PieceType::Rook, core::Color::White)) rights &= ~bb::Castling::WK;
  if (!has(bb::A1, core::PieceType::Rook, core::Color::White)) rights &= ~bb::Castling::WQ;
  if (!has(bb::H8, core::PieceType::Rook, core::Color::Black)) rights &= ~bb::Castling::BK;
  if (!has(bb::A8, core::PieceType::Rook, core::Color::Black)) rights &= ~bb::Castling::BQ;
  p.m_state.castlingRights = rights;

  // En passant
  p.m_state.enPassantSquare = core::NO_SQUARE;
  const std::string_view ep = fields[3];
  if (ep.size() == 2 && ep[0] >= 'a' && ep[0] <= 'h' && (ep[1] == '3' || ep[1] == '6')) {
    p.m_state.enPassantSquare = bb::make_square(ep[0] - 'a', ep[1] - '1');
  } else if (!ep.empty() && ep != "-") {
    return fail(err, "Bad FEN en passant field: " + std::string(ep));
  }

  // Clocks are optional
  int hm = 0, fm = 1;
  if (count > 4 && !parseUnsigned(fields[4], hm)) return fail(err, "Bad FEN halfmove clock");
  if (count > 5 && !parseUnsigned(fields[5], fm)) return fail(err, "Bad FEN fullmove number");
  p.m_state.halfmoveClock = static_cast<std::uint16_t>(hm);
  p.m_state.fullmoveNumber = fm == 0 ? 1u : static_cast<std::uint32_t>(fm);

  // The side not to move must not be in check.
  const core::Color them = ~p.m_state.sideToMove;
  if (attackedBy(p.m_board, p.kingSquare(them), p.m_state.sideToMove, p.m_board.getAllPieces()))
    return fail(err, "Side not to move is in check");

  out = p;
  return true;
}

core::Square Position::kingSquare(core::Color c) const {
  const bb::Bitboard kbb = m_board.getPieces(c, core::PieceType::King);
  if (!kbb) return core::NO_SQUARE;
  return static_cast<core::Square>(bb::ctz64(kbb));
}

bool Position::inCheck() const {
  const core::Square ksq = kingSquare(m_state.sideToMove);
  if (ksq == core::NO_SQUARE) return false;
  return attackedBy(m_board, ksq, ~m_state.sideToMove, m_board.getAllPieces());
}

bool Position::epCapturable() const {
  const core::Square ep = m_state.enPassantSquare;
  if (ep == core::NO_SQUARE) return false;
  const core::Color stm = m_state.sideToMove;
  // Our pawns that attack the ep square stand where an enemy pawn on ep would attack.
  return (bb::pawn_attacks_from(~stm, ep) & m_board.getPieces(stm, core::PieceType::Pawn)) != 0;
}

// ================== Make ==================

bool Position::doMove(const Move& m) {
  if (m.from() == m.to()) return false;

  const core::Color us = m_state.sideToMove;
  const auto fromPiece = m_board.getPiece(m.from());
  if (!fromPiece || fromPiece->color != us) return false;
  const auto toPiece = m_board.getPiece(m.to());
  if (toPiece && (toPiece->color == us || toPiece->type == core::PieceType::King)) return false;

  if (m.promotion() != core::PieceType::None) {
    if (fromPiece->type != core::PieceType::Pawn) return false;
    const int toRank = bb::rank_of(m.to());
    const bool onPromoRank = (us == core::Color::White) ? (toRank == 7) : (toRank == 0);
    if (!onPromoRank) return false;
    switch (m.promotion()) {
      case core::PieceType::Knight:
      case core::PieceType::Bishop:
      case core::PieceType::Rook:
      case core::PieceType::Queen:
        break;
      default:
        return false;
    }
  }

  const Board savedBoard = m_board;
  const GameState savedState = m_state;

  applyMove(m);

  // Illegal if our own king is left attacked
  const core::Square ksq = kingSquare(us);
  if (ksq == core::NO_SQUARE || attackedBy(m_board, ksq, ~us, m_board.getAllPieces())) {
    m_board = savedBoard;
    m_state = savedState;
    return false;
  }
  return true;
}

void Position::applyMove(const Move& m) {
  const core::Color us = m_state.sideToMove;
  const core::Color them = ~us;
  const core::Square prevEP = m_state.enPassantSquare;
  m_state.enPassantSquare = core::NO_SQUARE;

  const auto fromPiece = m_board.getPiece(m.from());
  if (!fromPiece) return;
  const bool movingPawn = (fromPiece->type == core::PieceType::Pawn);

  // Castling is recognised from the king's two-square step as well as from the flag.
  bool isCastleMove = (m.castle() != CastleSide::None);
  if (!isCastleMove && fromPiece->type == core::PieceType::King) {
    const int df = static_cast<int>(m.to()) - static_cast<int>(m.from());
    isCastleMove = (df == 2 || df == -2);
  }

  bool isEP = m.isEnPassant();
  if (!isEP && movingPawn && m.to() == prevEP && bb::file_of(m.from()) != bb::file_of(m.to()) &&
      !m_board.getPiece(m.to()))
    isEP = true;

  bool captured = false;
  if (isEP) {
    const core::Square capSq = (us == core::Color::White) ? static_cast<core::Square>(m.to() - 8)
                                                          : static_cast<core::Square>(m.to() + 8);
    m_board.removePiece(capSq);
    captured = true;
  } else if (auto cap = m_board.getPiece(m.to()); cap && cap->color == them) {
    m_board.removePiece(m.to());
    captured = true;
  }

  bb::Piece placed = *fromPiece;
  if (m.promotion() != core::PieceType::None) placed.type = m.promotion();
  m_board.removePiece(m.from());
  m_board.setPiece(m.to(), placed);

  if (isCastleMove) {
    const bool kingSide = bb::file_of(m.to()) == 6;
    const int rank = bb::rank_of(m.from());
    const core::Square rookFrom = bb::make_square(kingSide ? 7 : 0, rank);
    const core::Square rookTo = bb::make_square(kingSide ? 5 : 3, rank);
    m_board.movePiece(rookFrom, rookTo);
  }

  // 50-move rule
  if (movingPawn || captured)
    m_state.halfmoveClock = 0;
  else
    ++m_state.halfmoveClock;

  // new EP square (double push)
  if (movingPawn) {
    const int dr = bb::rank_of(m.to()) - bb::rank_of(m.from());
    if (dr == 2 || dr == -2)
      m_state.enPassantSquare = static_cast<core::Square>((m.from() + m.to()) / 2);
  }

  m_state.castlingRights &= ~(CR_CLEAR[m.from()] | CR_CLEAR[m.to()]);

  m_state.sideToMove = them;
  if (them == core::Color::White) ++m_state.fullmoveNumber;
}

// ================== FEN ==================

std::string Position::toFen() const {
  std::string fen = fingerprint();
  // fingerprint() drops an en passant square nobody can use; FEN keeps it.
  if (m_state.enPassantSquare != core::NO_SQUARE && !epCapturable()) {
    fen.resize(fen.size() - 1);
    fen.push_back(static_cast<char>('a' + bb::file_of(m_state.enPassantSquare)));
    fen.push_back(static_cast<char>('1' + bb::rank_of(m_state.enPassantSquare)));
  }
  fen.push_back(' ');
  fen.append(std::to_string(m_state.halfmoveClock));
  fen.push_back(' ');
  fen.append(std::to_string(m_state.fullmoveNumber));
  return fen;
}

std::string Position::fingerprint() const {
  std::string fen;
  fen.reserve(90);

  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const auto piece = m_board.getPiece(bb::make_square(file, rank));
      if (!piece) {
        ++empty;
        continue;
      }
      if (empty) {
        fen.push_back(static_cast<char>('0' + empty));
        empty = 0;
      }
      char ch = letterFromType(piece->type);
      if (piece->color == core::Color::White) ch = static_cast<char>(std::toupper(ch));
      fen.push_back(ch);
    }
    if (empty) fen.push_back(static_cast<char>('0' + empty));
    if (rank) fen.push_back('/');
  }

  fen.push_back(' ');
  fen.push_back(m_state.sideToMove == core::Color::White ? 'w' : 'b');
  fen.push_back(' ');

  if (m_state.castlingRights) {
    if (m_state.castlingRights & bb::Castling::WK) fen.push_back('K');
    if (m_state.castlingRights & bb::Castling::WQ) fen.push_back('Q');
    if (m_state.castlingRights & bb::Castling::BK) fen.push_back('k');
    if (m_state.castlingRights & bb::Castling::BQ) fen.push_back('q');
  } else {
    fen.push_back('-');
  }
  fen.push_back(' ');

  if (epCapturable()) {
    fen.push_back(static_cast<char>('a' + bb::file_of(m_state.enPassantSquare)));
    fen.push_back(static_cast<char>('1' + bb::rank_of(m_state.enPassantSquare)));
  } else {
    fen.push_back('-');
  }
  return fen;
}

}  // namespace glyph::model
