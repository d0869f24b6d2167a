#include "kibitz/model/fen.hpp"

#include <cctype>
#include <vector>

#include "kibitz/model/uci_notation.hpp"

namespace kibitz::model::fen {

namespace {

inline bool fail(std::string* err, const char* msg) {
  if (err) *err = msg;
  return false;
}

std::vector<std::string_view> splitFields(std::string_view sv) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    const std::size_t start = i;
    while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    if (i > start) out.push_back(sv.substr(start, i - start));
  }
  return out;
}

core::PieceType pieceFromChar(char lo) {
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

char pieceToChar(bb::Piece p) {
  char ch;
  switch (p.type) {
    case core::PieceType::King:
      ch = 'k';
      break;
    case core::PieceType::Queen:
      ch = 'q';
      break;
    case core::PieceType::Rook:
      ch = 'r';
      break;
    case core::PieceType::Bishop:
      ch = 'b';
      break;
    case core::PieceType::Knight:
      ch = 'n';
      break;
    case core::PieceType::Pawn:
      ch = 'p';
      break;
    default:
      ch = '?';
      break;
  }
  if (p.color == core::Color::White) ch = static_cast<char>(std::toupper(ch));
  return ch;
}

bool parseClock(std::string_view sv, int& out) {
  if (sv.empty() || sv.size() > 6) return false;
  int val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return false;
    val = val * 10 + (c - '0');
  }
  out = val;
  return true;
}

bool parsePlacement(std::string_view placement, Board& board, std::string* err) {
  int rank = 7, file = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (file != 8) return fail(err, "rank does not have 8 files");
      if (rank == 0) return fail(err, "more than 8 ranks");
      file = 0;
      --rank;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) return fail(err, "rank overflow");
      continue;
    }
    const char lo = uci::tolower_ascii(ch);
    const core::PieceType type = pieceFromChar(lo);
    if (type == core::PieceType::None) return fail(err, "bad piece character");
    if (file > 7) return fail(err, "rank overflow");
    const core::Color col = (ch == lo) ? core::Color::Black : core::Color::White;
    board.setPiece(bb::make_square(file, rank), {type, col});
    ++file;
  }
  if (rank != 0) return fail(err, "not 8 ranks");
  if (file != 8) return fail(err, "last rank does not have 8 files");
  return true;
}

// The en-passant field is only written when the capture is actually playable.
bool hasLegalEnPassant(const Position& pos) {
  const auto& st = pos.getState();
  if (st.enPassantSquare == core::NO_SQUARE) return false;
  const core::Color us = st.sideToMove;
  const core::Square victim = static_cast<core::Square>(
      us == core::Color::White ? st.enPassantSquare - 8 : st.enPassantSquare + 8);
  if (!(pos.getBoard().getPieces(~us, core::PieceType::Pawn) & bb::sq_bb(victim))) return false;
  bb::Bitboard attackers = bb::pawn_attacks_from(~us, st.enPassantSquare) &
                           pos.getBoard().getPieces(us, core::PieceType::Pawn);
  while (attackers) {
    const core::Square from = bb::pop_lsb(attackers);
    Position scratch = pos;
    if (scratch.doMove(Move{from, st.enPassantSquare, core::PieceType::None, true, true}))
      return true;
  }
  return false;
}

}  // namespace

bool parse(std::string_view fen, Position& out, std::string* err) {
  const auto fields = splitFields(fen);
  if (fields.size() < 4 || fields.size() > 6) return fail(err, "expected 4 to 6 fields");

  Position pos;
  Board& board = pos.getBoard();
  GameState& st = pos.getState();
  board.clear();

  if (!parsePlacement(fields[0], board, err)) return false;

  for (core::Color c : {core::Color::White, core::Color::Black}) {
    if (bb::popcount(board.getPieces(c, core::PieceType::King)) != 1)
      return fail(err, "each side needs exactly one king");
  }
  const bb::Bitboard pawns = board.getPieces(core::Color::White, core::PieceType::Pawn) |
                             board.getPieces(core::Color::Black, core::PieceType::Pawn);
  if (pawns & (bb::RANK_1 | bb::RANK_8)) return fail(err, "pawn on first or last rank");

  // Active color
  if (fields[1] == "w")
    st.sideToMove = core::Color::White;
  else if (fields[1] == "b")
    st.sideToMove = core::Color::Black;
  else
    return fail(err, "side to move must be w or b");

  // Castling rights
  std::uint8_t rights = 0;
  if (fields[2] != "-") {
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
        default:
          return fail(err, "bad castling field");
      }
    }
  }
  // Rights without their king and rook on the home squares are dropped.
  auto onSquare = [&](core::Color c, core::PieceType t, core::Square sq) {
    return (board.getPieces(c, t) & bb::sq_bb(sq)) != 0;
  };
  const bool whiteKingHome = onSquare(core::Color::White, core::PieceType::King, bb::make_square(4, 0));
  const bool blackKingHome = onSquare(core::Color::Black, core::PieceType::King, bb::make_square(4, 7));
  if (!whiteKingHome || !onSquare(core::Color::White, core::PieceType::Rook, bb::make_square(7, 0)))
    rights &= ~bb::Castling::WK;
  if (!whiteKingHome || !onSquare(core::Color::White, core::PieceType::Rook, bb::make_square(0, 0)))
    rights &= ~bb::Castling::WQ;
  if (!blackKingHome || !onSquare(core::Color::Black, core::PieceType::Rook, bb::make_square(7, 7)))
    rights &= ~bb::Castling::BK;
  if (!blackKingHome || !onSquare(core::Color::Black, core::PieceType::Rook, bb::make_square(0, 7)))
    rights &= ~bb::Castling::BQ;
  st.castlingRights = rights;

  // En passant
  if (fields[3] == "-") {
    st.enPassantSquare = core::NO_SQUARE;
  } else {
    const core::Square ep = fields[3].size() == 2 ? uci::stringToSquare(fields[3]) : core::NO_SQUARE;
    if (ep == core::NO_SQUARE) return fail(err, "bad en passant square");
    const int wantRank = st.sideToMove == core::Color::White ? 5 : 2;
    if (bb::rank_of(ep) != wantRank) return fail(err, "en passant square on wrong rank");
    st.enPassantSquare = ep;
  }

  // Clocks
  int hm = 0, fm = 1;
  if (fields.size() > 4 && !parseClock(fields[4], hm)) return fail(err, "bad halfmove clock");
  if (fields.size() > 5 && !parseClock(fields[5], fm)) return fail(err, "bad fullmove number");
  if (fm == 0) fm = 1;
  st.halfmoveClock = static_cast<std::uint16_t>(hm);
  st.fullmoveNumber = static_cast<std::uint32_t>(fm);

  if (pos.isKingAttacked(~st.sideToMove)) return fail(err, "side not to move is in check");

  out = pos;
  return true;
}

bool isValid(std::string_view fen, std::string* err) {
  Position scratch;
  return parse(fen, scratch, err);
}

std::string write(const Position& pos) {
  std::string fen;
  fen.reserve(100);
  const auto& board = pos.getBoard();

  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const auto piece = board.getPiece(bb::make_square(file, rank));
      if (piece.has_value()) {
        if (empty) {
          fen.push_back(static_cast<char>('0' + empty));
          empty = 0;
        }
        fen.push_back(pieceToChar(*piece));
      } else {
        ++empty;
      }
    }
    if (empty) fen.push_back(static_cast<char>('0' + empty));
    if (rank) fen.push_back('/');
  }

  const auto& st = pos.getState();
  fen.push_back(' ');
  fen.push_back(st.sideToMove == core::Color::White ? 'w' : 'b');
  fen.push_back(' ');

  if (st.castlingRights) {
    if (st.castlingRights & bb::Castling::WK) fen.push_back('K');
    if (st.castlingRights & bb::Castling::WQ) fen.push_back('Q');
    if (st.castlingRights & bb::Castling::BK) fen.push_back('k');
    if (st.castlingRights & bb::Castling::BQ) fen.push_back('q');
  } else {
    fen.push_back('-');
  }
  fen.push_back(' ');

  if (!hasLegalEnPassant(pos))
    fen += '-';
  else
    fen += uci::squareToString(st.enPassantSquare);
  fen.push_back(' ');
  fen.append(std::to_string(st.halfmoveClock));
  fen.push_back(' ');
  fen.append(std::to_string(st.fullmoveNumber));

  return fen;
}

}  // namespace kibitz::model::fen
