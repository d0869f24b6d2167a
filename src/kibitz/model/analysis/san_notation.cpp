#include "kibitz/model/analysis/san_notation.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "kibitz/model/chess_game.hpp"
#include "kibitz/model/uci_notation.hpp"

namespace kibitz::model::notation
{
  namespace
  {
    inline char fileChar(core::Square sq) { return char('a' + (int(sq) & 7)); }

    inline char pieceLetter(core::PieceType pt)
    {
      switch (pt)
      {
      case core::PieceType::Knight:
        return 'N';
      case core::PieceType::Bishop:
        return 'B';
      case core::PieceType::Rook:
        return 'R';
      case core::PieceType::Queen:
        return 'Q';
      case core::PieceType::King:
        return 'K';
      default:
        return '\0'; // pawn/none
      }
    }

    inline core::PieceType pieceFromLetter(char c)
    {
      switch (c)
      {
      case 'N':
        return core::PieceType::Knight;
      case 'B':
        return core::PieceType::Bishop;
      case 'R':
        return core::PieceType::Rook;
      case 'Q':
        return core::PieceType::Queen;
      case 'K':
        return core::PieceType::King;
      default:
        return core::PieceType::None;
      }
    }

    inline std::string trim(std::string_view v)
    {
      std::size_t a = 0, b = v.size();
      while (a < b && std::isspace((unsigned char)v[a]))
        ++a;
      while (b > a && std::isspace((unsigned char)v[b - 1]))
        --b;
      return std::string(v.substr(a, b - a));
    }

    inline std::string normalizeSan(std::string_view in)
    {
      std::string s = trim(in);

      // strip trailing annotations and check symbols
      while (!s.empty())
      {
        char c = s.back();
        if (c == '+' || c == '#' || c == '!' || c == '?')
          s.pop_back();
        else
          break;
      }

      if (s == "0-0")
        s = "O-O";
      if (s == "0-0-0")
        s = "O-O-O";
      return s;
    }

    // SAN broken into the parts a matcher needs.
    struct SanParts
    {
      core::PieceType piece = core::PieceType::Pawn;
      int fromFile = -1;
      int fromRank = -1;
      core::Square to = core::NO_SQUARE;
      core::PieceType promotion = core::PieceType::None;
    };

    bool splitSan(std::string_view s, SanParts &p)
    {
      if (s.empty())
        return false;

      std::size_t i = 0;
      if (const core::PieceType pt = pieceFromLetter(s[0]); pt != core::PieceType::None)
      {
        p.piece = pt;
        ++i;
      }

      // Promotion suffix: "=Q" or a bare trailing piece letter
      std::size_t end = s.size();
      if (end >= 2 && s[end - 2] == '=')
      {
        p.promotion = pieceFromLetter(s[end - 1]);
        if (p.promotion == core::PieceType::None || p.promotion == core::PieceType::King)
          return false;
        end -= 2;
      }
      else if (end >= 3 && pieceFromLetter(s[end - 1]) != core::PieceType::None &&
               std::isdigit((unsigned char)s[end - 2]))
      {
        p.promotion = pieceFromLetter(s[end - 1]);
        if (p.promotion == core::PieceType::King)
          return false;
        end -= 1;
      }
      if (p.promotion != core::PieceType::None && p.piece != core::PieceType::Pawn)
        return false;

      if (end < i + 2)
        return false;
      p.to = uci::stringToSquare(s.substr(end - 2, 2));
      if (p.to == core::NO_SQUARE)
        return false;

      // Disambiguation and capture marker between the piece letter and the target
      for (std::size_t k = i; k < end - 2; ++k)
      {
        const char c = s[k];
        if (c >= 'a' && c <= 'h' && p.fromFile < 0)
          p.fromFile = c - 'a';
        else if (c >= '1' && c <= '8' && p.fromRank < 0)
          p.fromRank = c - '1';
        else if (c == 'x' || c == ':' || c == '-')
          continue;
        else
          return false;
      }
      return true;
    }
  } // namespace

  std::string toSan(const model::Position &pos, const model::Move &mv)
  {
    model::ChessGame g(pos);
    const auto &legals = g.generateLegalMoves();

    bool legal = false;
    model::Move played{};
    for (const auto &m : legals)
      if (m == mv)
      {
        legal = true;
        played = m;
        break;
      }
    if (!legal)
      return "";

    const auto mover = g.getPiece(played.from());
    const core::PieceType pt = mover.type;
    const bool isPawn = (pt == core::PieceType::Pawn);
    const bool isCap = played.isCapture();

    std::string san;

    if (played.castle() != model::CastleSide::None)
    {
      san = (played.castle() == model::CastleSide::KingSide) ? "O-O" : "O-O-O";
    }
    else
    {
      // Piece letter (none for pawn)
      if (!isPawn)
        san.push_back(pieceLetter(pt));

      // Disambiguation for non-pawns
      if (!isPawn)
      {
        const int fromFile = int(played.from()) & 7;
        const int fromRank = int(played.from()) >> 3;

        bool competitors = false;
        bool anySameFile = false;
        bool anySameRank = false;
        for (const auto &m : legals)
        {
          if (m.to() != played.to() || m.from() == played.from())
            continue;
          const auto pc = g.getPiece(m.from());
          if (pc.type != pt)
            continue;
          competitors = true;
          if ((int(m.from()) & 7) == fromFile)
            anySameFile = true;
          if ((int(m.from()) >> 3) == fromRank)
            anySameRank = true;
        }

        if (competitors)
        {
          if (!anySameFile)
            san.push_back(char('a' + fromFile));
          else if (!anySameRank)
            san.push_back(char('1' + fromRank));
          else
          {
            san.push_back(char('a' + fromFile));
            san.push_back(char('1' + fromRank));
          }
        }
      }

      // Capture marker (pawn captures include origin file)
      if (isCap)
      {
        if (isPawn)
          san.push_back(fileChar(played.from()));
        san.push_back('x');
      }

      san += uci::squareToString(played.to());

      if (played.promotion() != core::PieceType::None)
      {
        san.push_back('=');
        san.push_back(pieceLetter(played.promotion()));
      }
    }

    // Check / mate suffix
    model::ChessGame after(pos);
    after.doMove(played);
    const core::Color stmNow = after.getGameState().sideToMove;
    if (after.isKingInCheck(stmNow))
    {
      const bool mate = after.generateLegalMoves().empty();
      san.push_back(mate ? '#' : '+');
    }

    return san;
  }

  bool fromSan(const model::Position &pos, std::string_view sanToken, model::Move &out)
  {
    const std::string tok = normalizeSan(sanToken);
    if (tok.empty())
      return false;

    model::ChessGame g(pos);
    const auto &legals = g.generateLegalMoves();

    // Coordinate fallback
    if (uci::isCoordinateShaped(tok))
    {
      core::Square from, to;
      core::PieceType promo;
      if (!uci::parseUciMove(tok, from, to, promo))
        return false;
      for (const auto &m : legals)
        if (m.from() == from && m.to() == to && m.promotion() == promo)
        {
          out = m;
          return true;
        }
      return false;
    }

    if (tok == "O-O" || tok == "O-O-O")
    {
      const auto side = (tok == "O-O") ? model::CastleSide::KingSide : model::CastleSide::QueenSide;
      for (const auto &m : legals)
        if (m.castle() == side)
        {
          out = m;
          return true;
        }
      return false;
    }

    SanParts parts;
    if (!splitSan(tok, parts))
      return false;

    int matches = 0;
    for (const auto &m : legals)
    {
      if (m.to() != parts.to || m.promotion() != parts.promotion)
        continue;
      if (m.castle() != model::CastleSide::None)
        continue;
      if (g.getPiece(m.from()).type != parts.piece)
        continue;
      if (parts.fromFile >= 0 && (int(m.from()) & 7) != parts.fromFile)
        continue;
      if (parts.fromRank >= 0 && (int(m.from()) >> 3) != parts.fromRank)
        continue;
      out = m;
      ++matches;
    }
    return matches == 1;
  }

} // namespace kibitz::model::notation
