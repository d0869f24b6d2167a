#pragma once

#include <string>
#include <string_view>

#include "kibitz/chess_types.hpp"
#include "kibitz/model/move.hpp"

namespace kibitz::model::uci
{

  // Fast ASCII helpers
  inline char tolower_ascii(char c) noexcept
  {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
  }

  inline core::Square stringToSquare(std::string_view sv) noexcept
  {
    if (sv.size() < 2)
      return core::NO_SQUARE;
    const char f = sv[0];
    const char r = sv[1];
    if (f < 'a' || f > 'h' || r < '1' || r > '8')
      return core::NO_SQUARE;
    const std::uint8_t file = static_cast<std::uint8_t>(f - 'a');
    const std::uint8_t rank = static_cast<std::uint8_t>(r - '1');
    return static_cast<core::Square>(file + rank * 8);
  }

  inline std::string squareToString(core::Square sq)
  {
    std::string s;
    s.push_back(static_cast<char>('a' + (sq & 7)));
    s.push_back(static_cast<char>('1' + (sq >> 3)));
    return s;
  }

  inline core::PieceType promoFromChar(char c) noexcept
  {
    switch (tolower_ascii(c))
    {
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    default:
      return core::PieceType::None;
    }
  }

  inline char promoToChar(core::PieceType pt) noexcept
  {
    switch (pt)
    {
    case core::PieceType::Queen:
      return 'q';
    case core::PieceType::Rook:
      return 'r';
    case core::PieceType::Bishop:
      return 'b';
    case core::PieceType::Knight:
      return 'n';
    default:
      return '\0';
    }
  }

  inline std::string moveToUci(const Move &m)
  {
    std::string s = squareToString(m.from()) + squareToString(m.to());
    if (const char p = promoToChar(m.promotion()))
      s.push_back(p);
    return s;
  }

  // Coordinate shape only: [a-h][0-9][a-h][0-9][nbrq]?. Ranks 0 and 9 pass so that
  // an off-board coordinate is reported as an illegal move rather than a syntax error.
  inline bool isCoordinateShaped(std::string_view t) noexcept
  {
    if (t.size() != 4 && t.size() != 5)
      return false;
    auto in = [](char c, char lo, char hi)
    { return c >= lo && c <= hi; };
    if (!in(t[0], 'a', 'h') || !in(t[1], '0', '9') || !in(t[2], 'a', 'h') || !in(t[3], '0', '9'))
      return false;
    if (t.size() == 5 && promoFromChar(t[4]) == core::PieceType::None)
      return false;
    return true;
  }

  // Parses a coordinate move whose squares are on the board.
  inline bool parseUciMove(std::string_view t, core::Square &from, core::Square &to,
                           core::PieceType &promo) noexcept
  {
    if (!isCoordinateShaped(t))
      return false;
    from = stringToSquare(t.substr(0, 2));
    to = stringToSquare(t.substr(2, 2));
    if (from == core::NO_SQUARE || to == core::NO_SQUARE)
      return false;
    promo = (t.size() == 5) ? promoFromChar(t[4]) : core::PieceType::None;
    return true;
  }

} // namespace kibitz::model::uci
