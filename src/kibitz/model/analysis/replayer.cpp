#include "kibitz/model/analysis/replayer.hpp"

#include <iostream>

#include "kibitz/model/analysis/san_notation.hpp"
#include "kibitz/model/uci_notation.hpp"

namespace kibitz::model::analysis
{
  namespace
  {
    std::string illegalMoveText(std::string_view token)
    {
      std::string_view t = token;
      while (!t.empty() && (t.back() == '+' || t.back() == '#' || t.back() == '!' || t.back() == '?'))
        t.remove_suffix(1);
      if (uci::isCoordinateShaped(t))
        return std::string(t);
      return std::string(token);
    }
  } // namespace

  bool PositionReplayer::reset(const std::string &startFen, std::string *err)
  {
    m_ply = 0;
    return m_game.setPosition(startFen, err);
  }

  bool PositionReplayer::apply(const RecordedMove &rec, ReplayedPly &out, IllegalMoveInfo &illegal)
  {
    const int ply = m_ply + 1;

    model::Move mv;
    const bool resolved = model::notation::fromSan(m_game.getPosition(), rec.token, mv);
    if (!resolved)
    {
      illegal.ply = ply;
      illegal.uci = illegalMoveText(rec.token);
      illegal.fenBefore = m_game.getFen();
#if KIBITZ_LOG
      std::cerr << "[Replay] illegal move at ply " << ply << ": " << rec.token << " in "
                << illegal.fenBefore << "\n";
#endif
      return false;
    }

    // SAN depends on the board context, so take it before moving
    std::string san = model::notation::toSan(m_game.getPosition(), mv);

    if (!m_game.doMove(mv))
    {
      illegal.ply = ply;
      illegal.uci = uci::moveToUci(mv);
      illegal.fenBefore = m_game.getFen();
      return false;
    }

    m_ply = ply;
    out.ply = ply;
    out.move = mv;
    out.uci = uci::moveToUci(mv);
    out.san = std::move(san);
    out.fenAfter = m_game.getFen();
    return true;
  }

} // namespace kibitz::model::analysis
