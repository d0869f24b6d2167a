#include "kibitz/engine/uci/uci_info.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace kibitz::engine::uci
{
  namespace
  {
    inline bool starts_with(const std::string &s, const char *pfx)
    {
      return s.rfind(pfx, 0) == 0;
    }

    inline std::vector<std::string> split_ws(const std::string &s)
    {
      std::vector<std::string> v;
      std::istringstream is(s);
      std::string t;
      while (is >> t)
        v.push_back(std::move(t));
      return v;
    }

    inline bool to_int(const std::string &s, int &out)
    {
      try
      {
        std::size_t used = 0;
        out = std::stoi(s, &used);
        return used == s.size();
      }
      catch (const std::exception &)
      {
        return false;
      }
    }

    bool isInfoKeyword(const std::string &t)
    {
      static const char *const kKeywords[] = {
          "depth", "seldepth", "time", "nodes", "pv", "multipv", "score", "currmove",
          "currmovenumber", "hashfull", "nps", "tbhits", "sbhits", "cpuload", "string",
          "refutation", "currline", "wdl"};
      return std::any_of(std::begin(kKeywords), std::end(kKeywords),
                         [&](const char *k)
                         { return t == k; });
    }
  } // namespace

  bool parseInfoLine(const std::string &line, UciInfo &out)
  {
    if (!starts_with(line, "info"))
      return false;
    const auto tok = split_ws(line);
    if (tok.empty() || tok[0] != "info")
      return false;

    out = UciInfo{};
    for (std::size_t i = 1; i < tok.size(); ++i)
    {
      const std::string &t = tok[i];
      int v = 0;
      if (t == "string")
        return false;
      if (t == "depth" && i + 1 < tok.size())
      {
        if (to_int(tok[i + 1], v))
          out.depth = v;
        ++i;
      }
      else if (t == "multipv" && i + 1 < tok.size())
      {
        if (to_int(tok[i + 1], v))
          out.multipv = std::max(1, v);
        ++i;
      }
      else if (t == "score" && i + 2 < tok.size())
      {
        if ((tok[i + 1] == "cp" || tok[i + 1] == "mate") && to_int(tok[i + 2], v))
          out.score = UciScore{tok[i + 1] == "mate", v};
        i += 2;
        while (i + 1 < tok.size() && (tok[i + 1] == "lowerbound" || tok[i + 1] == "upperbound"))
        {
          out.bound = true;
          ++i;
        }
      }
      else if (t == "pv")
      {
        out.hasPv = true;
        while (i + 1 < tok.size() && !isInfoKeyword(tok[i + 1]))
          out.pv.push_back(tok[++i]);
      }
    }
    return true;
  }

  bool parseBestmoveLine(const std::string &line, std::string &move)
  {
    if (!starts_with(line, "bestmove"))
      return false;
    std::istringstream is(line);
    std::string kw;
    is >> kw >> move;
    if (kw != "bestmove")
      return false;
    if (move == "(none)" || move == "0000")
      move.clear();
    return true;
  }

} // namespace kibitz::engine::uci
