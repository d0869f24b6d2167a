#include "kibitz/model/analysis/pgn_reader.hpp"

#include <cctype>
#include <string>
#include <vector>

#include "kibitz/constants.hpp"
#include "kibitz/model/fen.hpp"
#include "kibitz/model/uci_notation.hpp"

namespace kibitz::model::analysis
{
  namespace
  {
    bool fail(std::string *err, std::string msg)
    {
      if (err)
        *err = std::move(msg);
      return false;
    }

    bool isValidUtf8(std::string_view s)
    {
      std::size_t i = 0;
      while (i < s.size())
      {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        if (c < 0x80)
          len = 1;
        else if (c >= 0xC2 && c <= 0xDF)
          len = 2;
        else if (c >= 0xE0 && c <= 0xEF)
          len = 3;
        else if (c >= 0xF0 && c <= 0xF4)
          len = 4;
        else
          return false;

        if (i + len > s.size())
          return false;
        for (std::size_t k = 1; k < len; ++k)
          if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
            return false;

        // overlong three-byte forms, surrogates, and code points above U+10FFFF
        if (len == 3)
        {
          const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
          if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 > 0x9F))
            return false;
        }
        if (len == 4)
        {
          const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
          if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F))
            return false;
        }
        i += len;
      }
      return true;
    }

    inline bool isBlank(std::string_view s)
    {
      for (char c : s)
        if (!std::isspace(static_cast<unsigned char>(c)))
          return false;
      return true;
    }

    inline void skipSpace(std::string_view s, std::size_t &i)
    {
      while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
        ++i;
    }

    // Reads [Key "Value"] pairs at the top. On success `i` points at the movetext.
    bool parseTags(std::string_view pgn, std::size_t &i, GameRecord &out, std::string *err)
    {
      while (true)
      {
        skipSpace(pgn, i);
        // escape lines
        if (i < pgn.size() && pgn[i] == '%' && (i == 0 || pgn[i - 1] == '\n'))
        {
          while (i < pgn.size() && pgn[i] != '\n')
            ++i;
          continue;
        }
        if (i >= pgn.size() || pgn[i] != '[')
          return true;

        ++i;
        skipSpace(pgn, i);
        const std::size_t keyStart = i;
        while (i < pgn.size() &&
               (std::isalnum(static_cast<unsigned char>(pgn[i])) || pgn[i] == '_' || pgn[i] == '+'))
          ++i;
        if (i == keyStart)
          return fail(err, "malformed tag pair: missing name");
        std::string key(pgn.substr(keyStart, i - keyStart));

        skipSpace(pgn, i);
        if (i >= pgn.size())
          return fail(err, "unterminated tag pair [" + key);
        if (pgn[i] != '"')
          return fail(err, "malformed tag pair [" + key + "]: value must be quoted");
        ++i;

        std::string val;
        bool closed = false;
        while (i < pgn.size())
        {
          const char c = pgn[i++];
          if (c == '\\' && i < pgn.size() && (pgn[i] == '"' || pgn[i] == '\\'))
          {
            val.push_back(pgn[i++]);
            continue;
          }
          if (c == '"')
          {
            closed = true;
            break;
          }
          if (c == '\n')
            break;
          val.push_back(c);
        }
        if (!closed)
          return fail(err, "unterminated tag value in [" + key);

        skipSpace(pgn, i);
        if (i >= pgn.size() || pgn[i] != ']')
          return fail(err, "unterminated tag pair [" + key);
        ++i;

        out.tags[key] = val;
      }
    }

    // Removes {...} comments, ';' to end of line, and (...) variations, checking balance.
    bool stripCommentsAndVariations(std::string &s, std::string *err)
    {
      std::string out;
      out.reserve(s.size());

      bool brace = false;
      int paren = 0;
      bool lineComment = false;

      for (char c : s)
      {
        if (lineComment)
        {
          if (c == '\n' || c == '\r')
            lineComment = false;
          else
            continue;
        }

        if (brace)
        {
          if (c == '}')
            brace = false;
          continue;
        }

        if (c == ';')
        {
          lineComment = true;
          continue;
        }
        if (c == '{')
        {
          brace = true;
          continue;
        }
        if (c == '}')
          return fail(err, "unbalanced '}' in movetext");
        if (c == '(')
        {
          ++paren;
          continue;
        }
        if (c == ')')
        {
          if (paren == 0)
            return fail(err, "unbalanced ')' in movetext");
          --paren;
          out.push_back(' ');
          continue;
        }
        if (paren > 0)
          continue;

        out.push_back(c);
      }

      if (brace)
        return fail(err, "unterminated '{' comment");
      if (paren > 0)
        return fail(err, "unterminated '(' variation");

      s.swap(out);
      return true;
    }

    void pushTokenSplittingMoveNumber(std::vector<std::string> &toks, std::string tok)
    {
      if (tok.empty())
        return;

      // Split tokens like "1.e4" or "10...O-O" into "1." + "e4" or "10..." + "O-O"
      std::size_t i = 0;
      while (i < tok.size() && std::isdigit((unsigned char)tok[i]))
        ++i;

      std::size_t j = i;
      while (j < tok.size() && tok[j] == '.')
        ++j;

      const bool hasMoveNoPrefix = (i > 0 && j > i);
      const bool hasTail = (j < tok.size());

      if (hasMoveNoPrefix && hasTail)
      {
        toks.push_back(tok.substr(0, j));
        toks.push_back(tok.substr(j));
        return;
      }

      toks.push_back(std::move(tok));
    }

    std::vector<std::string> tokenizeMovetext(const std::string &s)
    {
      std::vector<std::string> toks;
      std::string cur;

      auto flush = [&]
      {
        if (!cur.empty())
        {
          pushTokenSplittingMoveNumber(toks, cur);
          cur.clear();
        }
      };

      for (std::size_t i = 0; i < s.size(); ++i)
      {
        unsigned char c = (unsigned char)s[i];

        if (std::isspace(c))
        {
          flush();
          continue;
        }

        // NAGs like $1, $15
        if (c == '$')
        {
          flush();
          std::size_t k = i + 1;
          while (k < s.size() && std::isdigit((unsigned char)s[k]))
            ++k;
          if (k == i + 1)
            cur = "$"; // bare '$' is not a NAG; keep it so validation rejects it
          else
            i = k - 1;
          flush();
          continue;
        }

        cur.push_back((char)c);
      }

      flush();
      return toks;
    }

    bool isMoveNumberToken(const std::string &t)
    {
      std::size_t i = 0;
      while (i < t.size() && std::isdigit((unsigned char)t[i]))
        ++i;

      // digits followed by dots, or a bare run of dots ("1 ... e5")
      std::size_t j = i;
      while (j < t.size() && t[j] == '.')
        ++j;

      return (j > i) && (j == t.size());
    }

    bool isResultToken(const std::string &t)
    {
      return (t == "1-0" || t == "0-1" || t == "1/2-1/2" || t == "*");
    }

    bool isAnnotationToken(const std::string &t)
    {
      if (t.empty())
        return false;
      for (char c : t)
        if (c != '!' && c != '?')
          return false;
      return true;
    }

    std::string_view stripSuffix(std::string_view t)
    {
      while (!t.empty() && (t.back() == '+' || t.back() == '#' || t.back() == '!' || t.back() == '?'))
        t.remove_suffix(1);
      return t;
    }

    bool isPieceLetter(char c)
    {
      return c == 'N' || c == 'B' || c == 'R' || c == 'Q' || c == 'K';
    }

    // SAN shape only; whether it names a legal move is decided during replay.
    bool isSanShaped(std::string_view t)
    {
      t = stripSuffix(t);
      if (t == "O-O" || t == "O-O-O" || t == "0-0" || t == "0-0-0")
        return true;
      if (t.empty())
        return false;

      std::size_t i = 0;
      const bool piece = isPieceLetter(t[0]);
      if (piece)
        ++i;

      std::size_t end = t.size();
      if (end >= 2 && t[end - 2] == '=')
      {
        if (piece || !isPieceLetter(t[end - 1]) || t[end - 1] == 'K')
          return false;
        end -= 2;
      }
      else if (!piece && end >= 3 && isPieceLetter(t[end - 1]) && t[end - 1] != 'K' &&
               std::isdigit((unsigned char)t[end - 2]))
      {
        end -= 1;
      }

      if (end < i + 2)
        return false;
      if (t[end - 2] < 'a' || t[end - 2] > 'h' || t[end - 1] < '1' || t[end - 1] > '8')
        return false;

      // [file][rank][x] between piece letter and target, each at most once and in order
      std::size_t k = i;
      if (k < end - 2 && t[k] >= 'a' && t[k] <= 'h')
        ++k;
      if (k < end - 2 && t[k] >= '1' && t[k] <= '8')
        ++k;
      if (k < end - 2 && t[k] == 'x')
        ++k;
      return k == end - 2;
    }

    bool isMoveToken(const std::string &t)
    {
      if (t == "--")
        return true;
      return isSanShaped(t) || uci::isCoordinateShaped(stripSuffix(t));
    }
  } // namespace

  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err)
  {
    out = GameRecord{};

    if (isBlank(pgn))
      return fail(err, "empty record");
    if (!isValidUtf8(pgn))
      return fail(err, "record is not valid UTF-8");

    std::size_t i = 0;
    if (pgn.size() >= 3 && pgn.substr(0, 3) == "\xEF\xBB\xBF")
      i = 3; // byte order mark
    if (!parseTags(pgn, i, out, err))
      return false;

    // start FEN from tags; decodeGame() decides whether it is used
    auto itFen = out.tags.find("FEN");
    if (itFen != out.tags.end() && !itFen->second.empty())
      out.startFen = itFen->second;

    std::string movetext(pgn.substr(i));
    if (!stripCommentsAndVariations(movetext, err))
      return false;

    const auto toks = tokenizeMovetext(movetext);

    bool sawMovetext = false;
    for (const std::string &t : toks)
    {
      if (isMoveNumberToken(t) || isAnnotationToken(t))
        continue;

      if (isResultToken(t))
      {
        out.result = t;
        sawMovetext = true;
        break;
      }

      if (!isMoveToken(t))
        return fail(err, "unexpected token in movetext: " + t);

      out.moves.push_back(RecordedMove{t});
      sawMovetext = true;
    }

    if (!sawMovetext)
      return fail(err, "record has no movetext");

    // A result tag stands in for a missing termination marker
    if (out.result == "*")
    {
      auto itRes = out.tags.find("Result");
      if (itRes != out.tags.end() && isResultToken(itRes->second))
        out.result = itRes->second;
    }

    return true;
  }

  DecodeStatus decodeGame(std::string_view pgn, const std::optional<std::string> &startOverride,
                          GameRecord &out, std::string *err)
  {
    if (!parsePgnToRecord(pgn, out, err))
      return DecodeStatus::InvalidRecord;

    if (startOverride && !isBlank(*startOverride))
      out.startFen = *startOverride;
    else if (out.startFen.empty())
      out.startFen = core::START_FEN;

    std::string why;
    if (!fen::isValid(out.startFen, &why))
    {
      if (err)
        *err = "invalid start position: " + why;
      return DecodeStatus::InvalidStartPosition;
    }
    return DecodeStatus::Ok;
  }
}
