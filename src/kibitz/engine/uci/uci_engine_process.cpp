#include "kibitz/engine/uci/uci_engine_process.hpp"

#include <sstream>

namespace kibitz::engine::uci
{

  static bool starts_with(const std::string &s, const char *pfx)
  {
    return s.rfind(pfx, 0) == 0;
  }

  UciEngineProcess::~UciEngineProcess()
  {
    stop();
  }

  bool UciEngineProcess::start(const std::string &exePath)
  {
    stop();
    if (!platformStart(exePath))
      return false;

    m_eof.store(false);
    m_running.store(true);
    m_reader = std::thread([this]
                           { readerLoop(); });
    return true;
  }

  void UciEngineProcess::stop() noexcept
  {
    if (!m_running.exchange(false) && !m_impl)
      return;

    // best-effort graceful shutdown, then reap (SIGKILL if it lingers)
    sendLine("quit");
    platformCloseInput();
    platformReap();

    if (m_reader.joinable())
      m_reader.join();
    platformRelease();

    std::lock_guard lk(m_mtx);
    m_lines.clear();
  }

  bool UciEngineProcess::sendLine(const std::string &line)
  {
    // UCI requires \n; many engines tolerate \r\n.
    return platformWrite(line + "\n");
  }

  void UciEngineProcess::readerLoop()
  {
    for (;;)
    {
      std::string line;
      if (!platformReadLine(line))
        break;

      // Normalize CRLF
      while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();

      {
        std::lock_guard lk(m_mtx);
        m_lines.push_back(std::move(line));
      }
      m_cvLines.notify_all();
    }

    {
      std::lock_guard lk(m_mtx);
      m_eof.store(true);
    }
    m_cvLines.notify_all();
  }

  bool UciEngineProcess::readLine(std::string &out, Clock::time_point deadline)
  {
    std::unique_lock lk(m_mtx);
    auto ready = [&]
    { return !m_lines.empty() || m_eof.load(); };
    if (deadline == Clock::time_point::max())
      m_cvLines.wait(lk, ready);
    else
      m_cvLines.wait_until(lk, deadline, ready);

    if (m_lines.empty())
      return false;
    out = std::move(m_lines.front());
    m_lines.pop_front();
    return true;
  }

  bool UciEngineProcess::uciHandshake(Id &outId, std::vector<UciOption> &outOptions,
                                      std::chrono::milliseconds timeout)
  {
    outId = {};
    outOptions.clear();

    if (!sendLine("uci"))
      return false;

    const auto deadline = Clock::now() + timeout;
    std::string line;
    while (readLine(line, deadline))
    {
      if (starts_with(line, "id name "))
        outId.name = line.substr(std::string("id name ").size());
      else if (starts_with(line, "id author "))
        outId.author = line.substr(std::string("id author ").size());
      else if (starts_with(line, "option "))
      {
        UciOption opt;
        if (parseUciOptionLine(line, opt))
          outOptions.push_back(std::move(opt));
      }
      else if (line == "uciok")
        return isReady(timeout);
    }
    return false;
  }

  bool UciEngineProcess::isReady(std::chrono::milliseconds timeout)
  {
    if (!sendLine("isready"))
      return false;

    const auto deadline = Clock::now() + timeout;
    std::string line;
    while (readLine(line, deadline))
    {
      if (line == "readyok")
        return true;
    }
    return false;
  }

  void UciEngineProcess::setOption(const std::string &name, const UciValue &v)
  {
    std::ostringstream os;
    os << "setoption name " << name << " value ";
    if (std::holds_alternative<bool>(v))
      os << (std::get<bool>(v) ? "true" : "false");
    else if (std::holds_alternative<int>(v))
      os << std::get<int>(v);
    else
      os << std::get<std::string>(v);
    sendLine(os.str());
  }

  void UciEngineProcess::newGame()
  {
    sendLine("ucinewgame");
  }

  void UciEngineProcess::position(const std::string &fen)
  {
    sendLine("position fen " + fen);
  }

  void UciEngineProcess::go(const SearchLimits &limits)
  {
    std::ostringstream os;
    os << "go";
    if (limits.depth)
      os << " depth " << *limits.depth;
    if (limits.movetimeMs)
      os << " movetime " << *limits.movetimeMs;
    if (!limits.depth && !limits.movetimeMs)
      os << " movetime 1000";
    sendLine(os.str());
  }

  void UciEngineProcess::stopSearch()
  {
    sendLine("stop");
  }

  // ---- UCI option parsing ----
  // Handles: option name <...> type <check|spin|combo|string|button> default ... [min/max/var]
  bool UciEngineProcess::parseUciOptionLine(const std::string &line, UciOption &out)
  {
    if (!starts_with(line, "option "))
      return false;

    const std::string keyName = "option name ";
    const std::string keyType = " type ";

    auto namePos = line.find(keyName);
    if (namePos == std::string::npos)
      return false;

    auto typePos = line.find(keyType, namePos + keyName.size());
    if (typePos == std::string::npos)
      return false;

    out = {};
    out.name = line.substr(namePos + keyName.size(), typePos - (namePos + keyName.size()));

    std::string rest = line.substr(typePos + keyType.size());
    std::istringstream iss(rest);

    std::string typeTok;
    if (!(iss >> typeTok))
      return false;

    using T = UciOption::Type;
    if (typeTok == "check")
      out.type = T::Check;
    else if (typeTok == "spin")
      out.type = T::Spin;
    else if (typeTok == "combo")
      out.type = T::Combo;
    else if (typeTok == "button")
      out.type = T::Button;
    else
      out.type = T::String;

    std::string tok;
    while (iss >> tok)
    {
      if (tok == "default")
      {
        if (out.type == T::Check)
        {
          std::string v;
          if (!(iss >> v))
            break;
          out.defaultBool = (v == "true");
        }
        else if (out.type == T::Spin)
        {
          int v = 0;
          if (!(iss >> v))
            break;
          out.defaultInt = v;
        }
        else
        {
          std::string v;
          if (!(iss >> v))
            break;
          out.defaultStr = v;
        }
      }
      else if (tok == "min")
      {
        int v = 0;
        if (!(iss >> v))
          break;
        out.min = v;
      }
      else if (tok == "max")
      {
        int v = 0;
        if (!(iss >> v))
          break;
        out.max = v;
      }
      else if (tok == "var")
      {
        std::string v;
        if (!(iss >> v))
          break;
        out.vars.push_back(v);
      }
    }
    return true;
  }

} // namespace kibitz::engine::uci
