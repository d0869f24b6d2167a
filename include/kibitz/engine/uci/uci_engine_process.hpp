#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "kibitz/engine/analysis_engine.hpp"
#include "kibitz/engine/uci/uci_option.hpp"

namespace kibitz::engine::uci
{

  // A UCI engine child process: stdin/stdout pipes plus a reader thread that
  // queues every output line.
  class UciEngineProcess
  {
  public:
    using Clock = std::chrono::steady_clock;

    struct Id
    {
      std::string name, author;
    };

    UciEngineProcess() = default;
    ~UciEngineProcess(); // out-of-line semantics via custom deleter (safe with incomplete Impl)

    UciEngineProcess(const UciEngineProcess &) = delete;
    UciEngineProcess &operator=(const UciEngineProcess &) = delete;
    UciEngineProcess(UciEngineProcess &&) = delete;
    UciEngineProcess &operator=(UciEngineProcess &&) = delete;

    bool start(const std::string &exePath);
    void stop() noexcept;
    bool running() const { return m_running.load(); }
    // The engine closed its output (exited or crashed).
    bool outputClosed() const { return m_eof.load(); }

    bool uciHandshake(Id &outId, std::vector<UciOption> &outOptions,
                      std::chrono::milliseconds timeout);
    bool isReady(std::chrono::milliseconds timeout);

    void setOption(const std::string &name, const UciValue &v);
    void newGame();

    void position(const std::string &fen);
    void go(const SearchLimits &limits);
    void stopSearch();

    // Next output line. False on deadline or when the engine has gone away.
    bool readLine(std::string &out, Clock::time_point deadline);

    static bool parseUciOptionLine(const std::string &line, UciOption &out);

  private:
    bool sendLine(const std::string &line);
    void readerLoop();

    bool platformStart(const std::string &exePath);
    void platformCloseInput();
    void platformReap() noexcept;
    void platformRelease() noexcept;

    bool platformWrite(const std::string &s);
    bool platformReadLine(std::string &outLine);

  private:
    std::thread m_reader;
    std::atomic_bool m_running{false};
    std::atomic_bool m_eof{false};

    std::mutex m_mtx;
    std::condition_variable m_cvLines;
    std::deque<std::string> m_lines;

    struct Impl;

    struct ImplDeleter
    {
      void operator()(Impl *p) noexcept; // defined in platform .cpp where Impl is complete
    };

    std::unique_ptr<Impl, ImplDeleter> m_impl;
  };

} // namespace kibitz::engine::uci
