#include "kibitz/app/serve.hpp"

#include <cctype>
#include <condition_variable>
#include <deque>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

#include "kibitz/analysis/analyze_request.hpp"
#include "kibitz/analysis/result_envelope.hpp"
#include "kibitz/app/thread_pool.hpp"

namespace kibitz::app {

namespace {

bool is_blank(const std::string& s) {
  for (unsigned char c : s)
    if (!std::isspace(c)) return false;
  return true;
}

nlohmann::json invalid_request(const std::string& message) {
  analysis::AnalysisError e;
  e.code = analysis::ErrorCode::InvalidRequest;
  e.message = message;
  return nlohmann::json(analysis::makeFailure(std::move(e)));
}

// Futures are written strictly in submission order by a single writer thread.
class OrderedWriter {
 public:
  OrderedWriter(std::ostream& out, bool pretty) : out_(out), pretty_(pretty) {
    thread_ = std::thread([this] { run(); });
  }

  ~OrderedWriter() { finish(); }

  void push(std::future<nlohmann::json> f) {
    {
      std::lock_guard<std::mutex> lk(m_);
      pending_.push_back(std::move(f));
    }
    cv_.notify_one();
  }

  void finish() {
    {
      std::lock_guard<std::mutex> lk(m_);
      done_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable()) thread_.join();
  }

  int written() const { return written_; }

 private:
  void run() {
    for (;;) {
      std::future<nlohmann::json> f;
      {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&] { return done_ || !pending_.empty(); });
        if (pending_.empty()) return;
        f = std::move(pending_.front());
        pending_.pop_front();
      }
      nlohmann::json j;
      try {
        j = f.get();
      } catch (const std::exception& e) {
        std::cerr << "[Serve] request failed: " << e.what() << "\n";
        j = invalid_request(std::string("request failed: ") + e.what());
      }
      out_ << j.dump(pretty_ ? 2 : -1) << "\n";
      out_.flush();
      ++written_;
    }
  }

  std::ostream& out_;
  bool pretty_;
  std::mutex m_;
  std::condition_variable cv_;
  std::deque<std::future<nlohmann::json>> pending_;
  bool done_ = false;
  int written_ = 0;
  std::thread thread_;
};

}  // namespace

nlohmann::json handle_request_line(analysis::AnalysisService& service, const std::string& line) {
  const nlohmann::json j = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return invalid_request("request is not valid JSON");

  nlohmann::json id;
  if (j.is_object()) {
    auto it = j.find("id");
    if (it != j.end()) id = *it;
  }

  analysis::AnalyzeRequest req;
  std::string err;
  nlohmann::json reply;
  if (!analysis::parseAnalyzeRequest(j, req, &err))
    reply = invalid_request(err);
  else
    reply = service.analyze(req);

  if (!id.is_null()) reply["id"] = id;
  return reply;
}

int run_serve(analysis::AnalysisService& service, std::istream& in, std::ostream& out, int workers,
              bool pretty) {
  OrderedWriter writer(out, pretty);
  {
    ThreadPool pool(workers);
    std::string line;
    while (std::getline(in, line)) {
      if (is_blank(line)) continue;
      writer.push(pool.submit(
          [&service](std::string l) { return handle_request_line(service, l); }, std::move(line)));
      line.clear();
    }
#if KIBITZ_LOG
    std::cerr << "[Serve] input closed, draining\n";
#endif
  }
  writer.finish();
  return writer.written();
}

}  // namespace kibitz::app
