#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace kibitz::app {

// Fixed-size worker pool for the serve loop. Each job runs a whole request, so
// jobs are few and long; the pool never grows after construction.
class ThreadPool {
 public:
  explicit ThreadPool(int threads) {
    int n = threads > 0 ? threads : static_cast<int>(std::thread::hardware_concurrency());
    if (n <= 0) n = 1;
    threads_.reserve(n);
    for (int i = 0; i < n; ++i) threads_.emplace_back([this] { worker(); });
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Queued jobs still run; the destructor returns once all of them have.
  ~ThreadPool() { shutdown(); }

  template <class F, class... Args>
  auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using R = std::invoke_result_t<F, Args...>;

    // packaged_task is move-only; std::function needs something copyable
    auto task_ptr = std::make_shared<std::packaged_task<R()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<R> fut = task_ptr->get_future();

    {
      std::lock_guard<std::mutex> lk(m_);
      if (stop_) throw std::runtime_error("submit on a stopped ThreadPool");
      q_.emplace([task_ptr]() { (*task_ptr)(); });
    }
    cv_.notify_one();
    return fut;
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lk(m_);
      if (stop_ && threads_.empty()) return;
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_)
      if (t.joinable()) t.join();
    threads_.clear();
  }

  std::size_t size() const { return threads_.size(); }

 private:
  void worker() {
    for (;;) {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
        if (stop_ && q_.empty()) return;
        job = std::move(q_.front());
        q_.pop();
      }
      job();
    }
  }

  std::mutex m_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> q_;
  std::vector<std::thread> threads_;
  bool stop_ = false;
};

}  // namespace kibitz::app
