#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace mp::engine {

// Single worker thread draining a FIFO queue. Tasks run in submission order.
class AsyncTaskService {
public:
  explicit AsyncTaskService(std::string name = "worker");
  AsyncTaskService(AsyncTaskService const &) = delete;
  AsyncTaskService &operator=(AsyncTaskService const &) = delete;
  ~AsyncTaskService();

  void start();
  // Drains queued tasks, then joins the worker.
  void stop();
  bool is_running() const noexcept;
  bool submit(std::function<void()> task);
  std::size_t pending() const;

  // Queues `fn` and returns its future. Runs inline when the worker is not
  // running so callers never wait on a queue nobody drains.
  template <typename Fn>
  auto run_task(Fn &&fn) -> std::future<std::invoke_result_t<Fn>> {
    using result_t = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<result_t()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    if (!is_running() || !submit([task]() mutable { (*task)(); })) {
      (*task)();
    }
    return future;
  }

private:
  void loop();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<bool> exit_requested_{false};
};

} // namespace mp::engine
