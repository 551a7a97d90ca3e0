#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace scanbox::app {

/// One worker thread running posted tasks in FIFO order: the serial context a
/// ScanSession lives on. post() is thread-safe. Tasks that throw are logged and
/// the loop continues.
///
/// The executor must be destroyed from a thread other than its worker: a task
/// may call shutdown() but must not destroy the executor it runs on.
class SerialExecutor {
 public:
  SerialExecutor();
  ~SerialExecutor();

  SerialExecutor(const SerialExecutor&) = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;

  /// Enqueue \p task. Returns false (task dropped) after shutdown().
  bool post(std::function<void()> task);

  /// Blocks until every task posted before this call has run.
  /// Returns immediately when called from the worker thread itself.
  void flush();

  /// Runs the tasks already queued, then joins the worker. Idempotent.
  /// From a task it only stops intake; the join happens in the destructor.
  void shutdown();

  [[nodiscard]] bool on_executor_thread() const noexcept;

 private:
  void thread_loop();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> tasks_;
  bool running_{true};
  std::thread thread_;
};

}  // namespace scanbox::app
