#include <scanbox/app/serial_executor.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <exception>
#include <future>

namespace scanbox::app {

SerialExecutor::SerialExecutor() : thread_(&SerialExecutor::thread_loop, this) {}

SerialExecutor::~SerialExecutor() {
  shutdown();
}

bool SerialExecutor::post(std::function<void()> task) {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return false;
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void SerialExecutor::flush() {
  if (on_executor_thread()) return;
  std::promise<void> done;
  auto future = done.get_future();
  if (!post([&done] { done.set_value(); })) return;
  future.wait();
}

void SerialExecutor::shutdown() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_one();
  // From a task: the loop exits once the queue drains; the destructor joins.
  if (thread_.joinable() && !on_executor_thread()) {
    thread_.join();
  }
}

bool SerialExecutor::on_executor_thread() const noexcept {
  return std::this_thread::get_id() == thread_.get_id();
}

void SerialExecutor::thread_loop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&]() { return !running_ || !tasks_.empty(); });
      if (!running_ && tasks_.empty()) break;
      task = std::move(tasks_.front());
      tasks_.pop();
    }

    if (!task) continue;
    try {
      task();
    } catch (const std::exception& e) {
      CV_LOG_ERROR(NULL, "scanbox: executor task threw: " << e.what());
    } catch (...) {
      CV_LOG_ERROR(NULL, "scanbox: executor task threw a non-standard exception");
    }
  }
}

}  // namespace scanbox::app
