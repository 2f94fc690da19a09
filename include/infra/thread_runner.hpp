#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread.
        - start/join, plus a local stop flag for this thread only
        - read-only view of the global stop flag
        - names the OS thread so lanes show up in top/gdb
        - running() turns false once the worker function returns, however it returned
*/

namespace fsp {

class ThreadRunner {
public:
  // Any callable that takes a global stop token and a local stop flag, and returns nothing
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  // Remove copy/move
  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  void start(StopToken global_stop, Fn fn);

  // Request this specific thread to stop. Does NOT affect other threads
  void request_stop();

  void join();
  bool joinable() const;
  bool running() const { return running_.load(std::memory_order_acquire); }

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};
  std::atomic_bool running_{false};
  StopToken global_stop_{};
  std::string name_{"thread"};
};

} // namespace fsp
