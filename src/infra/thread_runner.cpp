#include "infra/thread_runner.hpp"

#include <pthread.h>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace fsp {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

// Destructor stops and joins, a runner never outlives its thread
ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  running_.store(true, std::memory_order_release);
  global_stop_ = global_stop;

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    // Linux limits thread names to 15 chars
    pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());

    try {
      fn(global_stop_, local_stop_);
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "]: terminated by exception: " << e.what() << std::endl;
    }
    running_.store(false, std::memory_order_release);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace fsp
