#include "infra/thread_runner.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace fw {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  failed_.store(false, std::memory_order_release);
  global_stop_ = global_stop;

  // An exception escaping a worker would terminate the process, report it and let the thread end
  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    try {
      fn(global_stop_, local_stop_);
    } catch (const std::exception& e) {
      failed_.store(true, std::memory_order_release);
      std::cerr << "[" << name_ << "] worker stopped on error: " << e.what() << "\n";
    }
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

bool ThreadRunner::stop_requested() const {
  return global_stop_.stop_requested() || local_stop_.load(std::memory_order_relaxed);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace fw
