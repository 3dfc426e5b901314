#include "logging/async_log_sink.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <type_traits>
#include <utility>

namespace fw {

AsyncLogSink::AsyncLogSink(std::shared_ptr<EventLogSink> inner, QueueConfig cfg)
    : inner_(std::move(inner)), queue_(cfg.capacity, cfg.drop_policy) {}

AsyncLogSink::~AsyncLogSink() {
  stop();
}

void AsyncLogSink::start(StopToken global_stop) {
  std::cout << runner_.name() << " started" << std::endl;

  runner_.start(global_stop, [this](const StopToken& g, const std::atomic_bool& l) {
    run(g, l);
  });
}

void AsyncLogSink::stop() {
  queue_.close();

  if (runner_.joinable()) {
    runner_.join();
    std::cout << runner_.name() << " stopped" << std::endl;
    return;
  }

  // Never started: write out whatever was queued on the caller's thread
  Item item;
  while (queue_.try_pop(item)) forward(item);
}

void AsyncLogSink::write_record(const FrameRecord& record) {
  queue_.try_push(Item{record});
}

void AsyncLogSink::write_event(const CounterEvent& event) {
  queue_.try_push(Item{event});
}

void AsyncLogSink::write_temperature(const TemperatureSample& sample) {
  queue_.try_push(Item{sample});
}

void AsyncLogSink::write_performance(const PerformanceSample& sample) {
  queue_.try_push(Item{sample});
}

void AsyncLogSink::flush() {
  using namespace std::chrono_literals;

  if (runner_.joinable()) {
    while (queue_.size() > 0 || queue_.pops_total() != handled_.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(1ms);
    }
  }

  try {
    inner_->flush();
  } catch (const std::exception& e) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[log_writer] flush failed: " << e.what() << "\n";
  }
}

void AsyncLogSink::forward(const Item& item) {
  try {
    std::visit([this](const auto& v) {
      using V = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<V, FrameRecord>) {
        inner_->write_record(v);
      } else if constexpr (std::is_same_v<V, CounterEvent>) {
        inner_->write_event(v);
      } else if constexpr (std::is_same_v<V, TemperatureSample>) {
        inner_->write_temperature(v);
      } else {
        inner_->write_performance(v);
      }
    }, item);
    written_.fetch_add(1, std::memory_order_relaxed);
  } catch (const std::exception& e) {
    failures_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[log_writer] write failed: " << e.what() << "\n";
  }
  handled_.fetch_add(1, std::memory_order_release);
}

// Keeps running after a global stop until the queue is closed and drained, so records of the
// last frames still reach disk
void AsyncLogSink::run(const StopToken&, const std::atomic_bool& local) {
  using namespace std::chrono_literals;

  while (true) {
    Item item;
    if (queue_.try_pop_for(item, 50ms)) {
      forward(item);
      continue;
    }

    if (queue_.closed() || local.load(std::memory_order_relaxed)) {
      if (queue_.size() == 0) break;
    }
  }
}

} // namespace fw
