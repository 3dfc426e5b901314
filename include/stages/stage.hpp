#pragma once

#include <atomic>
#include <string>

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

namespace fw {

// A named worker with its own thread (camera capture, temperature sampling).
// Subclasses implement run() and poll the stop flags, returning promptly once either is set
class Stage {
public:
  explicit Stage(std::string name);
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  // Prints "<name> started" and launches run() on the worker thread
  void start(StopToken global_stop);
  // Stops and joins this stage only. Safe to call twice or before start()
  void stop();

  // run() threw, the stage is no longer doing its job
  bool failed() const { return runner_.failed(); }
  const std::string& name() const { return name_; }

protected:
  virtual void run(const StopToken& global_stop,
                   const std::atomic_bool& local_stop) = 0;

private:
  std::string name_;
  ThreadRunner runner_;
};

} // namespace fw
