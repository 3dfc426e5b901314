#pragma once

#include <cstdint>
#include <iostream>

#include "core/config.hpp"
#include "logging/emission_policy.hpp"
#include "tracking/presence_tracker.hpp"
#include "tracking/session_counters.hpp"

namespace fw {

// Human-readable progress on the console. Every method checks the policy itself
class ConsoleReporter {
public:
  explicit ConsoleReporter(EmissionPolicy policy, std::ostream& out = std::cout);

  void on_transition(const PresenceUpdate& update, const VisitDetector& visits, WallSeconds now);
  void on_change(const CounterChange& change);
  void on_stats(std::uint64_t frame_index, double fps, const CounterSnapshot& snap);

  const EmissionPolicy& policy() const { return policy_; }

private:
  EmissionPolicy policy_;
  std::ostream& out_;
};

// Startup settings block, printed once regardless of the console mode
void PrintSessionBanner(std::ostream& out, const AppConfig& cfg);

// Final totals, printed on shutdown
void PrintSessionSummary(std::ostream& out, const CounterSnapshot& snap, std::uint64_t frames, double fps);

} // namespace fw
