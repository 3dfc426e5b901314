#include "logging/console_reporter.hpp"

#include <iomanip>

#include "core/wall_clock.hpp"

namespace fw {

ConsoleReporter::ConsoleReporter(EmissionPolicy policy, std::ostream& out) : policy_(policy), out_(out) {}

void ConsoleReporter::on_transition(const PresenceUpdate& update, const VisitDetector& visits, WallSeconds now) {
  if (!policy_.should_print_transition(update.transition)) return;

  const std::string at = FormatLocalTime(now, "%H:%M:%S");
  const auto n = visits.total_visits();

  out_ << std::fixed << std::setprecision(1);
  switch (update.transition) {
    case VisitTransition::FirstVisit:
      out_ << "[visit] first feeder visit #" << n << " at " << at << "\n";
      break;
    case VisitTransition::NewVisit:
      out_ << "[visit] new feeder visit #" << n << " after " << visits.last_gap_seconds() << "s away, at " << at << "\n";
      break;
    case VisitTransition::Flicker:
      out_ << "[visit] visit #" << n << " continues (detector flicker, " << visits.last_gap_seconds() << "s gap)\n";
      break;
    case VisitTransition::GroupGrowth:
      out_ << "[visit] group feeder visit #" << n << ", birds on frame: " << update.frame_count << "\n";
      break;
    case VisitTransition::Departure:
      out_ << "[visit] birds left the frame at " << at << "\n";
      break;
    case VisitTransition::None:
      break;
  }
  out_ << std::flush;
}

void ConsoleReporter::on_change(const CounterChange& change) {
  if (!change.any() || !policy_.should_print_change()) return;
  out_ << "[change] unique: " << change.current.total_unique << " | visits: " << change.current.total_visits << std::endl;
}

void ConsoleReporter::on_stats(std::uint64_t frame_index, double fps, const CounterSnapshot& snap) {
  if (!policy_.should_print_stats(frame_index)) return;
  out_ << "[stats] frame " << frame_index
       << " | FPS: " << std::fixed << std::setprecision(1) << fps
       << " | birds: " << snap.current_frame_count
       << " | active: " << snap.current_active
       << " | unique: " << snap.total_unique
       << " | visits: " << snap.total_visits << std::endl;
}

void PrintSessionBanner(std::ostream& out, const AppConfig& cfg) {
  const auto on_off = [](bool b) { return b ? "on" : "off"; };

  out << "feeder-watch session\n";
  out << "  model:          " << (cfg.model.path.empty() ? "(none)" : cfg.model.path) << "\n";
  out << "  classes:        ";
  for (std::size_t i = 0; i < cfg.detection.target_classes.size(); ++i) {
    out << (i ? ", " : "") << cfg.detection.target_classes[i];
  }
  out << " (min confidence " << cfg.detection.min_confidence << ")\n";
  out << "  tracking:       " << on_off(cfg.tracking.enable_tracking)
      << ", timeout " << cfg.tracking.bird_timeout_seconds << "s\n";
  out << "  visit counter:  " << on_off(cfg.tracking.enable_visit_counter)
      << ", min gap " << cfg.tracking.min_time_between_visits_seconds << "s\n";
  out << "  text log:       " << on_off(cfg.logging.enable_text_log)
      << (cfg.logging.enable_text_log ? (cfg.logging.async_writes ? " (async)" : " (sync)") : "") << "\n";
  out << "  console:        " << ConsoleOutputModeName(cfg.logging.console_output_mode) << "\n";
  out << "  photos:         " << on_off(cfg.frame_saving.enable_photo_save)
      << ", every " << cfg.frame_saving.min_save_interval_seconds << "s\n";
  out << "  temperature:    " << on_off(cfg.monitoring.enable_temperature_logging) << "\n";
  out << "  perf debug log: " << on_off(cfg.performance.enable_performance_log) << std::endl;
}

void PrintSessionSummary(std::ostream& out, const CounterSnapshot& snap, std::uint64_t frames, double fps) {
  out << "session finished: " << frames << " frames"
      << " | FPS: " << std::fixed << std::setprecision(1) << fps
      << " | unique birds: " << snap.total_unique
      << " | feeder visits: " << snap.total_visits << std::endl;
}

} // namespace fw
