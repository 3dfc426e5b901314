#include "logging/event_log_sink.hpp"

namespace fw {

const char* EventKindName(EventKind kind) {
  switch (kind) {
    case EventKind::Visit: return "Feeder visit";
    case EventKind::NewUnique: return "New unique bird";
  }
  return "Event";
}

} // namespace fw
