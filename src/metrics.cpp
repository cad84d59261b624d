#include "metrics.hpp"
#include <sstream>

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.loop_p50 = loop_.perc(50);  s.loop_p95 = loop_.perc(95);  s.loop_p99 = loop_.perc(99);
  s.iterations = iterations_.load();
  const auto overruns = overruns_.load();
  s.overrun_rate = s.iterations ? (static_cast<double>(overruns) / static_cast<double>(s.iterations)) : 0.0;
  s.frames_submitted = frames_submitted_.load();
  s.frames_dropped = frames_dropped_.load();
  s.samples_processed = samples_processed_.load();
  s.payloads_emitted = payloads_emitted_.load();
  s.payloads_dropped = payloads_dropped_.load();
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "loop_iteration_ms{quantile=\"0.5\"} "  << s.loop_p50 << "\n";
  os << "loop_iteration_ms{quantile=\"0.95\"} " << s.loop_p95 << "\n";
  os << "loop_iteration_ms{quantile=\"0.99\"} " << s.loop_p99 << "\n";

  os << "loop_iterations_total " << s.iterations << "\n";
  os << "loop_overrun_total " << overruns_.load() << "\n";
  os << "loop_overrun_rate " << s.overrun_rate << "\n";
  os << "loop_fps " << s.fps << "\n";

  os << "frames_submitted_total " << s.frames_submitted << "\n";
  os << "frames_dropped_total " << s.frames_dropped << "\n";
  os << "samples_processed_total " << s.samples_processed << "\n";
  os << "payloads_emitted_total " << s.payloads_emitted << "\n";
  os << "payloads_dropped_total " << s.payloads_dropped << "\n";
  return os.str();
}
