#include "sinks/stdout_debug.hpp"

#include <ctime>

namespace dl100_bridge::sinks {

void StdoutDebugSink::publish(const model::Record& record) const {
  write_line(format_line(record.ts_ms, record.distance, record.velocity));
}

void StdoutDebugSink::publish(const model::SingleRecord& record) const {
  write_line(format_line(record.ts_ms, record.kind, record.value));
}

std::string StdoutDebugSink::format_line(const std::uint64_t ts_ms, const std::int32_t field1,
                                         const std::int32_t field2) {
  const auto seconds = static_cast<std::time_t>(ts_ms / 1000ULL);
  const auto millis = static_cast<unsigned>(ts_ms % 1000ULL);

  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char iso[32]{};
  std::strftime(iso, sizeof(iso), "%Y-%m-%dT%H:%M:%S", &utc);

  char buffer[128]{};
  std::snprintf(buffer, sizeof(buffer), "%s.%03u000 - %llu.%03u000, %8d, %12d", iso, millis,
                static_cast<unsigned long long>(seconds), millis, field1, field2);

  std::string line(buffer);
  if (line.size() < kLineWidth) {
    line.append(kLineWidth - line.size(), ' ');
  }
  return line;
}

void StdoutDebugSink::write_line(const std::string& line) const {
  if (out_ == nullptr) {
    return;
  }
  std::fprintf(out_, "\r%s", line.c_str());
  std::fflush(out_);
}

}  // namespace dl100_bridge::sinks
