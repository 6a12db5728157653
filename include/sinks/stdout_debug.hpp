#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

#include "model/record.hpp"

namespace dl100_bridge::sinks {

// Rewrites a single console line per published record.
class StdoutDebugSink {
 public:
  static constexpr std::size_t kLineWidth = 80;

  explicit StdoutDebugSink(std::FILE* out = stdout) noexcept : out_(out) {}

  void publish(const model::Record& record) const;
  void publish(const model::SingleRecord& record) const;

  // "<ISO-8601 UTC> - <seconds.micros>, <field1>, <field2>" padded to kLineWidth.
  static std::string format_line(std::uint64_t ts_ms, std::int32_t field1, std::int32_t field2);

 private:
  void write_line(const std::string& line) const;

  std::FILE* out_;
};

}  // namespace dl100_bridge::sinks
