#pragma once

#include <cstdint>

namespace dl100_bridge::model {

enum class Status : std::uint8_t {
  OK = 0,
  UNKNOWN_ATTRIBUTE = 1,
  MALFORMED_FRAME = 2,
  BIND_FAILURE = 3,
  POLL_TIMEOUT = 4,
  INVALID_MODE = 5,
  ALREADY_RUNNING = 6,
  INVALID_CYCLE = 7,
};

const char* status_name(Status status) noexcept;

}  // namespace dl100_bridge::model
