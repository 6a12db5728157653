#include "model/status.hpp"

namespace dl100_bridge::model {

const char* status_name(const Status status) noexcept {
  switch (status) {
    case Status::OK:
      return "ok";
    case Status::UNKNOWN_ATTRIBUTE:
      return "unknown_attribute";
    case Status::MALFORMED_FRAME:
      return "malformed_frame";
    case Status::BIND_FAILURE:
      return "bind_failure";
    case Status::POLL_TIMEOUT:
      return "poll_timeout";
    case Status::INVALID_MODE:
      return "invalid_mode";
    case Status::ALREADY_RUNNING:
      return "already_running";
    case Status::INVALID_CYCLE:
      return "invalid_cycle";
  }
  return "unknown";
}

}  // namespace dl100_bridge::model
