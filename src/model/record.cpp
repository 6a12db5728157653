#include "model/record.hpp"

namespace dl100_bridge::model {

std::optional<Channel> channel_from_name(const std::string_view name) noexcept {
  if (name == kDistanceName) {
    return Channel::DISTANCE;
  }
  if (name == kVelocityName) {
    return Channel::VELOCITY;
  }
  return std::nullopt;
}

std::string_view channel_name(const Channel channel) noexcept {
  return channel == Channel::DISTANCE ? kDistanceName : kVelocityName;
}

std::optional<PublishMode> parse_mode(const std::string_view text) noexcept {
  if (text == "single") {
    return PublishMode::SINGLE;
  }
  if (text == "multi") {
    return PublishMode::MULTI;
  }
  return std::nullopt;
}

std::string_view mode_name(const PublishMode mode) noexcept {
  return mode == PublishMode::SINGLE ? "single" : "multi";
}

}  // namespace dl100_bridge::model
