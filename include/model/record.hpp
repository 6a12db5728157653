#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace dl100_bridge::model {

// Logical sensor channels. Values double as the single-mode `kind` field.
enum class Channel : std::int32_t {
  DISTANCE = 1,
  VELOCITY = 2,
};

enum class PublishMode : std::uint8_t {
  SINGLE = 0,
  MULTI = 1,
};

inline constexpr std::string_view kDistanceName = "distance";
inline constexpr std::string_view kVelocityName = "velocity";

struct Reading {
  std::string name;
  std::int32_t value;
  std::uint64_t timestamp_ms;
};

// Aggregated multi-mode sample. ts_ms is the distance reading's timestamp.
struct Record {
  std::uint64_t ts_ms;
  std::int32_t distance;
  std::int32_t velocity;

  friend bool operator==(const Record&, const Record&) = default;
};

// Per-reading single-mode sample.
struct SingleRecord {
  std::uint64_t ts_ms;
  std::int32_t kind;
  std::int32_t value;

  friend bool operator==(const SingleRecord&, const SingleRecord&) = default;
};

static_assert(std::is_trivial_v<Record>, "Record must be trivial");
static_assert(std::is_trivial_v<SingleRecord>, "SingleRecord must be trivial");

std::optional<Channel> channel_from_name(std::string_view name) noexcept;
std::string_view channel_name(Channel channel) noexcept;

std::optional<PublishMode> parse_mode(std::string_view text) noexcept;
std::string_view mode_name(PublishMode mode) noexcept;

}  // namespace dl100_bridge::model
