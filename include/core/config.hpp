#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "core/bridge.hpp"
#include "model/record.hpp"
#include "sinks/publish_channel.hpp"

namespace dl100_bridge::core {

struct DeviceConfig {
  std::string host{"192.168.101.217"};
  std::uint16_t port{44818};
  std::chrono::milliseconds timeout{500};
};

struct PublishConfig {
  std::string address{"tcp://*:5559"};
  bool start_active{true};
};

struct SyntheticConfig {
  bool enabled{false};
  bool inject_zero{false};
  std::uint64_t zero_every{50};
  std::uint32_t seed{0};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"dl100:bridge"};
  bool enabled{false};
};

struct ControlConfig {
  bool stdin_enabled{false};
};

struct BridgeConfig {
  DeviceConfig device{};
  double cycle_seconds{1.0 / 30.0};
  model::PublishMode mode{model::PublishMode::MULTI};
  bool verbose{true};
  PublishConfig publish{};
  SyntheticConfig synthetic{};
  std::chrono::milliseconds health_interval{1000};
  RedisConfig redis{};
  ControlConfig control{};
};

// Reads a YAML-subset file: "key: value" lines, two-space indented sections, '#' comments.
// Unknown keys are ignored; invalid values throw std::runtime_error.
BridgeConfig load_bridge_config(const std::string& path);

// Applies one dotted key (e.g. "device.host") with the same validation as the file
// loader. Throws std::runtime_error for unknown keys and invalid values.
void apply_config_override(BridgeConfig& config, const std::string& key, const std::string& value);

// Maps a command-line flag name ("dl100_ip", "cycle", ...) to its config key.
// Names that are already config keys map to themselves.
std::string config_key_for_flag(const std::string& flag);

// DL100_BRIDGE_PUB_USERNAME / DL100_BRIDGE_PUB_PASSWORD.
sinks::PublishCredentials load_publish_credentials();

std::string describe_config(const BridgeConfig& config);

// With the stdin control surface on, stdout carries JSON-RPC replies and the record
// echo goes to stderr instead.
BridgeOptions bridge_options_for(const BridgeConfig& config);

}  // namespace dl100_bridge::core
