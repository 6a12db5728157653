#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/cycle_clock.hpp"
#include "model/status.hpp"

namespace dl100_bridge::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& key, const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1" || lower == "t" || lower == "y") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0" || lower == "f" || lower == "n") {
    return false;
  }
  throw std::runtime_error(key + " expects a boolean, got '" + value + "'");
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " expects an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " expects an integer, got '" + value + "'");
  }
  return parsed;
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " expects a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " expects a number, got '" + value + "'");
  }
  return parsed;
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto port = parse_integer(key, value);
  if (port <= 0 || port > 65535) {
    throw std::runtime_error(key + " must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(port);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = parse_port("redis.address port", value.substr(split + 1));
}

// Returns false for keys this loader does not know.
bool apply_key_value(BridgeConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "device.host") {
    if (value.empty()) {
      throw std::runtime_error("device.host must not be empty");
    }
    config.device.host = value;
    return true;
  }

  if (key == "device.port") {
    config.device.port = parse_port(key, value);
    return true;
  }

  if (key == "device.timeout_ms") {
    const auto timeout_ms = parse_integer(key, value);
    if (timeout_ms <= 0) {
      throw std::runtime_error("device.timeout_ms must be greater than 0");
    }
    config.device.timeout = std::chrono::milliseconds(timeout_ms);
    return true;
  }

  if (key == "cycle_s") {
    const double seconds = parse_double(key, value);
    if (seconds > 60.0 || !valid_cycle(cycle_from_seconds(seconds))) {
      throw std::runtime_error("cycle_s must be in range [0.001, 60]");
    }
    config.cycle_seconds = seconds;
    return true;
  }

  if (key == "cycle_hz") {
    const auto hz = parse_integer(key, value);
    if (hz <= 0 || hz > 1000) {
      throw std::runtime_error("cycle_hz must be in range 1..1000");
    }
    config.cycle_seconds = 1.0 / static_cast<double>(hz);
    return true;
  }

  if (key == "mode") {
    const auto mode = model::parse_mode(value);
    if (!mode.has_value()) {
      throw std::runtime_error(std::string(model::status_name(model::Status::INVALID_MODE)) + ": mode must be "
                               "'single' or 'multi', got '" + value + "'");
    }
    config.mode = *mode;
    return true;
  }

  if (key == "verbose") {
    config.verbose = parse_bool(key, value);
    return true;
  }

  if (key == "publish.address") {
    if (value.empty()) {
      throw std::runtime_error("publish.address must not be empty");
    }
    config.publish.address = value;
    return true;
  }

  if (key == "publish.port") {
    config.publish.address = "tcp://*:" + std::to_string(parse_port(key, value));
    return true;
  }

  if (key == "publish.start_active") {
    config.publish.start_active = parse_bool(key, value);
    return true;
  }

  if (key == "synthetic.enabled") {
    config.synthetic.enabled = parse_bool(key, value);
    return true;
  }

  if (key == "synthetic.inject_zero") {
    config.synthetic.inject_zero = parse_bool(key, value);
    return true;
  }

  if (key == "synthetic.zero_every") {
    const auto every = parse_integer(key, value);
    if (every < 1) {
      throw std::runtime_error("synthetic.zero_every must be at least 1");
    }
    config.synthetic.zero_every = static_cast<std::uint64_t>(every);
    return true;
  }

  if (key == "synthetic.seed") {
    const auto seed = parse_integer(key, value);
    if (seed < 0 || seed > 0xFFFFFFFFLL) {
      throw std::runtime_error("synthetic.seed must fit in 32 bits");
    }
    config.synthetic.seed = static_cast<std::uint32_t>(seed);
    return true;
  }

  if (key == "health_interval_ms") {
    const auto interval_ms = parse_integer(key, value);
    if (interval_ms < 100) {
      throw std::runtime_error("health_interval_ms must be at least 100");
    }
    config.health_interval = std::chrono::milliseconds(interval_ms);
    return true;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return true;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return true;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return true;
  }

  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0 || db > std::numeric_limits<int>::max()) {
      throw std::runtime_error("redis.db must be in range 0.." + std::to_string(std::numeric_limits<int>::max()));
    }
    config.redis.db = static_cast<int>(db);
    return true;
  }

  if (key == "control.stdin") {
    config.control.stdin_enabled = parse_bool(key, value);
    return true;
  }

  return false;
}

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

}  // namespace

BridgeConfig load_bridge_config(const std::string& path) {
  BridgeConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    (void)apply_key_value(config, full_key.str(), value);
  }

  return config;
}

void apply_config_override(BridgeConfig& config, const std::string& key, const std::string& value) {
  if (!apply_key_value(config, key, value)) {
    throw std::runtime_error("unknown option: " + key);
  }
}

std::string config_key_for_flag(const std::string& flag) {
  static const std::unordered_map<std::string, std::string> kFlagAliases = {
      {"dl100_ip", "device.host"},
      {"dl100_port", "device.port"},
      {"timeout_ms", "device.timeout_ms"},
      {"zmq_port", "publish.port"},
      {"bind", "publish.address"},
      {"cycle", "cycle_s"},
      {"mode", "mode"},
      {"verbose", "verbose"},
      {"synthetic", "synthetic.enabled"},
      {"inject_zero", "synthetic.inject_zero"},
      {"seed", "synthetic.seed"},
      {"redis", "redis.address"},
      {"control", "control.stdin"},
  };

  const auto it = kFlagAliases.find(flag);
  return it == kFlagAliases.end() ? flag : it->second;
}

sinks::PublishCredentials load_publish_credentials() {
  sinks::PublishCredentials credentials;
  credentials.username = getenv_or("DL100_BRIDGE_PUB_USERNAME", credentials.username);
  credentials.password = getenv_or("DL100_BRIDGE_PUB_PASSWORD", credentials.password);
  return credentials;
}

std::string describe_config(const BridgeConfig& config) {
  std::ostringstream output;
  output << "mode=" << model::mode_name(config.mode)
         << " | source=" << (config.synthetic.enabled ? "synthetic" : "device")
         << " | device=" << config.device.host << ':' << config.device.port
         << " | timeout_ms=" << config.device.timeout.count()
         << " | cycle_s=" << config.cycle_seconds
         << " | publish=" << config.publish.address
         << " | start_active=" << (config.publish.start_active ? "true" : "false")
         << " | verbose=" << (config.verbose ? "true" : "false")
         << " | inject_zero=" << (config.synthetic.inject_zero ? "true" : "false")
         << " | redis=";
  if (!config.redis.enabled) {
    output << "disabled";
  } else if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  output << " | control_stdin=" << (config.control.stdin_enabled ? "true" : "false");
  return output.str();
}

BridgeOptions bridge_options_for(const BridgeConfig& config) {
  BridgeOptions options{};
  options.start_active = config.publish.start_active;
  options.verbose = config.verbose;
  options.echo_stream = config.control.stdin_enabled ? stderr : stdout;
  return options;
}

}  // namespace dl100_bridge::core
