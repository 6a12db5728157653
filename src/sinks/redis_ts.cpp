#include "sinks/redis_ts.hpp"

#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>

#include <hiredis/hiredis.h>

#include "core/timestamp.hpp"

namespace dl100_bridge::sinks {
namespace {

struct MetricField {
  const char* suffix;
  double (*read)(const model::BridgeHealth&);
  // Only written once a record has been published.
  bool needs_record;
};

constexpr MetricField kMetrics[] = {
    {"bridge:heartbeat", [](const model::BridgeHealth& h) { return static_cast<double>(h.heartbeat_ms); }, false},
    {"bridge:readings", [](const model::BridgeHealth& h) { return static_cast<double>(h.readings_observed); }, false},
    {"bridge:records", [](const model::BridgeHealth& h) { return static_cast<double>(h.records_completed); }, false},
    {"bridge:sent", [](const model::BridgeHealth& h) { return static_cast<double>(h.frames_sent); }, false},
    {"bridge:suppressed", [](const model::BridgeHealth& h) { return static_cast<double>(h.frames_suppressed); }, false},
    {"bridge:dropped", [](const model::BridgeHealth& h) { return static_cast<double>(h.frames_dropped); }, false},
    {"bridge:unknown_attributes",
     [](const model::BridgeHealth& h) { return static_cast<double>(h.unknown_attributes); }, false},
    {"bridge:malformed", [](const model::BridgeHealth& h) { return static_cast<double>(h.malformed_readings); }, false},
    {"bridge:poll_cycles", [](const model::BridgeHealth& h) { return static_cast<double>(h.poll_cycles); }, false},
    {"bridge:poll_timeouts", [](const model::BridgeHealth& h) { return static_cast<double>(h.poll_timeouts); }, false},
    {"bridge:gate_active", [](const model::BridgeHealth& h) { return h.gate_active ? 1.0 : 0.0; }, false},
    {"record:distance", [](const model::BridgeHealth& h) { return static_cast<double>(h.last_distance); }, true},
    {"record:velocity", [](const model::BridgeHealth& h) { return static_cast<double>(h.last_velocity); }, true},
};

constexpr std::size_t kMetricCount = sizeof(kMetrics) / sizeof(kMetrics[0]);

bool is_error(const redisReply* reply) { return reply->type == REDIS_REPLY_ERROR; }

bool error_contains(const redisReply* reply, const char* needle) {
  return is_error(reply) && reply->str != nullptr && std::strstr(reply->str, needle) != nullptr;
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  args_.reserve(1 + kMetricCount * 3);
  argv_.reserve(args_.capacity());
  argv_len_.reserve(args_.capacity());
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisTsSink::ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

std::string RedisTsSink::describe_address() const {
  if (!options_.unix_socket.empty()) {
    return "unix://" + options_.unix_socket;
  }
  return options_.host + ":" + std::to_string(options_.port);
}

bool RedisTsSink::publish(const model::BridgeHealth& health) {
  if (!ensure_connected()) {
    return false;
  }
  if (send_samples(health)) {
    return true;
  }

  // One retry on a fresh connection; the next interval retries again.
  context_.reset();
  return ensure_connected() && send_samples(health);
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  if (!connect() || !prepare_session() || !create_series()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::connect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = options_.unix_socket.empty()
                          ? redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout)
                          : redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  context_.reset(raw);
  if (raw == nullptr) {
    std::cerr << "[redis] connect to " << describe_address() << " failed: out of memory\n";
    return false;
  }
  if (raw->err != REDIS_OK) {
    std::cerr << "[redis] connect to " << describe_address() << " failed: " << raw->errstr << '\n';
    return false;
  }
  return true;
}

bool RedisTsSink::prepare_session() {
  if (!options_.password.empty()) {
    stage({"AUTH", options_.password});
    const auto reply = run_staged();
    if (reply == nullptr || is_error(reply.get())) {
      std::cerr << "[redis] AUTH rejected by " << describe_address() << '\n';
      return false;
    }
  }

  if (options_.db != 0) {
    stage({"SELECT", std::to_string(options_.db)});
    const auto reply = run_staged();
    if (reply == nullptr || is_error(reply.get())) {
      std::cerr << "[redis] SELECT " << options_.db << " failed\n";
      return false;
    }
  }
  return true;
}

bool RedisTsSink::create_series() {
  if (series_created_) {
    return true;
  }

  for (const auto& metric : kMetrics) {
    const std::string key = options_.key_prefix + ":" + metric.suffix;
    stage({"TS.CREATE", key, "DUPLICATE_POLICY", "LAST", "LABELS", "source", "dl100-bridge", "series",
           metric.suffix});
    const auto reply = run_staged();
    if (reply == nullptr) {
      return false;
    }
    if (error_contains(reply.get(), "unknown command")) {
      std::cerr << "[redis] RedisTimeSeries module not loaded on " << describe_address()
                << "; health metrics disabled\n";
      timeseries_available_ = false;
      return false;
    }
    if (is_error(reply.get()) && !error_contains(reply.get(), "already exists")) {
      std::cerr << "[redis] TS.CREATE " << key << " failed: " << (reply->str != nullptr ? reply->str : "?") << '\n';
      return false;
    }
  }

  series_created_ = true;
  return true;
}

bool RedisTsSink::send_samples(const model::BridgeHealth& health) {
  const std::string timestamp = std::to_string(core::unix_timestamp_now_ms());

  args_.clear();
  args_.emplace_back("TS.MADD");
  for (const auto& metric : kMetrics) {
    if (metric.needs_record && !health.has_last_record) {
      continue;
    }
    args_.emplace_back(options_.key_prefix + ":" + metric.suffix);
    args_.push_back(timestamp);
    args_.emplace_back(std::to_string(metric.read(health)));
  }

  const auto reply = run_staged();
  return reply != nullptr && !is_error(reply.get());
}

void RedisTsSink::stage(std::initializer_list<std::string> args) {
  args_.assign(args.begin(), args.end());
}

RedisTsSink::ReplyPtr RedisTsSink::run_staged() {
  argv_.clear();
  argv_len_.clear();
  for (const auto& arg : args_) {
    argv_.push_back(arg.c_str());
    argv_len_.push_back(arg.size());
  }
  return ReplyPtr(static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv_.size()), argv_.data(), argv_len_.data())));
}

}  // namespace dl100_bridge::sinks
