#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "model/bridge_health.hpp"

struct redisContext;
struct redisReply;

namespace dl100_bridge::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"dl100:bridge"};
  std::uint32_t connect_timeout_ms{1000};
};

// Bridge health counters to RedisTimeSeries, one TS.MADD per publish().
// Series are created on first connect and labelled source=dl100-bridge.
// A server without the TimeSeries module disables the sink for good.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::BridgeHealth& health);

  [[nodiscard]] std::string describe_address() const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  bool ensure_connected();
  bool connect();
  bool prepare_session();
  bool create_series();
  bool send_samples(const model::BridgeHealth& health);

  // Runs the command staged in args_ and returns the reply, null on a transport error.
  ReplyPtr run_staged();
  void stage(std::initializer_list<std::string> args);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> args_;
  std::vector<const char*> argv_;
  std::vector<std::size_t> argv_len_;
  bool timeseries_available_{true};
  bool series_created_{false};
};

}  // namespace dl100_bridge::sinks
