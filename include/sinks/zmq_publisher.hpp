#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "sinks/publish_channel.hpp"

namespace dl100_bridge::sinks {

struct ZmqPublisherOptions {
  PublishCredentials credentials{};
  // Keep only the newest unsent frame per subscriber.
  bool conflate{true};
  int linger_ms{0};
  std::string zap_domain{"dl100"};
};

// ZeroMQ PUB socket. With credentials set the socket runs as a PLAIN server and a ZAP
// handler thread checks every connecting subscriber against them.
class ZmqPublisher final : public PublishChannel {
 public:
  explicit ZmqPublisher(ZmqPublisherOptions options = {});
  ~ZmqPublisher() override;

  ZmqPublisher(const ZmqPublisher&) = delete;
  ZmqPublisher& operator=(const ZmqPublisher&) = delete;

  model::Status bind(const std::string& address) override;
  bool send(const codec::Frame& frame) override;
  void close() override;
  bool is_open() const override;

  [[nodiscard]] const std::string& address() const noexcept { return address_; }
  [[nodiscard]] std::uint64_t auth_rejections() const noexcept {
    return auth_rejections_.load(std::memory_order_relaxed);
  }

 private:
  struct ContextDeleter {
    void operator()(void* context) const;
  };
  struct SocketDeleter {
    void operator()(void* socket) const;
  };
  using ContextPtr = std::unique_ptr<void, ContextDeleter>;
  using SocketPtr = std::unique_ptr<void, SocketDeleter>;

  bool configure_socket();
  bool start_authenticator();
  void run_authenticator();
  bool handle_zap_request();
  bool send_zap_reply(const std::string& request_id, const std::string& status_code, const std::string& status_text,
                      const std::string& user_id);

  ZmqPublisherOptions options_;
  std::string address_{};
  ContextPtr context_;
  SocketPtr socket_;
  SocketPtr zap_socket_;
  std::thread zap_worker_;
  std::atomic<bool> zap_running_{false};
  std::atomic<std::uint64_t> auth_rejections_{0};
  mutable std::mutex mutex_;
  bool closed_{false};
  bool send_was_ok_{true};
};

}  // namespace dl100_bridge::sinks
