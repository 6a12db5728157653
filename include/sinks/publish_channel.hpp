#pragma once

#include <string>

#include "codec/frame_codec.hpp"
#include "model/status.hpp"

namespace dl100_bridge::sinks {

// PLAIN username/password applied at bind time. Empty means an open channel.
struct PublishCredentials {
  std::string username{};
  std::string password{};

  [[nodiscard]] bool enabled() const noexcept { return !username.empty() && !password.empty(); }
};

// Best-effort outbound channel. send() never blocks; a frame the channel cannot take
// right now is dropped and reported as false. close() may be called any number of times.
class PublishChannel {
 public:
  virtual ~PublishChannel() = default;

  virtual model::Status bind(const std::string& address) = 0;
  virtual bool send(const codec::Frame& frame) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

}  // namespace dl100_bridge::sinks
