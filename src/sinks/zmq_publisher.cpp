#include "sinks/zmq_publisher.hpp"

#include <cerrno>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <zmq.h>

namespace dl100_bridge::sinks {
namespace {

constexpr const char* kZapEndpoint = "inproc://zeromq.zap.01";
constexpr long kZapPollTimeoutMs = 100;

bool set_int_option(void* socket, const int option, const int value, const char* name) {
  if (zmq_setsockopt(socket, option, &value, sizeof(value)) != 0) {
    std::cerr << "[zmq] setsockopt " << name << " failed: " << zmq_strerror(zmq_errno()) << '\n';
    return false;
  }
  return true;
}

bool send_frames(void* socket, const std::vector<std::string>& frames) {
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const int flags = (i + 1 < frames.size()) ? ZMQ_SNDMORE : 0;
    if (zmq_send(socket, frames[i].data(), frames[i].size(), flags) < 0) {
      return false;
    }
  }
  return true;
}

// Reads one message part. `more` is only updated when a part was read.
bool receive_part(void* socket, std::string& part, bool& more, const int flags) {
  zmq_msg_t message;
  zmq_msg_init(&message);
  if (zmq_msg_recv(&message, socket, flags) < 0) {
    zmq_msg_close(&message);
    return false;
  }
  part.assign(static_cast<const char*>(zmq_msg_data(&message)), zmq_msg_size(&message));
  more = zmq_msg_more(&message) != 0;
  zmq_msg_close(&message);
  return true;
}

}  // namespace

void ZmqPublisher::ContextDeleter::operator()(void* context) const {
  if (context != nullptr) {
    zmq_ctx_term(context);
  }
}

void ZmqPublisher::SocketDeleter::operator()(void* socket) const {
  if (socket != nullptr) {
    zmq_close(socket);
  }
}

ZmqPublisher::ZmqPublisher(ZmqPublisherOptions options) : options_(std::move(options)) {}

ZmqPublisher::~ZmqPublisher() { close(); }

model::Status ZmqPublisher::bind(const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || socket_ != nullptr) {
    std::cerr << "[zmq] bind " << address << " refused: publisher already bound or closed\n";
    return model::Status::BIND_FAILURE;
  }

  context_.reset(zmq_ctx_new());
  if (context_ == nullptr) {
    std::cerr << "[zmq] context creation failed: " << zmq_strerror(zmq_errno()) << '\n';
    return model::Status::BIND_FAILURE;
  }

  socket_.reset(zmq_socket(context_.get(), ZMQ_PUB));
  if (socket_ == nullptr || !configure_socket()) {
    std::cerr << "[zmq] PUB socket setup failed\n";
    socket_.reset();
    context_.reset();
    return model::Status::BIND_FAILURE;
  }

  if (options_.credentials.enabled() && !start_authenticator()) {
    socket_.reset();
    context_.reset();
    return model::Status::BIND_FAILURE;
  }

  if (zmq_bind(socket_.get(), address.c_str()) != 0) {
    std::cerr << "[zmq] bind " << address << " failed: " << zmq_strerror(zmq_errno()) << '\n';
    zap_running_.store(false, std::memory_order_release);
    if (zap_worker_.joinable()) {
      zap_worker_.join();
    }
    zap_socket_.reset();
    socket_.reset();
    context_.reset();
    return model::Status::BIND_FAILURE;
  }

  address_ = address;
  std::cerr << "[zmq] publishing on " << address_
            << (options_.credentials.enabled() ? " (PLAIN auth)" : " (unauthenticated)") << '\n';
  return model::Status::OK;
}

bool ZmqPublisher::send(const codec::Frame& frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || socket_ == nullptr) {
    return false;
  }

  const int rc = zmq_send(socket_.get(), frame.data(), frame.size(), ZMQ_DONTWAIT);
  if (rc < 0) {
    if (send_was_ok_) {
      const int error = zmq_errno();
      std::cerr << "[zmq] send dropped: " << (error == EAGAIN ? "would block" : zmq_strerror(error)) << '\n';
      send_was_ok_ = false;
    }
    return false;
  }

  if (!send_was_ok_) {
    std::cerr << "[zmq] send recovered\n";
    send_was_ok_ = true;
  }
  return static_cast<std::size_t>(rc) == frame.size();
}

void ZmqPublisher::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;

  zap_running_.store(false, std::memory_order_release);
  if (zap_worker_.joinable()) {
    zap_worker_.join();
  }
  zap_socket_.reset();

  const bool was_bound = socket_ != nullptr;
  socket_.reset();
  context_.reset();
  if (was_bound) {
    std::cerr << "[zmq] closed " << address_ << '\n';
  }
}

bool ZmqPublisher::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !closed_ && socket_ != nullptr;
}

bool ZmqPublisher::configure_socket() {
  if (!set_int_option(socket_.get(), ZMQ_LINGER, options_.linger_ms, "ZMQ_LINGER")) {
    return false;
  }
  if (options_.conflate && !set_int_option(socket_.get(), ZMQ_CONFLATE, 1, "ZMQ_CONFLATE")) {
    return false;
  }
  if (options_.credentials.enabled()) {
    if (!set_int_option(socket_.get(), ZMQ_PLAIN_SERVER, 1, "ZMQ_PLAIN_SERVER")) {
      return false;
    }
    if (zmq_setsockopt(socket_.get(), ZMQ_ZAP_DOMAIN, options_.zap_domain.data(), options_.zap_domain.size()) !=
        0) {
      std::cerr << "[zmq] setsockopt ZMQ_ZAP_DOMAIN failed: " << zmq_strerror(zmq_errno()) << '\n';
      return false;
    }
  }
  return true;
}

bool ZmqPublisher::start_authenticator() {
  zap_socket_.reset(zmq_socket(context_.get(), ZMQ_REP));
  if (zap_socket_ == nullptr) {
    std::cerr << "[zmq] ZAP socket creation failed: " << zmq_strerror(zmq_errno()) << '\n';
    return false;
  }
  if (!set_int_option(zap_socket_.get(), ZMQ_LINGER, 0, "ZMQ_LINGER") ||
      zmq_bind(zap_socket_.get(), kZapEndpoint) != 0) {
    std::cerr << "[zmq] ZAP handler bind failed: " << zmq_strerror(zmq_errno()) << '\n';
    zap_socket_.reset();
    return false;
  }

  zap_running_.store(true, std::memory_order_release);
  zap_worker_ = std::thread(&ZmqPublisher::run_authenticator, this);
  return true;
}

void ZmqPublisher::run_authenticator() {
  while (zap_running_.load(std::memory_order_acquire)) {
    zmq_pollitem_t item{};
    item.socket = zap_socket_.get();
    item.events = ZMQ_POLLIN;
    const int rc = zmq_poll(&item, 1, kZapPollTimeoutMs);
    if (rc < 0) {
      if (zmq_errno() == ETERM) {
        return;
      }
      continue;
    }
    if (rc > 0 && (item.revents & ZMQ_POLLIN) != 0) {
      (void)handle_zap_request();
    }
  }
}

// ZAP 1.0 request: version, request id, domain, address, identity, mechanism, credentials...
// Every request that was at least partly read gets a reply, otherwise the REP socket
// stays in its send state and no later subscriber can authenticate.
bool ZmqPublisher::handle_zap_request() {
  std::vector<std::string> request;
  bool more = true;
  bool complete = true;
  while (more) {
    std::string part;
    if (!receive_part(zap_socket_.get(), part, more, ZMQ_DONTWAIT)) {
      complete = false;
      break;
    }
    request.push_back(std::move(part));
  }

  if (request.empty()) {
    return false;
  }

  if (!complete) {
    // Multipart messages arrive whole, so the remaining parts are already queued.
    std::string discarded;
    while (more) {
      if (!receive_part(zap_socket_.get(), discarded, more, 0)) {
        std::cerr << "[zmq] could not drain partial ZAP request: " << zmq_strerror(zmq_errno()) << '\n';
        return false;
      }
    }
  }

  const std::string request_id = request.size() > 1 ? request[1] : std::string{};
  if (!complete || request.size() < 6) {
    auth_rejections_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[zmq] malformed ZAP request (" << request.size() << " parts read)\n";
    return send_zap_reply(request_id, "500", "malformed request", {});
  }

  const std::string& peer_address = request[3];
  const std::string& mechanism = request[5];

  const bool accepted = request[0] == "1.0" && mechanism == "PLAIN" && request.size() >= 8 &&
                        request[6] == options_.credentials.username && request[7] == options_.credentials.password;
  if (!accepted) {
    auth_rejections_.fetch_add(1, std::memory_order_relaxed);
    std::cerr << "[zmq] rejected subscriber " << peer_address << " (" << mechanism << ")\n";
    return send_zap_reply(request_id, "400", "invalid credentials", {});
  }
  return send_zap_reply(request_id, "200", "OK", options_.credentials.username);
}

bool ZmqPublisher::send_zap_reply(const std::string& request_id, const std::string& status_code,
                                  const std::string& status_text, const std::string& user_id) {
  return send_frames(zap_socket_.get(), {"1.0", request_id, status_code, status_text, user_id, std::string{}});
}

}  // namespace dl100_bridge::sinks
