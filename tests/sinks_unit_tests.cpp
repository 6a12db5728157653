#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>
#include <zmq.h>

#include "codec/frame_codec.hpp"
#include "model/bridge_health.hpp"
#include "model/record.hpp"
#include "model/status.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "sinks/zmq_publisher.hpp"

using dl100_bridge::codec::encode;
using dl100_bridge::model::BridgeHealth;
using dl100_bridge::model::Record;
using dl100_bridge::model::Status;
using dl100_bridge::sinks::RedisTsOptions;
using dl100_bridge::sinks::RedisTsSink;
using dl100_bridge::sinks::StdoutDebugSink;
using dl100_bridge::sinks::ZmqPublisher;
using dl100_bridge::sinks::ZmqPublisherOptions;

namespace {

struct MockSocket {
  int type;
};

struct ZmqMockState {
  std::mutex mutex;
  int context_token{0};
  int contexts_created{0};
  int contexts_terminated{0};
  int sockets_created{0};
  int sockets_closed{0};
  std::vector<std::pair<int, int>> int_options{};
  std::string zap_domain{};
  std::vector<std::string> bind_addresses{};
  std::string fail_bind_address{};
  int last_errno{0};

  bool fail_sends{false};
  std::vector<std::pair<std::size_t, int>> pub_sends{};

  std::deque<std::vector<std::string>> zap_requests{};
  std::vector<std::string> current_request{};
  std::size_t current_index{0};
  std::string current_part{};
  bool current_more{false};
  int fail_recv_at_part{-1};
  std::vector<std::string> building_reply{};
  std::vector<std::vector<std::string>> zap_replies{};

  void reset() {
    std::lock_guard<std::mutex> lock(mutex);
    contexts_created = 0;
    contexts_terminated = 0;
    sockets_created = 0;
    sockets_closed = 0;
    int_options.clear();
    zap_domain.clear();
    bind_addresses.clear();
    fail_bind_address.clear();
    last_errno = 0;
    fail_sends = false;
    pub_sends.clear();
    zap_requests.clear();
    current_request.clear();
    current_index = 0;
    current_part.clear();
    current_more = false;
    fail_recv_at_part = -1;
    building_reply.clear();
    zap_replies.clear();
  }

  bool has_option(const int option, const int value) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& [name, set_value] : int_options) {
      if (name == option && set_value == value) {
        return true;
      }
    }
    return false;
  }
};

ZmqMockState g_zmq_mock{};

struct RedisMockState {
  std::vector<std::string> last_argv{};
  std::vector<std::string> created_keys{};
  int madd_calls{0};
  bool timeseries_missing{false};
};

RedisMockState g_redis_mock{};

char g_unknown_command[] = "ERR unknown command 'TS.CREATE'";

}  // namespace

extern "C" {

void* zmq_ctx_new(void) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  ++g_zmq_mock.contexts_created;
  return &g_zmq_mock.context_token;
}

int zmq_ctx_term(void*) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  ++g_zmq_mock.contexts_terminated;
  return 0;
}

void* zmq_socket(void*, int type) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  ++g_zmq_mock.sockets_created;
  return new MockSocket{type};
}

int zmq_close(void* socket) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  ++g_zmq_mock.sockets_closed;
  delete static_cast<MockSocket*>(socket);
  return 0;
}

int zmq_setsockopt(void*, int option, const void* optval, size_t optvallen) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  if (option == ZMQ_ZAP_DOMAIN) {
    g_zmq_mock.zap_domain.assign(static_cast<const char*>(optval), optvallen);
  } else if (optvallen == sizeof(int)) {
    int value = 0;
    std::memcpy(&value, optval, sizeof(value));
    g_zmq_mock.int_options.emplace_back(option, value);
  }
  return 0;
}

int zmq_bind(void*, const char* addr) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  if (g_zmq_mock.fail_bind_address == addr) {
    g_zmq_mock.last_errno = EADDRINUSE;
    return -1;
  }
  g_zmq_mock.bind_addresses.emplace_back(addr);
  return 0;
}

int zmq_send(void* socket, const void* buf, size_t len, int flags) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  if (static_cast<MockSocket*>(socket)->type == ZMQ_REP) {
    g_zmq_mock.building_reply.emplace_back(static_cast<const char*>(buf), len);
    if ((flags & ZMQ_SNDMORE) == 0) {
      g_zmq_mock.zap_replies.push_back(std::move(g_zmq_mock.building_reply));
      g_zmq_mock.building_reply.clear();
    }
    return static_cast<int>(len);
  }

  if (g_zmq_mock.fail_sends) {
    g_zmq_mock.last_errno = EAGAIN;
    return -1;
  }
  g_zmq_mock.pub_sends.emplace_back(len, flags);
  return static_cast<int>(len);
}

int zmq_errno(void) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  return g_zmq_mock.last_errno;
}

const char* zmq_strerror(int) { return "mock zmq error"; }

int zmq_poll(zmq_pollitem_t* items, int, long) {
  {
    std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
    if (!g_zmq_mock.zap_requests.empty() || !g_zmq_mock.current_request.empty()) {
      items[0].revents = ZMQ_POLLIN;
      return 1;
    }
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(1));
  items[0].revents = 0;
  return 0;
}

int zmq_msg_init(zmq_msg_t*) { return 0; }

int zmq_msg_recv(zmq_msg_t*, void*, int) {
  std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
  if (g_zmq_mock.current_request.empty()) {
    if (g_zmq_mock.zap_requests.empty()) {
      g_zmq_mock.last_errno = EAGAIN;
      return -1;
    }
    g_zmq_mock.current_request = std::move(g_zmq_mock.zap_requests.front());
    g_zmq_mock.zap_requests.pop_front();
    g_zmq_mock.current_index = 0;
  }

  if (static_cast<int>(g_zmq_mock.current_index) == g_zmq_mock.fail_recv_at_part) {
    g_zmq_mock.fail_recv_at_part = -1;
    g_zmq_mock.last_errno = EAGAIN;
    return -1;
  }

  g_zmq_mock.current_part = g_zmq_mock.current_request[g_zmq_mock.current_index++];
  g_zmq_mock.current_more = g_zmq_mock.current_index < g_zmq_mock.current_request.size();
  if (!g_zmq_mock.current_more) {
    g_zmq_mock.current_request.clear();
  }
  return static_cast<int>(g_zmq_mock.current_part.size());
}

void* zmq_msg_data(zmq_msg_t*) { return g_zmq_mock.current_part.data(); }

size_t zmq_msg_size(const zmq_msg_t*) { return g_zmq_mock.current_part.size(); }

int zmq_msg_more(const zmq_msg_t*) { return g_zmq_mock.current_more ? 1 : 0; }

int zmq_msg_close(zmq_msg_t*) { return 0; }

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  const std::string command = argv[0];
  if (command == "TS.CREATE") {
    if (g_redis_mock.timeseries_missing) {
      reply->type = REDIS_REPLY_ERROR;
      reply->str = g_unknown_command;
      return reply;
    }
    g_redis_mock.created_keys.emplace_back(argv[1]);
    reply->type = REDIS_REPLY_STATUS;
    return reply;
  }

  g_redis_mock.madd_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  reply->type = REDIS_REPLY_ARRAY;
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool wait_for_zap_replies(const std::size_t count) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (std::chrono::steady_clock::now() < deadline) {
    {
      std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
      if (g_zmq_mock.zap_replies.size() >= count) {
        return true;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return false;
}

const std::string* find_metric_value(const std::string& key) {
  for (std::size_t i = 1; i + 2 < g_redis_mock.last_argv.size(); i += 3) {
    if (g_redis_mock.last_argv[i] == key) {
      return &g_redis_mock.last_argv[i + 2];
    }
  }
  return nullptr;
}

int test_publisher_binds_conflating_pub_socket() {
  g_zmq_mock.reset();
  ZmqPublisher publisher;

  if (publisher.bind("tcp://*:5559") != Status::OK || !publisher.is_open()) {
    return fail("test_publisher_binds_conflating_pub_socket", "bind should succeed");
  }
  if (!g_zmq_mock.has_option(ZMQ_CONFLATE, 1) || !g_zmq_mock.has_option(ZMQ_LINGER, 0)) {
    return fail("test_publisher_binds_conflating_pub_socket", "CONFLATE and LINGER must be set");
  }
  if (g_zmq_mock.has_option(ZMQ_PLAIN_SERVER, 1) || g_zmq_mock.sockets_created != 1) {
    return fail("test_publisher_binds_conflating_pub_socket", "open channel must not start PLAIN auth");
  }
  if (g_zmq_mock.bind_addresses.size() != 1 || g_zmq_mock.bind_addresses.front() != "tcp://*:5559" ||
      publisher.address() != "tcp://*:5559") {
    return fail("test_publisher_binds_conflating_pub_socket", "bind address mismatch");
  }

  if (publisher.bind("tcp://*:5560") != Status::BIND_FAILURE) {
    return fail("test_publisher_binds_conflating_pub_socket", "rebinding must be refused");
  }

  return 0;
}

int test_publisher_send_is_non_blocking() {
  g_zmq_mock.reset();
  ZmqPublisher publisher;
  (void)publisher.bind("tcp://*:5559");

  const auto frame = encode(Record{1, 2, 3});
  if (!publisher.send(frame)) {
    return fail("test_publisher_send_is_non_blocking", "send should succeed");
  }
  if (g_zmq_mock.pub_sends.size() != 1 || g_zmq_mock.pub_sends.front().first != 16 ||
      g_zmq_mock.pub_sends.front().second != ZMQ_DONTWAIT) {
    return fail("test_publisher_send_is_non_blocking", "frame must be 16 bytes sent with ZMQ_DONTWAIT");
  }

  g_zmq_mock.fail_sends = true;
  if (publisher.send(frame) || publisher.send(frame)) {
    return fail("test_publisher_send_is_non_blocking", "would-block send should report a drop");
  }
  g_zmq_mock.fail_sends = false;
  if (!publisher.send(frame)) {
    return fail("test_publisher_send_is_non_blocking", "send should recover");
  }

  return 0;
}

int test_publisher_close_is_idempotent() {
  g_zmq_mock.reset();
  {
    ZmqPublisher publisher;
    (void)publisher.bind("tcp://*:5559");
    publisher.close();
    publisher.close();

    if (publisher.is_open() || publisher.send(encode(Record{1, 1, 1}))) {
      return fail("test_publisher_close_is_idempotent", "closed publisher must not send");
    }
    if (publisher.bind("tcp://*:5559") != Status::BIND_FAILURE) {
      return fail("test_publisher_close_is_idempotent", "closed publisher must not rebind");
    }
  }

  if (g_zmq_mock.sockets_closed != 1 || g_zmq_mock.contexts_terminated != 1) {
    return fail("test_publisher_close_is_idempotent", "socket and context should be released exactly once");
  }

  return 0;
}

int test_publisher_bind_failure() {
  g_zmq_mock.reset();
  g_zmq_mock.fail_bind_address = "tcp://*:5559";
  ZmqPublisher publisher;

  if (publisher.bind("tcp://*:5559") != Status::BIND_FAILURE) {
    return fail("test_publisher_bind_failure", "address in use should map to bind failure");
  }
  if (publisher.is_open() || g_zmq_mock.sockets_closed != 1 || g_zmq_mock.contexts_terminated != 1) {
    return fail("test_publisher_bind_failure", "failed bind must release the socket and context");
  }

  return 0;
}

int test_publisher_plain_auth_checks_credentials() {
  g_zmq_mock.reset();
  {
    std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
    g_zmq_mock.zap_requests.push_back({"1.0", "req-1", "dl100", "10.0.0.9", "", "PLAIN", "reader", "s3cret"});
    g_zmq_mock.zap_requests.push_back({"1.0", "req-2", "dl100", "10.0.0.10", "", "PLAIN", "reader", "wrong"});
  }

  ZmqPublisherOptions options{};
  options.credentials.username = "reader";
  options.credentials.password = "s3cret";
  ZmqPublisher publisher(options);

  if (publisher.bind("tcp://*:5559") != Status::OK) {
    return fail("test_publisher_plain_auth_checks_credentials", "bind with credentials should succeed");
  }
  if (!g_zmq_mock.has_option(ZMQ_PLAIN_SERVER, 1) || g_zmq_mock.zap_domain != "dl100") {
    return fail("test_publisher_plain_auth_checks_credentials", "PLAIN server and ZAP domain must be set");
  }
  {
    std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
    if (g_zmq_mock.bind_addresses.size() != 2 || g_zmq_mock.bind_addresses[0] != "inproc://zeromq.zap.01") {
      return fail("test_publisher_plain_auth_checks_credentials", "ZAP handler must bind before the publisher");
    }
  }

  if (!wait_for_zap_replies(2)) {
    return fail("test_publisher_plain_auth_checks_credentials", "ZAP handler did not answer");
  }
  publisher.close();

  const auto& accepted = g_zmq_mock.zap_replies[0];
  const auto& rejected = g_zmq_mock.zap_replies[1];
  if (accepted.size() != 6 || accepted[1] != "req-1" || accepted[2] != "200" || accepted[4] != "reader") {
    return fail("test_publisher_plain_auth_checks_credentials", "valid credentials should be accepted");
  }
  if (rejected.size() != 6 || rejected[1] != "req-2" || rejected[2] != "400") {
    return fail("test_publisher_plain_auth_checks_credentials", "wrong password should be rejected");
  }
  if (publisher.auth_rejections() != 1) {
    return fail("test_publisher_plain_auth_checks_credentials", "rejection should be counted");
  }
  if (g_zmq_mock.sockets_closed != 2) {
    return fail("test_publisher_plain_auth_checks_credentials", "ZAP and PUB sockets should both close");
  }

  return 0;
}

int test_publisher_answers_malformed_zap_requests() {
  g_zmq_mock.reset();
  {
    std::lock_guard<std::mutex> lock(g_zmq_mock.mutex);
    g_zmq_mock.fail_recv_at_part = 4;
    g_zmq_mock.zap_requests.push_back({"1.0", "req-3", "dl100", "10.0.0.11", "", "PLAIN", "reader", "s3cret"});
    g_zmq_mock.zap_requests.push_back({"1.0", "req-4", "dl100"});
    g_zmq_mock.zap_requests.push_back({"1.0", "req-5", "dl100", "10.0.0.12", "", "PLAIN", "reader", "s3cret"});
  }

  ZmqPublisherOptions options{};
  options.credentials.username = "reader";
  options.credentials.password = "s3cret";
  ZmqPublisher publisher(options);
  if (publisher.bind("tcp://*:5559") != Status::OK) {
    return fail("test_publisher_answers_malformed_zap_requests", "bind with credentials should succeed");
  }

  if (!wait_for_zap_replies(3)) {
    return fail("test_publisher_answers_malformed_zap_requests", "every ZAP request needs a reply");
  }
  publisher.close();

  const auto& interrupted = g_zmq_mock.zap_replies[0];
  const auto& truncated = g_zmq_mock.zap_replies[1];
  const auto& valid = g_zmq_mock.zap_replies[2];
  if (interrupted.size() != 6 || interrupted[1] != "req-3" || interrupted[2] != "500") {
    return fail("test_publisher_answers_malformed_zap_requests", "interrupted request should get a 500 reply");
  }
  if (truncated.size() != 6 || truncated[1] != "req-4" || truncated[2] != "500") {
    return fail("test_publisher_answers_malformed_zap_requests", "short request should get a 500 reply");
  }
  if (valid.size() != 6 || valid[1] != "req-5" || valid[2] != "200") {
    return fail("test_publisher_answers_malformed_zap_requests", "handler should keep authenticating afterwards");
  }
  if (publisher.auth_rejections() != 2) {
    return fail("test_publisher_answers_malformed_zap_requests", "malformed requests count as rejections");
  }

  return 0;
}

int test_redis_sink_publishes_bridge_health() {
  g_redis_mock = {};
  RedisTsOptions options{};
  options.key_prefix = "dl100:test";
  RedisTsSink sink(options);

  BridgeHealth health{};
  health.heartbeat_ms = 1'700'000'000'000ULL;
  health.frames_sent = 42;
  health.frames_suppressed = 7;
  health.gate_active = true;
  health.has_last_record = true;
  health.last_distance = 2480;
  health.last_velocity = -60;

  if (!sink.publish(health)) {
    return fail("test_redis_sink_publishes_bridge_health", "publish should succeed with mock redis");
  }
  if (g_redis_mock.madd_calls != 1 || g_redis_mock.last_argv.front() != "TS.MADD") {
    return fail("test_redis_sink_publishes_bridge_health", "expected one TS.MADD call");
  }
  if (g_redis_mock.created_keys.size() != 13 || g_redis_mock.created_keys.front() != "dl100:test:bridge:heartbeat") {
    return fail("test_redis_sink_publishes_bridge_health", "every series should be created once");
  }

  const auto* sent = find_metric_value("dl100:test:bridge:sent");
  const auto* gate = find_metric_value("dl100:test:bridge:gate_active");
  const auto* distance = find_metric_value("dl100:test:record:distance");
  if (sent == nullptr || sent->rfind("42", 0) != 0 || gate == nullptr || gate->rfind("1", 0) != 0 ||
      distance == nullptr || distance->rfind("2480", 0) != 0) {
    return fail("test_redis_sink_publishes_bridge_health", "TS.MADD payload mismatch");
  }

  health.has_last_record = false;
  if (!sink.publish(health) || find_metric_value("dl100:test:record:velocity") != nullptr) {
    return fail("test_redis_sink_publishes_bridge_health", "record series need a published record");
  }
  if (g_redis_mock.created_keys.size() != 13 || g_redis_mock.madd_calls != 2) {
    return fail("test_redis_sink_publishes_bridge_health", "series should not be recreated");
  }

  return 0;
}

int test_redis_sink_disables_without_timeseries() {
  g_redis_mock = {};
  g_redis_mock.timeseries_missing = true;
  RedisTsSink sink(RedisTsOptions{});

  if (sink.check_connectivity() || sink.publish(BridgeHealth{})) {
    return fail("test_redis_sink_disables_without_timeseries", "sink should refuse without RedisTimeSeries");
  }
  if (g_redis_mock.madd_calls != 0 || !g_redis_mock.created_keys.empty()) {
    return fail("test_redis_sink_disables_without_timeseries", "sink should stop talking to redis");
  }

  return 0;
}

int test_stdout_line_format() {
  const std::string line = StdoutDebugSink::format_line(1'700'000'000'123ULL, 2500, -150);
  const std::string expected_prefix = "2023-11-14T22:13:20.123000 - 1700000000.123000,     2500,         -150";

  if (line.size() != StdoutDebugSink::kLineWidth) {
    return fail("test_stdout_line_format", "line must be padded to 80 columns");
  }
  if (line.rfind(expected_prefix, 0) != 0) {
    return fail("test_stdout_line_format", "line format mismatch");
  }

  std::FILE* out = std::tmpfile();
  if (out == nullptr) {
    return fail("test_stdout_line_format", "tmpfile failed");
  }
  StdoutDebugSink sink(out);
  sink.publish(Record{1'700'000'000'123ULL, 2500, -150});

  std::rewind(out);
  char buffer[128]{};
  const std::size_t bytes_read = std::fread(buffer, 1, sizeof(buffer) - 1, out);
  std::fclose(out);
  if (bytes_read != StdoutDebugSink::kLineWidth + 1 || buffer[0] != '\r' || std::string(buffer + 1) != line) {
    return fail("test_stdout_line_format", "published line should be written after a carriage return");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_publisher_binds_conflating_pub_socket(); rc != 0) return rc;
  if (int rc = test_publisher_send_is_non_blocking(); rc != 0) return rc;
  if (int rc = test_publisher_close_is_idempotent(); rc != 0) return rc;
  if (int rc = test_publisher_bind_failure(); rc != 0) return rc;
  if (int rc = test_publisher_plain_auth_checks_credentials(); rc != 0) return rc;
  if (int rc = test_publisher_answers_malformed_zap_requests(); rc != 0) return rc;
  if (int rc = test_redis_sink_publishes_bridge_health(); rc != 0) return rc;
  if (int rc = test_redis_sink_disables_without_timeseries(); rc != 0) return rc;
  if (int rc = test_stdout_line_format(); rc != 0) return rc;

  std::cout << "[PASS] sinks unit tests\n";
  return 0;
}
