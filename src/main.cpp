#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include "control/control_server.hpp"
#include "core/bridge.hpp"
#include "core/config.hpp"
#include "core/cycle_clock.hpp"
#include "poll/polling_engine.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/zmq_publisher.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_toggle_requests = 0;

void handle_shutdown_signal(int /*signal*/) { g_shutdown_requested = 1; }

void handle_toggle_signal(int /*signal*/) { g_toggle_requests = g_toggle_requests + 1; }

void print_usage(const char* program) {
  std::cerr << "usage: " << program << " [config.yaml] [--key=value ...]\n"
            << "  --dl100_ip=HOST  --dl100_port=PORT  --timeout_ms=MS  --zmq_port=PORT  --bind=ENDPOINT\n"
            << "  --cycle=SECONDS  --mode=single|multi  --verbose=BOOL  --synthetic  --inject_zero\n"
            << "  --redis=ADDRESS  --control\n"
            << "signals: SIGUSR1 toggles publishing, SIGINT/SIGTERM stop\n";
}

dl100_bridge::core::BridgeConfig load_config(int argc, char** argv) {
  dl100_bridge::core::BridgeConfig config{};
  int first_flag = 1;
  if (argc > 1 && std::string(argv[1]).rfind("--", 0) != 0) {
    config = dl100_bridge::core::load_bridge_config(argv[1]);
    first_flag = 2;
  }

  for (int i = first_flag; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0) {
      throw std::runtime_error("unexpected argument: " + arg);
    }
    const auto eq = arg.find('=');
    const std::string flag = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
    const std::string value = eq == std::string::npos ? "true" : arg.substr(eq + 1);
    dl100_bridge::core::apply_config_override(config, dl100_bridge::core::config_key_for_flag(flag), value);
  }
  return config;
}

std::unique_ptr<dl100_bridge::sinks::RedisTsSink> make_health_sink(const dl100_bridge::core::RedisConfig& redis) {
  if (!redis.enabled) {
    return nullptr;
  }

  dl100_bridge::sinks::RedisTsOptions options{};
  options.host = redis.host;
  options.port = redis.port;
  options.unix_socket = redis.unix_socket;
  options.password = redis.password;
  options.db = redis.db;
  options.key_prefix = redis.key_prefix;
  auto sink = std::make_unique<dl100_bridge::sinks::RedisTsSink>(options);

  if (sink->check_connectivity()) {
    std::cerr << "[bridge] redis connectivity confirmed at " << sink->describe_address() << '\n';
  } else {
    std::cerr << "[bridge] redis connectivity check failed at " << sink->describe_address() << '\n';
  }
  return sink;
}

// Hands whatever is readable on stdin to the control server without blocking past `timeout`.
void serve_control_input(dl100_bridge::control::ControlServer& server, bool& stdin_open,
                         const std::chrono::milliseconds timeout) {
  pollfd fd{};
  fd.fd = STDIN_FILENO;
  fd.events = POLLIN;
  if (::poll(&fd, 1, static_cast<int>(timeout.count())) <= 0 || (fd.revents & (POLLIN | POLLHUP)) == 0) {
    return;
  }

  char buffer[512];
  const ssize_t bytes = ::read(STDIN_FILENO, buffer, sizeof(buffer));
  if (bytes <= 0) {
    server.finish(std::cout, std::cerr);
    stdin_open = false;
    std::cerr << "[control] stdin closed; control surface disabled\n";
    return;
  }
  server.feed(std::string_view(buffer, static_cast<std::size_t>(bytes)), std::cout, std::cerr);
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGUSR1, handle_toggle_signal);

  dl100_bridge::core::BridgeConfig config{};
  try {
    config = load_config(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  std::cerr << "[bridge] " << dl100_bridge::core::describe_config(config) << '\n';

  dl100_bridge::sinks::ZmqPublisherOptions publisher_options{};
  publisher_options.credentials = dl100_bridge::core::load_publish_credentials();
  auto publisher = std::make_unique<dl100_bridge::sinks::ZmqPublisher>(publisher_options);
  if (publisher->bind(config.publish.address) != dl100_bridge::model::Status::OK) {
    std::cerr << "[bridge] " << dl100_bridge::model::status_name(dl100_bridge::model::Status::BIND_FAILURE)
              << ": cannot publish on " << config.publish.address << '\n';
    return 1;
  }

  dl100_bridge::core::Bridge bridge{dl100_bridge::core::bridge_options_for(config), std::move(publisher)};

  dl100_bridge::model::Status started = dl100_bridge::model::Status::OK;
  if (config.synthetic.enabled) {
    dl100_bridge::core::SyntheticOptions synthetic{};
    synthetic.cycle_seconds = config.cycle_seconds;
    synthetic.inject_zero = config.synthetic.inject_zero;
    synthetic.zero_every = config.synthetic.zero_every;
    synthetic.seed = config.synthetic.seed;
    started = bridge.start_synthetic(synthetic);
  } else {
    auto reader = dl100_bridge::poll::make_unavailable_reader(config.device.host, config.device.port);
    if (!reader->available()) {
      std::cerr << "[bridge] no EtherNet/IP reader linked for " << reader->endpoint()
                << "; every poll will time out\n";
    }
    dl100_bridge::poll::PollOptions poll_options{};
    poll_options.cycle = dl100_bridge::core::cycle_from_seconds(config.cycle_seconds);
    poll_options.timeout = config.device.timeout;
    started = bridge.start(std::move(reader), poll_options, config.mode);
  }
  if (started != dl100_bridge::model::Status::OK) {
    std::cerr << "[bridge] failed to start: " << dl100_bridge::model::status_name(started) << '\n';
    return 1;
  }

  auto health_sink = make_health_sink(config.redis);
  bool redis_was_ok = true;

  std::unique_ptr<dl100_bridge::control::ControlServer> control{};
  if (config.control.stdin_enabled) {
    control = std::make_unique<dl100_bridge::control::ControlServer>(bridge);
    std::cerr << "[control] JSON-RPC control listening on stdin\n";
  }
  bool stdin_open = true;

  constexpr auto kControlSlice = std::chrono::milliseconds(100);
  auto next_health = std::chrono::steady_clock::now() + config.health_interval;
  std::sig_atomic_t toggles_seen = 0;

  while (g_shutdown_requested == 0) {
    const std::sig_atomic_t toggles = g_toggle_requests;
    while (toggles_seen != toggles) {
      ++toggles_seen;
      const bool active = bridge.toggle_publishing();
      std::cerr << "\n[bridge] publishing " << (active ? "activated" : "deactivated") << '\n';
    }

    if (control != nullptr && stdin_open) {
      serve_control_input(*control, stdin_open, kControlSlice);
      if (control->stop_requested()) {
        break;
      }
    } else {
      std::this_thread::sleep_for(kControlSlice);
    }

    const auto now = std::chrono::steady_clock::now();
    if (health_sink != nullptr && now >= next_health) {
      next_health = now + config.health_interval;
      const bool ok = health_sink->publish(bridge.health());
      if (!ok && redis_was_ok) {
        std::cerr << "\n[redis] health publish failed\n";
        redis_was_ok = false;
      } else if (ok && !redis_was_ok) {
        std::cerr << "\n[redis] health publish recovered\n";
        redis_was_ok = true;
      }
    }
  }

  std::cerr << "\n[bridge] shutdown requested; stopping\n";
  bridge.stop();
  return 0;
}
