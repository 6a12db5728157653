#include "core/bridge.hpp"

#include <iostream>
#include <utility>

#include "core/cycle_clock.hpp"
#include "core/timestamp.hpp"
#include "sources/synthetic_source.hpp"

namespace dl100_bridge::core {

Bridge::Bridge(BridgeOptions options, std::unique_ptr<sinks::PublishChannel> channel)
    : options_(options),
      channel_(std::move(channel)),
      stdout_sink_(options.echo_stream),
      gate_(options.start_active) {}

Bridge::~Bridge() { stop(); }

model::Status Bridge::start(std::unique_ptr<poll::AttributeReader> reader, const poll::PollOptions options,
                            const model::PublishMode mode) {
  if (!valid_cycle(options.cycle)) {
    std::cerr << "[bridge] poll cycle below " << kMinCycle.count() << "ns refused\n";
    return model::Status::INVALID_CYCLE;
  }
  if (stopped_.load(std::memory_order_acquire) || started_.exchange(true)) {
    return model::Status::ALREADY_RUNNING;
  }

  mode_ = mode;
  engine_ = std::make_unique<poll::PollingEngine>(std::move(reader));
  const model::Status status = engine_->subscribe(
      poll::dl100_attributes(), options,
      [this](const poll::AttributeId& attribute, const std::vector<std::int32_t>& values) {
        observe(attribute, values);
      });
  if (status == model::Status::OK) {
    std::cerr << "[bridge] polling started in " << model::mode_name(mode_) << " mode\n";
  }
  return status;
}

model::Status Bridge::start_synthetic(SyntheticOptions options) {
  if (!valid_cycle(cycle_from_seconds(options.cycle_seconds))) {
    std::cerr << "[bridge] synthetic cycle of " << options.cycle_seconds << "s refused\n";
    return model::Status::INVALID_CYCLE;
  }
  if (stopped_.load(std::memory_order_acquire) || started_.exchange(true)) {
    return model::Status::ALREADY_RUNNING;
  }

  mode_ = model::PublishMode::MULTI;
  synthetic_running_.store(true, std::memory_order_release);
  synthetic_worker_ = std::thread(&Bridge::run_synthetic, this, options);
  std::cerr << "[bridge] synthetic source started (cycle " << options.cycle_seconds << "s"
            << (options.inject_zero ? ", zero injection every " + std::to_string(options.zero_every) + " ticks" : "")
            << ")\n";
  return model::Status::OK;
}

void Bridge::stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  if (engine_ != nullptr) {
    engine_->stop();
  }
  synthetic_stop_.request();
  if (synthetic_worker_.joinable()) {
    synthetic_worker_.join();
  }

  if (channel_ != nullptr) {
    channel_->close();
  }

  if (started_.load(std::memory_order_acquire)) {
    std::cerr << "[bridge] stopped: " << frames_sent_.load(std::memory_order_relaxed) << " frames sent, "
              << frames_suppressed_.load(std::memory_order_relaxed) << " suppressed, "
              << frames_dropped_.load(std::memory_order_relaxed) << " dropped\n";
  }
}

void Bridge::observe(const poll::AttributeId& attribute, const std::vector<std::int32_t>& values) {
  readings_observed_.fetch_add(1, std::memory_order_relaxed);

  const auto channel = poll::channel_for(attribute);
  if (!channel.has_value()) {
    note_unknown_attribute(attribute);
    return;
  }

  if (values.empty()) {
    const auto count = malformed_readings_.fetch_add(1, std::memory_order_relaxed);
    if (count == 0) {
      std::cerr << "[bridge] empty value list for " << poll::to_string(attribute) << "; reading discarded\n";
    }
    return;
  }

  const std::uint64_t timestamp_ms = unix_timestamp_now_ms();
  if (mode_ == model::PublishMode::SINGLE) {
    observe_single(*channel, values.front(), timestamp_ms);
  } else {
    observe_multi(*channel, values.front(), timestamp_ms);
  }
}

void Bridge::observe_multi(const model::Channel channel, const std::int32_t value,
                           const std::uint64_t timestamp_ms) {
  std::optional<model::Record> completed;
  const model::Status status = buffer_.accept(model::channel_name(channel), value, timestamp_ms, completed);
  if (status != model::Status::OK) {
    std::cerr << "[bridge] aggregation rejected " << model::channel_name(channel) << ": "
              << model::status_name(status) << '\n';
    return;
  }

  if (completed.has_value()) {
    records_completed_.fetch_add(1, std::memory_order_relaxed);
    (void)publish(*completed);
  }
}

void Bridge::observe_single(const model::Channel channel, const std::int32_t value,
                            const std::uint64_t timestamp_ms) {
  const model::SingleRecord record{timestamp_ms, static_cast<std::int32_t>(channel), value};
  records_completed_.fetch_add(1, std::memory_order_relaxed);
  (void)publish(record);
}

bool Bridge::publish(const model::Record& record) {
  if (!send_frame(codec::encode(record))) {
    return false;
  }

  last_distance_.store(record.distance, std::memory_order_relaxed);
  last_velocity_.store(record.velocity, std::memory_order_relaxed);
  has_last_record_.store(true, std::memory_order_relaxed);
  if (options_.verbose) {
    stdout_sink_.publish(record);
  }
  return true;
}

bool Bridge::publish(const model::SingleRecord& record) {
  if (!send_frame(codec::encode(record))) {
    return false;
  }

  if (record.kind == static_cast<std::int32_t>(model::Channel::DISTANCE)) {
    last_distance_.store(record.value, std::memory_order_relaxed);
  } else {
    last_velocity_.store(record.value, std::memory_order_relaxed);
  }
  has_last_record_.store(true, std::memory_order_relaxed);
  if (options_.verbose) {
    stdout_sink_.publish(record);
  }
  return true;
}

bool Bridge::send_frame(const codec::Frame& frame) {
  if (!gate_.is_active()) {
    frames_suppressed_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  if (channel_ == nullptr || !channel_->send(frame)) {
    frames_dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  frames_sent_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void Bridge::note_unknown_attribute(const poll::AttributeId& attribute) {
  const auto count = unknown_attributes_.fetch_add(1, std::memory_order_relaxed);
  const auto every = options_.unknown_attribute_log_every == 0 ? 1 : options_.unknown_attribute_log_every;
  if (count % every == 0) {
    std::cerr << "[bridge] unknown attribute " << poll::to_string(attribute) << " ("
              << model::status_name(model::Status::UNKNOWN_ATTRIBUTE) << ", " << (count + 1)
              << " so far); reading discarded\n";
  }
}

bool Bridge::toggle_publishing() noexcept { return gate_.toggle(); }

void Bridge::set_publishing(const bool active) noexcept { gate_.set_active(active); }

bool Bridge::publishing_active() const noexcept { return gate_.is_active(); }

bool Bridge::running() const noexcept {
  if (stopped_.load(std::memory_order_acquire)) {
    return false;
  }
  if (engine_ != nullptr) {
    return engine_->running();
  }
  return synthetic_running_.load(std::memory_order_acquire);
}

model::BridgeHealth Bridge::health() const {
  model::BridgeHealth health{};
  health.heartbeat_ms = unix_timestamp_now_ms();
  health.readings_observed = readings_observed_.load(std::memory_order_relaxed);
  health.records_completed = records_completed_.load(std::memory_order_relaxed);
  health.frames_sent = frames_sent_.load(std::memory_order_relaxed);
  health.frames_suppressed = frames_suppressed_.load(std::memory_order_relaxed);
  health.frames_dropped = frames_dropped_.load(std::memory_order_relaxed);
  health.unknown_attributes = unknown_attributes_.load(std::memory_order_relaxed);
  health.malformed_readings = malformed_readings_.load(std::memory_order_relaxed);
  if (engine_ != nullptr) {
    const auto poll_stats = engine_->stats();
    health.poll_cycles = poll_stats.cycles;
    health.poll_timeouts = poll_stats.timeouts;
  }
  health.gate_active = gate_.is_active();
  health.has_last_record = has_last_record_.load(std::memory_order_relaxed);
  health.last_distance = last_distance_.load(std::memory_order_relaxed);
  health.last_velocity = last_velocity_.load(std::memory_order_relaxed);
  return health;
}

void Bridge::run_synthetic(const SyntheticOptions options) {
  CycleClock clock(cycle_from_seconds(options.cycle_seconds));
  sources::SyntheticSource source(options.seed);
  std::int32_t prev_distance = sources::SyntheticSource::kBaseDistance;

  while (!synthetic_stop_.requested()) {
    const auto cycle_start = CycleClock::clock::now();

    const bool inject_zero =
        options.inject_zero && clock.tick() > 0 && clock.should_fire_every(options.zero_every);
    const auto tick = source.tick(prev_distance, options.cycle_seconds, inject_zero);
    prev_distance = tick.prev_distance;
    records_completed_.fetch_add(1, std::memory_order_relaxed);
    (void)publish(tick.record);
    clock.advance();

    const auto wait = clock.remaining(cycle_start, CycleClock::clock::now());
    if (wait == std::chrono::nanoseconds::zero()) {
      clock.note_overrun();
    }
    if (synthetic_stop_.wait_for(wait)) {
      break;
    }
  }

  synthetic_running_.store(false, std::memory_order_release);
  std::cerr << "[synthetic] worker stopped after " << clock.tick() << " ticks (" << clock.overruns()
            << " overruns)\n";
}

}  // namespace dl100_bridge::core
