#include "poll/polling_engine.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/cycle_clock.hpp"

namespace dl100_bridge::poll {
namespace {

class UnavailableReader final : public AttributeReader {
 public:
  UnavailableReader(std::string host, const std::uint16_t port) : host_(std::move(host)), port_(port) {}

  bool available() const override { return false; }

  std::string endpoint() const override { return host_ + ":" + std::to_string(port_); }

  model::Status read(const AttributeId&, std::chrono::milliseconds, std::vector<std::int32_t>& values) override {
    values.clear();
    return model::Status::POLL_TIMEOUT;
  }

 private:
  std::string host_;
  std::uint16_t port_;
};

}  // namespace

std::unique_ptr<AttributeReader> make_unavailable_reader(std::string host, const std::uint16_t port) {
  return std::make_unique<UnavailableReader>(std::move(host), port);
}

PollingEngine::PollingEngine(std::unique_ptr<AttributeReader> reader) : reader_(std::move(reader)) {}

PollingEngine::~PollingEngine() { stop(); }

model::Status PollingEngine::subscribe(std::vector<AttributeId> attributes, PollOptions options,
                                       PollCallback callback) {
  if (subscribed_ || reader_ == nullptr) {
    return model::Status::ALREADY_RUNNING;
  }
  if (!core::valid_cycle(options.cycle)) {
    std::cerr << "[poll] cycle of " << options.cycle.count() << "ns refused; minimum is "
              << core::kMinCycle.count() << "ns\n";
    return model::Status::INVALID_CYCLE;
  }
  subscribed_ = true;
  running_.store(true, std::memory_order_release);
  worker_ = std::thread(&PollingEngine::run, this, std::move(attributes), options, std::move(callback));
  return model::Status::OK;
}

void PollingEngine::stop() {
  stop_.request();
  if (worker_.joinable()) {
    worker_.join();
  }
  running_.store(false, std::memory_order_release);
}

PollStats PollingEngine::stats() const noexcept {
  PollStats stats{};
  stats.cycles = cycles_.load(std::memory_order_relaxed);
  stats.reads = reads_.load(std::memory_order_relaxed);
  stats.timeouts = timeouts_.load(std::memory_order_relaxed);
  stats.callback_errors = callback_errors_.load(std::memory_order_relaxed);
  return stats;
}

void PollingEngine::run(std::vector<AttributeId> attributes, PollOptions options, PollCallback callback) {
  core::CycleClock clock(options.cycle);
  std::vector<std::int32_t> values;
  values.reserve(4);

  std::cerr << "[poll] polling " << attributes.size() << " attributes at " << reader_->endpoint() << " every "
            << std::chrono::duration_cast<std::chrono::microseconds>(options.cycle).count() << "us\n";

  while (!stop_.requested()) {
    const auto cycle_start = core::CycleClock::clock::now();
    poll_once(attributes, options, callback, values);
    cycles_.fetch_add(1, std::memory_order_relaxed);
    clock.advance();

    const auto wait = clock.remaining(cycle_start, core::CycleClock::clock::now());
    if (wait == std::chrono::nanoseconds::zero()) {
      clock.note_overrun();
    }
    if (stop_.wait_for(wait)) {
      break;
    }
  }

  running_.store(false, std::memory_order_release);
  std::cerr << "[poll] worker stopped after " << clock.tick() << " cycles (" << clock.overruns()
            << " overruns)\n";
}

void PollingEngine::poll_once(const std::vector<AttributeId>& attributes, const PollOptions& options,
                              const PollCallback& callback, std::vector<std::int32_t>& values) {
  for (const auto& attribute : attributes) {
    if (stop_.requested()) {
      return;
    }

    values.clear();
    reads_.fetch_add(1, std::memory_order_relaxed);
    const model::Status status = reader_->read(attribute, options.timeout, values);
    if (status != model::Status::OK) {
      timeouts_.fetch_add(1, std::memory_order_relaxed);
      ++timeouts_since_ok_;
      if (reader_was_ok_) {
        std::cerr << "[poll] read " << to_string(attribute) << " from " << reader_->endpoint()
                  << " failed: " << model::status_name(status) << '\n';
        reader_was_ok_ = false;
      }
      continue;
    }

    if (!reader_was_ok_) {
      std::cerr << "[poll] reads from " << reader_->endpoint() << " recovered after " << timeouts_since_ok_
                << " failures\n";
      reader_was_ok_ = true;
    }
    timeouts_since_ok_ = 0;

    try {
      callback(attribute, values);
    } catch (const std::exception& ex) {
      callback_errors_.fetch_add(1, std::memory_order_relaxed);
      std::cerr << "[poll] callback for " << to_string(attribute) << " failed: " << ex.what() << '\n';
    }
  }
}

}  // namespace dl100_bridge::poll
