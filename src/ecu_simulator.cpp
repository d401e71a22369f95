#include "obdsim/ecu_simulator.hpp"
#include "obdsim/logging.hpp"
#include <random>

namespace obdsim {

namespace {

constexpr const char* kComponent = "ecu";

uint32_t pick_seed(const EcuConfig& config) {
  if (config.seed) return *config.seed;
  std::random_device rd;
  return rd();
}

} // namespace

// Member order matters: store_ is constructed before the dispatcher and the
// generator that hold a reference to it.
EcuSimulator::EcuSimulator(const EcuConfig& config)
    : config_(config),
      seed_(pick_seed(config)),
      endpoint_(bus_.attach()),
      dispatcher_(store_, seed_),
      generator_(store_, config.generator, seed_ + 1),
      bridge_(bridge_requests_) {
}

EcuSimulator::~EcuSimulator() {
  stop();
}

bool EcuSimulator::start() {
  if (running_) return true;

  if (!bridge_.start(config_.host, config_.port)) {
    logging::error(kComponent, "could not start bridge on " + config_.host + ":" +
                                   std::to_string(config_.port));
    return false;
  }

  running_ = true;
  service_thread_ = std::thread(&EcuSimulator::service_loop, this);

  if (config_.generator.enabled) {
    generator_.start();
  }

  logging::info(kComponent, "ECU simulator running, bridge on " + config_.host + ":" +
                                std::to_string(bridge_.port()) + ", seed " +
                                std::to_string(seed_));
  return true;
}

void EcuSimulator::stop() {
  generator_.stop();

  bool was_running = running_.exchange(false);
  if (service_thread_.joinable()) {
    service_thread_.join();
  }

  bridge_.stop();

  if (was_running) {
    logging::info(kComponent, "ECU simulator stopped");
  }
}

size_t EcuSimulator::service_once() {
  size_t processed = 0;
  CANFrame request;

  // Local bus first, bounded wait
  if (endpoint_->recv(request, config_.bus_poll)) {
    ++processed;
    if (auto response = dispatcher_.handle(request)) {
      publish(*response);
    }
  }

  // Then at most one bridge request, no wait
  if (bridge_requests_.try_pop(request)) {
    ++processed;
    if (auto response = dispatcher_.handle(request)) {
      publish(*response);
    }
  }

  return processed;
}

void EcuSimulator::service_loop() {
  while (running_) {
    service_once();
  }
}

void EcuSimulator::publish(const CANFrame& response) {
  if (!endpoint_->send(response)) {
    logging::warning(kComponent, "local bus rejected " + to_string(response));
  }
  bridge_.broadcast(response);
  ++responses_sent_;
}

} // namespace obdsim
