#include "obdsim/dtc_generator.hpp"
#include "obdsim/logging.hpp"
#include <algorithm>

namespace obdsim {

namespace {
constexpr const char* kComponent = "dtc_generator";
}

DtcGenerator::DtcGenerator(dtc::DtcStore& store, const GeneratorConfig& config, uint32_t seed)
    : store_(store), config_(config), rng_(seed) {
}

DtcGenerator::~DtcGenerator() {
    stop();
}

DtcGenerator::TickResult DtcGenerator::tick() {
    TickResult result;
    ++ticks_;

    std::lock_guard<std::mutex> rng_lock(rng_mutex_);
    std::uniform_real_distribution<double> chance(0.0, 1.0);

    if (chance(rng_) < config_.insert_probability) {
        const auto& pool = dtc::fault_pool();
        std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
        dtc::Dtc candidate = pool[pick(rng_)];

        // Capacity check and insert happen under one store lock
        if (store_.insert_if_absent(candidate, config_.max_active_codes)) {
            result.added = candidate;
            logging::info(kComponent, "NEW DTC: " + candidate.to_string());
        }
    }

    if (chance(rng_) < config_.remove_probability) {
        auto active = store_.snapshot();
        if (!active.empty()) {
            std::uniform_int_distribution<size_t> pick(0, active.size() - 1);
            dtc::Dtc victim = active[pick(rng_)];
            // A concurrent clear may already have taken it
            if (store_.remove(victim)) {
                result.removed = victim;
                logging::info(kComponent, "CLEARED DTC: " + victim.to_string());
            }
        }
    }

    return result;
}

void DtcGenerator::start() {
    if (running_) return;

    running_ = true;
    thread_ = std::thread(&DtcGenerator::run_loop, this);
}

void DtcGenerator::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

std::chrono::milliseconds DtcGenerator::next_period() {
    auto lo = config_.min_period.count();
    auto hi = std::max(config_.max_period.count(), lo);

    std::lock_guard<std::mutex> rng_lock(rng_mutex_);
    std::uniform_int_distribution<std::chrono::milliseconds::rep> pick(lo, hi);
    return std::chrono::milliseconds(pick(rng_));
}

void DtcGenerator::run_loop() {
    while (running_) {
        auto period = next_period();

        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (cv_.wait_for(lock, period, [this] { return !running_; })) {
                break;
            }
        }

        tick();
    }
}

} // namespace obdsim
