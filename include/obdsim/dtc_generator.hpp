#pragma once
/**
 * @file dtc_generator.hpp
 * @brief Background fault injection into the active DTC store
 *
 * Every tick (random period between GeneratorConfig::min_period and
 * max_period) the generator may raise one code from the fault pool and,
 * independently, may clear one active code. Both changes go through the
 * DtcStore, so a Service 0x03 snapshot never sees half a tick.
 */

#include "obdsim/config.hpp"
#include "obdsim/obd_dtc.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <thread>

namespace obdsim {

class DtcGenerator {
public:
    /// What a single tick changed
    struct TickResult {
        std::optional<dtc::Dtc> added;
        std::optional<dtc::Dtc> removed;
    };

    DtcGenerator(dtc::DtcStore& store, const GeneratorConfig& config, uint32_t seed);
    ~DtcGenerator();

    DtcGenerator(const DtcGenerator&) = delete;
    DtcGenerator& operator=(const DtcGenerator&) = delete;

    /// Run one insertion/removal round immediately
    TickResult tick();

    /// Start the periodic thread
    void start();

    /// Stop the thread; an in-progress sleep is interrupted
    void stop();

    bool is_running() const { return running_.load(); }

    uint64_t ticks() const { return ticks_.load(); }

private:
    void run_loop();
    std::chrono::milliseconds next_period();

    dtc::DtcStore& store_;
    GeneratorConfig config_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable cv_;
};

} // namespace obdsim
