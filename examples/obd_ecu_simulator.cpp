#include "obdsim/config.hpp"
#include "obdsim/ecu_simulator.hpp"
#include "obdsim/logging.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Simulated engine ECU. Listens on the bridge port until SIGINT/SIGTERM and
// answers OBD-II Service 0x01/0x03/0x04 requests from any connected reader.

namespace {

volatile std::sig_atomic_t stop_requested = 0;

void on_signal(int) {
    stop_requested = 1;
}

} // namespace

int main(int argc, char* argv[]) {
    obdsim::EcuConfig config;
    auto args = obdsim::parse_ecu_args(argc, argv, config);
    if (args.help) {
        std::cout << obdsim::ecu_usage(argv[0]);
        return 0;
    }
    if (!args.ok) {
        std::cerr << argv[0] << ": " << args.error << "\n\n" << obdsim::ecu_usage(argv[0]);
        return 1;
    }

    obdsim::logging::set_level(config.log_level);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    obdsim::EcuSimulator ecu(config);
    if (!ecu.start()) {
        std::cerr << "Failed to start ECU simulator on " << config.host << ":"
                  << config.port << std::endl;
        return 1;
    }

    std::cout << "=== OBD-II ECU Simulator ===" << std::endl;
    std::cout << "Bridge:    " << config.host << ":" << ecu.bridge_server().port() << std::endl;
    std::cout << "Generator: " << (config.generator.enabled ? "enabled" : "disabled") << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;

    while (!stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down..." << std::endl;
    ecu.stop();

    auto stats = ecu.bridge_server().stats();
    std::cout << "Responses sent:   " << ecu.responses_sent() << "\n";
    std::cout << "Clients accepted: " << stats.clients_accepted << "\n";
    std::cout << "Frames received:  " << stats.frames_received << "\n";
    std::cout << "Active DTCs:      " << ecu.dtc_store().size() << std::endl;
    return 0;
}
