#include "obdsim/config.hpp"
#include "obdsim/logging.hpp"
#include "obdsim/obd_reader.hpp"
#include "obdsim/tcp_bridge.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

// Command-line OBD-II reader. Connects to the simulator bridge and prints
// live data or trouble codes.

namespace {

template <typename T>
void print_value(const char* label, const std::optional<T>& value, const char* unit, int precision = 0) {
    std::cout << std::left << std::setw(18) << label;
    if (value) {
        std::cout << std::fixed << std::setprecision(precision) << *value << " " << unit;
    } else {
        std::cout << "no data";
    }
    std::cout << "\n";
}

void show_dashboard(obdsim::ObdReader& reader, int count) {
    for (int i = 0; i < count; ++i) {
        std::cout << "=== Reading " << (i + 1) << "/" << count << " ===" << std::endl;
        print_value("Engine RPM:", reader.read_rpm(), "rpm");
        print_value("Vehicle speed:", reader.read_speed(), "km/h");
        print_value("Coolant temp:", reader.read_coolant_temp(), "C");
        print_value("Throttle:", reader.read_throttle(), "%", 1);
        print_value("Engine load:", reader.read_engine_load(), "%", 1);
        print_value("Intake air temp:", reader.read_intake_temp(), "C");
        print_value("MAF:", reader.read_maf(), "g/s", 2);
        print_value("Intake pressure:", reader.read_intake_pressure(), "kPa");
        print_value("Barometric:", reader.read_barometric_pressure(), "kPa");
        std::cout << std::endl;

        if (i + 1 < count) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}

int show_dtcs(obdsim::ObdReader& reader) {
    auto codes = reader.read_dtcs();
    if (!codes) {
        std::cerr << "No response to Service 0x03" << std::endl;
        return 1;
    }
    if (codes->empty()) {
        std::cout << "No stored trouble codes" << std::endl;
        return 0;
    }
    for (const auto& code : *codes) {
        std::cout << code.to_string() << "  " << obdsim::dtc::describe(code) << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int clear_dtcs(obdsim::ObdReader& reader) {
    if (!reader.clear_dtcs()) {
        std::cerr << "No response to Service 0x04" << std::endl;
        return 1;
    }
    std::cout << "Trouble codes cleared" << std::endl;
    return 0;
}

int query_raw_pid(obdsim::ObdReader& reader, const std::string& text) {
    char* end = nullptr;
    unsigned long pid = std::strtoul(text.c_str(), &end, 16);
    if (text.empty() || *end != '\0' || pid > 0xFF) {
        std::cerr << "Invalid PID: " << text << std::endl;
        return 1;
    }

    auto response = reader.query_pid(static_cast<uint8_t>(pid));
    if (!response) {
        std::cout << obdsim::obd::pid_name(static_cast<uint8_t>(pid)) << ": no data" << std::endl;
        return 1;
    }
    std::cout << obdsim::obd::pid_name(static_cast<uint8_t>(pid)) << ": "
              << obdsim::to_string(*response) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    obdsim::ReaderConfig config;
    auto args = obdsim::parse_reader_args(argc, argv, config);
    if (args.help) {
        std::cout << obdsim::reader_usage(argv[0]);
        return 0;
    }
    if (!args.ok || args.positional.empty()) {
        if (!args.ok) std::cerr << argv[0] << ": " << args.error << "\n\n";
        std::cerr << obdsim::reader_usage(argv[0]);
        return 1;
    }

    obdsim::logging::set_level(config.log_level);

    const std::string& command = args.positional[0];

    obdsim::bridge::BridgeClient link;
    if (!link.connect(config.host, config.port)) {
        std::cerr << "Failed to connect to " << config.host << ":" << config.port << std::endl;
        return 1;
    }

    obdsim::ObdReader reader(link, link.inbound(), config);
    int status = 0;

    if (command == "dashboard") {
        int count = 10;
        if (args.positional.size() > 1) {
            count = std::atoi(args.positional[1].c_str());
            if (count <= 0) {
                std::cerr << "Invalid count: " << args.positional[1] << std::endl;
                link.close();
                return 1;
            }
        }
        show_dashboard(reader, count);
    } else if (command == "dtcs") {
        status = show_dtcs(reader);
    } else if (command == "clear") {
        status = clear_dtcs(reader);
    } else if (command == "pid" && args.positional.size() > 1) {
        status = query_raw_pid(reader, args.positional[1]);
    } else {
        std::cerr << "Unknown command: " << command << "\n\n" << obdsim::reader_usage(argv[0]);
        status = 1;
    }

    link.close();
    return status;
}
