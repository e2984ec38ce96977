/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "config.h"
#include "parsers/VendorRegistry.hpp"
#include "services/GenericSsdHealth.hpp"
#include "services/ProcessRunner.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <cstdio>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>

#include <getopt.h>

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = "ssd-health-cli";

constexpr auto NOT_AVAILABLE = "N/A";

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_MODEL_UNKNOWN = 2;

// Command line options
const struct option long_options[] = {
    {   "help",       no_argument, nullptr, 'h'},
    {"version",       no_argument, nullptr, 'V'},
    {   "json",       no_argument, nullptr, 'j'},
    {"verbose",       no_argument, nullptr, 'v'},
    {    "raw",       no_argument, nullptr, 'r'},
    {"log-dir", required_argument, nullptr, 'L'},
    {  nullptr,                 0, nullptr,   0}
};

auto format_number(double value) -> std::string {
    return std::format("{}", value);
}

template<typename T>
auto text_or_na(const std::optional<T>& value, const char* unit = "") -> std::string {
    if (!value) {
        return NOT_AVAILABLE;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        return *value;
    } else if constexpr (std::is_floating_point_v<T>) {
        return format_number(*value) + unit;
    } else {
        return std::to_string(*value) + unit;
    }
}

template<typename T>
auto json_or_null(const std::optional<T>& value) -> std::string {
    if (!value) {
        return "null";
    }
    if constexpr (std::is_same_v<T, std::string>) {
        return "\"" + CliApplication::json_escape(*value) + "\"";
    } else if constexpr (std::is_floating_point_v<T>) {
        return format_number(*value);
    } else {
        return std::to_string(*value);
    }
}

auto default_log_dir() -> std::filesystem::path {
    return std::filesystem::path(g_get_user_data_dir()) / "ssd-health" / "logs";
}

}  // namespace

CliApplication::CliApplication(std::shared_ptr<IProcessRunner> runner)
    : runner_(runner ? std::move(runner) : std::make_shared<ProcessRunner>()) {}

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (options.show_help) {
        print_help();
        return options.usage_error ? EXIT_USAGE : EXIT_OK;
    }

    if (options.show_version) {
        print_version();
        return EXIT_OK;
    }

    if (options.devices.empty()) {
        std::cerr << "Error: No device specified.\n";
        print_help();
        return EXIT_USAGE;
    }

    init_logging(options);

    const auto code = report(options, std::cout);
    util::Logger::instance().shutdown();
    return code;
}

auto CliApplication::report(const CliOptions& options, std::ostream& out) -> int {
    std::vector<SsdHealthRecord> records;
    records.reserve(options.devices.size());

    int code = EXIT_OK;
    for (const auto& device : options.devices) {
        LOG_INFO("CLI", std::format("Probing {}", device));
        GenericSsdHealth reporter{device, runner_};

        if (reporter.generic_probe().status == ProbeStatus::LAUNCH_FAILED) {
            LOG_ERROR("CLI", std::format("smartctl could not be started for {}", device));
        }
        if (reporter.record().model == UNKNOWN_MODEL) {
            code = EXIT_MODEL_UNKNOWN;
        }
        records.push_back(reporter.record());
    }

    if (options.json_output) {
        print_json(out, records, options.raw_output);
    } else {
        print_table(out, records, options.raw_output);
    }

    return code;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Force getopt to reinitialize so parsing can run more than once
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVjvrL:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'r':
                options.raw_output = true;
                break;
            case 'L':
                options.log_dir = optarg;
                break;
            default:
                options.show_help = true;
                options.usage_error = true;
                break;
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.devices.emplace_back(argv[i]);
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS] <device> [<device>...]\n\n"
              << "Report SSD health using vendor diagnostic tools\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n"
              << "  -j, --json              Output in JSON format\n"
              << "  -r, --raw               Include raw vendor tool output\n"
              << "  -v, --verbose           Log debug messages to stderr\n"
              << "  -L, --log-dir <dir>     Directory for the log file\n\n"
              << "Supported model prefixes:\n ";
    for (const auto& key : parsers::VendorRegistry::instance().keys()) {
        std::cout << " " << key;
    }
    std::cout << "\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " /dev/sda\n"
              << "  " << APP_NAME << " --json /dev/sda /dev/sdb\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of " << PROJECT_NAME << " - SSD health telemetry\n";
}

void CliApplication::init_logging(const CliOptions& options) {
    auto& logger = util::Logger::instance();
    const auto level = options.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO;

    logger.set_console_output(options.verbose);
    logger.set_min_level(level);

    const auto log_dir = options.log_dir.empty() ? default_log_dir()
                                                 : std::filesystem::path{options.log_dir};
    if (auto initialized = logger.initialize(log_dir, APP_NAME, level); !initialized) {
        std::cerr << std::format("Warning: {}\n", initialized.error().what());
    }
}

void CliApplication::print_table(std::ostream& out, const std::vector<SsdHealthRecord>& records,
                                 bool include_raw) {
    constexpr int LABEL_WIDTH = 24;

    auto row = [&out](const char* label, const std::string& value) {
        out << "  " << std::left << std::setw(LABEL_WIDTH) << label << value << "\n";
    };

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& rec = records[i];
        if (i > 0) {
            out << "\n";
        }

        out << "Device: " << rec.device_path << "\n";
        row("Model:", rec.model);
        row("Serial:", text_or_na(rec.serial));
        row("Firmware:", text_or_na(rec.firmware));
        row("Vendor tool:", rec.vendor ? vendor_tag_to_string(*rec.vendor) : NOT_AVAILABLE);
        row("Health:", text_or_na(rec.health_percent, "%"));
        row("Temperature:", text_or_na(rec.temperature_celsius, " C"));
        row("Power on hours:", text_or_na(rec.power_on_hours));
        row("Power cycle count:", text_or_na(rec.power_cycle_count));
        row("Total bad blocks:", text_or_na(rec.total_bad_block_count));
        row("Erase count max:", text_or_na(rec.erase_count_max));
        row("Erase count avg:", text_or_na(rec.erase_count_avg));
        row("Generic probe:", probe_status_to_string(rec.generic_probe.status));
        row("Vendor probe:", probe_status_to_string(rec.vendor_probe.status));

        if (include_raw && !rec.raw_vendor_output.empty()) {
            out << "  Vendor output:\n" << rec.raw_vendor_output;
            if (rec.raw_vendor_output.back() != '\n') {
                out << "\n";
            }
        }
    }
}

void CliApplication::print_json(std::ostream& out, const std::vector<SsdHealthRecord>& records,
                                bool include_raw) {
    const auto vendor_name = [](const SsdHealthRecord& rec) -> std::optional<std::string> {
        if (!rec.vendor) {
            return std::nullopt;
        }
        return vendor_tag_to_string(*rec.vendor);
    };

    out << "[\n";
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& rec = records[i];

        out << "  {\n";
        out << "    \"device\": \"" << json_escape(rec.device_path) << "\",\n";
        out << "    \"model\": \"" << json_escape(rec.model) << "\",\n";
        out << "    \"serial\": " << json_or_null(rec.serial) << ",\n";
        out << "    \"firmware\": " << json_or_null(rec.firmware) << ",\n";
        out << "    \"vendor\": " << json_or_null(vendor_name(rec)) << ",\n";
        out << "    \"health\": " << json_or_null(rec.health_percent) << ",\n";
        out << "    \"temperature\": " << json_or_null(rec.temperature_celsius) << ",\n";
        out << "    \"power_on_hours\": " << json_or_null(rec.power_on_hours) << ",\n";
        out << "    \"power_cycle_count\": " << json_or_null(rec.power_cycle_count) << ",\n";
        out << "    \"total_bad_block_count\": " << json_or_null(rec.total_bad_block_count)
            << ",\n";
        out << "    \"erase_count_max\": " << json_or_null(rec.erase_count_max) << ",\n";
        out << "    \"erase_count_avg\": " << json_or_null(rec.erase_count_avg) << ",\n";
        out << "    \"generic_probe\": \"" << probe_status_to_string(rec.generic_probe.status)
            << "\",\n";
        out << "    \"vendor_probe\": \"" << probe_status_to_string(rec.vendor_probe.status)
            << "\"";
        if (include_raw) {
            out << ",\n    \"vendor_output\": \"" << json_escape(rec.raw_vendor_output) << "\"";
        }
        out << "\n  }" << (i < records.size() - 1 ? "," : "") << "\n";
    }
    out << "]\n";
}

auto CliApplication::json_escape(const std::string& text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
                break;
        }
    }
    return escaped;
}

}  // namespace cli
