/**
 * @file CliApplication.hpp
 * @brief CLI application for SSD health reporting
 */

#pragma once

#include "models/SsdHealthRecord.hpp"
#include "services/IProcessRunner.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool usage_error = false;
    bool json_output = false;
    bool verbose = false;
    bool raw_output = false;
    std::string log_dir;               ///< Empty: use the default log directory
    std::vector<std::string> devices;  ///< Positional device paths, in order
};

/**
 * @class CliApplication
 * @brief Command-line front-end printing one health report per device
 */
class CliApplication {
public:
    /**
     * @param runner Process runner used for every probe; nullptr selects
     *        the GLib runner
     */
    explicit CliApplication(std::shared_ptr<IProcessRunner> runner = nullptr);
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return 0 on success, 1 on usage errors, 2 if a device model was not detected
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Probe devices and print their reports
     * @param options Parsed options (devices must be non-empty)
     * @param out Output stream
     * @return Exit code as for run()
     */
    auto report(const CliOptions& options, std::ostream& out) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();
    static void print_version();

    /**
     * @brief Print records as human readable blocks
     */
    static void print_table(std::ostream& out, const std::vector<SsdHealthRecord>& records,
                            bool include_raw);

    /**
     * @brief Print records as a JSON array; unavailable values become null
     */
    static void print_json(std::ostream& out, const std::vector<SsdHealthRecord>& records,
                           bool include_raw);

    /**
     * @brief Escape a string for inclusion in a JSON document
     */
    [[nodiscard]] static auto json_escape(const std::string& text) -> std::string;

private:
    /**
     * @brief Set up file and console logging from the options
     */
    static void init_logging(const CliOptions& options);

    std::shared_ptr<IProcessRunner> runner_;
};

}  // namespace cli
