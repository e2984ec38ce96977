/**
 * @file ProcessRunner.hpp
 * @brief GLib-based process runner
 */

#pragma once

#include "services/IProcessRunner.hpp"

/**
 * @class ProcessRunner
 * @brief Spawns commands with GLib and collects stdout until EOF, discarding stderr
 *
 * Output is returned byte for byte, including embedded NUL bytes.
 */
class ProcessRunner : public IProcessRunner {
public:
    ProcessRunner() = default;
    ~ProcessRunner() override = default;

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    [[nodiscard]] auto run(const std::vector<std::string>& argv) -> CommandResult override;
};
