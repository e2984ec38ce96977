/**
 * @file IProcessRunner.hpp
 * @brief Interface for running diagnostic tools and capturing their output
 */

#pragma once

#include <string>
#include <vector>

/**
 * @struct CommandResult
 * @brief Outcome of one external command invocation
 */
struct CommandResult {
    bool launched = false;      ///< Whether the process could be started
    int exit_status = -1;       ///< Exit code, -1 if not launched or killed by a signal
    std::string output;         ///< Captured stdout (empty if not launched)
    std::string error_message;  ///< Launch failure reason

    auto operator==(const CommandResult&) const -> bool = default;
};

/**
 * @class IProcessRunner
 * @brief Runs a command synchronously and returns its stdout
 *
 * Implementations never throw: a command that cannot be started produces
 * an empty output with launched=false. The exit status never suppresses
 * the captured output. No timeout is applied.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Execute a command and wait for it to finish
     * @param argv Program name followed by its arguments; searched in PATH
     * @return Captured stdout and launch/exit information
     */
    [[nodiscard]] virtual auto run(const std::vector<std::string>& argv) -> CommandResult = 0;
};
