/**
 * @file Error.hpp
 * @brief Error type carried through std::expected returns
 */

#pragma once

#include <string>
#include <utility>

namespace util {

/**
 * @struct Error
 * @brief Represents an error with a message and optional errno-style code
 */
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }
};

} // namespace util
