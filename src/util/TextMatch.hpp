/**
 * @file TextMatch.hpp
 * @brief Pattern extraction and numeric conversion helpers for tool output
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @brief Extract the first capture group of the first match of a pattern
 * @param pattern ECMAScript regular expression with one capture group
 * @param buffer Text to search
 * @return The captured text, or nullopt when nothing matches
 * @throws std::regex_error if the pattern is malformed
 */
[[nodiscard]] auto match_first(const std::string& pattern, const std::string& buffer)
    -> std::optional<std::string>;

/**
 * @brief Strip leading and trailing whitespace
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

/**
 * @brief First whitespace-delimited token, or empty if the text is blank
 */
[[nodiscard]] auto first_token(std::string_view text) -> std::string_view;

/**
 * @brief Parse an integer that spans the whole (trimmed) text
 * @return nullopt for empty, partial or out-of-range input
 */
[[nodiscard]] auto to_int64(std::string_view text) -> std::optional<int64_t>;

/**
 * @brief Parse a decimal number that spans the whole (trimmed) text
 * @return nullopt for empty, partial or non-finite input
 */
[[nodiscard]] auto to_double(std::string_view text) -> std::optional<double>;

}  // namespace util
