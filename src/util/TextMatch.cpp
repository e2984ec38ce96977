/**
 * @file TextMatch.cpp
 * @brief Pattern extraction and numeric conversion helpers
 */

#include "util/TextMatch.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <regex>
#include <system_error>

namespace util {

namespace {

auto is_space(char c) noexcept -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

auto match_first(const std::string& pattern, const std::string& buffer)
    -> std::optional<std::string> {
    const std::regex re{pattern};
    std::smatch match;
    if (!std::regex_search(buffer, match, re) || match.size() < 2) {
        return std::nullopt;
    }
    return match[1].str();
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto first_token(std::string_view text) -> std::string_view {
    text = trim(text);
    size_t end = 0;
    while (end < text.size() && !is_space(text[end])) {
        ++end;
    }
    return text.substr(0, end);
}

auto to_int64(std::string_view text) -> std::optional<int64_t> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    int64_t value = 0;
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

auto to_double(std::string_view text) -> std::optional<double> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace util
