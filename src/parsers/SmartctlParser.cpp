/**
 * @file SmartctlParser.cpp
 * @brief Parser for smartctl -a output
 */

#include "parsers/SmartctlParser.hpp"

#include "util/TextMatch.hpp"

#include <utility>

namespace {

// Each label captures the rest of its line, up to CR or LF.
constexpr auto MODEL_PATTERN = R"(Device Model:[ \t]*([^\r\n]*))";
constexpr auto SERIAL_PATTERN = R"(Serial Number:[ \t]*([^\r\n]*))";
constexpr auto FIRMWARE_PATTERN = R"(Firmware Version:[ \t]*([^\r\n]*))";

auto match_label(const char* pattern, const std::string& output) -> std::optional<std::string> {
    auto value = util::match_first(pattern, output);
    if (!value) {
        return std::nullopt;
    }
    auto trimmed = util::trim(*value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return std::string{trimmed};
}

}  // namespace

void SmartctlParser::parse(const std::string& /*output*/, SsdHealthRecord& /*record*/) const {}

void SmartctlParser::parse_identity(const std::string& output, SsdHealthRecord& record) {
    if (auto model = match_label(MODEL_PATTERN, output)) {
        record.model = std::move(*model);
    }
    record.serial = match_label(SERIAL_PATTERN, output);
    record.firmware = match_label(FIRMWARE_PATTERN, output);
}
