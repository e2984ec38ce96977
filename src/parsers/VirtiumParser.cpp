/**
 * @file VirtiumParser.cpp
 * @brief Parser for Virtium SmartCmd output
 */

#include "parsers/VirtiumParser.hpp"

#include "util/Logger.hpp"
#include "util/TextMatch.hpp"

namespace {

constexpr auto COMPONENT = "VirtiumParser";

// Each attribute captures the rest of its line: "[ID] Value Worst Threshold".
constexpr auto TEMPERATURE_PATTERN = R"(Temperature_Celsius[ \t]+([^\r\n]*))";
constexpr auto NAND_ENDURANCE_PATTERN = R"(NAND_Endurance[ \t]+([^\r\n]*))";
constexpr auto AVG_ERASE_COUNT_PATTERN = R"(Average_Erase_Count[ \t]+([^\r\n]*))";

// The value is the second column when a numeric ID precedes it, otherwise the
// first. A non-numeric value is unavailable and never falls back to the ID.
auto attribute_value(const char* pattern, const std::string& output) -> std::optional<double> {
    auto columns = util::match_first(pattern, output);
    if (!columns) {
        return std::nullopt;
    }

    const auto rest = util::trim(*columns);
    auto value = util::first_token(rest);
    const auto after_first = util::trim(rest.substr(value.size()));
    if (!after_first.empty() && util::to_int64(value)) {
        value = util::first_token(after_first);
    }
    return util::to_double(value);
}

}  // namespace

void VirtiumParser::parse(const std::string& output, SsdHealthRecord& record) const {
    record.temperature_celsius = attribute_value(TEMPERATURE_PATTERN, output);

    const auto nand_endurance = attribute_value(NAND_ENDURANCE_PATTERN, output);
    const auto avg_erase_count = attribute_value(AVG_ERASE_COUNT_PATTERN, output);

    if (!nand_endurance || !avg_erase_count) {
        LOG_DEBUG(COMPONENT, "Erase counters not reported, health unavailable");
        return;
    }

    if (auto health = derive_health(*avg_erase_count, *nand_endurance)) {
        record.health_percent = health;
    } else {
        LOG_DEBUG(COMPONENT, "NAND_Endurance is zero, health unavailable");
    }
}

auto VirtiumParser::derive_health(double avg_erase_count, double nand_endurance)
    -> std::optional<double> {
    if (nand_endurance <= 0.0) {
        return std::nullopt;
    }
    return 100.0 - (avg_erase_count * 100.0 / nand_endurance);
}
