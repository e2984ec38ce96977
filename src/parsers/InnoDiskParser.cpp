/**
 * @file InnoDiskParser.cpp
 * @brief Parser for InnoDisk iSmart output
 */

#include "parsers/InnoDiskParser.hpp"

#include "util/TextMatch.hpp"

namespace {

constexpr auto HEALTH_PATTERN = R"(Health:\s*(.+?)%)";
constexpr auto TEMPERATURE_PATTERN = R"(Temperature\s*\[\s*(.+?)\])";
constexpr auto POWER_ON_HOURS_PATTERN = R"(Power On Hours\s*\[\s*(.+?)\])";
constexpr auto POWER_CYCLE_COUNT_PATTERN = R"(Power Cycle Count\s*\[\s*(.+?)\])";
constexpr auto BAD_BLOCK_COUNT_PATTERN = R"(Total Bad Block Count\s*\[\s*(.+?)\])";
constexpr auto ERASE_COUNT_MAX_PATTERN = R"(Erase Count Max\.\s*\[\s*(.+?)\])";
constexpr auto ERASE_COUNT_AVG_PATTERN = R"(Erase Count Avg\.\s*\[\s*(.+?)\])";

auto match_double(const char* pattern, const std::string& output) -> std::optional<double> {
    if (auto text = util::match_first(pattern, output)) {
        return util::to_double(*text);
    }
    return std::nullopt;
}

auto match_int(const char* pattern, const std::string& output) -> std::optional<int64_t> {
    if (auto text = util::match_first(pattern, output)) {
        return util::to_int64(*text);
    }
    return std::nullopt;
}

}  // namespace

void InnoDiskParser::parse(const std::string& output, SsdHealthRecord& record) const {
    record.health_percent = match_double(HEALTH_PATTERN, output);
    record.temperature_celsius = match_double(TEMPERATURE_PATTERN, output);
    record.power_on_hours = match_int(POWER_ON_HOURS_PATTERN, output);
    record.power_cycle_count = match_int(POWER_CYCLE_COUNT_PATTERN, output);
    record.total_bad_block_count = match_int(BAD_BLOCK_COUNT_PATTERN, output);
    record.erase_count_max = match_int(ERASE_COUNT_MAX_PATTERN, output);
    record.erase_count_avg = match_int(ERASE_COUNT_AVG_PATTERN, output);
}
