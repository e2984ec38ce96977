/**
 * @file GenericSsdHealth.cpp
 * @brief Generic SSD health reporter implementation
 */

#include "services/GenericSsdHealth.hpp"

#include "parsers/SmartctlParser.hpp"
#include "parsers/VendorRegistry.hpp"
#include "services/ProcessRunner.hpp"
#include "util/Logger.hpp"
#include "util/TextMatch.hpp"

#include <format>
#include <utility>

namespace {
constexpr auto COMPONENT = "GenericSsdHealth";
}  // namespace

GenericSsdHealth::GenericSsdHealth(std::string device_path,
                                   std::shared_ptr<IProcessRunner> runner) {
    if (!runner) {
        runner = std::make_shared<ProcessRunner>();
    }

    record_.device_path = std::move(device_path);

    // Generic part
    fetch_generic_info(*runner);
    parse_generic_info();

    // Known vendor part
    if (record_.model.empty()) {
        LOG_WARNING(COMPONENT, std::format("Failed to detect model of {}", record_.device_path));
        record_.model = UNKNOWN_MODEL;
        return;
    }

    fetch_and_parse_vendor_info(*runner);
}

void GenericSsdHealth::fetch_generic_info(IProcessRunner& runner) {
    const auto& generic = parsers::VendorRegistry::instance().utility(VendorTag::GENERIC);
    auto result = runner.run(
        parsers::VendorRegistry::build_command(generic.command_template, record_.device_path));

    record_.generic_probe = to_probe_result(result);
    record_.raw_generic_output = std::move(result.output);
}

void GenericSsdHealth::parse_generic_info() {
    SmartctlParser::parse_identity(record_.raw_generic_output, record_);
}

void GenericSsdHealth::fetch_and_parse_vendor_info(IProcessRunner& runner) {
    const auto& registry = parsers::VendorRegistry::instance();
    const auto model_short = util::first_token(record_.model);

    auto tag = registry.resolve(model_short);
    if (!tag) {
        LOG_INFO(COMPONENT, std::format("No handler registered for model '{}' on {}",
                                        record_.model, record_.device_path));
        return;
    }

    const auto& utility = registry.utility(*tag);
    LOG_DEBUG(COMPONENT, std::format("{} dispatched to {}", record_.device_path,
                                      utility.parser->get_name()));

    auto result = runner.run(
        parsers::VendorRegistry::build_command(utility.command_template, record_.device_path));

    record_.vendor = tag;
    record_.vendor_probe = to_probe_result(result);
    record_.raw_vendor_output = std::move(result.output);

    utility.parser->parse(record_.raw_vendor_output, record_);
}

auto GenericSsdHealth::to_probe_result(const CommandResult& result) -> ProbeResult {
    if (!result.launched) {
        return ProbeResult{.status = ProbeStatus::LAUNCH_FAILED, .exit_status = -1};
    }
    return ProbeResult{.status = ProbeStatus::COMPLETED, .exit_status = result.exit_status};
}

auto GenericSsdHealth::get_health() const -> Query<std::optional<double>> {
    return record_.health_percent;
}

auto GenericSsdHealth::get_temperature() const -> Query<std::optional<double>> {
    return record_.temperature_celsius;
}

auto GenericSsdHealth::get_model() const -> Query<std::string> {
    return record_.model;
}

auto GenericSsdHealth::get_firmware() const -> Query<std::optional<std::string>> {
    return record_.firmware;
}

auto GenericSsdHealth::get_serial() const -> Query<std::optional<std::string>> {
    return record_.serial;
}

auto GenericSsdHealth::get_vendor_output() const -> Query<std::string> {
    return record_.raw_vendor_output;
}

auto GenericSsdHealth::get_power_on_hours() const -> Query<std::optional<int64_t>> {
    return record_.power_on_hours;
}

auto GenericSsdHealth::get_power_cycle_count() const -> Query<std::optional<int64_t>> {
    return record_.power_cycle_count;
}

auto GenericSsdHealth::get_total_bad_block_count() const -> Query<std::optional<int64_t>> {
    return record_.total_bad_block_count;
}

auto GenericSsdHealth::get_erase_count_max() const -> Query<std::optional<int64_t>> {
    return record_.erase_count_max;
}

auto GenericSsdHealth::get_erase_count_avg() const -> Query<std::optional<int64_t>> {
    return record_.erase_count_avg;
}
