/**
 * @file ISsdHealth.hpp
 * @brief Interface for SSD health telemetry queries
 *
 * All state is bound when the implementation is constructed; queries are
 * plain reads. A query returns an empty optional when the device did not
 * report the value, and util::Error with code ENOTSUP when the
 * implementation does not support the query at all.
 */

#pragma once

#include "util/Error.hpp"

#include <cerrno>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

/**
 * @class ISsdHealth
 * @brief Abstract interface for reading SSD health data
 *
 * Every query defaults to "unsupported" so an implementation only overrides
 * what its tools can deliver.
 */
class ISsdHealth {
public:
    template<typename T>
    using Query = std::expected<T, util::Error>;

    virtual ~ISsdHealth() = default;

    /**
     * @brief Remaining disk health in percent (e.g. 83.5)
     */
    [[nodiscard]] virtual auto get_health() const -> Query<std::optional<double>> {
        return unsupported("get_health");
    }

    /**
     * @brief Current disk temperature in Celsius (e.g. 40.1)
     */
    [[nodiscard]] virtual auto get_temperature() const -> Query<std::optional<double>> {
        return unsupported("get_temperature");
    }

    /**
     * @brief Disk model as provided by the manufacturer
     */
    [[nodiscard]] virtual auto get_model() const -> Query<std::string> {
        return unsupported("get_model");
    }

    /**
     * @brief Firmware version as provided by the manufacturer
     */
    [[nodiscard]] virtual auto get_firmware() const -> Query<std::optional<std::string>> {
        return unsupported("get_firmware");
    }

    /**
     * @brief Serial number as provided by the manufacturer
     */
    [[nodiscard]] virtual auto get_serial() const -> Query<std::optional<std::string>> {
        return unsupported("get_serial");
    }

    /**
     * @brief Raw vendor specific tool output
     */
    [[nodiscard]] virtual auto get_vendor_output() const -> Query<std::string> {
        return unsupported("get_vendor_output");
    }

    [[nodiscard]] virtual auto get_power_on_hours() const -> Query<std::optional<int64_t>> {
        return unsupported("get_power_on_hours");
    }

    [[nodiscard]] virtual auto get_power_cycle_count() const -> Query<std::optional<int64_t>> {
        return unsupported("get_power_cycle_count");
    }

    [[nodiscard]] virtual auto get_total_bad_block_count() const
        -> Query<std::optional<int64_t>> {
        return unsupported("get_total_bad_block_count");
    }

    [[nodiscard]] virtual auto get_erase_count_max() const -> Query<std::optional<int64_t>> {
        return unsupported("get_erase_count_max");
    }

    [[nodiscard]] virtual auto get_erase_count_avg() const -> Query<std::optional<int64_t>> {
        return unsupported("get_erase_count_avg");
    }

protected:
    [[nodiscard]] static auto unsupported(const std::string& query) -> std::unexpected<util::Error> {
        return std::unexpected(util::Error{query + " is not supported", ENOTSUP});
    }
};
