/**
 * @file GenericSsdHealth.hpp
 * @brief Generic SSD health reporter built on vendor diagnostic tools
 *
 * SSD models supported:
 *  - InnoDisk (and InnoDisk "M.2" modules)
 *  - StorFly
 *  - Virtium
 */

#pragma once

#include "interfaces/ISsdHealth.hpp"
#include "models/SsdHealthRecord.hpp"
#include "services/IProcessRunner.hpp"

#include <memory>
#include <string>

/**
 * @class GenericSsdHealth
 * @brief Probes one device at construction and serves the snapshot
 *
 * Construction runs "smartctl <dev> -a", reads the model, serial and
 * firmware, then dispatches on the first word of the model to a vendor
 * tool whose output supplies the wear metrics. Construction never fails;
 * anything that cannot be read is reported as not available.
 *
 * Both probes block until the tools exit. There is no timeout.
 */
class GenericSsdHealth : public ISsdHealth {
public:
    /**
     * @brief Probe a device
     * @param device_path Device path (e.g., /dev/sda)
     * @param runner Process runner; defaults to the GLib implementation
     */
    explicit GenericSsdHealth(std::string device_path,
                              std::shared_ptr<IProcessRunner> runner = nullptr);
    ~GenericSsdHealth() override = default;

    GenericSsdHealth(const GenericSsdHealth&) = default;
    GenericSsdHealth& operator=(const GenericSsdHealth&) = default;
    GenericSsdHealth(GenericSsdHealth&&) = default;
    GenericSsdHealth& operator=(GenericSsdHealth&&) = default;

    [[nodiscard]] auto get_health() const -> Query<std::optional<double>> override;
    [[nodiscard]] auto get_temperature() const -> Query<std::optional<double>> override;
    [[nodiscard]] auto get_model() const -> Query<std::string> override;
    [[nodiscard]] auto get_firmware() const -> Query<std::optional<std::string>> override;
    [[nodiscard]] auto get_serial() const -> Query<std::optional<std::string>> override;
    [[nodiscard]] auto get_vendor_output() const -> Query<std::string> override;
    [[nodiscard]] auto get_power_on_hours() const -> Query<std::optional<int64_t>> override;
    [[nodiscard]] auto get_power_cycle_count() const -> Query<std::optional<int64_t>> override;
    [[nodiscard]] auto get_total_bad_block_count() const
        -> Query<std::optional<int64_t>> override;
    [[nodiscard]] auto get_erase_count_max() const -> Query<std::optional<int64_t>> override;
    [[nodiscard]] auto get_erase_count_avg() const -> Query<std::optional<int64_t>> override;

    /**
     * @brief Device path this reporter was built for
     */
    [[nodiscard]] auto get_device_path() const -> const std::string& {
        return record_.device_path;
    }

    /**
     * @brief Verbatim output of the generic (smartctl) probe
     */
    [[nodiscard]] auto get_generic_output() const -> const std::string& {
        return record_.raw_generic_output;
    }

    /**
     * @brief Whether the generic tool launched, and its exit status
     */
    [[nodiscard]] auto generic_probe() const -> const ProbeResult& {
        return record_.generic_probe;
    }

    /**
     * @brief Whether the vendor tool ran; NOT_RUN when dispatch missed
     */
    [[nodiscard]] auto vendor_probe() const -> const ProbeResult& {
        return record_.vendor_probe;
    }

    /**
     * @brief Full snapshot
     */
    [[nodiscard]] auto record() const -> const SsdHealthRecord& {
        return record_;
    }

private:
    void fetch_generic_info(IProcessRunner& runner);
    void parse_generic_info();
    void fetch_and_parse_vendor_info(IProcessRunner& runner);

    [[nodiscard]] static auto to_probe_result(const CommandResult& result) -> ProbeResult;

    SsdHealthRecord record_;
};
