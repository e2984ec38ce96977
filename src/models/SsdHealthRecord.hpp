/**
 * @file SsdHealthRecord.hpp
 * @brief Data types for SSD health telemetry
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @enum VendorTag
 * @brief Vendor tool families known to the dispatch table
 */
enum class VendorTag {
    GENERIC,   ///< smartctl, covered by the generic probe
    INNODISK,  ///< InnoDisk iSmart utility
    VIRTIUM    ///< Virtium SmartCmd utility
};

/**
 * @enum ProbeStatus
 * @brief Execution outcome of one diagnostic tool invocation
 */
enum class ProbeStatus {
    NOT_RUN,       ///< Probe was never attempted
    COMPLETED,     ///< Tool launched and exited (any exit status)
    LAUNCH_FAILED  ///< Tool could not be started (missing, not executable, ...)
};

/**
 * @struct ProbeResult
 * @brief Status of a probe; the captured text lives in the record
 */
struct ProbeResult {
    ProbeStatus status = ProbeStatus::NOT_RUN;
    int exit_status = -1;  ///< Exit code of a completed probe, -1 otherwise

    auto operator==(const ProbeResult&) const -> bool = default;
};

/**
 * @struct SsdHealthRecord
 * @brief Snapshot of everything read from one device
 *
 * Every metric is optional; an empty value means the tool did not report
 * it or its text could not be parsed.
 */
struct SsdHealthRecord {
    std::string device_path;                     ///< Device path (e.g., /dev/sda)
    std::string model;                           ///< "Unknown" when not detected
    std::optional<std::string> serial;           ///< Serial number
    std::optional<std::string> firmware;         ///< Firmware version
    std::optional<double> health_percent;        ///< Remaining life, 0-100
    std::optional<double> temperature_celsius;   ///< Current temperature
    std::optional<int64_t> power_on_hours;
    std::optional<int64_t> power_cycle_count;
    std::optional<int64_t> total_bad_block_count;
    std::optional<int64_t> erase_count_max;
    std::optional<int64_t> erase_count_avg;

    std::string raw_generic_output;  ///< Verbatim generic probe stdout
    std::string raw_vendor_output;   ///< Verbatim vendor probe stdout

    std::optional<VendorTag> vendor;  ///< Resolved dispatch entry, if any
    ProbeResult generic_probe;
    ProbeResult vendor_probe;

    auto operator==(const SsdHealthRecord&) const -> bool = default;
};

/**
 * @brief Model string reported when the generic probe yields no model
 */
inline constexpr auto UNKNOWN_MODEL = "Unknown";

/**
 * @brief Human-readable vendor tag name
 */
[[nodiscard]] inline auto vendor_tag_to_string(VendorTag tag) -> std::string {
    switch (tag) {
        case VendorTag::GENERIC:
            return "Generic";
        case VendorTag::INNODISK:
            return "InnoDisk";
        case VendorTag::VIRTIUM:
            return "Virtium";
    }
    return "Unknown";
}

/**
 * @brief Human-readable probe status
 */
[[nodiscard]] inline auto probe_status_to_string(ProbeStatus status) -> std::string {
    switch (status) {
        case ProbeStatus::NOT_RUN:
            return "not run";
        case ProbeStatus::COMPLETED:
            return "completed";
        case ProbeStatus::LAUNCH_FAILED:
            return "launch failed";
    }
    return "unknown";
}
