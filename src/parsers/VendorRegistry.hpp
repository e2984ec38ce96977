/**
 * @file VendorRegistry.hpp
 * @brief Fixed dispatch table from model prefix to vendor tool and parser
 */

#pragma once

#include "models/SsdHealthRecord.hpp"
#include "parsers/IVendorParser.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parsers {

/**
 * @struct VendorUtility
 * @brief Command template and parser bound to one vendor tag
 *
 * The template is a whitespace separated command line in which "{}"
 * stands for the device path, e.g. "iSmart -d {}".
 */
struct VendorUtility {
    std::string command_template;
    std::shared_ptr<const IVendorParser> parser;
};

/**
 * @class VendorRegistry
 * @brief Immutable table shared by all reporters
 *
 * Dispatch keys (first word of the detected model) map to a vendor tag,
 * and every tag maps to exactly one VendorUtility. Several keys may alias
 * the same tag, e.g. "InnoDisk" and "M.2".
 *
 * @example
 * ```cpp
 * const auto& registry = parsers::VendorRegistry::instance();
 * if (auto tag = registry.resolve("Virtium")) {
 *     auto argv = VendorRegistry::build_command(
 *         registry.utility(*tag).command_template, "/dev/sda");
 * }
 * ```
 */
class VendorRegistry {
public:
    /**
     * @brief Get the shared, fully populated table
     */
    [[nodiscard]] static auto instance() -> const VendorRegistry&;

    VendorRegistry(const VendorRegistry&) = delete;
    VendorRegistry& operator=(const VendorRegistry&) = delete;

    /**
     * @brief Look up a dispatch key (exact, case-sensitive)
     * @param key First word of the model string
     * @return Vendor tag, or nullopt for an unknown vendor
     */
    [[nodiscard]] auto resolve(std::string_view key) const -> std::optional<VendorTag>;

    /**
     * @brief Command template and parser for a tag
     */
    [[nodiscard]] auto utility(VendorTag tag) const -> const VendorUtility&;

    /**
     * @brief All dispatch keys, sorted
     */
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

    /**
     * @brief Expand a command template into an argv vector
     * @param command_template Template such as "smartctl {} -a"
     * @param device_path Value substituted for every "{}" word
     */
    [[nodiscard]] static auto build_command(std::string_view command_template,
                                            const std::string& device_path)
        -> std::vector<std::string>;

private:
    VendorRegistry();
    ~VendorRegistry() = default;

    std::map<std::string, VendorTag, std::less<>> keys_;
    std::map<VendorTag, VendorUtility> utilities_;
};

}  // namespace parsers
