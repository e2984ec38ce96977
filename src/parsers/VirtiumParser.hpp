/**
 * @file VirtiumParser.hpp
 * @brief Parser for Virtium SmartCmd output
 */

#pragma once

#include "parsers/IVendorParser.hpp"

#include <optional>

/**
 * @class VirtiumParser
 * @brief Reads temperature and derives health from the SMART attribute table
 *
 * SmartCmd does not print a health percentage. It is derived from the
 * erase counters:
 *
 *   health = 100 - (Average_Erase_Count * 100 / NAND_Endurance)
 *
 * Health stays empty when either counter is missing or the endurance is 0.
 */
class VirtiumParser : public IVendorParser {
public:
    void parse(const std::string& output, SsdHealthRecord& record) const override;

    [[nodiscard]] auto get_name() const -> std::string override {
        return "Virtium SmartCmd";
    }

    /**
     * @brief Wear-based health percentage
     * @param avg_erase_count Average block erase count
     * @param nand_endurance Rated erase cycles of the NAND
     * @return Health percentage, nullopt if the endurance is not positive
     */
    [[nodiscard]] static auto derive_health(double avg_erase_count, double nand_endurance)
        -> std::optional<double>;
};
