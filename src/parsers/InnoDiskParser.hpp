/**
 * @file InnoDiskParser.hpp
 * @brief Parser for InnoDisk iSmart output
 */

#pragma once

#include "parsers/IVendorParser.hpp"

/**
 * @class InnoDiskParser
 * @brief Reads health and wear counters reported by iSmart
 *
 * Health is printed as "Health: 83%"; the remaining counters use the
 * "Label [ value ]" layout, e.g. "Power On Hours [ 1234 ]".
 */
class InnoDiskParser : public IVendorParser {
public:
    void parse(const std::string& output, SsdHealthRecord& record) const override;

    [[nodiscard]] auto get_name() const -> std::string override {
        return "InnoDisk iSmart";
    }
};
