/**
 * @file SmartctlParser.hpp
 * @brief Parser for smartctl -a output
 */

#pragma once

#include "parsers/IVendorParser.hpp"

/**
 * @class SmartctlParser
 * @brief Handles the generic (smartctl) probe
 *
 * The identity labels (model, serial, firmware) are read once from the
 * generic probe via parse_identity(). When a device dispatches to the
 * "Generic" entry there is nothing further to extract, so parse() leaves
 * the record as is.
 */
class SmartctlParser : public IVendorParser {
public:
    void parse(const std::string& output, SsdHealthRecord& record) const override;

    [[nodiscard]] auto get_name() const -> std::string override {
        return "smartctl";
    }

    /**
     * @brief Read model, serial and firmware from smartctl output
     * @param output Verbatim smartctl stdout
     * @param record Record to update; fields without a label stay empty
     *
     * The model is left empty here; normalizing it to "Unknown" is the
     * reporter's decision.
     */
    static void parse_identity(const std::string& output, SsdHealthRecord& record);
};
