/**
 * @file IVendorParser.hpp
 * @brief Base interface for vendor tool output parsers
 */

#pragma once

#include "models/SsdHealthRecord.hpp"

#include <string>

/**
 * @class IVendorParser
 * @brief Extracts vendor specific metrics from a diagnostic tool's text
 *
 * Parsers only set the fields they find; anything the text does not
 * contain is left untouched. Parsers never throw on unexpected text.
 */
class IVendorParser {
public:
    virtual ~IVendorParser() = default;

    /**
     * @brief Populate vendor metrics from captured tool output
     * @param output Verbatim stdout of the vendor tool
     * @param record Record to update
     */
    virtual void parse(const std::string& output, SsdHealthRecord& record) const = 0;

    /**
     * @brief Get the name of this parser
     */
    [[nodiscard]] virtual auto get_name() const -> std::string = 0;
};
