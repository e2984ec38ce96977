/**
 * @file VendorRegistry.cpp
 * @brief Fixed dispatch table from model prefix to vendor tool and parser
 */

#include "parsers/VendorRegistry.hpp"

#include "parsers/InnoDiskParser.hpp"
#include "parsers/SmartctlParser.hpp"
#include "parsers/VirtiumParser.hpp"
#include "util/TextMatch.hpp"

namespace parsers {

namespace {

constexpr auto SMARTCTL = "smartctl {} -a";
constexpr auto INNODISK = "iSmart -d {}";
constexpr auto VIRTIUM = "SmartCmd -m {}";

constexpr auto DEVICE_PLACEHOLDER = std::string_view{"{}"};

}  // namespace

VendorRegistry::VendorRegistry()
    : keys_{
          {"Generic", VendorTag::GENERIC},
          {"InnoDisk", VendorTag::INNODISK},
          {"M.2", VendorTag::INNODISK},
          {"StorFly", VendorTag::VIRTIUM},
          {"Virtium", VendorTag::VIRTIUM},
      } {
    utilities_.emplace(VendorTag::GENERIC,
                       VendorUtility{SMARTCTL, std::make_shared<SmartctlParser>()});
    utilities_.emplace(VendorTag::INNODISK,
                       VendorUtility{INNODISK, std::make_shared<InnoDiskParser>()});
    utilities_.emplace(VendorTag::VIRTIUM,
                       VendorUtility{VIRTIUM, std::make_shared<VirtiumParser>()});
}

auto VendorRegistry::instance() -> const VendorRegistry& {
    static const VendorRegistry registry;
    return registry;
}

auto VendorRegistry::resolve(std::string_view key) const -> std::optional<VendorTag> {
    auto it = keys_.find(key);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto VendorRegistry::utility(VendorTag tag) const -> const VendorUtility& {
    // Every enumerator is populated in the constructor.
    return utilities_.at(tag);
}

auto VendorRegistry::keys() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(keys_.size());
    for (const auto& [key, _] : keys_) {
        result.push_back(key);
    }
    return result;
}

auto VendorRegistry::build_command(std::string_view command_template,
                                   const std::string& device_path) -> std::vector<std::string> {
    std::vector<std::string> argv;
    auto rest = util::trim(command_template);
    while (!rest.empty()) {
        auto word = util::first_token(rest);
        argv.emplace_back(word == DEVICE_PLACEHOLDER ? device_path : std::string{word});
        rest = util::trim(rest.substr(word.size()));
    }
    return argv;
}

}  // namespace parsers
