/**
 * @file VendorRegistryTest.cpp
 * @brief Unit tests for the vendor dispatch table
 */

#include "parsers/VendorRegistry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using parsers::VendorRegistry;

class VendorRegistryTest : public ::testing::Test {
protected:
    const VendorRegistry& registry = VendorRegistry::instance();
};

TEST_F(VendorRegistryTest, Resolve_KnownKeys) {
    EXPECT_EQ(registry.resolve("Generic"), VendorTag::GENERIC);
    EXPECT_EQ(registry.resolve("InnoDisk"), VendorTag::INNODISK);
    EXPECT_EQ(registry.resolve("M.2"), VendorTag::INNODISK);
    EXPECT_EQ(registry.resolve("StorFly"), VendorTag::VIRTIUM);
    EXPECT_EQ(registry.resolve("Virtium"), VendorTag::VIRTIUM);
}

TEST_F(VendorRegistryTest, Resolve_IsCaseSensitive) {
    EXPECT_FALSE(registry.resolve("innodisk").has_value());
    EXPECT_FALSE(registry.resolve("VIRTIUM").has_value());
}

TEST_F(VendorRegistryTest, Resolve_UnknownKey_ReturnsNullopt) {
    EXPECT_FALSE(registry.resolve("Samsung").has_value());
    EXPECT_FALSE(registry.resolve("").has_value());
    EXPECT_FALSE(registry.resolve("InnoDisk Corp.").has_value());
}

TEST_F(VendorRegistryTest, Keys_ListsEveryAlias) {
    EXPECT_THAT(registry.keys(),
                testing::ElementsAre("Generic", "InnoDisk", "M.2", "StorFly", "Virtium"));
}

TEST_F(VendorRegistryTest, Utility_CommandTemplates) {
    EXPECT_EQ(registry.utility(VendorTag::GENERIC).command_template, "smartctl {} -a");
    EXPECT_EQ(registry.utility(VendorTag::INNODISK).command_template, "iSmart -d {}");
    EXPECT_EQ(registry.utility(VendorTag::VIRTIUM).command_template, "SmartCmd -m {}");
}

TEST_F(VendorRegistryTest, Utility_AliasesShareParser) {
    const auto& innodisk = registry.utility(*registry.resolve("InnoDisk"));
    const auto& m2 = registry.utility(*registry.resolve("M.2"));
    EXPECT_EQ(innodisk.parser.get(), m2.parser.get());

    const auto& storfly = registry.utility(*registry.resolve("StorFly"));
    const auto& virtium = registry.utility(*registry.resolve("Virtium"));
    EXPECT_EQ(storfly.parser.get(), virtium.parser.get());
}

TEST_F(VendorRegistryTest, Utility_EveryTagHasParser) {
    for (auto tag : {VendorTag::GENERIC, VendorTag::INNODISK, VendorTag::VIRTIUM}) {
        ASSERT_NE(registry.utility(tag).parser, nullptr);
        EXPECT_FALSE(registry.utility(tag).parser->get_name().empty());
    }
}

TEST_F(VendorRegistryTest, Instance_IsShared) {
    EXPECT_EQ(&VendorRegistry::instance(), &registry);
}

TEST_F(VendorRegistryTest, BuildCommand_SubstitutesDevicePath) {
    EXPECT_THAT(VendorRegistry::build_command("smartctl {} -a", "/dev/sda"),
                testing::ElementsAre("smartctl", "/dev/sda", "-a"));
    EXPECT_THAT(VendorRegistry::build_command("iSmart -d {}", "/dev/sdb"),
                testing::ElementsAre("iSmart", "-d", "/dev/sdb"));
}

TEST_F(VendorRegistryTest, BuildCommand_DevicePathWithSpacesStaysOneArgument) {
    EXPECT_THAT(VendorRegistry::build_command("SmartCmd -m {}", "/dev/disk/by-id/odd name"),
                testing::ElementsAre("SmartCmd", "-m", "/dev/disk/by-id/odd name"));
}

TEST_F(VendorRegistryTest, BuildCommand_EmptyTemplate_ReturnsEmpty) {
    EXPECT_TRUE(VendorRegistry::build_command("   ", "/dev/sda").empty());
}
