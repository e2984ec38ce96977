/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures and canned tool output for ssd-health tests
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "mocks/MockProcessRunner.hpp"
#include "models/SsdHealthRecord.hpp"

namespace fixtures {

inline const std::string DEVICE = "/dev/sda";

inline const std::vector<std::string> SMARTCTL_ARGV = {"smartctl", DEVICE, "-a"};
inline const std::vector<std::string> ISMART_ARGV = {"iSmart", "-d", DEVICE};
inline const std::vector<std::string> SMARTCMD_ARGV = {"SmartCmd", "-m", DEVICE};

/**
 * @brief smartctl -a output for a device with the given model line
 */
inline auto SmartctlOutput(const std::string& model) -> std::string {
    return "smartctl 7.2 2020-12-30 r5155 [x86_64-linux-5.10.0] (local build)\n"
           "Copyright (C) 2002-20, Bruce Allen, Christian Franke, www.smartmontools.org\n"
           "\n"
           "=== START OF INFORMATION SECTION ===\n"
           "Device Model:     " + model + "\n"
           "Serial Number:    BCA11712190600251\n"
           "Firmware Version: S16425i\n"
           "User Capacity:    32,017,047,552 bytes [32.0 GB]\n"
           "Sector Size:      512 bytes logical/physical\n"
           "SMART support is: Enabled\n";
}

// smartctl output of a device that does not report a model
inline const std::string SMARTCTL_NO_MODEL =
    "smartctl 7.2 2020-12-30 r5155 [x86_64-linux-5.10.0] (local build)\n"
    "\n"
    "=== START OF INFORMATION SECTION ===\n"
    "Serial Number:    BCA11712190600251\n"
    "Firmware Version: S16425i\n";

inline const std::string ISMART_OUTPUT =
    "********************************************************************************************\n"
    "* Innodisk iSMART V3.9.41                                                       2018/05/25 *\n"
    "********************************************************************************************\n"
    "Model Name: InnoDisk Corp. - mSATA 3ME4\n"
    "FW Version: S16425i\n"
    "Serial Number: BCA11712190600251\n"
    "Health: 83%\n"
    "Capacity: 29.818199 GB\n"
    "P/E Cycle: 3000\n"
    "Lifespan : 0 (Years : 0 Months : 0 Days)\n"
    "Write Protect: Disable\n"
    "InnoRobust: Enable\n"
    "--------------------------------------------------------------------------------\n"
    "ID    SMART Attributes                            Value           Raw Value\n"
    "--------------------------------------------------------------------------------\n"
    "[09]  Power On Hours                              [32]            [5178]\n"
    "[0C]  Power Cycle Count                           [  0]           [0000000000000000]\n"
    "[AA]  Total Bad Block Count                       [ 12]           [0000000000000000]\n"
    "[AD]  Erase Count Max.                            [ 7280]         [0000000000000000]\n"
    "[AD]  Erase Count Avg.                            [  251]         [0000000000000000]\n"
    "[C2]  Temperature                                 [ 41]           [0000000000000000]\n";

/**
 * @brief SmartCmd -m attribute table with the given erase counters
 */
inline auto SmartCmdOutput(const std::string& nand_endurance,
                           const std::string& avg_erase_count) -> std::string {
    return "Virtium SmartCmd v1.0\n"
           "Attribute              ID   Value   Worst  Threshold\n"
           "Temperature_Celsius    194  38      100    0\n"
           "NAND_Endurance         168  " + nand_endurance + "    100    0\n"
           "Average_Erase_Count    173  " + avg_erase_count + "      100    0\n"
           "Power_On_Hours         9    4711    100    0\n";
}

/**
 * @brief Fixture with a nice mock process runner
 */
class RunnerTestFixture : public ::testing::Test {
protected:
    std::shared_ptr<MockProcessRunner> runner;

    void SetUp() override {
        runner = MockProcessRunner::CreateNiceMock();
    }

    void TearDown() override {
        runner.reset();
    }

    // Route a specific command line to a canned result
    void ExpectCommand(const std::vector<std::string>& argv, const CommandResult& result) {
        EXPECT_CALL(*runner, run(argv)).WillOnce(testing::Return(result));
    }
};

}  // namespace fixtures
