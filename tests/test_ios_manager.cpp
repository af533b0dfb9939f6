#include <gtest/gtest.h>
#include "modules/ios_manager.hpp"
#include "core/mock_command_executor.hpp"
#include <algorithm>

using namespace emu_manager;
using namespace emu_manager::modules;

namespace {

const char* kDevicesJson = R"json({
  "devices" : {
    "com.apple.CoreSimulator.SimRuntime.iOS-17-0" : [
      {
        "dataPath" : "/Users/dev/Library/Developer/CoreSimulator/Devices/AAAA/data",
        "udid" : "AAAA-1111",
        "isAvailable" : true,
        "deviceTypeIdentifier" : "com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro",
        "state" : "Booted",
        "name" : "iPhone 15 Pro"
      },
      {
        "udid" : "BBBB-2222",
        "isAvailable" : true,
        "deviceTypeIdentifier" : "com.apple.CoreSimulator.SimDeviceType.iPad-Air-5th-generation",
        "state" : "Shutdown",
        "name" : "iPad Air (5th generation)"
      },
      {
        "isAvailable" : true,
        "state" : "Shutdown",
        "name" : "Missing udid"
      }
    ],
    "com.apple.CoreSimulator.SimRuntime.iOS-16-4" : [
      {
        "udid" : "CCCC-3333",
        "availability" : "(unavailable, runtime profile not found)",
        "deviceTypeIdentifier" : "com.apple.CoreSimulator.SimDeviceType.iPhone-14",
        "state" : "Shutdown",
        "name" : "iPhone 14"
      }
    ]
  }
})json";

const char* kDeviceTypesJson = R"json({
  "devicetypes" : [
    { "identifier" : "com.apple.CoreSimulator.SimDeviceType.iPad-Air-5th-generation", "name" : "iPad Air (5th generation)" },
    { "identifier" : "com.apple.CoreSimulator.SimDeviceType.iPhone-14", "name" : "iPhone 14" },
    { "identifier" : "com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro", "name" : "iPhone 15 Pro" },
    { "identifier" : "com.apple.CoreSimulator.SimDeviceType.iPhone-15" }
  ]
})json";

const char* kRuntimesJson = R"({
  "runtimes" : [
    { "identifier" : "com.apple.CoreSimulator.SimRuntime.iOS-16-4", "name" : "iOS 16.4", "version" : "16.4", "isAvailable" : true },
    { "identifier" : "com.apple.CoreSimulator.SimRuntime.iOS-17-0", "name" : "iOS 17.0", "version" : "17.0", "isAvailable" : true },
    { "identifier" : "com.apple.CoreSimulator.SimRuntime.iOS-15-0", "name" : "iOS 15.0", "version" : "15.0", "isAvailable" : false }
  ]
})";

} // namespace

TEST(SimctlParserTest, DeviceRecords) {
    auto records = ios::parse_device_records(kDevicesJson);
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 3u);

    auto find = [&](const std::string& udid) {
        return std::find_if(records->begin(), records->end(),
                            [&](const ios::SimDeviceRecord& r) { return r.udid == udid; });
    };
    auto pro = find("AAAA-1111");
    ASSERT_NE(pro, records->end());
    EXPECT_EQ(pro->state, "Booted");
    EXPECT_EQ(pro->runtime_identifier, "com.apple.CoreSimulator.SimRuntime.iOS-17-0");
    EXPECT_EQ(pro->data_path, "/Users/dev/Library/Developer/CoreSimulator/Devices/AAAA/data");

    auto legacy = find("CCCC-3333");
    ASSERT_NE(legacy, records->end());
    EXPECT_FALSE(legacy->is_available);
}

TEST(SimctlParserTest, InvalidJsonIsParseError) {
    auto not_json = ios::parse_device_records("xcrun: error: unable to find utility \"simctl\"");
    ASSERT_FALSE(not_json.has_value());
    EXPECT_EQ(not_json.error().kind, core::DeviceErrorKind::Parse);

    auto no_member = ios::parse_device_records(R"({"runtimes": []})");
    ASSERT_FALSE(no_member.has_value());
    EXPECT_EQ(no_member.error().kind, core::DeviceErrorKind::Parse);

    EXPECT_FALSE(ios::parse_runtimes("[]").has_value());
}

TEST(SimctlParserTest, DeviceTypesFillMissingNames) {
    auto types = ios::parse_device_types(kDeviceTypesJson);
    ASSERT_TRUE(types.has_value());
    ASSERT_EQ(types->size(), 4u);
    EXPECT_EQ((*types)[3].name, "iPhone 15");
}

TEST(SimctlParserTest, Runtimes) {
    auto runtimes = ios::parse_runtimes(kRuntimesJson);
    ASSERT_TRUE(runtimes.has_value());
    ASSERT_EQ(runtimes->size(), 3u);
    EXPECT_FALSE((*runtimes)[2].is_available);

    EXPECT_EQ(ios::runtime_version("com.apple.CoreSimulator.SimRuntime.iOS-17-0"), "17.0");
    EXPECT_EQ(ios::runtime_display_name("com.apple.CoreSimulator.SimRuntime.watchOS-10-2"), "watchOS 10.2");
    EXPECT_EQ(ios::device_type_fallback_name("com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro-Max"),
              "iPhone 15 Pro Max");
}

TEST(SimctlParserTest, StateMapping) {
    EXPECT_EQ(ios::state_to_status("Booted"), core::DeviceStatus::Running);
    EXPECT_EQ(ios::state_to_status("Shutdown"), core::DeviceStatus::Stopped);
    EXPECT_EQ(ios::state_to_status("Booting"), core::DeviceStatus::Starting);
    EXPECT_EQ(ios::state_to_status("Shutting Down"), core::DeviceStatus::Stopping);
    EXPECT_EQ(ios::state_to_status("Creating"), core::DeviceStatus::Creating);
    EXPECT_EQ(ios::state_to_status("Exploded"), core::DeviceStatus::Unknown);
}

TEST(SimctlParserTest, VersionOrdering) {
    EXPECT_TRUE(ios::version_less("17.2", "17.10"));
    EXPECT_TRUE(ios::version_less("16.4", "17.0"));
    EXPECT_FALSE(ios::version_less("17.0", "17"));
    EXPECT_FALSE(ios::version_less("18.0", "17.5"));
}

class IosManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_ = std::make_shared<core::MockCommandExecutor>();
        mock_->set_retry_policy({std::chrono::milliseconds(1), std::chrono::milliseconds(1)});
        mock_->with_success("xcrun", {"simctl", "list", "devices", "--json"}, kDevicesJson);
        mock_->with_success("xcrun", {"simctl", "list", "devicetypes", "--json"}, kDeviceTypesJson);
        mock_->with_success("xcrun", {"simctl", "list", "runtimes", "--json"}, kRuntimesJson);

        IosSettings settings;
        settings.available = true;
        settings.quiet = true;
        settings.max_retries = 1;
        manager_ = std::make_unique<IosManager>(mock_, settings);
    }

    std::shared_ptr<core::MockCommandExecutor> mock_;
    std::unique_ptr<IosManager> manager_;
};

TEST_F(IosManagerTest, ListsDevicesInPriorityOrder) {
    auto devices = manager_->list_devices();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 3u);

    EXPECT_EQ((*devices)[0].name, "iPhone 14");
    EXPECT_EQ((*devices)[1].name, "iPhone 15 Pro");
    EXPECT_EQ((*devices)[2].name, "iPad Air (5th generation)");

    const auto& pro = (*devices)[1];
    EXPECT_EQ(pro.identifier, "AAAA-1111");
    EXPECT_EQ(pro.status, core::DeviceStatus::Running);
    ASSERT_NE(pro.ios(), nullptr);
    EXPECT_EQ(pro.ios()->ios_version, "17.0");
    EXPECT_EQ(pro.ios()->runtime_version, "iOS 17.0");
    EXPECT_EQ(pro.ios()->device_type, "iPhone 15 Pro");
    EXPECT_FALSE((*devices)[0].ios()->is_available);
}

TEST_F(IosManagerTest, ListingFailsOnBadJson) {
    mock_->with_success("xcrun", {"simctl", "list", "devices", "--json"}, "not json");
    auto devices = manager_->list_devices();
    ASSERT_FALSE(devices.has_value());
    EXPECT_EQ(devices.error().kind, core::DeviceErrorKind::Parse);
}

TEST_F(IosManagerTest, DeviceTypesSorted) {
    auto types = manager_->list_device_types();
    ASSERT_TRUE(types.has_value());
    ASSERT_EQ(types->size(), 4u);
    EXPECT_EQ((*types)[0].second, "iPhone 15");
    EXPECT_EQ((*types)[1].second, "iPhone 14");
    EXPECT_EQ((*types)[2].second, "iPhone 15 Pro");
    EXPECT_EQ((*types)[3].second, "iPad Air (5th generation)");
}

TEST_F(IosManagerTest, RuntimesNewestFirstAndAvailableOnly) {
    auto runtimes = manager_->list_runtimes();
    ASSERT_TRUE(runtimes.has_value());
    ASSERT_EQ(runtimes->size(), 2u);
    EXPECT_EQ((*runtimes)[0].version, "17.0");
    EXPECT_EQ((*runtimes)[1].version, "16.4");
}

TEST_F(IosManagerTest, StartBootsShutdownDevice) {
    mock_->with_success("xcrun", {"simctl", "boot", "BBBB-2222"}, "");
    mock_->with_spawn("open", {"-a", "Simulator"}, 77);

    ASSERT_TRUE(manager_->start_device("BBBB-2222").has_value());
    EXPECT_TRUE(mock_->was_called("xcrun", {"simctl", "boot", "BBBB-2222"}));
    EXPECT_TRUE(mock_->was_called("open", {"-a", "Simulator"}));
}

TEST_F(IosManagerTest, StartOfBootedDeviceIsNoOp) {
    ASSERT_TRUE(manager_->start_device("iPhone 15 Pro").has_value());
    EXPECT_FALSE(mock_->was_called("xcrun", {"simctl", "boot", "AAAA-1111"}));
}

TEST_F(IosManagerTest, BootRaceIsIgnored) {
    mock_->with_error("xcrun", {"simctl", "boot", "BBBB-2222"},
                      "An error was encountered processing the command (domain=com.apple.CoreSimulator.SimError, code=405):\n"
                      "Unable to boot device in current state: Booted");
    EXPECT_TRUE(manager_->start_device("BBBB-2222").has_value());
}

TEST_F(IosManagerTest, BootFailureIsStartFailed) {
    mock_->with_error("xcrun", {"simctl", "boot", "BBBB-2222"}, "Runtime is unavailable");
    auto started = manager_->start_device("BBBB-2222");
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().kind, core::DeviceErrorKind::StartFailed);
}

TEST_F(IosManagerTest, StopIgnoresAlreadyShutdown) {
    mock_->with_error("xcrun", {"simctl", "shutdown", "BBBB-2222"},
                      "Unable to shutdown device in current state: Shutdown");
    EXPECT_TRUE(manager_->stop_device("BBBB-2222").has_value());
}

TEST_F(IosManagerTest, StopQuitsSimulatorWhenNothingIsBooted) {
    mock_->with_success("xcrun", {"simctl", "list", "devices", "--json"},
                        R"({"devices": {"com.apple.CoreSimulator.SimRuntime.iOS-17-0": [
                            {"udid": "AAAA-1111", "name": "iPhone 15 Pro", "state": "Shutdown"}]}})");
    mock_->with_success("xcrun", {"simctl", "shutdown", "AAAA-1111"}, "");
    mock_->with_error("osascript", {"-e", "tell application \"Simulator\" to quit"}, "execution error");
    mock_->with_error("killall", {"Simulator"}, "No matching processes belonging to you were found");

    EXPECT_TRUE(manager_->stop_device("AAAA-1111").has_value());
    EXPECT_TRUE(mock_->was_called("osascript", {"-e", "tell application \"Simulator\" to quit"}));
    EXPECT_TRUE(mock_->was_called("killall", {"Simulator"}));
}

TEST_F(IosManagerTest, DeleteShutsDownBootedDevice) {
    mock_->with_success("xcrun", {"simctl", "shutdown", "AAAA-1111"}, "");
    mock_->with_success("xcrun", {"simctl", "delete", "AAAA-1111"}, "");

    EXPECT_TRUE(manager_->delete_device("AAAA-1111").has_value());
    EXPECT_TRUE(mock_->was_called("xcrun", {"simctl", "shutdown", "AAAA-1111"}));
    EXPECT_TRUE(mock_->was_called("xcrun", {"simctl", "delete", "AAAA-1111"}));
}

TEST_F(IosManagerTest, DeleteUnknownIsNotFound) {
    auto deleted = manager_->delete_device("ZZZZ");
    ASSERT_FALSE(deleted.has_value());
    EXPECT_EQ(deleted.error().kind, core::DeviceErrorKind::NotFound);
}

TEST_F(IosManagerTest, WipeErasesDevice) {
    mock_->with_success("xcrun", {"simctl", "shutdown", "BBBB-2222"}, "");
    mock_->with_error("xcrun", {"simctl", "erase", "BBBB-2222"}, "Device busy");

    auto wiped = manager_->wipe_device("BBBB-2222");
    ASSERT_FALSE(wiped.has_value());
    EXPECT_EQ(wiped.error().message(), "Failed to wipe device iPad Air (5th generation): Device busy");

    mock_->with_success("xcrun", {"simctl", "erase", "BBBB-2222"}, "");
    EXPECT_TRUE(manager_->wipe_device("BBBB-2222").has_value());
}

TEST_F(IosManagerTest, CreateResolvesTypeAndRuntime) {
    mock_->with_success("xcrun",
                        {"simctl", "create", "Test Phone", "com.apple.CoreSimulator.SimDeviceType.iPhone-15-Pro",
                         "com.apple.CoreSimulator.SimRuntime.iOS-17-0"},
                        "DDDD-4444\n");

    core::DeviceConfig config{"Test Phone", "iPhone 15 Pro", "17.0", std::nullopt, std::nullopt, {}};
    auto udid = manager_->create_device(config);
    ASSERT_TRUE(udid.has_value()) << udid.error().message();
    EXPECT_EQ(*udid, "DDDD-4444");
}

TEST_F(IosManagerTest, CreateDefaultsToNewestRuntime) {
    mock_->with_success("xcrun",
                        {"simctl", "create", "Pad", "com.apple.CoreSimulator.SimDeviceType.iPad-Air-5th-generation",
                         "com.apple.CoreSimulator.SimRuntime.iOS-17-0"},
                        "EEEE-5555\n");

    core::DeviceConfig config{"Pad", "iPad Air (5th generation)", "", std::nullopt, std::nullopt, {}};
    auto udid = manager_->create_device(config);
    ASSERT_TRUE(udid.has_value()) << udid.error().message();
    EXPECT_EQ(*udid, "EEEE-5555");
}

TEST_F(IosManagerTest, CreateWithUnknownRuntimeFails) {
    core::DeviceConfig config{"Old", "iPhone 14", "12.0", std::nullopt, std::nullopt, {}};
    auto udid = manager_->create_device(config);
    ASSERT_FALSE(udid.has_value());
    EXPECT_EQ(udid.error().kind, core::DeviceErrorKind::CreateFailed);
    EXPECT_EQ(udid.error().subject, "Old");

    core::DeviceConfig unnamed{"  ", "iPhone 14", "17.0", std::nullopt, std::nullopt, {}};
    EXPECT_EQ(manager_->create_device(unnamed).error().kind, core::DeviceErrorKind::InvalidConfig);
}

TEST_F(IosManagerTest, Details) {
    auto details = manager_->get_device_details("iPhone 15 Pro");
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->identifier, "AAAA-1111");
    EXPECT_EQ(details->status, "Running");
    EXPECT_EQ(details->api_level_or_version, "iOS 17.0");
    EXPECT_EQ(details->device_type, "iPhone 15 Pro");
    EXPECT_EQ(details->device_path, "/Users/dev/Library/Developer/CoreSimulator/Devices/AAAA/data");
}

TEST(IosUnavailableTest, EmptyListsAndUnsupportedLifecycle) {
    auto mock = std::make_shared<core::MockCommandExecutor>();
    IosSettings settings;
    settings.available = false;
    settings.quiet = true;
    IosManager manager(mock, settings);

    EXPECT_FALSE(manager.is_available());
    auto devices = manager.list_devices();
    ASSERT_TRUE(devices.has_value());
    EXPECT_TRUE(devices->empty());

    auto started = manager.start_device("anything");
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().kind, core::DeviceErrorKind::PlatformNotSupported);
    EXPECT_EQ(manager.delete_device("anything").error().kind, core::DeviceErrorKind::PlatformNotSupported);
    EXPECT_TRUE(mock->call_history().empty());
}
