#include <gtest/gtest.h>
#include "modules/android_parser.hpp"

using namespace emu_manager;
using namespace emu_manager::modules::android;

namespace {

const char* kAvdList =
    "Available Android Virtual Devices:\n"
    "    Name: Pixel_7_API_34\n"
    "  Device: pixel_7 (Google)\n"
    "    Path: /home/user/.android/avd/Pixel_7_API_34.avd\n"
    "  Target: Google Play (Google Inc.)\n"
    "          Based on: Android 14.0 (UpsideDownCake) Tag/ABI: google_apis_playstore/x86_64\n"
    "  Sdcard: 512M\n"
    "---------\n"
    "    Name: Tablet_API_33\n"
    "  Device: pixel_tablet (Google)\n"
    "    Path: /home/user/.android/avd/Tablet_API_33.avd\n"
    "  Target: Google APIs (Google Inc.)\n"
    "          Based on: Android 13.0 (Tiramisu)\n"
    "  Tag/ABI: google_apis/x86_64\n"
    "---------\n"
    "    Name: Old_Device\n"
    "  Device: Nexus 5 (Google)\n"
    "    Path: /home/user/.android/avd/Old_Device.avd\n"
    "  Target: Default Android System Image (API level 28)\n";

const char* kDeviceProfiles =
    "Available devices definitions:\n"
    "id: 0 or \"automotive_1024p_landscape\"\n"
    "    Name: Automotive (1024p landscape)\n"
    "    OEM : Google\n"
    "    Tag : android-automotive-playstore\n"
    "---------\n"
    "id: 1 or \"pixel_7\"\n"
    "    Name: Pixel 7\n"
    "    OEM : Google\n"
    "---------\n"
    "id: 2 or \"pixel_7_pro\"\n"
    "    Name: Pixel 7 Pro\n"
    "    OEM : Google\n"
    "---------\n"
    "id: 3 or \"medium_phone\"\n"
    "    Name: Medium Phone\n"
    "    OEM : Generic\n"
    "---------\n"
    "id: 4 or \"Galaxy Nexus\"\n"
    "    Name: Galaxy Nexus\n"
    "    OEM : Google\n";

const char* kSdkList =
    "Installed packages:\n"
    "  Path                                        | Version | Description                    | Location\n"
    "  -------                                     | ------- | -------                        | -------\n"
    "  emulator                                    | 34.1.19 | Android Emulator               | emulator\n"
    "  system-images;android-34;google_apis;x86_64 | 12      | Google APIs Intel x86_64 Atom  | system-images/android-34/google_apis/x86_64\n"
    "  system-images;android-33;default;x86_64     | 5       | Intel x86_64 Atom System Image | system-images/android-33/default/x86_64\n"
    "\n"
    "Available Packages:\n"
    "  Path                                                  | Version | Description\n"
    "  system-images;android-34;google_apis_playstore;x86_64 | 12      | Google Play Intel x86_64\n"
    "  system-images;android-34;google_apis;x86_64           | 12      | Google APIs Intel x86_64\n"
    "  system-images;android-35;google_apis;arm64-v8a        | 8       | Google APIs ARM 64 v8a\n";

} // namespace

TEST(AvdListParserTest, ParsesEveryStanza) {
    auto stanzas = parse_avd_list(kAvdList);
    ASSERT_EQ(stanzas.size(), 3u);

    EXPECT_EQ(stanzas[0].name, "Pixel_7_API_34");
    EXPECT_EQ(stanzas[0].device, "pixel_7 (Google)");
    EXPECT_EQ(stanzas[0].path, "/home/user/.android/avd/Pixel_7_API_34.avd");
    EXPECT_EQ(stanzas[0].abi, "google_apis_playstore/x86_64");
    EXPECT_EQ(stanzas[0].api_level, 34u);

    EXPECT_EQ(stanzas[1].name, "Tablet_API_33");
    EXPECT_EQ(stanzas[1].abi, "google_apis/x86_64");
    EXPECT_EQ(stanzas[1].api_level, 33u);

    EXPECT_EQ(stanzas[2].name, "Old_Device");
    EXPECT_EQ(stanzas[2].api_level, 28u);
}

TEST(AvdListParserTest, MalformedStanzaHasNoApiLevel) {
    auto stanzas = parse_avd_list("    Name: Broken\n  Target: something odd\n");
    ASSERT_EQ(stanzas.size(), 1u);
    EXPECT_EQ(stanzas[0].name, "Broken");
    EXPECT_EQ(stanzas[0].api_level, 0u);
}

TEST(AvdListParserTest, EmptyOutput) {
    EXPECT_TRUE(parse_avd_list("").empty());
    EXPECT_TRUE(parse_avd_list("Available Android Virtual Devices:\n").empty());
}

TEST(ApiLevelParserTest, AndroidVersionsMapToApiLevels) {
    EXPECT_EQ(api_from_android_version("14"), 34u);
    EXPECT_EQ(api_from_android_version("14.0"), 34u);
    EXPECT_EQ(api_from_android_version("12"), 31u);
    EXPECT_EQ(api_from_android_version("12L"), 32u);
    EXPECT_EQ(api_from_android_version("8.1"), 27u);
    EXPECT_EQ(api_from_android_version("8.0"), 26u);
    EXPECT_EQ(api_from_android_version("4.4"), 19u);
    EXPECT_FALSE(api_from_android_version("Tiramisu").has_value());
}

TEST(ApiLevelParserTest, TargetTextFallbacks) {
    EXPECT_EQ(parse_api_level("Google APIs Based on: Android 15.0 (VanillaIceCream)"), 35u);
    EXPECT_EQ(parse_api_level("Default Android System Image (API level 30)"), 30u);
    EXPECT_EQ(parse_api_level("android-29"), 29u);
    EXPECT_EQ(parse_api_level("unknown"), 0u);
}

TEST(ApiLevelParserTest, VersionNames) {
    EXPECT_EQ(android_version_name(34), "Android 14");
    EXPECT_EQ(android_version_name(32), "Android 12L");
    EXPECT_EQ(android_version_name(99), "API 99");
}

TEST(AdbDevicesParserTest, SkipsHeaderAndDaemonLines) {
    auto devices = parse_adb_devices(
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n"
        "emulator-5554\tdevice\n"
        "emulator-5556\toffline\n"
        "R58M123ABC\tunauthorized\n\n");
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].serial, "emulator-5554");
    EXPECT_EQ(devices[0].state, "device");
    EXPECT_EQ(devices[1].state, "offline");
    EXPECT_EQ(devices[2].serial, "R58M123ABC");
}

TEST(DeviceProfileParserTest, ParsesProfiles) {
    auto profiles = parse_device_profiles(kDeviceProfiles);
    ASSERT_EQ(profiles.size(), 5u);
    EXPECT_EQ(profiles[1].id, "pixel_7");
    EXPECT_EQ(profiles[1].name, "Pixel 7");
    EXPECT_EQ(profiles[1].oem, "Google");
    EXPECT_EQ(profiles[1].display_name(), "Pixel 7 (Google)");
    EXPECT_EQ(profiles[3].display_name(), "Medium Phone");
    EXPECT_EQ(profiles[4].id, "Galaxy Nexus");
}

TEST(DeviceProfileParserTest, FuzzyMatching) {
    auto profiles = parse_device_profiles(kDeviceProfiles);

    EXPECT_EQ(find_matching_device_id(profiles, "pixel_7"), "pixel_7");
    EXPECT_EQ(find_matching_device_id(profiles, "Pixel 7 Pro"), "pixel_7_pro");
    EXPECT_EQ(find_matching_device_id(profiles, "Pixel 7 (Google)"), "pixel_7");
    EXPECT_EQ(find_matching_device_id(profiles, "PIXEL-7-PRO"), "pixel_7_pro");
    EXPECT_EQ(find_matching_device_id(profiles, "medium phone"), "medium_phone");
    EXPECT_EQ(find_matching_device_id(profiles, "Automotive 1024p"), "automotive_1024p_landscape");
    EXPECT_FALSE(find_matching_device_id(profiles, "Galaxy S24 Ultra").has_value());
    EXPECT_FALSE(find_matching_device_id(profiles, "").has_value());
}

TEST(SdkManagerParserTest, InstalledSystemImages) {
    auto images = parse_installed_system_images(kSdkList);
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0], "system-images;android-34;google_apis;x86_64");
    EXPECT_EQ(images[1], "system-images;android-33;default;x86_64");
}

TEST(SdkManagerParserTest, ApiLevelsGroupedNewestFirst) {
    auto levels = parse_api_levels(kSdkList);
    ASSERT_EQ(levels.size(), 3u);
    EXPECT_EQ(levels[0].api, 35u);
    EXPECT_FALSE(levels[0].is_installed);
    EXPECT_EQ(levels[0].version, "Android 15");

    EXPECT_EQ(levels[1].api, 34u);
    EXPECT_TRUE(levels[1].is_installed);
    ASSERT_EQ(levels[1].variants.size(), 2u);
    EXPECT_EQ(levels[1].variants[0].variant, "google_apis");
    EXPECT_TRUE(levels[1].variants[0].is_installed);
    EXPECT_EQ(levels[1].variants[1].variant, "google_apis_playstore");
    EXPECT_FALSE(levels[1].variants[1].is_installed);

    EXPECT_EQ(levels[2].api, 33u);
    EXPECT_EQ(levels[2].display_name(), "API 33 (Android 13)");
}

TEST(SdkManagerParserTest, RecommendedVariantPrefersPlayStore) {
    auto levels = parse_api_levels(kSdkList);
    ASSERT_GE(levels.size(), 2u);
    const auto* variant = levels[1].get_recommended_variant("x86_64");
    ASSERT_NE(variant, nullptr);
    EXPECT_EQ(variant->package_id, "system-images;android-34;google_apis_playstore;x86_64");
    EXPECT_EQ(variant->display_name(), "Google Play Store (x86_64)");

    core::ApiLevel empty;
    EXPECT_EQ(empty.get_recommended_variant("x86_64"), nullptr);
}

TEST(SdkManagerParserTest, PackageIds) {
    auto package = parse_system_image_package("system-images;android-34;google_apis;x86_64");
    ASSERT_TRUE(package.has_value());
    EXPECT_EQ(package->api, 34u);
    EXPECT_EQ(package->tag, "google_apis");
    EXPECT_EQ(package->abi, "x86_64");
    EXPECT_EQ(system_image_package(34, "google_apis", "x86_64"), "system-images;android-34;google_apis;x86_64");

    EXPECT_FALSE(parse_system_image_package("platform-tools").has_value());
    EXPECT_FALSE(parse_system_image_package("system-images;android-34;google_apis").has_value());
}

TEST(ConfigIniTest, ParseAndRender) {
    auto values = parse_config_ini("# comment\nhw.ramSize = 2048\nimage.sysdir.1=system-images/android-33/google_apis/x86_64/\n\nbad line\n");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values["hw.ramSize"], "2048");
    EXPECT_EQ(api_level_from_config(values), 33u);

    auto rendered = render_config_ini({{"a", "1"}, {"b", "2"}});
    EXPECT_EQ(rendered, "a=1\nb=2\n");
    EXPECT_EQ(api_level_from_config({}), 0u);
}

TEST(ConfigIniTest, SizeUnits) {
    EXPECT_EQ(parse_size_mb("8192M"), 8192u);
    EXPECT_EQ(parse_size_mb("8G"), 8192u);
    EXPECT_EQ(parse_size_mb("2048"), 2048u);
    EXPECT_EQ(parse_size_mb("4GB"), 4096u);
    EXPECT_EQ(parse_size_mb("6442450944"), 6144u);
    EXPECT_FALSE(parse_size_mb("lots").has_value());
    EXPECT_FALSE(parse_size_mb("").has_value());
}

TEST(ToolOutputTest, SanitizeAvdName) {
    EXPECT_EQ(sanitize_avd_name("My Pixel 7"), "My_Pixel_7");
    EXPECT_EQ(sanitize_avd_name("  dev (test)! "), "dev_test");
    EXPECT_EQ(sanitize_avd_name("Ünïcode-1.0"), "ncode-1.0");
    EXPECT_EQ(sanitize_avd_name("!!!"), "");
}

TEST(ToolOutputTest, SummarizeToolError) {
    EXPECT_EQ(summarize_tool_error("Loading local repository...\nError: Package path is not valid.\n"),
              "Package path is not valid.");
    EXPECT_EQ(summarize_tool_error("\nsomething went wrong\nmore\n"), "something went wrong");
    EXPECT_EQ(summarize_tool_error(""), "");
}

TEST(ToolOutputTest, InstallProgressLines) {
    auto downloading = parse_install_progress_line("[=====    ] 50% Downloading x86_64-34_r12.zip...");
    ASSERT_TRUE(downloading.has_value());
    EXPECT_EQ(downloading->percentage, 45);
    EXPECT_EQ(downloading->operation, "Downloading system image...");

    auto done = parse_install_progress_line("[=========] 100% Downloading x86_64-34_r12.zip...");
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->percentage, 70);

    auto unzip = parse_install_progress_line("[=========] 100% Unzipping... x86_64/system.img");
    ASSERT_TRUE(unzip.has_value());
    EXPECT_EQ(unzip->percentage, 75);

    auto installing = parse_install_progress_line("Installing Google APIs Intel x86_64 Atom System Image");
    ASSERT_TRUE(installing.has_value());
    EXPECT_EQ(installing->percentage, 85);

    EXPECT_FALSE(parse_install_progress_line("Loading local repository...").has_value());
}

TEST(ToolOutputTest, Targets) {
    auto targets = parse_targets(
        "Available Android targets:\n"
        "----------\n"
        "id: 1 or \"android-33\"\n"
        "     Name: Android API 33\n"
        "     Type: Platform\n"
        "     API level: 33\n"
        "     Revision: 2\n"
        "----------\n"
        "id: 2 or \"android-34\"\n"
        "     Name: Android API 34\n"
        "     Type: Platform\n"
        "     API level: 34\n");
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].first, "android-33");
    EXPECT_EQ(targets[0].second, "API 33 (Android 13)");
    EXPECT_EQ(targets[1].second, "API 34 (Android 14)");
}
