#include <gtest/gtest.h>
#include "utils/thread_pool.hpp"
#include "utils/string_utils.hpp"
#include <atomic>
#include <future>
#include <chrono>

using namespace emu_manager::utils;

TEST(ThreadPoolTest, SimpleTask) {
    ThreadPool pool(2);
    auto fut = pool.enqueue([]() { return 42; });
    EXPECT_EQ(fut.get(), 42);
}

TEST(ThreadPoolTest, MultipleTasks) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.enqueue([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, StopAndQueue) {
    auto pool = std::make_unique<ThreadPool>(1);
    pool.reset(); // Destructor called, pool stopped.
}

TEST(ThreadPoolTest, ZeroThreadsStillRunsTasks) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.enqueue([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, WaitIdleDrainsQueue) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 8; ++i) {
        pool.enqueue([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ++done;
        });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 8);
}

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(trim("  Pixel 7 \t\n"), "Pixel 7");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("Galaxy S24"), "galaxy s24");
}

TEST(StringUtilsTest, SplitLinesDropsCarriageReturns) {
    auto lines = split_lines("a\r\nb\n\nc");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");
}

TEST(StringUtilsTest, SplitAndJoin) {
    auto parts = split("system-images;android-34;google_apis;x86_64", ';');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[1], "android-34");
    EXPECT_EQ(join(parts, ";"), "system-images;android-34;google_apis;x86_64");

    auto words = split_whitespace("  emulator-5554\tdevice  ");
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[0], "emulator-5554");
    EXPECT_EQ(words[1], "device");
}

TEST(StringUtilsTest, Contains) {
    EXPECT_TRUE(contains("already booted", "booted"));
    EXPECT_FALSE(contains("already booted", "Booted"));
    EXPECT_TRUE(contains_icase("Permission DENIED", "denied"));
}

TEST(StringUtilsTest, Basename) {
    EXPECT_EQ(emu_manager::utils::basename("/opt/sdk/platform-tools/adb"), std::string("adb"));
    EXPECT_EQ(emu_manager::utils::basename("adb"), std::string("adb"));
}

TEST(StringUtilsTest, ParseNumbers) {
    EXPECT_EQ(parse_uint("34"), 34u);
    EXPECT_FALSE(parse_uint("34a").has_value());
    EXPECT_FALSE(parse_uint("").has_value());
    EXPECT_EQ(parse_leading_uint("34-ext10"), 34u);
    EXPECT_FALSE(parse_leading_uint("x34").has_value());
}

TEST(StringUtilsTest, TruncateWithEllipsis) {
    EXPECT_EQ(truncate_with_ellipsis("short", 10), "short");
    std::string long_text(200, 'x');
    auto cut = truncate_with_ellipsis(long_text, 150);
    EXPECT_EQ(cut.size(), 150u);
    EXPECT_EQ(cut.substr(147), "...");
}
