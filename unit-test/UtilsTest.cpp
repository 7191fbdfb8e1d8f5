#include <filesystem>
#include <stdexcept>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/single_fire_channel.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "monitor/run_options.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace sandbox;
namespace fs = std::filesystem;

TEST(UtilsTest, MakeCommandTest) {
    fs::path source("/tmp/run/solution.c");
    vector<string> flags = {"-O2", "-lm"};
    auto argv = make_command("gcc", source, "-o", source.parent_path() / "solution", flags, 10);
    vector<string> expected = {"gcc", "/tmp/run/solution.c", "-o", "/tmp/run/solution", "-O2", "-lm", "10"};
    EXPECT_EQ(argv, expected);
}

TEST(UtilsTest, TruncateUtf8Test) {
    EXPECT_EQ(truncate_utf8("hello", 10), "hello");
    EXPECT_EQ(truncate_utf8("hello", 3), "hel");
    // "가" 占 3 个字节，但只算一个字符
    string text = "a\xea\xb0\x80" "b";
    EXPECT_EQ(utf8_length(text), 3u);
    EXPECT_EQ(truncate_utf8(text, 1), "a");
    EXPECT_EQ(truncate_utf8(text, 2), "a\xea\xb0\x80");
    EXPECT_EQ(truncate_utf8(text, 3), text);
    EXPECT_EQ(truncate_utf8(text, 0), "");

    string korean;
    for (int i = 0; i < 10; ++i) korean += "\xea\xb0\x80";
    EXPECT_EQ(truncate_utf8(korean, 4).size(), 12u);
    EXPECT_EQ(truncate_utf8(korean, 10), korean);
}

TEST(UtilsTest, TrimTest) {
    EXPECT_EQ(trim_copy("  42 \n"), "42");
    EXPECT_EQ(trim_copy("\n\t"), "");
}

TEST(UtilsTest, Utf8ValidationTest) {
    EXPECT_TRUE(utf8_check_is_valid("print('안녕')"));
    EXPECT_FALSE(utf8_check_is_valid("\xff\xfe"));
}

TEST(UtilsTest, RunDirectoryIsUniqueTest) {
    fs::path a = make_run_directory(test_work_dir(), "utils-");
    fs::path b = make_run_directory(test_work_dir(), "utils-");
    EXPECT_NE(a, b);
    EXPECT_TRUE(fs::is_directory(a));
    remove_directory(a);
    remove_directory(b);
    EXPECT_FALSE(fs::exists(a));
}

TEST(UtilsTest, DeferRunsOnExceptionTest) {
    bool cleaned = false;
    try {
        defer { cleaned = true; };
        throw runtime_error("failure");
    } catch (runtime_error &) {
    }
    EXPECT_TRUE(cleaned);
}

TEST(UtilsTest, SingleFireChannelFirstWinsTest) {
    single_fire_channel<termination_reason> channel;
    EXPECT_FALSE(channel.peek().has_value());
    EXPECT_TRUE(channel.fire(termination_reason::TIMED_OUT));
    EXPECT_FALSE(channel.fire(termination_reason::MEMORY_EXCEEDED));
    EXPECT_EQ(channel.peek(), termination_reason::TIMED_OUT);
}

TEST(UtilsTest, SingleFireChannelWakesWaiterTest) {
    single_fire_channel<termination_reason> channel;
    thread firer([&] {
        this_thread::sleep_for(chrono::milliseconds(50));
        channel.fire(termination_reason::EXITED);
    });
    elapsed_time timer;
    auto value = channel.wait_for(chrono::seconds(10));
    firer.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, termination_reason::EXITED);
    EXPECT_LT(timer.milliseconds(), 5000);
}

TEST(UtilsTest, ConcurrentQueueCloseTest) {
    concurrent_queue<int> queue;
    EXPECT_TRUE(queue.push(1));
    queue.close();
    EXPECT_FALSE(queue.push(2));
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_FALSE(queue.pop().has_value());
}
