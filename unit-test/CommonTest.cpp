#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "test/sandbox_utils.hpp"

using namespace std;
using namespace codebox;

TEST(CommonTest, InsideDirectory) {
    EXPECT_TRUE(is_inside_directory("/work", "/work"));
    EXPECT_TRUE(is_inside_directory("/work", "/work/a/b"));
    EXPECT_TRUE(is_inside_directory("/work/", "/work/a"));
    EXPECT_TRUE(is_inside_directory("/work", "/work/a/../b"));
    EXPECT_FALSE(is_inside_directory("/work", "/work/../etc/passwd"));
    EXPECT_FALSE(is_inside_directory("/work", "/workspace/a"));
    EXPECT_FALSE(is_inside_directory("/work", "/etc"));
}

TEST(CommonTest, FileContent) {
    test::temp_directory tmp;
    write_file_content(tmp.path() / "a.txt", string("line\0binary", 11));
    EXPECT_EQ(read_file_content(tmp.path() / "a.txt"), string("line\0binary", 11));
    write_file_content(tmp.path() / "a.txt", "short");
    EXPECT_EQ(read_file_content(tmp.path() / "a.txt"), "short");
    EXPECT_EQ(read_file_content(tmp.path() / "missing.txt", "default"), "default");
    EXPECT_THROW(read_file_content(tmp.path() / "missing.txt"), system_error);
}

TEST(CommonTest, WriteDoesNotFollowSymlinks) {
    test::temp_directory tmp;
    write_file_content(tmp.path() / "target.txt", "original");
    filesystem::create_symlink(tmp.path() / "target.txt", tmp.path() / "link.txt");
    EXPECT_THROW(write_file_content(tmp.path() / "link.txt", "overwritten"), system_error);
    EXPECT_EQ(read_file_content(tmp.path() / "target.txt"), "original");
}

TEST(CommonTest, FormatCommand) {
    EXPECT_EQ(format_command({"docker", "run", "--rm"}), "docker run --rm");
    EXPECT_EQ(format_command({"sh", "-c", "echo hi && ./app"}), "sh -c 'echo hi && ./app'");
    EXPECT_EQ(format_command({"echo", "it's"}), "echo 'it'\\''s'");
    EXPECT_EQ(format_command({"echo", ""}), "echo ''");
}

TEST(CommonTest, ToStringList) {
    vector<string> argv;
    to_string_list(argv, "docker", string("run"), 512, filesystem::path("/w"), vector<string>{"-e", "A=1"});
    EXPECT_EQ(argv, (vector<string>{"docker", "run", "512", "/w", "-e", "A=1"}));
}

TEST(CommonTest, RandomUuidsDiffer) {
    EXPECT_NE(random_uuid(), random_uuid());
    EXPECT_EQ(random_uuid().size(), 36u);
}

TEST(CommonTest, DeferRunsOnScopeExit) {
    int value = 0;
    {
        defer { value = 1; };
        EXPECT_EQ(value, 0);
    }
    EXPECT_EQ(value, 1);

    try {
        defer { value = 2; };
        throw runtime_error("unwind");
    } catch (runtime_error &) {
    }
    EXPECT_EQ(value, 2);
}

TEST(CommonTest, ExceptionCategories) {
    EXPECT_STREQ(codebox_exception("x").category(), "internal");
    EXPECT_STREQ(archive_error("x").category(), "input");
    EXPECT_STREQ(path_safety_error("x").category(), "input");
    EXPECT_STREQ(unsupported_entry_error("x").category(), "input");
    EXPECT_STREQ(language_error("x").category(), "input");
    EXPECT_STREQ(resource_limit_error("x").category(), "resource_limit");
    EXPECT_STREQ(backend_error("x").category(), "backend");
    EXPECT_STREQ(configuration_error("x").category(), "configuration");

    stringstream ss;
    ss << backend_error("docker is missing");
    EXPECT_NE(ss.str().find("docker is missing"), string::npos);
}

TEST(CommonTest, ConcurrentQueueDrainsAfterClose) {
    concurrent_queue<int> queue;
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    queue.close();
    EXPECT_FALSE(queue.push(3));

    int value;
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(queue.pop(value));
}

TEST(CommonTest, ConcurrentQueueWakesBlockedReaders) {
    concurrent_queue<int> queue;
    int sum = 0;
    thread reader([&] {
        int value;
        while (queue.pop(value)) sum += value;
    });
    for (int i = 1; i <= 100; ++i) queue.push(i);
    queue.close();
    reader.join();
    EXPECT_EQ(sum, 5050);
}

TEST(CommonTest, BoundedQueueBlocksProducer) {
    concurrent_queue<int> queue(2);
    atomic<int> pushed{0};
    thread producer([&] {
        for (int i = 0; i < 5; ++i) {
            if (!queue.push(i)) return;
            ++pushed;
        }
    });

    this_thread::sleep_for(chrono::milliseconds(100));
    EXPECT_LE(pushed.load(), 2);

    int value;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue.pop(value));
        EXPECT_EQ(value, i);
    }
    producer.join();
    EXPECT_EQ(pushed.load(), 5);
}

TEST(CommonTest, ClosingBoundedQueueReleasesProducer) {
    concurrent_queue<int> queue(1);
    ASSERT_TRUE(queue.push(1));
    bool accepted = true;
    thread producer([&] { accepted = queue.push(2); });

    this_thread::sleep_for(chrono::milliseconds(50));
    queue.close();
    producer.join();
    EXPECT_FALSE(accepted);

    int value;
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    EXPECT_FALSE(queue.pop(value));
}
