#include <thread>
#include "gtest/gtest.h"
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

using namespace std;
using namespace codejudge;

TEST(CommonTest, TemporaryDirectoryIsRemoved) {
    filesystem::path path;
    {
        temporary_directory dir(filesystem::temp_directory_path(), "common-test-");
        path = dir.path();
        ASSERT_TRUE(filesystem::is_directory(path));
        EXPECT_EQ(path.filename().string().rfind("common-test-", 0), 0);
        filesystem::create_directories(path / "nested");
        write_file_content(path / "nested" / "file", "data");
    }
    EXPECT_FALSE(filesystem::exists(path));
}

TEST(CommonTest, TemporaryDirectoryIsRemovedOnException) {
    filesystem::path path;
    try {
        temporary_directory dir(filesystem::temp_directory_path());
        path = dir.path();
        throw runtime_error("compilation crashed");
    } catch (runtime_error &) {
    }
    EXPECT_FALSE(path.empty());
    EXPECT_FALSE(filesystem::exists(path));
}

TEST(CommonTest, TemporaryDirectoryWithMissingRoot) {
    EXPECT_THROW(temporary_directory("/nonexistent/codejudge/root"), internal_error);
}

TEST(CommonTest, ReadFileContent) {
    temporary_directory dir(filesystem::temp_directory_path());
    write_file_content(dir.path() / "a.txt", "line 1\nline 2\n");
    EXPECT_EQ(read_file_content(dir.path() / "a.txt"), "line 1\nline 2\n");
    EXPECT_EQ(read_file_content(dir.path() / "missing.txt", "default"), "default");
    EXPECT_THROW(read_file_content(dir.path() / "missing.txt"), internal_error);
}

TEST(CommonTest, TrimOutput) {
    EXPECT_EQ(trim_output("  5\n"), "5");
    EXPECT_EQ(trim_output("\n1 2  3\n\n"), "1 2  3");
    EXPECT_EQ(trim_output("a\n b"), "a\n b");
    EXPECT_EQ(trim_output(" \t\n"), "");
}

TEST(CommonTest, FormatSeconds) {
    EXPECT_EQ(format_seconds(0.0771), "0.077s");
    EXPECT_EQ(format_seconds(2), "2.000s");
}

TEST(CommonTest, ConcurrentQueueDrainsAfterClose) {
    concurrent_queue<int> queue;
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    queue.close();
    EXPECT_FALSE(queue.push(3));

    int value = 0;
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    EXPECT_TRUE(queue.try_pop(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(queue.pop(value));
}

TEST(CommonTest, ConcurrentQueueWakesBlockedReader) {
    concurrent_queue<int> queue;
    bool popped = true;
    thread reader([&] {
        int value;
        popped = queue.pop(value);
    });
    queue.close();
    reader.join();
    EXPECT_FALSE(popped);
}
