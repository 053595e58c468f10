#include "common/exceptions.hpp"
#include "docker/tar.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runner;
using namespace runner::docker;

TEST(TarArchiveTest, BlockLayoutTest) {
    tar_writer writer(1001, 1001);
    writer.add_file("a.txt", "abc");
    string archive = writer.finish();
    // 头 + 一个数据块 + 两个结尾空块
    EXPECT_EQ(archive.size(), 512u * 4);
    EXPECT_EQ(archive.substr(257, 5), "ustar");
}

TEST(TarArchiveTest, ReadBackTest) {
    tar_writer writer(1001, 1002);
    writer.add_directory("sandbox/project");
    writer.add_file("sandbox/project/main.py", "print('hi')\n");
    string binary("\0\x01\xff\xfe\n\r", 6);
    writer.add_file("sandbox/project/data.bin", binary, 0600);
    auto entries = read_tar(writer.finish());

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_TRUE(entries[0].directory);
    EXPECT_EQ(entries[0].path, "sandbox/project");
    EXPECT_EQ(entries[0].mode, 0755u);
    EXPECT_EQ(entries[1].path, "sandbox/project/main.py");
    EXPECT_EQ(entries[1].content, "print('hi')\n");
    EXPECT_EQ(entries[1].uid, 1001u);
    EXPECT_EQ(entries[1].gid, 1002u);
    EXPECT_EQ(entries[2].content, binary);
    EXPECT_EQ(entries[2].mode, 0600u);
}

TEST(TarArchiveTest, LongPathTest) {
    string dir(120, 'd');
    string medium = "sandbox/project/" + dir + "/file.txt";
    string huge = "sandbox/" + string(200, 'x') + "/" + string(120, 'y') + ".txt";

    tar_writer writer;
    writer.add_file(medium, "medium");
    writer.add_file(huge, "huge");
    auto entries = read_tar(writer.finish());

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].path, medium);
    EXPECT_EQ(entries[0].content, "medium");
    EXPECT_EQ(entries[1].path, huge);
    EXPECT_EQ(entries[1].content, "huge");
}

TEST(TarArchiveTest, TruncatedArchiveTest) {
    tar_writer writer;
    writer.add_file("big.txt", string(2000, 'z'));
    string archive = writer.finish();
    EXPECT_THROW(read_tar(archive.substr(0, 1024)), stream_error);
}
