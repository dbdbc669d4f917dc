#include <archive_entry.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/archive.hpp"
#include "test/archive_utils.hpp"
#include "test/sandbox_utils.hpp"

using namespace std;
using namespace codebox;
using namespace codebox::sandbox;
using namespace codebox::test;

class ArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        dest = tmp.path() / "dest";
        filesystem::create_directories(dest);
    }

    temp_directory tmp;
    filesystem::path dest;
};

TEST_F(ArchiveTest, ExtractsFilesAndDirectories) {
    string data = tar_builder()
                      .directory("src/")
                      .file("src/main.py", "print('hi')\n")
                      .file("deep/nested/data.txt", "data")
                      .file("empty.txt", "")
                      .gzip();
    extract_archive(data, dest);

    EXPECT_TRUE(filesystem::is_directory(dest / "src"));
    EXPECT_EQ(read_file_content(dest / "src" / "main.py"), "print('hi')\n");
    EXPECT_EQ(read_file_content(dest / "deep" / "nested" / "data.txt"), "data");
    EXPECT_EQ(read_file_content(dest / "empty.txt"), "");
}

TEST_F(ArchiveTest, EmptyInputIsNoop) {
    extract_archive("", dest);
    EXPECT_TRUE(filesystem::is_empty(dest));
}

TEST_F(ArchiveTest, ExtractsEmptyArchive) {
    extract_archive(tar_builder().gzip(), dest);
    EXPECT_TRUE(filesystem::is_empty(dest));
}

TEST_F(ArchiveTest, ExistingDirectoryIsIdempotent) {
    extract_archive(tar_builder().directory("a/").directory("a/").file("a/x", "1").gzip(), dest);
    EXPECT_EQ(read_file_content(dest / "a" / "x"), "1");
}

TEST_F(ArchiveTest, RejectsParentDirectoryTraversal) {
    string data = tar_builder().file("../escape.txt", "evil").gzip();
    EXPECT_THROW(extract_archive(data, dest), path_safety_error);
    EXPECT_FALSE(filesystem::exists(tmp.path() / "escape.txt"));
}

TEST_F(ArchiveTest, RejectsNestedTraversal) {
    string data = tar_builder().file("a/b/../../../escape.txt", "evil").gzip();
    EXPECT_THROW(extract_archive(data, dest), path_safety_error);
    EXPECT_FALSE(filesystem::exists(tmp.path() / "escape.txt"));
}

TEST_F(ArchiveTest, RejectsAbsolutePath) {
    string target = (tmp.path() / "absolute.txt").string();
    string data = tar_builder().file(target, "evil").gzip();
    EXPECT_THROW(extract_archive(data, dest), path_safety_error);
    EXPECT_FALSE(filesystem::exists(target));
}

TEST_F(ArchiveTest, RejectsSymlink) {
    string data = tar_builder().symlink("passwd", "/etc/passwd").gzip();
    EXPECT_THROW(extract_archive(data, dest), unsupported_entry_error);
    EXPECT_FALSE(filesystem::exists(filesystem::symlink_status(dest / "passwd")));
}

TEST_F(ArchiveTest, RejectsSymlinkFollowedByWriteThroughIt) {
    string data = tar_builder()
                      .symlink("link", tmp.path().string())
                      .file("link/escape.txt", "evil")
                      .gzip();
    EXPECT_THROW(extract_archive(data, dest), unsupported_entry_error);
    EXPECT_FALSE(filesystem::exists(tmp.path() / "escape.txt"));
}

TEST_F(ArchiveTest, RejectsOtherEntryTypes) {
    EXPECT_THROW(extract_archive(tar_builder().file("main.py", "x").hard_link("hard", "main.py").gzip(), dest), unsupported_entry_error);
    EXPECT_FALSE(filesystem::exists(dest / "hard"));
    EXPECT_THROW(extract_archive(tar_builder().entry("dev", AE_IFCHR).gzip(), dest), unsupported_entry_error);
    EXPECT_THROW(extract_archive(tar_builder().entry("fifo", AE_IFIFO).gzip(), dest), unsupported_entry_error);
}

TEST_F(ArchiveTest, StopsAtFirstBadEntry) {
    string data = tar_builder()
                      .file("before.txt", "1")
                      .file("../escape.txt", "evil")
                      .file("after.txt", "2")
                      .gzip();
    EXPECT_THROW(extract_archive(data, dest), path_safety_error);
    EXPECT_TRUE(filesystem::exists(dest / "before.txt"));
    EXPECT_FALSE(filesystem::exists(dest / "after.txt"));
}

TEST_F(ArchiveTest, RejectsCorruptedGzip) {
    EXPECT_THROW(extract_archive("definitely not gzip data", dest), archive_error);
}

TEST_F(ArchiveTest, RejectsUncompressedTar) {
    EXPECT_THROW(extract_archive(tar_builder().file("main.py", "print(1)").tar(), dest), archive_error);
    EXPECT_FALSE(filesystem::exists(dest / "main.py"));
}

TEST_F(ArchiveTest, RejectsTruncatedEntry) {
    string tar = tar_builder().file("big.txt", string(4096, 'x')).tar();
    string truncated = gzip_compress(tar.substr(0, 512 + 1000));
    EXPECT_THROW(extract_archive(truncated, dest), archive_error);
}

TEST_F(ArchiveTest, RejectsChecksumMismatch) {
    string tar = tar_builder().file("main.py", "print(1)").tar();
    tar[0] = 'X';
    EXPECT_THROW(extract_archive(gzip_compress(tar), dest), archive_error);
}

TEST_F(ArchiveTest, ReadsPaxPath) {
    string long_name = string(150, 'a') + "/" + string(120, 'b') + ".txt";
    tar_builder builder;
    builder.file(long_name, "pax content");
    ASSERT_NE(builder.tar().find(" path=" + long_name + "\n"), string::npos);

    extract_archive(builder.gzip(), dest);
    EXPECT_EQ(read_file_content(dest / long_name), "pax content");
}

TEST_F(ArchiveTest, PaxPathIsCheckedForTraversal) {
    string long_name = "../" + string(150, 'e') + ".txt";
    tar_builder builder;
    builder.file(long_name, "evil");
    ASSERT_NE(builder.tar().find(" path=" + long_name + "\n"), string::npos);

    EXPECT_THROW(extract_archive(builder.gzip(), dest), path_safety_error);
    EXPECT_FALSE(filesystem::exists(tmp.path() / (string(150, 'e') + ".txt")));
}

TEST_F(ArchiveTest, ReadsGnuLongName) {
    string long_name = string(200, 'c') + ".txt";
    tar_builder builder(tar_format::GNU);
    builder.file(long_name, "gnu content");
    ASSERT_NE(builder.tar().find("././@LongLink"), string::npos);

    extract_archive(builder.gzip(), dest);
    EXPECT_EQ(read_file_content(dest / long_name), "gnu content");
}

TEST_F(ArchiveTest, ExtractedEntriesAreWorldWritable) {
    extract_archive(tar_builder().file("deep/nested/data.txt", "data", 0600).gzip(), dest);

    struct stat st;
    ASSERT_EQ(stat((dest / "deep").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0777u);
    ASSERT_EQ(stat((dest / "deep" / "nested" / "data.txt").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0666, 0666u);
}

TEST_F(ArchiveTest, CreatesArchiveWithRelativeNames) {
    filesystem::path src = tmp.path() / "src";
    filesystem::create_directories(src / "pkg");
    write_file_content(src / "main.py", "print('hi')\n");
    write_file_content(src / "pkg" / "util.py", "x = 1\n");

    auto entries = list_archive(create_archive(src, {}));
    map<string, string> expected = {
        {"main.py", "print('hi')\n"},
        {"pkg/", ""},
        {"pkg/util.py", "x = 1\n"}};
    EXPECT_EQ(entries, expected);
}

TEST_F(ArchiveTest, CreatesValidEmptyArchive) {
    filesystem::path src = tmp.path() / "empty";
    filesystem::create_directories(src);
    string data = create_archive(src, {});
    EXPECT_FALSE(data.empty());
    EXPECT_TRUE(list_archive(data).empty());
    extract_archive(data, dest);
    EXPECT_TRUE(filesystem::is_empty(dest));
}

TEST_F(ArchiveTest, CreateAppliesExclusions) {
    filesystem::path src = tmp.path() / "src";
    filesystem::create_directories(src / "__pycache__");
    filesystem::create_directories(src / "lib" / "__pycache__");
    write_file_content(src / "main.py", "print(1)");
    write_file_content(src / "cache.pyc", "bytecode");
    write_file_content(src / "__pycache__" / "main.cpython-311.pyc", "bytecode");
    write_file_content(src / "lib" / "__pycache__" / "x.txt", "text");
    write_file_content(src / "lib" / "mod.py", "x = 1");

    auto entries = list_archive(create_archive(src, {"__pycache__/", "*.pyc"}));
    map<string, string> expected = {
        {"lib/", ""},
        {"lib/mod.py", "x = 1"},
        {"main.py", "print(1)"}};
    EXPECT_EQ(entries, expected);
}

TEST_F(ArchiveTest, CreateSkipsSymlinks) {
    filesystem::path src = tmp.path() / "src";
    filesystem::create_directories(src);
    write_file_content(src / "main.py", "print(1)");
    filesystem::create_symlink("/etc/passwd", src / "passwd");
    filesystem::create_directory_symlink("/etc", src / "etc");

    auto entries = list_archive(create_archive(src, {}));
    EXPECT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.count("main.py"), 1u);
}

TEST_F(ArchiveTest, CreateUsesPaxForLongNames) {
    filesystem::path src = tmp.path() / "src";
    string long_dir = string(120, 'd');
    string long_file = string(120, 'f') + ".txt";
    filesystem::create_directories(src / long_dir);
    write_file_content(src / long_dir / long_file, "long");

    auto entries = list_archive(create_archive(src, {}));
    EXPECT_EQ(entries.at(long_dir + "/" + long_file), "long");
}

TEST_F(ArchiveTest, CreateRecordsModeAndModificationTime) {
    filesystem::path src = tmp.path() / "src";
    filesystem::create_directories(src / "bin");
    write_file_content(src / "bin" / "run.sh", "#!/bin/sh\n", 0755);
    write_file_content(src / "data.txt", "data", 0640);
    filesystem::permissions(src / "bin" / "run.sh", filesystem::perms(0755));
    filesystem::permissions(src / "data.txt", filesystem::perms(0640));

    struct timespec times[2] = {{1600000000, 0}, {1600000000, 0}};
    for (auto &path : {src / "bin" / "run.sh", src / "data.txt", src / "bin"})
        ASSERT_EQ(utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW), 0);

    auto items = read_archive(create_archive(src, {}));
    ASSERT_EQ(items.size(), 3u);
    EXPECT_TRUE(items.at("bin/").directory);
    EXPECT_EQ(items.at("bin/").mtime, 1600000000);
    EXPECT_EQ(items.at("bin/run.sh").mode, 0755u);
    EXPECT_EQ(items.at("bin/run.sh").mtime, 1600000000);
    EXPECT_EQ(items.at("data.txt").mode, 0640u);
    EXPECT_EQ(items.at("data.txt").mtime, 1600000000);
}

TEST_F(ArchiveTest, RoundTripReproducesFiles) {
    filesystem::path src = tmp.path() / "src";
    filesystem::create_directories(src / "a" / "b");
    filesystem::create_directories(src / "empty_dir");
    write_file_content(src / "a" / "b" / "c.bin", string("\0\1\2\3binary\xff", 11));
    write_file_content(src / "large.txt", string(300000, 'z'));
    write_file_content(src / (string(130, 'n') + ".txt"), "long name");

    extract_archive(create_archive(src, {}), dest);

    EXPECT_EQ(read_file_content(dest / "a" / "b" / "c.bin"), string("\0\1\2\3binary\xff", 11));
    EXPECT_EQ(read_file_content(dest / "large.txt"), string(300000, 'z'));
    EXPECT_EQ(read_file_content(dest / (string(130, 'n') + ".txt")), "long name");
    EXPECT_TRUE(filesystem::is_directory(dest / "empty_dir"));
}

TEST_F(ArchiveTest, RoundTripPreservesExecutableBit) {
    filesystem::path src = tmp.path() / "src";
    filesystem::create_directories(src);
    write_file_content(src / "run.sh", "#!/bin/sh\necho hi\n", 0755);

    extract_archive(create_archive(src, {}), dest);

    struct stat st;
    ASSERT_EQ(stat((dest / "run.sh").c_str(), &st), 0);
    EXPECT_TRUE(st.st_mode & S_IXUSR);
}

TEST_F(ArchiveTest, CreateEnforcesSizeLimit) {
    filesystem::path src = tmp.path() / "src";
    filesystem::create_directories(src);
    // 随机数据几乎无法压缩
    string noise;
    unsigned seed = 12345;
    for (int i = 0; i < 256 * 1024; ++i) {
        seed = seed * 1103515245 + 12345;
        noise += (char)(seed >> 16);
    }
    write_file_content(src / "noise.bin", noise);

    EXPECT_THROW(create_archive(src, {}, 64 * 1024), resource_limit_error);
    EXPECT_NO_THROW(create_archive(src, {}, 1024 * 1024));
}
