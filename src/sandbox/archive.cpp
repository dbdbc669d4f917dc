#include "sandbox/archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cerrno>
#include <cstring>
#include <new>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/exclusion.hpp"

namespace codebox::sandbox {
using namespace std;

static constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

static string error_string(struct archive *a) {
    const char *message = archive_error_string(a);
    return message ? message : "unknown error";
}

/**
 * @brief 计算条目在 dest 中的路径
 * @throw path_safety_error 条目名会逃逸出 dest
 */
static filesystem::path resolve_entry_path(const filesystem::path &dest, const string &name) {
    if (name.empty())
        throw path_safety_error("archive entry has an empty name");
    if (name.front() == '/')
        throw path_safety_error("archive entry has an absolute path: " + name);

    vector<string> segments;
    boost::split(segments, name, boost::is_any_of("/"));
    filesystem::path relative;
    for (const string &segment : segments) {
        if (segment.empty() || segment == ".") continue;
        if (segment == "..")
            throw path_safety_error("archive entry escapes the workspace: " + name);
        relative /= segment;
    }

    filesystem::path target = dest / relative;
    if (!is_inside_directory(dest, target))
        throw path_safety_error("archive entry escapes the workspace: " + name);
    return target;
}

static void extract_directory(const filesystem::path &target, const string &name) {
    error_code ec;
    filesystem::create_directory(target, ec);
    if (ec || !filesystem::is_directory(filesystem::symlink_status(target)))
        throw archive_error(fmt::format("unable to create directory {}: {}", name, ec ? ec.message() : "conflicting entry"));
    // 工作目录中的内容需要能被容器内的 nobody 用户读写，私有性由工作目录的父文件夹保证
    filesystem::permissions(target, filesystem::perms::all);
}

/**
 * @brief 逐级创建 dir 及其缺失的父文件夹，dest 本身必须已经存在
 */
static void ensure_directory(const filesystem::path &dir, const string &name) {
    if (filesystem::is_directory(filesystem::symlink_status(dir))) return;
    ensure_directory(dir.parent_path(), name);
    extract_directory(dir, name);
}

static void extract_file(struct archive *in, const filesystem::path &target, const string &name, mode_t mode) {
    ensure_directory(target.parent_path(), name);

    // O_NOFOLLOW：已经存在的同名符号链接不会被跟随
    int fd = open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0)
        throw archive_error(fmt::format("unable to create file {}: {}", name, strerror(errno)));
    defer { close(fd); };

    if (archive_read_data_into_fd(in, fd) != ARCHIVE_OK)
        throw archive_error(fmt::format("unable to extract {}: {}", name, error_string(in)));
    if (fchmod(fd, (mode & 0777) | 0666) < 0)
        throw system_error(errno, system_category(), "unable to change mode of " + name);
}

static string entry_name(struct archive_entry *entry) {
    const char *name = archive_entry_pathname(entry);
    // 当前 locale 无法表示 PAX 头部中的 UTF-8 路径时，直接使用原始的 UTF-8 字节
    if (!name) name = archive_entry_pathname_utf8(entry);
    return name ? name : "";
}

void extract_archive(const string &data, const filesystem::path &dest) {
    if (data.empty()) return;

    struct archive *in = archive_read_new();
    if (!in) throw bad_alloc();
    defer { archive_read_free(in); };

    // tar 格式支持包含了 ustar、PAX 扩展头和 GNU 长文件名
    if (archive_read_support_filter_gzip(in) < ARCHIVE_WARN || archive_read_support_format_tar(in) < ARCHIVE_WARN)
        throw codebox_exception("libarchive lacks gzip or tar support: " + error_string(in));

    if (archive_read_open_memory(in, data.data(), data.size()) != ARCHIVE_OK)
        throw archive_error("malformed workdir archive: " + error_string(in));
    if (archive_filter_code(in, 0) != ARCHIVE_FILTER_GZIP)
        throw archive_error("workdir archive is not gzip compressed");

    while (true) {
        struct archive_entry *entry;
        int r = archive_read_next_header(in, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN)
            throw archive_error("malformed workdir archive: " + error_string(in));
        if (r == ARCHIVE_WARN)
            LOG(WARNING) << "Reading workdir archive: " << error_string(in);

        string name = entry_name(entry);
        if (archive_entry_hardlink(entry))
            throw unsupported_entry_error(fmt::format("archive entry {} is a hard link", name));

        mode_t type = archive_entry_filetype(entry);
        if (type == AE_IFREG) {
            filesystem::path target = resolve_entry_path(dest, name);
            if (target == dest / "")
                throw path_safety_error("archive entry refers to the workspace itself: " + name);
            VLOG(2) << "Extracting file " << name << " (" << archive_entry_size(entry) << " bytes)";
            extract_file(in, target, name, archive_entry_perm(entry));
        } else if (type == AE_IFDIR) {
            filesystem::path target = resolve_entry_path(dest, name);
            VLOG(2) << "Extracting directory " << name;
            ensure_directory(target, name);
            filesystem::permissions(target, filesystem::perms::all);
        } else {
            throw unsupported_entry_error(fmt::format("archive entry {} has unsupported type {:o}", name, (unsigned)type));
        }
    }
}

namespace {

/**
 * @brief 接收 libarchive 输出的压缩数据，超过大小限制时让写入失败
 */
struct archive_sink {
    string data;
    size_t limit = 0;
    bool exceeded = false;

    static la_ssize_t write(struct archive *a, void *client_data, const void *buffer, size_t length) {
        auto sink = static_cast<archive_sink *>(client_data);
        if (sink->limit > 0 && sink->data.size() + length > sink->limit) {
            sink->exceeded = true;
            archive_set_error(a, EFBIG, "artifact archive exceeds the size limit");
            return -1;
        }
        sink->data.append(static_cast<const char *>(buffer), length);
        return (la_ssize_t)length;
    }
};

struct tar_packer {
    explicit tar_packer(size_t size_limit) {
        sink.limit = size_limit;
        out = archive_write_new();
        if (!out) throw bad_alloc();
        if (archive_write_add_filter_gzip(out) < ARCHIVE_WARN ||
            archive_write_set_format_pax_restricted(out) != ARCHIVE_OK ||
            archive_write_set_bytes_in_last_block(out, 1) != ARCHIVE_OK ||
            archive_write_open(out, &sink, nullptr, archive_sink::write, nullptr) != ARCHIVE_OK) {
            string message = error_string(out);
            archive_write_free(out);
            throw codebox_exception("unable to create artifact archive: " + message);
        }
    }

    tar_packer(const tar_packer &) = delete;
    tar_packer &operator=(const tar_packer &) = delete;

    ~tar_packer() {
        archive_write_free(out);
    }

    void write_directory(const string &name, const filesystem::path &path) {
        struct stat st;
        if (lstat(path.c_str(), &st) < 0)
            throw system_error(errno, system_category(), "unable to stat " + path.string());
        write_header(name + "/", AE_IFDIR, st, 0);
    }

    void write_file(const string &name, const filesystem::path &path) {
        int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
        if (fd < 0)
            throw system_error(errno, system_category(), "unable to open " + path.string());
        defer { close(fd); };

        struct stat st;
        if (fstat(fd, &st) < 0)
            throw system_error(errno, system_category(), "unable to stat " + path.string());
        if (!S_ISREG(st.st_mode)) {
            VLOG(1) << "Skipping " << name << ", no longer a regular file";
            return;
        }

        write_header(name, AE_IFREG, st, st.st_size);

        // 文件在打包过程中变长的部分会被 libarchive 截断，变短时由 libarchive 用 0 补齐
        vector<char> buffer(COPY_BUFFER_SIZE);
        while (true) {
            ssize_t count = read(fd, buffer.data(), buffer.size());
            if (count < 0) {
                if (errno == EINTR) continue;
                throw system_error(errno, system_category(), "unable to read " + path.string());
            }
            if (count == 0) break;
            if (archive_write_data(out, buffer.data(), count) < 0)
                fail("writing " + name);
        }
    }

    string finish() {
        if (archive_write_close(out) != ARCHIVE_OK)
            fail("finishing artifact archive");
        return move(sink.data);
    }

private:
    void write_header(const string &name, mode_t type, const struct stat &st, int64_t size) {
        struct archive_entry *entry = archive_entry_new();
        if (!entry) throw bad_alloc();
        defer { archive_entry_free(entry); };

        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_filetype(entry, type);
        archive_entry_set_perm(entry, st.st_mode & 0777);
        archive_entry_set_size(entry, size);
        archive_entry_set_mtime(entry, st.st_mtime, 0);

        int r = archive_write_header(out, entry);
        if (r < ARCHIVE_WARN)
            fail("writing header of " + name);
        if (r == ARCHIVE_WARN)
            LOG(WARNING) << "Writing header of " << name << ": " << error_string(out);
    }

    [[noreturn]] void fail(const string &what) {
        if (sink.exceeded)
            throw resource_limit_error(fmt::format("artifact archive exceeds the limit of {} bytes", sink.limit));
        throw codebox_exception(fmt::format("{}: {}", what, error_string(out)));
    }

    struct archive *out;
    archive_sink sink;
};

}  // namespace

static void pack_directory(tar_packer &packer, const filesystem::path &root, const filesystem::path &dir, const vector<string> &exclude_patterns) {
    vector<filesystem::directory_entry> entries{filesystem::directory_iterator(dir), filesystem::directory_iterator()};
    sort(entries.begin(), entries.end(), [](const filesystem::directory_entry &a, const filesystem::directory_entry &b) {
        return a.path().filename() < b.path().filename();
    });

    for (auto &entry : entries) {
        string relative = entry.path().lexically_relative(root).generic_string();
        auto status = entry.symlink_status();

        if (filesystem::is_directory(status)) {
            if (is_excluded(relative, exclude_patterns)) {
                VLOG(1) << "Excluding directory " << relative;
                continue;
            }
            packer.write_directory(relative, entry.path());
            pack_directory(packer, root, entry.path(), exclude_patterns);
        } else if (filesystem::is_regular_file(status)) {
            if (is_excluded(relative, exclude_patterns)) {
                VLOG(1) << "Excluding file " << relative;
                continue;
            }
            packer.write_file(relative, entry.path());
        } else {
            VLOG(1) << "Skipping " << relative << ", neither a regular file nor a directory";
        }
    }
}

string create_archive(const filesystem::path &source, const vector<string> &exclude_patterns, size_t size_limit) {
    tar_packer packer(size_limit);
    pack_directory(packer, source, source, exclude_patterns);
    string compressed = packer.finish();

    if (size_limit > 0 && compressed.size() > size_limit)
        throw resource_limit_error(fmt::format("artifact archive of {} bytes exceeds the limit of {} bytes", compressed.size(), size_limit));
    return compressed;
}

}  // namespace codebox::sandbox
