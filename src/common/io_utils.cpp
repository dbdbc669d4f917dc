#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fstream>
#include <system_error>
#include "common/defer.hpp"

namespace codebox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content, mode_t mode) {
    // O_NOFOLLOW: 不允许通过已存在的符号链接写到其他位置
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, mode);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to create file " + path.string());
    defer { close(fd); };

    const char *data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to write file " + path.string());
        }
        data += written;
        remaining -= written;
    }
}

static fs::path normalize(const fs::path &path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path())
        normal = normal.parent_path();  // "a/b/" -> "a/b"
    return normal;
}

bool is_inside_directory(const fs::path &base, const fs::path &path) {
    fs::path relative = normalize(path).lexically_relative(normalize(base));
    if (relative.empty()) return false;
    auto first = relative.begin();
    return *first != "..";
}

}  // namespace codebox
