#include "sandbox/exclusion.hpp"
#include <fnmatch.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <set>

namespace codebox::sandbox {
using namespace std;

bool is_common_directory_name(const string &name) {
    static const set<string> common_directory_names = {
        "node_modules", "__pycache__", ".git", ".svn", ".hg", "build",
        "dist", "target", "bin", "obj", "vendor", ".pytest_cache"};
    return common_directory_names.count(name) > 0;
}

static bool glob_match(const string &pattern, const string &str) {
    // fnmatch 返回 FNM_NOMATCH 以外的非 0 值表示模式错误，同样视为不匹配
    return fnmatch(pattern.c_str(), str.c_str(), FNM_PATHNAME) == 0;
}

static bool match_directory_pattern(const string &relative_path, const string &directory) {
    if (relative_path == directory || boost::starts_with(relative_path, directory + "/"))
        return true;

    vector<string> segments;
    boost::split(segments, relative_path, boost::is_any_of("/"));
    return find(segments.begin(), segments.end(), directory) != segments.end();
}

static string base_name(const string &relative_path) {
    size_t pos = relative_path.find_last_of('/');
    if (pos == string::npos) return relative_path;
    return relative_path.substr(pos + 1);
}

bool is_excluded(const string &relative_path, const vector<string> &patterns) {
    for (const string &pattern : patterns) {
        if (pattern.empty()) continue;

        if (pattern.back() == '/') {
            string directory = pattern.substr(0, pattern.size() - 1);
            if (!directory.empty() && match_directory_pattern(relative_path, directory))
                return true;
        } else {
            // 不带 '/' 的常见目录名不作为文件名规则使用
            if (relative_path == pattern && is_common_directory_name(pattern))
                continue;

            if (glob_match(pattern, base_name(relative_path)) || glob_match(pattern, relative_path))
                return true;
        }
    }
    return false;
}

}  // namespace codebox::sandbox
