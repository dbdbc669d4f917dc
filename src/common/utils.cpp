#include "common/utils.hpp"
#include <stdlib.h>
#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>

namespace codebox {
using namespace std;

string format_command(const vector<string> &argv) {
    string result;
    for (auto &arg : argv) {
        if (!result.empty()) result += ' ';
        bool quote = arg.empty() || any_of(arg.begin(), arg.end(), [](char c) {
                         return isspace((unsigned char)c) || c == '\'' || c == '"';
                     });
        if (quote) {
            result += '\'';
            for (char c : arg) {
                if (c == '\'')
                    result += "'\\''";
                else
                    result += c;
            }
            result += '\'';
        } else {
            result += arg;
        }
    }
    return result;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_uuid() {
    return boost::lexical_cast<string>(boost::uuids::random_generator()());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace codebox
