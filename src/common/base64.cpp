#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <cctype>
#include <stdexcept>

namespace codebox {
using namespace std;
namespace it = boost::archive::iterators;

string base64_encode(const string &data) {
    using encoder = it::base64_from_binary<it::transform_width<string::const_iterator, 6, 8>>;
    string result(encoder(data.begin()), encoder(data.end()));
    result.append((3 - data.size() % 3) % 3, '=');
    return result;
}

static bool is_base64_char(char c) {
    return isalnum((unsigned char)c) || c == '+' || c == '/';
}

string base64_decode(const string &text) {
    string input;
    input.reserve(text.size());
    for (char c : text)
        if (!isspace((unsigned char)c)) input += c;

    if (input.size() % 4 != 0)
        throw invalid_argument("base64 text length is not a multiple of 4");

    size_t padding = 0;
    while (padding < 2 && padding < input.size() && input[input.size() - 1 - padding] == '=')
        ++padding;
    for (size_t i = 0; i + padding < input.size(); ++i)
        if (!is_base64_char(input[i]))
            throw invalid_argument("invalid character in base64 text");

    // 填充字符按 0 解码，最后再截掉对应的字节
    for (size_t i = input.size() - padding; i < input.size(); ++i)
        input[i] = 'A';

    using decoder = it::transform_width<it::binary_from_base64<string::const_iterator>, 8, 6>;
    string result(decoder(input.cbegin()), decoder(input.cend()));
    result.erase(result.size() - padding);
    return result;
}

}  // namespace codebox
