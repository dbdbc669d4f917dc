#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codebox {
using namespace std;

codebox_exception::codebox_exception()
    : codebox_exception("") {}

codebox_exception::codebox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *codebox_exception::what() const noexcept {
    return message.c_str();
}

const char *codebox_exception::category() const noexcept {
    return "internal";
}

std::ostream &operator<<(std::ostream &os, const codebox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

const char *input_error::category() const noexcept {
    return "input";
}

const char *resource_limit_error::category() const noexcept {
    return "resource_limit";
}

const char *backend_error::category() const noexcept {
    return "backend";
}

const char *configuration_error::category() const noexcept {
    return "configuration";
}

}  // namespace codebox
