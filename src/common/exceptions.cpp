#include "common/exceptions.hpp"
#include <fmt/core.h>
#include <errno.h>
#include <string.h>
#include <boost/exception/diagnostic_information.hpp>

namespace safeexec {
using namespace std;

safeexec_exception::safeexec_exception()
    : safeexec_exception("") {}

safeexec_exception::safeexec_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *safeexec_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const safeexec_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

validation_error::validation_error()
    : safeexec_exception() {}

validation_error::validation_error(const string &message)
    : safeexec_exception(message) {}

infrastructure_error::infrastructure_error()
    : safeexec_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : safeexec_exception(message) {}

static string describe_launch_failure(const string &binary, int err) {
    if (err == ENOENT)
        return fmt::format("Required tool not found: {}", binary);
    return fmt::format("Unable to launch {}: {}", binary, strerror(err));
}

launch_error::launch_error(const string &binary, int err)
    : infrastructure_error(describe_launch_failure(binary, err)), binary(binary) {}

}  // namespace safeexec
