#include "submission.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace safeexec {
using namespace std;

submission::submission(string code, size_t max_length)
    : code(move(code)), max_length(max_length) {}

submission make_submission(string code, size_t max_length) {
    if (code.find('\0') != string::npos || !utf8_check_is_valid(code))
        throw validation_error("code must be valid text");
    if (utf8_length(code) > max_length)
        throw validation_error(fmt::format("code too long (max {})", max_length));
    return submission(move(code), max_length);
}

}  // namespace safeexec
