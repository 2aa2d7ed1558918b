#include "classifier.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/trim.hpp>

namespace safeexec {
using namespace std;

outcome classify(const runguard_result &result, unsigned timeout_seconds) {
    if (result.deadline_exceeded)
        return outcome::timeout(timeout_seconds);

    if (result.exitcode == 0) {
        string output = result.stdout_content;
        if (!output.empty() && output.back() == '\n')
            output.pop_back();
        return outcome::success(move(output));
    }

    string output = boost::algorithm::trim_copy(result.stdout_content);
    string error = boost::algorithm::trim_copy(result.stderr_content);
    if (error.empty())
        error = fmt::format("container exited with code {}", result.exitcode);
    return outcome::program_error(move(output), move(error));
}

}  // namespace safeexec
