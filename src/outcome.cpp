#include "outcome.hpp"
#include <fmt/core.h>

namespace safeexec {
using namespace std;
using namespace nlohmann;

outcome::outcome(status s, string output, string error, unsigned seconds)
    : s(s), out(move(output)), err(move(error)), seconds(seconds) {}

status outcome::get_status() const {
    return s;
}

const string &outcome::output() const {
    return out;
}

string outcome::error() const {
    if (s == status::TIMEOUT)
        return fmt::format("timed out after {} seconds", seconds);
    return err;
}

unsigned outcome::timeout_seconds() const {
    return seconds;
}

outcome outcome::success(string output) {
    return outcome(status::SUCCESS, move(output), "", 0);
}

outcome outcome::program_error(string output, string error) {
    return outcome(status::PROGRAM_ERROR, move(output), move(error), 0);
}

outcome outcome::timeout(unsigned seconds) {
    return outcome(status::TIMEOUT, "", "", seconds);
}

outcome outcome::validation_error(string reason) {
    return outcome(status::VALIDATION_ERROR, "", move(reason), 0);
}

outcome outcome::infrastructure_error(string reason) {
    return outcome(status::INFRASTRUCTURE_ERROR, "", move(reason), 0);
}

void to_json(json &j, const outcome &result) {
    j = json::object();
    switch (result.get_status()) {
        case status::SUCCESS:
            j["output"] = result.output();
            break;
        case status::PROGRAM_ERROR:
            j["output"] = result.output();
            j["error"] = result.error();
            break;
        default:
            j["error"] = result.error();
            break;
    }
}

}  // namespace safeexec
