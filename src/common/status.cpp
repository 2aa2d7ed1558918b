#include "common/status.hpp"

namespace safeexec {

const char *get_display_message(status s) {
    switch (s) {
        case status::SUCCESS:
            return "Success";
        case status::PROGRAM_ERROR:
            return "Program Error";
        case status::TIMEOUT:
            return "Timeout";
        case status::VALIDATION_ERROR:
            return "Validation Error";
        case status::INFRASTRUCTURE_ERROR:
            return "Infrastructure Error";
    }
    return "Unknown";
}

int get_status_class(status s) {
    switch (s) {
        case status::SUCCESS:
            return 200;
        case status::PROGRAM_ERROR:
        case status::TIMEOUT:
        case status::VALIDATION_ERROR:
            return 400;
        case status::INFRASTRUCTURE_ERROR:
        default:
            return 500;
    }
}

}  // namespace safeexec
