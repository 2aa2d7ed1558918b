#include "config.hpp"
#include <fmt/core.h>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <limits>
#include <regex>
#include <stdexcept>
#include "common/io_utils.hpp"

namespace safeexec {
using namespace std;
using namespace nlohmann;

// 计数类配置项的上限
static const uint64_t MAX_TIMEOUT_SECONDS = 24 * 60 * 60;
static const uint64_t MAX_PROCESS_LIMIT = 1 << 22;
static const uint64_t MAX_CODE_LENGTH = 1 << 24;

/**
 * @brief 读取非负整数配置项，负数、小数以及超出 T 范围的数都会被拒绝
 */
template <typename T>
static void get_count_to(const json &j, const char *key, T &value) {
    if (!j.count(key)) return;
    const json &item = j.at(key);
    if (!item.is_number_integer() ||
        (!item.is_number_unsigned() && item.get<int64_t>() < 0) ||
        item.get<uint64_t>() > numeric_limits<T>::max())
        throw invalid_argument(fmt::format("{} must be a non-negative integer, got {}", key, item.dump()));
    value = item.get<T>();
}

void from_json(const json &j, configuration &config) {
    get_count_to(j, "maxCodeLength", config.max_code_length);
    get_count_to(j, "timeoutSeconds", config.timeout_seconds);
    if (j.count("memoryLimit"))
        j.at("memoryLimit").get_to(config.memory_limit);
    if (j.count("sandboxImage"))
        j.at("sandboxImage").get_to(config.sandbox_image);
    get_count_to(j, "processLimit", config.process_limit);
    if (j.count("runtime"))
        j.at("runtime").get_to(config.runtime);
    if (j.count("workspaceRoot"))
        config.workspace_root = j.at("workspaceRoot").get<string>();
    if (j.count("scriptName"))
        j.at("scriptName").get_to(config.script_name);
    if (j.count("mountPoint"))
        j.at("mountPoint").get_to(config.mount_point);
    if (j.count("interpreter"))
        j.at("interpreter").get_to(config.interpreter);
    if (j.count("runUser"))
        j.at("runUser").get_to(config.run_user);
    if (j.count("outputLimit"))
        j.at("outputLimit").get_to(config.output_limit);
}

void load_configuration(const filesystem::path &path, configuration &config) {
    if (!filesystem::is_regular_file(path))
        throw runtime_error(fmt::format("Configuration file {} does not exist", path.string()));
    json j = json::parse(read_file_content(path));
    from_json(j, config);
}

uint64_t parse_count(const string &name, const string &literal, uint64_t max) {
    static const regex matcher("^[0-9]+$");
    if (!regex_match(literal, matcher))
        throw invalid_argument(fmt::format("{} must be a non-negative integer, got '{}'", name, literal));

    uint64_t value;
    try {
        value = boost::lexical_cast<uint64_t>(literal);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument(fmt::format("{} '{}' is too large", name, literal));
    }
    if (value > max)
        throw invalid_argument(fmt::format("{} '{}' is too large (max {})", name, literal, max));
    return value;
}

int64_t parse_memory_limit(const string &literal) {
    static const regex matcher("^([0-9]+)([bBkKmMgG]?)$");
    smatch matches;
    if (!regex_match(literal, matches, matcher))
        throw invalid_argument(fmt::format("malformed memory limit '{}'", literal));

    int64_t value;
    try {
        value = boost::lexical_cast<int64_t>(matches[1].str());
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument(fmt::format("memory limit '{}' is too large", literal));
    }

    int64_t unit = 1;
    switch (matches[2].length() ? tolower(matches[2].str()[0]) : 'b') {
        case 'k': unit = 1LL << 10; break;
        case 'm': unit = 1LL << 20; break;
        case 'g': unit = 1LL << 30; break;
        default: break;
    }
    if (value > numeric_limits<int64_t>::max() / unit)
        throw invalid_argument(fmt::format("memory limit '{}' is too large", literal));
    if (value == 0)
        throw invalid_argument("memory limit must be positive");
    return value * unit;
}

void validate_configuration(configuration &config) {
    if (config.timeout_seconds == 0)
        throw invalid_argument("timeout must be greater than zero");
    if (config.timeout_seconds > MAX_TIMEOUT_SECONDS)
        throw invalid_argument(fmt::format("timeout must not exceed {} seconds", MAX_TIMEOUT_SECONDS));
    if (config.max_code_length == 0)
        throw invalid_argument("max code length must be greater than zero");
    if (config.max_code_length > MAX_CODE_LENGTH)
        throw invalid_argument(fmt::format("max code length must not exceed {}", MAX_CODE_LENGTH));
    if (config.process_limit == 0)
        throw invalid_argument("process limit must be greater than zero");
    if (config.process_limit > MAX_PROCESS_LIMIT)
        throw invalid_argument(fmt::format("process limit must not exceed {}", MAX_PROCESS_LIMIT));
    if (config.sandbox_image.empty())
        throw invalid_argument("sandbox image must be specified");
    if (config.runtime.empty())
        throw invalid_argument("sandbox runtime must be specified");
    if (config.interpreter.empty() || config.interpreter[0].empty())
        throw invalid_argument("interpreter command must be specified");
    if (config.mount_point.empty() || config.mount_point[0] != '/')
        throw invalid_argument(fmt::format("mount point '{}' must be an absolute path", config.mount_point));

    try {
        assert_safe_path(config.script_name);
    } catch (runtime_error &) {
        throw invalid_argument(fmt::format("script name '{}' is not a plain file name", config.script_name));
    }

    int64_t memory = parse_memory_limit(config.memory_limit);
    if (config.output_limit < 0)
        config.output_limit = memory;

    if (config.workspace_root.empty())
        config.workspace_root = filesystem::temp_directory_path();
}

}  // namespace safeexec
