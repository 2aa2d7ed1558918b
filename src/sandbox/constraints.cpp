#include "sandbox/constraints.hpp"
#include <boost/assign.hpp>

namespace safeexec {
using namespace std;
using namespace boost::assign;

constraint_set constraint_set::from_configuration(const configuration &config) {
    constraint_set limits;
    limits.memory_limit = config.memory_limit;
    limits.process_limit = config.process_limit;
    limits.timeout = chrono::seconds(config.timeout_seconds);
    limits.output_limit = config.output_limit;
    limits.user = config.run_user;
    return limits;
}

container_command::container_command(string runtime, string image)
    : runtime(move(runtime)), image(move(image)) {}

container_command &container_command::name(const string &container_name) {
    this->container_name = container_name;
    return *this;
}

container_command &container_command::constraints(const constraint_set &limits) {
    if (limits.network_disabled)
        options += "--network", "none";
    if (!limits.memory_limit.empty()) {
        // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
        options += "--memory", limits.memory_limit;
        options += "--memory-swap", limits.memory_limit;
    }
    if (limits.process_limit > 0)
        options += "--pids-limit", to_string(limits.process_limit);
    if (limits.read_only_root)
        options += "--read-only";
    if (limits.no_new_privileges)
        options += "--security-opt", "no-new-privileges:true";
    if (limits.drop_capabilities)
        options += "--cap-drop=ALL";
    if (!limits.user.empty())
        options += "--user", limits.user;
    return *this;
}

container_command &container_command::mount_read_only(const filesystem::path &host, const string &guest) {
    options += "--volume", host.string() + ":" + guest + ":ro";
    return *this;
}

container_command &container_command::entry(const vector<string> &command) {
    entry_command = command;
    return *this;
}

vector<string> container_command::build() const {
    vector<string> argv;
    argv += runtime, "run", "--rm";
    if (!container_name.empty())
        argv += "--name", container_name;
    argv.insert(argv.end(), options.begin(), options.end());
    argv += image;
    argv.insert(argv.end(), entry_command.begin(), entry_command.end());
    return argv;
}

vector<string> container_kill_command(const string &runtime, const string &container_name) {
    return {runtime, "kill", container_name};
}

}  // namespace safeexec
