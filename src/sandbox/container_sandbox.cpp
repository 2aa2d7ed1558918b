#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include <exception>
#include "common/exceptions.hpp"

namespace safeexec {
using namespace std;

// docker kill 本身也不可信，给它一个固定的时钟时间限制
static const chrono::milliseconds KILL_TIME_LIMIT(2000);

container_sandbox::container_sandbox(const configuration &config)
    : runtime(config.runtime), image(config.sandbox_image), mount_point(config.mount_point), interpreter(config.interpreter) {}

static string container_name_of(const workspace &ws) {
    return "safeexec-" + ws.run_id();
}

vector<string> container_sandbox::command_for(const workspace &ws, const constraint_set &limits) const {
    vector<string> entry = interpreter;
    entry.push_back(mount_point + "/" + ws.script_name());

    return container_command(runtime, image)
        .name(container_name_of(ws))
        .constraints(limits)
        .mount_read_only(ws.dir(), mount_point)
        .entry(entry)
        .build();
}

runguard_result container_sandbox::invoke(const workspace &ws, const constraint_set &limits) const {
    runguard_options opt;
    opt.command = command_for(ws, limits);
    opt.wall_limit = limits.timeout;
    opt.stream_size = limits.output_limit;

    runguard_result result;
    try {
        result = runit(opt);
    } catch (launch_error &) {
        // 运行时没有启动，也就不存在容器
        throw;
    } catch (exception &ex) {
        LOG(ERROR) << "Run " << ws.run_id() << " aborted: " << ex.what();
        kill_container(container_name_of(ws));
        throw;
    }

    if (result.deadline_exceeded) {
        // 杀死运行时的客户端进程并不一定能停止容器
        kill_container(container_name_of(ws));
    }
    if (result.stdout_truncated || result.stderr_truncated)
        LOG(WARNING) << "Run " << ws.run_id() << " output truncated at " << limits.output_limit << " bytes";
    return result;
}

void container_sandbox::kill_container(const string &container_name) const {
    runguard_options opt;
    opt.command = container_kill_command(runtime, container_name);
    opt.wall_limit = KILL_TIME_LIMIT;
    opt.stream_size = 4096;

    try {
        runguard_result result = runit(opt);
        // 容器已经随客户端退出时 kill 会失败，这不是错误
        if (result.exitcode != 0)
            LOG(INFO) << "Container " << container_name << " was not killed: " << result.stderr_content;
        else
            LOG(WARNING) << "Killed container " << container_name << " after deadline";
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to kill container " << container_name << ": " << ex.what();
    }
}

}  // namespace safeexec
