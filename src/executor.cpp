#include "executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <exception>
#include "classifier.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace safeexec {
using namespace std;

executor::executor(configuration config, const sandbox &box)
    : config(move(config)), box(box), workspaces(this->config.workspace_root, this->config.script_name) {}

outcome executor::execute(const string &code) const {
    return execute(code, config.max_code_length);
}

outcome executor::execute(const string &code, size_t max_length) const {
    try {
        submission submit = make_submission(code, max_length);
        return run(submit);
    } catch (validation_error &ex) {
        LOG(INFO) << "Rejected submission: " << ex.what();
        return outcome::validation_error(ex.what());
    }
}

outcome executor::run(const submission &submit) const {
    elapsed_time timer;
    string run_id = "<none>";
    try {
        // ws 离开作用域时删除工作目录，包括沙箱抛出异常的情况
        workspace ws = workspaces.create(submit);
        run_id = ws.run_id();

        constraint_set limits = constraint_set::from_configuration(config);
        runguard_result result = box.invoke(ws, limits);

        outcome classified = classify(result, config.timeout_seconds);
        ws.release();

        LOG(INFO) << fmt::format("Run {} finished with {} (exitcode {}) in {:.3f}s",
                                 run_id, get_display_message(classified.get_status()), result.exitcode,
                                 timer.duration<chrono::milliseconds>().count() / 1000.0);
        return classified;
    } catch (infrastructure_error &ex) {
        LOG(ERROR) << "Run " << run_id << " failed: " << ex;
        return outcome::infrastructure_error(ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << "Run " << run_id << " crashed: " << ex.what();
        return outcome::infrastructure_error(fmt::format("Internal error: {}", ex.what()));
    }
}

}  // namespace safeexec
