#include "workspace.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace safeexec {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(string run_id, fs::path dir, string script_name)
    : id(move(run_id)), path(move(dir)), script(move(script_name)), owned(true) {}

workspace::workspace(workspace &&other) noexcept
    : id(move(other.id)), path(move(other.path)), script(move(other.script)), owned(other.owned) {
    other.owned = false;
}

workspace::~workspace() {
    release();
}

workspace &workspace::operator=(workspace &&other) noexcept {
    if (this != &other) {
        release();
        id = move(other.id);
        path = move(other.path);
        script = move(other.script);
        owned = other.owned;
        other.owned = false;
    }
    return *this;
}

const string &workspace::run_id() const {
    return id;
}

const fs::path &workspace::dir() const {
    return path;
}

const string &workspace::script_name() const {
    return script;
}

bool workspace::valid() const {
    return owned;
}

void workspace::release() noexcept {
    if (!owned) return;
    owned = false;
    workspace_manager::destroy(path);
}

workspace_manager::workspace_manager(fs::path root, string script_name)
    : root_dir(move(root)), script_name(assert_safe_path(script_name)) {}

workspace workspace_manager::create(const submission &submit) const {
    string run_id = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path dir = root_dir / ("safeexec-" + run_id);

    error_code ec;
    if (!fs::create_directory(dir, ec)) {
        if (!ec) ec = make_error_code(errc::file_exists);
        LOG(ERROR) << "Unable to create workspace " << dir << ": " << ec.message();
        throw infrastructure_error(fmt::format("Unable to create workspace: {}", ec.message()));
    }

    // 从这里开始目录由 ws 持有，写入失败时随 ws 析构删除
    workspace ws(run_id, dir, script_name);
    try {
        write_file_content(dir / script_name, submit.code);
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to write submission into workspace " << dir << ": " << ex.what();
        throw infrastructure_error(fmt::format("Unable to write submission: {}", ex.code().message()));
    }

    LOG(INFO) << "Run " << run_id << " created workspace " << dir;
    return ws;
}

bool workspace_manager::destroy(const fs::path &dir) noexcept {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(WARNING) << "Unable to remove workspace " << dir << ": " << ec.message();
        return false;
    }
    return true;
}

}  // namespace safeexec
