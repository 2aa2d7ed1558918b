#include <glog/logging.h>
#include <signal.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <limits>
#include <sstream>
#include <thread>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "executor.hpp"
#include "sandbox/sandbox.hpp"
#include "worker.hpp"
using namespace std;

#ifndef SAFEEXEC_VERSION
#define SAFEEXEC_VERSION "1.0"
#endif

static void apply_option(const boost::program_options::variables_map &vm, const char *option, const char *env, string &value) {
    if (vm.count(option)) {
        value = vm[option].as<string>();
    } else if (getenv(env)) {
        value = getenv(env);
    }
}

/**
 * @brief 数值选项按字符串读入，由 parse_count 检查符号和范围
 */
template <typename T>
static void apply_count(const boost::program_options::variables_map &vm, const char *option, const char *env, T &value) {
    string literal;
    apply_option(vm, option, env, literal);
    if (vm.count(option) || getenv(env))
        value = static_cast<T>(safeexec::parse_count(option, literal, numeric_limits<T>::max()));
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 输出端被关闭时不要直接退出，让写入失败正常返回
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("safeexec options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration from the given JSON file. Options given on the command line or in the environment override the file. You can either pass it from environ SAFEEXECCONFIG")
        ("file,f", po::value<string>(), "run the program in the given file. If neither file nor serve is provided, the program is read from standard input.")
        ("serve", "read JSON-lines requests {\"id\", \"code\"} from standard input and write one JSON-line response per request.")
        ("workers", po::value<string>(), "set the number of concurrent runs in serve mode, default to the number of CPU cores.")
        ("max-code-length", po::value<string>(), "set the maximum length of submitted code in characters, default to 5000. You can either pass it from environ MAXCODELENGTH")
        ("timeout", po::value<string>(), "set host wall-clock time limit in seconds, default to 10. You can either pass it from environ TIMEOUTSECONDS")
        ("memory-limit", po::value<string>(), "set sandbox memory limit (e.g. 128m), default to 128m. You can either pass it from environ MEMORYLIMIT")
        ("process-limit", po::value<string>(), "set maximum processes living simultaneously in the sandbox, default to 64. You can either pass it from environ PROCESSLIMIT")
        ("image", po::value<string>(), "set the sandbox image with the interpreter installed. You can either pass it from environ SANDBOXIMAGE")
        ("runtime", po::value<string>(), "set the container runtime executable, default to docker. You can either pass it from environ SANDBOXRUNTIME")
        ("workspace-root", po::value<string>(), "set the directory to create run workspaces in, default to the system temporary directory. You can either pass it from environ WORKSPACEROOT")
        ("run-user", po::value<string>(), "set the user running the program inside the sandbox. You can either pass it from environ RUNUSER")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "safeexec: Run untrusted programs in a resource- and network-constrained sandbox" << endl
             << "Requires a container runtime (docker) and the sandbox image on this host" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "safeexec " << SAFEEXEC_VERSION << endl;
        return EXIT_SUCCESS;
    }

    safeexec::configuration config;
    size_t workers = thread::hardware_concurrency();
    try {
        string config_file = safeexec::get_env("SAFEEXECCONFIG", "");
        if (vm.count("config")) config_file = vm["config"].as<string>();
        if (!config_file.empty()) safeexec::load_configuration(config_file, config);

        apply_count(vm, "max-code-length", "MAXCODELENGTH", config.max_code_length);
        apply_count(vm, "timeout", "TIMEOUTSECONDS", config.timeout_seconds);
        apply_option(vm, "memory-limit", "MEMORYLIMIT", config.memory_limit);
        apply_count(vm, "process-limit", "PROCESSLIMIT", config.process_limit);
        apply_option(vm, "image", "SANDBOXIMAGE", config.sandbox_image);
        apply_option(vm, "runtime", "SANDBOXRUNTIME", config.runtime);
        apply_option(vm, "run-user", "RUNUSER", config.run_user);

        string workspace_root;
        apply_option(vm, "workspace-root", "WORKSPACEROOT", workspace_root);
        if (!workspace_root.empty()) config.workspace_root = workspace_root;

        if (vm.count("workers"))
            workers = safeexec::parse_count("workers", vm["workers"].as<string>(), 1024);

        safeexec::validate_configuration(config);
    } catch (std::exception &e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    CHECK(filesystem::is_directory(config.workspace_root))
        << "Workspace root " << config.workspace_root << " does not exist";

    LOG(INFO) << "Using runtime " << config.runtime << " with image " << config.sandbox_image
              << ", timeout " << config.timeout_seconds << "s, memory " << config.memory_limit
              << ", processes " << config.process_limit;

    safeexec::container_sandbox box(config);
    const safeexec::executor exec(config, box);

    if (vm.count("serve")) {
        size_t handled = safeexec::serve(exec, cin, cout, workers);
        LOG(INFO) << "Handled " << handled << " requests";
        return EXIT_SUCCESS;
    }

    string code;
    if (vm.count("file")) {
        filesystem::path file(vm["file"].as<string>());
        if (!filesystem::is_regular_file(file)) {
            cerr << "Program file " << file << " does not exist" << endl;
            return EXIT_FAILURE;
        }
        code = safeexec::read_file_content(file);
    } else {
        stringstream ss;
        ss << cin.rdbuf();
        code = ss.str();
    }

    safeexec::outcome result = exec.execute(code);
    cout << safeexec::dump_response(safeexec::make_response(result)) << endl;

    switch (safeexec::get_status_class(result.get_status())) {
        case 200:
            return 0;
        case 400:
            return 1;
        default:
            return 2;
    }
}
