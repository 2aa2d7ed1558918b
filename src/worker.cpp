#include "worker.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <mutex>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"

namespace safeexec {
using namespace std;
using namespace nlohmann;

json make_response(const outcome &result) {
    json j = result;
    j["status"] = get_status_class(result.get_status());
    return j;
}

json handle_request(const executor &exec, const string &line) {
    json request = json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        json response = make_response(outcome::validation_error("malformed request"));
        return response;
    }

    json response;
    auto code = request.find("code");
    if (code == request.end() || !code->is_string()) {
        response = make_response(outcome::validation_error("code must be a string"));
    } else {
        response = make_response(exec.execute(code->get<string>()));
    }

    if (request.count("id"))
        response["id"] = request.at("id");
    return response;
}

string dump_response(const json &response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

size_t serve(const executor &exec, istream &in, ostream &out, size_t workers) {
    concurrent_queue<string> request_queue;
    mutex output_mutex;
    vector<thread> worker_threads;
    if (workers == 0) workers = 1;

    // 无论主线程是否异常退出，都要让 worker 自然结束，避免 thread 析构时 terminate
    defer {
        request_queue.close();
        for (auto &th : worker_threads)
            if (th.joinable()) th.join();
    };

    for (size_t worker_id = 0; worker_id < workers; ++worker_id) {
        worker_threads.emplace_back([&exec, &out, &request_queue, &output_mutex, worker_id] {
            while (auto line = request_queue.pop()) {
                json response;
                try {
                    response = handle_request(exec, *line);
                } catch (exception &ex) {
                    LOG(ERROR) << "Worker " << worker_id << " has crashed when handling request, " << ex.what();
                    response = make_response(outcome::infrastructure_error(ex.what()));
                }

                string text = dump_response(response);
                scoped_lock guard(output_mutex);
                out << text << endl;
            }
        });
    }

    size_t count = 0;
    string line;
    while (getline(in, line)) {
        if (boost::algorithm::trim_copy(line).empty()) continue;
        request_queue.push(line);
        ++count;
    }
    return count;
}

}  // namespace safeexec
