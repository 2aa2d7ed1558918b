#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/algorithm/string/join.hpp>

namespace safeexec {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string join_command(const vector<string> &argv) {
    return boost::algorithm::join(argv, " ");
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace safeexec
