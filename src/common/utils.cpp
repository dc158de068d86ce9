#include "common/utils.hpp"
#include <boost/algorithm/string.hpp>
#include <cstdlib>

namespace assessor {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

vector<string> split_command(const string &command) {
    vector<string> tokens;
    string trimmed = boost::algorithm::trim_copy(command);
    if (trimmed.empty()) return tokens;
    boost::split(tokens, trimmed, boost::is_any_of(" \t"), boost::token_compress_on);
    return tokens;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
}

}  // namespace assessor
