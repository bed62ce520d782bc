#include "common/utils.hpp"
#include <fmt/core.h>
#include <stdlib.h>
#include <boost/algorithm/string/trim.hpp>

namespace codejudge {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string trim_output(const string &text) {
    return boost::algorithm::trim_copy(text);
}

string format_seconds(double seconds) {
    return fmt::format("{:.3f}s", seconds);
}

}  // namespace codejudge
