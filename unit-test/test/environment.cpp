#include "test/environment.hpp"
#include <unistd.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <filesystem>
#include <vector>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codejudge::test {
using namespace std;

bool has_command(const string &command) {
    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / command;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

engine_config local_config() {
    engine_config config;
    config.use_sandbox = false;
    config.python_command = "python3";
    config.compile_time_limit = 30;
    return config;
}

static const char *FAKE_CONTAINER_RUNTIME = R"(#!/bin/sh
if [ "$1" != "run" ]; then
    exit 0
fi
while [ "$#" -gt 0 ] && [ "$1" != "-i" ]; do
    shift
done
shift
image="$1"
shift
case "$image" in
    exit-*) exit "${image#exit-}" ;;
esac
exec "$@"
)";

filesystem::path write_fake_container_runtime(const filesystem::path &dir) {
    filesystem::path runtime = dir / "fake-docker";
    write_file_content(runtime, FAKE_CONTAINER_RUNTIME);
    filesystem::permissions(runtime, filesystem::perms::owner_all);
    return runtime;
}

}  // namespace codejudge::test
