#include "config.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

string engine_config::image_for(const string &language, const string &def) const {
    auto it = images.find(language);
    return it == images.end() ? def : it->second;
}

void from_json(const json &j, engine_config &config) {
    if (j.count("useSandbox")) j.at("useSandbox").get_to(config.use_sandbox);
    if (j.count("containerRuntime")) j.at("containerRuntime").get_to(config.container_runtime);
    if (j.count("images")) j.at("images").get_to(config.images);
    if (j.count("memoryLimit")) j.at("memoryLimit").get_to(config.memory_limit);
    if (j.count("procLimit")) j.at("procLimit").get_to(config.proc_limit);
    if (j.count("compileTimeLimit")) j.at("compileTimeLimit").get_to(config.compile_time_limit);
    if (j.count("containerOverhead")) j.at("containerOverhead").get_to(config.container_overhead);
    if (j.count("pythonCommand")) j.at("pythonCommand").get_to(config.python_command);
    if (j.count("outputLimit")) j.at("outputLimit").get_to(config.output_limit);
    if (j.count("tempDir")) config.temp_dir = j.at("tempDir").get<string>();
    if (j.count("workers")) j.at("workers").get_to(config.workers);

    if (config.compile_time_limit <= 0)
        throw invalid_argument("compileTimeLimit should be positive");
    if (config.proc_limit <= 0)
        throw invalid_argument("procLimit should be positive");
}

void load_config_file(const filesystem::path &path, engine_config &config) {
    json j = json::parse(read_file_content(path));
    j.get_to(config);
}

void apply_environment(engine_config &config) {
    string use_docker = boost::algorithm::to_lower_copy(get_env("USE_DOCKER", ""));
    if (use_docker.empty()) return;
    config.use_sandbox = use_docker == "true";
    if (!config.use_sandbox)
        LOG(INFO) << "Container execution disabled via USE_DOCKER environment variable";
}

}  // namespace codejudge
