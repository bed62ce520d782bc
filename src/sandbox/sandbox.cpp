#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include "sandbox/docker_sandbox.hpp"
#include "sandbox/local_sandbox.hpp"

namespace codejudge {
using namespace std;

sandbox::~sandbox() {}

unique_ptr<sandbox> make_sandbox(const engine_config &config) {
    if (config.use_sandbox)
        return make_unique<docker_sandbox>(config);
    else
        return make_unique<local_sandbox>(config);
}

}  // namespace codejudge
