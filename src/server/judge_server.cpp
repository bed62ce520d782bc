#include "server/judge_server.hpp"

namespace codejudge::server {

judge_server::~judge_server() {}

}  // namespace codejudge::server
