#include "convert/retry.hpp"
#include <cstdlib>
#include <cstring>

namespace geoconvert {
namespace convert {

RetryPolicy RetryPolicy::fromEnvironment() {
    RetryPolicy policy;
    const char* testing = std::getenv("GEOCONVERT_TESTING");
    if (testing && testing[0] != '\0' && std::strcmp(testing, "0") != 0 && std::strcmp(testing, "false") != 0) {
        policy.sleeper = [](std::chrono::seconds) {};
    }
    return policy;
}

} // namespace convert
} // namespace geoconvert
