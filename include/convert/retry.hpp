#ifndef GEOCONVERT_RETRY_HPP
#define GEOCONVERT_RETRY_HPP

#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace geoconvert {
namespace convert {

/**
 * Exponential backoff settings
 */
struct RetryPolicy {
    int base = 2;      // Backoff multiplier
    int count = 1;     // Additional attempts after the first failure
    std::function<void(std::chrono::seconds)> sleeper = [](std::chrono::seconds delay) {
        std::this_thread::sleep_for(delay);
    };

    /**
     * Default policy; sleeping is disabled when GEOCONVERT_TESTING is set
     */
    static RetryPolicy fromEnvironment();
};

/**
 * Call a function until it succeeds or the policy runs out of attempts
 * Before retry n (1-based) the policy sleeps base^n seconds. The last error is rethrown unchanged.
 * @param policy Backoff settings
 * @param name Operation name for logging
 * @param func Operation to run
 * @return Whatever func returns
 */
template <typename Func>
auto retry(const RetryPolicy& policy, const std::string& name, Func&& func) -> decltype(func()) {
    int attempt = 0;
    while (true) {
        try {
            return func();
        } catch (const std::exception& e) {
            if (attempt >= policy.count) {
                throw;
            }
            ++attempt;
            auto delay = std::chrono::seconds(static_cast<long long>(std::pow(policy.base, attempt)));
            std::cerr << "Warning: " << name << " failed (" << e.what() << "). Retrying "
                      << (policy.count - attempt + 1) << " more time(s), sleeping for "
                      << delay.count() << "s..." << std::endl;
            if (policy.sleeper) {
                policy.sleeper(delay);
            }
        }
    }
}

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_RETRY_HPP
