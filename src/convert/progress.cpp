#include "convert/progress.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace geoconvert {
namespace convert {

double computeAbsoluteProgress(double progress, double subtask_percentage, double subtask_start) {
    if (subtask_percentage <= 0.0) {
        subtask_percentage = 100.0;
    }
    double subtask_progress = std::min(progress, 100.0);
    return std::min(subtask_start + subtask_progress * (subtask_percentage / 100.0), 100.0);
}

void ConsoleProgressSink::updateProgress(const std::string& task_uid, double progress_percent,
                                         const std::optional<std::chrono::system_clock::time_point>& estimated_finish,
                                         const std::string& message) {
    std::cout << "Progress [" << task_uid << "]: " << std::fixed << std::setprecision(1) << progress_percent << "%";
    if (estimated_finish) {
        std::time_t finish = std::chrono::system_clock::to_time_t(*estimated_finish);
        std::tm finish_utc{};
        gmtime_r(&finish, &finish_utc);
        std::cout << " (estimated finish " << std::put_time(&finish_utc, "%Y-%m-%dT%H:%M:%SZ") << ")";
    }
    if (!message.empty()) {
        std::cout << " " << message;
    }
    std::cout << std::defaultfloat << std::endl;
}

} // namespace convert
} // namespace geoconvert
