#ifndef GEOCONVERT_PROGRESS_HPP
#define GEOCONVERT_PROGRESS_HPP

#include <chrono>
#include <optional>
#include <string>

namespace geoconvert {
namespace convert {

/**
 * Receiver of task progress reported by the conversion core
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    /**
     * @param task_uid Task the progress belongs to
     * @param progress_percent Absolute progress of the task [0-100]
     * @param estimated_finish When the whole task is expected to finish, if known
     * @param message Description of the current activity
     */
    virtual void updateProgress(const std::string& task_uid, double progress_percent,
                                const std::optional<std::chrono::system_clock::time_point>& estimated_finish,
                                const std::string& message) = 0;
};

/**
 * Map the progress of a subtask into its parent task's range
 * @param progress Subtask progress [0-100], clamped to 100
 * @param subtask_percentage Share of the parent task the subtask covers [0-100]; 0 means 100
 * @param subtask_start Where the subtask's block starts in the parent task [0-100]
 * @return Absolute progress, at most 100
 */
double computeAbsoluteProgress(double progress, double subtask_percentage = 100.0, double subtask_start = 0.0);

/**
 * Sink that prints progress lines to standard output
 */
class ConsoleProgressSink : public ProgressSink {
public:
    void updateProgress(const std::string& task_uid, double progress_percent,
                        const std::optional<std::chrono::system_clock::time_point>& estimated_finish,
                        const std::string& message) override;
};

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_PROGRESS_HPP
