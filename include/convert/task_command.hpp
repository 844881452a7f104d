#ifndef GEOCONVERT_TASK_COMMAND_HPP
#define GEOCONVERT_TASK_COMMAND_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "convert/conversion_request.hpp"
#include "convert/engine.hpp"
#include "io/file_staging.hpp"

namespace geoconvert {
namespace convert {

enum class JobKind {
    Raster,
    Vector
};

/**
 * A fully resolved conversion waiting to run
 * Holds the job description, the engine to run it on and shared ownership of the temporary
 * files the job reads, so an executor may run it later or on another thread.
 */
class TaskCommand {
public:
    TaskCommand(ConversionJob job, GeoEngine& engine,
                std::vector<std::shared_ptr<io::TemporaryFile>> temporary_files = {});

    JobKind kind() const;
    const ConversionJob& job() const { return job_; }

    // One line summary for logs
    std::string describe() const;

    /**
     * Run the job
     * @return Output path
     */
    std::string operator()() const;

private:
    ConversionJob job_;
    GeoEngine* engine_;
    std::vector<std::shared_ptr<io::TemporaryFile>> temporary_files_;
};

// Runs a task synchronously or hands it off; errors propagate to the caller
using Executor = std::function<void(const TaskCommand&)>;

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_TASK_COMMAND_HPP
