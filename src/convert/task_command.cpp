#include "convert/task_command.hpp"
#include "convert/raster_converter.hpp"
#include "convert/vector_converter.hpp"
#include <sstream>

namespace geoconvert {
namespace convert {

namespace {

template <typename Job>
std::string describeJob(const char* kind, const Job& job) {
    std::ostringstream text;
    text << kind << " job [";
    for (size_t i = 0; i < job.input_files.size(); ++i) {
        text << (i ? ", " : "") << job.input_files[i];
    }
    text << "] -> " << job.output_file << " (" << job.driver << ")";
    return text.str();
}

} // namespace

TaskCommand::TaskCommand(ConversionJob job, GeoEngine& engine,
                         std::vector<std::shared_ptr<io::TemporaryFile>> temporary_files)
    : job_(std::move(job)), engine_(&engine), temporary_files_(std::move(temporary_files)) {}

JobKind TaskCommand::kind() const {
    return std::holds_alternative<RasterJob>(job_) ? JobKind::Raster : JobKind::Vector;
}

std::string TaskCommand::describe() const {
    if (const auto* raster = std::get_if<RasterJob>(&job_)) {
        return describeJob("raster", *raster);
    }
    const auto& vector = std::get<VectorJob>(job_);
    std::string text = describeJob("vector", vector);
    return text + " " + accessModeName(vector.access_mode);
}

std::string TaskCommand::operator()() const {
    if (const auto* raster = std::get_if<RasterJob>(&job_)) {
        return RasterConverter(*engine_).convert(*raster);
    }
    return VectorConverter(*engine_).convert(std::get<VectorJob>(job_));
}

} // namespace convert
} // namespace geoconvert
