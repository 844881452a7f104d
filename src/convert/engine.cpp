#include "convert/engine.hpp"
#include "errors.hpp"
#include <iostream>
#include <sstream>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace geoconvert {
namespace convert {

std::string EngineCall::joinedArguments() const {
    std::ostringstream joined;
    for (size_t i = 0; i < arguments.size(); ++i) {
        joined << (i ? " " : "") << arguments[i];
    }
    return joined.str();
}

ScratchDatasets::ScratchDatasets(GeoEngine& engine) : engine_(engine) {}

ScratchDatasets::~ScratchDatasets() {
    for (const auto& path : paths_) {
        engine_.removeDataset(path);
    }
    for (const auto& directory : directories_) {
        boost::system::error_code ec;
        fs::remove_all(directory, ec);
        if (ec) {
            std::cerr << "Warning: Failed to remove " << directory << ": " << ec.message() << std::endl;
        }
    }
}

std::string ScratchDatasets::add(const std::string& suffix) {
    std::string path = "/vsimem/geoconvert-" + fs::unique_path("%%%%-%%%%-%%%%").string() + suffix;
    paths_.push_back(path);
    return path;
}

std::string ScratchDatasets::addBeside(const std::string& file) {
    fs::path target(file);
    fs::path directory = target.parent_path() / ("geoconvert-" + fs::unique_path("%%%%-%%%%-%%%%").string());

    boost::system::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw ConversionError("Cannot create " + directory.string() + ": " + ec.message());
    }
    directories_.push_back(directory.string());
    return (directory / target.filename()).string();
}

} // namespace convert
} // namespace geoconvert
