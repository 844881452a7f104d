#ifndef GEOCONVERT_GDAL_ENGINE_HPP
#define GEOCONVERT_GDAL_ENGINE_HPP

#include <string>
#include <vector>
#include "convert/engine.hpp"
#include "io/dataset_inspector.hpp"
#include "io/gdal_handles.hpp"

namespace geoconvert {
namespace convert {

/**
 * GeoEngine backed by the GDAL library and its utility programs API (gdal_utils.h)
 */
class GdalEngine : public GeoEngine {
public:
    explicit GdalEngine(io::InspectorConfig inspector_config = io::InspectorConfig::fromEnvironment());

    io::DatasetMetadata readMetadata(const std::string& path, bool is_raster) override;
    void warp(const EngineCall& call) override;
    void translate(const EngineCall& call) override;
    void vectorTranslate(const EngineCall& call) override;
    void nearblack(const EngineCall& call) override;
    void polygonize(const std::string& input, const std::string& output,
                    const std::string& output_type, int band) override;
    void mergeFeatures(const std::vector<std::string>& inputs, const std::string& output,
                       const std::string& driver) override;
    void removeDataset(const std::string& path) override;

private:
    static io::DatasetPtr openSource(const std::string& path, unsigned int flags);

    io::DatasetInspector inspector_;
};

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_GDAL_ENGINE_HPP
