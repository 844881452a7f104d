#ifndef GEOCONVERT_GDAL_HANDLES_HPP
#define GEOCONVERT_GDAL_HANDLES_HPP

#include <memory>
#include <type_traits>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>

namespace geoconvert {
namespace io {

// RAII wrappers for GDAL C API handles

struct DatasetCloser {
    void operator()(void* dataset) const {
        if (dataset) {
            GDALClose(static_cast<GDALDatasetH>(dataset));
        }
    }
};

struct SpatialReferenceReleaser {
    void operator()(std::remove_pointer_t<OGRSpatialReferenceH>* srs) const {
        if (srs) {
            OSRRelease(srs);
        }
    }
};

struct TransformDestroyer {
    void operator()(std::remove_pointer_t<OGRCoordinateTransformationH>* transform) const {
        if (transform) {
            OCTDestroyCoordinateTransformation(transform);
        }
    }
};

struct GeometryDestroyer {
    void operator()(std::remove_pointer_t<OGRGeometryH>* geometry) const {
        if (geometry) {
            OGR_G_DestroyGeometry(geometry);
        }
    }
};

struct FeatureDestroyer {
    void operator()(std::remove_pointer_t<OGRFeatureH>* feature) const {
        if (feature) {
            OGR_F_Destroy(feature);
        }
    }
};

using DatasetPtr = std::unique_ptr<void, DatasetCloser>;
using SpatialReferencePtr = std::unique_ptr<std::remove_pointer_t<OGRSpatialReferenceH>, SpatialReferenceReleaser>;
using TransformPtr = std::unique_ptr<std::remove_pointer_t<OGRCoordinateTransformationH>, TransformDestroyer>;
using GeometryPtr = std::unique_ptr<std::remove_pointer_t<OGRGeometryH>, GeometryDestroyer>;
using FeaturePtr = std::unique_ptr<std::remove_pointer_t<OGRFeatureH>, FeatureDestroyer>;

} // namespace io
} // namespace geoconvert

#endif // GEOCONVERT_GDAL_HANDLES_HPP
