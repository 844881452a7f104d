#ifndef GEOCONVERT_VECTOR_CONVERTER_HPP
#define GEOCONVERT_VECTOR_CONVERTER_HPP

#include <string>
#include <vector>
#include "convert/conversion_request.hpp"
#include "convert/engine.hpp"

namespace geoconvert {
namespace convert {

/**
 * Turns a VectorJob into ogr2ogr calls
 */
class VectorConverter {
public:
    explicit VectorConverter(GeoEngine& engine);

    /**
     * Run a vector conversion
     * In append mode the first input overwrites the output and each later input is appended, in order.
     * A distinct field triggers a GROUP BY pass over a scratch copy of the result, removed afterwards.
     * @param job Resolved vector parameters
     * @return Output path
     * @throws InputError for a missing driver or several inputs in overwrite mode
     * @throws ConversionError if the engine fails
     */
    std::string convert(const VectorJob& job) const;

    /**
     * Copy every feature geometry of several GeoJSON files into one GeoJSON file
     * @throws MergeError if the merge fails
     */
    std::string mergeGeojson(const std::vector<std::string>& inputs, const std::string& output) const;

    /**
     * ogr2ogr arguments of a job for one call
     * @param job Resolved vector parameters
     * @param mode Access mode of this call
     */
    static std::vector<std::string> buildArguments(const VectorJob& job, AccessMode mode);

    /**
     * ogr2ogr arguments of the de-duplication pass
     * Reprojection, skip-failures, spatial filter and clip options were applied by the first pass.
     */
    static std::vector<std::string> buildDistinctArguments(const VectorJob& job);

    // Shortest decimal text that reads back as the same coordinate
    static std::string formatCoordinate(double value);

private:
    GeoEngine& engine_;
};

} // namespace convert
} // namespace geoconvert

#endif // GEOCONVERT_VECTOR_CONVERTER_HPP
