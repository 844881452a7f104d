#include "convert/conversion_request.hpp"

namespace geoconvert {
namespace convert {

std::string accessModeName(AccessMode mode) {
    switch (mode) {
        case AccessMode::Append:
            return "append";
        case AccessMode::Overwrite:
        default:
            return "overwrite";
    }
}

} // namespace convert
} // namespace geoconvert
