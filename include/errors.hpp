#ifndef GEOCONVERT_ERRORS_HPP
#define GEOCONVERT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace geoconvert {

/**
 * Base class for every error raised by the conversion core
 */
class ConversionException : public std::runtime_error {
public:
    explicit ConversionException(const std::string& message)
        : std::runtime_error(message) {}
};

// No input files, unreadable boundary path, ambiguous multi-file mode, bad request
class InputError : public ConversionException {
public:
    explicit InputError(const std::string& message) : ConversionException(message) {}
};

// Area/envelope functions given a non-polygonal geometry
class UnsupportedGeometryError : public ConversionException {
public:
    explicit UnsupportedGeometryError(const std::string& message) : ConversionException(message) {}
};

// Attempt to rename a protected source file
class ProtectedFileError : public ConversionException {
public:
    explicit ProtectedFileError(const std::string& message) : ConversionException(message) {}
};

// Introspection worker died or the engine failed for a reason other than an unknown format
class IntrospectionError : public ConversionException {
public:
    explicit IntrospectionError(const std::string& message) : ConversionException(message) {}
};

// Warp, translate, vector translate, polygonize or archive call failed
class ConversionError : public ConversionException {
public:
    explicit ConversionError(const std::string& message) : ConversionException(message) {}
};

// Feature-by-feature vector merge aborted
class MergeError : public ConversionException {
public:
    explicit MergeError(const std::string& message) : ConversionException(message) {}
};

} // namespace geoconvert

#endif // GEOCONVERT_ERRORS_HPP
