#pragma once

#include <stdexcept>
#include <string>

namespace geoalign {

// Base of everything the pipeline throws. Nothing is retried internally.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Affine math
class DegenerateTransformError : public Error {
public:
    using Error::Error;
};

// Spatial reference systems
class UnsupportedCRSError : public Error {
public:
    using Error::Error;
};

class InvalidSRSSpecError : public Error {
public:
    using Error::Error;
};

class TransformError : public Error {
public:
    using Error::Error;
};

// Rasters
class RasterOpenError : public Error {
public:
    using Error::Error;
};

class MixedBandTypeError : public Error {
public:
    using Error::Error;
};

class MissingSRSError : public Error {
public:
    using Error::Error;
};

class ReprojectionError : public Error {
public:
    using Error::Error;
};

// Feature collections
class InvalidFeatureCollectionError : public Error {
public:
    using Error::Error;
};

class UnsupportedGeometryError : public Error {
public:
    using Error::Error;
};

class MalformedGeometryError : public Error {
public:
    using Error::Error;
};

class InvalidGeometryError : public Error {
public:
    using Error::Error;
};

class UnexpectedClipResultError : public Error {
public:
    using Error::Error;
};

class GeometryError : public Error {
public:
    using Error::Error;
};

// Crop windows
class AmbiguousCropSpecError : public Error {
public:
    using Error::Error;
};

class InvalidOffsetError : public Error {
public:
    using Error::Error;
};

class InvalidCropSizeError : public Error {
public:
    using Error::Error;
};

} // namespace geoalign
