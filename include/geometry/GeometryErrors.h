#pragma once

#include <stdexcept>
#include <string>

namespace isi_geometry {

/**
 * Base class for all faults raised by the geometry pipeline.
 */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Too few, non-finite, coincident or collinear points.
 * No principal axis exists for such input.
 */
class DegenerateGeometry : public GeometryError {
public:
    explicit DegenerateGeometry(const std::string& what) : GeometryError(what) {}
};

/**
 * Homogeneous w coordinate became zero while applying a transform.
 */
class SingularTransform : public GeometryError {
public:
    explicit SingularTransform(const std::string& what) : GeometryError(what) {}
};

/**
 * Out-of-range configuration or argument (unknown axis name, non-positive
 * scale, zero direction vector, non-finite matrix entry, ...).
 */
class InvalidParameter : public GeometryError {
public:
    explicit InvalidParameter(const std::string& what) : GeometryError(what) {}
};

} // namespace isi_geometry
