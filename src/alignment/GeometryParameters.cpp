#include "alignment/GeometryParameters.h"
#include "geometry/GeometryErrors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace isi_geometry {

static constexpr double MAX_TOLERANCE_DEGREES = 5.0;

Axis parseAxis(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "x") return Axis::X;
    if (lower == "y") return Axis::Y;
    if (lower == "z") return Axis::Z;
    throw InvalidParameter("Axis must be x, y, or z (got '" + name + "')");
}

const char* toString(Axis axis) {
    switch (axis) {
        case Axis::X: return "x";
        case Axis::Y: return "y";
        case Axis::Z: return "z";
    }
    return "z";
}

Eigen::Vector3d canonicalAxis(Axis axis) {
    switch (axis) {
        case Axis::X: return Eigen::Vector3d(1.0, 0.0, 0.0);
        case Axis::Y: return Eigen::Vector3d(0.0, 1.0, 0.0);
        case Axis::Z: return Eigen::Vector3d(0.0, 0.0, 1.0);
    }
    return Eigen::Vector3d(0.0, 0.0, 1.0);
}

void GeometryParameters::validate() const {
    if (!std::isfinite(scale_factor) || scale_factor <= 0.0) {
        std::ostringstream msg;
        msg << "scale_factor must be a positive finite number (got " << scale_factor << ")";
        throw InvalidParameter(msg.str());
    }
    if (!std::isfinite(alignment_tolerance_degrees) ||
        alignment_tolerance_degrees <= 0.0 ||
        alignment_tolerance_degrees > MAX_TOLERANCE_DEGREES) {
        std::ostringstream msg;
        msg << "alignment_tolerance_degrees must be in (0, " << MAX_TOLERANCE_DEGREES
            << "] (got " << alignment_tolerance_degrees << ")";
        throw InvalidParameter(msg.str());
    }
}

} // namespace isi_geometry
