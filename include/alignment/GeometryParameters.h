#pragma once

#include <Eigen/Dense>
#include <string>

namespace isi_geometry {

/**
 * Canonical world axis
 */
enum class Axis { X, Y, Z };

/**
 * Parse "x", "y" or "z" (case-insensitive)
 * @throws InvalidParameter for any other name
 */
Axis parseAxis(const std::string& name);

const char* toString(Axis axis);

/**
 * Unit vector of a canonical axis
 */
Eigen::Vector3d canonicalAxis(Axis axis);

/**
 * Parameters of the canonical alignment.
 *
 * The nose->tail direction is rotated onto nose_tail_axis, the left->right
 * ear direction onto ear_alignment_axis, and the model is scaled uniformly.
 */
struct GeometryParameters {
    double scale_factor = 8.0;                  // Uniform scale (> 0)
    double alignment_tolerance_degrees = 0.5;   // Accepted residual angle, in (0, 5]
    Axis nose_tail_axis = Axis::Z;
    Axis ear_alignment_axis = Axis::X;

    GeometryParameters() = default;

    GeometryParameters(double scale, double tolerance, Axis nose_tail, Axis ear)
        : scale_factor(scale), alignment_tolerance_degrees(tolerance),
          nose_tail_axis(nose_tail), ear_alignment_axis(ear) {}

    /**
     * Check value ranges
     * @throws InvalidParameter
     */
    void validate() const;
};

} // namespace isi_geometry
