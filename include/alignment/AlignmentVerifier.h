#pragma once

#include "alignment/GeometryParameters.h"
#include "landmarks/LandmarkSet.h"
#include <Eigen/Dense>
#include <optional>

namespace isi_geometry {

/**
 * Outcome of checking a transform against the canonical axes.
 * Angles are in degrees.
 */
struct AlignmentResult {
    Eigen::Matrix4d transform = Eigen::Matrix4d::Identity();
    double nose_tail_error = 0.0;
    std::optional<double> ear_error;     // Empty when the set has no ears
    double overall_error = 0.0;          // max of the errors that exist
    bool is_valid = false;               // overall_error <= tolerance
};

/**
 * Undirected angle between v and a canonical axis, in degrees [0, 90]
 * @throws DegenerateGeometry if v has zero length
 */
double axisAngleError(const Eigen::Vector3d& v, Axis target);

/**
 * Apply the transform to the landmarks and measure the residual angles of
 * nose->tail (and left->right ear, when both ears exist).
 *
 * The ear error uses the ear vector with its component along the nose-tail
 * axis removed; ears lying along the body report 90 degrees.
 *
 * @throws InvalidParameter for a non-finite matrix or invalid parameters
 * @throws SingularTransform if w becomes zero
 * @throws DegenerateGeometry if a transformed vector has zero length
 */
AlignmentResult verifyAlignment(const LandmarkSet& landmarks,
                                const Eigen::Matrix4d& transform,
                                const GeometryParameters& params);

/**
 * Copy of the landmark set with every position transformed
 * (confidences and metadata are kept)
 */
LandmarkSet transformLandmarks(const LandmarkSet& landmarks, const Eigen::Matrix4d& transform);

} // namespace isi_geometry
