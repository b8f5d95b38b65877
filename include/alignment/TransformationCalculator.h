#pragma once

#include "alignment/GeometryParameters.h"
#include "geometry/MeshGeometry.h"
#include "landmarks/LandmarkSet.h"
#include <Eigen/Dense>

namespace isi_geometry {

/**
 * Rotation taking the direction of `from` onto the direction of `to`
 * (Rodrigues' formula, embedded in a 4x4 identity).
 *
 * Parallel inputs give the identity, anti-parallel inputs a 180 degree
 * rotation about an axis perpendicular to `from`.
 *
 * @throws InvalidParameter if either vector is zero or non-finite
 */
Eigen::Matrix4d rotationBetween(const Eigen::Vector3d& from, const Eigen::Vector3d& to);

/**
 * Homogeneous uniform scale
 * @throws InvalidParameter if scale is not finite and positive
 */
Eigen::Matrix4d scaleMatrix(double scale);

/**
 * Nose->tail alignment: tail_tip - nose rotated onto params.nose_tail_axis,
 * followed by uniform scaling. Translation is zero.
 *
 * @throws InvalidParameter if nose/tail are missing, coincident or non-finite
 */
Eigen::Matrix4d alignmentMatrix(const LandmarkSet& landmarks, const GeometryParameters& params);

/**
 * Nose->tail alignment plus a twist about the nose->tail target axis that
 * brings the left->right ear vector onto params.ear_alignment_axis.
 * No twist is applied when the rotated ear vector is parallel to the
 * nose->tail axis.
 *
 * @throws InvalidParameter if ears are missing or both target axes are equal
 */
Eigen::Matrix4d fullAlignmentMatrix(const LandmarkSet& landmarks, const GeometryParameters& params);

/**
 * Canonical alignment of a landmark set.
 * Uses fullAlignmentMatrix when both ears exist and the target axes differ,
 * otherwise alignmentMatrix.
 *
 * @throws InvalidParameter for invalid parameters or landmarks
 */
Eigen::Matrix4d computeAlignment(const LandmarkSet& landmarks, const GeometryParameters& params);

/**
 * Apply a homogeneous transform to every point (multiply, then divide by w)
 *
 * @throws InvalidParameter if the matrix has non-finite entries
 * @throws SingularTransform if w becomes zero for any point
 */
PointCloud applyTransform(const Eigen::Matrix4d& matrix, const PointCloud& points);

/**
 * Single-point version of applyTransform
 */
Eigen::Vector3d applyTransform(const Eigen::Matrix4d& matrix, const Eigen::Vector3d& point);

/**
 * @throws InvalidParameter if any entry is NaN or infinite
 */
void requireFiniteMatrix(const Eigen::Matrix4d& matrix);

} // namespace isi_geometry
