#pragma once

#include "geometry/MeshGeometry.h"
#include "landmarks/DetectorConfig.h"
#include "landmarks/LandmarkSet.h"
#include <Eigen/Dense>
#include <vector>

namespace isi_geometry {

/**
 * Cross-section statistics of one slice of the density sweep
 */
struct SliceSample {
    double position;        // Slice center along the primary axis (relative to centroid)
    int point_count;
    double radius;          // Max distance of members from the axis (floored)
    double density;         // point_count / (pi * radius^2)
    double smoothed_density;
};

/**
 * Result of the nose/tail analysis along the primary axis
 */
struct NoseTailEstimate {
    Eigen::Vector3d nose;
    Eigen::Vector3d tail_tip;
    Eigen::Vector3d tail_attachment;
    DetectionMethod method;
    double transition_position;     // Tail-body transition along the primary axis
    double max_density_gradient;
    std::vector<SliceSample> slices;
    std::vector<std::string> warnings;
};

/**
 * Left/right ear candidates
 */
struct EarEstimate {
    bool found = false;
    Eigen::Vector3d left = Eigen::Vector3d::Zero();
    Eigen::Vector3d right = Eigen::Vector3d::Zero();
    size_t head_point_count = 0;
    std::string warning;   // Why ears were not found
};

/**
 * Left/right whisker candidates; either side may be missing
 */
struct WhiskerEstimate {
    bool has_left = false;
    bool has_right = false;
    Eigen::Vector3d left = Eigen::Vector3d::Zero();
    Eigen::Vector3d right = Eigen::Vector3d::Zero();
    size_t region_point_count = 0;
    size_t protrusion_count = 0;
    std::string warning;   // Why one or both sides are missing
};

/**
 * Detect anatomical landmarks on an unlabeled point cloud.
 *
 * Pipeline:
 *   1) Optionally restrict to vertices referenced by faces
 *   2) Nose/tail by cross-sectional density along frame.axes[0]
 *      (falls back to global projection extremes when the sweep is unreliable)
 *   3) Ears as lateral extremes along frame.axes[1] near the nose (low confidence)
 *   4) Derived eye center when both ears exist (low confidence)
 *   5) Whiskers as lateral protrusions near the nose (low confidence)
 *
 * Degradations are recorded in the returned metadata, never thrown.
 *
 * @param points Input vertices
 * @param frame Principal axes of the same cloud (see analyzeGeometry)
 * @param faces Optional F x 3 vertex indices; when non-empty only referenced vertices are used
 * @param config Detector thresholds
 * @throws DegenerateGeometry if no usable vertices remain
 * @throws InvalidParameter if config is invalid or a face index is out of range
 */
LandmarkSet detectLandmarks(const PointCloud& points,
                            const PrincipalAxisFrame& frame,
                            const Eigen::MatrixXi& faces = Eigen::MatrixXi(),
                            const DetectorConfig& config = DetectorConfig());

/**
 * Nose, tail tip and tail attachment by cross-sectional density.
 * @param points Non-empty input vertices
 */
NoseTailEstimate detectNoseTail(const PointCloud& points,
                                const PrincipalAxisFrame& frame,
                                const DetectorConfig& config = DetectorConfig());

/**
 * Ears as the extremes along frame.axes[1] of the vertices near the nose
 */
EarEstimate detectEars(const PointCloud& points,
                       const PrincipalAxisFrame& frame,
                       const Eigen::Vector3d& nose,
                       const DetectorConfig& config = DetectorConfig());

/**
 * Whiskers as the outermost lateral protrusions within
 * whisker_region_fraction * bbox diagonal of the nose.
 *
 * A vertex protrudes when its distance from the nose->tail_attachment line is
 * within 2% of the largest among its neighbors. Protrusions are split into
 * left and right along frame.axes[1].
 */
WhiskerEstimate detectWhiskers(const PointCloud& points,
                               const PrincipalAxisFrame& frame,
                               const Eigen::Vector3d& nose,
                               const Eigen::Vector3d& tail_attachment,
                               const DetectorConfig& config = DetectorConfig());

/**
 * Slice statistics of the density sweep (slices below min_slice_points are dropped).
 * smoothed_density is filled in.
 */
std::vector<SliceSample> computeSliceDensities(const PointCloud& points,
                                               const std::vector<double>& projections,
                                               const PrincipalAxisFrame& frame,
                                               const DetectorConfig& config);

/**
 * Centered moving average, truncated at both ends
 */
std::vector<double> movingAverage(const std::vector<double>& values, int window);

/**
 * Vertices referenced by at least one face, in original order
 * @throws InvalidParameter if a face index is out of range
 */
PointCloud referencedVertices(const PointCloud& points, const Eigen::MatrixXi& faces);

} // namespace isi_geometry
