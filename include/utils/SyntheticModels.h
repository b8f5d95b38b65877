#pragma once

#include "alignment/GeometryParameters.h"
#include "geometry/MeshGeometry.h"
#include <Eigen/Dense>

namespace isi_geometry {

/**
 * Shape of the synthetic mouse used by the demo and the tests.
 *
 * The body runs along +x from the tail tip (x = -10) to the nose (x = +10).
 * Each station carries an on-axis point and, except at both ends, a ring of
 * points: a wide sparse tail section, a narrow dense body and a head that
 * tapers towards the nose. Optional ear clusters sit beside the head and
 * optional whisker spikes stick out sideways near the nose.
 */
struct SyntheticMouseOptions {
    double half_length = 10.0;
    double station_spacing = 0.25;
    int ring_points = 12;
    double tail_radius = 3.0;
    double body_radius = 1.0;
    double tail_end = -7.0;         // Tail section for x < tail_end
    double head_start = 7.0;        // Head section for x > head_start
    double head_base_radius = 1.5;
    double head_tip_radius = 0.5;
    bool with_ears = false;
    double ear_x = 8.5;
    double ear_offset = 1.8;        // Lateral distance of each ear cluster
    bool with_whiskers = false;
    double whisker_x = 9.5;
    double whisker_length = 2.7;    // Lateral distance of each spike tip
};

/**
 * Deterministic synthetic mouse point cloud
 */
PointCloud makeSyntheticMouse(const SyntheticMouseOptions& options = SyntheticMouseOptions());

/**
 * Two spheres (radius 2, centers x = -6 and x = +6) joined by a thin rod
 */
PointCloud makeDumbbell();

/**
 * Mirror every point across the plane normal to the given axis
 */
PointCloud reflectAlongAxis(const PointCloud& points, Axis axis);

/**
 * Rigid transform R * p + t of every point
 */
PointCloud transformCloud(const PointCloud& points,
                          const Eigen::Matrix3d& rotation,
                          const Eigen::Vector3d& translation);

} // namespace isi_geometry
