/**
 * Mesh Geometry Analysis
 *
 * Principal component analysis of a vertex cloud: centroid, covariance,
 * eigen-decomposition and deterministic axis orientation.
 */

#include "geometry/MeshGeometry.h"
#include "geometry/GeometryErrors.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace isi_geometry {

static constexpr size_t MIN_ANALYSIS_POINTS = 4;
static constexpr double COINCIDENT_SPREAD = 1e-10;   // relative to the largest coordinate
static constexpr double COLLINEAR_RATIO = 1e-12;

// Flip v so that its component of greatest magnitude is positive
static Eigen::Vector3d orientBySignConvention(const Eigen::Vector3d& v) {
    Eigen::Index largest = 0;
    v.cwiseAbs().maxCoeff(&largest);
    return (v(largest) < 0.0) ? Eigen::Vector3d(-v) : v;
}

PrincipalAxisFrame analyzeGeometry(const PointCloud& points) {
    if (points.size() < MIN_ANALYSIS_POINTS) {
        throw DegenerateGeometry("Need at least " + std::to_string(MIN_ANALYSIS_POINTS) +
                                 " points for principal axis analysis, got " +
                                 std::to_string(points.size()));
    }

    // Compute centroid
    Eigen::Vector3d centroid = Eigen::Vector3d::Zero();
    double scale = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        if (!isFinite(points[i])) {
            throw DegenerateGeometry("Point " + std::to_string(i) + " has non-finite coordinates");
        }
        centroid += points[i];
        scale = std::max(scale, points[i].cwiseAbs().maxCoeff());
    }
    centroid /= static_cast<double>(points.size());

    // Build covariance matrix
    Eigen::Matrix3d cov = Eigen::Matrix3d::Zero();
    for (const auto& p : points) {
        Eigen::Vector3d d = p - centroid;
        cov += d * d.transpose();
    }
    cov /= static_cast<double>(points.size());

    // Eigen decomposition (eigenvalues ascending)
    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(cov);
    if (solver.info() != Eigen::Success) {
        throw DegenerateGeometry("Eigen-decomposition of the covariance matrix failed");
    }

    const Eigen::Vector3d& eigenvalues = solver.eigenvalues();
    const Eigen::Matrix3d& eigenvectors = solver.eigenvectors();

    double largest = eigenvalues(2);
    double second = eigenvalues(1);
    // Spread below the rounding noise of the coordinates counts as a single point
    double noise = COINCIDENT_SPREAD * scale;
    if (largest <= noise * noise) {
        throw DegenerateGeometry("All points are coincident");
    }
    if (second <= COLLINEAR_RATIO * largest) {
        throw DegenerateGeometry("All points are collinear");
    }

    PrincipalAxisFrame frame;
    frame.centroid = centroid;

    // Descending order: column 2 is the primary axis
    frame.axes[0] = orientBySignConvention(eigenvectors.col(2).normalized());
    frame.axes[1] = orientBySignConvention(eigenvectors.col(1).normalized());
    frame.axes[2] = frame.axes[0].cross(frame.axes[1]).normalized();

    double total = 0.0;
    for (int i = 0; i < 3; ++i) {
        // Round-off can leave tiny negative eigenvalues for planar clouds
        frame.variances[i] = std::max(0.0, eigenvalues(2 - i));
        total += frame.variances[i];
    }
    for (int i = 0; i < 3; ++i) {
        frame.variance_ratios[i] = frame.variances[i] / total;
    }

    return frame;
}

BoundingBox computeBoundingBox(const PointCloud& points) {
    BoundingBox box;
    for (const auto& p : points) {
        box.extend(p);
    }
    return box;
}

std::vector<double> projectOntoAxis(const PointCloud& points,
                                    const Eigen::Vector3d& origin,
                                    const Eigen::Vector3d& axis) {
    std::vector<double> projections;
    projections.reserve(points.size());
    for (const auto& p : points) {
        projections.push_back((p - origin).dot(axis));
    }
    return projections;
}

double distanceToAxis(const Eigen::Vector3d& point,
                      const Eigen::Vector3d& origin,
                      const Eigen::Vector3d& axis) {
    Eigen::Vector3d to_point = point - origin;
    Eigen::Vector3d perpendicular = to_point - to_point.dot(axis) * axis;
    return perpendicular.norm();
}

} // namespace isi_geometry
