#pragma once

#include <Eigen/Dense>
#include <array>
#include <limits>
#include <vector>

namespace isi_geometry {

/**
 * Ordered set of 3D points (mesh vertices or scan samples).
 */
using PointCloud = std::vector<Eigen::Vector3d>;

/**
 * Centroid and orthonormal principal axes of a point cloud.
 *
 * axes[0] is the direction of greatest variance (the body axis),
 * axes are sorted by descending variance and form a right-handed frame.
 */
struct PrincipalAxisFrame {
    Eigen::Vector3d centroid;
    std::array<Eigen::Vector3d, 3> axes;
    std::array<double, 3> variances;          // Eigenvalues of the covariance, descending
    std::array<double, 3> variance_ratios;    // variances[i] / sum(variances)

    PrincipalAxisFrame() : centroid(Eigen::Vector3d::Zero()),
                           axes{{Eigen::Vector3d(1.0, 0.0, 0.0), Eigen::Vector3d(0.0, 1.0, 0.0), Eigen::Vector3d(0.0, 0.0, 1.0)}},
                           variances{{0.0, 0.0, 0.0}},
                           variance_ratios{{0.0, 0.0, 0.0}} {}

    const Eigen::Vector3d& primaryAxis() const { return axes[0]; }
    const Eigen::Vector3d& secondaryAxis() const { return axes[1]; }

    /**
     * Signed coordinate of a point along axes[i], measured from the centroid
     */
    double project(const Eigen::Vector3d& point, int axis = 0) const {
        return (point - centroid).dot(axes[axis]);
    }
};

/**
 * Axis-aligned bounding box
 */
struct BoundingBox {
    Eigen::Vector3d min_pt;
    Eigen::Vector3d max_pt;

    BoundingBox() : min_pt(Eigen::Vector3d::Constant(std::numeric_limits<double>::max())),
                    max_pt(Eigen::Vector3d::Constant(std::numeric_limits<double>::lowest())) {}

    void extend(const Eigen::Vector3d& pt) {
        min_pt = min_pt.cwiseMin(pt);
        max_pt = max_pt.cwiseMax(pt);
    }

    double diagonal() const {
        return (max_pt - min_pt).norm();
    }

    Eigen::Vector3d center() const {
        return (min_pt + max_pt) * 0.5;
    }

    Eigen::Vector3d size() const {
        return max_pt - min_pt;
    }
};

/**
 * Compute centroid and principal axes of a point cloud.
 *
 * Axes come from the symmetric eigen-decomposition of the covariance matrix,
 * sorted by descending eigenvalue. Signs are fixed so that the largest
 * component of axes[0] and axes[1] is positive; axes[2] = axes[0] x axes[1].
 *
 * @param points At least 4 finite points, not all coincident or collinear
 * @return Principal axis frame
 * @throws DegenerateGeometry if no principal axis can be determined
 */
PrincipalAxisFrame analyzeGeometry(const PointCloud& points);

/**
 * Bounding box of a point cloud (empty box for an empty cloud)
 */
BoundingBox computeBoundingBox(const PointCloud& points);

/**
 * Project every point onto an axis through origin.
 * @return Signed distances (point - origin) . axis
 */
std::vector<double> projectOntoAxis(const PointCloud& points,
                                    const Eigen::Vector3d& origin,
                                    const Eigen::Vector3d& axis);

/**
 * Distance of a point from the line through origin with unit direction axis
 */
double distanceToAxis(const Eigen::Vector3d& point,
                      const Eigen::Vector3d& origin,
                      const Eigen::Vector3d& axis);

/**
 * True if all coordinates are finite
 */
inline bool isFinite(const Eigen::Vector3d& v) {
    return v.allFinite();
}

} // namespace isi_geometry
