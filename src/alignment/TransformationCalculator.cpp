/**
 * Transformation Calculator
 *
 * Builds the rotation + uniform scale that moves a detected landmark set
 * into the canonical frame of the imaging rig.
 */

#include "alignment/TransformationCalculator.h"
#include "geometry/GeometryErrors.h"
#include <algorithm>
#include <cmath>

namespace isi_geometry {

static constexpr double PARALLEL_EPSILON = 1e-12;
static constexpr double TWIST_EPSILON = 1e-9;

static Eigen::Matrix3d skew(const Eigen::Vector3d& k) {
    Eigen::Matrix3d K;
    K <<     0.0, -k.z(),  k.y(),
           k.z(),    0.0, -k.x(),
          -k.y(),  k.x(),    0.0;
    return K;
}

static void requireDirection(const Eigen::Vector3d& v, const char* name) {
    if (!v.allFinite()) {
        throw InvalidParameter(std::string(name) + " vector is not finite");
    }
    if (v.norm() == 0.0) {
        throw InvalidParameter(std::string(name) + " vector has zero length");
    }
}

static const Eigen::Vector3d& requireLandmark(const LandmarkSet& landmarks, const char* name) {
    if (!landmarks.has(name)) {
        throw InvalidParameter(std::string("Landmark set has no '") + name + "'");
    }
    return landmarks.position(name);
}

Eigen::Matrix4d rotationBetween(const Eigen::Vector3d& from, const Eigen::Vector3d& to) {
    requireDirection(from, "Source");
    requireDirection(to, "Target");

    Eigen::Vector3d f = from.normalized();
    Eigen::Vector3d t = to.normalized();

    Eigen::Vector3d cross = f.cross(t);
    double c = f.dot(t);
    double s = cross.norm();

    Eigen::Matrix3d R = Eigen::Matrix3d::Identity();
    if (c >= 1.0 - PARALLEL_EPSILON) {
        // Already aligned
    } else if (c <= -1.0 + PARALLEL_EPSILON) {
        // Opposite: half turn about any axis perpendicular to f
        Eigen::Vector3d helper = std::abs(f.x()) < 0.9 ? Eigen::Vector3d(1.0, 0.0, 0.0)
                                                        : Eigen::Vector3d(0.0, 1.0, 0.0);
        Eigen::Matrix3d K = skew(f.cross(helper).normalized());
        R += 2.0 * K * K;
    } else {
        // R = I + sin(a) K + (1 - cos(a)) K^2
        Eigen::Matrix3d K = skew(cross / s);
        R += s * K + (1.0 - c) * K * K;
    }

    Eigen::Matrix4d M = Eigen::Matrix4d::Identity();
    M.block<3, 3>(0, 0) = R;
    return M;
}

Eigen::Matrix4d scaleMatrix(double scale) {
    if (!std::isfinite(scale) || scale <= 0.0) {
        throw InvalidParameter("Scale factor must be finite and positive (got " +
                               std::to_string(scale) + ")");
    }
    Eigen::Matrix4d S = Eigen::Matrix4d::Identity();
    S(0, 0) = scale;
    S(1, 1) = scale;
    S(2, 2) = scale;
    return S;
}

Eigen::Matrix4d alignmentMatrix(const LandmarkSet& landmarks, const GeometryParameters& params) {
    params.validate();

    const Eigen::Vector3d& nose = requireLandmark(landmarks, landmark_names::NOSE);
    const Eigen::Vector3d& tail = requireLandmark(landmarks, landmark_names::TAIL_TIP);

    Eigen::Matrix4d rotation = rotationBetween(tail - nose, canonicalAxis(params.nose_tail_axis));
    return rotation * scaleMatrix(params.scale_factor);
}

Eigen::Matrix4d fullAlignmentMatrix(const LandmarkSet& landmarks, const GeometryParameters& params) {
    params.validate();

    if (params.nose_tail_axis == params.ear_alignment_axis) {
        throw InvalidParameter(std::string("Nose-tail and ear axes must differ (both ") +
                               toString(params.nose_tail_axis) + ")");
    }
    if (!landmarks.hasEars()) {
        throw InvalidParameter("Full alignment requires left_ear and right_ear");
    }

    const Eigen::Vector3d& nose = requireLandmark(landmarks, landmark_names::NOSE);
    const Eigen::Vector3d& tail = requireLandmark(landmarks, landmark_names::TAIL_TIP);
    Eigen::Vector3d ear_vector = landmarks.leftToRightEar();
    if (!ear_vector.allFinite()) {
        throw InvalidParameter("Ear vector is not finite");
    }

    Eigen::Vector3d axis = canonicalAxis(params.nose_tail_axis);
    Eigen::Vector3d ear_target = canonicalAxis(params.ear_alignment_axis);

    Eigen::Matrix4d primary = rotationBetween(tail - nose, axis);

    // Ear vector after the primary rotation, restricted to the plane normal to the axis
    Eigen::Vector3d projected = primary.block<3, 3>(0, 0) * ear_vector;
    projected -= projected.dot(axis) * axis;

    Eigen::Matrix4d twist = Eigen::Matrix4d::Identity();
    if (projected.norm() > TWIST_EPSILON * std::max(1.0, ear_vector.norm())) {
        double angle = std::atan2(projected.cross(ear_target).dot(axis),
                                  projected.dot(ear_target));
        twist.block<3, 3>(0, 0) = Eigen::AngleAxisd(angle, axis).toRotationMatrix();
    }

    return twist * primary * scaleMatrix(params.scale_factor);
}

Eigen::Matrix4d computeAlignment(const LandmarkSet& landmarks, const GeometryParameters& params) {
    params.validate();

    if (landmarks.hasEars() && params.nose_tail_axis != params.ear_alignment_axis) {
        return fullAlignmentMatrix(landmarks, params);
    }
    return alignmentMatrix(landmarks, params);
}

void requireFiniteMatrix(const Eigen::Matrix4d& matrix) {
    if (!matrix.allFinite()) {
        throw InvalidParameter("Transformation matrix has non-finite entries");
    }
}

Eigen::Vector3d applyTransform(const Eigen::Matrix4d& matrix, const Eigen::Vector3d& point) {
    requireFiniteMatrix(matrix);

    Eigen::Vector4d transformed = matrix * point.homogeneous();
    double w = transformed(3);
    if (w == 0.0) {
        throw SingularTransform("Homogeneous coordinate is zero after transform");
    }
    return transformed.head<3>() / w;
}

PointCloud applyTransform(const Eigen::Matrix4d& matrix, const PointCloud& points) {
    requireFiniteMatrix(matrix);

    PointCloud result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(applyTransform(matrix, p));
    }
    return result;
}

} // namespace isi_geometry
