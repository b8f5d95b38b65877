#include "alignment/AlignmentVerifier.h"
#include "alignment/TransformationCalculator.h"
#include "geometry/GeometryErrors.h"
#include <algorithm>
#include <cmath>

namespace isi_geometry {

static constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;
static constexpr double LATERAL_EPSILON = 1e-9;

double axisAngleError(const Eigen::Vector3d& v, Axis target) {
    double length = v.norm();
    if (!(length > 0.0)) {
        throw DegenerateGeometry("Cannot measure the angle of a zero-length vector");
    }
    double cos_angle = std::abs(v.dot(canonicalAxis(target))) / length;
    cos_angle = std::min(1.0, std::max(0.0, cos_angle));
    return std::acos(cos_angle) * RAD_TO_DEG;
}

LandmarkSet transformLandmarks(const LandmarkSet& landmarks, const Eigen::Matrix4d& transform) {
    LandmarkSet result;
    for (const auto& entry : landmarks.getLandmarks()) {
        result.set(entry.first, applyTransform(transform, entry.second.position),
                   entry.second.confidence);
    }
    result.metadata() = landmarks.metadata();
    return result;
}

AlignmentResult verifyAlignment(const LandmarkSet& landmarks,
                                const Eigen::Matrix4d& transform,
                                const GeometryParameters& params) {
    params.validate();
    requireFiniteMatrix(transform);

    if (!landmarks.has(landmark_names::NOSE) || !landmarks.has(landmark_names::TAIL_TIP)) {
        throw InvalidParameter("Landmark set needs nose and tail_tip for verification");
    }

    LandmarkSet aligned = transformLandmarks(landmarks, transform);

    AlignmentResult result;
    result.transform = transform;
    result.nose_tail_error = axisAngleError(aligned.noseToTail(), params.nose_tail_axis);
    result.overall_error = result.nose_tail_error;

    if (aligned.hasEars()) {
        // Only the ear component across the body axis can be rotated onto the ear axis
        Eigen::Vector3d ear = aligned.leftToRightEar();
        double ear_length = ear.norm();
        if (ear_length > 0.0 && params.ear_alignment_axis != params.nose_tail_axis) {
            Eigen::Vector3d body = canonicalAxis(params.nose_tail_axis);
            ear -= ear.dot(body) * body;
            if (ear.norm() <= LATERAL_EPSILON * std::max(1.0, ear_length)) {
                result.ear_error = 90.0;
            }
        }
        if (!result.ear_error) {
            result.ear_error = axisAngleError(ear, params.ear_alignment_axis);
        }
        result.overall_error = std::max(result.nose_tail_error, *result.ear_error);
    }

    result.is_valid = result.overall_error <= params.alignment_tolerance_degrees;
    return result;
}

} // namespace isi_geometry
