/**
 * Landmark Detection
 *
 * Orientation-independent detection of mouse landmarks on a vertex cloud.
 * Only the principal axes of the cloud are used; no world axis is assumed.
 *
 * Nose/tail: thin slices along the primary axis give a cross-sectional
 * density profile. The steepest density increase marks the tail-body
 * transition; the side with lower mean density is the tail.
 */

#include "landmarks/LandmarkDetector.h"
#include "geometry/GeometryErrors.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>

namespace isi_geometry {

static constexpr double PI = 3.14159265358979323846;
static constexpr int MIN_SMOOTHING_WINDOW = 3;
static constexpr int MIN_PROTRUSION_NEIGHBORS = 3;
static constexpr double PROTRUSION_RATIO = 0.98;
static constexpr double SIDE_MARGIN_FRACTION = 0.01;  // of the whisker region radius

namespace {

struct ProjectionExtremes {
    size_t min_idx = 0;
    size_t max_idx = 0;
    double min_proj = std::numeric_limits<double>::max();
    double max_proj = std::numeric_limits<double>::lowest();
};

ProjectionExtremes findExtremes(const std::vector<double>& projections) {
    ProjectionExtremes ext;
    for (size_t i = 0; i < projections.size(); ++i) {
        if (projections[i] < ext.min_proj) {
            ext.min_proj = projections[i];
            ext.min_idx = i;
        }
        if (projections[i] > ext.max_proj) {
            ext.max_proj = projections[i];
            ext.max_idx = i;
        }
    }
    return ext;
}

// Most extreme point whose projection lies in [lower, upper].
// Returns -1 if the band is empty.
long selectRegionExtreme(const std::vector<double>& projections,
                         double lower, double upper, bool want_max) {
    long best = -1;
    for (size_t i = 0; i < projections.size(); ++i) {
        double p = projections[i];
        if (p < lower || p > upper) continue;
        if (best < 0 ||
            (want_max && p > projections[best]) ||
            (!want_max && p < projections[best])) {
            best = static_cast<long>(i);
        }
    }
    return best;
}

size_t nearestPoint(const PointCloud& points, const Eigen::Vector3d& target) {
    size_t best = 0;
    double best_dist_sq = std::numeric_limits<double>::max();
    for (size_t i = 0; i < points.size(); ++i) {
        double dist_sq = (points[i] - target).squaredNorm();
        if (dist_sq < best_dist_sq) {
            best_dist_sq = dist_sq;
            best = i;
        }
    }
    return best;
}

std::string formatVector(const Eigen::Vector3d& v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << "(" << v.x() << ", " << v.y() << ", " << v.z() << ")";
    return oss.str();
}

void warn(std::vector<std::string>& warnings, const std::string& message) {
    std::cerr << "Warning: " << message << std::endl;
    warnings.push_back(message);
}

// Global projection extremes: higher projection is taken as the nose
void assignGlobalExtremes(NoseTailEstimate& estimate,
                          const PointCloud& points,
                          const ProjectionExtremes& ext,
                          const DetectorConfig& config) {
    estimate.method = DetectionMethod::GlobalExtremes;
    estimate.nose = points[ext.max_idx];
    estimate.tail_tip = points[ext.min_idx];
    estimate.tail_attachment = estimate.nose +
        config.tail_attachment_ratio * (estimate.tail_tip - estimate.nose);
    estimate.transition_position = 0.0;
    estimate.max_density_gradient = 0.0;
}

} // namespace

std::vector<double> movingAverage(const std::vector<double>& values, int window) {
    const int n = static_cast<int>(values.size());
    std::vector<double> smoothed(values.size(), 0.0);
    if (n == 0 || window <= 1) {
        return values;
    }

    const int half = window / 2;
    for (int i = 0; i < n; ++i) {
        int begin = std::max(0, i - half);
        int end = std::min(n, i - half + window);
        double sum = 0.0;
        for (int j = begin; j < end; ++j) {
            sum += values[j];
        }
        smoothed[i] = sum / static_cast<double>(end - begin);
    }
    return smoothed;
}

std::vector<SliceSample> computeSliceDensities(const PointCloud& points,
                                               const std::vector<double>& projections,
                                               const PrincipalAxisFrame& frame,
                                               const DetectorConfig& config) {
    std::vector<SliceSample> slices;
    if (points.empty()) {
        return slices;
    }

    ProjectionExtremes ext = findExtremes(projections);
    double range = ext.max_proj - ext.min_proj;
    if (!(range > 0.0)) {
        return slices;
    }

    const Eigen::Vector3d& axis = frame.primaryAxis();
    const int num_slices = config.num_slices;
    const double half_thickness = range / (config.slice_overlap * num_slices);

    for (int s = 0; s < num_slices; ++s) {
        double position = ext.min_proj + range * static_cast<double>(s) / (num_slices - 1);
        Eigen::Vector3d slice_center = frame.centroid + position * axis;

        int count = 0;
        double max_radius = 0.0;
        for (size_t i = 0; i < points.size(); ++i) {
            if (std::abs(projections[i] - position) > half_thickness) continue;
            ++count;
            max_radius = std::max(max_radius, distanceToAxis(points[i], slice_center, axis));
        }

        // Too few members for a reliable cross-section
        if (count < config.min_slice_points) continue;

        SliceSample sample;
        sample.position = position;
        sample.point_count = count;
        sample.radius = std::max(max_radius, config.radius_epsilon);
        sample.density = count / (PI * sample.radius * sample.radius);
        sample.smoothed_density = sample.density;
        slices.push_back(sample);
    }

    if (slices.empty()) {
        return slices;
    }

    std::vector<double> densities;
    densities.reserve(slices.size());
    for (const auto& sample : slices) {
        densities.push_back(sample.density);
    }

    int window = std::max(MIN_SMOOTHING_WINDOW,
                          static_cast<int>(slices.size()) / config.smoothing_divisor);
    std::vector<double> smoothed = movingAverage(densities, window);
    for (size_t i = 0; i < slices.size(); ++i) {
        slices[i].smoothed_density = smoothed[i];
    }

    return slices;
}

NoseTailEstimate detectNoseTail(const PointCloud& points,
                                const PrincipalAxisFrame& frame,
                                const DetectorConfig& config) {
    if (points.empty()) {
        throw DegenerateGeometry("No vertices available for nose/tail detection");
    }

    NoseTailEstimate estimate;
    const Eigen::Vector3d& axis = frame.primaryAxis();

    std::vector<double> projections = projectOntoAxis(points, frame.centroid, axis);
    ProjectionExtremes ext = findExtremes(projections);

    if (config.verbose) {
        std::cout << "Primary axis projection range: " << ext.min_proj
                  << " to " << ext.max_proj << std::endl;
    }

    estimate.slices = computeSliceDensities(points, projections, frame, config);
    const std::vector<SliceSample>& slices = estimate.slices;

    if (static_cast<int>(slices.size()) < config.min_usable_slices) {
        warn(estimate.warnings, "Insufficient slices for density analysis (" +
             std::to_string(slices.size()) + " < " + std::to_string(config.min_usable_slices) +
             "), falling back to global extremes");
        assignGlobalExtremes(estimate, points, ext, config);
        return estimate;
    }

    // Steepest positive step of the smoothed profile: tail -> body transition
    size_t transition_idx = 0;
    double max_gradient = std::numeric_limits<double>::lowest();
    for (size_t i = 0; i + 1 < slices.size(); ++i) {
        double gradient = slices[i + 1].smoothed_density - slices[i].smoothed_density;
        if (gradient > max_gradient) {
            max_gradient = gradient;
            transition_idx = i;
        }
    }
    double transition = slices[transition_idx].position;

    if (config.verbose) {
        std::cout << "Analyzed " << slices.size() << " slices along primary axis" << std::endl;
        std::cout << "Tail-body transition at position " << transition
                  << " (gradient " << max_gradient << ")" << std::endl;
    }

    // Partition slices at the transition
    size_t lower_count = transition_idx + 1;
    size_t upper_count = slices.size() - lower_count;
    if (static_cast<int>(lower_count) < config.min_region_slices ||
        static_cast<int>(upper_count) < config.min_region_slices) {
        warn(estimate.warnings, "Could not reliably partition into tail/body regions (" +
             std::to_string(lower_count) + " / " + std::to_string(upper_count) +
             " slices), falling back to global extremes");
        assignGlobalExtremes(estimate, points, ext, config);
        return estimate;
    }

    double lower_mean = 0.0;
    double upper_mean = 0.0;
    for (size_t i = 0; i < slices.size(); ++i) {
        if (i < lower_count) {
            lower_mean += slices[i].smoothed_density;
        } else {
            upper_mean += slices[i].smoothed_density;
        }
    }
    lower_mean /= static_cast<double>(lower_count);
    upper_mean /= static_cast<double>(upper_count);

    // The side with lower mean density is the tail
    bool tail_on_lower_side = lower_mean < upper_mean;

    if (config.verbose) {
        std::cout << "Mean density below transition: " << lower_mean
                  << ", above: " << upper_mean << std::endl;
        std::cout << "Tail region is on the " << (tail_on_lower_side ? "negative" : "positive")
                  << " side of the primary axis" << std::endl;
    }

    // Candidate bands at the outer end of each region
    double lower_extent = config.region_extent_fraction * (transition - ext.min_proj);
    double upper_extent = config.region_extent_fraction * (ext.max_proj - transition);
    long lower_pick = selectRegionExtreme(projections, ext.min_proj,
                                          ext.min_proj + lower_extent, false);
    long upper_pick = selectRegionExtreme(projections, ext.max_proj - upper_extent,
                                          ext.max_proj, true);

    if (lower_pick < 0) {
        warn(estimate.warnings, "No vertices in the negative-side region, using global extreme");
        lower_pick = static_cast<long>(ext.min_idx);
    }
    if (upper_pick < 0) {
        warn(estimate.warnings, "No vertices in the positive-side region, using global extreme");
        upper_pick = static_cast<long>(ext.max_idx);
    }

    estimate.method = DetectionMethod::DensityAnalysis;
    estimate.transition_position = transition;
    estimate.max_density_gradient = max_gradient;
    if (tail_on_lower_side) {
        estimate.tail_tip = points[lower_pick];
        estimate.nose = points[upper_pick];
    } else {
        estimate.tail_tip = points[upper_pick];
        estimate.nose = points[lower_pick];
    }

    if (config.tail_attachment_mode == TailAttachmentMode::NearestVertex) {
        Eigen::Vector3d attachment_3d = frame.centroid + transition * axis;
        estimate.tail_attachment = points[nearestPoint(points, attachment_3d)];
    } else {
        estimate.tail_attachment = estimate.nose +
            config.tail_attachment_ratio * (estimate.tail_tip - estimate.nose);
    }

    return estimate;
}

EarEstimate detectEars(const PointCloud& points,
                       const PrincipalAxisFrame& frame,
                       const Eigen::Vector3d& nose,
                       const DetectorConfig& config) {
    EarEstimate ears;

    double head_radius = config.head_radius_fraction * computeBoundingBox(points).diagonal();

    PointCloud head_points;
    for (const auto& p : points) {
        if ((p - nose).norm() <= head_radius) {
            head_points.push_back(p);
        }
    }
    ears.head_point_count = head_points.size();

    if (static_cast<int>(head_points.size()) < config.min_head_points) {
        ears.warning = "Insufficient head vertices for ear detection: " +
                       std::to_string(head_points.size());
        return ears;
    }

    // Left/right extremes along the secondary axis
    std::vector<double> lateral = projectOntoAxis(head_points, nose, frame.secondaryAxis());
    ProjectionExtremes ext = findExtremes(lateral);

    if (!(ext.max_proj > ext.min_proj)) {
        ears.warning = "Head region has no lateral extent";
        return ears;
    }

    ears.found = true;
    ears.left = head_points[ext.min_idx];
    ears.right = head_points[ext.max_idx];
    return ears;
}

WhiskerEstimate detectWhiskers(const PointCloud& points,
                               const PrincipalAxisFrame& frame,
                               const Eigen::Vector3d& nose,
                               const Eigen::Vector3d& tail_attachment,
                               const DetectorConfig& config) {
    WhiskerEstimate whiskers;

    double region_radius = config.whisker_region_fraction * computeBoundingBox(points).diagonal();

    PointCloud region;
    for (const auto& p : points) {
        if ((p - nose).norm() <= region_radius) {
            region.push_back(p);
        }
    }
    whiskers.region_point_count = region.size();

    if (static_cast<int>(region.size()) < config.min_whisker_points) {
        whiskers.warning = "Insufficient vertices in whisker region: " + std::to_string(region.size());
        return whiskers;
    }

    // Body direction from the nose; primary axis when the attachment coincides with the nose
    Eigen::Vector3d body = tail_attachment - nose;
    if (body.norm() > 0.0) {
        body.normalize();
    } else {
        body = frame.primaryAxis();
    }

    std::vector<double> lateral_distance(region.size());
    for (size_t i = 0; i < region.size(); ++i) {
        Eigen::Vector3d d = region[i] - nose;
        lateral_distance[i] = (d - d.dot(body) * body).norm();
    }

    // Local maxima of the lateral distance
    double neighborhood = config.whisker_neighborhood_fraction * computeBoundingBox(region).diagonal();
    std::vector<size_t> protrusions;
    for (size_t i = 0; i < region.size(); ++i) {
        int neighbors = 0;
        double max_lateral = 0.0;
        for (size_t j = 0; j < region.size(); ++j) {
            if ((region[j] - region[i]).norm() <= neighborhood) {
                ++neighbors;
                max_lateral = std::max(max_lateral, lateral_distance[j]);
            }
        }
        if (neighbors >= MIN_PROTRUSION_NEIGHBORS &&
            lateral_distance[i] >= PROTRUSION_RATIO * max_lateral) {
            protrusions.push_back(i);
        }
    }
    whiskers.protrusion_count = protrusions.size();

    if (protrusions.size() < 2) {
        whiskers.warning = "Insufficient whisker protrusions: " + std::to_string(protrusions.size());
        return whiskers;
    }

    // Most lateral protrusion on each side of the secondary axis
    double margin = SIDE_MARGIN_FRACTION * region_radius;
    double min_side = -margin;
    double max_side = margin;
    for (size_t idx : protrusions) {
        double side = (region[idx] - nose).dot(frame.secondaryAxis());
        if (side < min_side) {
            min_side = side;
            whiskers.left = region[idx];
            whiskers.has_left = true;
        }
        if (side > max_side) {
            max_side = side;
            whiskers.right = region[idx];
            whiskers.has_right = true;
        }
    }

    if (!whiskers.has_left || !whiskers.has_right) {
        whiskers.warning = std::string("No whisker protrusion on the ") +
                           (whiskers.has_left ? "right" : (whiskers.has_right ? "left" : "either")) +
                           " side";
    }
    return whiskers;
}

PointCloud referencedVertices(const PointCloud& points, const Eigen::MatrixXi& faces) {
    if (faces.size() == 0) {
        return points;
    }
    if (faces.cols() != 3) {
        throw InvalidParameter("Faces must be an F x 3 index matrix");
    }

    std::vector<bool> used(points.size(), false);
    for (int f = 0; f < faces.rows(); ++f) {
        for (int k = 0; k < 3; ++k) {
            int idx = faces(f, k);
            if (idx < 0 || static_cast<size_t>(idx) >= points.size()) {
                throw InvalidParameter("Face " + std::to_string(f) + " references vertex " +
                                       std::to_string(idx) + " out of range");
            }
            used[idx] = true;
        }
    }

    PointCloud referenced;
    for (size_t i = 0; i < points.size(); ++i) {
        if (used[i]) {
            referenced.push_back(points[i]);
        }
    }
    return referenced;
}

LandmarkSet detectLandmarks(const PointCloud& points,
                            const PrincipalAxisFrame& frame,
                            const Eigen::MatrixXi& faces,
                            const DetectorConfig& config) {
    config.validate();

    PointCloud vertices = referencedVertices(points, faces);
    if (vertices.empty()) {
        throw DegenerateGeometry("No vertices available for landmark detection");
    }

    if (config.verbose) {
        std::cout << "Starting landmark detection on " << vertices.size() << " vertices";
        if (faces.size() > 0) {
            std::cout << " (" << points.size() - vertices.size() << " unreferenced dropped)";
        }
        std::cout << std::endl;
    }

    NoseTailEstimate nose_tail = detectNoseTail(vertices, frame, config);

    LandmarkSet landmarks;
    DetectionMetadata& meta = landmarks.metadata();
    meta.method = nose_tail.method;
    meta.frame = frame;
    meta.vertex_count = vertices.size();
    meta.slices_analyzed = static_cast<int>(nose_tail.slices.size());
    meta.transition_position = nose_tail.transition_position;
    meta.max_density_gradient = nose_tail.max_density_gradient;
    meta.warnings = nose_tail.warnings;

    bool density_ok = nose_tail.method == DetectionMethod::DensityAnalysis;
    meta.confidence = density_ok ? LandmarkConfidence::High : LandmarkConfidence::Low;
    LandmarkConfidence primary = meta.confidence;
    LandmarkConfidence attachment =
        (density_ok && config.tail_attachment_mode == TailAttachmentMode::NearestVertex)
            ? LandmarkConfidence::High : LandmarkConfidence::Low;

    landmarks.set(landmark_names::NOSE, nose_tail.nose, primary);
    landmarks.set(landmark_names::TAIL_TIP, nose_tail.tail_tip, primary);
    landmarks.set(landmark_names::TAIL_ATTACHMENT, nose_tail.tail_attachment, attachment);

    if (config.verbose) {
        std::cout << "Nose detected at: " << formatVector(nose_tail.nose) << std::endl;
        std::cout << "Tail tip at: " << formatVector(nose_tail.tail_tip) << std::endl;
        std::cout << "Tail attachment at: " << formatVector(nose_tail.tail_attachment) << std::endl;
    }

    if (config.detect_ears) {
        EarEstimate ears = detectEars(vertices, frame, nose_tail.nose, config);
        if (ears.found) {
            landmarks.set(landmark_names::LEFT_EAR, ears.left, LandmarkConfidence::Low);
            landmarks.set(landmark_names::RIGHT_EAR, ears.right, LandmarkConfidence::Low);
            meta.ears_detected = true;

            Eigen::Vector3d ear_midpoint = 0.5 * (ears.left + ears.right);
            Eigen::Vector3d eye_center = nose_tail.nose +
                config.eye_center_ratio * (ear_midpoint - nose_tail.nose);
            landmarks.set(landmark_names::EYE_CENTER, eye_center, LandmarkConfidence::Low);

            if (config.verbose) {
                std::cout << "Ears from " << ears.head_point_count << " head vertices: left "
                          << formatVector(ears.left) << ", right " << formatVector(ears.right)
                          << std::endl;
            }
        } else {
            warn(meta.warnings, ears.warning);
        }
    }

    if (config.detect_whiskers) {
        WhiskerEstimate whiskers = detectWhiskers(vertices, frame, nose_tail.nose,
                                                  nose_tail.tail_attachment, config);
        if (whiskers.has_left) {
            landmarks.set(landmark_names::LEFT_WHISKER, whiskers.left, LandmarkConfidence::Low);
        }
        if (whiskers.has_right) {
            landmarks.set(landmark_names::RIGHT_WHISKER, whiskers.right, LandmarkConfidence::Low);
        }
        if (!whiskers.warning.empty()) {
            warn(meta.warnings, whiskers.warning);
        }
        if (config.verbose && (whiskers.has_left || whiskers.has_right)) {
            std::cout << "Whiskers from " << whiskers.protrusion_count << " protrusions in "
                      << whiskers.region_point_count << " vertices";
            if (whiskers.has_left) std::cout << " left " << formatVector(whiskers.left);
            if (whiskers.has_right) std::cout << " right " << formatVector(whiskers.right);
            std::cout << std::endl;
        }
    }

    return landmarks;
}

} // namespace isi_geometry
