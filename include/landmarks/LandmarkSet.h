#pragma once

#include "geometry/MeshGeometry.h"
#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace isi_geometry {

/**
 * Well-known landmark identifiers
 */
namespace landmark_names {
constexpr const char* NOSE = "nose";
constexpr const char* TAIL_TIP = "tail_tip";
constexpr const char* TAIL_ATTACHMENT = "tail_attachment";
constexpr const char* LEFT_EAR = "left_ear";
constexpr const char* RIGHT_EAR = "right_ear";
constexpr const char* EYE_CENTER = "eye_center";
constexpr const char* LEFT_WHISKER = "left_whisker";
constexpr const char* RIGHT_WHISKER = "right_whisker";
} // namespace landmark_names

enum class LandmarkConfidence {
    High,   // Density analysis succeeded
    Low     // Fallback, heuristic or derived estimate
};

enum class DetectionMethod {
    DensityAnalysis,   // Cross-sectional density sweep along the primary axis
    GlobalExtremes     // Plain projection extremes (fallback)
};

const char* toString(LandmarkConfidence confidence);
const char* toString(DetectionMethod method);

/**
 * A single named landmark
 */
struct Landmark3D {
    Eigen::Vector3d position;
    LandmarkConfidence confidence;

    Landmark3D() : position(Eigen::Vector3d::Zero()), confidence(LandmarkConfidence::Low) {}
    Landmark3D(const Eigen::Vector3d& p, LandmarkConfidence c) : position(p), confidence(c) {}
};

/**
 * How the landmark set was obtained
 */
struct DetectionMetadata {
    DetectionMethod method = DetectionMethod::GlobalExtremes;
    LandmarkConfidence confidence = LandmarkConfidence::Low;
    PrincipalAxisFrame frame;           // Frame the detection ran in
    size_t vertex_count = 0;            // Vertices that took part in detection
    int slices_analyzed = 0;            // Slices retained by the density sweep
    double transition_position = 0.0;   // Tail-body transition along the primary axis
    double max_density_gradient = 0.0;
    bool ears_detected = false;
    std::vector<std::string> warnings;  // Degradations absorbed during detection
};

/**
 * Named 3D landmarks detected on a model.
 *
 * nose, tail_tip and tail_attachment are always present after detection;
 * ears and derived landmarks are optional.
 */
class LandmarkSet {
public:
    LandmarkSet() = default;

    /**
     * Add or replace a landmark
     */
    void set(const std::string& name, const Eigen::Vector3d& position,
             LandmarkConfidence confidence = LandmarkConfidence::High) {
        landmarks_[name] = Landmark3D(position, confidence);
    }

    /**
     * Check if a landmark exists
     */
    bool has(const std::string& name) const {
        return landmarks_.find(name) != landmarks_.end();
    }

    /**
     * Position of a landmark
     * @throws std::out_of_range if the landmark is missing
     */
    const Eigen::Vector3d& position(const std::string& name) const;

    /**
     * Confidence of a landmark
     * @throws std::out_of_range if the landmark is missing
     */
    LandmarkConfidence confidence(const std::string& name) const;

    bool hasEars() const {
        return has(landmark_names::LEFT_EAR) && has(landmark_names::RIGHT_EAR);
    }

    /**
     * Vector from nose to tail tip
     */
    Eigen::Vector3d noseToTail() const;

    /**
     * Vector from left ear to right ear
     */
    Eigen::Vector3d leftToRightEar() const;

    /**
     * Landmark names in sorted order
     */
    std::vector<std::string> names() const;

    const std::map<std::string, Landmark3D>& getLandmarks() const { return landmarks_; }

    size_t size() const { return landmarks_.size(); }

    bool empty() const { return landmarks_.empty(); }

    void clear() { landmarks_.clear(); }

    DetectionMetadata& metadata() { return metadata_; }
    const DetectionMetadata& metadata() const { return metadata_; }

    /**
     * Load landmarks from a simple text file
     * Format: one landmark per line
     *   name x y z [high|low]
     */
    bool loadFromTXT(const std::string& filepath);

    /**
     * Save landmarks to TXT file
     */
    bool saveToTXT(const std::string& filepath) const;

private:
    std::map<std::string, Landmark3D> landmarks_;
    DetectionMetadata metadata_;
};

} // namespace isi_geometry
