#pragma once

#include <string>

namespace isi_geometry {

enum class TailAttachmentMode {
    NearestVertex,   // Input vertex nearest to the density transition
    Interpolated     // nose + ratio * (tail_tip - nose)
};

const char* toString(TailAttachmentMode mode);

/**
 * Parse "nearest_vertex" / "interpolated"
 * @throws InvalidParameter for any other name
 */
TailAttachmentMode parseTailAttachmentMode(const std::string& name);

/**
 * Tunable thresholds of the landmark detector.
 *
 * Defaults reproduce the density sweep used on the rig's mouse models.
 */
struct DetectorConfig {
    // Density sweep along the primary axis
    int num_slices = 40;                  // Slice positions (>= 30)
    double slice_overlap = 1.5;           // half_thickness = range / (slice_overlap * num_slices)
    int min_slice_points = 5;             // Slices with fewer members are discarded
    int min_usable_slices = 10;           // Fewer retained slices -> global extremes fallback
    int min_region_slices = 3;            // Each side of the transition needs this many slices
    int smoothing_divisor = 8;            // Moving average window = max(3, slices / divisor)
    double region_extent_fraction = 0.25; // Candidate band near each region's outer end
    double radius_epsilon = 1e-6;         // Floor for the cross-section radius

    // Tail attachment
    TailAttachmentMode tail_attachment_mode = TailAttachmentMode::NearestVertex;
    double tail_attachment_ratio = 0.7;   // Used by the interpolated mode and the fallback

    // Bilateral features (ears), lower confidence
    bool detect_ears = true;
    double head_radius_fraction = 0.15;   // Head region radius relative to bbox diagonal
    int min_head_points = 10;

    // Whiskers: lateral protrusions close to the nose, lower confidence
    bool detect_whiskers = true;
    double whisker_region_fraction = 0.15; // Search radius relative to bbox diagonal
    int min_whisker_points = 5;
    double whisker_neighborhood_fraction = 0.1;  // Local-maximum radius relative to the region diagonal

    // Derived landmarks
    double eye_center_ratio = 0.375;      // eye_center = nose + ratio * (ear_midpoint - nose)

    bool verbose = false;

    /**
     * Check value ranges
     * @throws InvalidParameter on the first offending field
     */
    void validate() const;
};

} // namespace isi_geometry
