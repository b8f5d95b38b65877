#include "landmarks/DetectorConfig.h"
#include "geometry/GeometryErrors.h"
#include <cmath>
#include <sstream>

namespace isi_geometry {

static constexpr int MIN_NUM_SLICES = 30;

const char* toString(TailAttachmentMode mode) {
    switch (mode) {
        case TailAttachmentMode::NearestVertex: return "nearest_vertex";
        case TailAttachmentMode::Interpolated:  return "interpolated";
    }
    return "nearest_vertex";
}

TailAttachmentMode parseTailAttachmentMode(const std::string& name) {
    if (name == "nearest_vertex") return TailAttachmentMode::NearestVertex;
    if (name == "interpolated") return TailAttachmentMode::Interpolated;
    throw InvalidParameter("tail_attachment_mode must be nearest_vertex or interpolated (got '" +
                           name + "')");
}

// Throws InvalidParameter naming the field when the condition does not hold
static void require(bool condition, const char* field, double value, const char* range) {
    if (!condition) {
        std::ostringstream msg;
        msg << field << " must be " << range << " (got " << value << ")";
        throw InvalidParameter(msg.str());
    }
}

void DetectorConfig::validate() const {
    require(num_slices >= MIN_NUM_SLICES, "num_slices", num_slices, ">= 30");
    require(std::isfinite(slice_overlap) && slice_overlap > 0.0,
            "slice_overlap", slice_overlap, "> 0");
    require(min_slice_points >= 1, "min_slice_points", min_slice_points, ">= 1");
    require(min_usable_slices >= 2 && min_usable_slices <= num_slices,
            "min_usable_slices", min_usable_slices, "in [2, num_slices]");
    require(min_region_slices >= 1, "min_region_slices", min_region_slices, ">= 1");
    require(smoothing_divisor >= 1, "smoothing_divisor", smoothing_divisor, ">= 1");
    require(region_extent_fraction > 0.0 && region_extent_fraction <= 1.0,
            "region_extent_fraction", region_extent_fraction, "in (0, 1]");
    require(std::isfinite(radius_epsilon) && radius_epsilon > 0.0,
            "radius_epsilon", radius_epsilon, "> 0");
    require(tail_attachment_ratio >= 0.0 && tail_attachment_ratio <= 1.0,
            "tail_attachment_ratio", tail_attachment_ratio, "in [0, 1]");
    require(head_radius_fraction > 0.0 && head_radius_fraction <= 1.0,
            "head_radius_fraction", head_radius_fraction, "in (0, 1]");
    require(min_head_points >= 2, "min_head_points", min_head_points, ">= 2");
    require(whisker_region_fraction > 0.0 && whisker_region_fraction <= 1.0,
            "whisker_region_fraction", whisker_region_fraction, "in (0, 1]");
    require(min_whisker_points >= 3, "min_whisker_points", min_whisker_points, ">= 3");
    require(whisker_neighborhood_fraction > 0.0 && whisker_neighborhood_fraction <= 1.0,
            "whisker_neighborhood_fraction", whisker_neighborhood_fraction, "in (0, 1]");
    require(eye_center_ratio >= 0.0 && eye_center_ratio <= 1.0,
            "eye_center_ratio", eye_center_ratio, "in [0, 1]");
}

} // namespace isi_geometry
