/**
 * Result export
 *
 * Serializes detection and alignment results in the shape the acquisition
 * software consumes: landmark name -> [x, y, z], 4x4 nested matrix,
 * errors as floats (null when absent).
 */

#include "io/ResultWriter.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace isi_geometry {

static std::string pad(int indent) {
    return std::string(static_cast<size_t>(indent), ' ');
}

static std::string quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out += c; break;
        }
    }
    return out + "\"";
}

static std::string vectorToJSON(const Eigen::Vector3d& v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6)
        << "[" << v.x() << ", " << v.y() << ", " << v.z() << "]";
    return oss.str();
}

static std::string number(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << value;
    return oss.str();
}

std::string landmarksToJSON(const LandmarkSet& landmarks, int indent) {
    std::ostringstream oss;
    oss << "{\n";
    bool first = true;
    for (const auto& entry : landmarks.getLandmarks()) {
        if (!first) oss << ",\n";
        oss << pad(indent + 2) << quote(entry.first) << ": " << vectorToJSON(entry.second.position);
        first = false;
    }
    oss << "\n" << pad(indent) << "}";
    return oss.str();
}

std::string matrixToJSON(const Eigen::Matrix4d& matrix) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(9) << "[";
    for (int r = 0; r < 4; ++r) {
        if (r > 0) oss << ", ";
        oss << "[";
        for (int c = 0; c < 4; ++c) {
            if (c > 0) oss << ", ";
            oss << matrix(r, c);
        }
        oss << "]";
    }
    oss << "]";
    return oss.str();
}

std::string metadataToJSON(const LandmarkSet& landmarks, int indent) {
    const DetectionMetadata& meta = landmarks.metadata();
    const std::string in = pad(indent + 2);

    std::ostringstream oss;
    oss << "{\n";
    oss << in << "\"method\": " << quote(toString(meta.method)) << ",\n";
    oss << in << "\"confidence\": " << quote(toString(meta.confidence)) << ",\n";
    oss << in << "\"centroid\": " << vectorToJSON(meta.frame.centroid) << ",\n";
    oss << in << "\"principal_axes\": [" << vectorToJSON(meta.frame.axes[0]) << ", "
        << vectorToJSON(meta.frame.axes[1]) << ", " << vectorToJSON(meta.frame.axes[2]) << "],\n";
    oss << in << "\"variance_ratios\": [" << number(meta.frame.variance_ratios[0]) << ", "
        << number(meta.frame.variance_ratios[1]) << ", "
        << number(meta.frame.variance_ratios[2]) << "],\n";
    oss << in << "\"vertex_count\": " << meta.vertex_count << ",\n";
    oss << in << "\"slices_analyzed\": " << meta.slices_analyzed << ",\n";
    oss << in << "\"transition_position\": " << number(meta.transition_position) << ",\n";
    oss << in << "\"ears_detected\": " << (meta.ears_detected ? "true" : "false") << ",\n";

    oss << in << "\"landmark_confidence\": {";
    bool first = true;
    for (const auto& entry : landmarks.getLandmarks()) {
        oss << (first ? "" : ", ") << quote(entry.first) << ": " << quote(toString(entry.second.confidence));
        first = false;
    }
    oss << "},\n";

    oss << in << "\"landmarks_detected\": " << landmarks.size() << ",\n";

    oss << in << "\"warnings\": [";
    for (size_t i = 0; i < meta.warnings.size(); ++i) {
        oss << (i > 0 ? ", " : "") << quote(meta.warnings[i]);
    }
    oss << "]\n";
    oss << pad(indent) << "}";
    return oss.str();
}

std::string alignmentToJSON(const AlignmentResult& result,
                            const GeometryParameters& params,
                            int indent) {
    const std::string in = pad(indent + 2);

    std::ostringstream oss;
    oss << "{\n";
    oss << in << "\"transformation_matrix\": " << matrixToJSON(result.transform) << ",\n";
    oss << in << "\"alignment_errors\": {\"nose_tail\": " << number(result.nose_tail_error)
        << ", \"ear\": " << (result.ear_error ? number(*result.ear_error) : "null")
        << ", \"overall\": " << number(result.overall_error) << "},\n";
    oss << in << "\"is_valid\": " << (result.is_valid ? "true" : "false") << ",\n";
    oss << in << "\"parameters\": {\"scale_factor\": " << number(params.scale_factor)
        << ", \"alignment_tolerance_degrees\": " << number(params.alignment_tolerance_degrees)
        << ", \"nose_tail_axis\": " << quote(toString(params.nose_tail_axis))
        << ", \"ear_alignment_axis\": " << quote(toString(params.ear_alignment_axis)) << "}\n";
    oss << pad(indent) << "}";
    return oss.str();
}

bool saveResultJSON(const std::string& filepath,
                    const LandmarkSet& landmarks,
                    const AlignmentResult* alignment,
                    const GeometryParameters& params) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << "{\n";
    file << "  \"landmarks\": " << landmarksToJSON(landmarks, 2) << ",\n";
    file << "  \"metadata\": " << metadataToJSON(landmarks, 2);
    if (alignment) {
        file << ",\n  \"alignment\": " << alignmentToJSON(*alignment, params, 2);
    }
    file << "\n}\n";

    file.close();
    return !file.fail();
}

void printKeyValues(std::ostream& out, const LandmarkSet& landmarks, const AlignmentResult* alignment) {
    const DetectionMetadata& meta = landmarks.metadata();
    out << "method=" << toString(meta.method) << std::endl;
    out << "confidence=" << toString(meta.confidence) << std::endl;
    out << "vertex_count=" << meta.vertex_count << std::endl;

    out << std::fixed << std::setprecision(6);
    for (const auto& entry : landmarks.getLandmarks()) {
        const Eigen::Vector3d& p = entry.second.position;
        out << entry.first << "=" << p.x() << "," << p.y() << "," << p.z() << std::endl;
    }

    if (alignment) {
        out << "nose_tail_error=" << alignment->nose_tail_error << std::endl;
        if (alignment->ear_error) {
            out << "ear_error=" << *alignment->ear_error << std::endl;
        }
        out << "overall_error=" << alignment->overall_error << std::endl;
        out << "is_valid=" << (alignment->is_valid ? "true" : "false") << std::endl;
    }
    out.unsetf(std::ios_base::floatfield);
}

} // namespace isi_geometry
