/**
 * Pipeline Configuration
 *
 * Reads and writes the key/value configuration file shared by the
 * detect_landmarks tool and the rig scripts.
 */

#include "config/PipelineConfig.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace isi_geometry {

static double parseDouble(const std::string& key, const std::string& value) {
    std::istringstream iss(value);
    double result;
    iss >> result;
    if (iss.fail() || !iss.eof()) {
        throw std::runtime_error("Invalid number for '" + key + "': " + value);
    }
    return result;
}

static int parseInt(const std::string& key, const std::string& value) {
    std::istringstream iss(value);
    int result;
    iss >> result;
    if (iss.fail() || !iss.eof()) {
        throw std::runtime_error("Invalid integer for '" + key + "': " + value);
    }
    return result;
}

static bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::runtime_error("Invalid boolean for '" + key + "': " + value);
}

bool PipelineConfig::set(const std::string& key, const std::string& value) {
    if (key == "scale_factor") {
        geometry.scale_factor = parseDouble(key, value);
    } else if (key == "alignment_tolerance_degrees") {
        geometry.alignment_tolerance_degrees = parseDouble(key, value);
    } else if (key == "nose_tail_axis") {
        geometry.nose_tail_axis = parseAxis(value);
    } else if (key == "ear_alignment_axis") {
        geometry.ear_alignment_axis = parseAxis(value);
    } else if (key == "num_slices") {
        detector.num_slices = parseInt(key, value);
    } else if (key == "slice_overlap") {
        detector.slice_overlap = parseDouble(key, value);
    } else if (key == "min_slice_points") {
        detector.min_slice_points = parseInt(key, value);
    } else if (key == "min_usable_slices") {
        detector.min_usable_slices = parseInt(key, value);
    } else if (key == "min_region_slices") {
        detector.min_region_slices = parseInt(key, value);
    } else if (key == "smoothing_divisor") {
        detector.smoothing_divisor = parseInt(key, value);
    } else if (key == "region_extent_fraction") {
        detector.region_extent_fraction = parseDouble(key, value);
    } else if (key == "radius_epsilon") {
        detector.radius_epsilon = parseDouble(key, value);
    } else if (key == "tail_attachment_mode") {
        detector.tail_attachment_mode = parseTailAttachmentMode(value);
    } else if (key == "tail_attachment_ratio") {
        detector.tail_attachment_ratio = parseDouble(key, value);
    } else if (key == "detect_ears") {
        detector.detect_ears = parseBool(key, value);
    } else if (key == "head_radius_fraction") {
        detector.head_radius_fraction = parseDouble(key, value);
    } else if (key == "min_head_points") {
        detector.min_head_points = parseInt(key, value);
    } else if (key == "detect_whiskers") {
        detector.detect_whiskers = parseBool(key, value);
    } else if (key == "whisker_region_fraction") {
        detector.whisker_region_fraction = parseDouble(key, value);
    } else if (key == "min_whisker_points") {
        detector.min_whisker_points = parseInt(key, value);
    } else if (key == "whisker_neighborhood_fraction") {
        detector.whisker_neighborhood_fraction = parseDouble(key, value);
    } else if (key == "eye_center_ratio") {
        detector.eye_center_ratio = parseDouble(key, value);
    } else if (key == "verbose") {
        detector.verbose = parseBool(key, value);
    } else {
        return false;
    }
    return true;
}

PipelineConfig PipelineConfig::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + filepath);
    }

    PipelineConfig config;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty() || line[0] == '#') continue;  // Skip empty lines and comments

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key)) continue;  // Whitespace only
        if (!(iss >> value)) {
            throw std::runtime_error("Missing value for '" + key + "' in " + filepath +
                                     ":" + std::to_string(line_number));
        }

        if (!config.set(key, value)) {
            std::cerr << "Warning: Unknown config key '" << key << "' in " << filepath
                      << ":" << line_number << std::endl;
        }
    }

    file.close();
    config.validate();
    return config;
}

void PipelineConfig::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }

    file << "# Landmark detection and alignment configuration" << std::endl;
    file << "# Format: key value" << std::endl;
    file << std::endl;

    file << "scale_factor " << geometry.scale_factor << std::endl;
    file << "alignment_tolerance_degrees " << geometry.alignment_tolerance_degrees << std::endl;
    file << "nose_tail_axis " << toString(geometry.nose_tail_axis) << std::endl;
    file << "ear_alignment_axis " << toString(geometry.ear_alignment_axis) << std::endl;
    file << std::endl;

    file << "num_slices " << detector.num_slices << std::endl;
    file << "slice_overlap " << detector.slice_overlap << std::endl;
    file << "min_slice_points " << detector.min_slice_points << std::endl;
    file << "min_usable_slices " << detector.min_usable_slices << std::endl;
    file << "min_region_slices " << detector.min_region_slices << std::endl;
    file << "smoothing_divisor " << detector.smoothing_divisor << std::endl;
    file << "region_extent_fraction " << detector.region_extent_fraction << std::endl;
    file << "radius_epsilon " << detector.radius_epsilon << std::endl;
    file << "tail_attachment_mode " << toString(detector.tail_attachment_mode) << std::endl;
    file << "tail_attachment_ratio " << detector.tail_attachment_ratio << std::endl;
    file << "detect_ears " << (detector.detect_ears ? "true" : "false") << std::endl;
    file << "head_radius_fraction " << detector.head_radius_fraction << std::endl;
    file << "min_head_points " << detector.min_head_points << std::endl;
    file << "detect_whiskers " << (detector.detect_whiskers ? "true" : "false") << std::endl;
    file << "whisker_region_fraction " << detector.whisker_region_fraction << std::endl;
    file << "min_whisker_points " << detector.min_whisker_points << std::endl;
    file << "whisker_neighborhood_fraction " << detector.whisker_neighborhood_fraction << std::endl;
    file << "eye_center_ratio " << detector.eye_center_ratio << std::endl;
    file << "verbose " << (detector.verbose ? "true" : "false") << std::endl;

    file.close();
}

void PipelineConfig::validate() const {
    geometry.validate();
    detector.validate();
}

void PipelineConfig::printStats() const {
    std::cout << "Alignment: nose->tail onto " << toString(geometry.nose_tail_axis)
              << ", ears onto " << toString(geometry.ear_alignment_axis)
              << ", scale " << geometry.scale_factor
              << ", tolerance " << geometry.alignment_tolerance_degrees << " deg" << std::endl;
    std::cout << "Detector: " << detector.num_slices << " slices"
              << ", min " << detector.min_slice_points << " points/slice"
              << ", tail attachment " << toString(detector.tail_attachment_mode)
              << ", ears " << (detector.detect_ears ? "on" : "off")
              << ", whiskers " << (detector.detect_whiskers ? "on" : "off") << std::endl;
}

} // namespace isi_geometry
