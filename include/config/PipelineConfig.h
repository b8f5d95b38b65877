#pragma once

#include "alignment/GeometryParameters.h"
#include "landmarks/DetectorConfig.h"
#include <string>

namespace isi_geometry {

/**
 * Complete configuration of the detection + alignment pipeline
 */
struct PipelineConfig {
    GeometryParameters geometry;
    DetectorConfig detector;

    /**
     * Load configuration from file
     * Format: key value
     * One pair per line, '#' starts a comment line
     *
     * Example:
     *   scale_factor 8.0
     *   nose_tail_axis z
     *   num_slices 40
     *
     * Keys that are not present keep their defaults. The loaded
     * configuration is validated before it is returned.
     *
     * @throws std::runtime_error if the file cannot be read or a value cannot be parsed
     * @throws InvalidParameter if a value is out of range
     */
    static PipelineConfig loadFromFile(const std::string& filepath);

    /**
     * Save configuration to file (all keys)
     * @throws std::runtime_error if the file cannot be written
     */
    void saveToFile(const std::string& filepath) const;

    /**
     * Apply a single key/value pair
     * @return false if the key is unknown
     * @throws std::runtime_error if the value cannot be parsed
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * Validate both parameter groups
     * @throws InvalidParameter
     */
    void validate() const;

    /**
     * Print configuration
     */
    void printStats() const;
};

} // namespace isi_geometry
