#pragma once

#include "alignment/AlignmentVerifier.h"
#include "alignment/GeometryParameters.h"
#include "landmarks/LandmarkSet.h"
#include <Eigen/Dense>
#include <ostream>
#include <string>

namespace isi_geometry {

/**
 * JSON object mapping landmark name -> [x, y, z]
 */
std::string landmarksToJSON(const LandmarkSet& landmarks, int indent = 0);

/**
 * JSON nested array of a 4x4 matrix (row major)
 */
std::string matrixToJSON(const Eigen::Matrix4d& matrix);

/**
 * JSON object of the detection metadata
 * (method, confidence, centroid, principal axes, vertex count, ...)
 */
std::string metadataToJSON(const LandmarkSet& landmarks, int indent = 0);

/**
 * JSON object of an alignment result; "ear" is null when no ear error exists
 */
std::string alignmentToJSON(const AlignmentResult& result,
                            const GeometryParameters& params,
                            int indent = 0);

/**
 * Write a complete report (landmarks, metadata and, if given, alignment)
 * @param alignment May be null when no alignment was computed
 * @return false if the file cannot be written
 */
bool saveResultJSON(const std::string& filepath,
                    const LandmarkSet& landmarks,
                    const AlignmentResult* alignment,
                    const GeometryParameters& params);

/**
 * key=value lines for scripts that parse stdout
 */
void printKeyValues(std::ostream& out, const LandmarkSet& landmarks, const AlignmentResult* alignment);

} // namespace isi_geometry
