/**
 * Component Demonstration Tool
 *
 * Runs each library component on a synthetic mouse model and prints the
 * intermediate results. Useful for understanding each component in isolation.
 *
 * Usage:
 *   build/bin/isi_geometry_demo [--verbose]
 *
 * Note: This is a demo/example tool, not part of the rig pipeline.
 */

#include "alignment/AlignmentVerifier.h"
#include "alignment/TransformationCalculator.h"
#include "geometry/GeometryErrors.h"
#include "geometry/MeshGeometry.h"
#include "landmarks/LandmarkDetector.h"
#include "utils/SyntheticModels.h"
#include <cmath>
#include <iostream>
#include <string>

using namespace isi_geometry;

static void printLandmarks(const LandmarkSet& landmarks) {
    for (const auto& entry : landmarks.getLandmarks()) {
        std::cout << "  " << entry.first << ": (" << entry.second.position.transpose() << ")  ["
                  << toString(entry.second.confidence) << "]" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    bool verbose = argc > 1 && std::string(argv[1]) == "--verbose";

    std::cout << "=== ISI Geometry - Component Demo ===" << std::endl;

    // Example 1: Synthetic model in an arbitrary pose
    std::cout << "\n[1] Building synthetic mouse..." << std::endl;
    SyntheticMouseOptions options;
    options.with_ears = true;
    Eigen::Matrix3d pose = (Eigen::AngleAxisd(0.6, Eigen::Vector3d::UnitZ()) *
                            Eigen::AngleAxisd(-0.4, Eigen::Vector3d::UnitY())).toRotationMatrix();
    PointCloud cloud = transformCloud(makeSyntheticMouse(options), pose, Eigen::Vector3d(5.0, -2.0, 1.0));
    std::cout << "Points: " << cloud.size() << std::endl;

    try {
        // Example 2: Principal axes
        std::cout << "\n[2] Testing Mesh Geometry Analysis..." << std::endl;
        PrincipalAxisFrame frame = analyzeGeometry(cloud);
        std::cout << "Centroid: (" << frame.centroid.transpose() << ")" << std::endl;
        for (int i = 0; i < 3; ++i) {
            std::cout << "Axis " << i << ": (" << frame.axes[i].transpose() << "), variance "
                      << frame.variances[i] << " (" << 100.0 * frame.variance_ratios[i] << "%)" << std::endl;
        }

        // Example 3: Landmarks
        std::cout << "\n[3] Testing Landmark Detection..." << std::endl;
        DetectorConfig detector;
        detector.verbose = verbose;
        LandmarkSet landmarks = detectLandmarks(cloud, frame, Eigen::MatrixXi(), detector);
        std::cout << "Method: " << toString(landmarks.metadata().method)
                  << ", slices: " << landmarks.metadata().slices_analyzed << std::endl;
        printLandmarks(landmarks);

        // Example 4: Rodrigues rotation
        std::cout << "\n[4] Testing Rotation Between Vectors..." << std::endl;
        Eigen::Matrix4d R = rotationBetween(Eigen::Vector3d(1, 0, 0), Eigen::Vector3d(0, 0, 1));
        std::cout << "(1,0,0) -> (0,0,1):\n" << R << std::endl;

        // Example 5: Canonical alignment
        std::cout << "\n[5] Testing Canonical Alignment..." << std::endl;
        GeometryParameters params;
        Eigen::Matrix4d transform = computeAlignment(landmarks, params);
        std::cout << "Transformation matrix:\n" << transform << std::endl;

        LandmarkSet aligned = transformLandmarks(landmarks, transform);
        std::cout << "Aligned landmarks:" << std::endl;
        printLandmarks(aligned);

        // Example 6: Verification
        std::cout << "\n[6] Testing Alignment Verification..." << std::endl;
        AlignmentResult result = verifyAlignment(landmarks, transform, params);
        std::cout << "Nose-tail error: " << result.nose_tail_error << " deg" << std::endl;
        if (result.ear_error) {
            std::cout << "Ear error: " << *result.ear_error << " deg" << std::endl;
        }
        std::cout << "Overall: " << result.overall_error << " deg, "
                  << (result.is_valid ? "VALID" : "INVALID") << std::endl;

        // Example 7: Degenerate input
        std::cout << "\n[7] Testing Degenerate Input..." << std::endl;
        PointCloud line;
        for (int i = 0; i < 10; ++i) {
            line.emplace_back(i, 2.0 * i, 0.0);
        }
        try {
            analyzeGeometry(line);
            std::cout << "Unexpected: collinear points accepted" << std::endl;
        } catch (const DegenerateGeometry& e) {
            std::cout << "Rejected as expected: " << e.what() << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== Demo completed ===" << std::endl;

    return 0;
}
