/**
 * Landmark Detection + Canonical Alignment Tool
 *
 * Main executable called by the rig setup scripts. Loads a scanned mouse
 * model, detects its landmarks, computes the transform into the canonical
 * frame and verifies it.
 *
 * Usage:
 *   build/bin/detect_landmarks --mesh <model.ply|obj|stl|xyz> [options]
 *
 * Exit codes:
 *   0  alignment within tolerance
 *   2  alignment computed but outside tolerance
 *   1  input or configuration error
 */

#include "alignment/AlignmentVerifier.h"
#include "alignment/TransformationCalculator.h"
#include "config/PipelineConfig.h"
#include "geometry/MeshGeometry.h"
#include "io/MeshIO.h"
#include "io/ResultWriter.h"
#include "landmarks/LandmarkDetector.h"
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace isi_geometry;

static constexpr int EXIT_INVALID_ALIGNMENT = 2;

static void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --mesh <path> [options]\n"
              << "\n"
              << "Required:\n"
              << "  --mesh <path>                Model file (.ply, .obj, .stl, .xyz)\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>              Configuration file (key value)\n"
              << "  --nose-tail-axis <x|y|z>     Target axis of the nose->tail direction\n"
              << "  --ear-axis <x|y|z>           Target axis of the left->right ear direction\n"
              << "  --scale <f>                  Uniform scale factor\n"
              << "  --tolerance <deg>            Accepted residual angle, in (0, 5]\n"
              << "  --slices <n>                 Number of density slices (>= 30)\n"
              << "  --no-ears                    Skip ear detection\n"
              << "  --no-whiskers                Skip whisker detection\n"
              << "  --no-dedup                   Keep duplicate vertices\n"
              << "  --output-json <path>         Write landmarks, metadata and alignment as JSON\n"
              << "  --output-landmarks <path>    Write landmarks as TXT (name x y z confidence)\n"
              << "  --output-aligned-ply <path>  Write the aligned model as PLY\n"
              << "  --verbose                    Print progress\n"
              << "  --help, -h                   Show this message\n";
}

int main(int argc, char* argv[]) {
    std::string mesh_path, config_path;
    std::string output_json, output_landmarks, output_aligned_ply;
    bool dedup = true;

    // Flag overrides are collected and applied after the config file
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--mesh" && i + 1 < argc) {
            mesh_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--nose-tail-axis" && i + 1 < argc) {
            overrides.emplace_back("nose_tail_axis", argv[++i]);
        } else if (arg == "--ear-axis" && i + 1 < argc) {
            overrides.emplace_back("ear_alignment_axis", argv[++i]);
        } else if (arg == "--scale" && i + 1 < argc) {
            overrides.emplace_back("scale_factor", argv[++i]);
        } else if (arg == "--tolerance" && i + 1 < argc) {
            overrides.emplace_back("alignment_tolerance_degrees", argv[++i]);
        } else if (arg == "--slices" && i + 1 < argc) {
            overrides.emplace_back("num_slices", argv[++i]);
        } else if (arg == "--no-ears") {
            overrides.emplace_back("detect_ears", "false");
        } else if (arg == "--no-whiskers") {
            overrides.emplace_back("detect_whiskers", "false");
        } else if (arg == "--no-dedup") {
            dedup = false;
        } else if (arg == "--output-json" && i + 1 < argc) {
            output_json = argv[++i];
        } else if (arg == "--output-landmarks" && i + 1 < argc) {
            output_landmarks = argv[++i];
        } else if (arg == "--output-aligned-ply" && i + 1 < argc) {
            output_aligned_ply = argv[++i];
        } else if (arg == "--verbose") {
            overrides.emplace_back("verbose", "true");
        } else {
            std::cerr << "Error: Unknown or incomplete argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (mesh_path.empty()) {
        std::cerr << "Error: --mesh is required" << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    try {
        PipelineConfig config;
        if (!config_path.empty()) {
            config = PipelineConfig::loadFromFile(config_path);
        }
        for (const auto& entry : overrides) {
            if (!config.set(entry.first, entry.second)) {
                std::cerr << "Error: Unknown setting: " << entry.first << std::endl;
                return 1;
            }
        }
        config.validate();

        const bool verbose = config.detector.verbose;
        if (verbose) {
            std::cout << "=== Landmark Detection ===" << std::endl;
            config.printStats();
            std::cout << "[1] Loading model: " << mesh_path << std::endl;
        }

        MeshData mesh;
        if (!loadMesh(mesh_path, mesh)) {
            std::cerr << "Error: Failed to load model: " << mesh_path << std::endl;
            return 1;
        }
        if (dedup) {
            size_t before = mesh.vertices.size();
            mesh = deduplicateVertices(mesh);
            if (verbose && before != mesh.vertices.size()) {
                std::cout << "    Merged " << (before - mesh.vertices.size())
                          << " duplicate vertices" << std::endl;
            }
        }
        if (verbose) {
            std::cout << "    Vertices: " << mesh.vertices.size()
                      << ", faces: " << mesh.faces.rows() << std::endl;
            std::cout << "[2] Principal axis analysis" << std::endl;
        }

        PrincipalAxisFrame frame = analyzeGeometry(mesh.vertices);
        if (verbose) {
            std::cout << "    Centroid: " << frame.centroid.transpose() << std::endl;
            std::cout << "    Primary axis: " << frame.primaryAxis().transpose()
                      << " (" << std::fixed << std::setprecision(1)
                      << 100.0 * frame.variance_ratios[0] << "% variance)" << std::endl;
            std::cout.unsetf(std::ios_base::floatfield);
            std::cout << "[3] Detecting landmarks" << std::endl;
        }

        LandmarkSet landmarks = detectLandmarks(mesh.vertices, frame, mesh.faces, config.detector);

        if (verbose) {
            std::cout << "[4] Computing canonical alignment" << std::endl;
        }
        Eigen::Matrix4d transform = computeAlignment(landmarks, config.geometry);
        AlignmentResult result = verifyAlignment(landmarks, transform, config.geometry);

        printKeyValues(std::cout, landmarks, &result);

        if (!output_json.empty()) {
            if (!saveResultJSON(output_json, landmarks, &result, config.geometry)) {
                std::cerr << "Error: Failed to write JSON: " << output_json << std::endl;
                return 1;
            }
            if (verbose) std::cout << "Saved results to: " << output_json << std::endl;
        }

        if (!output_landmarks.empty()) {
            if (!landmarks.saveToTXT(output_landmarks)) {
                std::cerr << "Error: Failed to write landmarks: " << output_landmarks << std::endl;
                return 1;
            }
            if (verbose) std::cout << "Saved landmarks to: " << output_landmarks << std::endl;
        }

        if (!output_aligned_ply.empty()) {
            MeshData aligned;
            aligned.vertices = applyTransform(transform, mesh.vertices);
            aligned.faces = mesh.faces;
            if (!saveMeshPLY(aligned, output_aligned_ply)) {
                std::cerr << "Error: Failed to write aligned model: " << output_aligned_ply << std::endl;
                return 1;
            }
            if (verbose) std::cout << "Saved aligned model to: " << output_aligned_ply << std::endl;
        }

        if (!result.is_valid) {
            std::cerr << "Warning: Alignment error " << result.overall_error
                      << " deg exceeds tolerance " << config.geometry.alignment_tolerance_degrees
                      << " deg" << std::endl;
            return EXIT_INVALID_ALIGNMENT;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
