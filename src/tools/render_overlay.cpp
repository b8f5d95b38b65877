/**
 * Landmark Overlay Tool
 *
 * Renders a model and its detected landmarks into an orthographic PNG for
 * visual inspection of detect_landmarks output.
 *
 * Usage:
 *   build/bin/render_overlay --mesh <model> --landmarks <landmarks.txt> \
 *                            --output <overlay.png> [--view x|y|z] [--width <px>] [--height <px>]
 */

#include "alignment/GeometryParameters.h"
#include "io/MeshIO.h"
#include "landmarks/LandmarkSet.h"
#include "rendering/LandmarkOverlay.h"
#include <exception>
#include <iostream>
#include <string>

using namespace isi_geometry;

static void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name
              << " --mesh <path> --landmarks <path> --output <png> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --view <x|y|z>    Viewing direction (default: z)\n"
              << "  --width <px>      Image width (default: 800)\n"
              << "  --height <px>     Image height (default: 600)\n";
}

int main(int argc, char* argv[]) {
    std::string mesh_path, landmarks_path, output_path;
    std::string view = "z";
    int width = 800;
    int height = 600;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--mesh" && i + 1 < argc) {
                mesh_path = argv[++i];
            } else if (arg == "--landmarks" && i + 1 < argc) {
                landmarks_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--view" && i + 1 < argc) {
                view = argv[++i];
            } else if (arg == "--width" && i + 1 < argc) {
                width = std::stoi(argv[++i]);
            } else if (arg == "--height" && i + 1 < argc) {
                height = std::stoi(argv[++i]);
            } else {
                std::cerr << "Error: Unknown or incomplete argument: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        if (mesh_path.empty() || landmarks_path.empty() || output_path.empty()) {
            std::cerr << "Error: --mesh, --landmarks and --output are required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        MeshData mesh;
        if (!loadMesh(mesh_path, mesh)) {
            std::cerr << "Error: Failed to load model: " << mesh_path << std::endl;
            return 1;
        }

        LandmarkSet landmarks;
        if (!landmarks.loadFromTXT(landmarks_path)) {
            std::cerr << "Error: Failed to load landmarks: " << landmarks_path << std::endl;
            return 1;
        }

        if (!saveLandmarkOverlay(output_path, mesh.vertices, landmarks, parseAxis(view), width, height)) {
            return 1;
        }
        std::cout << "Overlay saved to: " << output_path << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
