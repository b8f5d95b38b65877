/**
 * Result Export Test
 *
 * Checks the JSON, key=value and landmark TXT output consumed by the acquisition scripts:
 *   1) landmark and matrix encoding
 *   2) alignment errors ("ear" is null without ears)
 *   3) full report file, stdout lines and landmark TXT
 *
 * Usage:
 *   build/bin/test_result_writer
 */

#include "io/ResultWriter.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace isi_geometry;

static bool expectContains(const std::string& text, const std::string& fragment) {
    if (text.find(fragment) == std::string::npos) {
        std::cerr << "  FAIL: Missing '" << fragment << "' in:\n" << text << std::endl;
        return false;
    }
    return true;
}

static LandmarkSet makeLandmarks() {
    LandmarkSet landmarks;
    landmarks.set(landmark_names::NOSE, Eigen::Vector3d(1.0, 2.0, 3.0));
    landmarks.set(landmark_names::TAIL_TIP, Eigen::Vector3d(-1.5, 0.0, 0.25));
    landmarks.metadata().method = DetectionMethod::DensityAnalysis;
    landmarks.metadata().confidence = LandmarkConfidence::High;
    landmarks.metadata().vertex_count = 1029;
    landmarks.metadata().warnings.push_back("Ear detection: only 4 \"head\" vertices");
    return landmarks;
}

bool testEncoding() {
    std::cout << "Test 1: Landmark and matrix encoding..." << std::endl;

    std::string json = landmarksToJSON(makeLandmarks());
    bool ok = expectContains(json, "\"nose\": [1.000000, 2.000000, 3.000000]");
    ok &= expectContains(json, "\"tail_tip\": [-1.500000, 0.000000, 0.250000]");

    std::string matrix = matrixToJSON(Eigen::Matrix4d::Identity());
    ok &= expectContains(matrix, "[[1.000000000, 0.000000000, 0.000000000, 0.000000000], [0.000000000, 1.000000000");

    std::string meta = metadataToJSON(makeLandmarks());
    ok &= expectContains(meta, "\"method\": \"density_analysis\"");
    ok &= expectContains(meta, "\"vertex_count\": 1029");
    ok &= expectContains(meta, "\"landmarks_detected\": 2");
    ok &= expectContains(meta, "only 4 \\\"head\\\" vertices");

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

bool testAlignment() {
    std::cout << "Test 2: Alignment errors..." << std::endl;

    AlignmentResult result;
    result.nose_tail_error = 0.125;
    result.overall_error = 0.125;
    result.is_valid = true;

    GeometryParameters params;
    std::string json = alignmentToJSON(result, params);
    bool ok = expectContains(json, "\"nose_tail\": 0.125000, \"ear\": null");
    ok &= expectContains(json, "\"is_valid\": true");
    ok &= expectContains(json, "\"nose_tail_axis\": \"z\"");

    result.ear_error = 0.5;
    result.overall_error = 0.5;
    result.is_valid = false;
    json = alignmentToJSON(result, params);
    ok &= expectContains(json, "\"ear\": 0.500000, \"overall\": 0.500000");
    ok &= expectContains(json, "\"is_valid\": false");

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

bool testReport() {
    std::cout << "Test 3: Report file and stdout lines..." << std::endl;

    const std::string path = "test_result_writer.json";
    LandmarkSet landmarks = makeLandmarks();
    AlignmentResult result;
    result.is_valid = true;

    bool ok = saveResultJSON(path, landmarks, &result, GeometryParameters());
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();
    std::remove(path.c_str());

    std::string text = buffer.str();
    if (!ok || text.empty() || text[0] != '{') {
        std::cerr << "  FAIL: Report not written" << std::endl;
        return false;
    }
    ok &= expectContains(text, "\"landmarks\": {");
    ok &= expectContains(text, "\"metadata\": {");
    ok &= expectContains(text, "\"alignment\": {");

    std::ostringstream out;
    printKeyValues(out, landmarks, &result);
    ok &= expectContains(out.str(), "method=density_analysis\n");
    ok &= expectContains(out.str(), "nose=1.000000,2.000000,3.000000\n");
    ok &= expectContains(out.str(), "is_valid=true\n");
    if (out.str().find("ear_error=") != std::string::npos) {
        std::cerr << "  FAIL: ear_error printed without ears" << std::endl;
        ok = false;
    }

    // Landmark TXT keeps names, positions and confidence
    const std::string txt_path = "test_result_writer.txt";
    landmarks.set(landmark_names::LEFT_EAR, Eigen::Vector3d(0.5, -1.0, 0.0), LandmarkConfidence::Low);
    LandmarkSet reloaded;
    bool txt_ok = landmarks.saveToTXT(txt_path) && reloaded.loadFromTXT(txt_path);
    std::remove(txt_path.c_str());
    if (!txt_ok || reloaded.size() != 3 ||
        (reloaded.position(landmark_names::TAIL_TIP) - Eigen::Vector3d(-1.5, 0.0, 0.25)).norm() > 1e-6 ||
        reloaded.confidence(landmark_names::LEFT_EAR) != LandmarkConfidence::Low ||
        reloaded.confidence(landmark_names::NOSE) != LandmarkConfidence::High) {
        std::cerr << "  FAIL: Landmark TXT did not reload" << std::endl;
        ok = false;
    }

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

int main() {
    std::cout << "=== Result Writer Test ===" << std::endl << std::endl;

    bool test1 = testEncoding();
    bool test2 = testAlignment();
    bool test3 = testReport();

    std::cout << std::endl << "=== Test Summary ===" << std::endl;
    std::cout << "Test 1 (Encoding): " << (test1 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 2 (Alignment errors): " << (test2 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 3 (Report): " << (test3 ? "PASS" : "FAIL") << std::endl;

    if (test1 && test2 && test3) {
        std::cout << "All tests PASSED!" << std::endl;
        return 0;
    }
    std::cerr << "Some tests FAILED!" << std::endl;
    return 1;
}
