#include "landmarks/LandmarkSet.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace isi_geometry {

const char* toString(LandmarkConfidence confidence) {
    switch (confidence) {
        case LandmarkConfidence::High: return "high";
        case LandmarkConfidence::Low:  return "low";
    }
    return "low";
}

const char* toString(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::DensityAnalysis: return "density_analysis";
        case DetectionMethod::GlobalExtremes:  return "global_extremes";
    }
    return "global_extremes";
}

const Eigen::Vector3d& LandmarkSet::position(const std::string& name) const {
    auto it = landmarks_.find(name);
    if (it == landmarks_.end()) {
        throw std::out_of_range("Landmark not found: " + name);
    }
    return it->second.position;
}

LandmarkConfidence LandmarkSet::confidence(const std::string& name) const {
    auto it = landmarks_.find(name);
    if (it == landmarks_.end()) {
        throw std::out_of_range("Landmark not found: " + name);
    }
    return it->second.confidence;
}

Eigen::Vector3d LandmarkSet::noseToTail() const {
    return position(landmark_names::TAIL_TIP) - position(landmark_names::NOSE);
}

Eigen::Vector3d LandmarkSet::leftToRightEar() const {
    return position(landmark_names::RIGHT_EAR) - position(landmark_names::LEFT_EAR);
}

std::vector<std::string> LandmarkSet::names() const {
    std::vector<std::string> result;
    result.reserve(landmarks_.size());
    for (const auto& pair : landmarks_) {
        result.push_back(pair.first);
    }
    return result;
}

bool LandmarkSet::loadFromTXT(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open landmark file: " << filepath << std::endl;
        return false;
    }

    landmarks_.clear();
    std::string line;

    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;  // Skip empty lines and comments

        std::istringstream iss(line);
        std::string name;
        double x, y, z;

        iss >> name >> x >> y >> z;
        if (iss.fail()) {
            std::cerr << "Warning: Skipping malformed landmark line: " << line << std::endl;
            continue;
        }

        std::string level;
        LandmarkConfidence confidence = LandmarkConfidence::High;
        if (iss >> level && level == "low") {
            confidence = LandmarkConfidence::Low;
        }
        landmarks_[name] = Landmark3D(Eigen::Vector3d(x, y, z), confidence);
    }

    file.close();
    return !landmarks_.empty();
}

bool LandmarkSet::saveToTXT(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << "# name x y z confidence" << std::endl;
    for (const auto& pair : landmarks_) {
        const Eigen::Vector3d& p = pair.second.position;
        file << std::fixed << std::setprecision(6)
             << pair.first << " " << p.x() << " " << p.y() << " " << p.z() << " "
             << toString(pair.second.confidence) << std::endl;
    }

    file.close();
    return true;
}

} // namespace isi_geometry
