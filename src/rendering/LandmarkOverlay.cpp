#include "rendering/LandmarkOverlay.h"
#include "geometry/GeometryErrors.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace isi_geometry {

static constexpr int OVERLAY_MARGIN = 40;

// BGR colors per landmark
static cv::Scalar landmarkColor(const std::string& name) {
    if (name == landmark_names::NOSE) return cv::Scalar(0, 0, 255);              // Red
    if (name == landmark_names::TAIL_TIP) return cv::Scalar(255, 0, 0);          // Blue
    if (name == landmark_names::TAIL_ATTACHMENT) return cv::Scalar(255, 255, 0); // Cyan
    if (name == landmark_names::LEFT_EAR) return cv::Scalar(0, 255, 0);          // Green
    if (name == landmark_names::RIGHT_EAR) return cv::Scalar(0, 165, 255);       // Orange
    if (name == landmark_names::LEFT_WHISKER ||
        name == landmark_names::RIGHT_WHISKER) return cv::Scalar(255, 255, 255); // White
    return cv::Scalar(255, 0, 255);                                              // Magenta
}

void LandmarkOverlay::initialize(const BoundingBox& bounds, int width, int height, Axis view_axis) {
    if (width <= 2 * OVERLAY_MARGIN || height <= 2 * OVERLAY_MARGIN) {
        throw InvalidParameter("Overlay size must exceed twice the margin (" +
                               std::to_string(OVERLAY_MARGIN) + " px)");
    }
    if (!(bounds.max_pt.array() >= bounds.min_pt.array()).all()) {
        throw InvalidParameter("Overlay bounds are empty");
    }

    switch (view_axis) {
        case Axis::X: u_axis_ = 1; v_axis_ = 2; break;
        case Axis::Y: u_axis_ = 0; v_axis_ = 2; break;
        case Axis::Z: u_axis_ = 0; v_axis_ = 1; break;
    }

    Eigen::Vector3d size = bounds.size();
    Eigen::Vector3d center = bounds.center();
    double extent_u = std::max(size(u_axis_), 1e-9);
    double extent_v = std::max(size(v_axis_), 1e-9);

    pixels_per_unit_ = std::min((width - 2 * OVERLAY_MARGIN) / extent_u,
                                (height - 2 * OVERLAY_MARGIN) / extent_v);
    center_ = Eigen::Vector2d(center(u_axis_), center(v_axis_));
    width_ = width;
    height_ = height;
    initialized_ = true;
}

cv::Point LandmarkOverlay::project(const Eigen::Vector3d& point) const {
    double u = width_ * 0.5 + (point(u_axis_) - center_.x()) * pixels_per_unit_;
    double v = height_ * 0.5 - (point(v_axis_) - center_.y()) * pixels_per_unit_;   // Image y points down
    return cv::Point(static_cast<int>(std::round(u)), static_cast<int>(std::round(v)));
}

cv::Mat LandmarkOverlay::render(const PointCloud& points, const LandmarkSet& landmarks) const {
    cv::Mat overlay(height_, width_, CV_8UC3, cv::Scalar(0, 0, 0));
    if (!initialized_) {
        return overlay;
    }

    const cv::Rect image_rect(0, 0, width_, height_);
    for (const auto& p : points) {
        cv::Point px = project(p);
        if (image_rect.contains(px)) {
            cv::circle(overlay, px, 1, cv::Scalar(160, 160, 160), -1);
        }
    }

    if (landmarks.has(landmark_names::NOSE) && landmarks.has(landmark_names::TAIL_TIP)) {
        cv::line(overlay,
                 project(landmarks.position(landmark_names::NOSE)),
                 project(landmarks.position(landmark_names::TAIL_TIP)),
                 cv::Scalar(255, 255, 255), 1);
    }

    for (const auto& entry : landmarks.getLandmarks()) {
        cv::Point px = project(entry.second.position);
        cv::Scalar color = landmarkColor(entry.first);
        // Filled marker for high confidence, ring for low
        int thickness = entry.second.confidence == LandmarkConfidence::High ? -1 : 2;
        cv::circle(overlay, px, 6, color, thickness);
        cv::putText(overlay, entry.first, px + cv::Point(8, -8),
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
    }

    return overlay;
}

bool saveLandmarkOverlay(const std::string& filepath,
                         const PointCloud& points,
                         const LandmarkSet& landmarks,
                         Axis view_axis,
                         int width, int height) {
    if (points.empty()) {
        std::cerr << "No points to render for overlay: " << filepath << std::endl;
        return false;
    }

    LandmarkOverlay renderer;
    renderer.initialize(computeBoundingBox(points), width, height, view_axis);
    cv::Mat image = renderer.render(points, landmarks);

    if (!cv::imwrite(filepath, image)) {
        std::cerr << "Failed to write overlay image: " << filepath << std::endl;
        return false;
    }
    return true;
}

} // namespace isi_geometry
