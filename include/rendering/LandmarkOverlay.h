#pragma once

#include <Eigen/Dense>
#include <opencv2/opencv.hpp>
#include "alignment/GeometryParameters.h"
#include "geometry/MeshGeometry.h"
#include "landmarks/LandmarkSet.h"
#include <string>

namespace isi_geometry {

/**
 * Orthographic overlay of a point cloud and its landmarks.
 *
 * The view looks along one world axis; the remaining two axes span the
 * image (first one to the right, second one up). The cloud's bounding box
 * is fitted into the image with a fixed margin.
 */
class LandmarkOverlay {
public:
    LandmarkOverlay() = default;

    /**
     * Fit the view to a bounding box
     * @throws InvalidParameter for a non-positive image size or an empty box
     */
    void initialize(const BoundingBox& bounds, int width, int height, Axis view_axis = Axis::Z);

    /**
     * Draw the cloud (gray), the nose->tail line and every landmark with its name
     */
    cv::Mat render(const PointCloud& points, const LandmarkSet& landmarks) const;

    /**
     * Pixel position of a 3D point
     */
    cv::Point project(const Eigen::Vector3d& point) const;

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

    bool isInitialized() const { return initialized_; }

private:
    int width_ = 0;
    int height_ = 0;
    int u_axis_ = 0;        // World component drawn horizontally
    int v_axis_ = 1;        // World component drawn vertically
    double pixels_per_unit_ = 1.0;
    Eigen::Vector2d center_ = Eigen::Vector2d::Zero();
    bool initialized_ = false;
};

/**
 * Render the overlay and write it as an image (format from the extension)
 * @return false if the cloud is empty or the image cannot be written
 */
bool saveLandmarkOverlay(const std::string& filepath,
                         const PointCloud& points,
                         const LandmarkSet& landmarks,
                         Axis view_axis = Axis::Z,
                         int width = 800, int height = 600);

} // namespace isi_geometry
