#include "utils/SyntheticModels.h"
#include <cmath>

namespace isi_geometry {

static constexpr double PI = 3.14159265358979323846;

static void appendRing(PointCloud& points, double x, double radius, int count) {
    for (int k = 0; k < count; ++k) {
        double angle = 2.0 * PI * k / count;
        points.emplace_back(x, radius * std::cos(angle), radius * std::sin(angle));
    }
}

PointCloud makeSyntheticMouse(const SyntheticMouseOptions& options) {
    PointCloud points;

    int num_stations = static_cast<int>(std::round(2.0 * options.half_length / options.station_spacing));
    for (int i = 0; i <= num_stations; ++i) {
        double x = -options.half_length + i * options.station_spacing;
        points.emplace_back(x, 0.0, 0.0);

        // Single on-axis point at the tail tip and the nose
        if (i == 0 || i == num_stations) continue;

        double radius = options.body_radius;
        if (x < options.tail_end) {
            radius = options.tail_radius;
        } else if (x > options.head_start) {
            double t = (x - options.head_start) / (options.half_length - options.head_start);
            radius = options.head_base_radius + (options.head_tip_radius - options.head_base_radius) * t;
        }
        appendRing(points, x, radius, options.ring_points);
    }

    if (options.with_ears) {
        // Small cross-shaped cluster per ear; the outermost point is unique
        const double d = 0.2;
        const double offsets[6][3] = {
            {0.0, 0.0, 0.0}, {0.0, d, 0.0}, {-d, 0.0, 0.0},
            {d, 0.0, 0.0}, {0.0, 0.0, d}, {0.0, 0.0, -d}
        };
        for (double side : {-1.0, 1.0}) {
            for (const auto& o : offsets) {
                points.emplace_back(options.ear_x + o[0],
                                    side * (options.ear_offset + o[1]),
                                    o[2]);
            }
        }
    }

    if (options.with_whiskers) {
        // Straight spike along y from the head surface out to the tip
        const double step = 0.2;
        for (double side : {-1.0, 1.0}) {
            for (double y = options.whisker_length; y > options.head_tip_radius; y -= step) {
                points.emplace_back(options.whisker_x, side * y, 0.0);
            }
        }
    }

    return points;
}

PointCloud makeDumbbell() {
    const double sphere_radius = 2.0;
    const double sphere_center = 6.0;
    const int latitudes = 12;
    const int longitudes = 16;

    PointCloud points;
    for (double side : {-1.0, 1.0}) {
        Eigen::Vector3d center(side * sphere_center, 0.0, 0.0);
        points.push_back(center + Eigen::Vector3d(sphere_radius, 0.0, 0.0));
        points.push_back(center - Eigen::Vector3d(sphere_radius, 0.0, 0.0));
        for (int j = 1; j < latitudes; ++j) {
            double polar = PI * j / latitudes;
            double x = sphere_radius * std::cos(polar);
            double r = sphere_radius * std::sin(polar);
            for (int k = 0; k < longitudes; ++k) {
                double angle = 2.0 * PI * k / longitudes;
                points.push_back(center + Eigen::Vector3d(x, r * std::cos(angle), r * std::sin(angle)));
            }
        }
    }

    // Rod between the spheres
    for (double x = -4.0; x <= 4.0 + 1e-9; x += 0.25) {
        appendRing(points, x, 0.2, 8);
    }

    return points;
}

PointCloud reflectAlongAxis(const PointCloud& points, Axis axis) {
    int component = static_cast<int>(axis);
    PointCloud reflected = points;
    for (auto& p : reflected) {
        p(component) = -p(component);
    }
    return reflected;
}

PointCloud transformCloud(const PointCloud& points,
                          const Eigen::Matrix3d& rotation,
                          const Eigen::Vector3d& translation) {
    PointCloud transformed;
    transformed.reserve(points.size());
    for (const auto& p : points) {
        transformed.push_back(rotation * p + translation);
    }
    return transformed;
}

} // namespace isi_geometry
