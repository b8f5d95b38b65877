/**
 * Principal Axis Analysis Test
 *
 * Verifies analyzeGeometry on synthetic clouds:
 *   1) axes are orthonormal, right-handed and sorted by descending variance
 *   2) sign convention: largest component of axes[0] and axes[1] is positive
 *   3) repeated calls give identical output
 *   4) the primary axis follows the body in an arbitrary pose
 *   5) too few, non-finite, coincident and collinear inputs are rejected
 *   6) bounding box and projection helpers
 *   7) clouds measured in very small units
 *
 * Usage:
 *   build/bin/test_mesh_geometry
 */

#include "geometry/GeometryErrors.h"
#include "geometry/MeshGeometry.h"
#include "utils/SyntheticModels.h"
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using namespace isi_geometry;

static constexpr double EPS = 1e-6;

static PointCloud posedMouse() {
    Eigen::Matrix3d R = (Eigen::AngleAxisd(0.7, Eigen::Vector3d::UnitZ()) *
                         Eigen::AngleAxisd(0.3, Eigen::Vector3d::UnitX())).toRotationMatrix();
    return transformCloud(makeSyntheticMouse(), R, Eigen::Vector3d(1.0, 2.0, 3.0));
}

bool testOrthonormalAxes() {
    std::cout << "Test 1: Orthonormal, right-handed, descending axes..." << std::endl;

    PrincipalAxisFrame frame = analyzeGeometry(posedMouse());

    for (int i = 0; i < 3; ++i) {
        if (std::abs(frame.axes[i].norm() - 1.0) > EPS) {
            std::cerr << "  FAIL: |axes[" << i << "]| = " << frame.axes[i].norm() << std::endl;
            return false;
        }
        for (int j = i + 1; j < 3; ++j) {
            double dot = frame.axes[i].dot(frame.axes[j]);
            if (std::abs(dot) > EPS) {
                std::cerr << "  FAIL: axes[" << i << "] . axes[" << j << "] = " << dot << std::endl;
                return false;
            }
        }
    }

    if ((frame.axes[0].cross(frame.axes[1]) - frame.axes[2]).norm() > EPS) {
        std::cerr << "  FAIL: axes[2] != axes[0] x axes[1]" << std::endl;
        return false;
    }

    if (frame.variances[0] < frame.variances[1] || frame.variances[1] < frame.variances[2]) {
        std::cerr << "  FAIL: Variances not descending: " << frame.variances[0] << ", "
                  << frame.variances[1] << ", " << frame.variances[2] << std::endl;
        return false;
    }

    double ratio_sum = frame.variance_ratios[0] + frame.variance_ratios[1] + frame.variance_ratios[2];
    if (std::abs(ratio_sum - 1.0) > EPS) {
        std::cerr << "  FAIL: Variance ratios sum to " << ratio_sum << std::endl;
        return false;
    }

    std::cout << "  PASS: Frame is orthonormal and ordered" << std::endl;
    return true;
}

bool testSignConvention() {
    std::cout << "Test 2: Sign convention..." << std::endl;

    // Same cloud mirrored through the centroid has the same axis lines
    PointCloud cloud = posedMouse();
    PointCloud mirrored;
    for (const auto& p : cloud) {
        mirrored.push_back(-p);
    }

    PrincipalAxisFrame a = analyzeGeometry(cloud);
    PrincipalAxisFrame b = analyzeGeometry(mirrored);

    for (int i = 0; i < 2; ++i) {
        Eigen::Index largest = 0;
        a.axes[i].cwiseAbs().maxCoeff(&largest);
        if (a.axes[i](largest) <= 0.0) {
            std::cerr << "  FAIL: Largest component of axes[" << i << "] is not positive" << std::endl;
            return false;
        }
    }

    if ((a.axes[0] - b.axes[0]).norm() > EPS) {
        std::cerr << "  FAIL: Primary axis sign depends on point signs: ("
                  << a.axes[0].transpose() << ") vs (" << b.axes[0].transpose() << ")" << std::endl;
        return false;
    }

    std::cout << "  PASS: Signs are deterministic" << std::endl;
    return true;
}

bool testDeterminism() {
    std::cout << "Test 3: Repeated calls..." << std::endl;

    PointCloud cloud = posedMouse();
    PrincipalAxisFrame a = analyzeGeometry(cloud);
    PrincipalAxisFrame b = analyzeGeometry(cloud);

    for (int i = 0; i < 3; ++i) {
        if (a.axes[i] != b.axes[i] || a.variances[i] != b.variances[i]) {
            std::cerr << "  FAIL: Output differs between calls" << std::endl;
            return false;
        }
    }
    if (a.centroid != b.centroid) {
        std::cerr << "  FAIL: Centroid differs between calls" << std::endl;
        return false;
    }

    std::cout << "  PASS: Identical output" << std::endl;
    return true;
}

bool testPrimaryAxisFollowsBody() {
    std::cout << "Test 4: Primary axis in arbitrary pose..." << std::endl;

    Eigen::Matrix3d R = (Eigen::AngleAxisd(0.7, Eigen::Vector3d::UnitZ()) *
                         Eigen::AngleAxisd(0.3, Eigen::Vector3d::UnitX())).toRotationMatrix();
    Eigen::Vector3d body_direction = R * Eigen::Vector3d::UnitX();

    PrincipalAxisFrame frame = analyzeGeometry(posedMouse());
    double alignment = std::abs(frame.primaryAxis().dot(body_direction));

    if (alignment < 1.0 - 1e-9) {
        std::cerr << "  FAIL: |axes[0] . body| = " << alignment << std::endl;
        return false;
    }

    std::cout << "  PASS: axes[0] parallel to the body (|cos| = " << alignment << ")" << std::endl;
    return true;
}

static bool expectDegenerate(const PointCloud& points, const std::string& label) {
    try {
        analyzeGeometry(points);
    } catch (const DegenerateGeometry& e) {
        std::cout << "  " << label << ": rejected (" << e.what() << ")" << std::endl;
        return true;
    }
    std::cerr << "  FAIL: " << label << " was accepted" << std::endl;
    return false;
}

bool testDegenerateInput() {
    std::cout << "Test 5: Degenerate input..." << std::endl;

    bool ok = true;

    PointCloud three = {Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(1, 0, 0), Eigen::Vector3d(0, 1, 0)};
    ok &= expectDegenerate(three, "3 points");

    PointCloud coincident(10, Eigen::Vector3d(2.0, -1.0, 0.5));
    ok &= expectDegenerate(coincident, "Coincident points");

    PointCloud collinear;
    for (int i = 0; i < 20; ++i) {
        collinear.emplace_back(0.5 * i, -0.25 * i, 2.0 * i);
    }
    ok &= expectDegenerate(collinear, "Collinear points");

    PointCloud with_nan = makeSyntheticMouse();
    with_nan[5].y() = std::numeric_limits<double>::quiet_NaN();
    ok &= expectDegenerate(with_nan, "NaN coordinate");

    PointCloud with_inf = makeSyntheticMouse();
    with_inf[7].z() = std::numeric_limits<double>::infinity();
    ok &= expectDegenerate(with_inf, "Infinite coordinate");

    // Planar input is not degenerate
    PointCloud planar = {Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(4, 0, 0),
                         Eigen::Vector3d(0, 1, 0), Eigen::Vector3d(4, 1, 0)};
    try {
        PrincipalAxisFrame frame = analyzeGeometry(planar);
        if (std::abs(std::abs(frame.primaryAxis().x()) - 1.0) > EPS) {
            std::cerr << "  FAIL: Planar primary axis = (" << frame.primaryAxis().transpose() << ")" << std::endl;
            ok = false;
        }
    } catch (const DegenerateGeometry& e) {
        std::cerr << "  FAIL: Planar input rejected: " << e.what() << std::endl;
        ok = false;
    }

    if (ok) {
        std::cout << "  PASS: Degenerate inputs rejected" << std::endl;
    }
    return ok;
}

bool testHelpers() {
    std::cout << "Test 6: Bounding box and projections..." << std::endl;

    PointCloud cloud = makeSyntheticMouse();
    BoundingBox box = computeBoundingBox(cloud);

    if ((box.min_pt - Eigen::Vector3d(-10.0, -3.0, -3.0)).norm() > EPS ||
        (box.max_pt - Eigen::Vector3d(10.0, 3.0, 3.0)).norm() > EPS) {
        std::cerr << "  FAIL: Bounding box (" << box.min_pt.transpose() << ") - ("
                  << box.max_pt.transpose() << ")" << std::endl;
        return false;
    }

    std::vector<double> proj = projectOntoAxis({Eigen::Vector3d(3, 4, 5)}, Eigen::Vector3d(1, 0, 0),
                                               Eigen::Vector3d(1, 0, 0));
    if (proj.size() != 1 || std::abs(proj[0] - 2.0) > EPS) {
        std::cerr << "  FAIL: projectOntoAxis" << std::endl;
        return false;
    }

    double d = distanceToAxis(Eigen::Vector3d(7, 3, 4), Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(1, 0, 0));
    if (std::abs(d - 5.0) > EPS) {
        std::cerr << "  FAIL: distanceToAxis = " << d << std::endl;
        return false;
    }

    std::cout << "  PASS: Helpers correct" << std::endl;
    return true;
}

bool testSmallExtent() {
    std::cout << "Test 7: Micrometre-sized clouds..." << std::endl;

    bool ok = true;
    PointCloud tiny = transformCloud(makeSyntheticMouse(), 1e-7 * Eigen::Matrix3d::Identity(),
                                     Eigen::Vector3d::Zero());
    PointCloud offset = transformCloud(tiny, Eigen::Matrix3d::Identity(), Eigen::Vector3d(0.5, -0.25, 0.0));

    for (const PointCloud* cloud : {&tiny, &offset}) {
        std::string label = cloud == &tiny ? "At origin" : "Offset";
        try {
            PrincipalAxisFrame frame = analyzeGeometry(*cloud);
            if (std::abs(std::abs(frame.primaryAxis().x()) - 1.0) > 1e-4) {
                std::cerr << "  FAIL (" << label << "): primary axis = ("
                          << frame.primaryAxis().transpose() << ")" << std::endl;
                ok = false;
            }
        } catch (const DegenerateGeometry& e) {
            std::cerr << "  FAIL (" << label << "): rejected: " << e.what() << std::endl;
            ok = false;
        }
    }

    // Identical points far from the origin are still one point
    PointCloud far_coincident(10, Eigen::Vector3d(1000.0, 2000.0, -500.0));
    ok &= expectDegenerate(far_coincident, "Coincident points far from origin");

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

int main() {
    std::cout << "=== Mesh Geometry Test ===" << std::endl << std::endl;

    bool test1 = testOrthonormalAxes();
    bool test2 = testSignConvention();
    bool test3 = testDeterminism();
    bool test4 = testPrimaryAxisFollowsBody();
    bool test5 = testDegenerateInput();
    bool test6 = testHelpers();
    bool test7 = testSmallExtent();

    std::cout << std::endl << "=== Test Summary ===" << std::endl;
    std::cout << "Test 1 (Orthonormal axes): " << (test1 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 2 (Sign convention): " << (test2 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 3 (Determinism): " << (test3 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 4 (Primary axis): " << (test4 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 5 (Degenerate input): " << (test5 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 6 (Helpers): " << (test6 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 7 (Small extent): " << (test7 ? "PASS" : "FAIL") << std::endl;

    if (test1 && test2 && test3 && test4 && test5 && test6 && test7) {
        std::cout << "All tests PASSED!" << std::endl;
        return 0;
    }
    std::cerr << "Some tests FAILED!" << std::endl;
    return 1;
}
