/**
 * Mesh I/O Test
 *
 * Writes small models in each supported format and loads them back:
 *   1) ASCII PLY with extra properties and a quad face
 *   2) OBJ with texture/normal references and negative indices
 *   3) ASCII and binary STL
 *   4) XYZ point list (spaces, commas, comments)
 *   5) vertex deduplication
 *   6) PLY writers and unreadable input
 *   7) face indices outside the vertex list
 *
 * Usage:
 *   build/bin/test_mesh_io
 */

#include "geometry/GeometryErrors.h"
#include "io/MeshIO.h"
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace isi_geometry;

static std::vector<std::string> created_files;

static std::string writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    file << content;
    created_files.push_back(path);
    return path;
}

static bool expectVertex(const MeshData& mesh, size_t index, const Eigen::Vector3d& expected) {
    if (index >= mesh.vertices.size() || (mesh.vertices[index] - expected).norm() > 1e-6) {
        std::cerr << "  FAIL: Vertex " << index << " differs from (" << expected.transpose() << ")" << std::endl;
        return false;
    }
    return true;
}

bool testPLY() {
    std::cout << "Test 1: ASCII PLY..." << std::endl;

    std::string path = writeFile("test_mesh_io.ply",
        "ply\n"
        "format ascii 1.0\n"
        "comment exported by scanner\n"
        "element vertex 4\n"
        "property float nx\n"
        "property float x\n"
        "property float y\n"
        "property float z\n"
        "element face 1\n"
        "property list uchar int vertex_indices\n"
        "element camera 1\n"
        "property float fov\n"
        "end_header\n"
        "0 0 0 0\n"
        "0 1 0 0\n"
        "0 1 1 0\n"
        "0 0 1 0.5\n"
        "4 0 1 2 3\n"
        "45\n");

    MeshData mesh;
    if (!loadPLY(path, mesh)) {
        std::cerr << "  FAIL: loadPLY returned false" << std::endl;
        return false;
    }

    bool ok = mesh.vertices.size() == 4 && mesh.faces.rows() == 2;
    if (!ok) {
        std::cerr << "  FAIL: " << mesh.vertices.size() << " vertices, " << mesh.faces.rows() << " faces" << std::endl;
        return false;
    }
    ok &= expectVertex(mesh, 3, Eigen::Vector3d(0.0, 1.0, 0.5));
    if (mesh.faces(1, 0) != 0 || mesh.faces(1, 1) != 2 || mesh.faces(1, 2) != 3) {
        std::cerr << "  FAIL: Quad not fan-triangulated" << std::endl;
        ok = false;
    }

    std::string binary = writeFile("test_mesh_io_binary.ply",
        "ply\nformat binary_little_endian 1.0\nelement vertex 0\nend_header\n");
    if (loadPLY(binary, mesh)) {
        std::cerr << "  FAIL: Binary PLY accepted" << std::endl;
        ok = false;
    }

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

bool testOBJ() {
    std::cout << "Test 2: OBJ..." << std::endl;

    std::string path = writeFile("test_mesh_io.obj",
        "# cube corner\n"
        "o corner\n"
        "v 0 0 0\n"
        "v 2 0 0\n"
        "v 0 2 0\n"
        "v 0 0 2\n"
        "vt 0 0\n"
        "vn 0 0 1\n"
        "f 1/1/1 2/1/1 3/1/1\n"
        "f -4//1 -3//1 -1//1\n");

    MeshData mesh;
    if (!loadOBJ(path, mesh)) {
        std::cerr << "  FAIL: loadOBJ returned false" << std::endl;
        return false;
    }

    bool ok = mesh.vertices.size() == 4 && mesh.faces.rows() == 2;
    if (!ok) {
        std::cerr << "  FAIL: " << mesh.vertices.size() << " vertices, " << mesh.faces.rows() << " faces" << std::endl;
        return false;
    }
    if (mesh.faces(1, 0) != 0 || mesh.faces(1, 1) != 1 || mesh.faces(1, 2) != 3) {
        std::cerr << "  FAIL: Negative indices resolved to " << mesh.faces.row(1) << std::endl;
        ok = false;
    }

    std::string bad = writeFile("test_mesh_io_bad.obj", "v 0 0 0\nf 1 2 3\n");
    if (loadOBJ(bad, mesh)) {
        std::cerr << "  FAIL: Out-of-range face accepted" << std::endl;
        ok = false;
    }

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

bool testSTL() {
    std::cout << "Test 3: ASCII and binary STL..." << std::endl;

    std::string ascii = writeFile("test_mesh_io_ascii.stl",
        "solid part\n"
        "  facet normal 0 0 1\n"
        "    outer loop\n"
        "      vertex 0 0 0\n"
        "      vertex 1 0 0\n"
        "      vertex 0 1 0\n"
        "    endloop\n"
        "  endfacet\n"
        "  facet normal 0 0 1\n"
        "    outer loop\n"
        "      vertex 1 0 0\n"
        "      vertex 1 1 0\n"
        "      vertex 0 1 0\n"
        "    endloop\n"
        "  endfacet\n"
        "endsolid part\n");

    MeshData mesh;
    bool ok = loadSTL(ascii, mesh) && mesh.vertices.size() == 6 && mesh.faces.rows() == 2;
    if (!ok) {
        std::cerr << "  FAIL: ASCII STL gave " << mesh.vertices.size() << " vertices" << std::endl;
        return false;
    }
    ok &= expectVertex(mesh, 4, Eigen::Vector3d(1.0, 1.0, 0.0));

    // Binary: 80-byte header, count, then normal + 3 vertices + attribute per facet
    std::string binary_path = "test_mesh_io_binary.stl";
    {
        std::ofstream file(binary_path, std::ios::binary);
        char header[80];
        std::memset(header, 0, sizeof(header));
        std::strncpy(header, "binary test part", sizeof(header) - 1);
        file.write(header, sizeof(header));
        uint32_t count = 1;
        file.write(reinterpret_cast<const char*>(&count), sizeof(count));
        float record[12] = {0, 0, 1, 0, 0, 0, 3, 0, 0, 0, 4, 0};
        file.write(reinterpret_cast<const char*>(record), sizeof(record));
        uint16_t attribute = 0;
        file.write(reinterpret_cast<const char*>(&attribute), sizeof(attribute));
    }
    created_files.push_back(binary_path);

    if (!loadMesh(binary_path, mesh) || mesh.vertices.size() != 3 || mesh.faces.rows() != 1) {
        std::cerr << "  FAIL: Binary STL gave " << mesh.vertices.size() << " vertices" << std::endl;
        return false;
    }
    ok &= expectVertex(mesh, 1, Eigen::Vector3d(3.0, 0.0, 0.0));
    ok &= expectVertex(mesh, 2, Eigen::Vector3d(0.0, 4.0, 0.0));

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

bool testXYZ() {
    std::cout << "Test 4: XYZ point list..." << std::endl;

    std::string path = writeFile("test_mesh_io.xyz",
        "# x y z intensity\n"
        "1 2 3 0.5\n"
        "\n"
        "4.5,5.5,6.5\n"
        "-1 -2 -3\n");

    MeshData mesh;
    bool ok = loadMesh(path, mesh) && mesh.vertices.size() == 3 && !mesh.hasFaces();
    if (!ok) {
        std::cerr << "  FAIL: Loaded " << mesh.vertices.size() << " points" << std::endl;
        return false;
    }
    ok &= expectVertex(mesh, 1, Eigen::Vector3d(4.5, 5.5, 6.5));

    std::string bad = writeFile("test_mesh_io_bad.xyz", "1 2 3\n1 two 3\n");
    if (loadXYZ(bad, mesh)) {
        std::cerr << "  FAIL: Malformed line accepted" << std::endl;
        ok = false;
    }

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

bool testDeduplicate() {
    std::cout << "Test 5: Vertex deduplication..." << std::endl;

    MeshData mesh;
    mesh.vertices = {Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(1, 0, 0), Eigen::Vector3d(0, 1, 0),
                     Eigen::Vector3d(1, 0, 0), Eigen::Vector3d(1, 1, 0), Eigen::Vector3d(0, 1, 0),
                     Eigen::Vector3d(0, 0, 0)};
    mesh.faces.resize(3, 3);
    mesh.faces << 0, 1, 2,
                  3, 4, 5,
                  0, 3, 1;   // Collapses after merging

    MeshData merged = deduplicateVertices(mesh);

    bool ok = merged.vertices.size() == 4 && merged.faces.rows() == 2;
    if (!ok) {
        std::cerr << "  FAIL: " << merged.vertices.size() << " vertices, " << merged.faces.rows() << " faces" << std::endl;
        return false;
    }
    if (merged.faces(1, 0) != 1 || merged.faces(1, 1) != 3 || merged.faces(1, 2) != 2) {
        std::cerr << "  FAIL: Faces not remapped: " << merged.faces.row(1) << std::endl;
        ok = false;
    }

    if (ok) {
        std::cout << "  PASS: 7 -> 4 vertices" << std::endl;
    }
    return ok;
}

bool testWriters() {
    std::cout << "Test 6: PLY writers and unreadable input..." << std::endl;

    PointCloud points = {Eigen::Vector3d(0.125, -2.5, 3.0), Eigen::Vector3d(1, 2, 3), Eigen::Vector3d(-4, 0, 1)};
    std::string cloud_path = "test_mesh_io_cloud.ply";
    created_files.push_back(cloud_path);

    MeshData loaded;
    bool ok = savePointCloudPLY(points, cloud_path) && loadPLY(cloud_path, loaded) &&
              loaded.vertices.size() == 3 && !loaded.hasFaces();
    if (!ok) {
        std::cerr << "  FAIL: Point cloud PLY did not reload" << std::endl;
        return false;
    }
    ok &= expectVertex(loaded, 0, points[0]);

    MeshData mesh;
    mesh.vertices = points;
    mesh.faces.resize(1, 3);
    mesh.faces << 0, 1, 2;
    std::string mesh_path = "test_mesh_io_mesh.ply";
    created_files.push_back(mesh_path);
    if (!saveMeshPLY(mesh, mesh_path) || !loadMesh(mesh_path, loaded) || loaded.faces.rows() != 1) {
        std::cerr << "  FAIL: Mesh PLY did not reload" << std::endl;
        ok = false;
    }

    if (loadMesh("does_not_exist.ply", loaded)) {
        std::cerr << "  FAIL: Missing file reported as loaded" << std::endl;
        ok = false;
    }
    if (loadMesh(writeFile("test_mesh_io.dae", "<COLLADA/>"), loaded)) {
        std::cerr << "  FAIL: Unsupported extension accepted" << std::endl;
        ok = false;
    }

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

bool testFaceIndexRange() {
    std::cout << "Test 7: Face indices out of range..." << std::endl;

    std::string path = writeFile("test_mesh_io_bad_face.ply",
        "ply\n"
        "format ascii 1.0\n"
        "element vertex 4\n"
        "property float x\n"
        "property float y\n"
        "property float z\n"
        "element face 1\n"
        "property list uchar int vertex_indices\n"
        "end_header\n"
        "0 0 0\n"
        "1 0 0\n"
        "1 1 0\n"
        "0 1 0\n"
        "3 0 1 100000\n");

    bool ok = true;
    MeshData mesh;
    if (loadPLY(path, mesh)) {
        std::cerr << "  FAIL: PLY face index 100000 accepted" << std::endl;
        ok = false;
    }

    std::string negative = writeFile("test_mesh_io_negative_face.ply",
        "ply\nformat ascii 1.0\nelement vertex 3\nproperty float x\nproperty float y\nproperty float z\n"
        "element face 1\nproperty list uchar int vertex_indices\nend_header\n"
        "0 0 0\n1 0 0\n0 1 0\n3 0 -1 2\n");
    if (loadMesh(negative, mesh)) {
        std::cerr << "  FAIL: Negative PLY face index accepted" << std::endl;
        ok = false;
    }

    MeshData corrupt;
    corrupt.vertices = {Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(1, 0, 0), Eigen::Vector3d(0, 1, 0)};
    corrupt.faces.resize(1, 3);
    corrupt.faces << 0, 1, 7;
    try {
        deduplicateVertices(corrupt);
        std::cerr << "  FAIL: deduplicateVertices accepted face index 7" << std::endl;
        ok = false;
    } catch (const InvalidParameter& e) {
        std::cout << "  Rejected: " << e.what() << std::endl;
    }

    if (ok) {
        std::cout << "  PASS" << std::endl;
    }
    return ok;
}

int main() {
    std::cout << "=== Mesh I/O Test ===" << std::endl << std::endl;

    bool test1 = testPLY();
    bool test2 = testOBJ();
    bool test3 = testSTL();
    bool test4 = testXYZ();
    bool test5 = testDeduplicate();
    bool test6 = testWriters();
    bool test7 = testFaceIndexRange();

    for (const auto& path : created_files) {
        std::remove(path.c_str());
    }

    std::cout << std::endl << "=== Test Summary ===" << std::endl;
    std::cout << "Test 1 (PLY): " << (test1 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 2 (OBJ): " << (test2 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 3 (STL): " << (test3 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 4 (XYZ): " << (test4 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 5 (Deduplicate): " << (test5 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 6 (Writers): " << (test6 ? "PASS" : "FAIL") << std::endl;
    std::cout << "Test 7 (Face index range): " << (test7 ? "PASS" : "FAIL") << std::endl;

    if (test1 && test2 && test3 && test4 && test5 && test6 && test7) {
        std::cout << "All tests PASSED!" << std::endl;
        return 0;
    }
    std::cerr << "Some tests FAILED!" << std::endl;
    return 1;
}
