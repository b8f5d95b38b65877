#pragma once

#include "geometry/MeshGeometry.h"
#include <Eigen/Dense>
#include <string>

namespace isi_geometry {

/**
 * Vertices plus optional triangle indices (F x 3, 0-based)
 */
struct MeshData {
    PointCloud vertices;
    Eigen::MatrixXi faces;

    bool hasFaces() const { return faces.rows() > 0; }

    void clear() {
        vertices.clear();
        faces.resize(0, 3);
    }
};

/**
 * Load an ASCII PLY file (vertex x/y/z properties, optional face lists).
 * Polygons with more than 3 vertices are fan-triangulated.
 * @return true on success; the reason for a failure is printed to std::cerr
 */
bool loadPLY(const std::string& filepath, MeshData& mesh);

/**
 * Load a Wavefront OBJ file ('v' and 'f' records, 1-based or negative indices)
 */
bool loadOBJ(const std::string& filepath, MeshData& mesh);

/**
 * Load an STL file (ASCII or binary, detected from the content).
 * Each facet contributes three vertices; use deduplicateVertices to merge them.
 */
bool loadSTL(const std::string& filepath, MeshData& mesh);

/**
 * Load a plain point list: "x y z" per line, further columns and '#' lines ignored
 */
bool loadXYZ(const std::string& filepath, MeshData& mesh);

/**
 * Load by file extension (.ply, .obj, .stl, .xyz, .txt)
 */
bool loadMesh(const std::string& filepath, MeshData& mesh);

/**
 * Merge vertices with identical coordinates (first occurrence wins),
 * remapping faces and dropping faces that collapse.
 * @throws InvalidParameter if a face references a vertex out of range
 */
MeshData deduplicateVertices(const MeshData& mesh);

/**
 * Save points as ASCII PLY (vertices only)
 */
bool savePointCloudPLY(const PointCloud& points, const std::string& filepath);

/**
 * Save vertices and faces as ASCII PLY
 */
bool saveMeshPLY(const MeshData& mesh, const std::string& filepath);

} // namespace isi_geometry
