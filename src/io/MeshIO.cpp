/**
 * Mesh I/O
 *
 * Loaders for the scan formats produced by the rig's model pipeline
 * (PLY, OBJ, STL, plain XYZ) and an ASCII PLY writer.
 */

#include "io/MeshIO.h"
#include "geometry/GeometryErrors.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

namespace isi_geometry {

using Triangle = std::array<int, 3>;

static Eigen::MatrixXi toFaceMatrix(const std::vector<Triangle>& triangles) {
    Eigen::MatrixXi faces(static_cast<int>(triangles.size()), 3);
    for (size_t i = 0; i < triangles.size(); ++i) {
        faces(static_cast<int>(i), 0) = triangles[i][0];
        faces(static_cast<int>(i), 1) = triangles[i][1];
        faces(static_cast<int>(i), 2) = triangles[i][2];
    }
    return faces;
}

// Fan triangulation of a polygon given as vertex indices
static void appendPolygon(const std::vector<int>& polygon, std::vector<Triangle>& triangles) {
    for (size_t k = 1; k + 1 < polygon.size(); ++k) {
        triangles.push_back({{polygon[0], polygon[k], polygon[k + 1]}});
    }
}

static std::string lowercaseExtension(const std::string& filepath) {
    size_t dot = filepath.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = filepath.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

namespace {

struct PlyElement {
    std::string name;
    size_t count = 0;
    std::vector<std::string> properties;
};

} // namespace

bool loadPLY(const std::string& filepath, MeshData& mesh) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open PLY file: " << filepath << std::endl;
        return false;
    }

    mesh.clear();

    std::string line;
    if (!std::getline(file, line) || line.compare(0, 3, "ply") != 0) {
        std::cerr << "Not a PLY file: " << filepath << std::endl;
        return false;
    }

    std::vector<PlyElement> elements;
    bool header_done = false;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (keyword == "format") {
            std::string format;
            iss >> format;
            if (format != "ascii") {
                std::cerr << "Only ASCII PLY is supported (" << format << "): " << filepath << std::endl;
                return false;
            }
        } else if (keyword == "element") {
            PlyElement element;
            iss >> element.name >> element.count;
            elements.push_back(element);
        } else if (keyword == "property") {
            if (elements.empty()) {
                std::cerr << "PLY property before any element: " << filepath << std::endl;
                return false;
            }
            std::string type, name;
            iss >> type;
            if (type == "list") {
                std::string count_type, item_type;
                iss >> count_type >> item_type;
            }
            iss >> name;
            elements.back().properties.push_back(name);
        } else if (keyword == "end_header") {
            header_done = true;
            break;
        }
    }

    if (!header_done) {
        std::cerr << "PLY header not terminated: " << filepath << std::endl;
        return false;
    }

    std::vector<Triangle> triangles;
    for (const auto& element : elements) {
        if (element.name == "vertex") {
            auto column = [&element](const std::string& name) {
                auto it = std::find(element.properties.begin(), element.properties.end(), name);
                return it == element.properties.end() ? -1
                                                      : static_cast<int>(it - element.properties.begin());
            };
            int ix = column("x"), iy = column("y"), iz = column("z");
            if (ix < 0 || iy < 0 || iz < 0) {
                std::cerr << "PLY vertex element lacks x/y/z: " << filepath << std::endl;
                return false;
            }

            mesh.vertices.reserve(element.count);
            std::vector<double> values(element.properties.size());
            for (size_t i = 0; i < element.count; ++i) {
                if (!std::getline(file, line)) {
                    std::cerr << "PLY file truncated at vertex " << i << ": " << filepath << std::endl;
                    return false;
                }
                std::istringstream iss(line);
                for (auto& v : values) {
                    if (!(iss >> v)) {
                        std::cerr << "Malformed PLY vertex " << i << ": " << filepath << std::endl;
                        return false;
                    }
                }
                mesh.vertices.emplace_back(values[ix], values[iy], values[iz]);
            }
        } else if (element.name == "face") {
            for (size_t i = 0; i < element.count; ++i) {
                if (!std::getline(file, line)) {
                    std::cerr << "PLY file truncated at face " << i << ": " << filepath << std::endl;
                    return false;
                }
                std::istringstream iss(line);
                int n = 0;
                iss >> n;
                std::vector<int> polygon(std::max(n, 0));
                for (auto& idx : polygon) {
                    if (!(iss >> idx)) {
                        std::cerr << "Malformed PLY face " << i << ": " << filepath << std::endl;
                        return false;
                    }
                    if (idx < 0 || idx >= static_cast<int>(mesh.vertices.size())) {
                        std::cerr << "PLY face " << i << " index " << idx << " out of range: "
                                  << filepath << std::endl;
                        return false;
                    }
                }
                appendPolygon(polygon, triangles);
            }
        } else {
            // Unused element: skip its records
            for (size_t i = 0; i < element.count && std::getline(file, line); ++i) {}
        }
    }

    mesh.faces = toFaceMatrix(triangles);
    return !mesh.vertices.empty();
}

bool loadOBJ(const std::string& filepath, MeshData& mesh) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open OBJ file: " << filepath << std::endl;
        return false;
    }

    mesh.clear();

    std::vector<Triangle> triangles;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::istringstream iss(line);
        std::string tag;
        if (!(iss >> tag)) continue;

        if (tag == "v") {
            double x, y, z;
            if (!(iss >> x >> y >> z)) {
                std::cerr << "Malformed OBJ vertex at line " << line_number << ": " << filepath << std::endl;
                return false;
            }
            mesh.vertices.emplace_back(x, y, z);
        } else if (tag == "f") {
            std::vector<int> polygon;
            std::string token;
            while (iss >> token) {
                // "v", "v/vt", "v//vn" or "v/vt/vn"
                int idx = 0;
                try {
                    idx = std::stoi(token.substr(0, token.find('/')));
                } catch (const std::exception&) {
                    std::cerr << "Malformed OBJ face at line " << line_number << ": " << filepath << std::endl;
                    return false;
                }
                int resolved = idx < 0 ? static_cast<int>(mesh.vertices.size()) + idx : idx - 1;
                if (idx == 0 || resolved < 0 || resolved >= static_cast<int>(mesh.vertices.size())) {
                    std::cerr << "OBJ face index " << idx << " out of range at line "
                              << line_number << ": " << filepath << std::endl;
                    return false;
                }
                polygon.push_back(resolved);
            }
            appendPolygon(polygon, triangles);
        }
    }

    mesh.faces = toFaceMatrix(triangles);
    return !mesh.vertices.empty();
}

static bool loadSTLBinary(std::ifstream& file, uint32_t num_triangles, MeshData& mesh) {
    file.seekg(84, std::ios::beg);

    std::vector<Triangle> triangles;
    triangles.reserve(num_triangles);
    mesh.vertices.reserve(3 * static_cast<size_t>(num_triangles));

    for (uint32_t t = 0; t < num_triangles; ++t) {
        float record[12];   // normal, then three vertices
        uint16_t attribute = 0;
        file.read(reinterpret_cast<char*>(record), sizeof(record));
        file.read(reinterpret_cast<char*>(&attribute), sizeof(attribute));
        if (file.fail()) {
            return false;
        }

        int base = static_cast<int>(mesh.vertices.size());
        for (int k = 0; k < 3; ++k) {
            mesh.vertices.emplace_back(record[3 + 3 * k], record[4 + 3 * k], record[5 + 3 * k]);
        }
        triangles.push_back({{base, base + 1, base + 2}});
    }

    mesh.faces = toFaceMatrix(triangles);
    return true;
}

static bool loadSTLAscii(std::ifstream& file, MeshData& mesh) {
    file.seekg(0, std::ios::beg);

    std::vector<Triangle> triangles;
    std::vector<int> facet;
    std::string token;
    while (file >> token) {
        if (token == "vertex") {
            double x, y, z;
            if (!(file >> x >> y >> z)) {
                return false;
            }
            facet.push_back(static_cast<int>(mesh.vertices.size()));
            mesh.vertices.emplace_back(x, y, z);
        } else if (token == "endfacet") {
            appendPolygon(facet, triangles);
            facet.clear();
        }
    }

    mesh.faces = toFaceMatrix(triangles);
    return true;
}

bool loadSTL(const std::string& filepath, MeshData& mesh) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open STL file: " << filepath << std::endl;
        return false;
    }

    mesh.clear();

    file.seekg(0, std::ios::end);
    size_t file_size = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    // Binary layout: 80-byte header, uint32 count, 50 bytes per triangle
    bool parsed = false;
    uint32_t num_triangles = 0;
    if (file_size >= 84) {
        file.seekg(80, std::ios::beg);
        file.read(reinterpret_cast<char*>(&num_triangles), sizeof(num_triangles));
    }
    if (file_size >= 84 && file_size == 84 + 50 * static_cast<size_t>(num_triangles)) {
        parsed = loadSTLBinary(file, num_triangles, mesh);
    } else {
        file.clear();
        parsed = loadSTLAscii(file, mesh);
    }

    if (!parsed) {
        std::cerr << "Malformed STL file: " << filepath << std::endl;
        mesh.clear();
        return false;
    }
    return !mesh.vertices.empty();
}

bool loadXYZ(const std::string& filepath, MeshData& mesh) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open point file: " << filepath << std::endl;
        return false;
    }

    mesh.clear();

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (line.empty() || line[0] == '#') continue;

        // Accept comma separated values as well
        std::replace(line.begin(), line.end(), ',', ' ');
        std::istringstream iss(line);
        double x, y, z;
        if (!(iss >> x >> y >> z)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            std::cerr << "Malformed point at line " << line_number << ": " << filepath << std::endl;
            return false;
        }
        mesh.vertices.emplace_back(x, y, z);
    }

    return !mesh.vertices.empty();
}

bool loadMesh(const std::string& filepath, MeshData& mesh) {
    std::string ext = lowercaseExtension(filepath);
    if (ext == "ply") return loadPLY(filepath, mesh);
    if (ext == "obj") return loadOBJ(filepath, mesh);
    if (ext == "stl") return loadSTL(filepath, mesh);
    if (ext == "xyz" || ext == "txt") return loadXYZ(filepath, mesh);

    std::cerr << "Unsupported mesh format '" << ext << "': " << filepath << std::endl;
    return false;
}

MeshData deduplicateVertices(const MeshData& mesh) {
    MeshData result;
    std::map<std::tuple<double, double, double>, int> index_of;
    std::vector<int> remap(mesh.vertices.size());

    for (size_t i = 0; i < mesh.vertices.size(); ++i) {
        const Eigen::Vector3d& v = mesh.vertices[i];
        auto key = std::make_tuple(v.x(), v.y(), v.z());
        auto it = index_of.find(key);
        if (it == index_of.end()) {
            int new_index = static_cast<int>(result.vertices.size());
            index_of.emplace(key, new_index);
            result.vertices.push_back(v);
            remap[i] = new_index;
        } else {
            remap[i] = it->second;
        }
    }

    std::vector<Triangle> triangles;
    const int vertex_count = static_cast<int>(mesh.vertices.size());
    for (int f = 0; f < mesh.faces.rows(); ++f) {
        for (int k = 0; k < 3; ++k) {
            if (mesh.faces(f, k) < 0 || mesh.faces(f, k) >= vertex_count) {
                throw InvalidParameter("Face " + std::to_string(f) + " references vertex " +
                                       std::to_string(mesh.faces(f, k)) + " of " +
                                       std::to_string(vertex_count));
            }
        }
        Triangle t{{remap[mesh.faces(f, 0)], remap[mesh.faces(f, 1)], remap[mesh.faces(f, 2)]}};
        if (t[0] == t[1] || t[1] == t[2] || t[0] == t[2]) continue;  // Collapsed
        triangles.push_back(t);
    }
    result.faces = toFaceMatrix(triangles);

    return result;
}

bool savePointCloudPLY(const PointCloud& points, const std::string& filepath) {
    MeshData mesh;
    mesh.vertices = points;
    mesh.faces.resize(0, 3);
    return saveMeshPLY(mesh, filepath);
}

bool saveMeshPLY(const MeshData& mesh, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    // Write PLY header
    file << "ply\n";
    file << "format ascii 1.0\n";
    file << "element vertex " << mesh.vertices.size() << "\n";
    file << "property float x\n";
    file << "property float y\n";
    file << "property float z\n";
    if (mesh.hasFaces()) {
        file << "element face " << mesh.faces.rows() << "\n";
        file << "property list uchar int vertex_indices\n";
    }
    file << "end_header\n";

    for (const auto& v : mesh.vertices) {
        file << std::fixed << std::setprecision(6)
             << v.x() << " " << v.y() << " " << v.z() << "\n";
    }

    for (int i = 0; i < mesh.faces.rows(); ++i) {
        file << "3 " << mesh.faces(i, 0) << " " << mesh.faces(i, 1) << " " << mesh.faces(i, 2) << "\n";
    }

    file.close();
    return !file.fail();
}

} // namespace isi_geometry
