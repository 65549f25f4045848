#include "mesh.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>

namespace geargen {

VertexIndex Mesh::add_vertex(const Vec3& position) {
    vertices_.push_back(position);
    return static_cast<VertexIndex>(vertices_.size() - 1);
}

void Mesh::add_face(Face face) {
    if (face.size() < 3) {
        throw std::invalid_argument("Mesh::add_face: face needs at least 3 vertices, got " +
                                    std::to_string(face.size()));
    }
    for (VertexIndex index : face.indices) {
        if (index >= vertices_.size()) {
            throw std::out_of_range("Mesh::add_face: invalid vertex index " + std::to_string(index));
        }
    }
    faces_.push_back(std::move(face));
}

void Mesh::reserve(size_t vertex_count, size_t face_count) {
    vertices_.reserve(vertex_count);
    faces_.reserve(face_count);
}

std::pair<Vec3, Vec3> Mesh::bounding_box() const {
    if (vertices_.empty()) {
        return {vec3::zero(), vec3::zero()};
    }

    Vec3 min_pt = vertices_[0];
    Vec3 max_pt = vertices_[0];

    for (const auto& v : vertices_) {
        min_pt.x = std::min(min_pt.x, v.x);
        min_pt.y = std::min(min_pt.y, v.y);
        min_pt.z = std::min(min_pt.z, v.z);
        max_pt.x = std::max(max_pt.x, v.x);
        max_pt.y = std::max(max_pt.y, v.y);
        max_pt.z = std::max(max_pt.z, v.z);
    }

    return {min_pt, max_pt};
}

double Mesh::signed_volume() const {
    // V = (1/6) * sum(p0 . (p1 x p2)) over the triangles of every face
    double volume = 0.0;
    for (const auto& face : faces_) {
        const Vec3& p0 = vertices_[face.indices[0]];
        for (size_t i = 1; i + 1 < face.size(); ++i) {
            const Vec3& p1 = vertices_[face.indices[i]];
            const Vec3& p2 = vertices_[face.indices[i + 1]];
            volume += p0.dot(p1.cross(p2));
        }
    }
    return volume / 6.0;
}

bool Mesh::is_edge_manifold() const {
    if (faces_.empty()) {
        return false;
    }

    // Directed edge -> use count; a closed, consistently wound surface uses
    // each directed edge exactly once and its reverse exactly once
    std::map<std::pair<VertexIndex, VertexIndex>, int> directed;
    for (const auto& face : faces_) {
        for (size_t i = 0; i < face.size(); ++i) {
            VertexIndex a = face.indices[i];
            VertexIndex b = face.indices[(i + 1) % face.size()];
            directed[{a, b}]++;
        }
    }

    for (const auto& [edge, count] : directed) {
        if (count != 1) {
            return false;
        }
        if (directed.find({edge.second, edge.first}) == directed.end()) {
            return false;
        }
    }
    return true;
}

}  // namespace geargen
