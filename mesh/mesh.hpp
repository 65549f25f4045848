#ifndef GEARGEN_MESH_MESH_HPP
#define GEARGEN_MESH_MESH_HPP

#include <math/vec3.hpp>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

namespace geargen {

using VertexIndex = uint32_t;

// Polygon of three or more 0-based vertex indices, counterclockwise when
// seen from outside the solid
struct Face {
    std::vector<VertexIndex> indices;

    Face() = default;
    Face(std::initializer_list<VertexIndex> list) : indices(list) {}

    size_t size() const { return indices.size(); }
};

// Polygon mesh with stable vertex numbering. Faces reference vertices by
// their position in the vertex list.
class Mesh {
public:
    // Append a vertex and return its index
    VertexIndex add_vertex(const Vec3& position);

    // Append a face; throws std::out_of_range for unknown vertices and
    // std::invalid_argument for faces with fewer than three indices
    void add_face(Face face);

    void reserve(size_t vertex_count, size_t face_count);

    const std::vector<Vec3>& vertices() const { return vertices_; }
    const std::vector<Face>& faces() const { return faces_; }

    size_t vertex_count() const { return vertices_.size(); }
    size_t face_count() const { return faces_.size(); }

    // Axis-aligned bounds as (min, max); zero box for an empty mesh
    std::pair<Vec3, Vec3> bounding_box() const;

    // Enclosed volume from the divergence theorem, faces fanned from their
    // first vertex. Positive when faces wind outward.
    double signed_volume() const;

    // True when every undirected edge is shared by exactly two faces and
    // the two faces traverse it in opposite directions
    bool is_edge_manifold() const;

private:
    std::vector<Vec3> vertices_;
    std::vector<Face> faces_;
};

}  // namespace geargen

#endif // GEARGEN_MESH_MESH_HPP
