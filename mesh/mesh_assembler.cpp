#include "mesh_assembler.hpp"
#include "cap_triangulation.hpp"
#include <gear/gear_errors.hpp>
#include <common/logging.hpp>
#include <cmath>

namespace geargen {

namespace {

void check_rings(const std::vector<Ring>& rings, const GearSpec& spec) {
    const size_t expected_rings = static_cast<size_t>(spec.vertical_layers) + 1;
    if (rings.size() != expected_rings) {
        throw InvalidParameter("expected " + std::to_string(expected_rings) +
                               " rings, got " + std::to_string(rings.size()));
    }
    const size_t points = static_cast<size_t>(spec.points_per_ring());
    for (size_t position = 0; position < rings.size(); ++position) {
        const Ring& ring = rings[position];
        if (ring.layer != static_cast<int>(position)) {
            throw InvalidParameter("ring at position " + std::to_string(position) +
                                   " is layer " + std::to_string(ring.layer));
        }
        if (ring.size() != points) {
            throw InvalidParameter("ring " + std::to_string(ring.layer) + " has " +
                                   std::to_string(ring.size()) + " points, expected " +
                                   std::to_string(points));
        }
    }
}

// Consecutive points of one layer must not coincide
void check_ring_edges(const Mesh& mesh, int layer, VertexIndex first, size_t count) {
    const auto& vertices = mesh.vertices();
    for (size_t i = 0; i < count; ++i) {
        const Vec3& a = vertices[first + i];
        const Vec3& b = vertices[first + (i + 1) % count];
        if (a == b) {
            throw DegenerateMeshError("zero-length edge between points " + std::to_string(i) +
                                      " and " + std::to_string((i + 1) % count) +
                                      " of layer " + std::to_string(layer));
        }
    }
}

// Fan of the ring around a centre vertex; top caps face +z, bottom caps -z
void add_fan_cap(Mesh& mesh, VertexIndex first, size_t count, VertexIndex center, bool top) {
    const auto& vertices = mesh.vertices();
    for (size_t i = 0; i < count; ++i) {
        VertexIndex a = first + static_cast<VertexIndex>(i);
        VertexIndex b = first + static_cast<VertexIndex>((i + 1) % count);
        if (signed_area_xy(vertices[center], vertices[a], vertices[b]) <= 0.0) {
            throw DegenerateMeshError("zero-area cap triangle at point " + std::to_string(i));
        }
        if (top) {
            mesh.add_face({a, b, center});
        } else {
            mesh.add_face({b, a, center});
        }
    }
}

void add_ear_clip_cap(Mesh& mesh, VertexIndex first, size_t count, bool top) {
    std::vector<Vec3> outline(mesh.vertices().begin() + first,
                              mesh.vertices().begin() + first + count);
    for (const auto& tri : ear_clip(outline)) {
        VertexIndex a = first + static_cast<VertexIndex>(tri[0]);
        VertexIndex b = first + static_cast<VertexIndex>(tri[1]);
        VertexIndex c = first + static_cast<VertexIndex>(tri[2]);
        if (top) {
            mesh.add_face({a, b, c});
        } else {
            mesh.add_face({c, b, a});
        }
    }
}

}  // namespace

double layer_z(const GearSpec& spec, int layer) {
    return static_cast<double>(layer) * spec.layer_height();
}

Vec3 lift_point(const RingPoint& point, double z) {
    return Vec3(point.radius * std::cos(point.angle),
                point.radius * std::sin(point.angle),
                z);
}

size_t expected_vertex_count(const GearSpec& spec) {
    size_t points = static_cast<size_t>(spec.points_per_ring());
    size_t ring_vertices = (static_cast<size_t>(spec.vertical_layers) + 1) * points;
    return spec.cap_style == CapStyle::Fan ? ring_vertices + 2 : ring_vertices;
}

size_t expected_face_count(const GearSpec& spec) {
    size_t points = static_cast<size_t>(spec.points_per_ring());
    size_t side_faces = static_cast<size_t>(spec.vertical_layers) * points;
    size_t cap_faces = spec.cap_style == CapStyle::Fan ? points : points - 2;
    return side_faces + 2 * cap_faces;
}

Mesh assemble(const std::vector<Ring>& rings, const GearSpec& spec) {
    auto log = geargen::logging::get_logger();

    spec.validate();
    check_rings(rings, spec);

    const size_t points = static_cast<size_t>(spec.points_per_ring());
    const int layers = spec.vertical_layers;

    Mesh mesh;
    mesh.reserve(expected_vertex_count(spec), expected_face_count(spec));

    // Vertices in (layer, point) order
    for (const auto& ring : rings) {
        double z = layer_z(spec, ring.layer);
        VertexIndex first = static_cast<VertexIndex>(mesh.vertex_count());
        for (const auto& point : ring.points) {
            mesh.add_vertex(lift_point(point, z));
        }
        check_ring_edges(mesh, ring.layer, first, points);
    }

    auto index_of = [points](int layer, size_t i) {
        return static_cast<VertexIndex>(static_cast<size_t>(layer) * points + i % points);
    };

    // Side walls: same traversal direction on both rings keeps normals outward
    for (int layer = 0; layer < layers; ++layer) {
        for (size_t i = 0; i < points; ++i) {
            mesh.add_face({index_of(layer, i),
                           index_of(layer, i + 1),
                           index_of(layer + 1, i + 1),
                           index_of(layer + 1, i)});
        }
    }
    log->debug("MeshAssembler: {} side faces over {} layer bands", mesh.face_count(), layers);

    const VertexIndex bottom_first = index_of(0, 0);
    const VertexIndex top_first = index_of(layers, 0);

    switch (spec.cap_style) {
        case CapStyle::Fan: {
            VertexIndex bottom_center = mesh.add_vertex(Vec3(0.0, 0.0, layer_z(spec, 0)));
            VertexIndex top_center = mesh.add_vertex(Vec3(0.0, 0.0, layer_z(spec, layers)));
            add_fan_cap(mesh, bottom_first, points, bottom_center, false);
            add_fan_cap(mesh, top_first, points, top_center, true);
            break;
        }
        case CapStyle::EarClip:
            add_ear_clip_cap(mesh, bottom_first, points, false);
            add_ear_clip_cap(mesh, top_first, points, true);
            break;
    }

    log->info("MeshAssembler: {} vertices, {} faces ({} caps)",
              mesh.vertex_count(), mesh.face_count(), cap_style_name(spec.cap_style));
    return mesh;
}

}  // namespace geargen
