#ifndef GEARGEN_MESH_MESH_ASSEMBLER_HPP
#define GEARGEN_MESH_MESH_ASSEMBLER_HPP

#include "mesh.hpp"
#include <gear/gear_spec.hpp>
#include <gear/ring_builder.hpp>
#include <vector>

namespace geargen {

// Lift rings into 3-D and close them into a solid - main entry point.
//
// Vertex (layer L, point i) gets index L * points_per_ring + i. Faces are
// emitted as side-wall quads ring pair by ring pair, then the bottom cap,
// then the top cap. Fan caps append the bottom and top centre vertices
// after all ring vertices.
//
// Throws InvalidParameter when the rings do not match the GearSpec and
// DegenerateMeshError for zero-length ring edges or unclosable caps.
Mesh assemble(const std::vector<Ring>& rings, const GearSpec& spec);

// Height of a layer: rings are evenly spaced from z = 0 to z = thickness
double layer_z(const GearSpec& spec, int layer);

// Position of one ring point
Vec3 lift_point(const RingPoint& point, double z);

// Closed-form mesh size for a valid GearSpec
size_t expected_vertex_count(const GearSpec& spec);
size_t expected_face_count(const GearSpec& spec);

}  // namespace geargen

#endif // GEARGEN_MESH_MESH_ASSEMBLER_HPP
