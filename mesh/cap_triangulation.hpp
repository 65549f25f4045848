#ifndef GEARGEN_MESH_CAP_TRIANGULATION_HPP
#define GEARGEN_MESH_CAP_TRIANGULATION_HPP

#include <math/vec3.hpp>
#include <array>
#include <cstddef>
#include <vector>

namespace geargen {

// Three positions into the polygon passed to the triangulator
using CapTriangle = std::array<size_t, 3>;

// Twice the signed area of triangle abc projected onto the xy plane;
// positive when abc is counterclockwise
double signed_area_xy(const Vec3& a, const Vec3& b, const Vec3& c);

// Triangulate a simple counterclockwise polygon (xy plane, z ignored) by ear
// clipping. Produces polygon.size() - 2 counterclockwise triangles, none of
// them with zero area. Throws DegenerateMeshError when no such triangulation
// is found, e.g. for collinear or self-intersecting outlines.
std::vector<CapTriangle> ear_clip(const std::vector<Vec3>& polygon);

}  // namespace geargen

#endif // GEARGEN_MESH_CAP_TRIANGULATION_HPP
