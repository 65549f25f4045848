#ifndef GEARGEN_MESH_OBJ_WRITER_HPP
#define GEARGEN_MESH_OBJ_WRITER_HPP

#include "mesh.hpp"
#include <math/vec3.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace geargen {

// Settings for Wavefront OBJ output
struct ObjExportOptions {
    // Minimum digits after the decimal point. More are written when the
    // mesh is small, so the largest coordinate keeps six significant
    // digits. Coordinates are always in fixed notation since some OBJ
    // readers reject exponents.
    int precision = 6;

    std::string object_name = "gear";

    // Applied on write: v = position * scale + offset
    Vec3 scale = vec3::one();
    Vec3 offset = vec3::zero();

    // Extra "# ..." lines written after the standard header
    std::vector<std::string> comments;
};

// Write the mesh as OBJ: all "v" lines in vertex order, then all "f" lines
// in face order with 1-based indices. Output depends only on the mesh and
// the options. The stream's formatting flags are left untouched.
void write_obj(const Mesh& mesh, std::ostream& out, const ObjExportOptions& options = {});

// Export to OBJ format (returns string content)
std::string to_obj(const Mesh& mesh, const ObjExportOptions& options = {});

}  // namespace geargen

#endif // GEARGEN_MESH_OBJ_WRITER_HPP
