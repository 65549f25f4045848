#ifndef GEARGEN_GEAR_GEAR_GENERATOR_HPP
#define GEARGEN_GEAR_GEAR_GENERATOR_HPP

// Public entry points: GearSpec in, mesh or Wavefront OBJ out.
//
// Usage:
//   GearSpec spec;
//   spec.inner_radius = 20.0;
//   spec.outer_radius = 24.0;
//   spec.teeth = 12;
//   spec.thickness = 4.0;
//   spec.vertical_layers = 8;
//   spec.twist = twist_over_layers(twist::helical(0.5), spec.vertical_layers);
//
//   Mesh mesh = generate_gear(spec);
//   write_gear_obj(spec, default_output_name(spec));

#include "gear_spec.hpp"
#include <mesh/mesh.hpp>
#include <mesh/obj_writer.hpp>
#include <string>

namespace geargen {

Mesh generate_gear(const GearSpec& spec);

// The gear's parameters are added to the header comments
std::string generate_gear_obj(const GearSpec& spec, const ObjExportOptions& options = {});

// Same, for a mesh already generated from spec
std::string generate_gear_obj(const GearSpec& spec, const Mesh& mesh,
                              const ObjExportOptions& options = {});

// The whole file is generated in memory before the file is opened, so a
// failed generation never leaves a partial file behind
void write_gear_obj(const GearSpec& spec, const std::string& path,
                    const ObjExportOptions& options = {});

// "<teeth>t_<outer radius>r_<thickness>y.obj"
std::string default_output_name(const GearSpec& spec);

// One-line summary for logs and file headers
std::string describe(const GearSpec& spec);

}  // namespace geargen

#endif // GEARGEN_GEAR_GEAR_GENERATOR_HPP
