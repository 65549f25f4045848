#include "gear_generator.hpp"
#include "ring_builder.hpp"
#include <mesh/mesh_assembler.hpp>
#include <common/logging.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace geargen {

Mesh generate_gear(const GearSpec& spec) {
    auto log = geargen::logging::get_logger();
    log->debug("Generating gear: {}", describe(spec));

    std::vector<Ring> rings = build_rings(spec);
    return assemble(rings, spec);
}

std::string generate_gear_obj(const GearSpec& spec, const ObjExportOptions& options) {
    return generate_gear_obj(spec, generate_gear(spec), options);
}

std::string generate_gear_obj(const GearSpec& spec, const Mesh& mesh,
                              const ObjExportOptions& options) {
    ObjExportOptions with_header = options;
    with_header.comments.insert(with_header.comments.begin(), describe(spec));
    return to_obj(mesh, with_header);
}

void write_gear_obj(const GearSpec& spec, const std::string& path, const ObjExportOptions& options) {
    auto log = geargen::logging::get_logger();

    std::string obj = generate_gear_obj(spec, options);

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << obj;
    if (!file) {
        throw std::runtime_error("Failed writing file: " + path);
    }

    log->info("Wrote {} ({} bytes)", path, obj.size());
}

std::string default_output_name(const GearSpec& spec) {
    std::ostringstream ss;
    ss << spec.teeth << "t_" << spec.outer_radius << "r_" << spec.thickness << "y.obj";
    return ss.str();
}

std::string describe(const GearSpec& spec) {
    std::ostringstream ss;
    ss << "teeth=" << spec.teeth
       << " inner_radius=" << spec.inner_radius
       << " outer_radius=" << spec.outer_radius
       << " thickness=" << spec.thickness
       << " vertical_layers=" << spec.vertical_layers
       << " samples_per_tooth=" << spec.samples_per_tooth
       << " caps=" << cap_style_name(spec.cap_style)
       << (spec.twist ? " twisted" : " straight");
    return ss.str();
}

}  // namespace geargen
