#ifndef GEARGEN_GEAR_GEAR_CONFIG_HPP
#define GEARGEN_GEAR_GEAR_CONFIG_HPP

#include "gear_spec.hpp"
#include <mesh/obj_writer.hpp>
#include <string>

namespace geargen {

// Named twist pattern over the gear thickness
struct TwistConfig {
    std::string type = "straight";   // straight, helical, fishbone, wave
    double amount = 0.0;             // Radians: total, peak or amplitude by type
    double periods = 1.0;            // wave only
};

// Serializable gear description; built-in profiles replace the callables
// of GearSpec
struct GearConfig {
    double inner_radius = 20.0;
    double outer_radius = 24.0;
    int teeth = 12;
    double thickness = 4.0;

    std::string tooth_profile = "sine";
    int samples_per_tooth = 20;

    TwistConfig twist;
    int vertical_layers = 32;        // Forced to 1 for straight twist
    std::string cap_style = "fan";
    int threads = 0;                 // 0 = OpenMP default

    ObjExportOptions export_options;

    // Effective layer count after the straight-twist rule
    int effective_layers() const;

    // Resolve names into callables; throws InvalidParameter for unknown
    // names or out-of-range values
    GearSpec to_spec() const;
};

// Throws InvalidParameter for unknown twist types
AngleFn make_twist(const TwistConfig& config, int vertical_layers);

}  // namespace geargen

#endif // GEARGEN_GEAR_GEAR_CONFIG_HPP
