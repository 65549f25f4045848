#include "gear_config.hpp"
#include "gear_errors.hpp"
#include "tooth_profiles.hpp"

namespace geargen {

int GearConfig::effective_layers() const {
    // More than one band adds nothing to a spur gear
    return twist.type == "straight" ? 1 : vertical_layers;
}

AngleFn make_twist(const TwistConfig& config, int vertical_layers) {
    if (config.type == "straight") {
        return twist_over_layers(twist::straight(), vertical_layers);
    }
    if (config.type == "helical") {
        return twist_over_layers(twist::helical(config.amount), vertical_layers);
    }
    if (config.type == "fishbone") {
        return twist_over_layers(twist::fishbone(config.amount), vertical_layers);
    }
    if (config.type == "wave") {
        return twist_over_layers(twist::wave(config.amount, config.periods), vertical_layers);
    }
    throw InvalidParameter("unknown twist type '" + config.type +
                           "' (expected straight, helical, fishbone or wave)");
}

GearSpec GearConfig::to_spec() const {
    GearSpec spec;
    spec.inner_radius = inner_radius;
    spec.outer_radius = outer_radius;
    spec.teeth = teeth;
    spec.thickness = thickness;
    spec.vertical_layers = effective_layers();
    spec.samples_per_tooth = samples_per_tooth;
    spec.cap_style = cap_style_from_name(cap_style);
    spec.threads = threads;

    spec.validate();

    spec.tooth_shape = tooth_shape_from_profile(tooth_profile_from_name(tooth_profile),
                                                spec.tooth_depth());
    if (twist.type != "straight") {
        spec.twist = make_twist(twist, spec.vertical_layers);
    }

    return spec;
}

}  // namespace geargen
