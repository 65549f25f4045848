#include "tooth_profiles.hpp"
#include "gear_errors.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace geargen {

namespace profile {

double vshape(double u) {
    return std::abs(0.5 - u) * 2.0;
}

double ashape(double u) {
    return 1.0 - vshape(u);
}

double sine(double u) {
    return std::cos(u * 2.0 * std::numbers::pi) / 2.0 + 0.5;
}

double half_sine(double u) {
    return std::max(std::cos(u * 2.0 * std::numbers::pi), 0.0);
}

}  // namespace profile

ToothProfile tooth_profile_from_name(const std::string& name) {
    if (name == "vshape") return profile::vshape;
    if (name == "ashape") return profile::ashape;
    if (name == "sine") return profile::sine;
    if (name == "half_sine") return profile::half_sine;
    throw InvalidParameter("unknown tooth profile '" + name + "'");
}

std::vector<std::string> tooth_profile_names() {
    return {"vshape", "ashape", "sine", "half_sine"};
}

ToothShapeFn tooth_shape_from_profile(ToothProfile profile, double depth) {
    return [profile = std::move(profile), depth](double u) {
        return profile(u) * depth;
    };
}

ToothShapeFn default_tooth_shape(const GearSpec& spec) {
    return tooth_shape_from_profile(profile::sine, spec.tooth_depth());
}

namespace twist {

TwistCurve straight() {
    return [](double) { return 0.0; };
}

TwistCurve helical(double total_angle) {
    return [total_angle](double p) { return total_angle * p; };
}

TwistCurve fishbone(double amplitude) {
    // Same offset on both faces, none at mid thickness
    return [amplitude](double p) { return amplitude * profile::vshape(p); };
}

TwistCurve wave(double amplitude, double periods) {
    return [amplitude, periods](double p) {
        return amplitude * std::sin(2.0 * std::numbers::pi * periods * p);
    };
}

}  // namespace twist

AngleFn twist_over_layers(TwistCurve curve, int vertical_layers) {
    if (vertical_layers < 1) {
        throw InvalidParameter("vertical_layers must be >= 1, got " + std::to_string(vertical_layers));
    }
    return [curve = std::move(curve), vertical_layers](int layer) {
        return curve(static_cast<double>(layer) / static_cast<double>(vertical_layers));
    };
}

}  // namespace geargen
