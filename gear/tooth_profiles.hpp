#ifndef GEARGEN_GEAR_TOOTH_PROFILES_HPP
#define GEARGEN_GEAR_TOOTH_PROFILES_HPP

#include "gear_spec.hpp"
#include <functional>
#include <string>
#include <vector>

namespace geargen {

// Normalized tooth silhouette: u in [0,1) to height in [0,1], where 0 sits on
// the inner radius and 1 reaches the outer radius. Teeth are traced
// counterclockwise looking down the z axis.
using ToothProfile = std::function<double(double)>;

// Twist over the thickness: progress in [0,1] to radians.
using TwistCurve = std::function<double(double)>;

namespace profile {

double vshape(double u);      // Trough in the middle of the slice
double ashape(double u);      // Peak in the middle of the slice
double sine(double u);        // Rounded tooth, the default
double half_sine(double u);   // Undercut tooth with a flat root

}  // namespace profile

// Looks up a built-in profile; throws InvalidParameter for unknown names
ToothProfile tooth_profile_from_name(const std::string& name);

std::vector<std::string> tooth_profile_names();

// Scales a normalized profile into a radial offset over [0, depth]
ToothShapeFn tooth_shape_from_profile(ToothProfile profile, double depth);

// Default tooth for a GearSpec without an explicit tooth_shape
ToothShapeFn default_tooth_shape(const GearSpec& spec);

namespace twist {

TwistCurve straight();

// Rotates uniformly up to total_angle at the top face
TwistCurve helical(double total_angle);

// Reverses direction at mid thickness, forming chevron teeth
TwistCurve fishbone(double amplitude);

TwistCurve wave(double amplitude, double periods);

}  // namespace twist

// Samples a progress curve at layer / vertical_layers
AngleFn twist_over_layers(TwistCurve curve, int vertical_layers);

}  // namespace geargen

#endif // GEARGEN_GEAR_TOOTH_PROFILES_HPP
