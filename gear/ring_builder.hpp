#ifndef GEARGEN_GEAR_RING_BUILDER_HPP
#define GEARGEN_GEAR_RING_BUILDER_HPP

#include "gear_spec.hpp"
#include <cstddef>
#include <vector>

namespace geargen {

// One sample of a ring in polar form, angle already twisted and in [0, 2pi)
struct RingPoint {
    double angle;
    double radius;
};

// Closed 2-D outline of one layer. Points are ordered by their angle before
// twist, so point i of every ring of a gear describes the same tooth position.
struct Ring {
    int layer = 0;
    double twist = 0.0;
    std::vector<RingPoint> points;
    int clamped_samples = 0;    // Samples pulled back into [inner, outer] radius

    size_t size() const { return points.size(); }
};

// Immutable context shared by every layer (doesn't change during build)
struct RingContext {
    const GearSpec& spec;
    ToothShapeFn tooth_shape;   // Resolved: spec.tooth_shape or the default tooth
    int points_per_ring;
    double angle_step;

    static RingContext create(const GearSpec& spec);
};

// Build all vertical_layers + 1 rings in layer order - main entry point.
// Validates the GearSpec first.
std::vector<Ring> build_rings(const GearSpec& spec);

// Build the ring of a single layer
Ring build_ring(const RingContext& ctx, int layer);

// Evaluate the twist of a layer, wrapping caller failures in ShapeFunctionError
double evaluate_twist(const GearSpec& spec, int layer);

// Evaluate the tooth radius at in-tooth position u, clamped into
// [inner_radius, outer_radius]. Sets clamped when the clamp was applied.
double evaluate_radius(const RingContext& ctx, int layer, double u, bool& clamped);

// Wrap an angle into [0, 2pi)
double normalize_angle(double angle);

}  // namespace geargen

#endif // GEARGEN_GEAR_RING_BUILDER_HPP
