#ifndef GEARGEN_GEAR_GEAR_SPEC_HPP
#define GEARGEN_GEAR_GEAR_SPEC_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace geargen {

// Maps a position within one tooth slice, u in [0,1), to a radial offset
// added to the inner radius. Must be pure: it is called once per sample.
using ToothShapeFn = std::function<double(double)>;

// Maps a layer index in [0, vertical_layers] to a twist in radians.
using AngleFn = std::function<double(int)>;

enum class CapStyle {
    Fan,      // Fan from a synthesized centre vertex
    EarClip   // Ear clipping of the ring polygon, no extra vertices
};

// Immutable description of one gear
struct GearSpec {
    double inner_radius = 20.0;       // Radius at the troughs between teeth
    double outer_radius = 24.0;       // Radius at the tooth tips
    int teeth = 12;
    double thickness = 4.0;           // Extent along z

    // Empty means the default sine tooth spanning the full tooth depth
    ToothShapeFn tooth_shape;

    // Empty means no twist (spur gear)
    AngleFn twist;

    int vertical_layers = 1;          // Rings produced = vertical_layers + 1
    int samples_per_tooth = 20;
    CapStyle cap_style = CapStyle::Fan;

    int threads = 0;                  // OpenMP threads for ring building, 0 = default

    std::int64_t points_per_ring() const {
        return static_cast<std::int64_t>(teeth) * samples_per_tooth;
    }

    double tooth_depth() const {
        return outer_radius - inner_radius;
    }

    double layer_height() const {
        return thickness / static_cast<double>(vertical_layers);
    }

    // Throws InvalidParameter when any field is out of its domain or the
    // mesh would need more vertices than a VertexIndex can address
    void validate() const;
};

const char* cap_style_name(CapStyle style);

// Throws InvalidParameter for unknown names
CapStyle cap_style_from_name(const std::string& name);

}  // namespace geargen

#endif // GEARGEN_GEAR_GEAR_SPEC_HPP
