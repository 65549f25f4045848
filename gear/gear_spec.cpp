#include "gear_spec.hpp"
#include "gear_errors.hpp"
#include <mesh/mesh.hpp>
#include <cmath>
#include <limits>

namespace geargen {

namespace {

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw InvalidParameter(std::string(name) + " must be finite");
    }
}

}  // namespace

void GearSpec::validate() const {
    require_finite(inner_radius, "inner_radius");
    require_finite(outer_radius, "outer_radius");
    require_finite(thickness, "thickness");

    if (inner_radius <= 0.0) {
        throw InvalidParameter("inner_radius must be > 0, got " + std::to_string(inner_radius));
    }
    if (outer_radius <= inner_radius) {
        throw InvalidParameter("outer_radius must be > inner_radius (" +
                               std::to_string(outer_radius) + " <= " +
                               std::to_string(inner_radius) + ")");
    }
    if (teeth < 2) {
        throw InvalidParameter("teeth must be >= 2, got " + std::to_string(teeth));
    }
    if (thickness <= 0.0) {
        throw InvalidParameter("thickness must be > 0, got " + std::to_string(thickness));
    }
    if (vertical_layers < 1) {
        throw InvalidParameter("vertical_layers must be >= 1, got " + std::to_string(vertical_layers));
    }
    if (samples_per_tooth < 1) {
        throw InvalidParameter("samples_per_tooth must be >= 1, got " + std::to_string(samples_per_tooth));
    }
    if (threads < 0) {
        throw InvalidParameter("threads must be >= 0, got " + std::to_string(threads));
    }
    // A ring needs three points to enclose any area
    const std::int64_t ring_points = points_per_ring();
    if (ring_points < 3) {
        throw InvalidParameter("teeth * samples_per_tooth must be >= 3, got " +
                               std::to_string(ring_points));
    }
    // (vertical_layers + 1) rings plus two fan centres
    const std::int64_t rings = static_cast<std::int64_t>(vertical_layers) + 1;
    const std::int64_t max_vertices = std::numeric_limits<VertexIndex>::max();
    if (ring_points > (max_vertices - 2) / rings) {
        throw InvalidParameter("gear needs " + std::to_string(rings) + " rings of " +
                               std::to_string(ring_points) + " points, more than " +
                               std::to_string(max_vertices) + " vertices");
    }
}

const char* cap_style_name(CapStyle style) {
    switch (style) {
        case CapStyle::Fan: return "fan";
        case CapStyle::EarClip: return "ear_clip";
    }
    return "fan";
}

CapStyle cap_style_from_name(const std::string& name) {
    if (name == "fan") return CapStyle::Fan;
    if (name == "ear_clip") return CapStyle::EarClip;
    throw InvalidParameter("unknown cap style '" + name + "' (expected fan or ear_clip)");
}

}  // namespace geargen
