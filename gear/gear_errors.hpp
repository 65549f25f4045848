#ifndef GEARGEN_GEAR_GEAR_ERRORS_HPP
#define GEARGEN_GEAR_GEAR_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace geargen {

// Base of every error raised while generating a gear. All of them are
// terminal for the current generation call.
class GearError : public std::runtime_error {
public:
    explicit GearError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed GearSpec or configuration; raised before any sampling happens.
class InvalidParameter : public GearError {
public:
    explicit InvalidParameter(const std::string& message)
        : GearError("Invalid parameter: " + message) {}
};

// A caller-supplied tooth shape or twist function threw or returned a
// non-finite value. Twist failures have no in-tooth position.
class ShapeFunctionError : public GearError {
public:
    ShapeFunctionError(const std::string& message, int layer, std::optional<double> u = std::nullopt)
        : GearError(format(message, layer, u)), layer_(layer), u_(u) {}

    int layer() const { return layer_; }
    std::optional<double> u() const { return u_; }

private:
    static std::string format(const std::string& message, int layer, std::optional<double> u) {
        std::string where = "layer " + std::to_string(layer);
        if (u.has_value()) {
            where += ", u=" + std::to_string(*u);
        }
        return "Shape function error at " + where + ": " + message;
    }

    int layer_;
    std::optional<double> u_;
};

// Geometry collapsed into zero-length edges or zero-area faces.
class DegenerateMeshError : public GearError {
public:
    explicit DegenerateMeshError(const std::string& message)
        : GearError("Degenerate mesh: " + message) {}
};

}  // namespace geargen

#endif // GEARGEN_GEAR_GEAR_ERRORS_HPP
