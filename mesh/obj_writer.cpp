#include "obj_writer.hpp"
#include <gear/gear_errors.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace geargen {

namespace {

// Coordinates keep at least this many significant digits relative to the
// largest coordinate of the mesh
constexpr int SIGNIFICANT_DIGITS = 6;

// Values that print as zero are written as positive zero
double printable(double value, double half_ulp) {
    return std::abs(value) < half_ulp ? 0.0 : value;
}

int decimals_for(const std::vector<Vec3>& positions, int precision) {
    double extent = 0.0;
    for (const auto& p : positions) {
        extent = std::max({extent, std::abs(p.x), std::abs(p.y), std::abs(p.z)});
    }
    if (extent == 0.0) {
        return precision;
    }
    int leading = static_cast<int>(std::floor(std::log10(extent)));
    return std::max(precision, SIGNIFICANT_DIGITS - 1 - leading);
}

}  // namespace

void write_obj(const Mesh& mesh, std::ostream& out, const ObjExportOptions& options) {
    out << to_obj(mesh, options);
}

std::string to_obj(const Mesh& mesh, const ObjExportOptions& options) {
    if (options.precision < 1 || options.precision > 17) {
        throw InvalidParameter("OBJ precision must be in [1, 17], got " +
                               std::to_string(options.precision));
    }

    std::vector<Vec3> positions;
    positions.reserve(mesh.vertex_count());
    for (const auto& v : mesh.vertices()) {
        positions.push_back(v.scaled(options.scale) + options.offset);
    }

    const int decimals = decimals_for(positions, options.precision);
    const double half_ulp = 0.5 * std::pow(10.0, -decimals);

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals);

    ss << "# GearGen OBJ Export\n";
    ss << "# Vertices: " << mesh.vertex_count() << "\n";
    ss << "# Faces: " << mesh.face_count() << "\n";
    for (const auto& comment : options.comments) {
        ss << "# " << comment << "\n";
    }
    ss << "o " << options.object_name << "\n";

    for (const auto& p : positions) {
        ss << "v " << printable(p.x, half_ulp)
           << " " << printable(p.y, half_ulp)
           << " " << printable(p.z, half_ulp) << "\n";
    }

    ss << "s off\n";

    for (const auto& face : mesh.faces()) {
        ss << "f";
        for (VertexIndex index : face.indices) {
            ss << " " << (index + 1);
        }
        ss << "\n";
    }

    return ss.str();
}

}  // namespace geargen
