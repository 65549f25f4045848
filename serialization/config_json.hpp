#ifndef GEARGEN_SERIALIZATION_CONFIG_JSON_HPP
#define GEARGEN_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <gear/gear_config.hpp>
#include <mesh/mesh.hpp>
#include <mesh/obj_writer.hpp>

namespace geargen {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.at(2).get<double>();
}

// ObjExportOptions serialization
inline void to_json(nlohmann::json& j, const ObjExportOptions& options) {
    j = {
        {"precision", options.precision},
        {"object_name", options.object_name},
        {"scale", options.scale},
        {"offset", options.offset}
    };
}

inline void from_json(const nlohmann::json& j, ObjExportOptions& options) {
    options.precision = j.value("precision", 6);
    options.object_name = j.value("object_name", std::string("gear"));
    if (j.contains("scale")) {
        options.scale = j["scale"].get<Vec3>();
    }
    if (j.contains("offset")) {
        options.offset = j["offset"].get<Vec3>();
    }
}

// TwistConfig serialization
inline void to_json(nlohmann::json& j, const TwistConfig& twist) {
    j = {
        {"type", twist.type},
        {"amount", twist.amount},
        {"periods", twist.periods}
    };
}

inline void from_json(const nlohmann::json& j, TwistConfig& twist) {
    twist.type = j.value("type", std::string("straight"));
    twist.amount = j.value("amount", 0.0);
    twist.periods = j.value("periods", 1.0);
}

// GearConfig serialization
inline void to_json(nlohmann::json& j, const GearConfig& config) {
    j = {
        {"inner_radius", config.inner_radius},
        {"outer_radius", config.outer_radius},
        {"teeth", config.teeth},
        {"thickness", config.thickness},
        {"tooth_profile", config.tooth_profile},
        {"samples_per_tooth", config.samples_per_tooth},
        {"twist", config.twist},
        {"vertical_layers", config.vertical_layers},
        {"cap_style", config.cap_style},
        {"threads", config.threads},
        {"export", config.export_options}
    };
}

inline void from_json(const nlohmann::json& j, GearConfig& config) {
    config.inner_radius = j.value("inner_radius", 20.0);
    config.outer_radius = j.value("outer_radius", 24.0);
    config.teeth = j.value("teeth", 12);
    config.thickness = j.value("thickness", 4.0);
    config.tooth_profile = j.value("tooth_profile", std::string("sine"));
    config.samples_per_tooth = j.value("samples_per_tooth", 20);
    if (j.contains("twist")) {
        config.twist = j["twist"].get<TwistConfig>();
    }
    config.vertical_layers = j.value("vertical_layers", 32);
    config.cap_style = j.value("cap_style", std::string("fan"));
    config.threads = j.value("threads", 0);
    if (j.contains("export")) {
        config.export_options = j["export"].get<ObjExportOptions>();
    }
}

// Mesh summary for generation reports
inline nlohmann::json mesh_stats_to_json(const Mesh& mesh) {
    auto [min_pt, max_pt] = mesh.bounding_box();
    return {
        {"vertex_count", mesh.vertex_count()},
        {"face_count", mesh.face_count()},
        {"volume", mesh.signed_volume()},
        {"edge_manifold", mesh.is_edge_manifold()},
        {"bounding_box", {{"min", min_pt}, {"max", max_pt}}}
    };
}

}  // namespace geargen

#endif // GEARGEN_SERIALIZATION_CONFIG_JSON_HPP
