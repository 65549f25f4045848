#ifndef GEARGEN_CLI_COMMON_HPP
#define GEARGEN_CLI_COMMON_HPP

#include <gear/gear_config.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace geargen::cli {

// Command-line values that override the configuration file
struct GearOverrides {
    std::optional<double> inner_radius;
    std::optional<double> outer_radius;
    std::optional<int> teeth;
    std::optional<double> thickness;
    std::optional<std::string> tooth_profile;
    std::optional<int> samples_per_tooth;
    std::optional<std::string> twist_type;
    std::optional<double> twist_amount;
    std::optional<int> vertical_layers;
    std::optional<std::string> cap_style;
    std::optional<int> threads;
};

struct CommandContext {
    std::string output_path;                 // Empty = auto name, "-" = stdout
    std::optional<std::string> config_path;
    std::optional<std::string> stats_path;
    GearOverrides overrides;
    bool verbose = false;
    bool help = false;
};

inline double parse_double(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
}

inline int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int result = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
    }
}

inline CommandContext parse_args(int argc, char** argv) {
    CommandContext ctx;
    int i = 1;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];
        auto& o = ctx.overrides;

        if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = next_value(arg);
        } else if (arg == "--stats") {
            ctx.stats_path = next_value(arg);
        } else if (arg == "--inner") {
            o.inner_radius = parse_double(arg, next_value(arg));
        } else if (arg == "--outer") {
            o.outer_radius = parse_double(arg, next_value(arg));
        } else if (arg == "--teeth") {
            o.teeth = parse_int(arg, next_value(arg));
        } else if (arg == "--thickness") {
            o.thickness = parse_double(arg, next_value(arg));
        } else if (arg == "--profile") {
            o.tooth_profile = next_value(arg);
        } else if (arg == "--samples") {
            o.samples_per_tooth = parse_int(arg, next_value(arg));
        } else if (arg == "--twist") {
            o.twist_type = next_value(arg);
        } else if (arg == "--twist-amount") {
            o.twist_amount = parse_double(arg, next_value(arg));
        } else if (arg == "--layers") {
            o.vertical_layers = parse_int(arg, next_value(arg));
        } else if (arg == "--caps") {
            o.cap_style = next_value(arg);
        } else if (arg == "--threads") {
            o.threads = parse_int(arg, next_value(arg));
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return ctx;
}

inline void apply_overrides(GearConfig& config, const GearOverrides& o) {
    if (o.inner_radius) config.inner_radius = *o.inner_radius;
    if (o.outer_radius) config.outer_radius = *o.outer_radius;
    if (o.teeth) config.teeth = *o.teeth;
    if (o.thickness) config.thickness = *o.thickness;
    if (o.tooth_profile) config.tooth_profile = *o.tooth_profile;
    if (o.samples_per_tooth) config.samples_per_tooth = *o.samples_per_tooth;
    if (o.twist_type) config.twist.type = *o.twist_type;
    if (o.twist_amount) config.twist.amount = *o.twist_amount;
    if (o.vertical_layers) config.vertical_layers = *o.vertical_layers;
    if (o.cap_style) config.cap_style = *o.cap_style;
    if (o.threads) config.threads = *o.threads;
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed writing file: " + path);
    }
}

}  // namespace geargen::cli

#endif // GEARGEN_CLI_COMMON_HPP
