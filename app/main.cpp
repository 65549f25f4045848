#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>
#include <gear/gear_config.hpp>
#include <gear/gear_generator.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n";
    std::cerr << "\n";
    std::cerr << "Generates a 3D gear mesh as a Wavefront OBJ file.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config <file>     JSON gear configuration\n";
    std::cerr << "  -o, --output <file>     Output OBJ (default <teeth>t_<outer>r_<thickness>y.obj, - for stdout)\n";
    std::cerr << "  --stats <file>          Write a JSON report with mesh statistics\n";
    std::cerr << "  --inner <r>             Inner radius (troughs between teeth)\n";
    std::cerr << "  --outer <r>             Outer radius (tooth tips)\n";
    std::cerr << "  --teeth <n>             Number of teeth\n";
    std::cerr << "  --thickness <t>         Extent along z\n";
    std::cerr << "  --profile <name>        vshape, ashape, sine, half_sine\n";
    std::cerr << "  --samples <n>           Samples per tooth\n";
    std::cerr << "  --twist <type>          straight, helical, fishbone, wave\n";
    std::cerr << "  --twist-amount <rad>    Twist angle in radians\n";
    std::cerr << "  --layers <n>            Vertical layers (ignored for straight gears)\n";
    std::cerr << "  --caps <style>          fan or ear_clip\n";
    std::cerr << "  --threads <n>           OpenMP threads for ring building (0 = default)\n";
    std::cerr << "  -v, --verbose           Debug logging\n";
    std::cerr << "  -h, --help              Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  GEARGEN_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    auto log = geargen::logging::get_logger();

    try {
        geargen::cli::CommandContext ctx = geargen::cli::parse_args(argc, argv);

        if (ctx.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        // 1. Configuration: file, then command-line overrides
        geargen::GearConfig config;
        if (ctx.config_path.has_value()) {
            nlohmann::json j = geargen::json::read_json_file(ctx.config_path.value());
            config = j.get<geargen::GearConfig>();
            log->info("Loaded configuration from: {}", ctx.config_path.value());
        }
        geargen::cli::apply_overrides(config, ctx.overrides);

        geargen::GearSpec spec = config.to_spec();
        log->info("Gear: {}", geargen::describe(spec));

        // 2. Generate
        geargen::Mesh mesh = geargen::generate_gear(spec);

        std::string obj = geargen::generate_gear_obj(spec, mesh, config.export_options);

        // 3. Write output
        std::string output_path = ctx.output_path.empty()
            ? geargen::default_output_name(spec)
            : ctx.output_path;

        if (output_path == "-") {
            std::cout << obj;
        } else {
            geargen::cli::write_file(output_path, obj);
            log->info("Wrote OBJ to {}", output_path);
            std::cerr << "Wrote " << output_path << " ("
                      << mesh.vertex_count() << " vertices, "
                      << mesh.face_count() << " faces)\n";
        }

        if (ctx.stats_path.has_value()) {
            geargen::json::SerializedData report;
            report.step = "gear_mesh";
            report.timestamp = geargen::json::get_timestamp();
            report.output_file = output_path;
            report.config = config;
            report.stats = geargen::mesh_stats_to_json(mesh);
            geargen::json::write_serialized(ctx.stats_path.value(), report);
            log->info("Wrote statistics to {}", ctx.stats_path.value());
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
