#include "ring_builder.hpp"
#include "gear_errors.hpp"
#include "tooth_profiles.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <numbers>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace geargen {

RingContext RingContext::create(const GearSpec& spec) {
    // Bounded by GearSpec::validate()
    int points = static_cast<int>(spec.points_per_ring());
    return RingContext{
        spec,
        spec.tooth_shape ? spec.tooth_shape : default_tooth_shape(spec),
        points,
        2.0 * std::numbers::pi / static_cast<double>(points)
    };
}

double normalize_angle(double angle) {
    constexpr double two_pi = 2.0 * std::numbers::pi;
    double wrapped = std::fmod(angle, two_pi);
    if (wrapped < 0.0) {
        wrapped += two_pi;
    }
    // fmod of a tiny negative value can round up to exactly 2pi
    if (wrapped >= two_pi) {
        wrapped = 0.0;
    }
    return wrapped;
}

double evaluate_twist(const GearSpec& spec, int layer) {
    if (!spec.twist) {
        return 0.0;
    }

    double value;
    try {
        value = spec.twist(layer);
    } catch (const std::exception& e) {
        throw ShapeFunctionError(std::string("twist function threw: ") + e.what(), layer);
    } catch (...) {
        throw ShapeFunctionError("twist function threw a non-standard exception", layer);
    }

    if (!std::isfinite(value)) {
        throw ShapeFunctionError("twist function returned " + std::to_string(value), layer);
    }
    return value;
}

double evaluate_radius(const RingContext& ctx, int layer, double u, bool& clamped) {
    double offset;
    try {
        offset = ctx.tooth_shape(u);
    } catch (const std::exception& e) {
        throw ShapeFunctionError(std::string("tooth shape function threw: ") + e.what(), layer, u);
    } catch (...) {
        throw ShapeFunctionError("tooth shape function threw a non-standard exception", layer, u);
    }

    if (!std::isfinite(offset)) {
        throw ShapeFunctionError("tooth shape function returned " + std::to_string(offset), layer, u);
    }

    double radius = ctx.spec.inner_radius + offset;
    double bounded = std::clamp(radius, ctx.spec.inner_radius, ctx.spec.outer_radius);
    clamped = bounded != radius;
    return bounded;
}

Ring build_ring(const RingContext& ctx, int layer) {
    const int samples_per_tooth = ctx.spec.samples_per_tooth;

    Ring ring;
    ring.layer = layer;
    ring.twist = evaluate_twist(ctx.spec, layer);

    // Every tooth has the same silhouette; sample one and repeat it
    std::vector<double> tooth(samples_per_tooth);
    for (int s = 0; s < samples_per_tooth; ++s) {
        double u = static_cast<double>(s) / static_cast<double>(samples_per_tooth);
        bool clamped = false;
        tooth[s] = evaluate_radius(ctx, layer, u, clamped);
        if (clamped) {
            ring.clamped_samples += ctx.spec.teeth;
        }
    }

    ring.points.reserve(ctx.points_per_ring);
    for (int k = 0; k < ctx.points_per_ring; ++k) {
        double angle = ctx.angle_step * static_cast<double>(k);
        ring.points.push_back(RingPoint{
            normalize_angle(angle + ring.twist),
            tooth[k % samples_per_tooth]
        });
    }

    return ring;
}

std::vector<Ring> build_rings(const GearSpec& spec) {
    auto log = geargen::logging::get_logger();

    spec.validate();

    RingContext ctx = RingContext::create(spec);
    const int ring_count = spec.vertical_layers + 1;

    log->debug("RingBuilder: {} rings of {} points ({} teeth x {} samples)",
               ring_count, ctx.points_per_ring, spec.teeth, spec.samples_per_tooth);

#ifdef _OPENMP
    int max_threads = omp_get_max_threads();
    int use_threads = (spec.threads > 0) ? spec.threads : max_threads;
    log->debug("RingBuilder: using {} OpenMP threads", use_threads);
#else
    log->debug("RingBuilder: running single-threaded (OpenMP not available)");
#endif

    std::vector<Ring> rings(ring_count);
    std::vector<std::exception_ptr> failures(ring_count);

    // Layers are independent; each writes only its own slot
    #pragma omp parallel for schedule(static) num_threads(use_threads) if(ring_count > 8)
    for (int layer = 0; layer < ring_count; ++layer) {
        try {
            rings[layer] = build_ring(ctx, layer);
        } catch (...) {
            failures[layer] = std::current_exception();
        }
    }

    // Report the lowest failing layer, the same one a serial build would hit
    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    int clamped_total = 0;
    for (const auto& ring : rings) {
        log->debug("RingBuilder: layer {} twist = {}", ring.layer, ring.twist);
        clamped_total += ring.clamped_samples;
    }
    if (clamped_total > 0) {
        log->warn("RingBuilder: clamped {} samples into [{}, {}]",
                  clamped_total, spec.inner_radius, spec.outer_radius);
    }

    return rings;
}

}  // namespace geargen
