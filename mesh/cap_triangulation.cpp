#include "cap_triangulation.hpp"
#include <gear/gear_errors.hpp>
#include <cmath>
#include <list>

namespace geargen {

double signed_area_xy(const Vec3& a, const Vec3& b, const Vec3& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

namespace {

// Inside or on the boundary of counterclockwise triangle abc
bool point_in_triangle(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c) {
    return signed_area_xy(a, b, p) >= 0.0 &&
           signed_area_xy(b, c, p) >= 0.0 &&
           signed_area_xy(c, a, p) >= 0.0;
}

double edge_length_xy(const Vec3& a, const Vec3& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

// Twice the area of abc is |ab| |bc| sin(turn at b); below this the turn is
// treated as straight
bool is_convex_corner(const Vec3& a, const Vec3& b, const Vec3& c) {
    double tolerance = edge_length_xy(a, b) * edge_length_xy(b, c) * 1e-12;
    return signed_area_xy(a, b, c) > tolerance;
}

}  // namespace

std::vector<CapTriangle> ear_clip(const std::vector<Vec3>& polygon) {
    if (polygon.size() < 3) {
        throw DegenerateMeshError("cap polygon needs at least 3 points, got " +
                                  std::to_string(polygon.size()));
    }

    std::list<size_t> remaining;
    for (size_t i = 0; i < polygon.size(); ++i) {
        remaining.push_back(i);
    }

    std::vector<CapTriangle> triangles;
    triangles.reserve(polygon.size() - 2);

    auto next_of = [&remaining](std::list<size_t>::iterator it) {
        ++it;
        return it == remaining.end() ? remaining.begin() : it;
    };
    auto prev_of = [&remaining](std::list<size_t>::iterator it) {
        if (it == remaining.begin()) {
            it = remaining.end();
        }
        return --it;
    };

    auto is_ear = [&](std::list<size_t>::iterator it) {
        size_t a = *prev_of(it);
        size_t b = *it;
        size_t c = *next_of(it);
        if (!is_convex_corner(polygon[a], polygon[b], polygon[c])) {
            return false;  // reflex or collinear
        }
        for (size_t other : remaining) {
            if (other == a || other == b || other == c) {
                continue;
            }
            if (point_in_triangle(polygon[other], polygon[a], polygon[b], polygon[c])) {
                return false;
            }
        }
        return true;
    };

    // Resume the search where the last ear was cut; a full lap without an
    // ear means the outline cannot be triangulated
    auto cursor = remaining.begin();
    while (remaining.size() > 3) {
        bool clipped = false;
        for (size_t tries = remaining.size(); tries > 0; --tries) {
            if (is_ear(cursor)) {
                triangles.push_back({*prev_of(cursor), *cursor, *next_of(cursor)});
                auto after = next_of(cursor);
                remaining.erase(cursor);
                cursor = after;
                clipped = true;
                break;
            }
            cursor = next_of(cursor);
        }
        if (!clipped) {
            throw DegenerateMeshError("no ear found with " + std::to_string(remaining.size()) +
                                      " cap points left; outline is collinear or self-intersecting");
        }
    }

    auto it = remaining.begin();
    size_t a = *it++;
    size_t b = *it++;
    size_t c = *it;
    if (!is_convex_corner(polygon[a], polygon[b], polygon[c])) {
        throw DegenerateMeshError("final cap triangle has zero area");
    }
    triangles.push_back({a, b, c});

    return triangles;
}

}  // namespace geargen
