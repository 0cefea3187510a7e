#include "rqz_circle/circle_sampler.hpp"

#include <cmath>
#include <cstddef>
#include <string>

#include "rqz_circle/errors.hpp"

namespace rqz_circle {

double bearing_at(const CircleSpec& spec, int i) {
    return (static_cast<double>(i) * 360.0) / spec.num_points;
}

double round_coordinate(double deg) {
    static const double scale = std::pow(10.0, kCoordinateDecimals);
    // (-5e-7, 0) は -0.0 になるので +0.0 に寄せる（テキストに "-0" を出さない）
    return std::round(deg * scale) / scale + 0.0;
}

CirclePointRing generate_circle(const GeodesicEngine& engine, const CircleSpec& spec) {
    if (spec.num_points < 1) {
        throw InvalidInput("num_points must be >= 1, got " + std::to_string(spec.num_points));
    }
    if (!std::isfinite(spec.radius_m) || spec.radius_m <= 0.0) {
        throw InvalidInput("radius must be a finite positive number of meters, got " +
                           std::to_string(spec.radius_m));
    }

    CirclePointRing ring;
    ring.reserve(static_cast<std::size_t>(spec.num_points) + 1);

    // 0 .. num_points（両端含む）。最後の 360 度は 0 度と同じ点になりリングが閉じる
    for (int i = 0; i <= spec.num_points; i++) {
        const GeoPoint p = engine.solve_direct(spec.center, spec.radius_m, bearing_at(spec, i));
        ring.push_back(GeoPoint{round_coordinate(p.lat), round_coordinate(p.lon)});
    }
    return ring;
}

} // namespace rqz_circle
