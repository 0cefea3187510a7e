#include "rqz_circle/ring_check.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

#include <GeographicLib/PolygonArea.hpp>

namespace rqz_circle {

RingCheck check_ring(const GeodesicEngine& engine, const GeoPoint& center, double radius_m,
                     const CirclePointRing& ring) {
    RingCheck rc;
    if (ring.empty()) return rc;

    rc.distances_m.reserve(ring.size());
    double sum = 0.0;
    rc.min_distance_m = std::numeric_limits<double>::infinity();
    rc.max_distance_m = -std::numeric_limits<double>::infinity();

    for (const auto& p : ring) {
        const double d = engine.distance(center, p);
        rc.distances_m.push_back(d);
        sum += d;
        rc.min_distance_m = std::min(rc.min_distance_m, d);
        rc.max_distance_m = std::max(rc.max_distance_m, d);
        rc.max_abs_error_m = std::max(rc.max_abs_error_m, std::abs(d - radius_m));
    }
    rc.mean_distance_m = sum / static_cast<double>(ring.size());
    return rc;
}

RingMetrics measure_ring(const GeodesicEngine& engine, const CirclePointRing& ring) {
    RingMetrics m;

    // 末尾が先頭と同一点なら重複を避ける
    std::size_t n = ring.size();
    if (n >= 2 && ring.front() == ring.back()) n--;
    if (n < 3) return m;

    GeographicLib::PolygonArea poly(engine.geodesic());
    for (std::size_t i = 0; i < n; i++) {
        poly.AddPoint(ring[i].lat, ring[i].lon);
    }

    // reverse=false, sign=true（向きに関わらず符号付き面積を返す）
    double perimeter = 0.0, area = 0.0;
    poly.Compute(false, true, perimeter, area);

    m.perimeter_m = perimeter;
    m.area_m2 = std::abs(area);
    m.vertices_used = static_cast<int>(n);
    return m;
}

} // namespace rqz_circle
