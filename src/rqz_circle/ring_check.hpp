#pragma once

#include <vector>

#include "rqz_circle/geo_point.hpp"
#include "rqz_circle/geodesic_engine.hpp"

namespace rqz_circle {

// 逆問題で中心から各点までの距離を測り直した結果
struct RingCheck {
    std::vector<double> distances_m; // ring と同じ順
    double min_distance_m = 0.0;
    double max_distance_m = 0.0;
    double mean_distance_m = 0.0;
    double max_abs_error_m = 0.0;    // max |distance - radius|
};

RingCheck check_ring(const GeodesicEngine& engine, const GeoPoint& center, double radius_m,
                     const CirclePointRing& ring);

struct RingMetrics {
    double perimeter_m = 0.0;
    double area_m2 = 0.0;  // abs
    int vertices_used = 0; // 閉じ点を除いた頂点数
};

// 測地多角形としての周長・面積。3 頂点未満なら 0 のまま返す
RingMetrics measure_ring(const GeodesicEngine& engine, const CirclePointRing& ring);

} // namespace rqz_circle
