#pragma once

#include "rqz_circle/geo_point.hpp"
#include "rqz_circle/geodesic_engine.hpp"

namespace rqz_circle {

// 出力座標の桁数（1e-6 deg ≒ 赤道で 0.11 m）
constexpr int kCoordinateDecimals = 6;

struct CircleSpec {
    GeoPoint center;
    double radius_m = 0.0;
    int num_points = 90; // 方位角分割数（360/num_points 度ごと）
};

// i 番目のサンプルで使う真方位 (i * 360 / num_points)。i == num_points で 360。
double bearing_at(const CircleSpec& spec, int i);

// 小数点以下 kCoordinateDecimals 桁に丸める
double round_coordinate(double deg);

// num_points + 1 点の閉じたリングを返す（先頭と末尾は同一点）
// Throws InvalidInput for num_points < 1 or a non-positive radius; geodesic
// failures propagate unchanged.
CirclePointRing generate_circle(const GeodesicEngine& engine, const CircleSpec& spec);

} // namespace rqz_circle
