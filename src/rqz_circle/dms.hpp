#pragma once

#include <string>

#include "rqz_circle/geo_point.hpp"

namespace rqz_circle {

// 度分秒。符号は最初の非ゼロ成分で表す（-0 度 30 分 = {0, -30, 0}）。
struct DmsAngle {
    double degrees = 0.0;
    double minutes = 0.0;
    double seconds = 0.0;
};

double dms_to_decimal(const DmsAngle& angle);

GeoPoint dms_to_decimal(const DmsAngle& lat, const DmsAngle& lon);

// "78d56'34.68\"N 11d51'19.78\"E" のような緯度経度ペアを読む。
// Hemisphere letters decide which half is latitude; without them the first
// half is latitude.
GeoPoint parse_center_dms(const std::string& text);

} // namespace rqz_circle
