#pragma once

#include <string>

#include "rqz_circle/geo_point.hpp"

namespace rqz_circle {

// 元の double に戻せる最短の固定小数表記（78.9 -> "78.9", 900.0 -> "900"）
std::string format_number(double v);

// "%.3f_%.3f" (lat_lon)。ファイル名と GPX の説明文に使う
std::string format_center(const GeoPoint& center);

// "{radius}m_RQZ_Circle_w_Centre_{lat}_{lon}"
std::string default_output_name(double radius_m, const GeoPoint& center);

} // namespace rqz_circle
