#pragma once

#include <vector>

#include <GeographicLib/Constants.hpp>

namespace rqz_circle {

// (lat, lon) decimal degrees, WGS84 convention. lon is never wrapped.
struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
    return a.lat == b.lat && a.lon == b.lon;
}

inline bool operator!=(const GeoPoint& a, const GeoPoint& b) {
    return !(a == b);
}

// 回転楕円体 (a: 長半径 [m], f: 扁平率)
struct Ellipsoid {
    double a = GeographicLib::Constants::WGS84_a();
    double f = GeographicLib::Constants::WGS84_f();

    static Ellipsoid wgs84() { return Ellipsoid{}; }
};

// index 0 と index n は同じ点（bearing 0 / 360）で閉じている
using CirclePointRing = std::vector<GeoPoint>;

} // namespace rqz_circle
