#pragma once

#include <GeographicLib/Geodesic.hpp>

#include "rqz_circle/geo_point.hpp"

namespace rqz_circle {

struct InverseSolution {
    double distance_m = 0.0;   // s12: 測地線に沿った距離 [m]
    double azimuth1_deg = 0.0; // 点1での方位角
    double azimuth2_deg = 0.0; // 点2での方位角（前進方向）
};

// Karney の直接問題・逆問題を GeographicLib で解く。状態を持たない。
class GeodesicEngine {
public:
    explicit GeodesicEngine(const Ellipsoid& ellipsoid = Ellipsoid::wgs84());

    // center から bearing_deg（真北から時計回り, mod 360）方向に distance_m 進んだ点
    // Throws InvalidInput for negative/non-finite distance or a bad center,
    // NumericFailure if the solver result is not finite.
    GeoPoint solve_direct(const GeoPoint& center, double distance_m, double bearing_deg) const;

    InverseSolution solve_inverse(const GeoPoint& from, const GeoPoint& to) const;

    double distance(const GeoPoint& from, const GeoPoint& to) const {
        return solve_inverse(from, to).distance_m;
    }

    const Ellipsoid& ellipsoid() const { return ellipsoid_; }
    const GeographicLib::Geodesic& geodesic() const { return geod_; }

private:
    Ellipsoid ellipsoid_;
    GeographicLib::Geodesic geod_;
};

// [0, 360) に正規化。360 は 0 になる。
double normalize_bearing(double bearing_deg);

} // namespace rqz_circle
