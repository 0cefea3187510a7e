#include "rqz_circle/geodesic_engine.hpp"

#include <cmath>
#include <string>

#include "rqz_circle/errors.hpp"

namespace rqz_circle {

static void require_valid_point(const GeoPoint& p, const char* what) {
    if (!std::isfinite(p.lat) || !std::isfinite(p.lon)) {
        throw InvalidInput(std::string(what) + " is not a finite coordinate");
    }
    if (std::abs(p.lat) > 90.0) {
        throw InvalidInput(std::string(what) + " latitude out of range [-90, 90]: " +
                           std::to_string(p.lat));
    }
}

double normalize_bearing(double bearing_deg) {
    double b = std::fmod(bearing_deg, 360.0);
    if (b < 0) b += 360.0;
    // fmod(-0.0) や丸めで 360 ちょうどが残るケースを潰す
    if (b >= 360.0) b -= 360.0;
    return b + 0.0;
}

static const Ellipsoid& require_valid_ellipsoid(const Ellipsoid& e) {
    if (!std::isfinite(e.a) || e.a <= 0.0 || !std::isfinite(e.f) || e.f >= 1.0) {
        throw InvalidInput("invalid ellipsoid: a=" + std::to_string(e.a) +
                           ", f=" + std::to_string(e.f));
    }
    return e;
}

GeodesicEngine::GeodesicEngine(const Ellipsoid& ellipsoid)
    : ellipsoid_(require_valid_ellipsoid(ellipsoid)),
      geod_(ellipsoid_.a, ellipsoid_.f) {}

GeoPoint GeodesicEngine::solve_direct(const GeoPoint& center, double distance_m,
                                      double bearing_deg) const {
    require_valid_point(center, "center");
    if (!std::isfinite(distance_m) || distance_m < 0.0) {
        throw InvalidInput("distance must be a finite non-negative number of meters, got " +
                           std::to_string(distance_m));
    }
    if (!std::isfinite(bearing_deg)) {
        throw InvalidInput("bearing is not finite");
    }

    if (distance_m == 0.0) return center;

    const double azi1 = normalize_bearing(bearing_deg);

    // direct: (lat1, lon1, azi1, s12) -> (lat2, lon2)
    double lat2 = 0.0, lon2 = 0.0;
    geod_.Direct(center.lat, center.lon, azi1, distance_m, lat2, lon2);

    // GeographicLib の Direct は非反復。有限な入力ではここに到達しない
    if (!std::isfinite(lat2) || !std::isfinite(lon2)) {
        throw NumericFailure("geodesic direct solution did not converge (bearing " +
                             std::to_string(azi1) + ", distance " +
                             std::to_string(distance_m) + " m)");
    }
    return GeoPoint{lat2, lon2};
}

InverseSolution GeodesicEngine::solve_inverse(const GeoPoint& from, const GeoPoint& to) const {
    require_valid_point(from, "first point");
    require_valid_point(to, "second point");

    // Inverse の引数は (lat, lon) の順。小文字 s12 が距離 [m]
    InverseSolution sol;
    geod_.Inverse(from.lat, from.lon, to.lat, to.lon,
                  sol.distance_m, sol.azimuth1_deg, sol.azimuth2_deg);

    // Inverse の Newton 反復は失敗時も二分法に落ちて収束する (Karney 2013)。同じく有限な入力では到達しない
    if (!std::isfinite(sol.distance_m)) {
        throw NumericFailure("geodesic inverse solution did not converge");
    }
    return sol;
}

} // namespace rqz_circle
