#include "rqz_circle/dms.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include <GeographicLib/DMS.hpp>

#include "rqz_circle/errors.hpp"

namespace rqz_circle {

static void require_component(double v, const char* name, bool bounded) {
    if (!std::isfinite(v)) {
        throw InvalidInput(std::string("DMS ") + name + " is not finite");
    }
    if (bounded && std::abs(v) >= 60.0) {
        throw InvalidInput(std::string("DMS ") + name + " must be below 60 in magnitude");
    }
}

double dms_to_decimal(const DmsAngle& angle) {
    require_component(angle.degrees, "degrees", false);
    require_component(angle.minutes, "minutes", true);
    require_component(angle.seconds, "seconds", true);

    // 符号を持てるのは最初の非ゼロ成分だけ。それ以降の負値は InvalidInput
    double sign = 1.0;
    if (angle.degrees != 0.0) {
        sign = std::signbit(angle.degrees) ? -1.0 : 1.0;
        if (angle.minutes < 0.0 || angle.seconds < 0.0) {
            throw InvalidInput("DMS minutes and seconds must not be negative after non-zero degrees");
        }
    } else if (angle.minutes != 0.0) {
        sign = std::signbit(angle.minutes) ? -1.0 : 1.0;
        if (angle.seconds < 0.0) {
            throw InvalidInput("DMS seconds must not be negative after non-zero minutes");
        }
    } else if (std::signbit(angle.seconds)) {
        sign = -1.0;
    }

    // DMS::Decode(d, m, s) = d + (m + s/60)/60 なので、符号は外側で付ける
    return sign * GeographicLib::DMS::Decode(std::abs(angle.degrees),
                                             std::abs(angle.minutes),
                                             std::abs(angle.seconds));
}

GeoPoint dms_to_decimal(const DmsAngle& lat, const DmsAngle& lon) {
    return GeoPoint{dms_to_decimal(lat), dms_to_decimal(lon)};
}

GeoPoint parse_center_dms(const std::string& text) {
    std::istringstream iss(text);
    std::vector<std::string> parts;
    for (std::string tok; iss >> tok;) parts.push_back(tok);
    if (parts.size() != 2) {
        throw InvalidInput("expected \"<lat> <lon>\" in DMS, got: " + text);
    }

    GeoPoint p;
    try {
        // longfirst=false: 半球記号がなければ 1 つ目を緯度とみなす
        GeographicLib::DMS::DecodeLatLon(parts[0], parts[1], p.lat, p.lon, false);
    } catch (const GeographicLib::GeographicErr& e) {
        throw InvalidInput(std::string("cannot parse DMS center \"") + text + "\": " + e.what());
    }
    return p;
}

} // namespace rqz_circle
