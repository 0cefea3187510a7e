#include "rqz_circle/naming.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <system_error>

#include "rqz_circle/errors.hpp"

namespace rqz_circle {

std::string format_number(double v) {
    std::array<char, 512> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), v,
                                   std::chars_format::fixed);
    if (res.ec != std::errc()) {
        throw InvalidInput("cannot format number");
    }
    return std::string(buf.data(), res.ptr);
}

std::string format_center(const GeoPoint& center) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f_%.3f", center.lat, center.lon);
    return std::string(buf);
}

std::string default_output_name(double radius_m, const GeoPoint& center) {
    return format_number(radius_m) + "m_RQZ_Circle_w_Centre_" + format_center(center);
}

} // namespace rqz_circle
