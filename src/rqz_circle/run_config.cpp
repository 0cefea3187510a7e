#include "rqz_circle/run_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

#include "rqz_circle/dms.hpp"
#include "rqz_circle/errors.hpp"
#include "rqz_circle/naming.hpp"

using nlohmann::json;

namespace rqz_circle {

GeoPoint default_center() {
    return dms_to_decimal(DmsAngle{78, 56, 34.68}, DmsAngle{11, 51, 19.78});
}

static DmsAngle dms_from_json(const json& arr, const char* what) {
    if (!arr.is_array() || arr.empty() || arr.size() > 3) {
        throw InvalidInput(std::string("center_dms.") + what + " must be [deg, min, sec]");
    }
    DmsAngle a;
    a.degrees = arr.at(0).get<double>();
    if (arr.size() > 1) a.minutes = arr.at(1).get<double>();
    if (arr.size() > 2) a.seconds = arr.at(2).get<double>();
    return a;
}

void apply_config_json(RunConfig& cfg, const json& j) {
    if (!j.is_object()) throw InvalidInput("run config must be a JSON object");

    try {
        if (j.contains("center") && j.contains("center_dms")) {
            throw InvalidInput("run config has both \"center\" and \"center_dms\"");
        }
        if (j.contains("center")) {
            const json& c = j.at("center");
            cfg.center = GeoPoint{c.at("lat").get<double>(), c.at("lon").get<double>()};
        } else if (j.contains("center_dms")) {
            const json& c = j.at("center_dms");
            cfg.center = dms_to_decimal(dms_from_json(c.at("lat"), "lat"),
                                        dms_from_json(c.at("lon"), "lon"));
        }

        cfg.radius_m = j.value("radius_m", cfg.radius_m);
        if (j.contains("num_points")) {
            // get<int>() は浮動小数を static_cast で切り捨てるので、整数型と範囲を先に確かめる
            const json& n = j.at("num_points");
            if (!n.is_number_integer()) {
                throw InvalidInput("\"num_points\" must be an integer, got " + n.dump());
            }
            const bool in_range = n.is_number_unsigned()
                ? n.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                : n.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  n.get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range) throw InvalidInput("\"num_points\" out of range: " + n.dump());
            cfg.num_points = static_cast<int>(n.get<std::int64_t>());
        }
        cfg.output_name = j.value("output_name", cfg.output_name);
        cfg.output_dir = j.value("output_dir", cfg.output_dir);

        if (j.contains("track")) {
            const json& t = j.at("track");
            if (!t.is_object()) throw InvalidInput("\"track\" must be an object");
            cfg.author.name = t.value("author", cfg.author.name);
            cfg.author.email = t.value("email", cfg.author.email);
            cfg.author.purpose = t.value("description", cfg.author.purpose);
        }
    } catch (const json::exception& e) {
        throw InvalidInput(std::string("invalid run config: ") + e.what());
    }
}

RunConfig load_run_config(const std::string& path, RunConfig base) {
    std::ifstream ifs(path);
    if (!ifs) throw InvalidInput("Failed to open config: " + path);

    json j;
    try {
        ifs >> j;
    } catch (const json::exception& e) {
        throw InvalidInput("Failed to parse JSON config " + path + ": " + e.what());
    }
    apply_config_json(base, j);
    return base;
}

std::string resolved_output_name(const RunConfig& cfg) {
    if (!cfg.output_name.empty()) return cfg.output_name;
    return default_output_name(cfg.radius_m, cfg.center);
}

CircleSpec to_circle_spec(const RunConfig& cfg) {
    CircleSpec spec;
    spec.center = cfg.center;
    spec.radius_m = cfg.radius_m;
    spec.num_points = cfg.num_points;
    return spec;
}

} // namespace rqz_circle
