#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "rqz_circle/circle_sampler.hpp"
#include "rqz_circle/geo_point.hpp"
#include "rqz_circle/gpx_exporter.hpp"

namespace rqz_circle {

// 観測所（Brandal）: 78°56'34.68"N 11°51'19.78"E
GeoPoint default_center();

struct RunConfig {
    GeoPoint center = default_center();
    double radius_m = 900.0;
    int num_points = 90;
    std::string output_name; // 空なら default_output_name() で決める
    std::string output_dir = ".";
    TrackAuthor author;
};

// JSON の run config を cfg に上書き適用する。存在しないキーはそのまま。
//   {"center": {"lat": .., "lon": ..}} または {"center_dms": {"lat": [d,m,s], "lon": [d,m,s]}}
//   "radius_m", "num_points", "output_name", "output_dir",
//   "track": {"author", "email", "description"}
// Throws InvalidInput on wrong types or malformed DMS arrays.
void apply_config_json(RunConfig& cfg, const nlohmann::json& j);

// Throws InvalidInput if the file cannot be read or parsed.
RunConfig load_run_config(const std::string& path, RunConfig base = RunConfig());

std::string resolved_output_name(const RunConfig& cfg);

CircleSpec to_circle_spec(const RunConfig& cfg);

} // namespace rqz_circle
