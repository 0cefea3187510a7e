#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "rqz_circle/circle_sampler.hpp"
#include "rqz_circle/geodesic_engine.hpp"
#include "rqz_circle/gpx_exporter.hpp"
#include "rqz_circle/ring_check.hpp"
#include "rqz_circle/run_config.hpp"

namespace rqz_circle {

struct OutputPaths {
    std::string text;  // {base}.txt
    std::string track; // {base}.gpx
};

OutputPaths output_paths(const std::string& output_dir, const std::string& name);

// .txt と .gpx を "<path>.part" に書いてから両方そろって rename する。
// 途中で失敗した場合は書きかけのファイルを消してから例外を投げ直す。
void write_outputs(const CirclePointRing& ring, const OutputPaths& paths, const TrackInfo& info);

struct RunResult {
    Ellipsoid ellipsoid;
    CircleSpec spec;
    std::string name;
    OutputPaths paths;
    CirclePointRing ring;
    RingCheck check;
    RingMetrics metrics;
};

// parameters -> ring -> check/metrics -> 2 ファイル
RunResult run(const RunConfig& cfg, const GeodesicEngine& engine);

nlohmann::json summarize(const RunResult& r);

} // namespace rqz_circle
