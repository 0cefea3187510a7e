#include "rqz_circle/pipeline.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "rqz_circle/errors.hpp"
#include "rqz_circle/naming.hpp"
#include "rqz_circle/text_exporter.hpp"

using nlohmann::json;

namespace fs = std::filesystem;

namespace rqz_circle {

namespace {

// 書き込み中は "<final>.part"。commit() されずに破棄されたら消す
class StagedFile {
public:
    explicit StagedFile(std::string final_path)
        : final_(std::move(final_path)), part_(final_ + ".part") {}

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    ~StagedFile() {
        std::error_code ec;
        if (!committed_) fs::remove(part_, ec);
    }

    const std::string& part_path() const { return part_; }
    const std::string& final_path() const { return final_; }

    void commit() {
        std::error_code ec;
        fs::rename(part_, final_, ec);
        if (ec) throw IoFailure("Failed to move " + part_ + " to " + final_ + ": " + ec.message());
        committed_ = true;
    }

private:
    std::string final_;
    std::string part_;
    bool committed_ = false;
};

} // namespace

OutputPaths output_paths(const std::string& output_dir, const std::string& name) {
    const fs::path base = fs::path(output_dir.empty() ? "." : output_dir) / name;
    OutputPaths p;
    p.text = base.string() + ".txt";
    p.track = base.string() + ".gpx";
    return p;
}

void write_outputs(const CirclePointRing& ring, const OutputPaths& paths, const TrackInfo& info) {
    StagedFile text(paths.text);
    StagedFile track(paths.track);

    write_text(ring, text.part_path());
    write_track(ring, track.part_path(), info);

    text.commit();
    try {
        track.commit();
    } catch (const IoFailure&) {
        // .txt だけが成功したように見えないよう取り消す
        std::error_code ec;
        fs::remove(text.final_path(), ec);
        throw;
    }
}

RunResult run(const RunConfig& cfg, const GeodesicEngine& engine) {
    RunResult r;
    r.ellipsoid = engine.ellipsoid();
    r.spec = to_circle_spec(cfg);
    r.name = resolved_output_name(cfg);
    r.paths = output_paths(cfg.output_dir, r.name);

    r.ring = generate_circle(engine, r.spec);
    r.check = check_ring(engine, r.spec.center, r.spec.radius_m, r.ring);
    r.metrics = measure_ring(engine, r.ring);

    write_outputs(r.ring, r.paths, describe_track(r.name, r.spec, cfg.author));
    return r;
}

json summarize(const RunResult& r) {
    return json{
        {"input", {
            {"center_lat", r.spec.center.lat},
            {"center_lon", r.spec.center.lon},
            {"center", format_center(r.spec.center)},
            {"radius_m", r.spec.radius_m},
            {"num_points", r.spec.num_points},
            {"units", {{"angles", "degrees"}, {"distance", "meters"}}},
            {"ellipsoid", {{"a", r.ellipsoid.a}, {"f", r.ellipsoid.f}}}
        }},
        {"method", "GeographicLib geodesic direct (Karney, WGS84)"},
        {"name", r.name},
        {"outputs", {{"text", r.paths.text}, {"track", r.paths.track}}},
        {"ring", {
            {"points", r.ring.size()},
            {"closed", !r.ring.empty() && r.ring.front() == r.ring.back()},
            {"perimeter_m", r.metrics.perimeter_m},
            {"area_m2", r.metrics.area_m2}
        }},
        {"check", {
            {"min_distance_m", r.check.min_distance_m},
            {"max_distance_m", r.check.max_distance_m},
            {"mean_distance_m", r.check.mean_distance_m},
            {"max_abs_error_m", r.check.max_abs_error_m}
        }}
    };
}

} // namespace rqz_circle
