#include <cstdlib>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rqz_circle/circle_sampler.hpp"
#include "rqz_circle/dms.hpp"
#include "rqz_circle/errors.hpp"
#include "rqz_circle/geodesic_engine.hpp"
#include "rqz_circle/pipeline.hpp"
#include "rqz_circle/run_config.hpp"

using nlohmann::json;

struct Args {
    rqz_circle::RunConfig cfg;
    bool check = false;  // 各点の逆問題距離を stderr に出す
    bool pretty = true;
};

static void die(const std::string& msg, int code = 2) {
    std::cerr << msg << "\n";
    std::exit(code);
}

static void usage(std::ostream& os) {
    os << "Usage: rqz_circle [options]\n"
       << "  --lat <deg> --lon <deg>  : center in decimal degrees\n"
       << "  --center \"<lat> <lon>\"   : center in DMS, e.g. \"78d56'34.68\\\"N 11d51'19.78\\\"E\"\n"
       << "  --radius <m>             : circle radius in meters (default 900)\n"
       << "  --points <n>             : number of bearings, 360/n deg apart (default 90)\n"
       << "  --name <base>            : output base name (<base>.txt, <base>.gpx)\n"
       << "  --out-dir <dir>          : output directory (default .)\n"
       << "  --config <file.json>     : JSON run config; later options override it\n"
       << "  --check                  : print recomputed distance of every point\n"
       << "  --compact                : compact JSON summary\n";
}

static Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; i++) {
        std::string k = argv[i];
        auto need = [&](const char* name) -> std::string {
            if (i + 1 >= argc) die(std::string("Missing value for ") + name);
            return std::string(argv[++i]);
        };

        try {
            if (k == "--lat") a.cfg.center.lat = std::stod(need("--lat"));
            else if (k == "--lon") a.cfg.center.lon = std::stod(need("--lon"));
            else if (k == "--center") a.cfg.center = rqz_circle::parse_center_dms(need("--center"));
            else if (k == "--radius") a.cfg.radius_m = std::stod(need("--radius"));
            else if (k == "--points") a.cfg.num_points = std::stoi(need("--points"));
            else if (k == "--name") a.cfg.output_name = need("--name");
            else if (k == "--out-dir") a.cfg.output_dir = need("--out-dir");
            else if (k == "--config") a.cfg = rqz_circle::load_run_config(need("--config"), a.cfg);
            else if (k == "--check") a.check = true;
            else if (k == "--compact") a.pretty = false;
            else if (k == "--help") {
                usage(std::cout);
                std::exit(0);
            } else {
                die("Unknown option: " + k);
            }
        } catch (const rqz_circle::InvalidInput& e) {
            die(e.what());
        } catch (const std::logic_error& e) {
            // std::stod / std::stoi (invalid_argument, out_of_range)
            die("Invalid value for " + k + ": " + e.what());
        }
    }
    return a;
}

static void print_check(const rqz_circle::RunResult& r) {
    std::cerr << std::fixed << std::setprecision(6);
    for (std::size_t i = 0; i < r.check.distances_m.size(); i++) {
        std::cerr << "[check] " << i
                  << " bearing=" << rqz_circle::bearing_at(r.spec, static_cast<int>(i))
                  << " distance_m=" << r.check.distances_m[i] << "\n";
    }
    std::cerr << std::defaultfloat;
}

int main(int argc, char** argv) {
    const Args args = parse_args(argc, argv);

    try {
        // WGS84 楕円体で測地計算
        const rqz_circle::GeodesicEngine engine(rqz_circle::Ellipsoid::wgs84());

        const rqz_circle::RunResult r = rqz_circle::run(args.cfg, engine);

        if (args.check) print_check(r);
        if (r.check.max_abs_error_m > 0.1) {
            std::cerr << "[warn] ring deviates from the radius by up to "
                      << r.check.max_abs_error_m << " m\n";
        }

        // サマリは stderr へ
        const json summary = rqz_circle::summarize(r);
        if (args.pretty) std::cerr << summary.dump(2) << "\n";
        else std::cerr << summary.dump() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
