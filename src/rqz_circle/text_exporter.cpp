#include "rqz_circle/text_exporter.hpp"

#include <filesystem>
#include <fstream>

#include "rqz_circle/errors.hpp"
#include "rqz_circle/naming.hpp"

namespace rqz_circle {

void write_text(const CirclePointRing& ring, const std::string& path) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!ofs) throw IoFailure("Failed to open output: " + path);

    for (const auto& p : ring) {
        ofs << format_number(p.lat) << ", " << format_number(p.lon) << "\n";
    }

    ofs.flush();
    if (!ofs) throw IoFailure("Failed to write output: " + path);
}

std::string write_text(const CirclePointRing& ring, const std::string& output_dir,
                       const std::string& name) {
    if (name.empty()) throw InvalidInput("output name must not be empty");
    const std::string path = (std::filesystem::path(output_dir) / (name + ".txt")).string();
    write_text(ring, path);
    return path;
}

} // namespace rqz_circle
