#pragma once

#include <string>

#include "rqz_circle/geo_point.hpp"

namespace rqz_circle {

// 1 行 1 点 "{lat}, {lon}\n"。ヘッダなし、既存ファイルは上書き。
// Throws IoFailure if the file cannot be opened or fully written.
void write_text(const CirclePointRing& ring, const std::string& path);

// "{output_dir}/{name}.txt" に書き、そのパスを返す。
std::string write_text(const CirclePointRing& ring, const std::string& output_dir,
                       const std::string& name);

} // namespace rqz_circle
