#pragma once

#include <string>

#include "rqz_circle/circle_sampler.hpp"
#include "rqz_circle/geo_point.hpp"

namespace rqz_circle {

// 作成者情報と区域の目的。設定ファイルの "track" で上書きできる
struct TrackAuthor {
    std::string name = "ESL";
    std::string email = "earl.sullivan.lester@kartverket.no";
    std::string purpose =
        "Within the Ny Ålesund RQZ is a core mobile-no-go zone surrounding the observatory.";
};

// GPX に書き出す説明文一式（表示用のみ、読み戻されることはない）
struct TrackInfo {
    std::string name;              // <metadata><name>
    std::string description;       // <metadata><desc>
    std::string author;            // <metadata><author><name>
    std::string email;             // <metadata><author><email>
    std::string track_name = "Delineation of mobile-no-go zone";
    std::string track_description; // <trk><desc>
    std::string creator = "rqz_circle";
};

// run name と CircleSpec から説明文を組み立てる。半径と中心文字列はそのまま埋め込む
TrackInfo describe_track(const std::string& name, const CircleSpec& spec,
                         const TrackAuthor& author = TrackAuthor());

// GPX 1.1: metadata + trk 1 本 + trkseg 1 本、trkpt はリング順
// Throws IoFailure if the GPX driver is missing or the document cannot be written.
void write_track(const CirclePointRing& ring, const std::string& path, const TrackInfo& info);

} // namespace rqz_circle
