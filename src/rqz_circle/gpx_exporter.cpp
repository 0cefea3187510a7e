#include "rqz_circle/gpx_exporter.hpp"

#include "gdal_priv.h"
#include "ogrsf_frmts.h"
#include "cpl_error.h"
#include "cpl_vsi.h"
#include "cpl_string.h"

#include "rqz_circle/errors.hpp"
#include "rqz_circle/naming.hpp"

namespace rqz_circle {

TrackInfo describe_track(const std::string& name, const CircleSpec& spec,
                         const TrackAuthor& author) {
    const std::string step_deg =
        spec.num_points > 0 ? format_number(360.0 / spec.num_points) : std::string("?");

    TrackInfo info;
    info.name = name;
    info.author = author.name;
    info.email = author.email;
    info.description = author.purpose +
        " The track to follow delineates this region with a resolution of one point per " +
        step_deg + " degrees from true bearing.";

    info.track_description =
        "This track was computed as a perfect circle with radius " + format_number(spec.radius_m) +
        " [m], using a Karney formula and the WGS-84 ellipsoidal model, around a central "
        "co-ordinate: " + format_center(spec.center) + " [lat]_[long].";
    if (!author.email.empty()) {
        info.track_description += " Contact " + author.name + " at " + author.email +
                                  " for more information.";
    }
    return info;
}

static GDALDriver* gpx_driver() {
    GDALAllRegister();
    GDALDriver* drv = GetGDALDriverManager()->GetDriverByName("GPX");
    if (!drv) throw IoFailure("GPX driver not found in this GDAL build");
    return drv;
}

static std::string last_gdal_error(const std::string& fallback) {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? fallback + ": " + msg : fallback;
}

void write_track(const CirclePointRing& ring, const std::string& path, const TrackInfo& info) {
    GDALDriver* drv = gpx_driver();

    // <metadata> は GPX ドライバのデータセット作成オプションで渡す
    CPLStringList opts;
    opts.SetNameValue("CREATOR", info.creator.c_str());
    if (!info.name.empty()) opts.SetNameValue("METADATA_NAME", info.name.c_str());
    if (!info.description.empty()) opts.SetNameValue("METADATA_DESCRIPTION", info.description.c_str());
    if (!info.author.empty()) opts.SetNameValue("METADATA_AUTHOR_NAME", info.author.c_str());
    if (!info.email.empty()) opts.SetNameValue("METADATA_AUTHOR_EMAIL", info.email.c_str());

    // GPX ドライバは既存ファイルへの Create を拒否するので先に消す
    VSIStatBufL st;
    if (VSIStatL(path.c_str(), &st) == 0 && VSI_ISREG(st.st_mode)) {
        if (VSIUnlink(path.c_str()) != 0) throw IoFailure("Failed to replace existing output: " + path);
    }

    CPLErrorReset();
    GDALDatasetUniquePtr ds(drv->Create(path.c_str(), 0, 0, 0, GDT_Unknown, opts.List()));
    if (!ds) throw IoFailure(last_gdal_error("Failed to create output: " + path));

    // MultiLineString のレイヤは <trk> として書かれ、各 LineString が <trkseg> になる
    OGRLayer* ly = ds->CreateLayer("tracks", nullptr, wkbMultiLineString, nullptr);
    if (!ly) throw IoFailure(last_gdal_error("Failed to CreateLayer() in " + path));

    OGRFeatureUniquePtr trk(OGRFeature::CreateFeature(ly->GetLayerDefn()));
    trk->SetField("name", info.track_name.c_str());
    trk->SetField("desc", info.track_description.c_str());

    OGRLineString seg;
    for (const auto& p : ring) {
        seg.addPoint(p.lon, p.lat); // x=lon, y=lat
    }
    OGRMultiLineString segs;
    segs.addGeometry(&seg);
    trk->SetGeometry(&segs);

    if (ly->CreateFeature(trk.get()) != OGRERR_NONE) {
        throw IoFailure(last_gdal_error("Failed to CreateFeature() in " + path));
    }

    // close で </gpx> と metadata の bounds が書かれる
    ds.reset();
    if (CPLGetLastErrorType() == CE_Failure) {
        throw IoFailure(last_gdal_error("Failed to finish output: " + path));
    }
}

} // namespace rqz_circle
