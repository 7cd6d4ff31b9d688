#include "ptsrc/pipeline/regions.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/units.hpp"
#include "ptsrc/core/utils.hpp"

#include <opencv2/core.hpp>

#include <cmath>
#include <fstream>

namespace ptsrc::pipeline {

namespace {

std::vector<PixBox> to_pixboxes(const std::vector<std::pair<SkyPos, SkyPos>>& boxes,
                                const sky::Geometry& geom) {
    std::vector<PixBox> out;
    out.reserve(boxes.size());
    for (const auto& [c1, c2] : boxes) out.push_back(geom.sky_box_to_pixbox(c1, c2));
    return out;
}

int parse_int_arg(const std::string& tok, const std::string& spec) {
    auto v = core::parse_double(tok);
    if (!v || *v < 1.0 || *v != std::floor(*v)) {
        throw ConfigError("Bad tile size '" + tok + "' in region spec '" + spec + "'");
    }
    return static_cast<int>(*v);
}

} // namespace

std::vector<std::pair<SkyPos, SkyPos>> read_boxes_txt(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open region file: " + path.string());
    }
    std::vector<std::pair<SkyPos, SkyPos>> boxes;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const std::string t = core::trim(line);
        if (t.empty() || t[0] == '#') continue;
        const auto toks = core::split_whitespace(t);
        if (toks.size() < 4) {
            throw ConfigError("Region file " + path.string() + " line " + std::to_string(lineno) +
                              " needs ra1 ra2 dec1 dec2");
        }
        double v[4];
        for (int i = 0; i < 4; ++i) {
            auto d = core::parse_double(toks[i]);
            if (!d) {
                throw ConfigError("Region file " + path.string() + " line " +
                                  std::to_string(lineno) + ": bad number '" + toks[i] + "'");
            }
            v[i] = *d * core::kDegree;
        }
        boxes.emplace_back(SkyPos{v[2], v[0]}, SkyPos{v[3], v[1]});
    }
    return boxes;
}

std::vector<std::pair<SkyPos, SkyPos>> read_boxes_ds9(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open region file: " + path.string());
    }
    std::vector<std::pair<SkyPos, SkyPos>> boxes;
    std::string line;
    while (std::getline(in, line)) {
        if (!core::starts_with(line, "box(")) continue;
        std::string body = line.substr(4);
        const auto close = body.find(')');
        if (close != std::string::npos) body = body.substr(0, close);

        auto toks = core::split(body, ',');
        if (toks.size() < 4) {
            throw ConfigError("Malformed ds9 box in " + path.string() + ": " + line);
        }
        // Widths carry a trailing arcsec mark
        for (int i = 2; i < 4; ++i) {
            toks[i] = core::trim(toks[i]);
            if (!toks[i].empty() && toks[i].back() == '"') toks[i].pop_back();
        }
        auto ra = core::parse_double(core::trim(toks[0]));
        auto dec = core::parse_double(core::trim(toks[1]));
        auto wra = core::parse_double(toks[2]);
        auto wdec = core::parse_double(toks[3]);
        if (!ra || !dec || !wra || !wdec) {
            throw ConfigError("Malformed ds9 box in " + path.string() + ": " + line);
        }
        const double r = *ra * core::kDegree;
        const double d = *dec * core::kDegree;
        const double hw = 0.5 * *wra * core::kArcsec;
        const double hh = 0.5 * *wdec * core::kArcsec;
        boxes.emplace_back(SkyPos{d - hh, r + hw}, SkyPos{d + hh, r - hw});
    }
    return boxes;
}

std::vector<PixBox> get_regions(const std::string& spec, const sky::Geometry& geom) {
    const std::string s = spec.empty() ? "full" : spec;
    const auto toks = core::split(s, ':');
    const std::string name = toks.empty() ? s : toks[0];

    if (name == "full") {
        return {geom.full_box()};
    }
    if (name == "tile") {
        int ty = 480;
        int tx = 480;
        if (toks.size() > 1) ty = tx = parse_int_arg(toks[1], s);
        if (toks.size() > 2) tx = parse_int_arg(toks[2], s);
        std::vector<PixBox> out;
        for (int y = 0; y < geom.ny(); y += ty) {
            for (int x = 0; x < geom.nx(); x += tx) {
                out.push_back(PixBox{y, x, y + ty, x + tx});
            }
        }
        return out;
    }
    if (name == "box") {
        if (toks.size() < 5) {
            throw ConfigError("Region spec '" + s + "' must be box:dec1:ra1:dec2:ra2");
        }
        double v[4];
        for (int i = 0; i < 4; ++i) {
            auto d = core::parse_double(toks[i + 1]);
            if (!d) {
                throw ConfigError("Bad coordinate '" + toks[i + 1] + "' in region spec '" + s + "'");
            }
            v[i] = *d * core::kDegree;
        }
        return {geom.sky_box_to_pixbox(SkyPos{v[0], v[1]}, SkyPos{v[2], v[3]})};
    }
    if (name == "adaptive") {
        throw ConfigError("Adaptive region splitting is not implemented");
    }
    if (fs::is_regular_file(s)) {
        try {
            return to_pixboxes(read_boxes_txt(s), geom);
        } catch (const ConfigError&) {
            return to_pixboxes(read_boxes_ds9(s), geom);
        }
    }
    throw ConfigError("Unrecognized region specification '" + s + "'");
}

PixBox pad_region(const PixBox& box, int pad, bool fft) {
    PixBox out{box.y0 - pad, box.x0 - pad, box.y1 + pad, box.x1 + pad};
    if (fft) {
        out.y1 = out.y0 + cv::getOptimalDFTSize(out.height());
        out.x1 = out.x0 + cv::getOptimalDFTSize(out.width());
    }
    return out;
}

} // namespace ptsrc::pipeline
