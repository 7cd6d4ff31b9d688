#include "ptsrc/detection/source_finder.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/units.hpp"
#include "ptsrc/core/utils.hpp"
#include "ptsrc/noise/noise_model.hpp"
#include "ptsrc/sky/apodization.hpp"
#include "ptsrc/sky/fourier.hpp"
#include "ptsrc/sky/sampling.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ptsrc::detection {

using core::json;

namespace {

struct LabelStats {
    double wsum = 0.0;
    double wy = 0.0;
    double wx = 0.0;
    double vmax = -std::numeric_limits<double>::infinity();
    double vmin = std::numeric_limits<double>::infinity();
    PixPos pmax;
    PixPos pmin;
    double snmax = 0.0;
    long count = 0;
};

// Accumulate per-label statistics in raster order, so ties resolve to the
// first pixel
std::vector<LabelStats> label_stats(const Matrix2Dd& fmap, const Matrix2Dd* snmap,
                                    const Matrix2Di& labels, int nlabel) {
    std::vector<LabelStats> st(nlabel + 1);
    for (int y = 0; y < labels.rows(); ++y) {
        for (int x = 0; x < labels.cols(); ++x) {
            const int l = labels(y, x);
            if (l <= 0 || l > nlabel) continue;
            LabelStats& s = st[l];
            const double v = fmap(y, x);
            s.wsum += v;
            s.wy += v * y;
            s.wx += v * x;
            if (v > s.vmax) {
                s.vmax = v;
                s.pmax = PixPos{static_cast<double>(y), static_cast<double>(x)};
            }
            if (v < s.vmin) {
                s.vmin = v;
                s.pmin = PixPos{static_cast<double>(y), static_cast<double>(x)};
            }
            if (snmap) s.snmax = std::max(s.snmax, std::abs((*snmap)(y, x)));
            ++s.count;
        }
    }
    return st;
}

// 4-connected labels of mask, returns the number of components
int label_mask(const Matrix2Dd& snmap, double sign, double snmin, cv::Mat& labels) {
    cv::Mat mask(static_cast<int>(snmap.rows()), static_cast<int>(snmap.cols()), CV_8U);
    for (int y = 0; y < mask.rows; ++y) {
        auto* row = mask.ptr<unsigned char>(y);
        for (int x = 0; x < mask.cols; ++x) {
            row[x] = (sign * snmap(y, x) >= snmin) ? 1 : 0;
        }
    }
    return cv::connectedComponents(mask, labels, 4, CV_32S) - 1;
}

// Positive components keep their labels, negative ones follow after them
int label_significant(const Matrix2Dd& snmap, double snmin, Matrix2Di& labels) {
    cv::Mat lpos;
    cv::Mat lneg;
    const int npos = label_mask(snmap, 1.0, snmin, lpos);
    const int nneg = label_mask(snmap, -1.0, snmin, lneg);

    labels = Matrix2Di::Zero(snmap.rows(), snmap.cols());
    for (int y = 0; y < lpos.rows; ++y) {
        const int* p = lpos.ptr<int>(y);
        const int* n = lneg.ptr<int>(y);
        for (int x = 0; x < lpos.cols; ++x) {
            if (p[x] > 0) labels(y, x) = p[x];
            else if (n[x] > 0) labels(y, x) = n[x] + npos;
        }
    }
    return npos + nneg;
}

Matrix2Dd elementwise(const Matrix2Dd& a, const Matrix2Dd& b) {
    return (a.array() * b.array()).matrix();
}

Matrix2Dd sqrt_positive(const Matrix2Dd& a) {
    return a.array().max(0.0).sqrt().matrix();
}

json sn_histogram(const std::vector<double>& amps, const std::vector<double>& damps) {
    static const double edges[] = {0, 5, 10, 20, 50, 100, std::numeric_limits<double>::infinity()};
    std::vector<int> counts(6, 0);
    for (size_t i = 0; i < amps.size(); ++i) {
        const double sn = amps[i] / damps[i];
        for (int b = 0; b < 6; ++b) {
            if (sn >= edges[b] && (sn < edges[b + 1] || b == 5)) {
                ++counts[b];
                break;
            }
        }
    }
    json h = json::object();
    for (int b = 0; b < 6; ++b) h[std::to_string(static_cast<int>(edges[b]))] = counts[b];
    return h;
}

Matrix2Dd unit_beam_thumbnail(const Matrix2Dd& beam2d, int kernel) {
    Matrix2Dd thumb = sky::thumbnail(sky::ifft_real(beam2d.cast<std::complex<double>>()), kernel);
    const double peak = thumb.maxCoeff();
    if (peak > 0.0) thumb /= peak;
    return thumb;
}

std::vector<PixPos> catalog_pixels(const catalog::Catalog& cat, const sky::Geometry& geom) {
    std::vector<PixPos> pix;
    pix.reserve(cat.size());
    for (const auto& e : cat) pix.push_back(geom.sky_to_pix(e.pos()));
    return pix;
}

std::vector<double> catalog_amps(const catalog::Catalog& cat) {
    std::vector<double> amps;
    amps.reserve(cat.size());
    for (const auto& e : cat) amps.push_back(e.amp[0]);
    return amps;
}

} // namespace

std::vector<ComponentFit> fit_labeled_sources(const Matrix2Dd& fmap, const Matrix2Di& labels,
                                              const std::vector<int>& label_ids,
                                              double extended_threshold) {
    const int nlabel = labels.size() > 0 ? labels.maxCoeff() : 0;
    const std::vector<LabelStats> st = label_stats(fmap, nullptr, labels, nlabel);

    std::vector<ComponentFit> fits;
    fits.reserve(label_ids.size());
    for (int id : label_ids) {
        if (id <= 0 || id > nlabel || st[id].count == 0) {
            throw PipelineError("Label " + std::to_string(id) + " has no pixels");
        }
        const LabelStats& s = st[id];
        ComponentFit f;
        if (s.wsum != 0.0) {
            f.pos = PixPos{s.wy / s.wsum, s.wx / s.wsum};
        } else {
            f.pos = s.vmax >= -s.vmin ? s.pmax : s.pmin;
        }
        f.amp = sky::interpolate(fmap, f.pos, 1);

        const bool negative = f.amp < 0.0;
        const double amp_ext = negative ? s.vmin : s.vmax;
        const PixPos pos_ext = negative ? s.pmin : s.pmax;
        f.extended = std::abs(amp_ext) > std::abs(f.amp) * extended_threshold;
        if (f.extended) {
            f.pos = pos_ext;
            f.amp = amp_ext;
        }
        fits.push_back(f);
    }
    return fits;
}

Matrix2Dd calc_model(int ny, int nx, const std::vector<PixPos>& pixels, const Matrix2Dd& tmpl,
                     const std::vector<double>& amps) {
    Matrix2Dd model = Matrix2Dd::Zero(ny, nx);
    const int sy = static_cast<int>(tmpl.rows());
    const int sx = static_cast<int>(tmpl.cols());
    for (size_t i = 0; i < pixels.size(); ++i) {
        const PixPos& p = pixels[i];
        if (!std::isfinite(p.y) || !std::isfinite(p.x)) continue;
        const int y0 = core::nint(p.y);
        const int x0 = core::nint(p.x);
        Matrix2Dd src = sky::fourier_shift(tmpl, p.y - y0, p.x - x0) * amps[i];
        sky::insert_add(model, PixBox{y0 - sy / 2, x0 - sx / 2, y0 - sy / 2 + sy, x0 - sx / 2 + sx},
                        src, true);
    }
    return model;
}

FinderResult find_sources(const Matrix2Dd& map, const Matrix2Dd& ivar, const sky::Geometry& geom,
                          const beam::Beam& beam, const config::FinderConfig& cfg,
                          const core::EventSink* events) {
    const int ny = static_cast<int>(map.rows());
    const int nx = static_cast<int>(map.cols());
    if (ivar.rows() != ny || ivar.cols() != nx || geom.ny() != ny || geom.nx() != nx) {
        throw PipelineError("Map, inverse variance and geometry shapes differ");
    }

    // Apodize before any Fourier space operation
    const Matrix2Dd apod_map = elementwise(sky::apod_edges(ny, nx, cfg.apod),
                                           sky::apod_holes(ivar, cfg.apod));
    Matrix2Dd imap = elementwise(map, apod_map);
    if (cfg.pixwin) imap = sky::apply_pixel_window(imap, -1);

    const Matrix2Dd wmap = elementwise(imap, sqrt_positive(ivar));
    const Matrix2Dd adiv = elementwise(ivar, elementwise(apod_map, apod_map));
    const Matrix2Dd beam2d = beam.transform_2d(geom);
    const double beam_area = beam::transform_area(beam2d, geom);
    const double fluxconv = core::flux_factor(beam_area, cfg.freq_ghz * 1e9) / 1e6;

    FinderResult result;
    result.geometry = geom;
    result.map = imap;
    result.beam_thumb = unit_beam_thumbnail(beam2d, cfg.kernel);
    result.snmap = Matrix2Dd::Zero(ny, nx);
    result.resid_snmap = Matrix2Dd::Zero(ny, nx);
    result.model = Matrix2Dd::Zero(ny, nx);
    result.resid = imap;

    if (!(adiv.sum() > 0.0)) {
        if (events) events->emit("finder_skip", {{"reason", "no weighted area"}});
        return result;
    }

    Matrix2Dd inner_mask(ny, nx);
    for (Eigen::Index i = 0; i < inner_mask.size(); ++i) {
        inner_mask.data()[i] = apod_map.data()[i] == 1.0 ? 1.0 : 0.0;
    }

    // Point-source free starting point for the noise model
    Matrix2Dd noise = noise::sim_initial_noise(ivar, geom, static_cast<std::uint32_t>(cfg.noise_seed),
                                               cfg.noise_lknee, cfg.noise_alpha);

    for (int ipass = 0; ipass < cfg.npass; ++ipass) {
        const Matrix2Dd wnoise = elementwise(noise, sqrt_positive(adiv));
        Matrix2Dd ps = noise::measure_noise(wnoise, geom, cfg.apod, cfg.apod, cfg.ps_res);
        if (cfg.highl_cut > 0.0) ps = noise::flatten_high_l(ps, geom, cfg.highl_cut);
        const Matrix2Dd filter = noise::build_filter(ps, beam2d);
        const Matrix2Dd tmpl = sky::thumbnail(
            sky::ifft_real(elementwise(filter, beam2d).cast<std::complex<double>>()), cfg.kernel, true);

        Matrix2Dd fmap = sky::filter_map(wmap, filter);
        const Matrix2Dd fnoise = sky::filter_map(wnoise, filter);
        const Matrix2Dd norm = noise::snmap_norm(elementwise(fnoise, inner_mask), cfg.norm_block);

        result.snmap = (fmap.array() / norm.array()).matrix();

        double sn_lim = 0.0;
        for (Eigen::Index i = 0; i < fmap.size(); ++i) {
            if (apod_map.data()[i] > 0.0) sn_lim = std::max(sn_lim, std::abs(result.snmap.data()[i]));
        }

        std::vector<PixPos> fit_pix;
        std::vector<double> fit_amp, fit_damp, fit_npix;

        for (int iblock = 0; iblock < cfg.nblock; ++iblock) {
            const Matrix2Dd snmap = (fmap.array() / norm.array()).matrix();
            Matrix2Di labels;
            const int nlabel = label_significant(snmap, cfg.snmin, labels);
            if (nlabel == 0) break;

            const std::vector<LabelStats> st = label_stats(fmap, &snmap, labels, nlabel);
            double sn_peak = 0.0;
            for (int l = 1; l <= nlabel; ++l) sn_peak = std::max(sn_peak, st[l].snmax);

            // Strongest components first, the cutoff shrinks every block
            sn_lim = std::max(cfg.snmin, std::min(sn_lim, sn_peak) / cfg.block_ratio);
            std::vector<int> keep;
            for (int l = 1; l <= nlabel; ++l) {
                if (st[l].snmax >= sn_lim) keep.push_back(l);
            }
            if (keep.empty()) break;

            const std::vector<ComponentFit> fits =
                fit_labeled_sources(fmap, labels, keep, cfg.extended_threshold);
            std::vector<PixPos> pix;
            std::vector<double> amps;
            for (size_t k = 0; k < fits.size(); ++k) {
                pix.push_back(fits[k].pos);
                amps.push_back(fits[k].amp);
                fit_pix.push_back(fits[k].pos);
                fit_amp.push_back(fits[k].amp);
                fit_damp.push_back(sky::interpolate(norm, fits[k].pos, 0));
                fit_npix.push_back(static_cast<double>(st[keep[k]].count));
            }
            fmap -= calc_model(ny, nx, pix, tmpl, amps);

            if (events) {
                events->emit("finder_block", {{"pass", ipass + 1},
                                              {"block", iblock + 1},
                                              {"sn_lim", sn_lim},
                                              {"n_new", static_cast<int>(fits.size())},
                                              {"sn_hist", sn_histogram(fit_amp, fit_damp)}});
            }
            // Below the floor we would only dig into the noise
            if (sn_lim <= cfg.snmin) break;
        }

        // Assemble the catalog in physical units
        const Matrix2Dd valid = (apod_map.array() >= 1.0).cast<double>().matrix();
        const Matrix2Dd dist_from_apod = sky::distance_to_invalid(valid);
        catalog::Catalog cat;
        for (size_t i = 0; i < fit_pix.size(); ++i) {
            const double rms = std::pow(sky::interpolate(adiv, fit_pix[i], 0), -0.5);
            const int iy = core::nint(fit_pix[i].y);
            const int ix = core::nint(fit_pix[i].x);
            if (!std::isfinite(rms) || iy < 0 || ix < 0 || iy >= ny || ix >= nx) continue;
            if (dist_from_apod(iy, ix) < cfg.apod_margin) continue;

            catalog::Entry e;
            const SkyPos p = geom.pix_to_sky(fit_pix[i]);
            e.ra = p.ra;
            e.dec = p.dec;
            e.amp[0] = fit_amp[i] * rms;
            e.damp[0] = fit_damp[i] * rms;
            for (int c = 0; c < catalog::kNumComp; ++c) {
                e.flux[c] = e.amp[c] * fluxconv;
                e.dflux[c] = e.damp[c] * fluxconv;
            }
            e.npix = fit_npix[i];
            cat.push_back(e);
        }
        catalog::sort_by_snr(cat);

        result.resid_snmap = (fmap.array() / norm.array()).matrix();
        result.model = calc_model(ny, nx, catalog_pixels(cat, geom), result.beam_thumb,
                                  catalog_amps(cat));
        result.resid = imap - result.model;
        result.catalog = std::move(cat);

        if (events) {
            events->emit("finder_pass", {{"pass", ipass + 1},
                                         {"npass", cfg.npass},
                                         {"nsrc", static_cast<int>(result.catalog.size())}});
        }

        noise = result.resid;
    }
    return result;
}

catalog::ArtifactParams artifact_params(const config::ArtifactConfig& cfg) {
    catalog::ArtifactParams p;
    p.vlim = cfg.vlim;
    p.maxrad = cfg.maxrad_arcmin * core::kArcmin;
    p.jumprad = cfg.jumprad_arcmin * core::kArcmin;
    p.gmax = cfg.gmax;
    p.maxit = cfg.maxit;
    p.core_lim = cfg.core_lim;
    p.core_rad = cfg.core_rad_arcmin * core::kArcmin;
    return p;
}

FinderResult prune_artifacts(const FinderResult& result, const config::ArtifactConfig& cfg) {
    FinderResult out = result;
    const auto found = catalog::find_source_artifacts(result.catalog, artifact_params(cfg));
    if (found.empty()) return out;

    std::vector<bool> good(result.catalog.size(), true);
    for (const auto& a : found) {
        for (int j : a.artifacts) good[j] = false;
    }
    std::vector<int> keep;
    for (size_t i = 0; i < good.size(); ++i) {
        if (good[i]) keep.push_back(static_cast<int>(i));
    }
    out.catalog = catalog::select(result.catalog, keep);

    const int ny = static_cast<int>(result.map.rows());
    const int nx = static_cast<int>(result.map.cols());
    out.model = calc_model(ny, nx, catalog_pixels(out.catalog, result.geometry), result.beam_thumb,
                           catalog_amps(out.catalog));
    out.resid = result.map - out.model;
    return out;
}

} // namespace ptsrc::detection
