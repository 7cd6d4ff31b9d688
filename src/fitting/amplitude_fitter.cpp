#include "ptsrc/fitting/amplitude_fitter.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/units.hpp"
#include "ptsrc/core/utils.hpp"
#include "ptsrc/grouping/correlation_groups.hpp"
#include "ptsrc/noise/noise_model.hpp"
#include "ptsrc/sky/apodization.hpp"
#include "ptsrc/sky/fourier.hpp"
#include "ptsrc/sky/sampling.hpp"

#include <Eigen/Cholesky>

#include <cmath>

namespace ptsrc::fitting {

namespace {

// Beam profile evaluated at the exact angular distance of every pixel of box
sky::Patch source_template(const sky::Geometry& geom, const PixBox& box, const SkyPos& pos,
                           const beam::BeamProfile& profile) {
    sky::Patch p;
    p.box = box;
    p.data = Matrix2Dd::Zero(std::max(0, box.height()), std::max(0, box.width()));
    for (int y = box.y0; y < box.y1; ++y) {
        for (int x = box.x0; x < box.x1; ++x) {
            const SkyPos q = geom.pix_to_sky(PixPos{static_cast<double>(y), static_cast<double>(x)});
            p.data(y - box.y0, x - box.x0) = profile.at(core::angular_distance(q, pos));
        }
    }
    return p;
}

// H F^-1[iC F[H m]]
Matrix2Dd weighted_filter(const Matrix2Dd& m, const Matrix2Dd& H, const Matrix2Dd& iC) {
    const Matrix2Dd hm = (H.array() * m.array()).matrix();
    return (H.array() * sky::filter_map(hm, iC).array()).matrix();
}

} // namespace

std::vector<int> inside_margin(const std::vector<PixPos>& pixels, int ny, int nx, double margin) {
    std::vector<int> out;
    for (size_t i = 0; i < pixels.size(); ++i) {
        const PixPos& p = pixels[i];
        if (p.y >= margin && p.x >= margin && p.y < ny - margin && p.x < nx - margin) {
            out.push_back(static_cast<int>(i));
        }
    }
    return out;
}

FitResult fit_amplitudes(const Matrix2Dd& map, const Matrix2Dd& ivar, const sky::Geometry& geom,
                         const std::vector<SkyPos>& positions, const beam::Beam& beam,
                         const config::FitterConfig& cfg, const config::BeamConfig& beam_cfg,
                         const catalog::Prior* prior, const core::EventSink* events) {
    const int ny = static_cast<int>(map.rows());
    const int nx = static_cast<int>(map.cols());
    if (ivar.rows() != ny || ivar.cols() != nx || geom.ny() != ny || geom.nx() != nx) {
        throw PipelineError("Map, inverse variance and geometry shapes differ");
    }
    if (prior && (prior->amp.size() != static_cast<Eigen::Index>(positions.size()) ||
                  prior->ivar.size() != static_cast<Eigen::Index>(positions.size()))) {
        throw PipelineError("Prior length does not match the number of positions");
    }

    std::vector<PixPos> all_pix;
    all_pix.reserve(positions.size());
    for (const auto& p : positions) all_pix.push_back(geom.sky_to_pix(p));

    // Only sources clear of the edge apodization are fit
    double margin = cfg.apod + cfg.apod_margin;
    FitResult result;
    result.fit_inds = inside_margin(all_pix, ny, nx, margin);
    const int nsrc = static_cast<int>(result.fit_inds.size());

    std::vector<SkyPos> src_pos;
    std::vector<PixPos> src_pix;
    for (int i : result.fit_inds) {
        src_pos.push_back(positions[i]);
        src_pix.push_back(all_pix[i]);
    }

    result.amp = VectorXd::Zero(nsrc);
    result.damp = VectorXd::Zero(nsrc);
    result.icov = Eigen::MatrixXd::Zero(nsrc, nsrc);
    result.local_amps = VectorXd::Zero(nsrc);
    if (nsrc == 0) return result;

    const Matrix2Dd apod_map = (sky::apod_edges(ny, nx, cfg.apod).array() *
                                sky::apod_holes(ivar, cfg.apod).array()).matrix();
    Matrix2Dd imap = (map.array() * apod_map.array()).matrix();

    // Nothing is measurable without weight, nor is a noise model buildable
    if (!((ivar.array() * apod_map.array().square()).sum() > 0.0)) {
        if (events) events->emit("fitter_skip", {{"reason", "no weighted area"}, {"nsrc", nsrc}});
        return result;
    }

    if (cfg.pixwin) imap = sky::apply_pixel_window(imap, -1);

    const beam::BeamProfile profile =
        beam.radial_profile(beam_cfg.profile_samples, 0.0, beam_cfg.profile_tol);
    const double brad = beam::profile_radius(profile, cfg.beam_tol);

    std::vector<sky::Patch> Bs(nsrc);
    for (int s = 0; s < nsrc; ++s) {
        Bs[s] = source_template(geom, geom.neighborhood_pixbox(src_pos[s], brad), src_pos[s], profile);
    }

    // Only needed for the correlation length
    Matrix2Dd beam2d = beam.transform_2d(geom);
    beam2d /= beam2d.mean();

    // Constant correlation model for H-weighted data
    const Matrix2Dd H = (ivar.array().max(0.0).sqrt() * apod_map.array()).matrix();
    Matrix2Dd noise = noise::sim_initial_noise(ivar, geom, static_cast<std::uint32_t>(cfg.noise_seed),
                                               cfg.noise_lknee, cfg.noise_alpha);

    for (int ipass = 0; ipass < cfg.npass; ++ipass) {
        Matrix2Dd C = noise::measure_noise((H.array() * noise.array()).matrix(), geom, cfg.apod,
                                           cfg.apod, cfg.ps_res);
        if (cfg.highl_cut > 0.0) C = noise::flatten_high_l(C, geom, cfg.highl_cut);
        const Matrix2Dd iC = C.array().inverse().matrix();

        VectorXd rhs(nsrc);
        Eigen::MatrixXd icov = Eigen::MatrixXd::Zero(nsrc, nsrc);

        const Matrix2Dd Nd = weighted_filter(imap, H, iC);
        for (int s = 0; s < nsrc; ++s) {
            rhs[s] = sky::overlap_dot(sky::Patch{Bs[s].box, sky::extract(Nd, Bs[s].box)}, Bs[s]);
        }

        const Matrix2Dd tfun = (beam2d.array().square() * iC.array()).matrix();
        const double corrlen = grouping::measure_corrlen(tfun, geom, cfg.indep_tol);
        std::vector<PixBox> cboxes(nsrc);
        for (int s = 0; s < nsrc; ++s) cboxes[s] = geom.neighborhood_pixbox(src_pos[s], corrlen);

        // No part of another member's response may fall inside a source's
        // correlation box: twice the radius, times sqrt(2) for the diagonal
        const grouping::IndependentGroups groups =
            grouping::group_independent(src_pos, corrlen * 2.0 * std::sqrt(2.0));

        std::vector<sky::Patch> NBs(nsrc);
        for (const auto& group : groups.groups) {
            Matrix2Dd NB = Matrix2Dd::Zero(ny, nx);
            for (int s : group) sky::add_patch(NB, Bs[s]);
            NB = weighted_filter(NB, H, iC);
            for (int s : group) NBs[s] = sky::Patch{cboxes[s], sky::extract(NB, cboxes[s])};
        }

        for (int s = 0; s < nsrc; ++s) {
            for (int s2 : groups.sources[s].neighbors) {
                icov(s, s2) = sky::overlap_dot(NBs[s], Bs[s2]);
            }
        }

        if (prior) {
            for (int s = 0; s < nsrc; ++s) {
                const int i = result.fit_inds[s];
                rhs[s] += prior->ivar[i] * prior->amp[i];
                icov(s, s) += prior->ivar[i];
            }
        }

        // Cutoffs in the beam and correlation boxes leave icov slightly asymmetric
        icov = 0.5 * (icov + icov.transpose()).eval();

        Eigen::LDLT<Eigen::MatrixXd> ldlt(icov);
        if (ldlt.info() != Eigen::Success) {
            throw SolverError("LDLT factorization of the " + std::to_string(nsrc) + "x" +
                              std::to_string(nsrc) + " inverse covariance failed");
        }
        // LDLT silently pseudo-inverts zero pivots
        const VectorXd pivots = ldlt.vectorD().cwiseAbs();
        if (!(pivots.maxCoeff() > 0.0) || pivots.minCoeff() <= 1e-14 * pivots.maxCoeff()) {
            throw SolverError("Inverse covariance is singular in pass " + std::to_string(ipass + 1));
        }
        const VectorXd amp = ldlt.solve(rhs);
        if (ldlt.info() != Eigen::Success || !amp.allFinite()) {
            throw SolverError("Amplitude system is singular in pass " + std::to_string(ipass + 1));
        }

        Matrix2Dd model = Matrix2Dd::Zero(ny, nx);
        for (int s = 0; s < nsrc; ++s) sky::add_patch(model, Bs[s], amp[s]);
        for (int s = 0; s < nsrc; ++s) result.local_amps[s] = sky::interpolate(model, src_pix[s], 1);
        noise = imap - model;

        result.amp = amp;
        result.icov = icov;
        result.damp = icov.diagonal().array().rsqrt().matrix();

        if (events) {
            events->emit("fitter_pass", {{"pass", ipass + 1},
                                         {"npass", cfg.npass},
                                         {"nsrc", nsrc},
                                         {"ngroups", static_cast<int>(groups.groups.size())},
                                         {"corrlen_arcmin", corrlen / core::kArcmin}});
        }
    }

    // A source just inside the margin can have its flux absorbed by a
    // neighbor outside it, so prune again with a wider margin
    margin += cfg.apod_margin;
    const std::vector<int> good = inside_margin(src_pix, ny, nx, margin);
    const int ngood = static_cast<int>(good.size());

    FitResult pruned;
    pruned.amp.resize(ngood);
    pruned.damp.resize(ngood);
    pruned.local_amps.resize(ngood);
    pruned.icov.resize(ngood, ngood);
    for (int a = 0; a < ngood; ++a) {
        pruned.fit_inds.push_back(result.fit_inds[good[a]]);
        pruned.amp[a] = result.amp[good[a]];
        pruned.damp[a] = result.damp[good[a]];
        pruned.local_amps[a] = result.local_amps[good[a]];
        for (int b = 0; b < ngood; ++b) pruned.icov(a, b) = result.icov(good[a], good[b]);
    }
    return pruned;
}

} // namespace ptsrc::fitting
