#include "ptsrc/config/configuration.hpp"
#include "ptsrc/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace ptsrc::config {

static bool is_positive_finite(double v) {
    return std::isfinite(v) && v > 0.0;
}

static Config parse_config(const YAML::Node& node) {
    Config cfg;

    if (node["beam"]) {
        auto b = node["beam"];
        if (b["spec"]) cfg.beam.spec = b["spec"].as<std::string>();
        if (b["profile_samples"]) cfg.beam.profile_samples = b["profile_samples"].as<int>();
        if (b["profile_tol"]) cfg.beam.profile_tol = b["profile_tol"].as<double>();
    }

    if (node["finder"]) {
        auto f = node["finder"];
        if (f["freq_ghz"]) cfg.finder.freq_ghz = f["freq_ghz"].as<double>();
        if (f["apod"]) cfg.finder.apod = f["apod"].as<int>();
        if (f["apod_margin"]) cfg.finder.apod_margin = f["apod_margin"].as<int>();
        if (f["snmin"]) cfg.finder.snmin = f["snmin"].as<double>();
        if (f["npass"]) cfg.finder.npass = f["npass"].as<int>();
        if (f["nblock"]) cfg.finder.nblock = f["nblock"].as<int>();
        if (f["block_ratio"]) cfg.finder.block_ratio = f["block_ratio"].as<double>();
        if (f["ps_res"]) cfg.finder.ps_res = f["ps_res"].as<double>();
        if (f["pixwin"]) cfg.finder.pixwin = f["pixwin"].as<bool>();
        if (f["kernel"]) cfg.finder.kernel = f["kernel"].as<int>();
        if (f["extended_threshold"]) cfg.finder.extended_threshold = f["extended_threshold"].as<double>();
        if (f["norm_block"]) cfg.finder.norm_block = f["norm_block"].as<int>();
        if (f["highl_cut"]) cfg.finder.highl_cut = f["highl_cut"].as<double>();
        if (f["noise_seed"]) cfg.finder.noise_seed = f["noise_seed"].as<int>();
        if (f["noise_lknee"]) cfg.finder.noise_lknee = f["noise_lknee"].as<double>();
        if (f["noise_alpha"]) cfg.finder.noise_alpha = f["noise_alpha"].as<double>();
    }

    if (node["fitter"]) {
        auto f = node["fitter"];
        if (f["apod"]) cfg.fitter.apod = f["apod"].as<int>();
        if (f["apod_margin"]) cfg.fitter.apod_margin = f["apod_margin"].as<int>();
        if (f["npass"]) cfg.fitter.npass = f["npass"].as<int>();
        if (f["indep_tol"]) cfg.fitter.indep_tol = f["indep_tol"].as<double>();
        if (f["beam_tol"]) cfg.fitter.beam_tol = f["beam_tol"].as<double>();
        if (f["ps_res"]) cfg.fitter.ps_res = f["ps_res"].as<double>();
        if (f["pixwin"]) cfg.fitter.pixwin = f["pixwin"].as<bool>();
        if (f["highl_cut"]) cfg.fitter.highl_cut = f["highl_cut"].as<double>();
        if (f["noise_seed"]) cfg.fitter.noise_seed = f["noise_seed"].as<int>();
        if (f["noise_lknee"]) cfg.fitter.noise_lknee = f["noise_lknee"].as<double>();
        if (f["noise_alpha"]) cfg.fitter.noise_alpha = f["noise_alpha"].as<double>();
        if (f["prior_variability"]) cfg.fitter.prior_variability = f["prior_variability"].as<double>();
        if (f["prior_min_ivar"]) cfg.fitter.prior_min_ivar = f["prior_min_ivar"].as<double>();
    }

    if (node["artifacts"]) {
        auto a = node["artifacts"];
        if (a["enabled"]) cfg.artifacts.enabled = a["enabled"].as<bool>();
        if (a["vlim"]) cfg.artifacts.vlim = a["vlim"].as<double>();
        if (a["maxrad_arcmin"]) cfg.artifacts.maxrad_arcmin = a["maxrad_arcmin"].as<double>();
        if (a["jumprad_arcmin"]) cfg.artifacts.jumprad_arcmin = a["jumprad_arcmin"].as<double>();
        if (a["gmax"]) cfg.artifacts.gmax = a["gmax"].as<int>();
        if (a["maxit"]) cfg.artifacts.maxit = a["maxit"].as<int>();
        if (a["core_lim"]) cfg.artifacts.core_lim = a["core_lim"].as<double>();
        if (a["core_rad_arcmin"]) cfg.artifacts.core_rad_arcmin = a["core_rad_arcmin"].as<double>();
        if (a["prune_near_bright"]) cfg.artifacts.prune_near_bright = a["prune_near_bright"].as<bool>();
        if (a["bright_snr"]) cfg.artifacts.bright_snr = a["bright_snr"].as<double>();
        if (a["bright_rad_arcmin"]) cfg.artifacts.bright_rad_arcmin = a["bright_rad_arcmin"].as<double>();
    }

    if (node["merge"]) {
        auto m = node["merge"];
        if (m["rlim_arcmin"]) cfg.merge.rlim_arcmin = m["rlim_arcmin"].as<double>();
        if (m["alim"]) cfg.merge.alim = m["alim"].as<double>();
        if (m["crop"]) cfg.merge.crop = m["crop"].as<int>();
    }

    if (node["regions"]) {
        auto r = node["regions"];
        if (r["spec"]) cfg.regions.spec = r["spec"].as<std::string>();
        if (r["pad"]) cfg.regions.pad = r["pad"].as<int>();
        if (r["fft_pad"]) cfg.regions.fft_pad = r["fft_pad"].as<bool>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["catalog_format"]) cfg.output.catalog_format = o["catalog_format"].as<std::string>();
        if (o["write_maps"]) cfg.output.write_maps = o["write_maps"].as<bool>();
    }

    return cfg;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    try {
        return parse_config(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["beam"]["spec"] = beam.spec;
    node["beam"]["profile_samples"] = beam.profile_samples;
    node["beam"]["profile_tol"] = beam.profile_tol;

    node["finder"]["freq_ghz"] = finder.freq_ghz;
    node["finder"]["apod"] = finder.apod;
    node["finder"]["apod_margin"] = finder.apod_margin;
    node["finder"]["snmin"] = finder.snmin;
    node["finder"]["npass"] = finder.npass;
    node["finder"]["nblock"] = finder.nblock;
    node["finder"]["block_ratio"] = finder.block_ratio;
    node["finder"]["ps_res"] = finder.ps_res;
    node["finder"]["pixwin"] = finder.pixwin;
    node["finder"]["kernel"] = finder.kernel;
    node["finder"]["extended_threshold"] = finder.extended_threshold;
    node["finder"]["norm_block"] = finder.norm_block;
    node["finder"]["highl_cut"] = finder.highl_cut;
    node["finder"]["noise_seed"] = finder.noise_seed;
    node["finder"]["noise_lknee"] = finder.noise_lknee;
    node["finder"]["noise_alpha"] = finder.noise_alpha;

    node["fitter"]["apod"] = fitter.apod;
    node["fitter"]["apod_margin"] = fitter.apod_margin;
    node["fitter"]["npass"] = fitter.npass;
    node["fitter"]["indep_tol"] = fitter.indep_tol;
    node["fitter"]["beam_tol"] = fitter.beam_tol;
    node["fitter"]["ps_res"] = fitter.ps_res;
    node["fitter"]["pixwin"] = fitter.pixwin;
    node["fitter"]["highl_cut"] = fitter.highl_cut;
    node["fitter"]["noise_seed"] = fitter.noise_seed;
    node["fitter"]["noise_lknee"] = fitter.noise_lknee;
    node["fitter"]["noise_alpha"] = fitter.noise_alpha;
    node["fitter"]["prior_variability"] = fitter.prior_variability;
    node["fitter"]["prior_min_ivar"] = fitter.prior_min_ivar;

    node["artifacts"]["enabled"] = artifacts.enabled;
    node["artifacts"]["vlim"] = artifacts.vlim;
    node["artifacts"]["maxrad_arcmin"] = artifacts.maxrad_arcmin;
    node["artifacts"]["jumprad_arcmin"] = artifacts.jumprad_arcmin;
    node["artifacts"]["gmax"] = artifacts.gmax;
    node["artifacts"]["maxit"] = artifacts.maxit;
    node["artifacts"]["core_lim"] = artifacts.core_lim;
    node["artifacts"]["core_rad_arcmin"] = artifacts.core_rad_arcmin;
    node["artifacts"]["prune_near_bright"] = artifacts.prune_near_bright;
    node["artifacts"]["bright_snr"] = artifacts.bright_snr;
    node["artifacts"]["bright_rad_arcmin"] = artifacts.bright_rad_arcmin;

    node["merge"]["rlim_arcmin"] = merge.rlim_arcmin;
    node["merge"]["alim"] = merge.alim;
    node["merge"]["crop"] = merge.crop;

    node["regions"]["spec"] = regions.spec;
    node["regions"]["pad"] = regions.pad;
    node["regions"]["fft_pad"] = regions.fft_pad;

    node["output"]["catalog_format"] = output.catalog_format;
    node["output"]["write_maps"] = output.write_maps;

    return node;
}

void Config::validate() const {
    if (beam.spec.empty()) {
        throw ValidationError("beam.spec must not be empty");
    }
    if (beam.profile_samples < 3) {
        throw ValidationError("beam.profile_samples must be >= 3");
    }
    if (!is_positive_finite(beam.profile_tol)) {
        throw ValidationError("beam.profile_tol must be > 0");
    }

    if (!is_positive_finite(finder.freq_ghz)) {
        throw ValidationError("finder.freq_ghz must be > 0");
    }
    if (finder.apod < 1) {
        throw ValidationError("finder.apod must be >= 1");
    }
    if (finder.apod_margin < 0) {
        throw ValidationError("finder.apod_margin must be >= 0");
    }
    if (!is_positive_finite(finder.snmin)) {
        throw ValidationError("finder.snmin must be > 0");
    }
    if (finder.npass < 1) {
        throw ValidationError("finder.npass must be >= 1");
    }
    if (finder.nblock < 1) {
        throw ValidationError("finder.nblock must be >= 1");
    }
    if (!(finder.block_ratio > 1.0) || !std::isfinite(finder.block_ratio)) {
        throw ValidationError("finder.block_ratio must be > 1");
    }
    if (!is_positive_finite(finder.ps_res)) {
        throw ValidationError("finder.ps_res must be > 0");
    }
    if (finder.kernel < 8) {
        throw ValidationError("finder.kernel must be >= 8");
    }
    if (!(finder.extended_threshold >= 1.0)) {
        throw ValidationError("finder.extended_threshold must be >= 1");
    }
    if (finder.norm_block < 1) {
        throw ValidationError("finder.norm_block must be >= 1");
    }
    if (finder.highl_cut < 0.0) {
        throw ValidationError("finder.highl_cut must be >= 0");
    }
    if (!is_positive_finite(finder.noise_lknee)) {
        throw ValidationError("finder.noise_lknee must be > 0");
    }

    if (fitter.apod < 1) {
        throw ValidationError("fitter.apod must be >= 1");
    }
    if (fitter.apod_margin < 0) {
        throw ValidationError("fitter.apod_margin must be >= 0");
    }
    if (fitter.npass < 1) {
        throw ValidationError("fitter.npass must be >= 1");
    }
    if (!(fitter.indep_tol > 0.0 && fitter.indep_tol < 1.0)) {
        throw ValidationError("fitter.indep_tol must be in (0, 1)");
    }
    if (!(fitter.beam_tol > 0.0 && fitter.beam_tol < 1.0)) {
        throw ValidationError("fitter.beam_tol must be in (0, 1)");
    }
    if (!is_positive_finite(fitter.ps_res)) {
        throw ValidationError("fitter.ps_res must be > 0");
    }
    if (fitter.highl_cut < 0.0) {
        throw ValidationError("fitter.highl_cut must be >= 0");
    }
    if (!is_positive_finite(fitter.noise_lknee)) {
        throw ValidationError("fitter.noise_lknee must be > 0");
    }
    if (fitter.prior_variability < 0.0) {
        throw ValidationError("fitter.prior_variability must be >= 0");
    }
    if (!is_positive_finite(fitter.prior_min_ivar)) {
        throw ValidationError("fitter.prior_min_ivar must be > 0");
    }

    if (!(artifacts.vlim > 0.0 && artifacts.vlim < 1.0)) {
        throw ValidationError("artifacts.vlim must be in (0, 1)");
    }
    if (!(artifacts.core_lim > 0.0 && artifacts.core_lim < 1.0)) {
        throw ValidationError("artifacts.core_lim must be in (0, 1)");
    }
    if (!is_positive_finite(artifacts.maxrad_arcmin) ||
        !is_positive_finite(artifacts.jumprad_arcmin) ||
        !is_positive_finite(artifacts.core_rad_arcmin)) {
        throw ValidationError("artifacts radii must be > 0");
    }
    if (artifacts.gmax < 1 || artifacts.maxit < 1) {
        throw ValidationError("artifacts.gmax and artifacts.maxit must be >= 1");
    }
    if (!is_positive_finite(artifacts.bright_snr) ||
        !is_positive_finite(artifacts.bright_rad_arcmin)) {
        throw ValidationError("artifacts.bright_snr and artifacts.bright_rad_arcmin must be > 0");
    }

    if (!is_positive_finite(merge.rlim_arcmin)) {
        throw ValidationError("merge.rlim_arcmin must be > 0");
    }
    if (!(merge.alim >= 0.0 && merge.alim < 1.0)) {
        throw ValidationError("merge.alim must be in [0, 1)");
    }
    if (merge.crop < 0) {
        throw ValidationError("merge.crop must be >= 0");
    }

    if (regions.spec.empty()) {
        throw ValidationError("regions.spec must not be empty");
    }
    if (regions.pad < 0) {
        throw ValidationError("regions.pad must be >= 0");
    }

    if (output.catalog_format != "txt" && output.catalog_format != "fits") {
        throw ValidationError("output.catalog_format must be 'txt' or 'fits'");
    }
}

} // namespace ptsrc::config
