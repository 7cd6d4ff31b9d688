#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace ptsrc::config {

namespace fs = std::filesystem;

struct BeamConfig {
  std::string spec = "1.4";      // FWHM in arcmin, or path to an "l b_l" file
  int profile_samples = 10001;
  double profile_tol = 1e-7;
};

struct FinderConfig {
  double freq_ghz = 150.0;
  int apod = 15;                 // pixels
  int apod_margin = 10;          // pixels
  double snmin = 3.5;
  int npass = 2;
  int nblock = 10;
  double block_ratio = 2.0;      // per-block divisor of the S/N cutoff
  double ps_res = 2000.0;        // noise spectrum smoothing scale in l
  bool pixwin = true;
  int kernel = 256;              // template thumbnail size
  double extended_threshold = 1.1;
  int norm_block = 240;          // S/N normalization block size
  double highl_cut = 0.0;        // 0 disables the high-l flattening
  int noise_seed = 0;
  double noise_lknee = 3000.0;
  double noise_alpha = -2.0;
};

struct FitterConfig {
  int apod = 15;
  int apod_margin = 10;
  int npass = 2;
  double indep_tol = 1e-4;
  double beam_tol = 1e-4;
  double ps_res = 2000.0;
  bool pixwin = true;
  double highl_cut = 0.0;
  int noise_seed = 0;
  double noise_lknee = 3000.0;
  double noise_alpha = -2.0;
  double prior_variability = 1.0;
  double prior_min_ivar = 1e-10;
};

struct ArtifactConfig {
  bool enabled = true;
  double vlim = 0.005;
  double maxrad_arcmin = 80.0;
  double jumprad_arcmin = 7.0;
  int gmax = 1000;
  int maxit = 100;
  double core_lim = 0.05;
  double core_rad_arcmin = 2.0;
  bool prune_near_bright = false;
  double bright_snr = 100.0;
  double bright_rad_arcmin = 2.0;
};

struct MergeConfig {
  double rlim_arcmin = 1.0;
  double alim = 0.25;
  int crop = 0;                  // tile border ignored when merging maps
};

struct RegionConfig {
  std::string spec = "full";     // full | tile[:ny[:nx]] | box:dec1:ra1:dec2:ra2 | file
  int pad = 60;
  bool fft_pad = true;
};

struct OutputConfig {
  std::string catalog_format = "txt";  // txt | fits
  bool write_maps = true;
};

struct Config {
  BeamConfig beam;
  FinderConfig finder;
  FitterConfig fitter;
  ArtifactConfig artifacts;
  MergeConfig merge;
  RegionConfig regions;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);
  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;
  void validate() const;
};

} // namespace ptsrc::config
