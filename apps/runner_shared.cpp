#include "runner_shared.hpp"

#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/utils.hpp"
#include "ptsrc/pipeline/regions.hpp"

#include <cmath>

namespace ptsrc::runner {

namespace fs = std::filesystem;

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

config::Config load_run_config(const CommandOptions &opts) {
  config::Config cfg;
  if (!opts.config_path.empty()) {
    if (!fs::exists(opts.config_path)) {
      throw ConfigError("Config file not found: " + opts.config_path);
    }
    cfg = config::Config::load(opts.config_path);
  }
  if (!opts.beam_spec.empty())
    cfg.beam.spec = opts.beam_spec;
  if (!opts.region_spec.empty())
    cfg.regions.spec = opts.region_spec;
  cfg.validate();
  return cfg;
}

fs::path catalog_output_path(const fs::path &out_dir, const config::Config &cfg,
                             const std::string &stem) {
  const std::string ext = cfg.output.catalog_format == "fits" ? ".fits" : ".txt";
  return out_dir / (stem + ext);
}

std::vector<RegionWork> plan_regions(const config::Config &cfg,
                                     const sky::Geometry &geom) {
  std::vector<RegionWork> work;
  for (const PixBox &box : pipeline::get_regions(cfg.regions.spec, geom)) {
    // Tiles at the far edges can reach past the map
    const PixBox clipped = intersect(box, geom.full_box());
    if (clipped.empty())
      continue;
    work.push_back(RegionWork{
        clipped, pipeline::pad_region(clipped, cfg.regions.pad, cfg.regions.fft_pad)});
  }
  return work;
}

bool owns_position(const sky::Geometry &geom, const PixBox &box,
                   const SkyPos &pos) {
  const PixPos pix = geom.sky_to_pix(pos);
  if (!std::isfinite(pix.y) || !std::isfinite(pix.x))
    return false;
  return box.contains(core::nint(pix.y), core::nint(pix.x));
}

} // namespace ptsrc::runner
