#pragma once

#include "ptsrc/config/configuration.hpp"
#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace ptsrc::runner {

// Duplicates every character written to it into two buffers
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Options shared by the subcommands. Empty strings mean "not given".
struct CommandOptions {
  std::string map_path;
  std::string ivar_path;
  std::string config_path;
  std::string out_dir;
  std::string catalog_path;
  std::string beam_spec;
  std::string region_spec;
  std::string run_id;
  bool use_prior = false;
  std::vector<std::string> inputs;
};

// Defaults when path is empty; command line overrides are applied before
// validation
config::Config load_run_config(const CommandOptions &opts);

std::filesystem::path catalog_output_path(const std::filesystem::path &out_dir,
                                          const config::Config &cfg,
                                          const std::string &stem);

// A region and the padded box actually processed for it
struct RegionWork {
  PixBox box;
  PixBox padded;
};

std::vector<RegionWork> plan_regions(const config::Config &cfg,
                                     const sky::Geometry &geom);

// Whether pos falls on a pixel of box in the full map
bool owns_position(const sky::Geometry &geom, const PixBox &box,
                   const SkyPos &pos);

} // namespace ptsrc::runner
