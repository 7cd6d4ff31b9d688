#include "runner_pipeline.hpp"

#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/events.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

namespace {

using ptsrc::runner::CommandOptions;

void add_map_options(CLI::App *cmd, CommandOptions &opts) {
  cmd->add_option("--map", opts.map_path, "Sky map (FITS)")
      ->required()
      ->check(CLI::ExistingFile);
  cmd->add_option("--ivar", opts.ivar_path, "Inverse variance map (FITS)")
      ->required()
      ->check(CLI::ExistingFile);
  cmd->add_option("--out", opts.out_dir, "Output directory")->required();
  cmd->add_option("--regions", opts.region_spec,
                  "Region spec: full | tile[:ny[:nx]] | box:dec1:ra1:dec2:ra2 | file");
}

void add_common_options(CLI::App *cmd, CommandOptions &opts) {
  cmd->add_option("--config", opts.config_path, "Path to config.yaml");
  cmd->add_option("--beam", opts.beam_spec,
                  "Beam FWHM in arcmin, or an 'l b_l' text file");
  cmd->add_option("--run-id", opts.run_id, "Run identifier for the event log");
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Point source finder and amplitude fitter"};
  app.require_subcommand(1);

  CommandOptions find_opts;
  auto find_cmd =
      app.add_subcommand("find", "Blind matched-filter source detection");
  add_map_options(find_cmd, find_opts);
  add_common_options(find_cmd, find_opts);

  CommandOptions fit_opts;
  auto fit_cmd = app.add_subcommand(
      "fit", "Joint amplitude fit at the positions of a catalog");
  add_map_options(fit_cmd, fit_opts);
  add_common_options(fit_cmd, fit_opts);
  fit_cmd->add_option("--catalog", fit_opts.catalog_path, "Input catalog")
      ->required()
      ->check(CLI::ExistingFile);
  fit_cmd->add_flag("--prior", fit_opts.use_prior,
                    "Use the input amplitudes as priors");

  CommandOptions merge_opts;
  auto merge_cmd = app.add_subcommand(
      "merge-catalogs", "Concatenate catalogs and merge duplicates");
  add_common_options(merge_cmd, merge_opts);
  merge_cmd->add_option("--out", merge_opts.out_dir, "Output catalog")
      ->required();
  merge_cmd->add_option("catalogs", merge_opts.inputs, "Input catalogs")
      ->required()
      ->check(CLI::ExistingFile);

  CLI11_PARSE(app, argc, argv);

  const CommandOptions *active = nullptr;
  try {
    if (find_cmd->parsed()) {
      active = &find_opts;
      return ptsrc::runner::run_find_command(find_opts);
    }
    if (fit_cmd->parsed()) {
      active = &fit_opts;
      return ptsrc::runner::run_fit_command(fit_opts);
    }
    if (merge_cmd->parsed()) {
      active = &merge_opts;
      return ptsrc::runner::run_merge_catalogs_command(merge_opts);
    }
  } catch (const ptsrc::PtsrcError &e) {
    ptsrc::core::emit_event("error", active ? active->run_id : std::string(),
                            {{"message", e.what()}}, std::cout);
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    ptsrc::core::emit_event("error", active ? active->run_id : std::string(),
                            {{"message", e.what()}}, std::cout);
    std::cerr << "Unexpected error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
