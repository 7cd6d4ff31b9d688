#include "runner_pipeline.hpp"

#include "ptsrc/beam/beam.hpp"
#include "ptsrc/catalog/catalog.hpp"
#include "ptsrc/catalog/catalog_io.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/events.hpp"
#include "ptsrc/core/units.hpp"
#include "ptsrc/core/utils.hpp"
#include "ptsrc/detection/source_finder.hpp"
#include "ptsrc/fitting/amplitude_fitter.hpp"
#include "ptsrc/io/fits_io.hpp"
#include "ptsrc/pipeline/map_merge.hpp"
#include "ptsrc/sky/sampling.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace ptsrc::runner {

namespace fs = std::filesystem;
using core::json;

namespace {

// Event log in <out>/logs/run_events.jsonl, mirrored to stdout
class RunLog {
public:
  explicit RunLog(const fs::path &out_dir)
      : file_(out_dir / "logs" / "run_events.jsonl",
              std::ios::out | std::ios::trunc),
        tee_(std::cout.rdbuf(), file_.rdbuf()), out_(&tee_) {
    if (!file_.is_open()) {
      throw IOError("cannot open events log file: " +
                    (out_dir / "logs" / "run_events.jsonl").string());
    }
  }

  std::ostream &out() { return out_; }

private:
  std::ofstream file_;
  TeeBuf tee_;
  std::ostream out_;
};

struct MapInputs {
  Matrix2Dd map;
  Matrix2Dd ivar;
  sky::Geometry geom;
};

MapInputs read_inputs(const CommandOptions &opts) {
  io::FitsMap map = io::read_fits_map(opts.map_path);
  io::FitsMap ivar = io::read_fits_map(opts.ivar_path);
  if (map.data.rows() != ivar.data.rows() || map.data.cols() != ivar.data.cols()) {
    throw PipelineError("Map " + opts.map_path + " is " +
                        std::to_string(map.data.rows()) + "x" +
                        std::to_string(map.data.cols()) + " but " +
                        opts.ivar_path + " is " +
                        std::to_string(ivar.data.rows()) + "x" +
                        std::to_string(ivar.data.cols()));
  }
  return MapInputs{std::move(map.data), std::move(ivar.data), map.geometry};
}

fs::path prepare_out_dir(const CommandOptions &opts, const config::Config &cfg) {
  const fs::path out_dir = fs::absolute(opts.out_dir);
  fs::create_directories(out_dir / "logs");
  cfg.save(out_dir / "config.yaml");
  return out_dir;
}

json run_info(const std::string &command, const CommandOptions &opts,
              const fs::path &out_dir) {
  return {{"command", command},
          {"map", opts.map_path},
          {"ivar", opts.ivar_path},
          {"config_path", opts.config_path},
          {"out_dir", out_dir.string()}};
}

double flux_conversion(const beam::Beam &beam, const sky::Geometry &geom,
                       double freq_ghz) {
  const double area = beam::transform_area(beam.transform_2d(geom), geom);
  return core::flux_factor(area, freq_ghz * 1e9) / 1e6;
}

} // namespace

int run_find_command(const CommandOptions &opts) {
  const config::Config cfg = load_run_config(opts);
  const fs::path out_dir = prepare_out_dir(opts, cfg);
  const std::string run_id =
      opts.run_id.empty() ? core::get_run_id() : opts.run_id;

  RunLog log(out_dir);
  std::ostream &log_file = log.out();
  const core::EventSink sink{run_id, &log_file};

  core::EventEmitter emitter;
  emitter.run_start(run_id, run_info("find", opts, out_dir), log_file);

  Stage stage = Stage::SETUP;
  try {
    emitter.stage_start(run_id, Stage::SETUP, json::object(), log_file);
    const MapInputs in = read_inputs(opts);
    const beam::Beam beam = beam::Beam::from_spec(cfg.beam.spec);
    const std::vector<RegionWork> regions = plan_regions(cfg, in.geom);
    emitter.stage_end(run_id, Stage::SETUP, "ok",
                      {{"ny", in.geom.ny()},
                       {"nx", in.geom.nx()},
                       {"nregions", static_cast<int>(regions.size())},
                       {"beam", cfg.beam.spec}},
                      log_file);

    stage = Stage::DETECTION;
    emitter.stage_start(run_id, Stage::DETECTION,
                        {{"snmin", cfg.finder.snmin}, {"npass", cfg.finder.npass}},
                        log_file);

    const int ny = in.geom.ny();
    const int nx = in.geom.nx();
    pipeline::MapAccumulator acc_model(ny, nx, cfg.merge.crop);
    pipeline::MapAccumulator acc_resid(ny, nx, cfg.merge.crop);
    pipeline::MapAccumulator acc_snmap(ny, nx, cfg.merge.crop);
    pipeline::MapAccumulator acc_resid_snmap(ny, nx, cfg.merge.crop);

    std::vector<catalog::Catalog> region_cats;
    int nraw = 0;
    int nartifact = 0;
    const int nreg = static_cast<int>(regions.size());
    for (int ri = 0; ri < nreg; ++ri) {
      const RegionWork &work = regions[ri];
      const Matrix2Dd rivar = sky::extract(in.ivar, work.padded);
      if (!(rivar.array() > 0.0).any()) {
        emitter.stage_progress(run_id, Stage::DETECTION, ri + 1, nreg,
                               "region " + std::to_string(ri) + " has no weight",
                               log_file);
        continue;
      }
      const Matrix2Dd rmap = sky::extract(in.map, work.padded);
      const sky::Geometry sub = in.geom.subgeometry(work.padded);

      detection::FinderResult res =
          detection::find_sources(rmap, rivar, sub, beam, cfg.finder, &sink);
      nraw += static_cast<int>(res.catalog.size());
      if (cfg.artifacts.enabled) {
        const size_t before = res.catalog.size();
        res = detection::prune_artifacts(res, cfg.artifacts);
        nartifact += static_cast<int>(before - res.catalog.size());
      }

      // The padding belongs to the neighbors
      catalog::Catalog owned;
      for (const auto &e : res.catalog) {
        if (owns_position(in.geom, work.box, e.pos()))
          owned.push_back(e);
      }
      region_cats.push_back(std::move(owned));

      if (cfg.output.write_maps) {
        acc_model.add(work.padded, res.model);
        acc_resid.add(work.padded, res.resid);
        acc_snmap.add(work.padded, res.snmap);
        acc_resid_snmap.add(work.padded, res.resid_snmap);
      }
      emitter.stage_progress(run_id, Stage::DETECTION, ri + 1, nreg,
                             "region " + std::to_string(ri) + ": " +
                                 std::to_string(region_cats.back().size()) +
                                 " sources",
                             log_file);
    }
    emitter.stage_end(run_id, Stage::DETECTION, "ok",
                      {{"nsrc_raw", nraw}, {"nartifacts", nartifact}}, log_file);

    stage = Stage::ARTIFACTS;
    emitter.stage_start(run_id, Stage::ARTIFACTS, json::object(), log_file);
    const catalog::Catalog all = catalog::concatenate(region_cats);
    catalog::Catalog cat = catalog::merge_duplicates(
        all, cfg.merge.rlim_arcmin * core::kArcmin, cfg.merge.alim);
    const size_t nmerged = cat.size();
    if (cfg.artifacts.prune_near_bright) {
      cat = catalog::prune_near_bright(cat, cfg.artifacts.bright_snr,
                                       cfg.artifacts.bright_rad_arcmin * core::kArcmin);
    }
    catalog::sort_by_snr(cat);
    emitter.stage_end(run_id, Stage::ARTIFACTS, "ok",
                      {{"nsrc_in", static_cast<int>(all.size())},
                       {"nsrc_merged", static_cast<int>(nmerged)},
                       {"nsrc_out", static_cast<int>(cat.size())}},
                      log_file);

    stage = Stage::OUTPUT;
    emitter.stage_start(run_id, Stage::OUTPUT, json::object(), log_file);
    const fs::path cat_path = catalog_output_path(out_dir, cfg, "cat");
    catalog::write_catalog(cat_path, cat);
    json written = {{"catalog", cat_path.string()}};
    if (cfg.output.write_maps) {
      const std::vector<std::pair<std::string, const pipeline::MapAccumulator *>> maps = {
          {"model.fits", &acc_model},
          {"resid.fits", &acc_resid},
          {"snmap.fits", &acc_snmap},
          {"resid_snmap.fits", &acc_resid_snmap}};
      for (const auto &[name, acc] : maps) {
        io::write_fits_map(out_dir / name, acc->result(), in.geom);
        written[name] = (out_dir / name).string();
      }
    }
    emitter.stage_end(run_id, Stage::OUTPUT, "ok", written, log_file);

    std::cout << "Sources: " << cat.size() << std::endl;
    std::cout << "Catalog: " << cat_path.string() << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  } catch (const std::exception &e) {
    emitter.stage_end(run_id, stage, "error", {{"error", e.what()}}, log_file);
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during " << stage_to_string(stage) << ": " << e.what()
              << std::endl;
    return 1;
  }
}

int run_fit_command(const CommandOptions &opts) {
  const config::Config cfg = load_run_config(opts);
  const fs::path out_dir = prepare_out_dir(opts, cfg);
  const std::string run_id =
      opts.run_id.empty() ? core::get_run_id() : opts.run_id;

  RunLog log(out_dir);
  std::ostream &log_file = log.out();
  const core::EventSink sink{run_id, &log_file};

  core::EventEmitter emitter;
  json info = run_info("fit", opts, out_dir);
  info["catalog"] = opts.catalog_path;
  info["prior"] = opts.use_prior;
  emitter.run_start(run_id, info, log_file);

  Stage stage = Stage::SETUP;
  try {
    emitter.stage_start(run_id, Stage::SETUP, json::object(), log_file);
    const MapInputs in = read_inputs(opts);
    const catalog::Catalog input = catalog::read_catalog(opts.catalog_path);
    const std::vector<SkyPos> positions = catalog::positions(input);
    const beam::Beam beam = beam::Beam::from_spec(cfg.beam.spec);
    const std::vector<RegionWork> regions = plan_regions(cfg, in.geom);
    emitter.stage_end(run_id, Stage::SETUP, "ok",
                      {{"ny", in.geom.ny()},
                       {"nx", in.geom.nx()},
                       {"nsrc", static_cast<int>(input.size())},
                       {"nregions", static_cast<int>(regions.size())}},
                      log_file);

    stage = Stage::AMPLITUDE_FIT;
    emitter.stage_start(run_id, Stage::AMPLITUDE_FIT,
                        {{"npass", cfg.fitter.npass}}, log_file);

    catalog::Catalog cat;
    int nfailed = 0;
    const int nreg = static_cast<int>(regions.size());
    for (int ri = 0; ri < nreg; ++ri) {
      const RegionWork &work = regions[ri];

      // Sources in the padding are fit too so that their flux is not
      // absorbed by the owned ones
      std::vector<int> members;
      for (size_t i = 0; i < positions.size(); ++i) {
        if (owns_position(in.geom, work.padded, positions[i]))
          members.push_back(static_cast<int>(i));
      }
      if (members.empty()) {
        emitter.stage_progress(run_id, Stage::AMPLITUDE_FIT, ri + 1, nreg,
                               "region " + std::to_string(ri) + " has no sources",
                               log_file);
        continue;
      }

      std::vector<SkyPos> rpos;
      VectorXd ramp(members.size());
      VectorXd rdamp(members.size());
      for (size_t k = 0; k < members.size(); ++k) {
        const catalog::Entry &e = input[members[k]];
        rpos.push_back(e.pos());
        ramp[k] = e.amp[0];
        rdamp[k] = e.damp[0];
      }
      catalog::Prior prior;
      if (opts.use_prior) {
        prior = catalog::build_prior(ramp, rdamp, cfg.fitter.prior_variability,
                                     cfg.fitter.prior_min_ivar);
      }

      const sky::Geometry sub = in.geom.subgeometry(work.padded);
      const Matrix2Dd rmap = sky::extract(in.map, work.padded);
      const Matrix2Dd rivar = sky::extract(in.ivar, work.padded);

      fitting::FitResult fit;
      try {
        fit = fitting::fit_amplitudes(rmap, rivar, sub, rpos, beam, cfg.fitter,
                                      cfg.beam, opts.use_prior ? &prior : nullptr,
                                      &sink);
      } catch (const SolverError &e) {
        ++nfailed;
        emitter.warning(run_id,
                        "region " + std::to_string(ri) + " skipped: " + e.what(),
                        log_file);
        continue;
      }

      const double fluxconv = flux_conversion(beam, sub, cfg.finder.freq_ghz);
      int nowned = 0;
      for (size_t a = 0; a < fit.fit_inds.size(); ++a) {
        const catalog::Entry &src = input[members[fit.fit_inds[a]]];
        if (!owns_position(in.geom, work.box, src.pos()))
          continue;
        catalog::Entry e = src;
        e.amp[0] = fit.amp[a];
        e.damp[0] = fit.damp[a];
        e.flux[0] = fit.amp[a] * fluxconv;
        e.dflux[0] = fit.damp[a] * fluxconv;
        cat.push_back(e);
        ++nowned;
      }
      emitter.stage_progress(run_id, Stage::AMPLITUDE_FIT, ri + 1, nreg,
                             "region " + std::to_string(ri) + ": " +
                                 std::to_string(nowned) + " sources fit",
                             log_file);
    }
    catalog::sort_by_snr(cat);
    emitter.stage_end(run_id, Stage::AMPLITUDE_FIT, nfailed ? "partial" : "ok",
                      {{"nsrc_in", static_cast<int>(input.size())},
                       {"nsrc_fit", static_cast<int>(cat.size())},
                       {"nregions_failed", nfailed}},
                      log_file);

    stage = Stage::OUTPUT;
    emitter.stage_start(run_id, Stage::OUTPUT, json::object(), log_file);
    const fs::path cat_path = catalog_output_path(out_dir, cfg, "cat_fit");
    catalog::write_catalog(cat_path, cat);
    emitter.stage_end(run_id, Stage::OUTPUT, "ok",
                      {{"catalog", cat_path.string()}}, log_file);

    std::cout << "Fitted: " << cat.size() << " of " << input.size() << std::endl;
    std::cout << "Catalog: " << cat_path.string() << std::endl;
    emitter.run_end(run_id, true, nfailed ? "partial" : "ok", log_file);
    return 0;
  } catch (const std::exception &e) {
    emitter.stage_end(run_id, stage, "error", {{"error", e.what()}}, log_file);
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during " << stage_to_string(stage) << ": " << e.what()
              << std::endl;
    return 1;
  }
}

int run_merge_catalogs_command(const CommandOptions &opts) {
  const config::Config cfg = load_run_config(opts);
  const std::string run_id =
      opts.run_id.empty() ? core::get_run_id() : opts.run_id;
  if (opts.inputs.empty()) {
    throw ConfigError("merge-catalogs needs at least one input catalog");
  }

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"command", "merge-catalogs"},
                     {"inputs", opts.inputs},
                     {"out", opts.out_dir}},
                    std::cout);

  try {
    emitter.stage_start(run_id, Stage::MERGE, json::object(), std::cout);
    std::vector<catalog::Catalog> cats;
    for (const auto &path : opts.inputs)
      cats.push_back(catalog::read_catalog(path));
    const catalog::Catalog all = catalog::concatenate(cats);
    catalog::Catalog cat = catalog::merge_duplicates(
        all, cfg.merge.rlim_arcmin * core::kArcmin, cfg.merge.alim);
    catalog::sort_by_snr(cat);
    catalog::write_catalog(opts.out_dir, cat);
    emitter.stage_end(run_id, Stage::MERGE, "ok",
                      {{"nsrc_in", static_cast<int>(all.size())},
                       {"nsrc_out", static_cast<int>(cat.size())}},
                      std::cout);

    emitter.run_end(run_id, true, "ok", std::cout);
    return 0;
  } catch (const std::exception &e) {
    emitter.stage_end(run_id, Stage::MERGE, "error", {{"error", e.what()}},
                      std::cout);
    emitter.error(run_id, e.what(), std::cout);
    emitter.run_end(run_id, false, "error", std::cout);
    std::cerr << "Error during " << stage_to_string(Stage::MERGE) << ": "
              << e.what() << std::endl;
    return 1;
  }
}

} // namespace ptsrc::runner
