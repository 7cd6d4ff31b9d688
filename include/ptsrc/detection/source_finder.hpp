#pragma once

#include "ptsrc/beam/beam.hpp"
#include "ptsrc/catalog/artifacts.hpp"
#include "ptsrc/catalog/catalog.hpp"
#include "ptsrc/config/configuration.hpp"
#include "ptsrc/core/events.hpp"
#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <vector>

namespace ptsrc::detection {

// Position and amplitude of one connected component of a filtered map
struct ComponentFit {
    PixPos pos;
    double amp = 0.0;
    bool extended = false;
};

// Center-of-mass fit of each listed label, weighted by fmap. Components whose
// extremum exceeds the center-of-mass amplitude by extended_threshold use the
// extremum instead.
std::vector<ComponentFit> fit_labeled_sources(const Matrix2Dd& fmap, const Matrix2Di& labels,
                                              const std::vector<int>& label_ids,
                                              double extended_threshold = 1.1);

// Sum of sub-pixel shifted, scaled copies of tmpl (centered at size/2)
// placed at each pixel position, wrapping around the map edges
Matrix2Dd calc_model(int ny, int nx, const std::vector<PixPos>& pixels, const Matrix2Dd& tmpl,
                     const std::vector<double>& amps);

struct FinderResult {
    catalog::Catalog catalog;
    Matrix2Dd snmap;        // S/N map before any subtraction
    Matrix2Dd resid_snmap;  // S/N map after subtracting all blocks
    Matrix2Dd model;        // beam templates at the catalog positions
    Matrix2Dd resid;        // map - model
    Matrix2Dd map;          // apodized, pixel-window corrected input
    Matrix2Dd beam_thumb;   // unit-peak real-space beam
    sky::Geometry geometry;
};

// Multi-pass, multi-block matched filter detection. map and ivar share geom.
FinderResult find_sources(const Matrix2Dd& map, const Matrix2Dd& ivar, const sky::Geometry& geom,
                          const beam::Beam& beam, const config::FinderConfig& cfg,
                          const core::EventSink* events = nullptr);

catalog::ArtifactParams artifact_params(const config::ArtifactConfig& cfg);

// Remove artifacts from the catalog and rebuild model and residual.
// The S/N maps are left as they are.
FinderResult prune_artifacts(const FinderResult& result, const config::ArtifactConfig& cfg);

} // namespace ptsrc::detection
