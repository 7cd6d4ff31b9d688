#pragma once

#include "ptsrc/catalog/catalog.hpp"
#include "ptsrc/core/units.hpp"

#include <vector>

namespace ptsrc::catalog {

struct ArtifactParams {
    double vlim = 0.005;                     // chain members are weaker than vlim x owner S/N
    double maxrad = 80.0 * core::kArcmin;    // search radius around a strong source
    double jumprad = 7.0 * core::kArcmin;    // maximum chain step
    int gmax = 1000;                         // crowded neighborhoods are skipped
    int maxit = 100;
    double core_lim = 0.05;                  // strong means S/N > 1/core_lim
    double core_rad = 2.0 * core::kArcmin;
};

struct SourceArtifacts {
    int owner = -1;
    std::vector<int> artifacts;  // ascending catalog indices
};

// Entries spawned by bright sources: weak neighbors inside the core radius
// plus chains of faint entries reachable in jumprad steps. Owners are
// visited by decreasing S/N and an owner already tagged is skipped.
std::vector<SourceArtifacts> find_source_artifacts(const Catalog& cat,
                                                   const ArtifactParams& params = ArtifactParams());

// Merge entries closer than rlim. Groups whose members agree in amplitude to
// within alim are averaged; otherwise only members within alim of the
// strongest are. Uncertainties take the smallest contributing value.
Catalog merge_duplicates(const Catalog& cat, double rlim = core::kArcmin, double alim = 0.25);

// Around every entry with flux S/N above lim_bright keep only the highest
// flux S/N entry within rlim
Catalog prune_near_bright(const Catalog& cat, double lim_bright = 100.0,
                          double rlim = 2.0 * core::kArcmin);

} // namespace ptsrc::catalog
