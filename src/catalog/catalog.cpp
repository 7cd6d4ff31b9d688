#include "ptsrc/catalog/catalog.hpp"

#include <algorithm>

namespace ptsrc::catalog {

double snr(const Entry& e) {
    return e.damp[0] > 0.0 ? e.amp[0] / e.damp[0] : 0.0;
}

double flux_snr(const Entry& e) {
    return e.dflux[0] > 0.0 ? e.flux[0] / e.dflux[0] : 0.0;
}

void sort_by_snr(Catalog& cat) {
    std::stable_sort(cat.begin(), cat.end(),
                     [](const Entry& a, const Entry& b) { return snr(a) > snr(b); });
}

Catalog select(const Catalog& cat, const std::vector<int>& indices) {
    Catalog out;
    out.reserve(indices.size());
    for (int i : indices) out.push_back(cat.at(static_cast<size_t>(i)));
    return out;
}

Catalog concatenate(const std::vector<Catalog>& cats) {
    Catalog out;
    for (const auto& c : cats) out.insert(out.end(), c.begin(), c.end());
    return out;
}

std::vector<SkyPos> positions(const Catalog& cat) {
    std::vector<SkyPos> out;
    out.reserve(cat.size());
    for (const auto& e : cat) out.push_back(e.pos());
    return out;
}

Prior build_prior(const VectorXd& amps, const VectorXd& damps, double variability,
                  double min_ivar) {
    Prior p;
    p.amp = amps;
    p.ivar = VectorXd::Constant(amps.size(), min_ivar);
    for (Eigen::Index i = 0; i < amps.size(); ++i) {
        if (damps[i] > 0.0) {
            const double v = amps[i] * variability;
            p.ivar[i] = 1.0 / (damps[i] * damps[i] + v * v);
        }
    }
    return p;
}

} // namespace ptsrc::catalog
