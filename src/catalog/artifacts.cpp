#include "ptsrc/catalog/artifacts.hpp"
#include "ptsrc/core/utils.hpp"
#include "ptsrc/grouping/correlation_groups.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace ptsrc::catalog {

std::vector<SourceArtifacts> find_source_artifacts(const Catalog& cat, const ArtifactParams& params) {
    std::vector<SourceArtifacts> out;
    if (cat.empty()) return out;

    const int n = static_cast<int>(cat.size());
    std::vector<double> sn(n);
    for (int i = 0; i < n; ++i) sn[i] = snr(cat[i]);
    const std::vector<SkyPos> pos = positions(cat);

    std::vector<int> strong;
    for (int i = 0; i < n; ++i) {
        if (sn[i] > 1.0 / params.core_lim) strong.push_back(i);
    }
    if (strong.empty()) return out;
    std::stable_sort(strong.begin(), strong.end(), [&](int a, int b) { return sn[a] > sn[b]; });

    const grouping::SkyIndex index(pos);
    std::set<int> done;

    for (int si : strong) {
        if (done.count(si)) continue;
        const std::vector<int> group = index.query_radius(pos[si], params.maxrad);

        std::set<int> tagged{si};
        std::vector<int> faint;
        for (int j : group) {
            if (sn[j] < sn[si] * params.core_lim &&
                core::angular_distance(pos[j], pos[si]) < params.core_rad) {
                tagged.insert(j);
            }
            if (sn[j] < sn[si] * params.vlim) faint.push_back(j);
        }

        const int nfaint = static_cast<int>(faint.size());
        if (nfaint > 0 && nfaint < params.gmax) {
            for (int it = 0; it < params.maxit; ++it) {
                std::vector<int> matches;
                for (int j : faint) {
                    if (tagged.count(j)) continue;
                    for (int t : tagged) {
                        if (core::angular_distance(pos[j], pos[t]) < params.jumprad) {
                            matches.push_back(j);
                            break;
                        }
                    }
                }
                if (matches.empty()) break;
                tagged.insert(matches.begin(), matches.end());
            }
        }

        tagged.erase(si);
        if (tagged.empty()) continue;
        done.insert(tagged.begin(), tagged.end());
        out.push_back(SourceArtifacts{si, std::vector<int>(tagged.begin(), tagged.end())});
    }
    return out;
}

namespace {

Entry merge_group(const Catalog& cat, const std::vector<int>& members) {
    std::vector<double> w(members.size());
    double wsum = 0.0;
    for (size_t k = 0; k < members.size(); ++k) {
        const double d = cat[members[k]].damp[0];
        w[k] = 1.0 / (d * d);
        wsum += w[k];
    }
    if (!std::isfinite(wsum) || wsum <= 0.0) {
        std::fill(w.begin(), w.end(), 1.0);
        wsum = static_cast<double>(w.size());
    }

    const Entry& first = cat[members.front()];
    Entry e;
    e.ra = 0.0;
    e.dec = 0.0;
    e.npix = 0.0;
    for (int c = 0; c < kNumComp; ++c) {
        e.damp[c] = first.damp[c];
        e.dflux[c] = first.dflux[c];
    }

    std::vector<double> status;
    for (size_t k = 0; k < members.size(); ++k) {
        const Entry& m = cat[members[k]];
        const double wk = w[k] / wsum;
        // Average RA on the branch of the first member
        e.ra += wk * core::rewind(m.ra, first.ra);
        e.dec += wk * m.dec;
        e.npix += wk * m.npix;
        for (int c = 0; c < kNumComp; ++c) {
            e.amp[c] += wk * m.amp[c];
            e.flux[c] += wk * m.flux[c];
            e.damp[c] = std::min(e.damp[c], m.damp[c]);
            e.dflux[c] = std::min(e.dflux[c], m.dflux[c]);
        }
        status.push_back(static_cast<double>(m.status));
    }
    e.ra = core::rewind(e.ra, M_PI);
    e.status = core::nint(core::median_of(status));
    return e;
}

} // namespace

Catalog merge_duplicates(const Catalog& cat, double rlim, double alim) {
    Catalog out;
    if (cat.empty()) return out;

    const int n = static_cast<int>(cat.size());
    const std::vector<SkyPos> pos = positions(cat);
    const grouping::SkyIndex index(pos);
    std::vector<bool> done(n, false);

    for (int i = 0; i < n; ++i) {
        std::vector<int> group;
        for (int j : index.query_radius(pos[i], rlim)) {
            if (!done[j]) group.push_back(j);
        }
        if (group.empty()) continue;
        if (group.size() == 1) {
            done[group[0]] = true;
            out.push_back(cat[group[0]]);
            continue;
        }

        double amax = 0.0;
        for (int j : group) amax = std::max(amax, std::abs(cat[j].amp[0]));
        std::vector<int> good;
        for (int j : group) {
            if (std::abs(cat[j].amp[0]) >= amax * (1.0 - alim)) good.push_back(j);
        }
        // Non-finite amplitudes can disqualify the whole group
        if (good.empty()) continue;

        out.push_back(merge_group(cat, good));
        for (int j : group) done[j] = true;
    }
    return out;
}

Catalog prune_near_bright(const Catalog& cat, double lim_bright, double rlim) {
    const int n = static_cast<int>(cat.size());
    std::vector<double> sn(n);
    for (int i = 0; i < n; ++i) sn[i] = std::abs(flux_snr(cat[i]));

    const std::vector<SkyPos> pos = positions(cat);
    const grouping::SkyIndex index(pos);
    std::vector<bool> rejected(n, false);

    for (int i = 0; i < n; ++i) {
        if (!(sn[i] > lim_bright)) continue;
        const std::vector<int> group = index.query_radius(pos[i], rlim);
        if (group.empty()) continue;
        const int best = *std::max_element(group.begin(), group.end(),
                                           [&](int a, int b) { return sn[a] < sn[b]; });
        for (int j : group) {
            if (j != best) rejected[j] = true;
        }
    }

    Catalog out;
    for (int i = 0; i < n; ++i) {
        if (!rejected[i]) out.push_back(cat[i]);
    }
    return out;
}

} // namespace ptsrc::catalog
