#include "ptsrc/core/units.hpp"

namespace ptsrc::core {

double dplanck(double freq_hz, double temp) {
    const double x = kPlanck * freq_hz / (kBoltzmann * temp);
    const double s = std::sinh(0.5 * x);
    const double num = 2.0 * std::pow(x, 4) * std::pow(kBoltzmann, 3) * temp * temp;
    const double den = kPlanck * kPlanck * kLightSpeed * kLightSpeed;
    return num / den / (4.0 * s * s) * 1e26;
}

double flux_factor(double beam_area, double freq_hz, double temp) {
    return dplanck(freq_hz, temp) * beam_area;
}

} // namespace ptsrc::core
