#pragma once

#include <cmath>

namespace ptsrc::core {

constexpr double kDegree = M_PI / 180.0;
constexpr double kArcmin = kDegree / 60.0;
constexpr double kArcsec = kArcmin / 60.0;

// sigma = fwhm * kFwhmToSigma
const double kFwhmToSigma = 1.0 / std::sqrt(8.0 * std::log(2.0));

constexpr double kTCmb = 2.72548;           // K
constexpr double kPlanck = 6.62606957e-34;  // J s
constexpr double kBoltzmann = 1.3806488e-23;  // J/K
constexpr double kLightSpeed = 299792458.0;   // m/s

// Derivative of the blackbody intensity with respect to temperature, Jy/sr/K
double dplanck(double freq_hz, double temp = kTCmb);

// Factor turning a linearized temperature increment (K) into a flux (Jy)
// for a source with the given beam solid angle (sr).
double flux_factor(double beam_area, double freq_hz, double temp = kTCmb);

} // namespace ptsrc::core
