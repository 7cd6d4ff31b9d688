#pragma once

#include "ptsrc/core/types.hpp"

namespace ptsrc::sky {

// Unnormalized forward 2D transform
ComplexMatrix fft(const Matrix2Dd& map);

// Inverse 2D transform divided by the pixel count; real part only
Matrix2Dd ifft_real(const ComplexMatrix& fmap);

// Convolution expressed as a real multiplicative kernel in Fourier space
Matrix2Dd filter_map(const Matrix2Dd& map, const Matrix2Dd& kernel);

// Shift map content by a fractional number of pixels: out(p) = in(p - shift)
Matrix2Dd fourier_shift(const Matrix2Dd& map, double dy, double dx);

// Multiply by the sinc pixel window raised to power (-1 deconvolves)
Matrix2Dd apply_pixel_window(const Matrix2Dd& map, int power);

} // namespace ptsrc::sky
