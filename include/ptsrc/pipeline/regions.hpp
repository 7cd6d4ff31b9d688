#pragma once

#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ptsrc::pipeline {

// Pixel boxes to process independently. spec is one of
//   full
//   tile[:ny[:nx]]          tiles of 480 pixels by default
//   box:dec1:ra1:dec2:ra2   degrees
//   <file>                  "ra1 ra2 dec1 dec2" rows in degrees, or ds9 box() lines
// Tiles at the far edges may extend past the map.
std::vector<PixBox> get_regions(const std::string& spec, const sky::Geometry& geom);

// Sky boxes as (corner1, corner2) pairs read from a region file
std::vector<std::pair<SkyPos, SkyPos>> read_boxes_txt(const fs::path& path);
std::vector<std::pair<SkyPos, SkyPos>> read_boxes_ds9(const fs::path& path);

// Grow box by pad on every side; with fft the size is also rounded up to a
// fast transform length
PixBox pad_region(const PixBox& box, int pad, bool fft = false);

} // namespace ptsrc::pipeline
