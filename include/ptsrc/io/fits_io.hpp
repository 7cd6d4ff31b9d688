#pragma once

#include "ptsrc/astrometry/wcs.hpp"
#include "ptsrc/core/types.hpp"
#include "ptsrc/sky/geometry.hpp"

#include <map>
#include <optional>
#include <string>

namespace ptsrc::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    // Integer keywords are returned as doubles too
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// 2D sky map with its header and pixelization
struct FitsMap {
    Matrix2Dd data;
    FitsHeader header;
    sky::Geometry geometry;
};

bool is_fits_path(const fs::path& path);

// Linear WCS from CTYPE/CRPIX/CRVAL and either CD or CDELT/CROTA keywords
astrometry::WCS wcs_from_header(const FitsHeader& header, int naxis1, int naxis2);
void wcs_to_header(const astrometry::WCS& wcs, FitsHeader& header);

// Read the primary image (first plane of a cube) as doubles
FitsMap read_fits_map(const fs::path& path);

// Write a double image with the WCS of geom; overwrites existing files
void write_fits_map(const fs::path& path, const Matrix2Dd& data, const sky::Geometry& geom,
                    const FitsHeader& extra = FitsHeader());

} // namespace ptsrc::io
