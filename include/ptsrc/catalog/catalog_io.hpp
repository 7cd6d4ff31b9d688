#pragma once

#include "ptsrc/catalog/catalog.hpp"

#include <filesystem>

namespace ptsrc::catalog {

namespace fs = std::filesystem;

// Whitespace columns in degrees, mK and mJy, one header line
void write_catalog_txt(const fs::path& path, const Catalog& cat);
Catalog read_catalog_txt(const fs::path& path);

// Binary table extension in native units
void write_catalog_fits(const fs::path& path, const Catalog& cat);
Catalog read_catalog_fits(const fs::path& path);

// Dispatch on the extension: .fits/.fit is binary, anything else text
void write_catalog(const fs::path& path, const Catalog& cat);
Catalog read_catalog(const fs::path& path);

} // namespace ptsrc::catalog
