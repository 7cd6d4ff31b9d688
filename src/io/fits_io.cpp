#include "ptsrc/io/fits_io.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/utils.hpp"

#include <fitsio.h>
#include <cmath>
#include <vector>

namespace ptsrc::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto iit = int_values.find(key);
    if (iit != int_values.end()) {
        return static_cast<double>(iit->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

astrometry::WCS wcs_from_header(const FitsHeader& header, int naxis1, int naxis2) {
    auto num = [&](const char* key, double fallback) {
        auto v = header.get_double(key);
        return v ? *v : fallback;
    };

    Projection proj = Projection::CAR;
    if (auto ctype = header.get_string("CTYPE1")) {
        proj = astrometry::projection_from_ctype(*ctype);
    }

    const double crval1 = num("CRVAL1", 0.0);
    const double crval2 = num("CRVAL2", 0.0);
    const double crpix1 = num("CRPIX1", 0.5 * (naxis1 + 1));
    const double crpix2 = num("CRPIX2", 0.5 * (naxis2 + 1));

    const bool have_cd = header.get_double("CD1_1") || header.get_double("CD2_2");
    if (have_cd) {
        astrometry::WCS w;
        w.crval1 = crval1;
        w.crval2 = crval2;
        w.crpix1 = crpix1;
        w.crpix2 = crpix2;
        w.cd1_1 = num("CD1_1", 0.0);
        w.cd1_2 = num("CD1_2", 0.0);
        w.cd2_1 = num("CD2_1", 0.0);
        w.cd2_2 = num("CD2_2", 0.0);
        w.naxis1 = naxis1;
        w.naxis2 = naxis2;
        w.projection = proj;
        return w;
    }

    const double cdelt1 = num("CDELT1", 0.0);
    const double cdelt2 = num("CDELT2", 0.0);
    if (cdelt1 == 0.0 || cdelt2 == 0.0) {
        throw FitsError("Header has neither a CD matrix nor CDELT1/CDELT2");
    }
    const double crota1 = num("CROTA1", 0.0);
    const double crota2 = num("CROTA2", 0.0);
    const double rot = (std::abs(crota2) > 0) ? crota2 : crota1;
    return astrometry::wcs_from_cdelt_crota(crval1, crval2, crpix1, crpix2, cdelt1, cdelt2,
                                            rot, naxis1, naxis2, proj);
}

void wcs_to_header(const astrometry::WCS& wcs, FitsHeader& header) {
    const bool car = wcs.projection == Projection::CAR;
    header.set("CTYPE1", std::string(car ? "RA---CAR" : "RA---TAN"));
    header.set("CTYPE2", std::string(car ? "DEC--CAR" : "DEC--TAN"));
    header.set("CUNIT1", std::string("deg"));
    header.set("CUNIT2", std::string("deg"));
    header.set("CRPIX1", wcs.crpix1);
    header.set("CRPIX2", wcs.crpix2);
    header.set("CRVAL1", wcs.crval1);
    header.set("CRVAL2", wcs.crval2);
    header.set("CD1_1", wcs.cd1_1);
    header.set("CD1_2", wcs.cd1_2);
    header.set("CD2_1", wcs.cd2_1);
    header.set("CD2_2", wcs.cd2_2);
}

namespace {

// Header keywords that describe the data layout rather than the map
bool is_structural_key(const std::string& key) {
    return key == "SIMPLE" || key == "BITPIX" || key == "EXTEND" || key == "END" ||
           key == "COMMENT" || key == "HISTORY" || core::starts_with(key, "NAXIS");
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        if (fits_read_record(fptr, i, card, &status)) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;
        if (fits_get_keyname(card, keyname, &keylen, &status)) continue;

        std::string key(keyname);
        if (key.empty() || is_structural_key(key)) continue;

        char dtype = 0;
        if (fits_parse_value(card, value, comment, &status)) continue;
        if (fits_get_keytype(value, &dtype, &status)) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I': {
                auto v = core::parse_double(val_str);
                if (v && std::abs(*v) < 2147483647.0) {
                    header.set(key, static_cast<int>(*v));
                } else if (v) {
                    header.set(key, *v);
                } else {
                    header.set(key, val_str);
                }
                break;
            }
            case 'F': {
                auto v = core::parse_double(val_str);
                if (v) header.set(key, *v);
                else header.set(key, val_str);
                break;
            }
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

} // namespace

FitsMap read_fits_map(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long npixels = width * height;

    // Row-major Eigen storage matches the FITS pixel order directly
    Matrix2Dd data(height, width);
    long fpixel[3] = {1, 1, 1};
    int anynul = 0;
    fits_read_pix(fptr, TDOUBLE, fpixel, npixels, nullptr, data.data(), &anynul, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsHeader header = read_header(fptr);
    fits_close_file(fptr, &status);

    // Blank pixels carry no information
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        if (!std::isfinite(data.data()[i])) data.data()[i] = 0.0;
    }

    const astrometry::WCS wcs = wcs_from_header(header, static_cast<int>(width),
                                                static_cast<int>(height));
    sky::Geometry geom(static_cast<int>(height), static_cast<int>(width), wcs);
    return FitsMap{std::move(data), std::move(header), geom};
}

void write_fits_map(const fs::path& path, const Matrix2Dd& data, const sky::Geometry& geom,
                    const FitsHeader& extra) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, DOUBLE_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    FitsHeader header = extra;
    wcs_to_header(geom.wcs(), header);

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                           const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<double*>(data.data()), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace ptsrc::io
