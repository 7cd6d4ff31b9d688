#include "ptsrc/catalog/catalog_io.hpp"
#include "ptsrc/core/errors.hpp"
#include "ptsrc/core/units.hpp"
#include "ptsrc/core/utils.hpp"

#include <fitsio.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace ptsrc::catalog {

namespace {

constexpr int kTextColumns = 17;
const char* kTextHeader =
    "# ra dec SNR Tamp dTamp Qamp dQamp Uamp dUamp Tflux dTflux Qflux dQflux Uflux dUflux npix status";

bool is_fits_catalog(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    return ext == ".fits" || ext == ".fit";
}

// Fixed-point text of a huge value runs to hundreds of characters
template <typename T>
std::string format_field(const char* fmt, T value) {
    const int len = std::snprintf(nullptr, 0, fmt, value);
    if (len < 0) {
        throw IOError(std::string("Cannot format catalog field with ") + fmt);
    }
    std::string field(static_cast<size_t>(len) + 1, '\0');
    std::snprintf(&field[0], field.size(), fmt, value);
    field.resize(static_cast<size_t>(len));
    return field;
}

} // namespace

void write_catalog_txt(const fs::path& path, const Catalog& cat) {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot write catalog: " + path.string());
    }
    out << kTextHeader << "\n";

    for (const auto& e : cat) {
        std::string row = format_field("%9.4f", e.ra / core::kDegree);
        row += format_field(" %9.4f", e.dec / core::kDegree);
        row += format_field(" %8.3f", snr(e));
        for (int c = 0; c < kNumComp; ++c) {
            row += format_field(" %9.4f", e.amp[c] / 1e3);
            row += format_field(" %9.4f", e.damp[c] / 1e3);
        }
        for (int c = 0; c < kNumComp; ++c) {
            row += format_field(" %9.4f", e.flux[c] * 1e3);
            row += format_field(" %9.4f", e.dflux[c] * 1e3);
        }
        row += format_field(" %5d", core::nint(e.npix));
        row += format_field(" %2d", e.status);
        out << row << "\n";
    }
    if (!out) {
        throw IOError("Failed writing catalog: " + path.string());
    }
}

Catalog read_catalog_txt(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError("Cannot open catalog: " + path.string());
    }

    Catalog cat;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const std::string t = core::trim(line);
        if (t.empty() || t[0] == '#') continue;

        const auto toks = core::split_whitespace(t);
        if (static_cast<int>(toks.size()) < kTextColumns) {
            throw IOError("Catalog row " + std::to_string(lineno) + " of " + path.string() +
                          " has " + std::to_string(toks.size()) + " columns, expected " +
                          std::to_string(kTextColumns));
        }
        std::vector<double> v(kTextColumns);
        for (int i = 0; i < kTextColumns; ++i) {
            auto d = core::parse_double(toks[i]);
            if (!d) {
                throw IOError("Bad number '" + toks[i] + "' in catalog row " +
                              std::to_string(lineno) + " of " + path.string());
            }
            v[i] = *d;
        }

        Entry e;
        e.ra = v[0] * core::kDegree;
        e.dec = v[1] * core::kDegree;
        // v[2] is the derived S/N
        for (int c = 0; c < kNumComp; ++c) {
            e.amp[c] = v[3 + 2 * c] * 1e3;
            e.damp[c] = v[4 + 2 * c] * 1e3;
            e.flux[c] = v[9 + 2 * c] / 1e3;
            e.dflux[c] = v[10 + 2 * c] / 1e3;
        }
        e.npix = v[15];
        e.status = core::nint(v[16]);
        cat.push_back(e);
    }
    return cat;
}

void write_catalog_fits(const fs::path& path, const Catalog& cat) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    char* ttype[] = {const_cast<char*>("ra"),   const_cast<char*>("dec"),
                     const_cast<char*>("amp"),  const_cast<char*>("damp"),
                     const_cast<char*>("flux"), const_cast<char*>("dflux"),
                     const_cast<char*>("npix"), const_cast<char*>("status")};
    char* tform[] = {const_cast<char*>("1D"), const_cast<char*>("1D"),
                     const_cast<char*>("3D"), const_cast<char*>("3D"),
                     const_cast<char*>("3D"), const_cast<char*>("3D"),
                     const_cast<char*>("1D"), const_cast<char*>("1J")};
    char* tunit[] = {const_cast<char*>("rad"), const_cast<char*>("rad"),
                     const_cast<char*>("uK"),  const_cast<char*>("uK"),
                     const_cast<char*>("Jy"),  const_cast<char*>("Jy"),
                     const_cast<char*>(""),    const_cast<char*>("")};

    const LONGLONG nrows = static_cast<LONGLONG>(cat.size());
    fits_create_tbl(fptr, BINARY_TBL, nrows, 8, ttype, tform, tunit,
                    const_cast<char*>("CATALOG"), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create catalog table: " + path.string());
    }

    if (!cat.empty()) {
        const size_t n = cat.size();
        std::vector<double> ra(n), dec(n), npix(n);
        std::vector<double> amp(3 * n), damp(3 * n), flux(3 * n), dflux(3 * n);
        std::vector<int> st(n);
        for (size_t i = 0; i < n; ++i) {
            const Entry& e = cat[i];
            ra[i] = e.ra;
            dec[i] = e.dec;
            npix[i] = e.npix;
            st[i] = e.status;
            for (int c = 0; c < kNumComp; ++c) {
                amp[3 * i + c] = e.amp[c];
                damp[3 * i + c] = e.damp[c];
                flux[3 * i + c] = e.flux[c];
                dflux[3 * i + c] = e.dflux[c];
            }
        }
        fits_write_col(fptr, TDOUBLE, 1, 1, 1, nrows, ra.data(), &status);
        fits_write_col(fptr, TDOUBLE, 2, 1, 1, nrows, dec.data(), &status);
        fits_write_col(fptr, TDOUBLE, 3, 1, 1, 3 * nrows, amp.data(), &status);
        fits_write_col(fptr, TDOUBLE, 4, 1, 1, 3 * nrows, damp.data(), &status);
        fits_write_col(fptr, TDOUBLE, 5, 1, 1, 3 * nrows, flux.data(), &status);
        fits_write_col(fptr, TDOUBLE, 6, 1, 1, 3 * nrows, dflux.data(), &status);
        fits_write_col(fptr, TDOUBLE, 7, 1, 1, nrows, npix.data(), &status);
        fits_write_col(fptr, TINT, 8, 1, 1, nrows, st.data(), &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot write catalog columns: " + path.string());
        }
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

Catalog read_catalog_fits(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_table(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open catalog table: " + path.string());
    }

    long nrows = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read catalog row count: " + path.string());
    }

    auto read_column = [&](const char* name, int width, std::vector<double>& dst) {
        int colnum = 0;
        std::string tmpl(name);
        if (fits_get_colnum(fptr, CASEINSEN, &tmpl[0], &colnum, &status)) {
            fits_close_file(fptr, &status);
            throw FitsError("Catalog column '" + std::string(name) + "' missing in " + path.string());
        }
        dst.assign(static_cast<size_t>(nrows) * width, 0.0);
        if (nrows == 0) return;
        double nulval = 0.0;
        int anynul = 0;
        fits_read_col(fptr, TDOUBLE, colnum, 1, 1, static_cast<LONGLONG>(nrows) * width, &nulval,
                      dst.data(), &anynul, &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot read catalog column '" + std::string(name) + "': " + path.string());
        }
    };

    std::vector<double> ra, dec, amp, damp, flux, dflux, npix, st;
    read_column("ra", 1, ra);
    read_column("dec", 1, dec);
    read_column("amp", kNumComp, amp);
    read_column("damp", kNumComp, damp);
    read_column("flux", kNumComp, flux);
    read_column("dflux", kNumComp, dflux);
    read_column("npix", 1, npix);
    read_column("status", 1, st);
    fits_close_file(fptr, &status);

    Catalog cat(static_cast<size_t>(nrows));
    for (size_t i = 0; i < cat.size(); ++i) {
        Entry& e = cat[i];
        e.ra = ra[i];
        e.dec = dec[i];
        for (int c = 0; c < kNumComp; ++c) {
            e.amp[c] = amp[kNumComp * i + c];
            e.damp[c] = damp[kNumComp * i + c];
            e.flux[c] = flux[kNumComp * i + c];
            e.dflux[c] = dflux[kNumComp * i + c];
        }
        e.npix = npix[i];
        e.status = core::nint(st[i]);
    }
    return cat;
}

void write_catalog(const fs::path& path, const Catalog& cat) {
    if (is_fits_catalog(path)) {
        write_catalog_fits(path, cat);
    } else {
        write_catalog_txt(path, cat);
    }
}

Catalog read_catalog(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Catalog not found: " + path.string());
    }
    return is_fits_catalog(path) ? read_catalog_fits(path) : read_catalog_txt(path);
}

} // namespace ptsrc::catalog
