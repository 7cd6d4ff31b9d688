#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <complex>
#include <filesystem>
#include <string>
#include <vector>

namespace ptsrc {

namespace fs = std::filesystem;

// Matrix types (row-major, matching the on-disk pixel order)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ComplexMatrix = Eigen::Matrix<std::complex<double>, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

// Sky position in radians
struct SkyPos {
    double dec = 0.0;
    double ra = 0.0;
};

// Fractional pixel coordinate (0-indexed, integer values at pixel centers)
struct PixPos {
    double y = 0.0;
    double x = 0.0;
};

// Half-open pixel box [y0, y1) x [x0, x1)
struct PixBox {
    int y0 = 0;
    int x0 = 0;
    int y1 = 0;
    int x1 = 0;

    int height() const { return y1 - y0; }
    int width() const { return x1 - x0; }
    bool empty() const { return y1 <= y0 || x1 <= x0; }
    bool contains(int y, int x) const { return y >= y0 && y < y1 && x >= x0 && x < x1; }
};

inline PixBox intersect(const PixBox& a, const PixBox& b) {
    PixBox r;
    r.y0 = std::max(a.y0, b.y0);
    r.x0 = std::max(a.x0, b.x0);
    r.y1 = std::min(a.y1, b.y1);
    r.x1 = std::min(a.x1, b.x1);
    return r;
}

// Map projection
enum class Projection {
    CAR,  // plate carree
    TAN   // gnomonic
};

// Processing stage enumeration
enum class Stage {
    SETUP = 0,
    DETECTION = 1,
    ARTIFACTS = 2,
    AMPLITUDE_FIT = 3,
    MERGE = 4,
    OUTPUT = 5
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::SETUP: return "SETUP";
        case Stage::DETECTION: return "DETECTION";
        case Stage::ARTIFACTS: return "ARTIFACTS";
        case Stage::AMPLITUDE_FIT: return "AMPLITUDE_FIT";
        case Stage::MERGE: return "MERGE";
        case Stage::OUTPUT: return "OUTPUT";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace ptsrc
