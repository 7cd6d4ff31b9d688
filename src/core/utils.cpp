#include "ptsrc/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iterator>
#include <locale>
#include <random>
#include <sstream>

namespace ptsrc::core {

std::string get_iso_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const long ms = static_cast<long>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03ldZ", ms);
    return buf;
}

// Local time stamp plus 32 random bits, e.g. 20240131_235959_0a1b2c3d
std::string get_run_id() {
    const std::time_t secs = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&secs, &local);

    std::random_device rd;
    const unsigned long tag = (static_cast<unsigned long>(rd()) & 0xffffffffUL);

    char buf[40];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
    std::snprintf(buf + n, sizeof(buf) - n, "_%08lx", tag);
    return buf;
}

double median_of(std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const size_t n = v.size();
    const size_t mid = n / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double hi = v[mid];
    if ((n % 2) == 1) return hi;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid - 1), v.end());
    const double lo = v[mid - 1];
    return 0.5 * (lo + hi);
}

int nint(double v) {
    return static_cast<int>(std::lround(v));
}

// Wrap angle into [ref - pi, ref + pi)
double rewind(double angle, double ref) {
    const double two_pi = 2.0 * M_PI;
    double d = std::fmod(angle - ref + M_PI, two_pi);
    if (d < 0.0) d += two_pi;
    return d - M_PI + ref;
}

// Haversine form, well conditioned for small separations
double angular_distance(const SkyPos& a, const SkyPos& b) {
    const double sdd = std::sin(0.5 * (b.dec - a.dec));
    const double sdr = std::sin(0.5 * (b.ra - a.ra));
    const double h = sdd * sdd + std::cos(a.dec) * std::cos(b.dec) * sdr * sdr;
    return 2.0 * std::asin(std::sqrt(std::min(1.0, std::max(0.0, h))));
}

std::string to_lower(const std::string& s) {
    std::string out(s.size(), '\0');
    std::transform(s.begin(), s.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

// Empty fields are kept, a trailing delimiter does not add one
std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start < str.size()) {
        const size_t end = str.find(delimiter, start);
        if (end == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::istringstream iss(str);
    return std::vector<std::string>(std::istream_iterator<std::string>(iss),
                                    std::istream_iterator<std::string>());
}

std::optional<double> parse_double(const std::string& s) {
    std::istringstream ss(trim(s));
    ss.imbue(std::locale::classic());
    double result = 0.0;
    ss >> result;
    if (ss.fail()) return std::nullopt;
    ss >> std::ws;
    if (!ss.eof()) return std::nullopt;
    return result;
}

} // namespace ptsrc::core
