#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <cmath>
#include <limits>

namespace openetas {

// Times are decimal days, coordinates are projected kilometres
using TimeDays = double;

// Projected point
struct Point2D {
    double x;   // km, easting
    double y;   // km, northing

    Point2D() : x(0), y(0) {}
    Point2D(double x_, double y_) : x(x_), y(y_) {}

    double distanceTo(const Point2D& other) const {
        return std::sqrt(squaredDistanceTo(other));
    }

    double squaredDistanceTo(const Point2D& other) const {
        double dx = other.x - x;
        double dy = other.y - y;
        return dx * dx + dy * dy;
    }
};

// Axis-aligned bounds
struct Bounds {
    double min_x, max_x;
    double min_y, max_y;

    Bounds() : min_x(0), max_x(0), min_y(0), max_y(0) {}
    Bounds(double x0, double x1, double y0, double y1)
        : min_x(x0), max_x(x1), min_y(y0), max_y(y1) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double area() const { return width() * height(); }
};

// Time window of a catalog or a simulation
struct TimeWindow {
    TimeDays start;
    TimeDays end;

    TimeWindow() : start(0), end(0) {}
    TimeWindow(TimeDays s, TimeDays e) : start(s), end(e) {}

    double length() const { return end - start; }
    bool contains(TimeDays t) const { return t >= start && t <= end; }
};

// Temporal triggering kernel shapes
enum class TemporalKernel {
    OmoriUtsu,      // (t + c)^-p, p > 1
    TaperedOmori    // exp(-t/tau) (t + c)^-p, p > 0
};

// Spatial triggering kernel shapes
enum class SpatialKernel {
    PowerLaw,       // (1 + r^2/D)^-q
    Gaussian        // exp(-r^2 / 2D)
};

inline std::string temporalKernelToString(TemporalKernel k) {
    switch (k) {
        case TemporalKernel::OmoriUtsu: return "omori";
        case TemporalKernel::TaperedOmori: return "tapered";
    }
    return "?";
}

inline std::string spatialKernelToString(SpatialKernel k) {
    switch (k) {
        case SpatialKernel::PowerLaw: return "powerlaw";
        case SpatialKernel::Gaussian: return "gaussian";
    }
    return "?";
}

inline bool stringToTemporalKernel(const std::string& s, TemporalKernel& out) {
    if (s == "omori" || s == "omori_utsu") { out = TemporalKernel::OmoriUtsu; return true; }
    if (s == "tapered" || s == "tapered_omori") { out = TemporalKernel::TaperedOmori; return true; }
    return false;
}

inline bool stringToSpatialKernel(const std::string& s, SpatialKernel& out) {
    if (s == "powerlaw" || s == "power_law") { out = SpatialKernel::PowerLaw; return true; }
    if (s == "gaussian") { out = SpatialKernel::Gaussian; return true; }
    return false;
}

/**
 * KernelConfig - Kernel variant selection, fixed for a whole run
 */
struct KernelConfig {
    TemporalKernel temporal;
    SpatialKernel spatial;

    KernelConfig() : temporal(TemporalKernel::OmoriUtsu), spatial(SpatialKernel::PowerLaw) {}
    KernelConfig(TemporalKernel t, SpatialKernel s) : temporal(t), spatial(s) {}

    std::string toString() const {
        return temporalKernelToString(temporal) + "/" + spatialKernelToString(spatial);
    }
};

// Constants
namespace constants {
    constexpr double LN10 = 2.302585092994046;
    constexpr double MIN_OMORI_C = 1e-5;        // days, regularisation floor for c
    constexpr double DAYS_PER_YEAR = 365.25;
}

} // namespace openetas
