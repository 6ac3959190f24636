#include "openetas/background/background_field.hpp"
#include "openetas/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace openetas {

namespace {

// Kernels beyond this many bandwidths contribute nothing measurable
constexpr double CUTOFF_SIGMAS = 6.0;
constexpr int MAX_REJECTION_ATTEMPTS = 100;

} // anonymous namespace

BackgroundField BackgroundField::uniform(const Region& region) {
    BackgroundField field;
    field.region_ = region;
    field.norm_ = 1.0;
    field.floor_ = 0.0;
    return field;
}

std::vector<double> BackgroundField::adaptiveBandwidths(const std::vector<Point2D>& points,
                                                        int n_neighbors,
                                                        double min_bandwidth) {
    const size_t n = points.size();
    std::vector<double> bw(n, min_bandwidth);
    if (n < 2 || n_neighbors < 1) return bw;

    std::vector<double> dist;
    dist.reserve(n - 1);

    for (size_t i = 0; i < n; i++) {
        dist.clear();
        for (size_t j = 0; j < n; j++) {
            if (j == i) continue;
            dist.push_back(points[i].squaredDistanceTo(points[j]));
        }

        // Fewer neighbours than requested: use the farthest one
        size_t k = std::min(static_cast<size_t>(n_neighbors), dist.size()) - 1;
        std::nth_element(dist.begin(), dist.begin() + k, dist.end());
        bw[i] = std::max(min_bandwidth, std::sqrt(dist[k]));
    }

    return bw;
}

BackgroundField BackgroundField::estimate(const std::vector<Point2D>& sources,
                                          const std::vector<double>& weights,
                                          const std::vector<double>& bandwidths,
                                          const Region& region,
                                          const BackgroundOptions& options) {
    if (sources.size() != weights.size() || sources.size() != bandwidths.size()) {
        throw DataError("BackgroundField: sources, weights and bandwidths differ in size");
    }

    BackgroundField field = uniform(region);

    for (size_t i = 0; i < sources.size(); i++) {
        if (!(weights[i] > 0)) continue;
        if (!std::isfinite(weights[i]) || !(bandwidths[i] > 0)) {
            throw DataError("BackgroundField: invalid weight or bandwidth");
        }
        field.sources_.push_back(sources[i]);
        field.weights_.push_back(weights[i]);
        field.bandwidths_.push_back(bandwidths[i]);
        field.total_weight_ += weights[i];
    }

    if (field.sources_.empty()) {
        return field;
    }

    // Midpoint quadrature of the unnormalised density over the region
    const Bounds& b = region.bounds();
    const int res = std::max(4, options.grid_resolution);
    const double dx = b.width() / res;
    const double dy = b.height() / res;

    double integral = 0;
    for (int iy = 0; iy < res; iy++) {
        double y = b.min_y + (iy + 0.5) * dy;
        for (int ix = 0; ix < res; ix++) {
            double x = b.min_x + (ix + 0.5) * dx;
            if (!region.contains(x, y)) continue;
            integral += field.rawDensity(x, y);
        }
    }
    integral *= dx * dy;

    if (!(integral > 0) || !std::isfinite(integral)) {
        std::cerr << "BackgroundField: normalisation integral vanished, using uniform field"
                  << std::endl;
        return uniform(region);
    }

    // nu integrates to the region area, i.e. averages 1
    field.norm_ = region.area() / integral;
    field.floor_ = options.floor_fraction;
    return field;
}

double BackgroundField::rawDensity(double x, double y) const {
    double sum = 0;
    for (size_t j = 0; j < sources_.size(); j++) {
        const double h = bandwidths_[j];
        const double dx = x - sources_[j].x;
        const double dy = y - sources_[j].y;
        const double r2 = dx * dx + dy * dy;
        const double h2 = h * h;
        if (r2 > CUTOFF_SIGMAS * CUTOFF_SIGMAS * h2) continue;
        sum += weights_[j] * std::exp(-r2 / (2.0 * h2)) / (2.0 * M_PI * h2);
    }
    return sum;
}

double BackgroundField::relativeIntensity(double x, double y) const {
    if (isUniform()) return 1.0;
    return std::max(floor_, norm_ * rawDensity(x, y));
}

bool BackgroundField::belowFloor(double x, double y) const {
    if (isUniform()) return false;
    return norm_ * rawDensity(x, y) < floor_;
}

Point2D BackgroundField::sampleUniform(Rng& rng) const {
    if (region_.empty()) {
        throw DataError("BackgroundField: cannot sample without a region");
    }

    const Bounds& b = region_.bounds();
    std::uniform_real_distribution<double> ux(b.min_x, b.max_x);
    std::uniform_real_distribution<double> uy(b.min_y, b.max_y);

    // Acceptance is area / bbox area; give up only for degenerate slivers
    for (int attempt = 0; attempt < 100 * MAX_REJECTION_ATTEMPTS; attempt++) {
        Point2D p(ux(rng), uy(rng));
        if (region_.contains(p)) return p;
    }
    return region_.centroid();
}

Point2D BackgroundField::sample(Rng& rng) const {
    if (isUniform()) return sampleUniform(rng);

    std::discrete_distribution<size_t> pick(weights_.begin(), weights_.end());
    std::normal_distribution<double> gauss(0.0, 1.0);

    for (int attempt = 0; attempt < MAX_REJECTION_ATTEMPTS; attempt++) {
        size_t j = pick(rng);
        Point2D p(sources_[j].x + bandwidths_[j] * gauss(rng),
                  sources_[j].y + bandwidths_[j] * gauss(rng));
        if (region_.contains(p)) return p;
    }
    return sampleUniform(rng);
}

std::vector<double> BackgroundField::evaluateGrid(int nx, int ny) const {
    std::vector<double> grid;
    if (nx <= 0 || ny <= 0 || region_.empty()) return grid;

    grid.assign(static_cast<size_t>(nx) * ny, 0.0);
    const Bounds& b = region_.bounds();
    const double dx = b.width() / nx;
    const double dy = b.height() / ny;

    for (int iy = 0; iy < ny; iy++) {
        double y = b.min_y + (iy + 0.5) * dy;
        for (int ix = 0; ix < nx; ix++) {
            double x = b.min_x + (ix + 0.5) * dx;
            if (region_.contains(x, y)) {
                grid[static_cast<size_t>(iy) * nx + ix] = relativeIntensity(x, y);
            }
        }
    }
    return grid;
}

double BackgroundField::regionalMean(int resolution) const {
    auto grid = evaluateGrid(resolution, resolution);
    if (grid.empty()) return 0.0;

    const Bounds& b = region_.bounds();
    double cell = (b.width() / resolution) * (b.height() / resolution);
    double sum = 0;
    for (double v : grid) sum += v;
    return sum * cell / region_.area();
}

} // namespace openetas
