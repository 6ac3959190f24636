#pragma once

#include "../core/types.hpp"
#include "../core/region.hpp"
#include "../kernel/kernels.hpp"
#include <vector>
#include <memory>

namespace openetas {

/**
 * BackgroundOptions - Kernel density estimator settings
 */
struct BackgroundOptions {
    int n_neighbors = 5;            // bandwidth = distance to n-th neighbour
    double min_bandwidth = 0.5;     // km
    int grid_resolution = 64;       // cells per axis for normalisation
    double floor_fraction = 1e-6;   // floor relative to the mean intensity
};

/**
 * BackgroundField - Smoothed spatial background intensity
 *
 * Weighted sum of isotropic Gaussian kernels, one per source event, with
 * adaptive bandwidths. The field is scaled so its relative intensity
 * nu(x) averages 1 over the region; the background intensity is then
 * mu * nu(x). A field without weighted sources is uniform (nu = 1).
 */
class BackgroundField {
public:
    BackgroundField() = default;

    // Uniform field over a region
    static BackgroundField uniform(const Region& region);

    // Weighted kernel estimate; weights are background probabilities
    static BackgroundField estimate(const std::vector<Point2D>& sources,
                                    const std::vector<double>& weights,
                                    const std::vector<double>& bandwidths,
                                    const Region& region,
                                    const BackgroundOptions& options = BackgroundOptions());

    // Distance to the n-th nearest neighbour of each point, floored
    static std::vector<double> adaptiveBandwidths(const std::vector<Point2D>& points,
                                                  int n_neighbors, double min_bandwidth);

    // Relative intensity nu(x), floored and normalised
    double relativeIntensity(double x, double y) const;
    double relativeIntensity(const Point2D& p) const { return relativeIntensity(p.x, p.y); }

    // mu * nu(x)
    double intensity(double x, double y, double mu) const {
        return mu * relativeIntensity(x, y);
    }

    // True if the unclamped estimate at (x, y) is below the floor
    bool belowFloor(double x, double y) const;

    // Draw a location inside the region distributed as nu
    Point2D sample(Rng& rng) const;

    // nu at cell centres of an nx * ny grid over the region bounds,
    // row-major from (min_x, min_y); cells outside the region are 0
    std::vector<double> evaluateGrid(int nx, int ny) const;

    // Mean of nu over the region by grid quadrature (close to 1)
    double regionalMean(int resolution = 64) const;

    bool isUniform() const { return sources_.empty(); }
    const Region& region() const { return region_; }
    const std::vector<Point2D>& sources() const { return sources_; }
    const std::vector<double>& weights() const { return weights_; }
    const std::vector<double>& bandwidths() const { return bandwidths_; }
    double normalization() const { return norm_; }
    double floorValue() const { return floor_; }

private:
    Region region_;
    std::vector<Point2D> sources_;
    std::vector<double> weights_;
    std::vector<double> bandwidths_;
    double norm_ = 1.0;
    double floor_ = 0.0;
    double total_weight_ = 0.0;

    double rawDensity(double x, double y) const;
    Point2D sampleUniform(Rng& rng) const;
};

using BackgroundFieldPtr = std::shared_ptr<const BackgroundField>;

} // namespace openetas
