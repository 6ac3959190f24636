#pragma once

#include "types.hpp"
#include "region.hpp"
#include <vector>
#include <memory>
#include <string>
#include <limits>
#include <cmath>

namespace openetas {

/**
 * Event - A single catalog entry
 */
struct Event {
    int64_t id;
    TimeDays time;      // days since catalog reference
    double x;           // km
    double y;           // km
    double depth;       // km, positive downward
    double magnitude;
    double mc_current;  // local completeness; NaN = catalog mc

    Event() : id(0), time(0), x(0), y(0), depth(0), magnitude(0),
              mc_current(std::numeric_limits<double>::quiet_NaN()) {}
    Event(TimeDays t, double x_, double y_, double dep, double mag, int64_t id_ = 0)
        : id(id_), time(t), x(x_), y(y_), depth(dep), magnitude(mag),
          mc_current(std::numeric_limits<double>::quiet_NaN()) {}

    bool hasLocalCompleteness() const { return !std::isnan(mc_current); }

    Point2D location() const { return Point2D(x, y); }
};

/**
 * Catalog - Time-ordered, validated event table
 *
 * Events before the target window start (back to the auxiliary start)
 * only act as triggering sources during inversion. Construction checks
 * the data model and throws DataError on violations.
 *
 * mc is the reference completeness. Events may carry a higher local
 * completeness (time- or space-varying detection); an event below its
 * own completeness is neither a target nor a triggering source.
 */
class Catalog {
public:
    Catalog() = default;

    Catalog(std::vector<Event> events, const Region& region,
            const TimeWindow& window, double mc, double delta_m = 0.0);

    Catalog(std::vector<Event> events, const Region& region,
            const TimeWindow& window, double mc, double delta_m,
            TimeDays auxiliary_start);

    // Access
    const std::vector<Event>& events() const { return events_; }
    const Event& operator[](size_t i) const { return events_[i]; }
    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    const Region& region() const { return region_; }
    const TimeWindow& window() const { return window_; }
    TimeDays auxiliaryStart() const { return auxiliary_start_; }
    double mc() const { return mc_; }
    double deltaM() const { return delta_m_; }

    // Lower edge of the lowest magnitude bin; kernels are referenced to it
    double referenceMagnitude() const { return mc_ - delta_m_ / 2.0; }

    // Completeness at event i (its own, or the catalog mc)
    double completeness(size_t i) const;
    bool hasVariableCompleteness() const;

    // Magnitude at or above the event's completeness
    bool isComplete(size_t i) const;

    // Complete events inside the target window and region
    bool isTarget(size_t i) const;
    std::vector<size_t> targetIndices() const;
    size_t targetCount() const;

    double maxMagnitude() const;

    // Copy restricted to magnitudes >= m_min (mc raised accordingly)
    Catalog aboveMagnitude(double m_min) const;

    // Events with time < t, window unchanged
    std::vector<Event> eventsBefore(TimeDays t) const;

    std::string summary() const;

private:
    std::vector<Event> events_;
    Region region_;
    TimeWindow window_;
    TimeDays auxiliary_start_ = 0;
    double mc_ = 0;
    double delta_m_ = 0;

    void validate() const;
};

using CatalogPtr = std::shared_ptr<Catalog>;

// Read "time x y depth magnitude [mc_current]" lines (whitespace or comma separated)
bool loadEventsFromFile(const std::string& filename, std::vector<Event>& events);

} // namespace openetas
