#include "openetas/core/event.hpp"
#include "openetas/core/errors.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <cmath>

namespace openetas {

Catalog::Catalog(std::vector<Event> events, const Region& region,
                 const TimeWindow& window, double mc, double delta_m)
    : Catalog(std::move(events), region, window, mc, delta_m, window.start)
{
}

Catalog::Catalog(std::vector<Event> events, const Region& region,
                 const TimeWindow& window, double mc, double delta_m,
                 TimeDays auxiliary_start)
    : events_(std::move(events))
    , region_(region)
    , window_(window)
    , auxiliary_start_(auxiliary_start)
    , mc_(mc)
    , delta_m_(delta_m)
{
    std::stable_sort(events_.begin(), events_.end(),
        [](const Event& a, const Event& b) { return a.time < b.time; });

    // Sequential ids for events that came without one
    for (size_t i = 0; i < events_.size(); i++) {
        if (events_[i].id == 0) events_[i].id = static_cast<int64_t>(i + 1);
    }

    validate();
}

void Catalog::validate() const {
    if (region_.empty()) {
        throw DataError("Catalog has no region");
    }
    if (!std::isfinite(window_.start) || !std::isfinite(window_.end) ||
        window_.end <= window_.start) {
        throw DataError("Catalog time window is empty or negative");
    }
    if (!std::isfinite(auxiliary_start_) || auxiliary_start_ > window_.start) {
        throw DataError("Auxiliary start must not be after the window start");
    }
    if (!std::isfinite(mc_) || delta_m_ < 0) {
        throw DataError("Invalid completeness magnitude or bin width");
    }

    // Small tolerance for magnitudes rounded to the bin
    const double m_min = referenceMagnitude() - 1e-9;

    for (const auto& e : events_) {
        if (!std::isfinite(e.time) || !std::isfinite(e.x) || !std::isfinite(e.y) ||
            !std::isfinite(e.depth) || !std::isfinite(e.magnitude)) {
            throw DataError("Event " + std::to_string(e.id) + " has non-finite values");
        }
        if (e.hasLocalCompleteness() &&
            (!std::isfinite(e.mc_current) || e.mc_current < mc_ - 1e-9)) {
            std::ostringstream oss;
            oss << "Event " << e.id << " completeness " << e.mc_current
                << " is below the catalog mc " << mc_;
            throw DataError(oss.str());
        }
        if (e.time < auxiliary_start_ || e.time > window_.end) {
            std::ostringstream oss;
            oss << "Event " << e.id << " at t=" << e.time
                << " lies outside [" << auxiliary_start_ << ", " << window_.end << "]";
            throw DataError(oss.str());
        }
        if (e.magnitude < m_min) {
            std::ostringstream oss;
            oss << "Event " << e.id << " magnitude " << e.magnitude
                << " is below completeness " << mc_;
            throw DataError(oss.str());
        }
    }
}

double Catalog::completeness(size_t i) const {
    const Event& e = events_[i];
    return e.hasLocalCompleteness() ? e.mc_current : mc_;
}

bool Catalog::hasVariableCompleteness() const {
    for (const auto& e : events_) {
        if (e.hasLocalCompleteness() && e.mc_current > mc_ + 1e-9) return true;
    }
    return false;
}

bool Catalog::isComplete(size_t i) const {
    return events_[i].magnitude >= completeness(i) - delta_m_ / 2.0 - 1e-9;
}

bool Catalog::isTarget(size_t i) const {
    const Event& e = events_[i];
    return e.time >= window_.start && e.time <= window_.end &&
           region_.contains(e.x, e.y) && isComplete(i);
}

std::vector<size_t> Catalog::targetIndices() const {
    std::vector<size_t> idx;
    for (size_t i = 0; i < events_.size(); i++) {
        if (isTarget(i)) idx.push_back(i);
    }
    return idx;
}

size_t Catalog::targetCount() const {
    size_t n = 0;
    for (size_t i = 0; i < events_.size(); i++) {
        if (isTarget(i)) n++;
    }
    return n;
}

double Catalog::maxMagnitude() const {
    double m = -std::numeric_limits<double>::infinity();
    for (const auto& e : events_) m = std::max(m, e.magnitude);
    return m;
}

Catalog Catalog::aboveMagnitude(double m_min) const {
    std::vector<Event> kept;
    double cut = m_min - delta_m_ / 2.0 - 1e-9;
    for (const auto& e : events_) {
        if (e.magnitude < cut) continue;
        kept.push_back(e);
        if (kept.back().hasLocalCompleteness()) {
            kept.back().mc_current = std::max(kept.back().mc_current, m_min);
        }
    }
    return Catalog(kept, region_, window_, std::max(mc_, m_min), delta_m_, auxiliary_start_);
}

std::vector<Event> Catalog::eventsBefore(TimeDays t) const {
    std::vector<Event> out;
    for (const auto& e : events_) {
        if (e.time < t) out.push_back(e);
    }
    return out;
}

std::string Catalog::summary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Catalog: " << events_.size() << " events ("
        << targetCount() << " targets)\n";
    oss << "  Window: [" << window_.start << ", " << window_.end << "] days";
    if (auxiliary_start_ < window_.start) {
        oss << ", auxiliary from " << auxiliary_start_;
    }
    oss << "\n";
    oss << "  Mc: " << mc_ << " (delta_m=" << delta_m_ << ")";
    if (hasVariableCompleteness()) oss << ", variable";
    if (!events_.empty()) oss << ", Mmax: " << maxMagnitude();
    oss << "\n";
    oss << "  Region: " << region_.vertexCount() << " vertices, "
        << region_.area() << " km^2\n";
    return oss.str();
}

bool loadEventsFromFile(const std::string& filename, std::vector<Event>& events) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open catalog: " << filename << std::endl;
        return false;
    }

    events.clear();
    std::string line;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream iss(line);
        double t, x, y, depth, mag;
        if (!(iss >> t >> x >> y >> depth >> mag)) {
            // Header lines and malformed rows
            skipped++;
            continue;
        }
        events.emplace_back(t, x, y, depth, mag, static_cast<int64_t>(events.size() + 1));

        double mc_current;
        if (iss >> mc_current) events.back().mc_current = mc_current;
    }

    std::cout << "Loaded " << events.size() << " events from " << filename;
    if (skipped > 0) std::cout << " (" << skipped << " lines skipped)";
    std::cout << std::endl;
    return !events.empty();
}

} // namespace openetas
