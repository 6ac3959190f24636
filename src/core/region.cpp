#include "openetas/core/region.hpp"
#include "openetas/core/errors.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iostream>
#include <cmath>

namespace openetas {

Region::Region(const std::vector<Point2D>& vertices, const std::string& name)
    : name_(name)
    , vertices_(vertices)
{
    // Drop explicit closing vertex
    if (vertices_.size() > 1) {
        const auto& a = vertices_.front();
        const auto& b = vertices_.back();
        if (a.x == b.x && a.y == b.y) vertices_.pop_back();
    }
    initialize();
}

Region Region::rectangle(double min_x, double max_x, double min_y, double max_y) {
    return Region({{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}},
                  "rectangle");
}

void Region::initialize() {
    if (vertices_.size() < 3) {
        throw DataError("Region needs at least 3 vertices, got " +
                        std::to_string(vertices_.size()));
    }

    // Shoelace formula
    double twice_area = 0;
    bounds_ = Bounds(vertices_[0].x, vertices_[0].x, vertices_[0].y, vertices_[0].y);
    for (size_t i = 0; i < vertices_.size(); i++) {
        const auto& a = vertices_[i];
        const auto& b = vertices_[(i + 1) % vertices_.size()];
        if (!std::isfinite(a.x) || !std::isfinite(a.y)) {
            throw DataError("Region vertex is not finite");
        }
        twice_area += a.x * b.y - b.x * a.y;
        bounds_.min_x = std::min(bounds_.min_x, a.x);
        bounds_.max_x = std::max(bounds_.max_x, a.x);
        bounds_.min_y = std::min(bounds_.min_y, a.y);
        bounds_.max_y = std::max(bounds_.max_y, a.y);
    }
    area_ = std::abs(twice_area) / 2.0;

    if (area_ <= 0) {
        throw DataError("Region has zero area");
    }
}

bool Region::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open region file: " << filename << std::endl;
        return false;
    }

    std::vector<Point2D> points;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        std::replace(line.begin(), line.end(), ',', ' ');

        std::istringstream iss(line);
        double x, y;
        if (!(iss >> x >> y)) continue;
        points.emplace_back(x, y);
    }

    try {
        *this = Region(points, filename);
    } catch (const DataError& e) {
        std::cerr << "Invalid region in " << filename << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "Loaded region with " << vertices_.size()
              << " vertices (" << area_ << " km^2) from " << filename << std::endl;
    return true;
}

bool Region::contains(double x, double y) const {
    bool inside = false;
    size_t n = vertices_.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const auto& a = vertices_[i];
        const auto& b = vertices_[j];
        if (((a.y > y) != (b.y > y)) &&
            (x < (b.x - a.x) * (y - a.y) / (b.y - a.y) + a.x)) {
            inside = !inside;
        }
    }
    return inside;
}

Point2D Region::centroid() const {
    double cx = 0, cy = 0, twice_area = 0;
    for (size_t i = 0; i < vertices_.size(); i++) {
        const auto& a = vertices_[i];
        const auto& b = vertices_[(i + 1) % vertices_.size()];
        double cross = a.x * b.y - b.x * a.y;
        twice_area += cross;
        cx += (a.x + b.x) * cross;
        cy += (a.y + b.y) * cross;
    }
    if (twice_area == 0) return Point2D();
    return Point2D(cx / (3.0 * twice_area), cy / (3.0 * twice_area));
}

} // namespace openetas
