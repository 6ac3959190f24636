#pragma once

#include "types.hpp"
#include <vector>
#include <string>

namespace openetas {

/**
 * Region - Simple polygon in projected coordinates (km)
 *
 * Vertices are stored without the closing duplicate. Orientation is
 * irrelevant; area() is always positive.
 */
class Region {
public:
    Region() = default;

    // Throws DataError on fewer than 3 vertices or zero area
    explicit Region(const std::vector<Point2D>& vertices, const std::string& name = "");

    static Region rectangle(double min_x, double max_x, double min_y, double max_y);

    // Load "x y" vertex lines ('#' comments allowed)
    bool loadFromFile(const std::string& filename);

    const std::string& name() const { return name_; }
    const std::vector<Point2D>& vertices() const { return vertices_; }
    size_t vertexCount() const { return vertices_.size(); }
    bool empty() const { return vertices_.empty(); }

    // Point-in-polygon (even-odd rule)
    bool contains(double x, double y) const;
    bool contains(const Point2D& p) const { return contains(p.x, p.y); }

    double area() const { return area_; }
    const Bounds& bounds() const { return bounds_; }
    Point2D centroid() const;

private:
    std::string name_;
    std::vector<Point2D> vertices_;
    double area_ = 0;
    Bounds bounds_;

    void initialize();
};

} // namespace openetas
