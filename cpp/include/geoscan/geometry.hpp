// =============================================================================
// geometry.hpp - Planar and spherical helpers for cluster polygons
// =============================================================================
// Polygons are treated as planar in (longitude, latitude) degrees, which is
// what the grid index cuts. Distances use the unit sphere.
// =============================================================================

#pragma once

#include "geoscan/types.hpp"

#include <vector>

namespace geoscan {

struct BoundingBox {
    double min_lat;
    double max_lat;
    double min_lng;
    double max_lng;

    // Open rectangle: points on the border are outside
    bool interior_contains(const LatLng& p) const noexcept {
        return p.lat > min_lat && p.lat < max_lat &&
               p.lng > min_lng && p.lng < max_lng;
    }
};

// Bounding box of a non-empty ring
BoundingBox bounding_box(const std::vector<LatLng>& ring) noexcept;

// Even-odd rule; the ring is closed implicitly
bool point_in_polygon(const LatLng& p, const std::vector<LatLng>& ring) noexcept;

// True when the segment a-b passes through the interior of the rectangle.
// Running along the border or touching a corner does not count.
bool segment_intersects_box(const LatLng& a, const LatLng& b, const BoundingBox& box) noexcept;

// True when the ring and the rectangle overlap with positive area, so two
// polygons sharing an edge on a cell border never both claim that cell
bool polygon_intersects_box(const std::vector<LatLng>& ring, const BoundingBox& box) noexcept;

// Spherical centroid of the ring vertices (mean of unit vectors)
LatLng spherical_centroid(const std::vector<LatLng>& ring) noexcept;

// Great-circle distance in metres
double great_circle_m(const LatLng& a, const LatLng& b, double radius_m) noexcept;

} // namespace geoscan
