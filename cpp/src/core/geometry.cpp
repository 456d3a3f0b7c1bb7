#include "geoscan/geometry.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace geoscan {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

Eigen::Vector3d to_unit_vector(const LatLng& p) noexcept {
    const double lat = p.lat * DEG_TO_RAD;
    const double lng = p.lng * DEG_TO_RAD;
    return Eigen::Vector3d(std::cos(lat) * std::cos(lng),
                           std::cos(lat) * std::sin(lng),
                           std::sin(lat));
}

} // anonymous namespace

BoundingBox bounding_box(const std::vector<LatLng>& ring) noexcept {
    BoundingBox box{ring.front().lat, ring.front().lat, ring.front().lng, ring.front().lng};
    for (const auto& p : ring) {
        box.min_lat = std::min(box.min_lat, p.lat);
        box.max_lat = std::max(box.max_lat, p.lat);
        box.min_lng = std::min(box.min_lng, p.lng);
        box.max_lng = std::max(box.max_lng, p.lng);
    }
    return box;
}

bool point_in_polygon(const LatLng& p, const std::vector<LatLng>& ring) noexcept {
    bool inside = false;
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const LatLng& a = ring[i];
        const LatLng& b = ring[j];
        if ((a.lat > p.lat) != (b.lat > p.lat)) {
            double x = (b.lng - a.lng) * (p.lat - a.lat) / (b.lat - a.lat) + a.lng;
            if (p.lng < x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool segment_intersects_box(const LatLng& a, const LatLng& b, const BoundingBox& box) noexcept {
    // Liang-Barsky clipping with x = longitude, y = latitude
    const double dx = b.lng - a.lng;
    const double dy = b.lat - a.lat;
    const double p[4] = {-dx, dx, -dy, dy};
    const double q[4] = {a.lng - box.min_lng, box.max_lng - a.lng,
                         a.lat - box.min_lat, box.max_lat - a.lat};

    double t0 = 0.0;
    double t1 = 1.0;
    for (int i = 0; i < 4; ++i) {
        if (p[i] == 0.0) {
            if (q[i] < 0.0) return false;
            continue;
        }
        double t = q[i] / p[i];
        if (p[i] < 0.0) {
            t0 = std::max(t0, t);
        } else {
            t1 = std::min(t1, t);
        }
        if (t0 > t1) return false;
    }

    // The clipped chord is either on the border or crosses the interior;
    // its midpoint tells which
    const double tm = (t0 + t1) / 2.0;
    return box.interior_contains(LatLng(a.lat + tm * dy, a.lng + tm * dx));
}

bool polygon_intersects_box(const std::vector<LatLng>& ring, const BoundingBox& box) noexcept {
    if (ring.empty()) return false;

    const size_t n = ring.size();
    for (size_t i = 0; i < n; ++i) {
        if (box.interior_contains(ring[i])) return true;
        if (segment_intersects_box(ring[i], ring[(i + 1) % n], box)) return true;
    }

    // No boundary inside the cell: it is either wholly in or wholly out
    const LatLng center((box.min_lat + box.max_lat) / 2.0, (box.min_lng + box.max_lng) / 2.0);
    return point_in_polygon(center, ring);
}

LatLng spherical_centroid(const std::vector<LatLng>& ring) noexcept {
    Eigen::Vector3d sum = Eigen::Vector3d::Zero();
    for (const auto& p : ring) {
        sum += to_unit_vector(p);
    }

    // Antipodal vertex sets have no meaningful mean direction
    if (sum.norm() < 1e-12) {
        return ring.empty() ? LatLng() : ring.front();
    }
    sum.normalize();

    return LatLng(std::asin(std::clamp(sum.z(), -1.0, 1.0)) * RAD_TO_DEG,
                  std::atan2(sum.y(), sum.x()) * RAD_TO_DEG);
}

double great_circle_m(const LatLng& a, const LatLng& b, double radius_m) noexcept {
    const Eigen::Vector3d va = to_unit_vector(a);
    const Eigen::Vector3d vb = to_unit_vector(b);
    return std::atan2(va.cross(vb).norm(), va.dot(vb)) * radius_m;
}

} // namespace geoscan
