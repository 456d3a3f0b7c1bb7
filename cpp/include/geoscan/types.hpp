#pragma once

#include <cmath>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace geoscan {

// Geographic coordinate in degrees (WGS84 latitude / longitude)
struct LatLng {
    double lat;
    double lng;

    constexpr LatLng() noexcept : lat(0.0), lng(0.0) {}
    constexpr LatLng(double lat_, double lng_) noexcept : lat(lat_), lng(lng_) {}

    bool is_valid() const noexcept {
        return std::isfinite(lat) && std::isfinite(lng) &&
               lat >= -90.0 && lat <= 90.0 &&
               lng >= -180.0 && lng <= 180.0;
    }
};

// Exact comparison: persisted coordinates must survive a round trip bit for bit
constexpr bool operator==(const LatLng& lhs, const LatLng& rhs) noexcept {
    return lhs.lat == rhs.lat && lhs.lng == rhs.lng;
}

constexpr bool operator!=(const LatLng& lhs, const LatLng& rhs) noexcept {
    return !(lhs == rhs);
}

/**
 * A single GEOSCAN cluster: a stable identifier and the polygon boundary
 * enclosing its points. The ring may be implicitly closed; the point
 * sequence is kept exactly as given.
 */
struct Cluster {
    std::string id;
    std::vector<LatLng> points;

    Cluster() = default;
    Cluster(std::string id_, std::vector<LatLng> points_)
        : id(std::move(id_)), points(std::move(points_)) {}

    bool operator==(const Cluster& other) const {
        return id == other.id && points == other.points;
    }
    bool operator!=(const Cluster& other) const { return !(*this == other); }
};

/**
 * The trained model payload: every cluster produced by GEOSCAN.
 * Immutable once built. Construction validates each cluster and rejects
 * duplicate identifiers.
 */
class Shape {
public:
    Shape() = default;
    explicit Shape(std::vector<Cluster> clusters);

    const std::vector<Cluster>& clusters() const noexcept { return clusters_; }
    size_t size() const noexcept { return clusters_.size(); }
    bool empty() const noexcept { return clusters_.empty(); }

    bool operator==(const Shape& other) const { return clusters_ == other.clusters_; }
    bool operator!=(const Shape& other) const { return !(*this == other); }

private:
    std::vector<Cluster> clusters_;
};

using ShapePtr = std::shared_ptr<const Shape>;

// Minimum number of vertices of a cluster boundary
constexpr size_t MIN_POLYGON_POINTS = 3;

// Throws InvalidArgumentError when the cluster breaks a data model invariant
void validate_cluster(const Cluster& cluster);

// (cluster, cell) association used as the inference join key
struct Tile {
    std::string cluster_id;
    std::string cell_id;

    bool operator==(const Tile& other) const {
        return cluster_id == other.cluster_id && cell_id == other.cell_id;
    }
};

} // namespace geoscan
