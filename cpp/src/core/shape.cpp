#include "geoscan/types.hpp"
#include "geoscan/error.hpp"

#include <unordered_set>

namespace geoscan {

void validate_cluster(const Cluster& cluster) {
    if (cluster.id.empty()) {
        throw InvalidArgumentError("Cluster id must not be empty", __func__);
    }
    if (cluster.points.size() < MIN_POLYGON_POINTS) {
        throw InvalidArgumentError(
            "Cluster '" + cluster.id + "' has " + std::to_string(cluster.points.size()) +
            " points, a polygon needs at least " + std::to_string(MIN_POLYGON_POINTS),
            __func__);
    }
    for (size_t i = 0; i < cluster.points.size(); ++i) {
        if (!cluster.points[i].is_valid()) {
            throw InvalidArgumentError(
                "Cluster '" + cluster.id + "' point " + std::to_string(i) +
                " is not a valid latitude/longitude", __func__);
        }
    }
}

Shape::Shape(std::vector<Cluster> clusters) : clusters_(std::move(clusters)) {
    std::unordered_set<std::string> seen;
    seen.reserve(clusters_.size());

    for (const auto& cluster : clusters_) {
        validate_cluster(cluster);
        if (!seen.insert(cluster.id).second) {
            throw InvalidArgumentError("Duplicate cluster id '" + cluster.id + "'", __func__,
                                       "Cluster ids must be unique within a model");
        }
    }
}

} // namespace geoscan
