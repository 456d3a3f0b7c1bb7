#include "geoscan/params.hpp"
#include "geoscan/error.hpp"

#include <cmath>

namespace geoscan {

void GeoscanParams::validate() const {
    if (!std::isfinite(epsilon) || epsilon <= 0.0) {
        throw ConfigurationError("epsilon must be a positive distance, got " + std::to_string(epsilon),
                                 __func__);
    }
    if (min_pts < 1) {
        throw ConfigurationError("minPts must be at least 1, got " + std::to_string(min_pts), __func__);
    }
    if (latitude_col.empty() || longitude_col.empty() || prediction_col.empty()) {
        throw ConfigurationError("Column names must not be empty", __func__);
    }
    if (latitude_col == longitude_col || prediction_col == latitude_col ||
        prediction_col == longitude_col) {
        throw ConfigurationError("latitudeCol, longitudeCol and predictionCol must be distinct",
                                 __func__);
    }
}

GeoscanParams ParamOverrides::apply(GeoscanParams params) const {
    if (epsilon) params.epsilon = *epsilon;
    if (min_pts) params.min_pts = *min_pts;
    if (latitude_col) params.latitude_col = *latitude_col;
    if (longitude_col) params.longitude_col = *longitude_col;
    if (prediction_col) params.prediction_col = *prediction_col;
    return params;
}

} // namespace geoscan
