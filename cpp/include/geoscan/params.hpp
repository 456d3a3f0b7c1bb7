#pragma once

#include <optional>
#include <string>

namespace geoscan {

// Parameters shared by GEOSCAN training and model serving
struct GeoscanParams {
    double epsilon = 50.0;       // metres
    int min_pts = 3;
    std::string latitude_col = "latitude";
    std::string longitude_col = "longitude";
    std::string prediction_col = "predicted";

    // Throws ConfigurationError on an unusable combination
    void validate() const;

    bool operator==(const GeoscanParams& other) const {
        return epsilon == other.epsilon && min_pts == other.min_pts &&
               latitude_col == other.latitude_col &&
               longitude_col == other.longitude_col &&
               prediction_col == other.prediction_col;
    }
    bool operator!=(const GeoscanParams& other) const { return !(*this == other); }
};

// Sparse set of parameter values applied on top of an existing model
struct ParamOverrides {
    std::optional<double> epsilon;
    std::optional<int> min_pts;
    std::optional<std::string> latitude_col;
    std::optional<std::string> longitude_col;
    std::optional<std::string> prediction_col;

    GeoscanParams apply(GeoscanParams params) const;
};

} // namespace geoscan
