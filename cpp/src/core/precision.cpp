#include "geoscan/precision.hpp"
#include "geoscan/error.hpp"
#include "geoscan/logging.hpp"

#include <cmath>

namespace geoscan {

int select_precision(double epsilon_m, const SpatialIndex& index) {
    if (!std::isfinite(epsilon_m) || epsilon_m <= 0.0) {
        throw NoPrecisionError("Could not infer precision from epsilon value " +
                               std::to_string(epsilon_m), __func__,
                               "epsilon must be a positive distance in metres");
    }

    for (int res = index.min_resolution(); res <= index.max_resolution(); ++res) {
        if (index.cell_diagonal_m(res) <= epsilon_m) {
            LOG_DEBUG("Selected resolution " + std::to_string(res) + " for epsilon " +
                      std::to_string(epsilon_m) + "m");
            return res;
        }
    }

    const double finest = index.cell_diagonal_m(index.max_resolution());
    throw NoPrecisionError("Could not infer precision from epsilon value " +
                           std::to_string(epsilon_m), __func__,
                           "The finest cell diagonal is " + std::to_string(finest) +
                           "m, use an epsilon at least that large");
}

} // namespace geoscan
