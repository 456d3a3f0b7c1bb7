#pragma once

#include "geoscan/spatial_index.hpp"

namespace geoscan {

/**
 * Pick the grid resolution matching a GEOSCAN distance scale.
 *
 * Returns the coarsest resolution whose largest cell diagonal does not
 * exceed `epsilon_m`, so that two points sharing a cell are never further
 * apart than epsilon. Throws NoPrecisionError (a ConfigurationError) when
 * epsilon is not a positive finite number or is finer than the index can
 * resolve.
 *
 * The result must be shared between tile expansion and point lookup:
 * cell ids from different resolutions never match.
 */
int select_precision(double epsilon_m, const SpatialIndex& index);

} // namespace geoscan
