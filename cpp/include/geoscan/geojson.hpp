// =============================================================================
// geojson.hpp - Shape <-> GeoJSON text codec
// =============================================================================
// A shape is written as a FeatureCollection with one Polygon feature per
// cluster:
//
//   {"type":"FeatureCollection","features":[
//     {"type":"Feature","properties":{"cluster":"A"},
//      "geometry":{"type":"Polygon","coordinates":[[[lng,lat],...]]}}]}
//
// The ring holds the cluster points verbatim (no closing point is added) and
// doubles are printed in shortest round-trip form, so decode(encode(s)) == s.
// =============================================================================

#pragma once

#include "geoscan/types.hpp"

#include <string>

namespace geoscan {

// Single-line GeoJSON document
std::string to_geojson(const Shape& shape);

// Throws CorruptDataError on malformed input
Shape from_geojson(const std::string& text);

} // namespace geoscan
