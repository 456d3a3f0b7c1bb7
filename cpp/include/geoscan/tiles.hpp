#pragma once

#include "geoscan/spatial_index.hpp"
#include "geoscan/thread_pool.hpp"
#include "geoscan/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace geoscan {

/**
 * Cover every cluster polygon with grid cells.
 *
 * Output is grouped by cluster in shape order, each group sorted by cell id.
 * A cell may appear under several clusters when dilated polygons overlap;
 * those duplicates are kept.
 */
std::vector<Tile> expand_tiles(const Shape& shape, const SpatialIndex& index,
                               int precision, int layers,
                               const ExecutionContext& ctx = ExecutionContext());

/**
 * Read-only lookup from cell id to the clusters covering it.
 * Keys are upper-cased so lookups are case-insensitive.
 */
class TileTable {
public:
    TileTable() = default;
    TileTable(const Shape& shape, const std::vector<Tile>& tiles);

    // Cluster indices (into the shape) covering the cell, ascending; empty when none
    const std::vector<size_t>& lookup(const std::string& cell_id) const;

    size_t cell_count() const noexcept { return cells_.size(); }
    size_t ambiguous_cell_count() const noexcept { return ambiguous_; }

private:
    std::unordered_map<std::string, std::vector<size_t>> cells_;
    size_t ambiguous_ = 0;
};

std::string normalize_cell_id(const std::string& cell_id);

} // namespace geoscan
