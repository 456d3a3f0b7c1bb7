#include "geoscan/tiles.hpp"
#include "geoscan/error.hpp"
#include "geoscan/logging.hpp"

#include <algorithm>
#include <cctype>

namespace geoscan {

std::string normalize_cell_id(const std::string& cell_id) {
    std::string out = cell_id;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::vector<Tile> expand_tiles(const Shape& shape, const SpatialIndex& index,
                               int precision, int layers, const ExecutionContext& ctx) {
    GEOSCAN_CHECK_ARGUMENT(layers >= 0, "layers must be >= 0, got " + std::to_string(layers));

    const auto& clusters = shape.clusters();

    // One slot per cluster, filled independently by the workers
    std::vector<std::vector<std::string>> cells(clusters.size());
    ctx.parallel_for(0, clusters.size(), [&](size_t i) {
        cells[i] = index.poly_fill(clusters[i].points, precision, layers);
    });

    size_t total = 0;
    for (const auto& c : cells) {
        total += c.size();
    }

    std::vector<Tile> tiles;
    tiles.reserve(total);
    for (size_t i = 0; i < clusters.size(); ++i) {
        for (auto& cell : cells[i]) {
            tiles.push_back(Tile{clusters[i].id, normalize_cell_id(cell)});
        }
    }

    LOG_DEBUG("Expanded " + std::to_string(clusters.size()) + " clusters into " +
              std::to_string(tiles.size()) + " tiles at resolution " +
              std::to_string(precision) + " with " + std::to_string(layers) + " layers");
    return tiles;
}

TileTable::TileTable(const Shape& shape, const std::vector<Tile>& tiles) {
    std::unordered_map<std::string, size_t> cluster_index;
    cluster_index.reserve(shape.size());
    for (size_t i = 0; i < shape.size(); ++i) {
        cluster_index.emplace(shape.clusters()[i].id, i);
    }

    cells_.reserve(tiles.size());
    for (const auto& tile : tiles) {
        auto it = cluster_index.find(tile.cluster_id);
        if (it == cluster_index.end()) {
            throw InvalidArgumentError("Tile refers to unknown cluster '" + tile.cluster_id + "'",
                                       __func__);
        }
        cells_[normalize_cell_id(tile.cell_id)].push_back(it->second);
    }

    for (auto& [cell, owners] : cells_) {
        std::sort(owners.begin(), owners.end());
        owners.erase(std::unique(owners.begin(), owners.end()), owners.end());
        if (owners.size() > 1) {
            ++ambiguous_;
        }
    }
}

const std::vector<size_t>& TileTable::lookup(const std::string& cell_id) const {
    static const std::vector<size_t> none;
    auto it = cells_.find(normalize_cell_id(cell_id));
    return it == cells_.end() ? none : it->second;
}

} // namespace geoscan
