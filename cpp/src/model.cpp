#include "geoscan/model.hpp"
#include "geoscan/error.hpp"
#include "geoscan/geojson.hpp"
#include "geoscan/geometry.hpp"
#include "geoscan/logging.hpp"
#include "geoscan/persistence.hpp"
#include "geoscan/precision.hpp"
#include "geoscan/tiles.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <limits>
#include <random>

namespace geoscan {

TieBreak parse_tie_break(const std::string& text) {
    std::string val = text;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "nearest" || val == "nearest_centroid") return TieBreak::NEAREST_CENTROID;
    if (val == "lowest" || val == "lowest_id") return TieBreak::LOWEST_ID;

    throw ConfigurationError("Unknown tie-break policy '" + text + "'", __func__,
                             "Use nearest_centroid or lowest_id");
}

const char* tie_break_name(TieBreak tie_break) noexcept {
    switch (tie_break) {
        case TieBreak::NEAREST_CENTROID: return "nearest_centroid";
        case TieBreak::LOWEST_ID:        return "lowest_id";
    }
    return "unknown";
}

GeoscanModel::GeoscanModel(std::string uid, ShapePtr shape, GeoscanParams params,
                           std::shared_ptr<const SpatialIndex> index)
    : uid_(std::move(uid))
    , shape_(std::move(shape))
    , params_(std::move(params))
    , index_(std::move(index)) {
    GEOSCAN_CHECK_ARGUMENT(!uid_.empty(), "Model uid must not be empty");
    if (!shape_) {
        shape_ = std::make_shared<const Shape>();
    }
    if (!index_) {
        index_ = std::make_shared<const GridIndex>();
    }
    params_.validate();
}

std::string GeoscanModel::random_uid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    const uint64_t bits = rng() & 0xFFFFFFFFFFFFULL;

    char buf[13];
    std::snprintf(buf, sizeof(buf), "%012llx", static_cast<unsigned long long>(bits));
    return std::string("GeoscanModel_") + buf;
}

int GeoscanModel::precision() const {
    return select_precision(params_.epsilon, *index_);
}

std::string GeoscanModel::to_geojson() const {
    return geoscan::to_geojson(*shape_);
}

std::vector<Tile> GeoscanModel::get_tiles(int precision, int layers, const ExecutionContext& ctx) const {
    return expand_tiles(*shape_, *index_, precision, layers, ctx);
}

GeoscanModel GeoscanModel::copy(const ParamOverrides& extra) const {
    return GeoscanModel(uid_, shape_, extra.apply(params_), index_);
}

Schema GeoscanModel::transform_schema(const Schema& schema) const {
    auto require_numeric = [&](const std::string& name, const char* param) {
        int idx = schema.index_of(name);
        if (idx < 0) {
            throw InvalidArgumentError(std::string(param) + " column '" + name + "' does not exist",
                                       __func__);
        }
        FieldType type = schema.fields()[static_cast<size_t>(idx)].type;
        if (type != FieldType::DOUBLE && type != FieldType::INT64) {
            throw InvalidArgumentError(std::string(param) + " column '" + name + "' must be numeric, got " +
                                       field_type_name(type), __func__);
        }
    };

    require_numeric(params_.latitude_col, "latitudeCol");
    require_numeric(params_.longitude_col, "longitudeCol");

    if (schema.contains(params_.prediction_col)) {
        throw InvalidArgumentError("Prediction column '" + params_.prediction_col + "' already exists",
                                   __func__, "Set a different predictionCol");
    }
    return schema.add(Field{params_.prediction_col, FieldType::STRING, true});
}

Table GeoscanModel::transform(const Table& input, const ExecutionContext& ctx,
                              const TransformOptions& options) const {
    Schema output_schema = transform_schema(input.schema());

    // Both sides of the join use the same resolution
    const int res = precision();
    const std::vector<Tile> tiles = get_tiles(res, options.layers, ctx);
    const TileTable table(*shape_, tiles);

    if (table.ambiguous_cell_count() > 0) {
        LOG_WARNING(std::to_string(table.ambiguous_cell_count()) +
                    " cells belong to more than one cluster, resolving with " +
                    tie_break_name(options.tie_break));
    }

    const auto& clusters = shape_->clusters();
    std::vector<LatLng> centroids;
    if (options.tie_break == TieBreak::NEAREST_CENTROID && table.ambiguous_cell_count() > 0) {
        centroids.reserve(clusters.size());
        for (const auto& cluster : clusters) {
            centroids.push_back(spherical_centroid(cluster.points));
        }
    }

    auto resolve = [&](const std::vector<size_t>& owners, const LatLng& point) -> size_t {
        if (options.tie_break == TieBreak::LOWEST_ID) {
            return *std::min_element(owners.begin(), owners.end(), [&](size_t a, size_t b) {
                return clusters[a].id < clusters[b].id;
            });
        }
        size_t best = owners.front();
        double best_dist = std::numeric_limits<double>::infinity();
        for (size_t idx : owners) {
            double d = great_circle_m(point, centroids[idx], GridIndex::EARTH_RADIUS_M);
            if (d < best_dist || (d == best_dist && clusters[idx].id < clusters[best].id)) {
                best = idx;
                best_dist = d;
            }
        }
        return best;
    };

    const size_t lat_idx = static_cast<size_t>(input.schema().index_of(params_.latitude_col));
    const size_t lng_idx = static_cast<size_t>(input.schema().index_of(params_.longitude_col));
    const auto& in_rows = input.rows();

    std::vector<Row> out_rows(in_rows.size());
    std::atomic<size_t> matched{0};
    std::atomic<size_t> invalid{0};
    std::atomic<size_t> ambiguous{0};

    ctx.parallel_for(0, in_rows.size(), [&](size_t i) {
        const Row& row = in_rows[i];
        Row out;
        out.reserve(row.size() + 1);
        out.insert(out.end(), row.begin(), row.end());

        auto lat = as_double(row[lat_idx]);
        auto lng = as_double(row[lng_idx]);
        if (!lat || !lng || !LatLng(*lat, *lng).is_valid()) {
            invalid.fetch_add(1, std::memory_order_relaxed);
            out.emplace_back(std::monostate{});
            out_rows[i] = std::move(out);
            return;
        }

        const std::string cell = index_->cell_id(*lat, *lng, res);
        const auto& owners = table.lookup(cell);
        if (owners.empty()) {
            out.emplace_back(std::monostate{});
        } else {
            size_t winner = owners.front();
            if (owners.size() > 1) {
                ambiguous.fetch_add(1, std::memory_order_relaxed);
                winner = resolve(owners, LatLng(*lat, *lng));
            }
            out.emplace_back(clusters[winner].id);
            matched.fetch_add(1, std::memory_order_relaxed);
        }
        out_rows[i] = std::move(out);
    });

    if (invalid.load() > 0) {
        LOG_WARNING(std::to_string(invalid.load()) +
                    " rows have missing or out-of-range coordinates, left unassigned");
    }
    LOG_DEBUG("Assigned " + std::to_string(matched.load()) + " of " + std::to_string(in_rows.size()) +
              " rows at resolution " + std::to_string(res) + " (" + std::to_string(ambiguous.load()) +
              " resolved by tie-break)");

    return Table(std::move(output_schema), std::move(out_rows));
}

ModelWriter GeoscanModel::write() const {
    return ModelWriter(*this);
}

void GeoscanModel::save(const std::string& path) const {
    write().save(path);
}

GeoscanModel GeoscanModel::load(const std::string& path, std::shared_ptr<const SpatialIndex> index) {
    return ModelReader(std::move(index)).load(path);
}

} // namespace geoscan
