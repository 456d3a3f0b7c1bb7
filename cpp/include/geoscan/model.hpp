#pragma once

#include "geoscan/params.hpp"
#include "geoscan/spatial_index.hpp"
#include "geoscan/table.hpp"
#include "geoscan/thread_pool.hpp"
#include "geoscan/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace geoscan {

class ModelWriter;

/**
 * How to pick a cluster when a record's cell is covered by several
 * (dilated) clusters. Either way exactly one prediction per record.
 */
enum class TieBreak {
    NEAREST_CENTROID,   // closest cluster centroid, then lowest id
    LOWEST_ID           // lexicographically smallest cluster id
};

TieBreak parse_tie_break(const std::string& text);
const char* tie_break_name(TieBreak tie_break) noexcept;

struct TransformOptions {
    int layers = 0;
    TieBreak tie_break = TieBreak::NEAREST_CENTROID;
};

/**
 * Trained GEOSCAN model: every cluster with its polygon, plus the
 * parameters used to serve it.
 *
 * Inference is a join instead of a point-in-polygon query: clusters are
 * covered with grid cells at a precision derived from epsilon, each record
 * is mapped to its own cell at that same precision, and the two are
 * left-outer joined on cell id. Records outside every cluster keep a null
 * prediction.
 *
 * Instances are immutable; copy() shares the shape.
 */
class GeoscanModel {
public:
    GeoscanModel(std::string uid, ShapePtr shape, GeoscanParams params = GeoscanParams(),
                 std::shared_ptr<const SpatialIndex> index = nullptr);

    // Fresh identifier of the form GeoscanModel_<12 hex digits>
    static std::string random_uid();

    const std::string& uid() const noexcept { return uid_; }
    const Shape& shape() const noexcept { return *shape_; }
    const ShapePtr& shape_ptr() const noexcept { return shape_; }
    const GeoscanParams& params() const noexcept { return params_; }
    const SpatialIndex& index() const noexcept { return *index_; }
    const std::shared_ptr<const SpatialIndex>& index_ptr() const noexcept { return index_; }

    // Grid resolution derived from epsilon; throws NoPrecisionError
    int precision() const;

    std::string to_geojson() const;

    std::vector<Tile> get_tiles(int precision, int layers = 0,
                                const ExecutionContext& ctx = ExecutionContext()) const;

    GeoscanModel copy(const ParamOverrides& extra = ParamOverrides()) const;

    /**
     * Validate an input schema and return the output schema.
     * Latitude and longitude must be numeric columns; the prediction
     * column must not exist yet. It is appended as a nullable string.
     */
    Schema transform_schema(const Schema& schema) const;

    /**
     * Enrich every row with the id of the cluster containing it.
     * Row count, row order and every input column are preserved.
     */
    Table transform(const Table& input,
                    const ExecutionContext& ctx = ExecutionContext(),
                    const TransformOptions& options = TransformOptions()) const;

    ModelWriter write() const;

    // Shortcut for write().save(path)
    void save(const std::string& path) const;

    static GeoscanModel load(const std::string& path,
                             std::shared_ptr<const SpatialIndex> index = nullptr);

    bool operator==(const GeoscanModel& other) const {
        return uid_ == other.uid_ && params_ == other.params_ && *shape_ == *other.shape_;
    }

private:
    std::string uid_;
    ShapePtr shape_;
    GeoscanParams params_;
    std::shared_ptr<const SpatialIndex> index_;
};

} // namespace geoscan
