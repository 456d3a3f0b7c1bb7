#pragma once

#include "geoscan/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geoscan {

/**
 * Discrete global grid used to turn point-in-polygon queries into joins.
 *
 * Implementations must be pure and deterministic: the same inputs always
 * yield the same cell ids, and cell ids are hexadecimal strings that can be
 * compared literally once upper-cased.
 */
class SpatialIndex {
public:
    virtual ~SpatialIndex() = default;

    virtual int min_resolution() const noexcept = 0;
    virtual int max_resolution() const noexcept = 0;

    // Largest cell diagonal at this resolution, in metres
    virtual double cell_diagonal_m(int resolution) const = 0;

    // Cell containing the point
    virtual std::string cell_id(double lat, double lng, int resolution) const = 0;

    // Cells whose area intersects the polygon, dilated by `layers` rings.
    // Sorted and free of duplicates.
    virtual std::vector<std::string> poly_fill(const std::vector<LatLng>& points,
                                               int resolution, int layers) const = 0;
};

/**
 * Hierarchical latitude/longitude grid.
 *
 * At resolution r the globe is cut into 2^r rows and 2^(r+1) columns of
 * square (in degrees) cells of 180 / 2^r degrees. The (column, row) pair
 * is linearised along a 2D Hilbert curve and tagged with its resolution:
 *
 *   id = resolution << 56 | hilbert(column, row)
 *
 * and printed as upper-case hex.
 */
class GridIndex : public SpatialIndex {
public:
    static constexpr int MIN_RESOLUTION = 0;
    static constexpr int MAX_RESOLUTION = 24;
    static constexpr double EARTH_RADIUS_M = 6371008.8;
    static constexpr uint64_t DEFAULT_MAX_CELLS = 4000000;

    struct Cell {
        int resolution;
        uint32_t col;
        uint32_t row;

        bool operator==(const Cell& other) const noexcept {
            return resolution == other.resolution && col == other.col && row == other.row;
        }
    };

    explicit GridIndex(uint64_t max_cells_per_polygon = DEFAULT_MAX_CELLS);

    int min_resolution() const noexcept override { return MIN_RESOLUTION; }
    int max_resolution() const noexcept override { return MAX_RESOLUTION; }

    double cell_diagonal_m(int resolution) const override;

    std::string cell_id(double lat, double lng, int resolution) const override;

    std::vector<std::string> poly_fill(const std::vector<LatLng>& points,
                                       int resolution, int layers) const override;

    // Cell containing the point; throws InvalidArgumentError on bad input
    Cell locate(double lat, double lng, int resolution) const;

    // Cells at Chebyshev distance <= k around `cell`, wrapping longitude
    std::vector<Cell> disk(const Cell& cell, int k) const;

    // Degrees covered by one cell edge
    static double cell_size_deg(int resolution) noexcept;
    static uint32_t rows(int resolution) noexcept { return 1U << resolution; }
    static uint32_t cols(int resolution) noexcept { return 2U << resolution; }

    static std::string format_cell(const Cell& cell);

    // Case-insensitive; throws InvalidArgumentError on a malformed id
    static Cell parse_cell(const std::string& id);

    static LatLng cell_center(const Cell& cell) noexcept;

private:
    void check_resolution(int resolution) const;

    uint64_t max_cells_;
};

} // namespace geoscan
