#include "geoscan/spatial_index.hpp"
#include "geoscan/error.hpp"
#include "geoscan/geometry.hpp"
#include "geoscan/hilbert.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <set>
#include <utility>

namespace geoscan {

namespace {

constexpr int RESOLUTION_SHIFT = 56;
constexpr uint64_t HILBERT_MASK = (1ULL << RESOLUTION_SHIFT) - 1ULL;
constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

// Bits per axis of the Hilbert curve; columns need one more bit than rows
constexpr uint32_t axis_bits(int resolution) noexcept {
    return static_cast<uint32_t>(resolution) + 1U;
}

uint32_t clamp_index(double scaled, uint32_t count) noexcept {
    if (!(scaled > 0.0)) return 0;
    auto idx = static_cast<uint64_t>(std::floor(scaled));
    return idx >= count ? count - 1 : static_cast<uint32_t>(idx);
}

BoundingBox cell_box(const GridIndex::Cell& cell) noexcept {
    const double size = GridIndex::cell_size_deg(cell.resolution);
    BoundingBox box;
    box.min_lat = -90.0 + cell.row * size;
    box.max_lat = box.min_lat + size;
    box.min_lng = -180.0 + cell.col * size;
    box.max_lng = box.min_lng + size;
    return box;
}

} // anonymous namespace

GridIndex::GridIndex(uint64_t max_cells_per_polygon) : max_cells_(max_cells_per_polygon) {
    GEOSCAN_CHECK_ARGUMENT(max_cells_per_polygon > 0, "max_cells_per_polygon must be positive");
}

void GridIndex::check_resolution(int resolution) const {
    if (resolution < MIN_RESOLUTION || resolution > MAX_RESOLUTION) {
        throw InvalidArgumentError("Resolution " + std::to_string(resolution) + " outside [" +
                                   std::to_string(MIN_RESOLUTION) + ", " +
                                   std::to_string(MAX_RESOLUTION) + "]", __func__);
    }
}

double GridIndex::cell_size_deg(int resolution) noexcept {
    return 180.0 / static_cast<double>(1ULL << resolution);
}

double GridIndex::cell_diagonal_m(int resolution) const {
    check_resolution(resolution);
    // Cells are widest on the equator
    const double side_m = cell_size_deg(resolution) * DEG_TO_RAD * EARTH_RADIUS_M;
    return side_m * std::sqrt(2.0);
}

GridIndex::Cell GridIndex::locate(double lat, double lng, int resolution) const {
    check_resolution(resolution);
    if (!LatLng(lat, lng).is_valid()) {
        throw InvalidArgumentError("Invalid coordinate (" + std::to_string(lat) + ", " +
                                   std::to_string(lng) + ")", __func__);
    }

    const double size = cell_size_deg(resolution);
    Cell cell;
    cell.resolution = resolution;
    cell.row = clamp_index((lat + 90.0) / size, rows(resolution));
    cell.col = clamp_index((lng + 180.0) / size, cols(resolution));
    return cell;
}

std::string GridIndex::format_cell(const Cell& cell) {
    const uint64_t h = HilbertCurve2D::coords_to_index(cell.col, cell.row, axis_bits(cell.resolution));
    const uint64_t id = (static_cast<uint64_t>(cell.resolution) << RESOLUTION_SHIFT) | h;

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llX", static_cast<unsigned long long>(id));
    return std::string(buf);
}

GridIndex::Cell GridIndex::parse_cell(const std::string& id) {
    if (id.empty() || id.size() > 16) {
        throw InvalidArgumentError("Malformed cell id '" + id + "'", __func__);
    }

    uint64_t value = 0;
    for (char c : id) {
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            throw InvalidArgumentError("Malformed cell id '" + id + "'", __func__);
        }
        value = (value << 4) | static_cast<uint64_t>(digit);
    }

    const auto resolution = static_cast<int>(value >> RESOLUTION_SHIFT);
    if (resolution > MAX_RESOLUTION) {
        throw InvalidArgumentError("Cell id '" + id + "' has invalid resolution " +
                                   std::to_string(resolution), __func__);
    }

    const uint64_t h = value & HILBERT_MASK;
    const uint32_t bits = axis_bits(resolution);
    if (h >> (2 * bits) != 0) {
        throw InvalidArgumentError("Cell id '" + id + "' is out of range", __func__);
    }

    Cell cell;
    cell.resolution = resolution;
    HilbertCurve2D::index_to_coords(h, bits, cell.col, cell.row);
    if (cell.row >= rows(resolution) || cell.col >= cols(resolution)) {
        throw InvalidArgumentError("Cell id '" + id + "' lies outside the grid", __func__);
    }
    return cell;
}

LatLng GridIndex::cell_center(const Cell& cell) noexcept {
    const double size = cell_size_deg(cell.resolution);
    return LatLng(-90.0 + (cell.row + 0.5) * size, -180.0 + (cell.col + 0.5) * size);
}

std::string GridIndex::cell_id(double lat, double lng, int resolution) const {
    return format_cell(locate(lat, lng, resolution));
}

std::vector<GridIndex::Cell> GridIndex::disk(const Cell& cell, int k) const {
    GEOSCAN_CHECK_ARGUMENT(k >= 0, "Ring count must be non-negative");

    const auto n_rows = static_cast<int64_t>(rows(cell.resolution));
    const auto n_cols = static_cast<int64_t>(cols(cell.resolution));

    // Once the disk is wider than the globe every column is covered once
    int64_t col_lo = static_cast<int64_t>(cell.col) - k;
    int64_t col_hi = static_cast<int64_t>(cell.col) + k;
    if (col_hi - col_lo + 1 >= n_cols) {
        col_lo = 0;
        col_hi = n_cols - 1;
    }

    std::vector<Cell> out;
    for (int64_t r = static_cast<int64_t>(cell.row) - k; r <= static_cast<int64_t>(cell.row) + k; ++r) {
        if (r < 0 || r >= n_rows) continue;
        for (int64_t c = col_lo; c <= col_hi; ++c) {
            int64_t wrapped = ((c % n_cols) + n_cols) % n_cols;
            out.push_back(Cell{cell.resolution, static_cast<uint32_t>(wrapped), static_cast<uint32_t>(r)});
        }
    }
    return out;
}

std::vector<std::string> GridIndex::poly_fill(const std::vector<LatLng>& points,
                                              int resolution, int layers) const {
    check_resolution(resolution);
    GEOSCAN_CHECK_ARGUMENT(layers >= 0, "layers must be >= 0");
    GEOSCAN_CHECK_ARGUMENT(!points.empty(), "Cannot fill an empty polygon");
    for (const auto& p : points) {
        GEOSCAN_CHECK_ARGUMENT(p.is_valid(), "Polygon contains an invalid coordinate");
    }

    const BoundingBox box = bounding_box(points);
    const Cell lo = locate(box.min_lat, box.min_lng, resolution);
    const Cell hi = locate(box.max_lat, box.max_lng, resolution);

    const uint64_t ring_width = 2ULL * static_cast<uint64_t>(layers) + 1ULL;
    const uint64_t candidates = (static_cast<uint64_t>(hi.row - lo.row) + 1ULL) *
                                (static_cast<uint64_t>(hi.col - lo.col) + 1ULL);
    // Dilated cells are bounded by candidates * ring_width^2; compared by
    // division so huge layer counts cannot wrap around
    const uint64_t budget = max_cells_ > std::numeric_limits<uint64_t>::max() / 9ULL
                                ? std::numeric_limits<uint64_t>::max()
                                : max_cells_ * 9ULL;
    const uint64_t per_candidate = budget / candidates;
    if (candidates > max_cells_ || ring_width > per_candidate / ring_width) {
        throw InvalidArgumentError(
            "Polygon spans " + std::to_string(candidates) + " cells at resolution " +
            std::to_string(resolution), __func__,
            "Use a coarser resolution or raise index.max_cells_per_polygon");
    }

    std::set<std::pair<uint32_t, uint32_t>> filled;
    for (uint32_t row = lo.row; row <= hi.row; ++row) {
        for (uint32_t col = lo.col; col <= hi.col; ++col) {
            Cell cell{resolution, col, row};
            if (polygon_intersects_box(points, cell_box(cell))) {
                filled.emplace(col, row);
            }
        }
    }

    if (layers > 0) {
        std::set<std::pair<uint32_t, uint32_t>> dilated;
        for (const auto& [col, row] : filled) {
            for (const auto& neighbour : disk(Cell{resolution, col, row}, layers)) {
                dilated.emplace(neighbour.col, neighbour.row);
            }
        }
        filled.swap(dilated);
    }

    std::vector<std::string> ids;
    ids.reserve(filled.size());
    for (const auto& [col, row] : filled) {
        ids.push_back(format_cell(Cell{resolution, col, row}));
    }
    // Fixed-width upper-case hex sorts in numeric order
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace geoscan
