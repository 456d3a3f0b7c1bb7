#pragma once

#include <cstdint>

namespace geoscan {

/**
 * 2D Hilbert Curve implementation
 *
 * Maps a (column, row) grid coordinate with up to 32 bits per axis to a
 * 64-bit Hilbert index and back. Nearby grid cells map to nearby indices,
 * which keeps the cell ids of one cluster close together when sorted.
 *
 * Implementation based on:
 * - Skilling, J. "Programming the Hilbert curve" (2004)
 */
class HilbertCurve2D {
public:
    static constexpr uint32_t DIMS = 2;

    /**
     * Convert grid coordinates to a Hilbert index
     * @param x column, must fit in `bits` bits
     * @param y row, must fit in `bits` bits
     * @param bits bits per axis (1..32)
     */
    static uint64_t coords_to_index(uint32_t x, uint32_t y, uint32_t bits) noexcept;

    /**
     * Convert a Hilbert index back to grid coordinates
     */
    static void index_to_coords(uint64_t index, uint32_t bits, uint32_t& x, uint32_t& y) noexcept;

    // Transpose operations for the Hilbert curve (public for specialized use cases)
    static void transpose_to_axes(uint32_t* x, uint32_t n, uint32_t bits) noexcept;
    static void axes_to_transpose(uint32_t* x, uint32_t n, uint32_t bits) noexcept;
};

} // namespace geoscan
