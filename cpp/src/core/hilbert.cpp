#include "geoscan/hilbert.hpp"

namespace geoscan {

/**
 * 2D Hilbert Curve - Coordinate to Index mapping
 *
 * `bits` bits per dimension x 2 dimensions, packed into one 64-bit integer.
 * Bit-plane interleave: bit i of dimension d goes to position i*2 + (1 - d),
 * so the x axis owns the high bit of every pair.
 *
 * Algorithm: Skilling's compact Hilbert index
 */

void HilbertCurve2D::transpose_to_axes(uint32_t* x, uint32_t n, uint32_t bits) noexcept {
    // Gray decode
    uint32_t t = x[n - 1] >> 1;
    for (uint32_t i = n - 1; i > 0; --i) {
        x[i] ^= x[i - 1];
    }
    x[0] ^= t;

    // Undo excess work
    for (uint32_t b = 1; b < bits; ++b) {
        uint64_t Q = 1ULL << b;
        uint64_t P = Q - 1ULL;
        for (int i = static_cast<int>(n) - 1; i >= 0; --i) {
            if (x[i] & static_cast<uint32_t>(Q)) {
                x[0] ^= static_cast<uint32_t>(P);
            } else {
                t = (x[0] ^ x[i]) & static_cast<uint32_t>(P);
                x[0] ^= t;
                x[i] ^= t;
            }
        }
    }
}

void HilbertCurve2D::axes_to_transpose(uint32_t* x, uint32_t n, uint32_t bits) noexcept {
    // Inverse undo
    for (int b = static_cast<int>(bits) - 1; b >= 1; --b) {
        uint64_t Q = 1ULL << b;
        uint64_t P = Q - 1ULL;
        for (uint32_t i = 0; i < n; ++i) {
            if (x[i] & static_cast<uint32_t>(Q)) {
                x[0] ^= static_cast<uint32_t>(P);
            } else {
                uint32_t t = (x[0] ^ x[i]) & static_cast<uint32_t>(P);
                x[0] ^= t;
                x[i] ^= t;
            }
        }
    }

    // Gray encode
    for (uint32_t i = 1; i < n; ++i) {
        x[i] ^= x[i - 1];
    }
    uint32_t t = 0;
    for (int b = static_cast<int>(bits) - 1; b >= 1; --b) {
        uint64_t Q = 1ULL << b;
        if (x[n - 1] & static_cast<uint32_t>(Q)) t ^= static_cast<uint32_t>(Q - 1);
    }
    for (uint32_t i = 0; i < n; ++i) {
        x[i] ^= t;
    }
}

uint64_t HilbertCurve2D::coords_to_index(uint32_t x, uint32_t y, uint32_t bits) noexcept {
    uint32_t X[2] = {x, y};
    axes_to_transpose(X, DIMS, bits);

    uint64_t result = 0;
    for (uint32_t bit = 0; bit < bits; ++bit) {
        uint64_t pair = (static_cast<uint64_t>((X[0] >> bit) & 1U) << 1) |
                        static_cast<uint64_t>((X[1] >> bit) & 1U);
        result |= pair << (bit * 2);
    }
    return result;
}

void HilbertCurve2D::index_to_coords(uint64_t index, uint32_t bits, uint32_t& x, uint32_t& y) noexcept {
    uint32_t X[2] = {0, 0};

    for (uint32_t bit = 0; bit < bits; ++bit) {
        uint64_t pair = (index >> (bit * 2)) & 0x3ULL;
        X[0] |= static_cast<uint32_t>((pair >> 1) & 1ULL) << bit;
        X[1] |= static_cast<uint32_t>(pair & 1ULL) << bit;
    }

    transpose_to_axes(X, DIMS, bits);
    x = X[0];
    y = X[1];
}

} // namespace geoscan
