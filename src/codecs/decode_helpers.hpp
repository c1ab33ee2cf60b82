#pragma once

#include <winbmp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace winbmp {

// Default limits
constexpr int DEFAULT_MAX_DIMENSION = 16384;
constexpr std::uint64_t DEFAULT_MAX_PIXEL_BYTES = 1024ULL * 1024ULL * 1024ULL;

// Get effective dimension limits from options
inline std::pair<int, int> get_dimension_limits(const decode_options& options,
                                                 int default_limit = DEFAULT_MAX_DIMENSION) {
    int max_w = options.max_width > 0 ? options.max_width : default_limit;
    int max_h = options.max_height > 0 ? options.max_height : default_limit;
    return {max_w, max_h};
}

inline std::uint64_t get_pixel_byte_limit(const decode_options& options) {
    return options.max_pixel_bytes > 0 ? options.max_pixel_bytes : DEFAULT_MAX_PIXEL_BYTES;
}

// Multiply without wrapping; nullopt on overflow
inline std::optional<std::uint64_t> checked_mul(std::uint64_t a, std::uint64_t b) {
    if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a) {
        return std::nullopt;
    }
    return a * b;
}

// Row stride calculation (4-byte aligned, for BMP/DIB formats)
inline std::size_t row_stride_4byte(int width, int bits_per_pixel) {
    return ((static_cast<std::size_t>(width) * static_cast<std::size_t>(bits_per_pixel) + 31) / 32) * 4;
}

// Extract pixel from packed data (1, 4, or 8 bits per pixel, MSB first)
inline std::uint8_t extract_pixel(const std::uint8_t* row, int x, int bits_per_pixel) {
    switch (bits_per_pixel) {
        case 1: {
            int byte_index = x / 8;
            int bit_index = 7 - (x % 8);
            return (row[byte_index] >> bit_index) & 0x01;
        }
        case 4: {
            int byte_index = x / 2;
            int bit_index = (x % 2) ? 0 : 4;
            return (row[byte_index] >> bit_index) & 0x0F;
        }
        case 8:
            return row[x];
        default:
            return 0;
    }
}

// Pack an index into a row (1, 4, or 8 bits per pixel, MSB first)
inline void store_pixel(std::uint8_t* row, int x, int bits_per_pixel, std::uint8_t value) {
    switch (bits_per_pixel) {
        case 1:
            row[x / 8] |= static_cast<std::uint8_t>((value & 0x01) << (7 - (x % 8)));
            break;
        case 4:
            row[x / 2] |= static_cast<std::uint8_t>((value & 0x0F) << ((x % 2) ? 0 : 4));
            break;
        case 8:
            row[x] = value;
            break;
        default:
            break;
    }
}

} // namespace winbmp
