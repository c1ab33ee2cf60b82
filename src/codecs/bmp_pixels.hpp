#pragma once

#include <winbmp/types.hpp>

#include "decode_helpers.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>

namespace winbmp {

// ============================================================================
// Bitfield channels
// ============================================================================

// Count trailing zero bits
inline int count_zero_bits(std::uint32_t v) {
    if (v == 0) return 32;
    int count = 0;
    while ((v & 1) == 0) {
        count++;
        v >>= 1;
    }
    return count;
}

// Count bits set in mask
inline int count_mask_bits(std::uint32_t v) {
    int count = 0;
    while (v) {
        if (v & 1) count++;
        v >>= 1;
    }
    return count;
}

// A mask is usable when its set bits form a single run
inline bool is_contiguous_mask(std::uint32_t v) {
    if (v == 0) return true;
    const std::uint32_t shifted = v >> count_zero_bits(v);
    return (shifted & (shifted + 1)) == 0;
}

/**
 * Scale an n-bit channel value to 8 bits by bit replication.
 * Values wider than 8 bits keep their top 8 bits.
 */
inline std::uint8_t expand_to_8bit(std::uint32_t value, int bits) {
    if (bits <= 0) return 0;
    if (bits >= 8) return static_cast<std::uint8_t>(value >> (bits - 8));

    std::uint32_t out = 0;
    int filled = 0;
    while (filled < 8) {
        out = (out << bits) | value;
        filled += bits;
    }
    return static_cast<std::uint8_t>(out >> (filled - 8));
}

struct channel_mask {
    std::uint32_t mask = 0;
    int shift = 0;
    int bits = 0;

    [[nodiscard]] static channel_mask from_mask(std::uint32_t mask) {
        channel_mask ch;
        ch.mask = mask;
        ch.shift = mask ? count_zero_bits(mask) : 0;
        ch.bits = count_mask_bits(mask);
        return ch;
    }

    [[nodiscard]] std::uint8_t extract(std::uint32_t pixel) const {
        return expand_to_8bit((pixel & mask) >> shift, bits);
    }
};

// ============================================================================
// Row strategies
// ============================================================================

// 1/4/8 bpp palette indices, MSB first (RLE output uses 8)
struct indexed_rows {
    int bits_per_pixel = 8;
    std::span<const palette_entry> palette;
    bool keep_indices = false;
};

// 16/32 bpp little-endian words split by channel masks
struct bitfield_rows {
    int bytes_per_pixel = 4;
    channel_mask red;
    channel_mask green;
    channel_mask blue;
    channel_mask alpha;
    bool with_alpha = false;
};

// 24 bpp B,G,R triplets
struct bgr24_rows {};

using row_decoder = std::variant<indexed_rows, bitfield_rows, bgr24_rows>;

/**
 * Pick the strategy for uncompressed or bitfield pixel data.
 */
row_decoder select_row_decoder(const image_descriptor& desc,
                               std::span<const palette_entry> palette,
                               const decode_options& options);

/**
 * Convert one stored row into output pixels.
 * @param dec Strategy from select_row_decoder (or indexed_rows for RLE)
 * @param src Row bytes without regard to padding
 * @param width Pixels in the row
 * @param dst Output row, width * bytes_per_pixel(format) bytes
 */
void decode_row(const row_decoder& dec, const std::uint8_t* src, int width, std::uint8_t* dst);

// ============================================================================
// Scanline assembly
// ============================================================================

/**
 * Row geometry shared by the decoder and the encoder.
 * Stored rows are padded to 4 bytes; bottom-up storage is reversed so that
 * pixel buffers are always top to bottom.
 */
class scanline_assembler {
public:
    scanline_assembler(int width, int rows, int bits_per_pixel, bool top_down) noexcept
        : rows_(rows),
          top_down_(top_down),
          stride_(row_stride_4byte(width, bits_per_pixel)) {}

    [[nodiscard]] int rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t stride() const noexcept { return stride_; }

    // Buffer row for a row in file order (and the reverse, the mapping is symmetric)
    [[nodiscard]] int buffer_row(int stored_row) const noexcept {
        return top_down_ ? stored_row : rows_ - 1 - stored_row;
    }

private:
    int rows_;
    bool top_down_;
    std::size_t stride_;
};

} // namespace winbmp
