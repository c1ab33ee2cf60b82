#pragma once

#include <winbmp/types.hpp>

#include "bmp_error.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace winbmp {

// ============================================================================
// BMP layout constants
// ============================================================================

constexpr std::uint8_t BMP_SIGNATURE[] = {'B', 'M'};

constexpr std::size_t FILE_HEADER_SIZE = 14;

// Information header lengths
constexpr std::uint32_t CORE_HEADER_SIZE = 12;
constexpr std::uint32_t INFO_HEADER_SIZE = 40;
constexpr std::uint32_t V2_HEADER_SIZE = 52;
constexpr std::uint32_t V3_HEADER_SIZE = 56;
constexpr std::uint32_t OS2_V2_HEADER_SIZE = 64;
constexpr std::uint32_t V4_HEADER_SIZE = 108;
constexpr std::uint32_t V5_HEADER_SIZE = 124;

// Compression methods
constexpr std::uint32_t BI_RGB = 0;
constexpr std::uint32_t BI_RLE8 = 1;
constexpr std::uint32_t BI_RLE4 = 2;
constexpr std::uint32_t BI_BITFIELDS = 3;
constexpr std::uint32_t BI_JPEG = 4;
constexpr std::uint32_t BI_PNG = 5;
constexpr std::uint32_t BI_ALPHABITFIELDS = 6;
constexpr std::uint32_t BI_CMYK = 11;
constexpr std::uint32_t BI_CMYKRLE8 = 12;
constexpr std::uint32_t BI_CMYKRLE4 = 13;

// LCS_WINDOWS_COLOR_SPACE ("Win ")
constexpr std::uint32_t LCS_WINDOWS_COLOR_SPACE = 0x57696E20;

// 72 DPI
constexpr std::int32_t DEFAULT_PIXELS_PER_METER = 2835;

// ============================================================================
// Header parsing and palette resolution
// ============================================================================

struct bmp_header_info {
    image_descriptor descriptor;
    int palette_entry_size = 4;     // 3 for OS/2 1.x core headers
};

/**
 * Read the file header, the information header and any trailing bitfield
 * masks, leaving the reader at the start of the color table.
 * Validates dimensions and the pixel budget before returning.
 */
bmp_header_info parse_headers(source_reader& in, const decode_options& options);

/**
 * Read the color table of an indexed image (empty for direct color).
 * Must directly follow parse_headers().
 */
std::vector<palette_entry> read_palette(source_reader& in, const bmp_header_info& header);

/**
 * Pixel format produced for an image with the given options.
 */
pixel_format output_format(const image_descriptor& desc, const decode_options& options) noexcept;

// ============================================================================
// RLE
// ============================================================================

/**
 * Expand an RLE4/RLE8 stream into one index per pixel, stored row order.
 * indices must hold width * rows zero-initialised bytes.
 */
void expand_rle(source_reader& in, compression_kind kind, int width, int rows,
                std::span<std::uint8_t> indices);

} // namespace winbmp
