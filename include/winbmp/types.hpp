#ifndef WINBMP_TYPES_HPP_
#define WINBMP_TYPES_HPP_

#include <winbmp/winbmp_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace winbmp {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    indexed8,   // 8-bit palette indices
    rgb888,     // 24-bit, 8-bit RGB components, no alpha
    rgba8888    // 32-bit, 8-bit RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::indexed8: return 1;
        case pixel_format::rgb888:   return 3;
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

// ============================================================================
// Palette
// ============================================================================

struct palette_entry {
    std::uint8_t red = 0;
    std::uint8_t green = 0;
    std::uint8_t blue = 0;
    std::uint8_t reserved = 0;

    friend bool operator==(const palette_entry&, const palette_entry&) = default;
};

// ============================================================================
// Image Descriptor
// ============================================================================

enum class compression_kind {
    none,
    rle8,
    rle4,
    bitfields
};

// Information header layouts, named after their length in bytes
enum class header_variant {
    core,       // 12: BITMAPCOREHEADER (OS/2 1.x)
    info,       // 40: BITMAPINFOHEADER
    v2,         // 52: adds RGB masks
    v3,         // 56: adds alpha mask
    os2_v2,     // 64: OS/2 2.x
    v4,         // 108: BITMAPV4HEADER
    v5          // 124: BITMAPV5HEADER
};

struct color_masks {
    std::uint32_t red = 0;
    std::uint32_t green = 0;
    std::uint32_t blue = 0;
    std::uint32_t alpha = 0;
};

/**
 * Normalised view of the file and information headers.
 * Built once per decode call and not modified afterwards.
 */
struct image_descriptor {
    std::uint32_t file_size = 0;
    std::uint32_t data_offset = 0;
    header_variant variant = header_variant::info;
    std::uint32_t header_size = 0;

    std::int32_t width = 0;
    std::int32_t height = 0;     // as declared, negative for top-down storage
    bool top_down = false;

    int bits_per_pixel = 0;
    compression_kind compression = compression_kind::none;
    std::uint32_t palette_size = 0;
    std::uint32_t image_size = 0;
    color_masks masks;

    [[nodiscard]] int rows() const noexcept {
        return height < 0 ? -height : height;
    }

    [[nodiscard]] bool is_indexed() const noexcept {
        return bits_per_pixel <= 8;
    }

    [[nodiscard]] bool has_alpha() const noexcept {
        return bits_per_pixel >= 16 && masks.alpha != 0;
    }
};

[[nodiscard]] WINBMP_EXPORT const char* to_string(compression_kind kind) noexcept;
[[nodiscard]] WINBMP_EXPORT const char* to_string(header_variant variant) noexcept;

// ============================================================================
// Codec Errors
// ============================================================================

enum class codec_error {
    none,
    invalid_format,     // the stream violates the BMP structure
    unsupported,        // valid, but a variant this codec does not handle
    io_error            // the byte source or sink failed
};

[[nodiscard]] WINBMP_EXPORT const char* to_string(codec_error err) noexcept;

// ============================================================================
// Codec Result
// ============================================================================

struct codec_result {
    bool ok = false;
    codec_error error = codec_error::none;
    std::string message;

    [[nodiscard]] static codec_result success() {
        return {true, codec_error::none, {}};
    }

    [[nodiscard]] static codec_result failure(codec_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // Ceiling for the decoded pixel buffer in bytes (0 = use default)
    std::uint64_t max_pixel_bytes = 1024ULL * 1024ULL * 1024ULL;

    // Keep palette indices (indexed8 output) for 1, 4 and 8 bpp images
    bool keep_indices = false;
};

struct encode_options {
    // Target depth: 1, 4, 8, 16, 24 or 32 (0 = derive from the pixel format)
    int bits_per_pixel = 0;

    // Store rows top-down with a negative height
    bool top_down = false;

    // Palette for indexed targets; empty = buffer palette, then grayscale
    std::vector<palette_entry> palette;
};

} // namespace winbmp

#endif // WINBMP_TYPES_HPP_
