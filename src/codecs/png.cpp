#include <winbmp/codecs/png.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include <lodepng.h>

#include <cstring>
#include <fstream>
#include <string>
#include <utility>

namespace winbmp {

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

// IHDR chunk follows the signature:
// Offset 8-11: length (13), 12-15: "IHDR", 16-19: width, 20-23: height
constexpr std::size_t PNG_IHDR_LENGTH_OFFSET = 8;
constexpr std::size_t PNG_IHDR_TYPE_OFFSET = 12;
constexpr std::size_t PNG_IHDR_WIDTH_OFFSET = 16;
constexpr std::size_t PNG_IHDR_HEIGHT_OFFSET = 20;
constexpr std::size_t PNG_MIN_SIZE_FOR_DIMENSIONS = 24;
constexpr std::uint32_t PNG_IHDR_TYPE = 0x49484452;
constexpr std::uint32_t PNG_IHDR_LENGTH = 13;

codec_result check_dimensions(std::uint64_t width, std::uint64_t height, const decode_options& options) {
    const auto [max_w, max_h] = get_dimension_limits(options);
    if (width == 0 || height == 0) {
        return codec_result::failure(codec_error::invalid_format, "PNG has zero dimensions");
    }
    if (width > static_cast<std::uint64_t>(max_w) || height > static_cast<std::uint64_t>(max_h)) {
        return codec_result::failure(codec_error::invalid_format,
            "PNG dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed limit " + std::to_string(max_w) + "x" + std::to_string(max_h));
    }
    auto bytes = checked_mul(width, height);
    if (bytes) {
        bytes = checked_mul(*bytes, 4);
    }
    if (!bytes || *bytes > get_pixel_byte_limit(options)) {
        return codec_result::failure(codec_error::invalid_format, "PNG exceeds the pixel buffer limit");
    }
    return codec_result::success();
}

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }
    return std::memcmp(data.data(), PNG_SIGNATURE, PNG_SIGNATURE_SIZE) == 0;
}

codec_result png_decoder::decode(std::span<const std::uint8_t> data,
                                 pixel_buffer& pixels,
                                 const decode_options& options) {
    if (!sniff(data)) {
        return codec_result::failure(codec_error::invalid_format, "Not a valid PNG file");
    }

    // Reject huge images from IHDR before lodepng allocates anything
    if (data.size() >= PNG_MIN_SIZE_FOR_DIMENSIONS &&
        read_be32(data.data() + PNG_IHDR_LENGTH_OFFSET) == PNG_IHDR_LENGTH &&
        read_be32(data.data() + PNG_IHDR_TYPE_OFFSET) == PNG_IHDR_TYPE) {
        auto result = check_dimensions(read_be32(data.data() + PNG_IHDR_WIDTH_OFFSET),
                                       read_be32(data.data() + PNG_IHDR_HEIGHT_OFFSET), options);
        if (!result) return result;
    }

    unsigned width = 0;
    unsigned height = 0;
    std::vector<std::uint8_t> rgba;

    unsigned error = lodepng::decode(rgba, width, height, data.data(), data.size());
    if (error) {
        return codec_result::failure(codec_error::invalid_format,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    auto result = check_dimensions(width, height, options);
    if (!result) return result;

    pixel_buffer decoded;
    if (!decoded.set_size(static_cast<int>(width), static_cast<int>(height), pixel_format::rgba8888)) {
        return codec_result::failure(codec_error::invalid_format, "Failed to allocate pixel buffer");
    }
    std::memcpy(decoded.mutable_pixels().data(), rgba.data(), decoded.pixels().size());

    pixels = std::move(decoded);
    return codec_result::success();
}

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const pixel_buffer& pixels) {
    if (pixels.width() <= 0 || pixels.height() <= 0) {
        return {};
    }

    const auto w = static_cast<unsigned>(pixels.width());
    const auto h = static_cast<unsigned>(pixels.height());
    const std::size_t count = static_cast<std::size_t>(w) * h;
    const auto* src = pixels.pixels().data();

    std::vector<std::uint8_t> rgba;
    LodePNGColorType color_type = LCT_RGBA;

    switch (pixels.format()) {
        case pixel_format::rgba8888:
            rgba.assign(pixels.pixels().begin(), pixels.pixels().end());
            break;
        case pixel_format::rgb888:
            rgba.assign(pixels.pixels().begin(), pixels.pixels().end());
            color_type = LCT_RGB;
            break;
        case pixel_format::indexed8: {
            // Resolve through the palette; missing entries become black
            const auto palette = pixels.palette();
            rgba.resize(count * 3);
            color_type = LCT_RGB;
            for (std::size_t i = 0; i < count; ++i) {
                if (src[i] < palette.size()) {
                    const palette_entry& color = palette[src[i]];
                    rgba[i * 3 + 0] = color.red;
                    rgba[i * 3 + 1] = color.green;
                    rgba[i * 3 + 2] = color.blue;
                } else {
                    rgba[i * 3 + 0] = 0;
                    rgba[i * 3 + 1] = 0;
                    rgba[i * 3 + 2] = 0;
                }
            }
            break;
        }
    }

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, rgba, w, h, color_type, 8);
    if (error) {
        return {};
    }

    return png_data;
}

bool save_png(const pixel_buffer& pixels, const std::filesystem::path& path) {
    auto png_data = encode_png(pixels);
    if (png_data.empty()) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(png_data.data()),
               static_cast<std::streamsize>(png_data.size()));

    return file.good();
}

} // namespace winbmp
