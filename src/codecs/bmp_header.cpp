#include "bmp_format.hpp"
#include "bmp_pixels.hpp"
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <optional>
#include <string>

namespace winbmp {

namespace {

std::optional<header_variant> variant_for_size(std::uint32_t header_size) {
    switch (header_size) {
        case CORE_HEADER_SIZE:   return header_variant::core;
        case INFO_HEADER_SIZE:   return header_variant::info;
        case V2_HEADER_SIZE:     return header_variant::v2;
        case V3_HEADER_SIZE:     return header_variant::v3;
        case OS2_V2_HEADER_SIZE: return header_variant::os2_v2;
        case V4_HEADER_SIZE:     return header_variant::v4;
        case V5_HEADER_SIZE:     return header_variant::v5;
        default:                 return std::nullopt;
    }
}

bool has_rgb_masks(header_variant v) {
    return v == header_variant::v2 || v == header_variant::v3 ||
           v == header_variant::v4 || v == header_variant::v5;
}

bool has_alpha_mask(header_variant v) {
    return v == header_variant::v3 || v == header_variant::v4 || v == header_variant::v5;
}

// Map the raw biCompression value, rejecting what this codec cannot decode
compression_kind map_compression(std::uint32_t raw, header_variant variant, int bits_per_pixel) {
    const bool os2 = variant == header_variant::os2_v2;

    switch (raw) {
        case BI_RGB:
            return compression_kind::none;
        case BI_RLE8:
            return compression_kind::rle8;
        case BI_RLE4:
            return compression_kind::rle4;
        case BI_BITFIELDS:
            if (os2 && bits_per_pixel == 1) {
                throw_unsupported("OS/2 Huffman 1D compression is not supported");
            }
            return compression_kind::bitfields;
        case BI_JPEG:
            if (os2 && bits_per_pixel == 24) {
                throw_unsupported("OS/2 RLE24 compression is not supported");
            }
            throw_unsupported("Embedded JPEG data is not supported");
        case BI_PNG:
            throw_unsupported("Embedded PNG data is not supported");
        case BI_ALPHABITFIELDS:
            return compression_kind::bitfields;
        case BI_CMYK:
        case BI_CMYKRLE8:
        case BI_CMYKRLE4:
            throw_unsupported("CMYK bitmaps are not supported");
        default:
            throw_format("Unknown compression method " + std::to_string(raw));
    }
}

void validate_bit_depth(int bits_per_pixel) {
    switch (bits_per_pixel) {
        case 1:
        case 4:
        case 8:
        case 16:
        case 24:
        case 32:
            return;
        case 2:
        case 64:
            throw_unsupported("Unsupported bit depth " + std::to_string(bits_per_pixel));
        default:
            throw_format("Invalid bit depth " + std::to_string(bits_per_pixel));
    }
}

void validate_compression(compression_kind kind, int bits_per_pixel) {
    switch (kind) {
        case compression_kind::none:
            return;
        case compression_kind::rle8:
            if (bits_per_pixel != 8) {
                throw_format("RLE8 compression requires 8 bits per pixel");
            }
            return;
        case compression_kind::rle4:
            if (bits_per_pixel != 4) {
                throw_format("RLE4 compression requires 4 bits per pixel");
            }
            return;
        case compression_kind::bitfields:
            if (bits_per_pixel != 16 && bits_per_pixel != 32) {
                throw_format("Bitfields compression requires 16 or 32 bits per pixel");
            }
            return;
    }
}

void validate_masks(const color_masks& masks, int bits_per_pixel) {
    const std::uint32_t limit = bits_per_pixel == 16 ? 0xFFFFu : 0xFFFFFFFFu;
    const std::uint32_t all[] = {masks.red, masks.green, masks.blue, masks.alpha};

    if (masks.red == 0 && masks.green == 0 && masks.blue == 0) {
        throw_format("Bitfield masks are empty");
    }

    std::uint32_t seen = 0;
    for (std::uint32_t mask : all) {
        if ((mask & ~limit) != 0) {
            throw_format("Bitfield mask exceeds the pixel size");
        }
        if (!is_contiguous_mask(mask)) {
            throw_format("Bitfield mask is not contiguous");
        }
        if ((seen & mask) != 0) {
            throw_format("Bitfield masks overlap");
        }
        seen |= mask;
    }
}

void check_pixel_budget(const image_descriptor& desc, const decode_options& options) {
    const auto [max_w, max_h] = get_dimension_limits(options);
    if (desc.width > max_w || desc.rows() > max_h) {
        throw_format("Image dimensions exceed limits");
    }

    // RLE expands into one index byte per pixel before rows are converted
    std::size_t channels = bytes_per_pixel(output_format(desc, options));
    if (desc.compression == compression_kind::rle4 || desc.compression == compression_kind::rle8) {
        channels += 1;
    }
    auto bytes = checked_mul(static_cast<std::uint64_t>(desc.width),
                             static_cast<std::uint64_t>(desc.rows()));
    if (bytes) {
        bytes = checked_mul(*bytes, channels);
    }
    if (!bytes || *bytes > get_pixel_byte_limit(options)) {
        throw_format("Image exceeds the pixel buffer limit");
    }
}

} // namespace

bmp_header_info parse_headers(source_reader& in, const decode_options& options) {
    bmp_header_info info;
    image_descriptor& desc = info.descriptor;

    // File header
    std::array<std::uint8_t, FILE_HEADER_SIZE> file_header{};
    in.read_exact(file_header, "file header");
    if (file_header[0] != BMP_SIGNATURE[0] || file_header[1] != BMP_SIGNATURE[1]) {
        throw_format("Not a valid BMP file");
    }
    desc.file_size = read_le32(file_header.data() + 2);
    desc.data_offset = read_le32(file_header.data() + 10);

    // Info header - the size field selects the layout
    std::array<std::uint8_t, V5_HEADER_SIZE> header{};
    in.read_exact(std::span(header).first(4), "information header");
    desc.header_size = read_le32(header.data());

    const auto variant = variant_for_size(desc.header_size);
    if (!variant) {
        throw_unsupported("Unsupported information header size " + std::to_string(desc.header_size));
    }
    desc.variant = *variant;
    in.read_exact(std::span(header).subspan(4, desc.header_size - 4), "information header");

    const std::uint8_t* h = header.data();
    std::uint32_t raw_compression = BI_RGB;
    std::uint32_t colors_used = 0;

    if (desc.variant == header_variant::core) {
        // OS/2 1.x: 16-bit unsigned dimensions, always bottom-up
        desc.width = read_le16(h + 4);
        desc.height = read_le16(h + 6);
        desc.bits_per_pixel = read_le16(h + 10);
        info.palette_entry_size = 3;
    } else {
        desc.width = read_le32_signed(h + 4);
        desc.height = read_le32_signed(h + 8);
        desc.bits_per_pixel = read_le16(h + 14);
        raw_compression = read_le32(h + 16);
        desc.image_size = read_le32(h + 20);
        colors_used = read_le32(h + 32);

        if (has_rgb_masks(desc.variant)) {
            desc.masks.red = read_le32(h + 40);
            desc.masks.green = read_le32(h + 44);
            desc.masks.blue = read_le32(h + 48);
        }
        if (has_alpha_mask(desc.variant)) {
            desc.masks.alpha = read_le32(h + 52);
        }
    }

    desc.compression = map_compression(raw_compression, desc.variant, desc.bits_per_pixel);
    validate_bit_depth(desc.bits_per_pixel);
    validate_compression(desc.compression, desc.bits_per_pixel);

    // Dimensions
    if (desc.width <= 0) {
        throw_format("Invalid image width " + std::to_string(desc.width));
    }
    if (desc.height == 0 || desc.height == std::numeric_limits<std::int32_t>::min()) {
        throw_format("Invalid image height " + std::to_string(desc.height));
    }
    desc.top_down = desc.height < 0;
    if (desc.top_down && (desc.compression == compression_kind::rle4 ||
                          desc.compression == compression_kind::rle8)) {
        throw_format("Top-down bitmaps cannot be RLE compressed");
    }

    // Channel masks
    if (desc.compression == compression_kind::bitfields) {
        if (desc.variant == header_variant::info || desc.variant == header_variant::os2_v2) {
            // Masks follow the header
            const bool with_alpha = raw_compression == BI_ALPHABITFIELDS;
            std::array<std::uint8_t, 16> mask_bytes{};
            const auto masks = std::span(mask_bytes).first(with_alpha ? 16 : 12);
            in.read_exact(masks, "bitfield masks");
            desc.masks.red = read_le32(mask_bytes.data());
            desc.masks.green = read_le32(mask_bytes.data() + 4);
            desc.masks.blue = read_le32(mask_bytes.data() + 8);
            desc.masks.alpha = with_alpha ? read_le32(mask_bytes.data() + 12) : 0;
        }
        validate_masks(desc.masks, desc.bits_per_pixel);
    } else if (desc.bits_per_pixel == 16) {
        // Default 16-bit format: 5-5-5
        desc.masks = {0x7C00, 0x03E0, 0x001F, 0};
    } else if (desc.bits_per_pixel == 32) {
        // Default 32-bit format: 8-8-8, alpha only if the header declares it
        const std::uint32_t alpha = desc.masks.alpha == 0xFF000000u ? desc.masks.alpha : 0;
        desc.masks = {0x00FF0000, 0x0000FF00, 0x000000FF, alpha};
    } else {
        desc.masks = {};
    }

    // Palette size
    if (desc.is_indexed()) {
        const std::uint32_t max_colors = 1u << desc.bits_per_pixel;
        if (desc.variant == header_variant::core) {
            // OS/2 1.x has no colors_used field - calculate from available space
            const std::uint64_t palette_start = FILE_HEADER_SIZE + CORE_HEADER_SIZE;
            const std::uint64_t palette_bytes = desc.data_offset > palette_start ?
                                                desc.data_offset - palette_start : 0;
            colors_used = static_cast<std::uint32_t>(
                std::min<std::uint64_t>(palette_bytes / 3, max_colors));
            if (colors_used == 0) {
                throw_format("Missing color table");
            }
        } else if (colors_used == 0 || colors_used > max_colors) {
            colors_used = max_colors;
        }
        desc.palette_size = colors_used;
    }

    check_pixel_budget(desc, options);
    return info;
}

std::vector<palette_entry> read_palette(source_reader& in, const bmp_header_info& header) {
    const image_descriptor& desc = header.descriptor;
    if (!desc.is_indexed()) {
        return {};
    }

    const std::size_t entry_size = static_cast<std::size_t>(header.palette_entry_size);
    std::vector<std::uint8_t> raw(desc.palette_size * entry_size);
    in.read_exact(raw, "color table");

    std::vector<palette_entry> palette(desc.palette_size);
    for (std::size_t i = 0; i < palette.size(); i++) {
        const std::uint8_t* p = raw.data() + i * entry_size;
        palette[i].blue = p[0];   // BGR -> RGB order
        palette[i].green = p[1];
        palette[i].red = p[2];
        palette[i].reserved = entry_size == 4 ? p[3] : 0;
    }
    return palette;
}

pixel_format output_format(const image_descriptor& desc, const decode_options& options) noexcept {
    if (desc.is_indexed()) {
        return options.keep_indices ? pixel_format::indexed8 : pixel_format::rgb888;
    }
    return desc.has_alpha() ? pixel_format::rgba8888 : pixel_format::rgb888;
}

} // namespace winbmp
