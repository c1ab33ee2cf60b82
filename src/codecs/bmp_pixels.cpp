#include "bmp_pixels.hpp"
#include "bmp_error.hpp"
#include "byte_io.hpp"

namespace winbmp {

namespace {

// Overloaded-lambda helper for std::visit
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void decode_indexed(const indexed_rows& dec, const std::uint8_t* src, int width, std::uint8_t* dst) {
    const std::size_t palette_size = dec.palette.size();

    for (int x = 0; x < width; x++) {
        const std::uint8_t index = extract_pixel(src, x, dec.bits_per_pixel);
        if (index >= palette_size) {
            throw_format("Palette index " + std::to_string(index) +
                         " exceeds palette size " + std::to_string(palette_size));
        }

        const auto i = static_cast<std::size_t>(x);
        if (dec.keep_indices) {
            dst[i] = index;
        } else {
            const palette_entry& color = dec.palette[index];
            dst[i * 3 + 0] = color.red;
            dst[i * 3 + 1] = color.green;
            dst[i * 3 + 2] = color.blue;
        }
    }
}

void decode_bitfields(const bitfield_rows& dec, const std::uint8_t* src, int width, std::uint8_t* dst) {
    const std::size_t out_bpp = dec.with_alpha ? 4 : 3;

    for (int x = 0; x < width; x++) {
        const std::uint8_t* p = src + static_cast<std::size_t>(x) * dec.bytes_per_pixel;
        const std::uint32_t pixel = dec.bytes_per_pixel == 2 ? read_le16(p) : read_le32(p);

        std::uint8_t* out = dst + static_cast<std::size_t>(x) * out_bpp;
        out[0] = dec.red.extract(pixel);
        out[1] = dec.green.extract(pixel);
        out[2] = dec.blue.extract(pixel);
        if (dec.with_alpha) {
            out[3] = dec.alpha.extract(pixel);
        }
    }
}

void decode_bgr24(const std::uint8_t* src, int width, std::uint8_t* dst) {
    const auto count = static_cast<std::size_t>(width);
    for (std::size_t x = 0; x < count; x++) {
        dst[x * 3 + 0] = src[x * 3 + 2];  // R
        dst[x * 3 + 1] = src[x * 3 + 1];  // G
        dst[x * 3 + 2] = src[x * 3 + 0];  // B
    }
}

} // namespace

row_decoder select_row_decoder(const image_descriptor& desc,
                               std::span<const palette_entry> palette,
                               const decode_options& options) {
    switch (desc.bits_per_pixel) {
        case 1:
        case 4:
        case 8:
            return indexed_rows{desc.bits_per_pixel, palette, options.keep_indices};
        case 24:
            return bgr24_rows{};
        default:
            break;
    }

    // 16 and 32 bpp: BI_RGB defaults have already been folded into the masks
    bitfield_rows rows;
    rows.bytes_per_pixel = desc.bits_per_pixel / 8;
    rows.red = channel_mask::from_mask(desc.masks.red);
    rows.green = channel_mask::from_mask(desc.masks.green);
    rows.blue = channel_mask::from_mask(desc.masks.blue);
    rows.alpha = channel_mask::from_mask(desc.masks.alpha);
    rows.with_alpha = desc.has_alpha();
    return rows;
}

void decode_row(const row_decoder& dec, const std::uint8_t* src, int width, std::uint8_t* dst) {
    std::visit(overloaded{
        [&](const indexed_rows& d) { decode_indexed(d, src, width, dst); },
        [&](const bitfield_rows& d) { decode_bitfields(d, src, width, dst); },
        [&](const bgr24_rows&) { decode_bgr24(src, width, dst); }
    }, dec);
}

} // namespace winbmp
