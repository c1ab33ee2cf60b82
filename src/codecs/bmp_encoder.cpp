#include <winbmp/codecs/bmp.hpp>
#include <winbmp/palettes.hpp>

#include "bmp_error.hpp"
#include "bmp_format.hpp"
#include "bmp_pixels.hpp"
#include "byte_io.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <new>
#include <vector>

namespace winbmp {

namespace {

struct encode_plan {
    int bits_per_pixel = 24;
    bool indexed = false;
    bool with_alpha = false;
    std::uint32_t header_size = INFO_HEADER_SIZE;
    std::vector<palette_entry> palette;     // written color table (indexed targets)
    std::span<const palette_entry> lookup;  // resolves indexed8 sources for direct targets
    std::size_t stride = 0;
    std::uint32_t data_offset = 0;
    std::uint32_t image_size = 0;
    std::uint32_t file_size = 0;
};

int default_depth(pixel_format format) {
    switch (format) {
        case pixel_format::indexed8: return 8;
        case pixel_format::rgb888:   return 24;
        case pixel_format::rgba8888: return 32;
    }
    return 24;
}

void check_indices(const pixel_buffer& pixels, std::size_t palette_size) {
    for (std::uint8_t index : pixels.pixels()) {
        if (index >= palette_size) {
            throw_format("Pixel index " + std::to_string(index) +
                         " exceeds palette size " + std::to_string(palette_size));
        }
    }
}

encode_plan plan_encoding(const pixel_buffer& pixels, const encode_options& options) {
    if (pixels.empty() || pixels.width() <= 0 || pixels.height() <= 0) {
        throw_format("Pixel buffer is empty");
    }

    encode_plan plan;
    plan.bits_per_pixel = options.bits_per_pixel != 0 ? options.bits_per_pixel : default_depth(pixels.format());

    switch (plan.bits_per_pixel) {
        case 1:
        case 4:
        case 8:
            plan.indexed = true;
            break;
        case 16:
        case 24:
        case 32:
            break;
        default:
            throw_format("Unsupported target bit depth " + std::to_string(plan.bits_per_pixel));
    }

    if (plan.indexed) {
        if (pixels.format() != pixel_format::indexed8) {
            throw_format("Indexed bit depths require indexed pixel data");
        }
        if (!options.palette.empty()) {
            plan.palette = options.palette;
        } else if (!pixels.palette().empty()) {
            plan.palette.assign(pixels.palette().begin(), pixels.palette().end());
        } else {
            plan.palette = grayscale_palette(plan.bits_per_pixel);
        }
        if (plan.palette.size() > (std::size_t{1} << plan.bits_per_pixel)) {
            throw_format("Palette has more entries than the bit depth can address");
        }
        check_indices(pixels, plan.palette.size());
    } else if (pixels.format() == pixel_format::indexed8) {
        plan.lookup = options.palette.empty() ? pixels.palette() : std::span<const palette_entry>(options.palette);
        if (plan.lookup.empty()) {
            throw_format("Indexed pixel data has no palette");
        }
        check_indices(pixels, plan.lookup.size());
    }

    plan.with_alpha = plan.bits_per_pixel == 32 && pixels.format() == pixel_format::rgba8888;
    plan.header_size = plan.with_alpha ? V4_HEADER_SIZE : INFO_HEADER_SIZE;
    plan.stride = row_stride_4byte(pixels.width(), plan.bits_per_pixel);

    const std::uint64_t image_size = static_cast<std::uint64_t>(plan.stride) *
                                     static_cast<std::uint64_t>(pixels.height());
    const std::uint64_t data_offset = FILE_HEADER_SIZE + plan.header_size + plan.palette.size() * 4;
    const std::uint64_t file_size = data_offset + image_size;
    if (file_size > std::numeric_limits<std::uint32_t>::max()) {
        throw_format("Image is too large for a BMP file");
    }

    plan.image_size = static_cast<std::uint32_t>(image_size);
    plan.data_offset = static_cast<std::uint32_t>(data_offset);
    plan.file_size = static_cast<std::uint32_t>(file_size);
    return plan;
}

std::vector<std::uint8_t> build_headers(const pixel_buffer& pixels,
                                        const encode_plan& plan,
                                        const encode_options& options) {
    std::vector<std::uint8_t> out(plan.data_offset, 0);
    std::uint8_t* p = out.data();

    // File header
    p[0] = BMP_SIGNATURE[0];
    p[1] = BMP_SIGNATURE[1];
    write_le32(p + 2, plan.file_size);
    write_le32(p + 10, plan.data_offset);

    // Info header
    std::uint8_t* h = p + FILE_HEADER_SIZE;
    write_le32(h, plan.header_size);
    write_le32_signed(h + 4, pixels.width());
    write_le32_signed(h + 8, options.top_down ? -pixels.height() : pixels.height());
    write_le16(h + 12, 1);
    write_le16(h + 14, static_cast<std::uint16_t>(plan.bits_per_pixel));
    write_le32(h + 16, plan.with_alpha ? BI_BITFIELDS : BI_RGB);
    write_le32(h + 20, plan.image_size);
    write_le32_signed(h + 24, DEFAULT_PIXELS_PER_METER);
    write_le32_signed(h + 28, DEFAULT_PIXELS_PER_METER);
    write_le32(h + 32, static_cast<std::uint32_t>(plan.palette.size()));
    write_le32(h + 36, 0);

    if (plan.with_alpha) {
        write_le32(h + 40, 0x00FF0000);
        write_le32(h + 44, 0x0000FF00);
        write_le32(h + 48, 0x000000FF);
        write_le32(h + 52, 0xFF000000);
        write_le32(h + 56, LCS_WINDOWS_COLOR_SPACE);
    }

    // Color table
    std::uint8_t* pal = h + plan.header_size;
    for (const palette_entry& color : plan.palette) {
        pal[0] = color.blue;
        pal[1] = color.green;
        pal[2] = color.red;
        pal[3] = 0;
        pal += 4;
    }

    return out;
}

struct rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0xFF;
};

rgba fetch(const pixel_buffer& pixels, std::span<const std::uint8_t> row, int x,
           std::span<const palette_entry> lookup) {
    switch (pixels.format()) {
        case pixel_format::indexed8: {
            const palette_entry& color = lookup[row[static_cast<std::size_t>(x)]];
            return {color.red, color.green, color.blue, 0xFF};
        }
        case pixel_format::rgb888: {
            const std::size_t i = static_cast<std::size_t>(x) * 3;
            return {row[i], row[i + 1], row[i + 2], 0xFF};
        }
        case pixel_format::rgba8888: {
            const std::size_t i = static_cast<std::size_t>(x) * 4;
            return {row[i], row[i + 1], row[i + 2], row[i + 3]};
        }
    }
    return {};
}

void encode_row(const pixel_buffer& pixels, const encode_plan& plan,
                std::span<const std::uint8_t> row, std::uint8_t* dst) {
    const int width = pixels.width();

    if (plan.indexed) {
        for (int x = 0; x < width; x++) {
            store_pixel(dst, x, plan.bits_per_pixel, row[static_cast<std::size_t>(x)]);
        }
        return;
    }

    for (int x = 0; x < width; x++) {
        const rgba c = fetch(pixels, row, x, plan.lookup);
        const auto i = static_cast<std::size_t>(x);
        switch (plan.bits_per_pixel) {
            case 16: {
                // 5-5-5, low bits truncated
                const auto v = static_cast<std::uint16_t>(((c.r >> 3) << 10) | ((c.g >> 3) << 5) | (c.b >> 3));
                write_le16(dst + i * 2, v);
                break;
            }
            case 24:
                dst[i * 3 + 0] = c.b;
                dst[i * 3 + 1] = c.g;
                dst[i * 3 + 2] = c.r;
                break;
            case 32:
                dst[i * 4 + 0] = c.b;
                dst[i * 4 + 1] = c.g;
                dst[i * 4 + 2] = c.r;
                dst[i * 4 + 3] = plan.with_alpha ? c.a : 0;
                break;
            default:
                break;
        }
    }
}

void write_bytes(byte_sink& sink, std::span<const std::uint8_t> bytes) {
    if (!sink.write(bytes)) {
        throw_io("Write failed");
    }
}

} // namespace

codec_result bmp_encoder::encode(const pixel_buffer& pixels,
                                 byte_sink& sink,
                                 const encode_options& options) {
    try {
        const encode_plan plan = plan_encoding(pixels, options);
        write_bytes(sink, build_headers(pixels, plan, options));

        const scanline_assembler rows(pixels.width(), pixels.height(), plan.bits_per_pixel, options.top_down);
        std::vector<std::uint8_t> scanline(rows.stride());
        for (int r = 0; r < rows.rows(); r++) {
            std::fill(scanline.begin(), scanline.end(), 0);
            encode_row(pixels, plan, pixels.row(rows.buffer_row(r)), scanline.data());
            write_bytes(sink, scanline);
        }

        return codec_result::success();
    } catch (const codec_exception& e) {
        return codec_result::failure(e.kind(), e.what());
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::invalid_format, "Out of memory");
    }
}

codec_result bmp_encoder::encode(const pixel_buffer& pixels,
                                 std::vector<std::uint8_t>& out,
                                 const encode_options& options) {
    memory_sink sink;
    auto result = encode(pixels, sink, options);
    if (result) {
        out = sink.release();
    }
    return result;
}

codec_result save_bmp(const pixel_buffer& pixels,
                      const std::filesystem::path& path,
                      const encode_options& options) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return codec_result::failure(codec_error::io_error, "Failed to open " + path.string());
    }

    stream_sink sink(file);
    auto result = bmp_encoder::encode(pixels, sink, options);
    if (result) {
        file.flush();
        if (!file.good()) {
            return codec_result::failure(codec_error::io_error, "Failed to write " + path.string());
        }
    }
    return result;
}

} // namespace winbmp
