#include <winbmp/codecs/bmp.hpp>

#include "bmp_error.hpp"
#include "bmp_format.hpp"
#include "bmp_pixels.hpp"
#include "decode_helpers.hpp"

#include <fstream>
#include <new>
#include <optional>
#include <utility>
#include <vector>

namespace winbmp {

namespace {

// Position the reader at the pixel data, checking that the stored rows can
// exist before anything proportional to the image size is allocated.
void seek_to_pixels(source_reader& in, const image_descriptor& desc, std::size_t stride) {
    if (desc.data_offset < in.tell()) {
        throw_format("Pixel data offset points inside the headers");
    }

    // Sources without a known length are bounded by the declared file size
    std::optional<std::uint64_t> total = in.size();
    if (!total && desc.file_size != 0) {
        total = desc.file_size;
    }
    if (total && desc.data_offset >= *total) {
        throw_format("Pixel data offset is past the end of the file");
    }

    if (total && desc.compression != compression_kind::rle4 &&
        desc.compression != compression_kind::rle8) {
        const auto needed = checked_mul(stride, static_cast<std::uint64_t>(desc.rows()));
        if (!needed || *needed > *total - desc.data_offset) {
            throw_format("Pixel data is truncated");
        }
    }

    in.seek(desc.data_offset);
}

void decode_pixels(source_reader& in,
                   const image_descriptor& desc,
                   std::span<const palette_entry> palette,
                   const decode_options& options,
                   pixel_buffer& pixels) {
    const scanline_assembler rows(desc.width, desc.rows(), desc.bits_per_pixel, desc.top_down);
    seek_to_pixels(in, desc, rows.stride());

    if (!pixels.set_size(desc.width, desc.rows(), output_format(desc, options))) {
        throw_format("Failed to allocate pixel buffer");
    }

    if (desc.compression == compression_kind::rle4 || desc.compression == compression_kind::rle8) {
        const std::size_t width = static_cast<std::size_t>(desc.width);
        std::vector<std::uint8_t> indices(width * static_cast<std::size_t>(desc.rows()), 0);
        expand_rle(in, desc.compression, desc.width, desc.rows(), indices);

        // RLE output holds one index per byte
        const row_decoder decoder = indexed_rows{8, palette, options.keep_indices};
        for (int r = 0; r < rows.rows(); r++) {
            decode_row(decoder, indices.data() + static_cast<std::size_t>(r) * width,
                       desc.width, pixels.mutable_row(rows.buffer_row(r)).data());
        }
        return;
    }

    const row_decoder decoder = select_row_decoder(desc, palette, options);
    std::vector<std::uint8_t> scanline(rows.stride());
    for (int r = 0; r < rows.rows(); r++) {
        in.read_exact(scanline, "pixel data");
        decode_row(decoder, scanline.data(), desc.width, pixels.mutable_row(rows.buffer_row(r)).data());
    }
}

} // namespace

bool bmp_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 2) {
        return false;
    }
    return data[0] == BMP_SIGNATURE[0] && data[1] == BMP_SIGNATURE[1];
}

codec_result bmp_decoder::read_descriptor(byte_source& src,
                                          image_descriptor& desc,
                                          const decode_options& options) {
    try {
        source_reader in(src);
        desc = parse_headers(in, options).descriptor;
        return codec_result::success();
    } catch (const codec_exception& e) {
        return codec_result::failure(e.kind(), e.what());
    }
}

codec_result bmp_decoder::decode(byte_source& src,
                                 image& out,
                                 const decode_options& options) {
    try {
        source_reader in(src);
        const bmp_header_info header = parse_headers(in, options);
        std::vector<palette_entry> palette = read_palette(in, header);

        pixel_buffer pixels;
        decode_pixels(in, header.descriptor, palette, options, pixels);
        if (pixels.format() == pixel_format::indexed8) {
            pixels.set_palette(std::move(palette));
        }

        out.descriptor = header.descriptor;
        out.pixels = std::move(pixels);
        return codec_result::success();
    } catch (const codec_exception& e) {
        return codec_result::failure(e.kind(), e.what());
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::invalid_format, "Out of memory");
    }
}

codec_result bmp_decoder::decode(std::span<const std::uint8_t> data,
                                 image& out,
                                 const decode_options& options) {
    if (!sniff(data)) {
        return codec_result::failure(codec_error::invalid_format, "Not a valid BMP file");
    }

    memory_source src(data);
    return decode(src, out, options);
}

codec_result rle_decompress(byte_source& src,
                            compression_kind kind,
                            int width,
                            int height,
                            std::vector<std::uint8_t>& indices) {
    if (width < 0 || height < 0) {
        return codec_result::failure(codec_error::invalid_format, "Invalid RLE dimensions");
    }

    const auto count = checked_mul(static_cast<std::uint64_t>(width), static_cast<std::uint64_t>(height));
    if (!count || *count > DEFAULT_MAX_PIXEL_BYTES) {
        return codec_result::failure(codec_error::invalid_format, "RLE image exceeds the pixel buffer limit");
    }

    try {
        source_reader in(src);
        std::vector<std::uint8_t> expanded(static_cast<std::size_t>(*count), 0);
        expand_rle(in, kind, width, height, expanded);
        indices = std::move(expanded);
        return codec_result::success();
    } catch (const codec_exception& e) {
        return codec_result::failure(e.kind(), e.what());
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::invalid_format, "Out of memory");
    }
}

codec_result load_bmp(const std::filesystem::path& path,
                      image& out,
                      const decode_options& options) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return codec_result::failure(codec_error::io_error, "Failed to open " + path.string());
    }

    stream_source src(file);
    return bmp_decoder::decode(src, out, options);
}

} // namespace winbmp
