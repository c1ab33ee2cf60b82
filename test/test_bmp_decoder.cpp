#include <doctest/doctest.h>
#include <winbmp/winbmp.hpp>

#include "helpers/bmp_builder.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

using test_helpers::bmp_builder;
using test_helpers::pixel_at;
using test_helpers::rgb;

namespace {

using bytes = std::vector<std::uint8_t>;

winbmp::image decode_ok(const bytes& data, const winbmp::decode_options& options = {}) {
    winbmp::image img;
    auto result = winbmp::decode(data, img, options);
    INFO("message: ", result.message);
    REQUIRE(result.ok);
    return img;
}

winbmp::codec_error decode_error_of(const bytes& data, const winbmp::decode_options& options = {}) {
    winbmp::image img;
    auto result = winbmp::decode(data, img, options);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.message.empty());
    return result.error;
}

// A source that cannot report its length
class sizeless_source : public winbmp::byte_source {
public:
    explicit sizeless_source(const bytes& data)
        : inner_(data) {}

    bool read(std::span<std::uint8_t> dst, std::size_t& bytes_read) override {
        return inner_.read(dst, bytes_read);
    }
    bool seek(std::uint64_t offset) override { return inner_.seek(offset); }
    [[nodiscard]] std::uint64_t tell() const override { return inner_.tell(); }

private:
    winbmp::memory_source inner_;
};

// Every pixel of an rgb888 buffer equals color
void check_solid(const winbmp::pixel_buffer& buf, const bytes& color) {
    for (int y = 0; y < buf.height(); y++) {
        for (int x = 0; x < buf.width(); x++) {
            CHECK(pixel_at(buf, x, y) == color);
        }
    }
}

} // namespace

TEST_CASE("BMP decoder: sniff") {
    SUBCASE("Valid BMP signature") {
        bytes data = {'B', 'M', 0x00, 0x00};
        CHECK(winbmp::bmp_decoder::sniff(data));
    }

    SUBCASE("Invalid signature") {
        bytes data = {'P', 'N', 'G', 0x00};
        CHECK_FALSE(winbmp::bmp_decoder::sniff(data));
    }

    SUBCASE("Too short") {
        bytes data = {'B'};
        CHECK_FALSE(winbmp::bmp_decoder::sniff(data));
    }
}

TEST_CASE("BMP decoder: solid images at every depth") {
    bmp_builder b;
    b.width = 3;
    b.height = 2;

    SUBCASE("1-bit") {
        b.bits_per_pixel = 1;
        b.palette = {rgb(0, 0, 0), rgb(255, 0, 0)};
        b.pixel_data = {0xE0, 0, 0, 0, 0xE0, 0, 0, 0};

        auto img = decode_ok(b.build());
        CHECK(img.pixels.format() == winbmp::pixel_format::rgb888);
        CHECK(img.pixels.width() == 3);
        CHECK(img.pixels.height() == 2);
        check_solid(img.pixels, {255, 0, 0});
    }

    SUBCASE("4-bit") {
        b.bits_per_pixel = 4;
        b.palette = {rgb(0, 0, 0), rgb(1, 2, 3), rgb(10, 20, 30)};
        b.pixel_data = {0x22, 0x20, 0, 0, 0x22, 0x20, 0, 0};

        auto img = decode_ok(b.build());
        check_solid(img.pixels, {10, 20, 30});
    }

    SUBCASE("8-bit") {
        b.bits_per_pixel = 8;
        b.palette = {rgb(0, 0, 0), rgb(0, 0, 0), rgb(0, 0, 0), rgb(0, 0, 0), rgb(0, 0, 0), rgb(7, 8, 9)};
        b.pixel_data = {5, 5, 5, 0, 5, 5, 5, 0};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.palette_size == 6);
        check_solid(img.pixels, {7, 8, 9});
    }

    SUBCASE("16-bit default 5-5-5") {
        b.bits_per_pixel = 16;
        // 0x7C00 = full red
        b.pixel_data = {0x00, 0x7C, 0x00, 0x7C, 0x00, 0x7C, 0, 0,
                        0x00, 0x7C, 0x00, 0x7C, 0x00, 0x7C, 0, 0};

        auto img = decode_ok(b.build());
        CHECK(img.pixels.format() == winbmp::pixel_format::rgb888);
        check_solid(img.pixels, {255, 0, 0});
    }

    SUBCASE("24-bit") {
        b.bits_per_pixel = 24;
        b.pixel_data = {0x10, 0x20, 0x30, 0x10, 0x20, 0x30, 0x10, 0x20, 0x30, 0, 0, 0,
                        0x10, 0x20, 0x30, 0x10, 0x20, 0x30, 0x10, 0x20, 0x30, 0, 0, 0};

        auto img = decode_ok(b.build());
        check_solid(img.pixels, {0x30, 0x20, 0x10});
    }

    SUBCASE("32-bit without alpha mask ignores the fourth byte") {
        b.bits_per_pixel = 32;
        for (int i = 0; i < 6; i++) {
            b.pixel_data.insert(b.pixel_data.end(), {0x10, 0x20, 0x30, 0x80});
        }

        auto img = decode_ok(b.build());
        CHECK(img.pixels.format() == winbmp::pixel_format::rgb888);
        check_solid(img.pixels, {0x30, 0x20, 0x10});
    }
}

TEST_CASE("BMP decoder: row orientation") {
    bmp_builder b;
    b.width = 1;
    b.height = 2;
    // Stored row 0 is blue, stored row 1 is red
    b.pixel_data = {0xFF, 0x00, 0x00, 0, 0x00, 0x00, 0xFF, 0};

    SUBCASE("Positive height is bottom-up") {
        auto img = decode_ok(b.build());
        CHECK_FALSE(img.descriptor.top_down);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{255, 0, 0});
        CHECK(pixel_at(img.pixels, 0, 1) == bytes{0, 0, 255});
    }

    SUBCASE("Negative height is top-down") {
        b.height = -2;
        auto img = decode_ok(b.build());
        CHECK(img.descriptor.top_down);
        CHECK(img.descriptor.rows() == 2);
        CHECK(img.pixels.height() == 2);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{0, 0, 255});
        CHECK(pixel_at(img.pixels, 0, 1) == bytes{255, 0, 0});
    }
}

TEST_CASE("BMP decoder: oversized headers are rejected before allocation") {
    // About 6 GB of pixels declared in a 54-byte file
    bmp_builder b;
    b.width = 65536;
    b.height = 32768;
    b.bits_per_pixel = 24;

    SUBCASE("Default dimension limits") {
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Byte ceiling alone") {
        winbmp::decode_options options;
        options.max_width = 1 << 20;
        options.max_height = 1 << 20;
        CHECK(decode_error_of(b.build(), options) == winbmp::codec_error::invalid_format);

        const auto data = b.build();
        winbmp::memory_source src(data);
        winbmp::image_descriptor desc;
        auto result = winbmp::bmp_decoder::read_descriptor(src, desc, options);
        CHECK(result.error == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Custom ceiling") {
        bmp_builder small;
        small.width = 10;
        small.height = 10;
        small.pixel_data.assign(10 * 32, 0);

        winbmp::decode_options options;
        options.max_pixel_bytes = 299;
        CHECK(decode_error_of(small.build(), options) == winbmp::codec_error::invalid_format);

        options.max_pixel_bytes = 300;
        decode_ok(small.build(), options);
    }
}

TEST_CASE("BMP decoder: indexed edge cases") {
    bmp_builder b;
    b.width = 2;
    b.height = 1;
    b.bits_per_pixel = 8;
    b.palette = {rgb(1, 1, 1), rgb(2, 2, 2)};

    SUBCASE("Index beyond the palette") {
        b.pixel_data = {0, 5, 0, 0};
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Keep indices") {
        b.pixel_data = {1, 0, 0, 0};
        winbmp::decode_options options;
        options.keep_indices = true;

        auto img = decode_ok(b.build(), options);
        REQUIRE(img.pixels.format() == winbmp::pixel_format::indexed8);
        CHECK(img.pixels.pixels()[0] == 1);
        CHECK(img.pixels.pixels()[1] == 0);
        REQUIRE(img.pixels.palette().size() == 2);
        CHECK(img.pixels.palette()[1] == rgb(2, 2, 2));
    }

    SUBCASE("Colors used of zero means the full table") {
        b.bits_per_pixel = 1;
        b.colors_used = 0;
        b.pixel_data = {0x40, 0, 0, 0};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.palette_size == 2);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{1, 1, 1});
        CHECK(pixel_at(img.pixels, 1, 0) == bytes{2, 2, 2});
    }
}

TEST_CASE("BMP decoder: bitfields") {
    SUBCASE("16-bit 5-6-5 scales by bit replication") {
        bmp_builder b;
        b.width = 2;
        b.bits_per_pixel = 16;
        b.compression = 3;
        b.trailing_masks = {0xF800, 0x07E0, 0x001F};
        // (31, 63, 0) and (16, 32, 31)
        b.pixel_data = {0xE0, 0xFF, 0x1F, 0x84};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.compression == winbmp::compression_kind::bitfields);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{255, 255, 0});
        CHECK(pixel_at(img.pixels, 1, 0) == bytes{132, 130, 255});
    }

    SUBCASE("32-bit with alpha mask in a V3 header") {
        bmp_builder b;
        b.header_size = 56;
        b.bits_per_pixel = 32;
        b.compression = 3;
        b.masks = {0x00FF0000, 0x0000FF00, 0x000000FF, 0xFF000000};
        b.pixel_data = {0x10, 0x20, 0x30, 0x40};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.variant == winbmp::header_variant::v3);
        REQUIRE(img.pixels.format() == winbmp::pixel_format::rgba8888);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{0x30, 0x20, 0x10, 0x40});
    }

    SUBCASE("Alpha bitfields after an info header") {
        bmp_builder b;
        b.bits_per_pixel = 32;
        b.compression = 6;
        b.trailing_masks = {0x000000FF, 0x0000FF00, 0x00FF0000, 0xFF000000};
        b.pixel_data = {0x10, 0x20, 0x30, 0x40};

        auto img = decode_ok(b.build());
        REQUIRE(img.pixels.format() == winbmp::pixel_format::rgba8888);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{0x10, 0x20, 0x30, 0x40});
    }

    SUBCASE("Overlapping masks") {
        bmp_builder b;
        b.bits_per_pixel = 16;
        b.compression = 3;
        b.trailing_masks = {0xF800, 0x0FE0, 0x001F};
        b.pixel_data = {0, 0, 0, 0};
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Bitfields on a 24-bit image") {
        bmp_builder b;
        b.bits_per_pixel = 24;
        b.compression = 3;
        b.trailing_masks = {0xFF0000, 0x00FF00, 0x0000FF};
        b.pixel_data = {0, 0, 0, 0};
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }
}

TEST_CASE("BMP decoder: header variants") {
    SUBCASE("OS/2 1.x core header") {
        bmp_builder b;
        b.header_size = 12;
        b.width = 2;
        b.bits_per_pixel = 8;
        b.palette = {rgb(9, 8, 7), rgb(1, 2, 3)};
        b.pixel_data = {1, 0, 0, 0};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.variant == winbmp::header_variant::core);
        CHECK(img.descriptor.palette_size == 2);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{1, 2, 3});
        CHECK(pixel_at(img.pixels, 1, 0) == bytes{9, 8, 7});
    }

    SUBCASE("OS/2 2.x header") {
        bmp_builder b;
        b.header_size = 64;
        b.bits_per_pixel = 4;
        b.palette = {rgb(0, 0, 0), rgb(50, 60, 70)};
        b.pixel_data = {0x10, 0, 0, 0};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.variant == winbmp::header_variant::os2_v2);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{50, 60, 70});
    }

    SUBCASE("V4 header with BI_RGB honours a declared alpha mask") {
        bmp_builder b;
        b.header_size = 108;
        b.bits_per_pixel = 32;
        b.masks = {0x00FF0000, 0x0000FF00, 0x000000FF, 0xFF000000};
        b.pixel_data = {1, 2, 3, 4};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.variant == winbmp::header_variant::v4);
        REQUIRE(img.pixels.format() == winbmp::pixel_format::rgba8888);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{3, 2, 1, 4});
    }

    SUBCASE("V5 header, 24-bit") {
        bmp_builder b;
        b.header_size = 124;
        b.pixel_data = {1, 2, 3, 0};

        auto img = decode_ok(b.build());
        CHECK(img.descriptor.variant == winbmp::header_variant::v5);
        CHECK(img.descriptor.header_size == 124);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{3, 2, 1});
    }

    SUBCASE("Unknown header size") {
        bmp_builder b;
        b.pixel_data = {0, 0, 0, 0};
        auto data = b.build();
        data[14] = 20;
        CHECK(decode_error_of(data) == winbmp::codec_error::unsupported);
    }
}

TEST_CASE("BMP decoder: rejected variants") {
    bmp_builder b;
    b.pixel_data = {0, 0, 0, 0};

    SUBCASE("Embedded JPEG") {
        b.compression = 4;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::unsupported);
    }

    SUBCASE("Embedded PNG") {
        b.compression = 5;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::unsupported);
    }

    SUBCASE("OS/2 Huffman") {
        b.header_size = 64;
        b.bits_per_pixel = 1;
        b.compression = 3;
        b.palette = {rgb(0, 0, 0), rgb(255, 255, 255)};
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::unsupported);
    }

    SUBCASE("2 bits per pixel") {
        b.bits_per_pixel = 2;
        b.palette = {rgb(0, 0, 0), rgb(1, 1, 1), rgb(2, 2, 2), rgb(3, 3, 3)};
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::unsupported);
    }

    SUBCASE("Invalid bit depth") {
        b.bits_per_pixel = 7;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Unknown compression") {
        b.compression = 9;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("RLE8 on a 24-bit image") {
        b.compression = 1;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Top-down RLE") {
        b.bits_per_pixel = 8;
        b.compression = 1;
        b.height = -1;
        b.palette = {rgb(0, 0, 0)};
        b.pixel_data = {1, 0, 0, 1};
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Zero width") {
        b.width = 0;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Zero height") {
        b.height = 0;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Bad signature") {
        auto data = b.build();
        data[0] = 'X';
        CHECK(decode_error_of(data) == winbmp::codec_error::invalid_format);
    }
}

TEST_CASE("BMP decoder: truncated and corrupt files") {
    bmp_builder b;
    b.width = 2;
    b.height = 2;
    b.pixel_data.assign(16, 0x40);

    SUBCASE("Missing pixel rows") {
        auto data = b.build();
        data.resize(data.size() - 4);
        CHECK(decode_error_of(data) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Truncated information header") {
        auto data = b.build();
        data.resize(30);
        CHECK(decode_error_of(data) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Truncated color table") {
        bmp_builder indexed;
        indexed.bits_per_pixel = 8;
        indexed.colors_used = 200;
        indexed.palette = {rgb(0, 0, 0)};
        auto data = indexed.build();
        CHECK(decode_error_of(data) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Data offset inside the headers") {
        b.data_offset = 20;
        CHECK(decode_error_of(b.build()) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Data offset past the end") {
        b.data_offset = 5000;
        b.pixel_data.clear();
        auto data = b.build();
        data.resize(100);
        CHECK(decode_error_of(data) == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Failed decode leaves the destination untouched") {
        auto data = b.build();
        data.resize(data.size() - 4);

        winbmp::image img;
        REQUIRE(img.pixels.set_size(5, 5, winbmp::pixel_format::rgba8888));
        auto result = winbmp::decode(data, img);
        CHECK_FALSE(result.ok);
        CHECK(img.pixels.width() == 5);
        CHECK(img.pixels.format() == winbmp::pixel_format::rgba8888);
    }
}

TEST_CASE("BMP decoder: transport failures") {
    SUBCASE("Failing source") {
        test_helpers::failing_source src;
        winbmp::image img;
        auto result = winbmp::decode(src, img);
        CHECK_FALSE(result.ok);
        CHECK(result.error == winbmp::codec_error::io_error);
    }

    SUBCASE("Missing file") {
        winbmp::image img;
        auto result = winbmp::load_bmp(std::filesystem::temp_directory_path() / "winbmp_missing_file.bmp", img);
        CHECK(result.error == winbmp::codec_error::io_error);
    }
}

TEST_CASE("BMP decoder: read_descriptor") {
    bmp_builder b;
    b.width = 7;
    b.height = -3;
    b.bits_per_pixel = 4;
    b.palette = {rgb(0, 0, 0), rgb(1, 1, 1), rgb(2, 2, 2)};

    const auto data = b.build();
    winbmp::memory_source src(data);
    winbmp::image_descriptor desc;
    auto result = winbmp::bmp_decoder::read_descriptor(src, desc);
    REQUIRE(result.ok);

    CHECK(desc.variant == winbmp::header_variant::info);
    CHECK(desc.width == 7);
    CHECK(desc.height == -3);
    CHECK(desc.rows() == 3);
    CHECK(desc.top_down);
    CHECK(desc.bits_per_pixel == 4);
    CHECK(desc.compression == winbmp::compression_kind::none);
    CHECK(desc.palette_size == 3);
    CHECK(desc.is_indexed());
    CHECK(desc.data_offset == 14 + 40 + 3 * 4);
}

TEST_CASE("BMP decoder: to_string") {
    CHECK(std::string(winbmp::to_string(winbmp::codec_error::invalid_format)) == "invalid_format");
    CHECK(std::string(winbmp::to_string(winbmp::codec_error::unsupported)) == "unsupported");
    CHECK(std::string(winbmp::to_string(winbmp::codec_error::io_error)) == "io_error");
    CHECK(std::string(winbmp::to_string(winbmp::compression_kind::rle4)) == "rle4");
    CHECK(std::string(winbmp::to_string(winbmp::header_variant::core)) == "BITMAPCOREHEADER");
}

TEST_CASE("BMP decoder: declared file size bounds sources of unknown length") {
    SUBCASE("Huge dimensions with no pixel data") {
        bmp_builder b;
        b.width = 16384;
        b.height = 16384;
        b.pixel_data = {0, 0, 0, 0};
        const auto data = b.build();
        REQUIRE(data.size() == 58);

        sizeless_source src(data);
        winbmp::image img;
        auto result = winbmp::decode(src, img);
        CHECK(result.error == winbmp::codec_error::invalid_format);
        CHECK(result.message == "Pixel data is truncated");
    }

    SUBCASE("Data offset beyond the declared size") {
        bmp_builder b;
        b.pixel_data = {1, 2, 3, 0};
        auto data = b.build();
        test_helpers::put_le32(data, 2, 54);

        sizeless_source src(data);
        winbmp::image img;
        CHECK(winbmp::decode(src, img).error == winbmp::codec_error::invalid_format);
    }

    SUBCASE("Complete file decodes") {
        bmp_builder b;
        b.width = 2;
        b.pixel_data = {1, 2, 3, 4, 5, 6, 0, 0};
        const auto data = b.build();

        sizeless_source src(data);
        winbmp::image img;
        REQUIRE(winbmp::decode(src, img).ok);
        CHECK(pixel_at(img.pixels, 1, 0) == bytes{6, 5, 4});
    }

    SUBCASE("A zero file size leaves the stream unbounded") {
        bmp_builder b;
        b.pixel_data = {1, 2, 3, 0};
        auto data = b.build();
        test_helpers::put_le32(data, 2, 0);

        sizeless_source src(data);
        winbmp::image img;
        REQUIRE(winbmp::decode(src, img).ok);
        CHECK(pixel_at(img.pixels, 0, 0) == bytes{3, 2, 1});
    }
}
