#include <winbmp/winbmp.hpp>

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <input_file> [output_file]\n";
    std::cerr << "Converts BMP to PNG, or PNG to BMP.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -i, --info     Print the BMP headers and exit\n";
    std::cerr << "  -b, --bpp N    BMP output depth (1, 4, 8, 16, 24, 32)\n";
    std::cerr << "  -h, --help     Show this help\n";
}

void print_descriptor(const winbmp::image_descriptor& desc) {
    std::cout << "Header:      " << winbmp::to_string(desc.variant) << " (" << desc.header_size << " bytes)\n";
    std::cout << "File size:   " << desc.file_size << "\n";
    std::cout << "Data offset: " << desc.data_offset << "\n";
    std::cout << "Dimensions:  " << desc.width << "x" << desc.rows()
              << (desc.top_down ? " (top-down)" : " (bottom-up)") << "\n";
    std::cout << "Bit depth:   " << desc.bits_per_pixel << "\n";
    std::cout << "Compression: " << winbmp::to_string(desc.compression) << "\n";
    if (desc.is_indexed()) {
        std::cout << "Palette:     " << desc.palette_size << " entries\n";
    }
    if (desc.compression == winbmp::compression_kind::bitfields || desc.bits_per_pixel >= 16) {
        std::cout << std::hex
                  << "Masks:       R=0x" << desc.masks.red
                  << " G=0x" << desc.masks.green
                  << " B=0x" << desc.masks.blue
                  << " A=0x" << desc.masks.alpha
                  << std::dec << "\n";
    }
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

bool has_extension(const std::filesystem::path& path, std::string_view ext) {
    std::string actual = path.extension().string();
    for (auto& c : actual) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return actual == ext;
}

} // namespace

int main(int argc, char* argv[]) {
    bool info_only = false;
    winbmp::encode_options encode_opts;
    std::vector<std::filesystem::path> paths;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-i") == 0 || std::strcmp(argv[i], "--info") == 0) {
            info_only = true;
        } else if (std::strcmp(argv[i], "-b") == 0 || std::strcmp(argv[i], "--bpp") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " needs a value\n";
                return 1;
            }
            encode_opts.bits_per_pixel = std::atoi(argv[++i]);
        } else {
            paths.emplace_back(argv[i]);
        }
    }

    if (paths.empty() || paths.size() > 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path& input_path = paths[0];

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    winbmp::pixel_buffer pixels;
    bool from_bmp = false;

    if (winbmp::bmp_decoder::sniff(data)) {
        from_bmp = true;
        std::cout << "Detected format: " << winbmp::bmp_decoder::name << "\n";

        if (info_only) {
            winbmp::memory_source src(data);
            winbmp::image_descriptor desc;
            auto result = winbmp::bmp_decoder::read_descriptor(src, desc);
            if (!result) {
                std::cerr << "Error: " << winbmp::to_string(result.error) << ": " << result.message << "\n";
                return 1;
            }
            print_descriptor(desc);
            return 0;
        }

        // Indexed output depths re-pack the stored indices
        winbmp::decode_options decode_opts;
        decode_opts.keep_indices = encode_opts.bits_per_pixel > 0 && encode_opts.bits_per_pixel <= 8;

        winbmp::image img;
        auto result = winbmp::decode(std::span<const std::uint8_t>(data), img, decode_opts);
        if (!result) {
            std::cerr << "Error: Failed to decode: " << winbmp::to_string(result.error)
                      << ": " << result.message << "\n";
            return 1;
        }
        pixels = std::move(img.pixels);
    } else if (winbmp::png_decoder::sniff(data)) {
        std::cout << "Detected format: " << winbmp::png_decoder::name << "\n";
        if (info_only) {
            std::cerr << "Error: --info only reads BMP files\n";
            return 1;
        }

        auto result = winbmp::png_decoder::decode(data, pixels);
        if (!result) {
            std::cerr << "Error: Failed to decode: " << result.message << "\n";
            return 1;
        }
    } else {
        std::cerr << "Error: Unknown image format: " << input_path << "\n";
        return 1;
    }

    std::cout << "Decoded: " << pixels.width() << "x" << pixels.height() << "\n";

    // Second argument is the output path; otherwise swap the container
    std::filesystem::path output_path;
    if (paths.size() == 2) {
        output_path = paths[1];
    } else {
        output_path = input_path;
        output_path.replace_extension(from_bmp ? ".png" : ".bmp");
    }

    if (has_extension(output_path, ".png")) {
        if (!winbmp::save_png(pixels, output_path)) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            return 1;
        }
    } else {
        auto result = winbmp::save_bmp(pixels, output_path, encode_opts);
        if (!result) {
            std::cerr << "Error: Failed to save: " << output_path << ": " << result.message << "\n";
            return 1;
        }
    }

    std::cout << "Saved: " << output_path << "\n";

    return 0;
}
