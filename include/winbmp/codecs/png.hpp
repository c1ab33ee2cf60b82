#ifndef WINBMP_CODECS_PNG_HPP_
#define WINBMP_CODECS_PNG_HPP_

#include <winbmp/winbmp_export.h>
#include <winbmp/types.hpp>
#include <winbmp/pixel_buffer.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace winbmp {

// ============================================================================
// PNG Bridge
// ============================================================================
//
// Reference renderings and the converter exchange images as PNG. These
// helpers only move pixel buffers in and out of lodepng.

class WINBMP_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png"};

    /**
     * Check if data appears to be a PNG file.
     * @param data Raw file data
     * @return true if the signature matches PNG format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PNG data into an rgba8888 pixel buffer.
     * @param data Raw file data
     * @param pixels Destination buffer
     * @param options Decode options (dimension limits)
     * @return Decode result with success/error status
     */
    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data,
                                             pixel_buffer& pixels,
                                             const decode_options& options = {});
};

/**
 * Encode a pixel buffer to PNG format.
 * @param pixels Source buffer
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] WINBMP_EXPORT std::vector<std::uint8_t> encode_png(const pixel_buffer& pixels);

/**
 * Save a pixel buffer to a PNG file.
 * @param pixels Source buffer
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] WINBMP_EXPORT bool save_png(const pixel_buffer& pixels,
                                          const std::filesystem::path& path);

} // namespace winbmp

#endif // WINBMP_CODECS_PNG_HPP_
