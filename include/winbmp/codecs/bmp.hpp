#ifndef WINBMP_CODECS_BMP_HPP_
#define WINBMP_CODECS_BMP_HPP_

#include <winbmp/winbmp_export.h>
#include <winbmp/types.hpp>
#include <winbmp/pixel_buffer.hpp>
#include <winbmp/stream.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace winbmp {

// ============================================================================
// BMP/DIB Decoder
// ============================================================================

class WINBMP_EXPORT bmp_decoder {
public:
    static constexpr std::string_view name = "bmp";
    static constexpr std::string_view extensions[] = {".bmp", ".dib"};

    /**
     * Check if data appears to be a BMP file.
     * @param data Raw file data
     * @return true if the signature matches BMP format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Parse and validate the headers without decoding pixels.
     * @param src Byte source positioned at the start of the BMP stream
     * @param desc Receives the descriptor on success
     * @param options Decode options (limits are enforced here as well)
     * @return Decode result with success/error status
     */
    [[nodiscard]] static codec_result read_descriptor(byte_source& src,
                                                      image_descriptor& desc,
                                                      const decode_options& options = {});

    /**
     * Decode a BMP stream into a pixel buffer.
     * Supports:
     *   - BITMAPCOREHEADER (OS/2 1.x), BITMAPINFOHEADER and V2-V5, OS/2 2.x
     *   - 1, 4, 8, 16, 24, and 32-bit color depths
     *   - RLE4 and RLE8 compression
     *   - BI_BITFIELDS and BI_ALPHABITFIELDS for 16-bit and 32-bit images
     *   - Top-down and bottom-up images
     *
     * The output is left untouched unless decoding succeeds.
     *
     * @param src Byte source positioned at the start of the BMP stream
     * @param out Destination image (descriptor and pixels)
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static codec_result decode(byte_source& src,
                                             image& out,
                                             const decode_options& options = {});

    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data,
                                             image& out,
                                             const decode_options& options = {});
};

/**
 * Expand an RLE4 or RLE8 pixel stream.
 * Produces width * height palette indices in stored row order (the first
 * row is the bottom row of a bottom-up bitmap). Pixels skipped by
 * end-of-line or delta codes are 0.
 * @param src Byte source positioned at the first RLE byte
 * @param kind compression_kind::rle4 or compression_kind::rle8
 * @param width Pixels per row
 * @param height Number of rows
 * @param indices Receives the indices on success
 */
[[nodiscard]] WINBMP_EXPORT codec_result rle_decompress(byte_source& src,
                                                        compression_kind kind,
                                                        int width,
                                                        int height,
                                                        std::vector<std::uint8_t>& indices);

/**
 * Decode a BMP file from disk.
 */
[[nodiscard]] WINBMP_EXPORT codec_result load_bmp(const std::filesystem::path& path,
                                                  image& out,
                                                  const decode_options& options = {});

// ============================================================================
// BMP Encoder
// ============================================================================

/**
 * Writes uncompressed BMP streams.
 *
 * Output is always uncompressed (BI_RGB, or BI_BITFIELDS for 32-bit images
 * with alpha), even for images that were decoded from RLE data. Emitting RLE
 * is left out of this library on purpose; the format itself allows it.
 *
 * Header choice:
 *   - BITMAPINFOHEADER for every depth without alpha
 *   - BITMAPV4HEADER for 32-bit output of rgba8888 buffers
 */
class WINBMP_EXPORT bmp_encoder {
public:
    /**
     * Encode a pixel buffer.
     * Nothing is written to the sink when validation fails.
     * @param pixels Source image
     * @param sink Destination
     * @param options Target depth, orientation and palette
     * @return Encode result with success/error status
     */
    [[nodiscard]] static codec_result encode(const pixel_buffer& pixels,
                                             byte_sink& sink,
                                             const encode_options& options = {});

    [[nodiscard]] static codec_result encode(const pixel_buffer& pixels,
                                             std::vector<std::uint8_t>& out,
                                             const encode_options& options = {});
};

/**
 * Save a pixel buffer to a BMP file.
 */
[[nodiscard]] WINBMP_EXPORT codec_result save_bmp(const pixel_buffer& pixels,
                                                  const std::filesystem::path& path,
                                                  const encode_options& options = {});

} // namespace winbmp

#endif // WINBMP_CODECS_BMP_HPP_
