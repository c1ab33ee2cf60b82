#ifndef WINBMP_CODEC_HPP_
#define WINBMP_CODEC_HPP_

#include <winbmp/winbmp_export.h>
#include <winbmp/types.hpp>
#include <winbmp/pixel_buffer.hpp>
#include <winbmp/stream.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace winbmp {

// ============================================================================
// Convenience Functions
// ============================================================================

/**
 * Decode a BMP stream.
 * @param src Byte source positioned at the start of the BMP stream
 * @param out Destination image
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] WINBMP_EXPORT codec_result decode(byte_source& src,
                                                image& out,
                                                const decode_options& options = {});

/**
 * Decode BMP data held in memory.
 * @param data Raw file data
 * @param out Destination image
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] WINBMP_EXPORT codec_result decode(std::span<const std::uint8_t> data,
                                                image& out,
                                                const decode_options& options = {});

/**
 * Encode a pixel buffer as BMP.
 * @param pixels Source image
 * @param sink Destination
 * @param options Encode options
 * @return Encode result
 */
[[nodiscard]] WINBMP_EXPORT codec_result encode(const pixel_buffer& pixels,
                                                byte_sink& sink,
                                                const encode_options& options = {});

[[nodiscard]] WINBMP_EXPORT codec_result encode(const pixel_buffer& pixels,
                                                std::vector<std::uint8_t>& out,
                                                const encode_options& options = {});

} // namespace winbmp

#endif // WINBMP_CODEC_HPP_
