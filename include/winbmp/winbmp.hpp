#ifndef WINBMP_WINBMP_HPP_
#define WINBMP_WINBMP_HPP_

#include <winbmp/winbmp_export.h>
#include <winbmp/types.hpp>
#include <winbmp/pixel_buffer.hpp>
#include <winbmp/stream.hpp>
#include <winbmp/codec.hpp>
#include <winbmp/palettes.hpp>
#include <winbmp/codecs/bmp.hpp>
#include <winbmp/codecs/png.hpp>

namespace winbmp {

// All public API is included via the headers above.
// See:
//   - types.hpp:        image_descriptor, codec_error, codec_result, options
//   - pixel_buffer.hpp: pixel_buffer, image
//   - stream.hpp:       byte_source, byte_sink and their memory/stream variants
//   - codec.hpp:        decode(), encode()
//   - palettes.hpp:     Default palettes for indexed output
//   - codecs/bmp.hpp:   bmp_decoder, bmp_encoder, rle_decompress()
//   - codecs/png.hpp:   PNG bridge

} // namespace winbmp

#endif // WINBMP_WINBMP_HPP_
