#include <winbmp/codec.hpp>
#include <winbmp/codecs/bmp.hpp>

namespace winbmp {

codec_result decode(byte_source& src, image& out, const decode_options& options) {
    return bmp_decoder::decode(src, out, options);
}

codec_result decode(std::span<const std::uint8_t> data, image& out, const decode_options& options) {
    return bmp_decoder::decode(data, out, options);
}

codec_result encode(const pixel_buffer& pixels, byte_sink& sink, const encode_options& options) {
    return bmp_encoder::encode(pixels, sink, options);
}

codec_result encode(const pixel_buffer& pixels, std::vector<std::uint8_t>& out, const encode_options& options) {
    return bmp_encoder::encode(pixels, out, options);
}

} // namespace winbmp
