#include <winbmp/types.hpp>

namespace winbmp {

const char* to_string(codec_error err) noexcept {
    switch (err) {
        case codec_error::none:           return "none";
        case codec_error::invalid_format: return "invalid_format";
        case codec_error::unsupported:    return "unsupported";
        case codec_error::io_error:       return "io_error";
    }
    return "unknown";
}

const char* to_string(compression_kind kind) noexcept {
    switch (kind) {
        case compression_kind::none:      return "none";
        case compression_kind::rle8:      return "rle8";
        case compression_kind::rle4:      return "rle4";
        case compression_kind::bitfields: return "bitfields";
    }
    return "unknown";
}

const char* to_string(header_variant variant) noexcept {
    switch (variant) {
        case header_variant::core:   return "BITMAPCOREHEADER";
        case header_variant::info:   return "BITMAPINFOHEADER";
        case header_variant::v2:     return "BITMAPV2INFOHEADER";
        case header_variant::v3:     return "BITMAPV3INFOHEADER";
        case header_variant::os2_v2: return "OS22XBITMAPHEADER";
        case header_variant::v4:     return "BITMAPV4HEADER";
        case header_variant::v5:     return "BITMAPV5HEADER";
    }
    return "unknown";
}

} // namespace winbmp
