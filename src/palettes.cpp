#include <winbmp/palettes.hpp>

namespace winbmp {

std::vector<palette_entry> grayscale_palette(int bits) {
    if (bits != 1 && bits != 4 && bits != 8) {
        return {};
    }

    const std::size_t count = std::size_t{1} << bits;
    std::vector<palette_entry> palette(count);

    // Spread the ramp so the last entry is always full white
    for (std::size_t i = 0; i < count; ++i) {
        const auto gray = static_cast<std::uint8_t>(i * 255 / (count - 1));
        palette[i] = {gray, gray, gray, 0};
    }

    return palette;
}

} // namespace winbmp
