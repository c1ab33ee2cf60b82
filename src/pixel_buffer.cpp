#include <winbmp/pixel_buffer.hpp>

#include <limits>
#include <new>
#include <utility>

namespace winbmp {

bool pixel_buffer::set_size(int width, int height, pixel_format format) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t bpp = bytes_per_pixel(format);

    // Check for overflow in pitch calculation (width * bpp)
    if (w > std::numeric_limits<std::size_t>::max() / bpp) {
        return false;
    }
    const std::size_t pitch = w * bpp;

    // Check for overflow in total size calculation (pitch * height)
    if (pitch > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }
    const std::size_t total_size = pitch * h;

    try {
        std::vector<std::uint8_t> storage(total_size, 0);
        pixels_.swap(storage);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = pitch;
    palette_.clear();

    return true;
}

void pixel_buffer::set_palette(std::vector<palette_entry> palette) {
    palette_ = std::move(palette);
}

std::span<const std::uint8_t> pixel_buffer::row(int y) const noexcept {
    if (y < 0 || y >= height_) {
        return {};
    }
    return std::span<const std::uint8_t>(pixels_).subspan(static_cast<std::size_t>(y) * pitch_, pitch_);
}

std::span<std::uint8_t> pixel_buffer::mutable_row(int y) noexcept {
    if (y < 0 || y >= height_) {
        return {};
    }
    return std::span<std::uint8_t>(pixels_).subspan(static_cast<std::size_t>(y) * pitch_, pitch_);
}

} // namespace winbmp
