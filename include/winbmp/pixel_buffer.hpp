#ifndef WINBMP_PIXEL_BUFFER_HPP_
#define WINBMP_PIXEL_BUFFER_HPP_

#include <winbmp/winbmp_export.h>
#include <winbmp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace winbmp {

// ============================================================================
// Pixel Buffer
// ============================================================================

/**
 * Owned, contiguous row-major image storage.
 * Rows are always top to bottom with no padding between them.
 * Indexed buffers carry their palette.
 */
class WINBMP_EXPORT pixel_buffer {
public:
    pixel_buffer() = default;
    ~pixel_buffer() = default;

    pixel_buffer(const pixel_buffer&) = default;
    pixel_buffer& operator=(const pixel_buffer&) = default;
    pixel_buffer(pixel_buffer&&) noexcept = default;
    pixel_buffer& operator=(pixel_buffer&&) noexcept = default;

    /**
     * Set the buffer dimensions and pixel format.
     * Existing contents are discarded and the new storage is zero-filled.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    bool set_size(int width, int height, pixel_format format);

    /**
     * Replace the palette (indexed8 only carries meaning).
     */
    void set_palette(std::vector<palette_entry> palette);

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<const palette_entry> palette() const noexcept { return palette_; }
    [[nodiscard]] std::span<const std::uint8_t> row(int y) const noexcept;

    // Mutable accessors
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }
    [[nodiscard]] std::span<std::uint8_t> mutable_row(int y) noexcept;

    friend bool operator==(const pixel_buffer&, const pixel_buffer&) = default;

private:
    std::vector<std::uint8_t> pixels_;
    std::vector<palette_entry> palette_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgb888;
};

// ============================================================================
// Decoded Image
// ============================================================================

struct image {
    image_descriptor descriptor;
    pixel_buffer pixels;
};

} // namespace winbmp

#endif // WINBMP_PIXEL_BUFFER_HPP_
