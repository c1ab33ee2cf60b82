#ifndef WINBMP_PALETTES_HPP_
#define WINBMP_PALETTES_HPP_

#include <winbmp/winbmp_export.h>
#include <winbmp/types.hpp>

#include <cstdint>
#include <vector>

namespace winbmp {

// ============================================================================
// Default Palettes
// ============================================================================

/**
 * Linear grayscale ramp with 2^bits entries, black to white.
 * Used for indexed output when no palette is supplied.
 * @param bits Index width (1, 4 or 8)
 * @return Palette, empty for unsupported widths
 */
[[nodiscard]] WINBMP_EXPORT std::vector<palette_entry> grayscale_palette(int bits);

} // namespace winbmp

#endif // WINBMP_PALETTES_HPP_
