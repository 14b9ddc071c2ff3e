//! # ICNS Container Writer
//!
//! Writes Apple icon containers without `iconutil`. Every entry holds a PNG.
//!
//! ```text
//! 'icns' | u32 total length (big-endian)
//! repeated: OSType | u32 entry length incl. 8-byte header | PNG bytes
//! ```
//!
//! | OSType | Pixels | Iconset name            |
//! |--------|--------|-------------------------|
//! | `icp4` | 16     | icon_16x16.png          |
//! | `ic11` | 32     | icon_16x16@2x.png       |
//! | `icp5` | 32     | icon_32x32.png          |
//! | `ic12` | 64     | icon_32x32@2x.png       |
//! | `ic07` | 128    | icon_128x128.png        |
//! | `ic13` | 256    | icon_128x128@2x.png     |
//! | `ic08` | 256    | icon_256x256.png        |
//! | `ic14` | 512    | icon_256x256@2x.png     |
//! | `ic09` | 512    | icon_512x512.png        |
//! | `ic10` | 1024   | icon_512x512@2x.png     |

#ifndef RELPACK_ICON_ICNS_WRITER_HPP
#define RELPACK_ICON_ICNS_WRITER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relpack::icon {

/// OSType for an image of `points` at `scale` (1 or 2), or nullopt.
std::optional<std::string> icns_type(int points, int scale);

/// True if `data` starts with the PNG signature.
bool is_png(std::string_view data);

/// Serializes (OSType, PNG bytes) entries into an ICNS container.
std::string encode_icns(const std::vector<std::pair<std::string, std::string>>& entries);

/// Lists the entry types of an ICNS container, or nullopt if malformed.
std::optional<std::vector<std::string>> icns_entry_types(std::string_view data);

} // namespace relpack::icon

#endif // RELPACK_ICON_ICNS_WRITER_HPP
