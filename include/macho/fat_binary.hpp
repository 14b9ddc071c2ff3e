//! # Mach-O Universal Binaries
//!
//! In-process equivalent of `lipo -info` and `lipo -create`: reads thin and
//! fat Mach-O headers and writes universal ("fat") files.
//!
//! ## Fat File Layout
//!
//! ```text
//! fat_header   { magic = 0xcafebabe, nfat_arch }           big-endian
//! fat_arch[n]  { cputype, cpusubtype, offset, size, align } big-endian
//! padding
//! slice 0      aligned to 2^align
//! slice 1      aligned to 2^align
//! ...
//! ```
//!
//! Slices are ordered by alignment, then CPU type. `arm64` slices use 16 KiB
//! alignment, everything else 4 KiB.

#ifndef RELPACK_MACHO_FAT_BINARY_HPP
#define RELPACK_MACHO_FAT_BINARY_HPP

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::macho {

constexpr uint32_t MH_MAGIC = 0xfeedface;
constexpr uint32_t MH_MAGIC_64 = 0xfeedfacf;
constexpr uint32_t MH_CIGAM = 0xcefaedfe;
constexpr uint32_t MH_CIGAM_64 = 0xcffaedfe;
constexpr uint32_t FAT_MAGIC = 0xcafebabe;
constexpr uint32_t FAT_MAGIC_64 = 0xcafebabf;

constexpr uint32_t CPU_ARCH_ABI64 = 0x01000000;
constexpr uint32_t CPU_TYPE_X86 = 7;
constexpr uint32_t CPU_TYPE_X86_64 = CPU_TYPE_X86 | CPU_ARCH_ABI64;
constexpr uint32_t CPU_TYPE_ARM = 12;
constexpr uint32_t CPU_TYPE_ARM64 = CPU_TYPE_ARM | CPU_ARCH_ABI64;
constexpr uint32_t CPU_SUBTYPE_MASK = 0xff000000;

/// One architecture inside a Mach-O file. For thin files there is exactly
/// one slice covering the whole file.
struct Slice {
    uint32_t cputype = 0;
    uint32_t cpusubtype = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    uint32_t align = 0; ///< Power of two
    std::string arch;
};

struct BinaryInfo {
    bool fat = false;
    std::vector<Slice> slices;

    std::vector<std::string> architectures() const;
};

/// Name for a (cputype, cpusubtype) pair, e.g. "x86_64", "arm64e".
std::string arch_name(uint32_t cputype, uint32_t cpusubtype);

/// Inverse of `arch_name()` for the architectures relpack builds.
std::optional<std::pair<uint32_t, uint32_t>> cpu_for_arch(std::string_view arch);

/// Default slice alignment (power of two) for a CPU type.
uint32_t default_alignment(uint32_t cputype);

/// Parses Mach-O headers from an in-memory image. Returns nullopt if the
/// bytes are not a Mach-O file.
std::optional<BinaryInfo> inspect_bytes(std::string_view data);

/// Reads and parses `path`. Returns nullopt if unreadable or not Mach-O.
std::optional<BinaryInfo> inspect(const fs::path& path);

/// True if `path` starts with a thin or fat Mach-O magic.
bool is_macho(const fs::path& path);

/// Builds a fat image from thin or fat Mach-O images. Fat inputs contribute
/// all of their slices. Duplicate architectures are rejected.
Result<std::string> fuse_images(const std::vector<std::string>& images);

/// `lipo -create inputs -output output`. The output takes the permission
/// bits of the first input.
Result<Unit> create_universal(const std::vector<fs::path>& inputs, const fs::path& output);

} // namespace relpack::macho

#endif // RELPACK_MACHO_FAT_BINARY_HPP
