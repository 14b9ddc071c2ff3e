#include "macho/fat_binary.hpp"

#include "common/fs_utils.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <set>

namespace relpack::macho {

namespace {

/// Java class files share the fat magic; real fat files have few slices.
constexpr uint32_t MAX_FAT_ARCHS = 30;

constexpr size_t FAT_HEADER_SIZE = 8;
constexpr size_t FAT_ARCH_SIZE = 20;
constexpr size_t FAT_ARCH_64_SIZE = 32;

uint32_t read_be32(std::string_view data, size_t pos) {
    auto b = [&](size_t i) { return static_cast<uint32_t>(static_cast<uint8_t>(data[pos + i])); };
    return (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
}

uint32_t read_le32(std::string_view data, size_t pos) {
    auto b = [&](size_t i) { return static_cast<uint32_t>(static_cast<uint8_t>(data[pos + i])); };
    return b(0) | (b(1) << 8) | (b(2) << 16) | (b(3) << 24);
}

uint64_t read_be64(std::string_view data, size_t pos) {
    return (static_cast<uint64_t>(read_be32(data, pos)) << 32) | read_be32(data, pos + 4);
}

void write_be32(std::string& out, uint32_t value) {
    out += static_cast<char>((value >> 24) & 0xff);
    out += static_cast<char>((value >> 16) & 0xff);
    out += static_cast<char>((value >> 8) & 0xff);
    out += static_cast<char>(value & 0xff);
}

uint64_t align_up(uint64_t value, uint32_t p2align) {
    uint64_t alignment = uint64_t{1} << p2align;
    return (value + alignment - 1) & ~(alignment - 1);
}

std::optional<Slice> parse_thin(std::string_view data) {
    if (data.size() < 28)
        return std::nullopt;
    uint32_t magic = read_le32(data, 0);
    uint32_t cputype = 0;
    uint32_t cpusubtype = 0;
    if (magic == MH_MAGIC || magic == MH_MAGIC_64) {
        cputype = read_le32(data, 4);
        cpusubtype = read_le32(data, 8);
    } else if (magic == MH_CIGAM || magic == MH_CIGAM_64) {
        cputype = read_be32(data, 4);
        cpusubtype = read_be32(data, 8);
    } else {
        return std::nullopt;
    }
    Slice slice;
    slice.cputype = cputype;
    slice.cpusubtype = cpusubtype & ~CPU_SUBTYPE_MASK;
    slice.offset = 0;
    slice.size = data.size();
    slice.align = default_alignment(cputype);
    slice.arch = arch_name(cputype, cpusubtype);
    return slice;
}

std::optional<BinaryInfo> parse_fat(std::string_view data) {
    if (data.size() < FAT_HEADER_SIZE)
        return std::nullopt;
    uint32_t magic = read_be32(data, 0);
    bool is64 = magic == FAT_MAGIC_64;
    uint32_t count = read_be32(data, 4);
    if (count == 0 || count > MAX_FAT_ARCHS)
        return std::nullopt;

    size_t entry_size = is64 ? FAT_ARCH_64_SIZE : FAT_ARCH_SIZE;
    if (data.size() < FAT_HEADER_SIZE + count * entry_size)
        return std::nullopt;

    BinaryInfo info;
    info.fat = true;
    for (uint32_t i = 0; i < count; ++i) {
        size_t pos = FAT_HEADER_SIZE + i * entry_size;
        Slice slice;
        slice.cputype = read_be32(data, pos);
        slice.cpusubtype = read_be32(data, pos + 4) & ~CPU_SUBTYPE_MASK;
        if (is64) {
            slice.offset = read_be64(data, pos + 8);
            slice.size = read_be64(data, pos + 16);
            slice.align = read_be32(data, pos + 24);
        } else {
            slice.offset = read_be32(data, pos + 8);
            slice.size = read_be32(data, pos + 12);
            slice.align = read_be32(data, pos + 16);
        }
        if (slice.offset > data.size() || slice.size > data.size() - slice.offset)
            return std::nullopt;
        slice.arch = arch_name(slice.cputype, slice.cpusubtype);
        info.slices.push_back(slice);
    }
    return info;
}

PackError merge_error(std::string message) {
    return make_error(ErrorKind::MergeError, std::move(message));
}

} // namespace

std::vector<std::string> BinaryInfo::architectures() const {
    std::vector<std::string> arches;
    for (const auto& slice : slices) {
        arches.push_back(slice.arch);
    }
    return arches;
}

std::string arch_name(uint32_t cputype, uint32_t cpusubtype) {
    uint32_t sub = cpusubtype & ~CPU_SUBTYPE_MASK;
    switch (cputype) {
    case CPU_TYPE_X86:
        return "i386";
    case CPU_TYPE_X86_64:
        return sub == 8 ? "x86_64h" : "x86_64";
    case CPU_TYPE_ARM64:
        return sub == 2 ? "arm64e" : "arm64";
    case CPU_TYPE_ARM:
        return "arm";
    default:
        return "cputype" + std::to_string(cputype) + ":" + std::to_string(sub);
    }
}

std::optional<std::pair<uint32_t, uint32_t>> cpu_for_arch(std::string_view arch) {
    if (arch == "x86_64")
        return std::make_pair(CPU_TYPE_X86_64, 3u);
    if (arch == "x86_64h")
        return std::make_pair(CPU_TYPE_X86_64, 8u);
    if (arch == "arm64")
        return std::make_pair(CPU_TYPE_ARM64, 0u);
    if (arch == "arm64e")
        return std::make_pair(CPU_TYPE_ARM64, 2u);
    if (arch == "i386")
        return std::make_pair(CPU_TYPE_X86, 3u);
    return std::nullopt;
}

uint32_t default_alignment(uint32_t cputype) {
    return cputype == CPU_TYPE_ARM64 ? 14 : 12;
}

std::optional<BinaryInfo> inspect_bytes(std::string_view data) {
    if (data.size() < 4)
        return std::nullopt;
    uint32_t be_magic = read_be32(data, 0);
    if (be_magic == FAT_MAGIC || be_magic == FAT_MAGIC_64)
        return parse_fat(data);

    auto slice = parse_thin(data);
    if (!slice)
        return std::nullopt;
    BinaryInfo info;
    info.slices.push_back(*slice);
    return info;
}

std::optional<BinaryInfo> inspect(const fs::path& path) {
    auto content = read_file(path);
    if (!content)
        return std::nullopt;
    return inspect_bytes(*content);
}

bool is_macho(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    char magic[4];
    if (!in.read(magic, sizeof(magic)))
        return false;
    std::string_view data(magic, sizeof(magic));
    uint32_t be = read_be32(data, 0);
    uint32_t le = read_le32(data, 0);
    return be == FAT_MAGIC || be == FAT_MAGIC_64 || le == MH_MAGIC || le == MH_MAGIC_64 ||
           le == MH_CIGAM || le == MH_CIGAM_64;
}

Result<std::string> fuse_images(const std::vector<std::string>& images) {
    struct Input {
        Slice slice;
        std::string_view bytes;
    };

    std::vector<Input> inputs;
    std::set<std::pair<uint32_t, uint32_t>> seen;
    for (size_t i = 0; i < images.size(); ++i) {
        std::string_view image = images[i];
        auto info = inspect_bytes(image);
        if (!info) {
            return merge_error("input " + std::to_string(i) + " is not a Mach-O file");
        }
        for (const auto& slice : info->slices) {
            Input input;
            input.slice = slice;
            input.slice.align = default_alignment(slice.cputype);
            input.bytes = image.substr(slice.offset, slice.size);
            if (!seen.insert({slice.cputype, slice.cpusubtype}).second) {
                return merge_error("architecture " + slice.arch + " appears in more than one input");
            }
            inputs.push_back(input);
        }
    }
    if (inputs.empty()) {
        return merge_error("no input slices");
    }

    std::stable_sort(inputs.begin(), inputs.end(), [](const Input& a, const Input& b) {
        if (a.slice.align != b.slice.align)
            return a.slice.align < b.slice.align;
        if (a.slice.cputype != b.slice.cputype)
            return a.slice.cputype < b.slice.cputype;
        return a.slice.cpusubtype < b.slice.cpusubtype;
    });

    // Lay out offsets first, then emit header and slices.
    uint64_t offset = FAT_HEADER_SIZE + inputs.size() * FAT_ARCH_SIZE;
    for (auto& input : inputs) {
        offset = align_up(offset, input.slice.align);
        input.slice.offset = offset;
        input.slice.size = input.bytes.size();
        offset += input.slice.size;
    }
    if (offset > UINT32_MAX) {
        return merge_error("universal binary exceeds 4 GiB");
    }

    std::string out;
    out.reserve(static_cast<size_t>(offset));
    write_be32(out, FAT_MAGIC);
    write_be32(out, static_cast<uint32_t>(inputs.size()));
    for (const auto& input : inputs) {
        write_be32(out, input.slice.cputype);
        write_be32(out, input.slice.cpusubtype);
        write_be32(out, static_cast<uint32_t>(input.slice.offset));
        write_be32(out, static_cast<uint32_t>(input.slice.size));
        write_be32(out, input.slice.align);
    }
    for (const auto& input : inputs) {
        out.resize(static_cast<size_t>(input.slice.offset), '\0');
        out.append(input.bytes);
    }
    return out;
}

Result<Unit> create_universal(const std::vector<fs::path>& inputs, const fs::path& output) {
    if (inputs.empty()) {
        return merge_error("no inputs for " + output.string());
    }

    std::vector<std::string> images;
    for (const auto& input : inputs) {
        auto content = read_file(input);
        if (!content) {
            return merge_error("cannot read " + input.string());
        }
        images.push_back(std::move(*content));
    }

    auto fused = fuse_images(images);
    if (is_err(fused)) {
        auto error = unwrap_err(fused);
        error.message = output.filename().string() + ": " + error.message;
        return error;
    }

    std::error_code ec;
    auto perms = fs::status(inputs.front(), ec).permissions();

    // Write beside the target and rename, so an input may also be the output.
    fs::path temp = output;
    temp += ".fat";
    if (!write_file(temp, unwrap(fused))) {
        fs::remove(temp, ec);
        return merge_error("cannot write " + temp.string());
    }
    fs::permissions(temp, perms, fs::perm_options::replace, ec);
    fs::rename(temp, output, ec);
    if (ec) {
        fs::remove(temp, ec);
        return merge_error("cannot replace " + output.string() + ": " + ec.message());
    }

    RELPACK_LOG_DEBUG("macho", "Created universal " << output.filename().string() << " from "
                                                    << inputs.size() << " inputs");
    return Unit{};
}

} // namespace relpack::macho
