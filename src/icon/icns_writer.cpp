#include "icon/icns_writer.hpp"

#include <cstdint>

namespace relpack::icon {

namespace {

constexpr size_t ENTRY_HEADER_SIZE = 8;

void write_be32(std::string& out, uint32_t value) {
    out += static_cast<char>((value >> 24) & 0xff);
    out += static_cast<char>((value >> 16) & 0xff);
    out += static_cast<char>((value >> 8) & 0xff);
    out += static_cast<char>(value & 0xff);
}

uint32_t read_be32(std::string_view data, size_t pos) {
    auto b = [&](size_t i) { return static_cast<uint32_t>(static_cast<uint8_t>(data[pos + i])); };
    return (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
}

} // namespace

std::optional<std::string> icns_type(int points, int scale) {
    struct Mapping {
        int points;
        int scale;
        const char* type;
    };
    static const Mapping mappings[] = {
        {16, 1, "icp4"},  {16, 2, "ic11"},  {32, 1, "icp5"},  {32, 2, "ic12"},
        {128, 1, "ic07"}, {128, 2, "ic13"}, {256, 1, "ic08"}, {256, 2, "ic14"},
        {512, 1, "ic09"}, {512, 2, "ic10"},
    };
    for (const auto& m : mappings) {
        if (m.points == points && m.scale == scale)
            return std::string(m.type);
    }
    return std::nullopt;
}

bool is_png(std::string_view data) {
    static constexpr std::string_view signature("\x89PNG\r\n\x1a\n", 8);
    return data.substr(0, signature.size()) == signature;
}

std::string encode_icns(const std::vector<std::pair<std::string, std::string>>& entries) {
    size_t total = ENTRY_HEADER_SIZE;
    for (const auto& [_, data] : entries) {
        total += ENTRY_HEADER_SIZE + data.size();
    }

    std::string out;
    out.reserve(total);
    out += "icns";
    write_be32(out, static_cast<uint32_t>(total));
    for (const auto& [type, data] : entries) {
        out += type.substr(0, 4);
        write_be32(out, static_cast<uint32_t>(ENTRY_HEADER_SIZE + data.size()));
        out += data;
    }
    return out;
}

std::optional<std::vector<std::string>> icns_entry_types(std::string_view data) {
    if (data.size() < ENTRY_HEADER_SIZE || data.substr(0, 4) != "icns")
        return std::nullopt;
    if (read_be32(data, 4) != data.size())
        return std::nullopt;

    std::vector<std::string> types;
    size_t pos = ENTRY_HEADER_SIZE;
    while (pos < data.size()) {
        if (data.size() - pos < ENTRY_HEADER_SIZE)
            return std::nullopt;
        uint32_t length = read_be32(data, pos + 4);
        if (length < ENTRY_HEADER_SIZE || length > data.size() - pos)
            return std::nullopt;
        types.emplace_back(data.substr(pos, 4));
        pos += length;
    }
    return types;
}

} // namespace relpack::icon
