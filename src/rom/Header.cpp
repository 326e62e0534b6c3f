#include "rom/Header.hpp"
#include "logging/LogRegistry.hpp"
#include "util/strings.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

using namespace sw::logging;

namespace sw::rom {

namespace {

constexpr std::size_t CRC1_OFFSET = 0x10;
constexpr std::size_t CRC2_OFFSET = 0x14;
constexpr std::size_t NAME_OFFSET = 0x20;
constexpr std::size_t NAME_LENGTH = 20;
constexpr std::size_t MEDIA_FORMAT_OFFSET = 0x3B;
constexpr std::size_t GAME_ID_OFFSET = 0x3C;
constexpr std::size_t REGION_OFFSET = 0x3E;
constexpr std::size_t VERSION_OFFSET = 0x3F;

uint32_t readBe32(const std::array<uint8_t, Header::SIZE>& b, const std::size_t off) {
    return static_cast<uint32_t>(b[off]) << 24 | static_cast<uint32_t>(b[off + 1]) << 16 |
           static_cast<uint32_t>(b[off + 2]) << 8 | static_cast<uint32_t>(b[off + 3]);
}

}

std::optional<ByteOrder> detectByteOrder(const uint8_t firstByte) {
    switch (firstByte) {
        case 0x80: return ByteOrder::BigEndian;
        case 0x37: return ByteOrder::ByteSwapped;
        case 0x40: return ByteOrder::LittleEndian;
        case 0x12: return ByteOrder::WordSwapped;
        default: return std::nullopt;
    }
}

void toBigEndian(const std::span<uint8_t> bytes, const ByteOrder from) {
    for (std::size_t i = 0; i + 3 < bytes.size(); i += 4) {
        switch (from) {
            case ByteOrder::BigEndian: return;
            case ByteOrder::ByteSwapped:
                std::swap(bytes[i], bytes[i + 1]);
                std::swap(bytes[i + 2], bytes[i + 3]);
                break;
            case ByteOrder::LittleEndian:
                std::swap(bytes[i], bytes[i + 3]);
                std::swap(bytes[i + 1], bytes[i + 2]);
                break;
            case ByteOrder::WordSwapped:
                std::swap(bytes[i], bytes[i + 2]);
                std::swap(bytes[i + 1], bytes[i + 3]);
                break;
        }
    }
}

std::optional<Header> parseHeader(const std::span<const uint8_t> raw) {
    if (raw.size() < Header::SIZE) return std::nullopt;

    const auto order = detectByteOrder(raw[0]);
    if (!order) return std::nullopt;

    std::array<uint8_t, Header::SIZE> b{};
    std::copy_n(raw.begin(), Header::SIZE, b.begin());
    toBigEndian(b, *order);

    Header h;
    h.byteOrder = *order;
    h.crc1 = readBe32(b, CRC1_OFFSET);
    h.crc2 = readBe32(b, CRC2_OFFSET);

    std::string name(reinterpret_cast<const char*>(&b[NAME_OFFSET]), NAME_LENGTH);
    if (const auto nul = name.find('\0'); nul != std::string::npos) name.resize(nul);
    h.internalName = util::trim(name, std::string_view(" \0", 2));

    h.mediaFormat = static_cast<char>(b[MEDIA_FORMAT_OFFSET]);
    h.gameId = std::string(reinterpret_cast<const char*>(&b[GAME_ID_OFFSET]), 2);
    h.regionCode = static_cast<char>(b[REGION_OFFSET]);
    h.version = b[VERSION_OFFSET];
    return h;
}

std::optional<Header> readHeader(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LogRegistry::rom()->debug("[Header] Cannot open {}", path.string());
        return std::nullopt;
    }

    std::array<uint8_t, Header::SIZE> raw{};
    if (!in.read(reinterpret_cast<char*>(raw.data()), raw.size())) {
        LogRegistry::rom()->debug("[Header] {} is shorter than a ROM header", path.string());
        return std::nullopt;
    }

    auto h = parseHeader(raw);
    if (!h) LogRegistry::rom()->debug("[Header] {} does not start with a known N64 signature", path.string());
    return h;
}

}
