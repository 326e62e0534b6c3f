#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace sw::rom {

// Byte order of a ROM image as dumped, identified by the first byte.
enum class ByteOrder : uint8_t {
    BigEndian,      // .z64, 0x80
    ByteSwapped,    // .v64, 0x37
    LittleEndian,   // .n64, 0x40
    WordSwapped,    // no standard extension, 0x12
};

struct Header {
    static constexpr std::size_t SIZE = 0x40;

    ByteOrder byteOrder{ByteOrder::BigEndian};
    uint32_t crc1{0};
    uint32_t crc2{0};
    std::string internalName; // cartridge title, trailing spaces and NULs removed
    char mediaFormat{'N'};    // N cart, C expandable cart, D 64DD disk, E 64DD expansion, Z Aleck64
    std::string gameId;       // two characters
    char regionCode{'E'};
    uint8_t version{0};
};

std::optional<ByteOrder> detectByteOrder(uint8_t firstByte);

// Rewrites `bytes` (length a multiple of 4) from `from` to big-endian order in place.
void toBigEndian(std::span<uint8_t> bytes, ByteOrder from);

// Parses the first 64 bytes of a ROM image in any supported byte order.
std::optional<Header> parseHeader(std::span<const uint8_t> raw);

// Reads and parses the header of the ROM at `path`; nullopt if unreadable or not an N64 image.
std::optional<Header> readHeader(const std::filesystem::path& path);

}
