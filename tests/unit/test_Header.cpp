#include <gtest/gtest.h>
#include "rom/Header.hpp"
#include "SaveDirFixture.hpp"

#include <array>
#include <cstring>
#include <vector>

using namespace sw::rom;

namespace {

// Minimal big-endian (.z64) header for "PERFECT DARK", NUS-NPDE.
std::array<uint8_t, Header::SIZE> makeBigEndianHeader() {
    std::array<uint8_t, Header::SIZE> h{};
    h[0] = 0x80; h[1] = 0x37; h[2] = 0x12; h[3] = 0x40;
    const uint8_t crc1[] = {0xDE, 0xAD, 0xBE, 0xEF};
    const uint8_t crc2[] = {0x01, 0x02, 0x03, 0x04};
    std::memcpy(&h[0x10], crc1, 4);
    std::memcpy(&h[0x14], crc2, 4);
    std::memset(&h[0x20], ' ', 20);
    std::memcpy(&h[0x20], "PERFECT DARK", 12);
    h[0x3B] = 'N';
    h[0x3C] = 'P';
    h[0x3D] = 'D';
    h[0x3E] = 'E';
    h[0x3F] = 1;
    return h;
}

// Every reordering is its own inverse, so toBigEndian also produces the other layouts.
std::array<uint8_t, Header::SIZE> asOrder(std::array<uint8_t, Header::SIZE> h, const ByteOrder order) {
    toBigEndian(h, order);
    return h;
}

void expectPerfectDark(const Header& h) {
    EXPECT_EQ(h.internalName, "PERFECT DARK");
    EXPECT_EQ(h.crc1, 0xDEADBEEFu);
    EXPECT_EQ(h.crc2, 0x01020304u);
    EXPECT_EQ(h.mediaFormat, 'N');
    EXPECT_EQ(h.gameId, "PD");
    EXPECT_EQ(h.regionCode, 'E');
    EXPECT_EQ(h.version, 1);
}

}

TEST(HeaderTest, DetectByteOrder) {
    EXPECT_EQ(detectByteOrder(0x80), ByteOrder::BigEndian);
    EXPECT_EQ(detectByteOrder(0x37), ByteOrder::ByteSwapped);
    EXPECT_EQ(detectByteOrder(0x40), ByteOrder::LittleEndian);
    EXPECT_EQ(detectByteOrder(0x12), ByteOrder::WordSwapped);
    EXPECT_FALSE(detectByteOrder(0x00).has_value());
}

TEST(HeaderTest, ParsesEveryByteOrder) {
    const auto be = makeBigEndianHeader();
    for (const auto order : {ByteOrder::BigEndian, ByteOrder::ByteSwapped, ByteOrder::LittleEndian, ByteOrder::WordSwapped}) {
        const auto raw = asOrder(be, order);
        const auto h = parseHeader(raw);
        ASSERT_TRUE(h.has_value());
        EXPECT_EQ(h->byteOrder, order);
        expectPerfectDark(*h);
    }
}

TEST(HeaderTest, NameStopsAtNul) {
    auto be = makeBigEndianHeader();
    std::memset(&be[0x20], 0, 20);
    std::memcpy(&be[0x20], "F-ZERO X", 8);
    const auto h = parseHeader(be);
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->internalName, "F-ZERO X");
}

TEST(HeaderTest, RejectsShortOrUnknownImages) {
    const std::vector<uint8_t> shortImage(0x20, 0x80);
    EXPECT_FALSE(parseHeader(shortImage).has_value());

    auto be = makeBigEndianHeader();
    be[0] = 0xFF;
    EXPECT_FALSE(parseHeader(be).has_value());
}

class HeaderFileTest : public SaveDirFixture {};

TEST_F(HeaderFileTest, ReadsHeaderFromFile) {
    const auto raw = asOrder(makeBigEndianHeader(), ByteOrder::ByteSwapped);
    std::string content(reinterpret_cast<const char*>(raw.data()), raw.size());
    content += std::string(64, '\0');
    addRom("Perfect Dark (USA).v64", content);

    const auto h = readHeader(romDir / "Perfect Dark (USA).v64");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->byteOrder, ByteOrder::ByteSwapped);
    expectPerfectDark(*h);
}

TEST_F(HeaderFileTest, MissingOrTruncatedFileGivesNothing) {
    EXPECT_FALSE(readHeader(romDir / "absent.z64").has_value());
    addRom("tiny.z64", "\x80\x37");
    EXPECT_FALSE(readHeader(romDir / "tiny.z64").has_value());
}
