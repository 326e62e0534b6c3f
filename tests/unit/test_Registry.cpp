#include <gtest/gtest.h>
#include "save/Registry.hpp"
#include "util/strings.hpp"

#include <stdexcept>

using namespace sw::save;

TEST(SaveFormatTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseSaveFormat("project64"), SaveFormat::Project64);
    EXPECT_EQ(parseSaveFormat("Mupen64Plus"), SaveFormat::Mupen64Plus);
    EXPECT_EQ(parseSaveFormat("EVERDRIVE"), SaveFormat::Everdrive);
    EXPECT_THROW(parseSaveFormat("retroarch"), std::invalid_argument);
    EXPECT_THROW(parseSaveFormat(""), std::invalid_argument);
}

TEST(SaveFormatTest, ToStringRoundTrips) {
    for (const auto f : {SaveFormat::Project64, SaveFormat::Mupen64Plus, SaveFormat::Everdrive})
        EXPECT_EQ(parseSaveFormat(to_string(f)), f);
}

TEST(SaveKindTest, ControllerPakSlotRange) {
    EXPECT_THROW(SaveKind::controllerPak(0), std::out_of_range);
    EXPECT_THROW(SaveKind::controllerPak(5), std::out_of_range);
    EXPECT_EQ(SaveKind::controllerPak(4).slot, 4);
    EXPECT_TRUE(SaveKind::controllerPak(1).isControllerPak());
    EXPECT_FALSE(SaveKind::eeprom().isControllerPak());
}

TEST(SaveKindTest, AllListsEveryKindOnce) {
    const auto& all = SaveKind::all();
    ASSERT_EQ(all.size(), 7u);
    EXPECT_EQ(all[0], SaveKind::sram());
    EXPECT_EQ(all[1], SaveKind::eeprom());
    EXPECT_EQ(all[2], SaveKind::flashRam());
    for (unsigned i = 1; i <= 4; ++i) EXPECT_EQ(all[2 + i], SaveKind::controllerPak(i));
    EXPECT_EQ(to_string(all[4]), "mpk2");
}

TEST(RegistryTest, EverdriveNaming) {
    const auto& ed = Registry::get(SaveFormat::Everdrive);
    EXPECT_EQ(ed.id(), SaveFormat::Everdrive);
    EXPECT_FALSE(ed.usesSubfolder());
    EXPECT_EQ(ed.fileName("Perfect Dark (USA)", SaveKind::sram()), "Perfect Dark (USA).srm");
    EXPECT_EQ(ed.fileName("Perfect Dark (USA)", SaveKind::eeprom()), "Perfect Dark (USA).eep");
    EXPECT_EQ(ed.fileName("Perfect Dark (USA)", SaveKind::flashRam()), "Perfect Dark (USA).fla");
    EXPECT_EQ(ed.fileName("Perfect Dark (USA)", SaveKind::controllerPak(1)), "Perfect Dark (USA).mpk");
    EXPECT_EQ(ed.fileName("Perfect Dark (USA)", SaveKind::controllerPak(2)), "Perfect Dark (USA)_Cont_2.mpk");
    EXPECT_EQ(ed.fileName("Perfect Dark (USA)", SaveKind::controllerPak(4)), "Perfect Dark (USA)_Cont_4.mpk");
}

TEST(RegistryTest, Project64Naming) {
    const auto& pj = Registry::get(SaveFormat::Project64);
    EXPECT_TRUE(pj.usesSubfolder());
    EXPECT_EQ(pj.fileName("PERFECT DARK", SaveKind::sram()), "PERFECT DARK.sra");
    EXPECT_EQ(pj.fileName("PERFECT DARK", SaveKind::eeprom()), "PERFECT DARK.eep");
    EXPECT_EQ(pj.fileName("PERFECT DARK", SaveKind::flashRam()), "PERFECT DARK.fla");
    EXPECT_EQ(pj.fileName("PERFECT DARK", SaveKind::controllerPak(1)), "PERFECT DARK_Cont_1.mpk");
    EXPECT_EQ(pj.fileName("PERFECT DARK", SaveKind::controllerPak(2)), "PERFECT DARK_Cont_2.mpk");
}

TEST(RegistryTest, Project64SubfolderRuleStripsTags) {
    const auto rule = Registry::get(SaveFormat::Project64).subfolderRule("Perfect Dark (USA) (Rev 1) [!]");
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->title, "Perfect Dark");
}

TEST(RegistryTest, Mupen64PlusKeepsOneFileAndNoPaks) {
    const auto& mp = Registry::get(SaveFormat::Mupen64Plus);
    EXPECT_FALSE(mp.usesSubfolder());
    EXPECT_EQ(mp.fileName("Perfect Dark (USA)", SaveKind::sram()), "Perfect Dark (USA).srm");
    EXPECT_EQ(mp.fileName("Perfect Dark (USA)", SaveKind::eeprom()), "Perfect Dark (USA).srm");
    EXPECT_EQ(mp.fileName("Perfect Dark (USA)", SaveKind::flashRam()), "Perfect Dark (USA).srm");
    for (unsigned i = 1; i <= 4; ++i)
        EXPECT_FALSE(mp.fileName("Perfect Dark (USA)", SaveKind::controllerPak(i)).has_value());
}

TEST(RegistryTest, OutOfRangeFormatThrows) {
    EXPECT_THROW(Registry::get(static_cast<SaveFormat>(42)), std::logic_error);
}

TEST(SubfolderPatternTest, MatchesTitleDashHex) {
    const SubfolderPattern p{"Perfect Dark"};
    EXPECT_EQ(p.match("PERFECT DARK-0123456789ABCDEF"), "PERFECT DARK");
    EXPECT_EQ(p.match("Perfect Dark-e0a4"), "Perfect Dark");
}

TEST(SubfolderPatternTest, RejectsNearMisses) {
    const SubfolderPattern p{"Perfect Dark"};
    EXPECT_FALSE(p.match("Perfect Dark").has_value());
    EXPECT_FALSE(p.match("Perfect Dark-").has_value());
    EXPECT_FALSE(p.match("Perfect Dark-XYZ").has_value());
    EXPECT_FALSE(p.match("Perfect Dark 2-ABCD").has_value());
    EXPECT_FALSE(p.match("Perfect Darkness-ABCD").has_value());
    EXPECT_FALSE(SubfolderPattern{""}.match("-ABCD").has_value());
}

TEST(StringsTest, StripTags) {
    using sw::util::stripTags;
    EXPECT_EQ(stripTags("Perfect Dark (USA)"), "Perfect Dark");
    EXPECT_EQ(stripTags("F-Zero X (USA) [!]"), "F-Zero X");
    EXPECT_EQ(stripTags("Mario (Europe) (En,Fr,De) Kart"), "Mario Kart");
    EXPECT_EQ(stripTags("No Tags"), "No Tags");
}
