#include <MemoryLane.hpp>
#include <ini/IniEditor.hpp>

#include <gtest/gtest.h>

#include <format>

#include "shared.hpp"

using namespace Override;

class MemoryLaneTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_ini      = m_dir.file("PCSX2.ini");
        m_out      = m_dir.file("cards");
        m_template = m_dir.file("template.ps2");

        writeFile(m_ini, "[MemoryCards]\nSlot1_Enable = false\nSlot1_Filename = Mcd001.ps2\n");
        writeFile(m_template, "tpl");
    }

    void writeSettings(bool restoreOnExit) {
        writeFile(m_dir.file("memlane.conf"),
                  std::format("general {{\n    enable_auto_switch = 1\n    restore_on_exit = {}\n}}\n\n"
                              "cards {{\n    output_folder = {}\n    template = {}\n    auto_create = 1\n}}\n\n"
                              "pcsx2 {{\n    config_path = {}\n}}\n",
                              restoreOnExit ? 1 : 0, m_out, m_template, m_ini));
    }

    CTempDir    m_dir;
    std::string m_ini, m_out, m_template;

    const SGame JAK{.id = "7f3c2a10-0000", .name = "Jak and Daxter", .platformIds = {"ps2"}};
};

TEST_F(MemoryLaneTest, gameLifecycle) {
    writeSettings(true);

    CMemoryLane lane(m_dir.file("memlane.conf"), {{.id = "ps2", .name = "Sony PlayStation 2"}});

    const auto  RET = lane.onGameStarting(JAK);
    ASSERT_TRUE(RET.has_value());
    EXPECT_EQ(*RET, APPLY_RESULT_APPLIED);

    EXPECT_EQ(Ini::readValue(m_ini, "MemoryCards", "Slot1_Filename"), "Jak and Daxter.ps2");
    EXPECT_EQ(Ini::readValue(m_ini, "MemoryCards", "Slot1_Enable"), "true");
    EXPECT_EQ(Ini::readValue(m_ini, "Folders", "MemoryCards"), m_out);
    EXPECT_EQ(readFile(m_out + "/Jak and Daxter.ps2"), "tpl");
    EXPECT_TRUE(lane.session().hasActiveOverride());

    EXPECT_EQ(lane.onGameStopped(JAK), REVERT_RESULT_RESTORED);
    EXPECT_EQ(Ini::readValue(m_ini, "MemoryCards", "Slot1_Filename"), "Mcd001.ps2");
    EXPECT_FALSE(lane.session().hasActiveOverride());
}

TEST_F(MemoryLaneTest, keepsOverrideWithoutRestoreOnExit) {
    writeSettings(false);

    CMemoryLane lane(m_dir.file("memlane.conf"), {{.id = "ps2", .name = "Sony PlayStation 2"}});

    ASSERT_TRUE(lane.onGameStarting(JAK).has_value());
    EXPECT_EQ(lane.onGameStopped(JAK), REVERT_RESULT_NOOP);

    EXPECT_EQ(Ini::readValue(m_ini, "MemoryCards", "Slot1_Filename"), "Jak and Daxter.ps2");
    EXPECT_TRUE(lane.session().hasActiveOverride());
}

TEST_F(MemoryLaneTest, createsCardsForResolvedPlatform) {
    writeSettings(true);

    CMemoryLane lane(m_dir.file("memlane.conf"), {{.id = "snes", .name = "Nintendo SNES"}, {.id = "ps2", .name = "PlayStation 2"}});

    const auto  RESULT = lane.createMemoryCards({JAK, {.id = "1", .name = "Zelda", .platformIds = {"snes"}}});

    EXPECT_EQ(RESULT.totalGames, 1u);
    EXPECT_EQ(RESULT.created, 1u);
    EXPECT_TRUE(std::filesystem::exists(m_out + "/Jak and Daxter.ps2"));
}
