#include "desktop/desktop_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "helpers/scripted_worker.hpp"

namespace fs = std::filesystem;
using namespace littera::desktop;
using littera::tests::TempDir;

class DesktopConfigTest : public ::testing::Test {
protected:
    TempDir dir_{"littera_desktop_config_test"};
};

TEST_F(DesktopConfigTest, MissingFileLoadsEmptyConfig) {
    DesktopConfigStore store(dir_.path() / "nope" / "desktop.json");

    DesktopConfig config = store.load();
    EXPECT_TRUE(config.recent.empty());
    EXPECT_FALSE(config.workspace.has_value());
}

TEST_F(DesktopConfigTest, CorruptFileLoadsEmptyConfig) {
    fs::path file = dir_.write_file("desktop.json", "{ not json");
    DesktopConfigStore store(file);

    DesktopConfig config = store.load();
    EXPECT_TRUE(config.recent.empty());
}

TEST_F(DesktopConfigTest, SaveCreatesParentAndRoundTrips) {
    DesktopConfigStore store(dir_.path() / ".littera" / "desktop.json");
    DesktopConfig config;
    record_recent(config, "/works/novel", 1700000000);
    config.workspace = "/works";

    std::string error;
    ASSERT_TRUE(store.save(config, error)) << error;
    ASSERT_TRUE(fs::exists(store.path()));

    DesktopConfig loaded = store.load();
    ASSERT_EQ(loaded.recent.size(), 1u);
    EXPECT_EQ(loaded.recent[0].path, "/works/novel");
    EXPECT_EQ(loaded.recent[0].name, "novel");
    EXPECT_EQ(loaded.recent[0].last_opened, 1700000000u);
    ASSERT_TRUE(loaded.workspace.has_value());
    EXPECT_EQ(*loaded.workspace, "/works");
}

TEST_F(DesktopConfigTest, FileFormatMatchesDesktopJson) {
    fs::path file = dir_.write_file("desktop.json", R"({
  "recent": [{"path": "/w/a", "name": "a", "last_opened": 5}],
  "workspace": null
})");
    DesktopConfigStore store(file);

    DesktopConfig config = store.load();
    ASSERT_EQ(config.recent.size(), 1u);
    EXPECT_EQ(config.recent[0].name, "a");
    EXPECT_FALSE(config.workspace.has_value());

    nlohmann::json j = config;
    EXPECT_TRUE(j["workspace"].is_null());
    EXPECT_EQ(j["recent"][0]["last_opened"], 5);
}

TEST_F(DesktopConfigTest, SaveFailsWhenParentIsAFile) {
    fs::path blocker = dir_.write_file("blocker", "x");
    DesktopConfigStore store(blocker / "desktop.json");

    std::string error;
    EXPECT_FALSE(store.save(DesktopConfig{}, error));
    EXPECT_FALSE(error.empty());
}

TEST(RecordRecentTest, NewestFirstWithoutDuplicates) {
    DesktopConfig config;
    record_recent(config, "/w/a", 1);
    record_recent(config, "/w/b", 2);
    record_recent(config, "/w/a", 3);

    ASSERT_EQ(config.recent.size(), 2u);
    EXPECT_EQ(config.recent[0].path, "/w/a");
    EXPECT_EQ(config.recent[0].last_opened, 3u);
    EXPECT_EQ(config.recent[1].path, "/w/b");
}

TEST(RecordRecentTest, CapsAtTenEntries) {
    DesktopConfig config;
    for (int i = 0; i < 15; ++i) {
        record_recent(config, "/w/" + std::to_string(i), static_cast<uint64_t>(i));
    }

    ASSERT_EQ(config.recent.size(), kMaxRecentWorks);
    EXPECT_EQ(config.recent.front().path, "/w/14");
    EXPECT_EQ(config.recent.back().path, "/w/5");
}

TEST(RecordRecentTest, NameHandlesTrailingSeparator) {
    DesktopConfig config;
    record_recent(config, "/works/novel/", 1);

    EXPECT_EQ(config.recent[0].name, "novel");
    EXPECT_EQ(config.recent[0].path, "/works/novel/");
}

TEST(DesktopConfigPathTest, DefaultsUnderHome) {
    fs::path path = default_desktop_config_path();

    EXPECT_EQ(path.filename(), "desktop.json");
    EXPECT_EQ(path.parent_path().filename(), ".littera");
}
