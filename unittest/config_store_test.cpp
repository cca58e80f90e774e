#include <gtest/gtest.h>
#include "config/config_store.hpp"
#include "test_utils.hpp"

using namespace snapkeep;
using namespace snapkeep::testing_utils;

class ConfigStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
    ConfigStore store_;
};

TEST_F(ConfigStoreTest, MissingFileLeavesStoreEmpty) {
    EXPECT_FALSE(store_.load(dir_.file("nope.json")));
    EXPECT_TRUE(store_.keys().empty());
    EXPECT_EQ(store_.profiles(), (std::vector<std::string>{"1"}));
    EXPECT_EQ(store_.profileName("1"), "Main profile");
}

TEST_F(ConfigStoreTest, MalformedFileThrows) {
    dir_.write("config.json", "{ not json");
    EXPECT_THROW(store_.load(dir_.file("config.json")), std::runtime_error);

    dir_.write("array.json", "[1, 2]");
    EXPECT_THROW(store_.load(dir_.file("array.json")), std::runtime_error);
}

TEST_F(ConfigStoreTest, SaveAndLoadRoundTrip) {
    store_.setIntValue("config.version", 6);
    store_.setProfileStrValue("snapshots.path", "/backup", "1");
    store_.setProfileBoolValue("schedule.debug", true, "1");
    std::string path = dir_.file("sub/dir/config.json");

    ASSERT_TRUE(store_.save(path));
    ConfigStore loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.data(), store_.data());
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(ConfigStoreTest, TypedGettersAcceptStringSpellings) {
    store_.setStrValue("a.int", "42");
    store_.setStrValue("a.bool", "true");
    store_.setStrValue("a.badint", "4x2");
    store_.setIntValue("a.number", 7);

    EXPECT_EQ(store_.intValue("a.int"), 42);
    EXPECT_TRUE(store_.boolValue("a.bool"));
    EXPECT_EQ(store_.intValue("a.badint", 5), 5);
    EXPECT_EQ(store_.strValue("a.number"), "7");
    EXPECT_EQ(store_.intValue("missing", -1), -1);
}

TEST_F(ConfigStoreTest, ProfilesListAndLegacySpelling) {
    store_.setListValue("profiles", nlohmann::json::array({"1", 2}));
    EXPECT_EQ(store_.profiles(), (std::vector<std::string>{"1", "2"}));

    store_.setStrValue("profiles", "1:3:");
    EXPECT_EQ(store_.profiles(), (std::vector<std::string>{"1", "3"}));
    EXPECT_EQ(store_.profileName("3"), "Profile 3");
}

TEST_F(ConfigStoreTest, AddProfileAllocatesNextId) {
    store_.setListValue("profiles", nlohmann::json::array({"1", "4"}));
    EXPECT_EQ(store_.addProfile("Laptop"), "5");
    EXPECT_EQ(store_.profileName("5"), "Laptop");
    EXPECT_EQ(store_.profiles().back(), "5");
}

TEST_F(ConfigStoreTest, RemapAndRemoveKeys) {
    store_.setProfileIntValue("old.key", 3, "2");
    EXPECT_TRUE(store_.remapProfileKey("old.key", "new.key", "2"));
    EXPECT_EQ(store_.profileIntValue("new.key", 0, "2"), 3);
    EXPECT_FALSE(store_.remapProfileKey("old.key", "new.key", "2"));

    store_.setBoolValue("qt4.a", true);
    store_.setBoolValue("qt4.b", false);
    EXPECT_EQ(store_.remapKeyRegex("^qt4\\.", "qt."), 2);
    EXPECT_TRUE(store_.hasKey("qt.a"));

    store_.setBoolValue("gnome.x", true);
    store_.setBoolValue("gnomish", true);
    EXPECT_EQ(store_.removeKeysStartingWith("gnome"), 1);
    EXPECT_TRUE(store_.hasKey("gnomish"));
}
