#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "engine/resource_set.hpp"

namespace {

namespace fs = std::filesystem;
using bambam::loadItems;
using bambam::Resource;
using bambam::ResourceCategory;
using bambam::ResourceSet;

bool loadUnless(const std::string& failing, const fs::path& path, Resource&) {
    return path.filename().string() != failing;
}

TEST(ResourceSetTest, LookupByName) {
    std::vector<Resource> items(2);
    items[0].name = "cow.wav";
    items[1].name = "dog.wav";
    ResourceSet set(items);

    ASSERT_EQ(set.size(), 2u);
    ASSERT_NE(set.find("dog.wav"), nullptr);
    EXPECT_EQ(set.find("dog.wav")->name, "dog.wav");
    EXPECT_EQ(set.find("cat.wav"), nullptr);
}

TEST(ResourceSetTest, DuplicateNamesKeepFirst) {
    std::vector<Resource> items(2);
    items[0].name = "cow.wav";
    items[0].path = "data/cow.wav";
    items[1].name = "cow.wav";
    items[1].path = "extra/cow.wav";
    ResourceSet set(items);

    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.find("cow.wav")->path, fs::path("data/cow.wav"));
}

TEST(LoadItemsTest, PartialFailureKeepsTheRest) {
    const std::vector<fs::path> paths{"data/a.wav", "data/b.wav", "data/c.wav"};
    ResourceSet out;
    ErrorReport err;

    bool ok = loadItems(paths, {},
                        [](const fs::path& p, Resource& r) { return loadUnless("b.wav", p, r); },
                        ResourceCategory::Sounds, out, &err);

    ASSERT_TRUE(ok);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out.at(0).name, "a.wav");
    EXPECT_EQ(out.at(1).name, "c.wav");
    EXPECT_EQ(out.find("b.wav"), nullptr);
}

TEST(LoadItemsTest, TotalFailureNamesTheCategory) {
    const std::vector<fs::path> paths{"data/a.wav", "data/b.wav", "data/c.wav"};
    ResourceSet out;
    ErrorReport err;

    bool ok = loadItems(paths, {}, [](const fs::path&, Resource&) { return false; },
                        ResourceCategory::Sounds, out, &err);

    EXPECT_FALSE(ok);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(err.code, "ERR_SOUNDS_ALL_FAILED");
    EXPECT_EQ(err.message, "All sounds failed to load.");
}

TEST(LoadItemsTest, ImageCategoryMessage) {
    ResourceSet out;
    ErrorReport err;
    EXPECT_FALSE(loadItems({"x.png"}, {}, [](const fs::path&, Resource&) { return false; },
                           ResourceCategory::Images, out, &err));
    EXPECT_EQ(err.message, "All images failed to load.");
}

TEST(LoadItemsTest, BlacklistedItemsAreNeverLoaded) {
    std::vector<std::string> attempted;
    ResourceSet out;

    bool ok = loadItems({"data/a.wav", "data/scary/b.wav", "data/c.ogg"},
                        {"*scary*", "*.ogg"},
                        [&](const fs::path& p, Resource&) {
                            attempted.push_back(p.filename().string());
                            return true;
                        },
                        ResourceCategory::Sounds, out);

    ASSERT_TRUE(ok);
    EXPECT_EQ(attempted, std::vector<std::string>{"a.wav"});
    EXPECT_EQ(out.size(), 1u);
}

TEST(LoadItemsTest, NothingToLoadIsNotAnError) {
    ResourceSet out;
    EXPECT_TRUE(loadItems({}, {}, [](const fs::path&, Resource&) { return true; },
                          ResourceCategory::Images, out));
    EXPECT_TRUE(out.empty());
}

TEST(GlobMatchTest, Wildcards) {
    EXPECT_TRUE(bambam::globMatch("cow.wav", "*.wav"));
    EXPECT_FALSE(bambam::globMatch("cow.ogg", "*.wav"));
    EXPECT_TRUE(bambam::globMatch("cow.wav", "c?w.wav"));
    EXPECT_TRUE(bambam::globMatch("cow.wav", "[bc]ow.wav"));
    EXPECT_FALSE(bambam::globMatch("cow.wav", "[!c]ow.wav"));
    EXPECT_TRUE(bambam::globMatch("/usr/share/bambam/data/cow.wav", "*/data/*"));
    EXPECT_TRUE(bambam::globMatch("", "*"));
    EXPECT_FALSE(bambam::globMatch("cow", ""));
}

TEST(GlobMatchTest, BlacklistMatchesPathOrName) {
    EXPECT_TRUE(bambam::isBlacklisted("/data/animals/cow.wav", {"cow.*"}));
    EXPECT_TRUE(bambam::isBlacklisted("/data/animals/cow.wav", {"*/animals/*"}));
    EXPECT_FALSE(bambam::isBlacklisted("/data/animals/cow.wav", {"dog.*"}));
    EXPECT_FALSE(bambam::isBlacklisted("/data/animals/cow.wav", {}));
}

} // namespace
