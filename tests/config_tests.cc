#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "bootstrap_config.hpp"
#include "cli_args.hpp"

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

class SettingsFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("bambam_cfg_" + std::to_string(stamp));
        path_ = dir_ / SETTINGS_FILE;
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& text) {
        fs::create_directories(dir_);
        std::ofstream out(path_);
        out << text;
    }

    json readBack() const {
        std::ifstream in(path_);
        return json::parse(in);
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(SettingsFileTest, MissingFileIsCreatedFromDefaults) {
    json cfg;
    ASSERT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultSettings(), cfg, SETTINGS_FILE));
    ASSERT_TRUE(fs::exists(path_));
    EXPECT_EQ(readBack(), bootstrap_config::defaultSettings());

    Settings s = bootstrap_config::settingsFromJson(cfg);
    EXPECT_FALSE(s.uppercase);
    EXPECT_TRUE(s.soundEnabled);
    EXPECT_EQ(s.randomSeed, -1);
    EXPECT_EQ(s.logFile, "bambam.log");
}

TEST_F(SettingsFileTest, MissingKeysArePatched) {
    write(R"({ "dark": true, "image_blacklist": ["*spider*"] })");

    json cfg;
    ASSERT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultSettings(), cfg, SETTINGS_FILE));
    Settings s = bootstrap_config::settingsFromJson(cfg);
    EXPECT_TRUE(s.dark);
    EXPECT_EQ(s.imageBlacklist, std::vector<std::string>{"*spider*"});

    json saved = readBack();
    EXPECT_TRUE(saved.contains("deterministic_sounds"));
    EXPECT_TRUE(saved["dark"].get<bool>());
}

TEST_F(SettingsFileTest, WrongTypeFallsBackToDefault) {
    write(R"({ "uppercase": "yes please", "random_seed": 9 })");

    json cfg;
    ASSERT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultSettings(), cfg, SETTINGS_FILE));
    Settings s = bootstrap_config::settingsFromJson(cfg);
    EXPECT_FALSE(s.uppercase);
    EXPECT_EQ(s.randomSeed, 9);
}

TEST_F(SettingsFileTest, OutOfRangeSeedIsUnseeded) {
    for (const char* text : {R"({ "random_seed": 4294967296 })", R"({ "random_seed": -7 })"}) {
        write(text);
        json cfg;
        ASSERT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultSettings(), cfg, SETTINGS_FILE));
        Settings s = bootstrap_config::settingsFromJson(cfg);
        EXPECT_EQ(s.randomSeed, -1) << text;
        EXPECT_FALSE(bootstrap_config::engineOptions(s).randomSeed.has_value()) << text;
    }

    write(R"({ "random_seed": 4294967295 })");
    json cfg;
    ASSERT_TRUE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultSettings(), cfg, SETTINGS_FILE));
    EXPECT_EQ(bootstrap_config::settingsFromJson(cfg).randomSeed, 4294967295LL);
}

TEST_F(SettingsFileTest, BrokenFileIsReset) {
    write("{ not json");

    json cfg;
    EXPECT_FALSE(bootstrap_config::loadConfig(path_, bootstrap_config::defaultSettings(), cfg, SETTINGS_FILE));
    EXPECT_EQ(cfg, bootstrap_config::defaultSettings());
    EXPECT_EQ(readBack(), bootstrap_config::defaultSettings());
}

TEST(EngineOptionsTest, SeedAndExtensionCarryOver) {
    Settings s;
    s.uppercase = true;
    s.mute = true;
    s.randomSeed = 42;
    s.extension = "farm";

    bambam::EngineOptions opts = bootstrap_config::engineOptions(s);
    EXPECT_TRUE(opts.uppercaseLetters);
    EXPECT_TRUE(opts.startMuted);
    ASSERT_TRUE(opts.randomSeed.has_value());
    EXPECT_EQ(*opts.randomSeed, 42u);
    EXPECT_EQ(opts.activeExtensionName, std::string("farm"));

    s.randomSeed = -1;
    s.extension.clear();
    opts = bootstrap_config::engineOptions(s);
    EXPECT_FALSE(opts.randomSeed.has_value());
    EXPECT_FALSE(opts.activeExtensionName.has_value());
}

// ------------------------------------------------------------
// Command line
// ------------------------------------------------------------
bool parse(std::vector<std::string> args, CommandLine& out, std::string* err = nullptr) {
    args.insert(args.begin(), "bambam");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return parseCommandLine(static_cast<int>(argv.size()), argv.data(), out, err);
}

TEST(CommandLineTest, ShortAndLongFlags) {
    CommandLine cli;
    ASSERT_TRUE(parse({"-u", "--deterministic-sounds", "-D", "-m", "--nosound"}, cli));
    EXPECT_TRUE(cli.uppercase);
    EXPECT_TRUE(cli.deterministicSounds);
    EXPECT_TRUE(cli.dark);
    EXPECT_TRUE(cli.mute);
    EXPECT_TRUE(cli.noSound);
    EXPECT_FALSE(cli.help);
}

TEST(CommandLineTest, ValuesAndRepeats) {
    CommandLine cli;
    ASSERT_TRUE(parse({"--sound_blacklist", "*moo*", "--sound_blacklist=*baa*",
                       "--image_blacklist", "*spider*", "-e", "farm", "--seed", "42",
                       "--config", "/tmp/b.json"}, cli));
    EXPECT_EQ(cli.soundBlacklist, (std::vector<std::string>{"*moo*", "*baa*"}));
    EXPECT_EQ(cli.imageBlacklist, std::vector<std::string>{"*spider*"});
    EXPECT_EQ(cli.extension, std::string("farm"));
    EXPECT_EQ(cli.seed, 42LL);
    EXPECT_EQ(cli.configPath, std::string("/tmp/b.json"));
}

TEST(CommandLineTest, Errors) {
    CommandLine cli;
    std::string err;
    EXPECT_FALSE(parse({"--loud"}, cli, &err));
    EXPECT_NE(err.find("--loud"), std::string::npos);

    EXPECT_FALSE(parse({"--seed", "abc"}, cli, &err));
    EXPECT_FALSE(parse({"--seed=-3"}, cli, &err));
    EXPECT_FALSE(parse({"--seed", "4294967296"}, cli, &err));
    EXPECT_NE(err.find("4294967296"), std::string::npos);
    EXPECT_FALSE(parse({"--extension"}, cli, &err));
}

TEST(CommandLineTest, LargestSeedAccepted) {
    CommandLine cli;
    std::string err;
    ASSERT_TRUE(parse({"--seed", "4294967295"}, cli, &err)) << err;
    EXPECT_EQ(cli.seed, 4294967295LL);
}

TEST(CommandLineTest, FlagsOverrideSettings) {
    Settings s;
    s.soundBlacklist = {"*a*"};
    s.randomSeed = 7;

    CommandLine cli;
    ASSERT_TRUE(parse({"--nosound", "--sound_blacklist", "*b*", "--seed", "9", "-u"}, cli));
    applyCommandLine(cli, s);

    EXPECT_FALSE(s.soundEnabled);
    EXPECT_TRUE(s.uppercase);
    EXPECT_EQ(s.randomSeed, 9);
    EXPECT_EQ(s.soundBlacklist, (std::vector<std::string>{"*a*", "*b*"}));
}

TEST(CommandLineTest, AbsentFlagsKeepFileValues) {
    Settings s;
    s.dark = true;
    s.extension = "farm";

    CommandLine cli;
    ASSERT_TRUE(parse({}, cli));
    applyCommandLine(cli, s);
    EXPECT_TRUE(s.dark);
    EXPECT_EQ(s.extension, "farm");
    EXPECT_TRUE(s.soundEnabled);
}

} // namespace
