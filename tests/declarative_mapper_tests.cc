#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "engine/declarative_mapper.hpp"
#include "engine/event_mapper.hpp"
#include "test_helpers.hpp"

namespace {

using namespace bambam;
using bambam::testing::key;
using json = nlohmann::json;

json farmDocument() {
    return json::parse(R"({
        "apiVersion": 0,
        "image": [
            { "check": [ { "type": "KeyDown" }, { "unicode": { "value": "a" } } ],
              "policy": "named_file", "args": ["cow.png"] },
            { "check": [ { "unicode": { "isdigit": true } } ], "policy": "font" },
            { "check": [ { "type": "pointermove" } ], "policy": "mark" },
            { "policy": "random" }
        ],
        "sound": [
            { "check": [ { "unicode": { "isalpha": true } } ], "policy": "deterministic" },
            { "policy": "random" }
        ]
    })");
}

ErrorReport parseFailure(const json& doc, bool soundRequired = false) {
    Extension ext;
    ErrorReport err;
    EXPECT_FALSE(parseExtension(doc, "event_map.json", soundRequired, ext, &err));
    return err;
}

TEST(DeclarativeMapperTest, FirstMatchingRuleWins) {
    Extension ext;
    ASSERT_TRUE(parseExtension(farmDocument(), "event_map.json", true, ext));
    DeclarativeMapper image(Channel::Image, ext.imageRules, ext.source);

    PolicyChoice a = image.map(key(U'a'));
    EXPECT_TRUE(a.matched);
    EXPECT_EQ(a.kind, PolicyKind::NamedFile);
    EXPECT_EQ(a.args, PolicyArgs{"cow.png"});

    EXPECT_EQ(image.map(key(U'7')).kind, PolicyKind::Font);
    EXPECT_EQ(image.map(key(U'b')).kind, PolicyKind::Random);
    EXPECT_EQ(image.map(InputEvent::pointer(EventKind::PointerMove, {5, 5})).kind, PolicyKind::Mark);
    EXPECT_EQ(image.map(InputEvent::deviceButton(3)).kind, PolicyKind::Random);
}

TEST(DeclarativeMapperTest, KeyDownFontElseRandom) {
    json doc = json::parse(R"({
        "apiVersion": 0,
        "image": [ { "check": [ { "type": "KeyDown" } ], "policy": "font" }, { "policy": "random" } ]
    })");
    Extension ext;
    ASSERT_TRUE(parseExtension(doc, "event_map.json", false, ext));
    DeclarativeMapper image(Channel::Image, ext.imageRules, ext.source);

    PolicyChoice k = image.map(key(U'a'));
    EXPECT_EQ(k.kind, PolicyKind::Font);
    EXPECT_TRUE(k.args.empty());

    PolicyChoice p = image.map(InputEvent::pointer(EventKind::PointerDown, {10, 10}));
    EXPECT_EQ(p.kind, PolicyKind::Random);
    EXPECT_TRUE(p.args.empty());
}

TEST(DeclarativeMapperTest, SoundRulesParsed) {
    Extension ext;
    ASSERT_TRUE(parseExtension(farmDocument(), "event_map.json", true, ext));
    ASSERT_TRUE(ext.soundRules.has_value());
    DeclarativeMapper sound(Channel::Sound, *ext.soundRules, ext.source);

    EXPECT_EQ(sound.map(key(U'z')).kind, PolicyKind::Deterministic);
    EXPECT_EQ(sound.map(key(U'1')).kind, PolicyKind::Random);
}

TEST(DeclarativeMapperTest, NoMatchIsReported) {
    json doc = json::parse(R"({
        "apiVersion": 0,
        "image": [ { "check": [ { "type": "KeyDown" } ], "policy": "font" } ]
    })");
    Extension ext;
    ASSERT_TRUE(parseExtension(doc, "event_map.json", false, ext));
    DeclarativeMapper image(Channel::Image, ext.imageRules, ext.source);

    EXPECT_FALSE(image.map(InputEvent::pointer(EventKind::PointerDown, {1, 1})).matched);
}

TEST(DeclarativeMapperTest, UnicodeChecksNeedACharacter) {
    Check alpha;
    alpha.type = Check::Type::UnicodeIsAlpha;
    alpha.flag = false;
    // isalpha=false does not match an event with no character at all
    EXPECT_FALSE(alpha.matches(InputEvent::deviceButton(1)));
    EXPECT_TRUE(alpha.matches(key(U'5')));
}

TEST(DeclarativeMapperTest, ReachableChoicesListEveryRule) {
    Extension ext;
    ASSERT_TRUE(parseExtension(farmDocument(), "event_map.json", true, ext));
    DeclarativeMapper image(Channel::Image, ext.imageRules, ext.source);
    EXPECT_EQ(image.reachableChoices().size(), 4u);
}

TEST(LegacyMapperTest, ImageChannelPicksByEventShape) {
    LegacyMapper mapper(Channel::Image);
    EXPECT_EQ(mapper.map(key(U'a')).kind, PolicyKind::Font);
    EXPECT_EQ(mapper.map(key(U'7')).kind, PolicyKind::Font);
    EXPECT_EQ(mapper.map(key(U'\u00e9')).kind, PolicyKind::Font);
    EXPECT_EQ(mapper.map(key(U'!')).kind, PolicyKind::Random);
    EXPECT_EQ(mapper.map(InputEvent::deviceButton(3)).kind, PolicyKind::Random);
    EXPECT_EQ(mapper.map(InputEvent::pointer(EventKind::PointerDown, {5, 5})).kind, PolicyKind::Mark);
}

TEST(LegacyMapperTest, DeterministicSoundsOnlyForKeys) {
    LegacyMapper mapper(Channel::Sound, true);
    EXPECT_EQ(mapper.map(key(U'a')).kind, PolicyKind::Deterministic);
    EXPECT_EQ(mapper.map(InputEvent::deviceButton(1)).kind, PolicyKind::Random);
}

TEST(ExtensionValidationTest, UnknownTopLevelKey) {
    json doc = farmDocument();
    doc["images"] = json::array();
    ErrorReport err = parseFailure(doc);
    EXPECT_EQ(err.code, "ERR_EXT_UNKNOWN_KEY");
    EXPECT_NE(err.message.find("images"), std::string::npos);
    EXPECT_NE(err.message.find("event_map.json"), std::string::npos);
}

TEST(ExtensionValidationTest, WrongApiVersion) {
    json doc = farmDocument();
    doc["apiVersion"] = 1;
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_API_VERSION");

    doc.erase("apiVersion");
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_API_VERSION");
}

TEST(ExtensionValidationTest, CheckWithTwoKeys) {
    json doc = farmDocument();
    doc["image"][0]["check"][0] = { {"type", "KeyDown"}, {"unicode", { {"value", "a"} }} };
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_BAD_CHECK");
}

TEST(ExtensionValidationTest, UnicodeWithTwoPredicates) {
    json doc = farmDocument();
    doc["image"][0]["check"][1] = { {"unicode", { {"value", "a"}, {"isalpha", true} }} };
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_BAD_CHECK");
}

TEST(ExtensionValidationTest, UnknownRuleKey) {
    json doc = farmDocument();
    doc["sound"][1]["volume"] = 11;
    ErrorReport err = parseFailure(doc);
    EXPECT_EQ(err.code, "ERR_EXT_UNKNOWN_KEY");
    EXPECT_NE(err.message.find("volume"), std::string::npos);
}

TEST(ExtensionValidationTest, PolicyFromTheWrongChannel) {
    json doc = farmDocument();
    doc["image"][3]["policy"] = "deterministic";
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_UNKNOWN_POLICY");

    doc = farmDocument();
    doc["sound"][1]["policy"] = "jingle";
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_UNKNOWN_POLICY");
}

TEST(ExtensionValidationTest, UnknownEventType) {
    json doc = farmDocument();
    doc["image"][0]["check"][0]["type"] = "Wiggle";
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_BAD_CHECK");
}

TEST(ExtensionValidationTest, SoundSectionOnlyRequiredWithSound) {
    json doc = farmDocument();
    doc.erase("sound");

    EXPECT_EQ(parseFailure(doc, true).code, "ERR_EXT_MISSING_SECTION");

    Extension ext;
    EXPECT_TRUE(parseExtension(doc, "event_map.json", false, ext));
    EXPECT_FALSE(ext.soundRules.has_value());
}

TEST(ExtensionValidationTest, ImageSectionRequired) {
    json doc = farmDocument();
    doc.erase("image");
    EXPECT_EQ(parseFailure(doc).code, "ERR_EXT_MISSING_SECTION");
}

// ------------------------------------------------------------
// File loading
// ------------------------------------------------------------
class ExtensionDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        dir_ = std::filesystem::temp_directory_path() / ("bambam_ext_" + std::to_string(stamp));
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write(const std::string& text) {
        std::ofstream out(dir_ / EXTENSION_FILE);
        out << text;
    }

    std::filesystem::path dir_;
};

TEST_F(ExtensionDirTest, LoadsFromDirectory) {
    write(farmDocument().dump(2));
    Extension ext;
    ASSERT_TRUE(loadExtension(dir_, true, ext));
    EXPECT_EQ(ext.directory, dir_);
    EXPECT_EQ(ext.imageRules.size(), 4u);
}

TEST_F(ExtensionDirTest, MalformedJson) {
    write("{ \"apiVersion\": 0, \"image\": [ ");
    Extension ext;
    ErrorReport err;
    EXPECT_FALSE(loadExtension(dir_, false, ext, &err));
    EXPECT_EQ(err.code, "ERR_EXT_PARSE");
}

TEST_F(ExtensionDirTest, MissingFile) {
    Extension ext;
    ErrorReport err;
    EXPECT_FALSE(loadExtension(dir_, false, ext, &err));
    EXPECT_EQ(err.code, "ERR_EXT_NOT_FOUND");
}

TEST(ShippedExtensionTest, ShapesExtensionIsValid) {
    const std::filesystem::path dir = std::filesystem::path(BAMBAM_SOURCE_DIR) / "extensions" / "shapes";
    Extension ext;
    ErrorReport err;
    ASSERT_TRUE(loadExtension(dir, true, ext, &err)) << err.message;
    EXPECT_EQ(ext.name, "shapes");

    DeclarativeMapper image(Channel::Image, ext.imageRules, ext.source);
    PolicyChoice c = image.map(key(U'c'));
    EXPECT_EQ(c.kind, PolicyKind::NamedFile);
    EXPECT_EQ(c.args, PolicyArgs{"red_circle.png"});
    EXPECT_EQ(image.map(key(U'q')).kind, PolicyKind::Font);
    EXPECT_EQ(image.map(InputEvent::pointer(EventKind::PointerMove, {0, 0})).kind, PolicyKind::Mark);
    EXPECT_TRUE(image.map(InputEvent::deviceButton(0)).matched);
}

} // namespace
