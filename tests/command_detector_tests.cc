#include <gtest/gtest.h>

#include <string>

#include "engine/command_detector.hpp"

namespace {

using bambam::CommandDetector;
using bambam::CommandWord;

std::optional<CommandWord> typeAll(CommandDetector& detector, const std::u32string& text) {
    std::optional<CommandWord> last;
    for (char32_t c : text) {
        if (auto cmd = detector.observe(c)) {
            last = cmd;
        }
    }
    return last;
}

TEST(CommandDetectorTest, QuitInAnyCase) {
    for (const std::u32string word : {U"quit", U"QUIT", U"QuIt", U"qUIT"}) {
        CommandDetector detector;
        EXPECT_EQ(typeAll(detector, word), CommandWord::Quit);
    }
}

TEST(CommandDetectorTest, QuitInsideLongerMashing) {
    CommandDetector detector;
    EXPECT_EQ(typeAll(detector, U"asdfjklquitzz"), CommandWord::Quit);
}

TEST(CommandDetectorTest, PrefixesDoNotMatch) {
    CommandDetector detector;
    EXPECT_FALSE(typeAll(detector, U"q").has_value());
    EXPECT_FALSE(typeAll(detector, U"u").has_value());
    EXPECT_FALSE(typeAll(detector, U"i").has_value());
    EXPECT_EQ(detector.buffer(), U"qui");
}

TEST(CommandDetectorTest, MatchFiresOnCompletingCharacter) {
    CommandDetector detector;
    EXPECT_FALSE(detector.observe(U'm'));
    EXPECT_FALSE(detector.observe(U'u'));
    EXPECT_FALSE(detector.observe(U't'));
    EXPECT_EQ(detector.observe(U'e'), CommandWord::Mute);
    EXPECT_TRUE(detector.buffer().empty());
}

TEST(CommandDetectorTest, UnmuteWinsOverMute) {
    CommandDetector detector;
    for (char32_t c : std::u32string(U"unmut")) {
        EXPECT_FALSE(detector.observe(c).has_value()) << static_cast<char>(c);
    }
    EXPECT_EQ(detector.observe(U'e'), CommandWord::Unmute);
    EXPECT_TRUE(detector.buffer().empty());
}

TEST(CommandDetectorTest, BufferClearedAfterMatch) {
    CommandDetector detector;
    EXPECT_EQ(typeAll(detector, U"mute"), CommandWord::Mute);
    // "te" left over would not form a second match
    EXPECT_FALSE(detector.observe(U't'));
    EXPECT_EQ(detector.buffer(), U"t");
}

TEST(CommandDetectorTest, BufferIsBounded) {
    CommandDetector detector;
    for (int i = 0; i < 100; ++i) {
        detector.observe(U'a');
    }
    EXPECT_EQ(detector.buffer().size(), CommandDetector::kMaxBuffer);
    EXPECT_EQ(typeAll(detector, U"quit"), CommandWord::Quit);
}

TEST(CommandDetectorTest, ResetDropsPartialWord) {
    CommandDetector detector;
    typeAll(detector, U"qui");
    detector.reset();
    EXPECT_FALSE(detector.observe(U't'));
}

} // namespace
