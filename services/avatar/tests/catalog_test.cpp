#include "../include/catalog.hpp"
#include <gtest/gtest.h>

namespace {

SynthesisRequest make(const std::string& voice, const std::string& character, const std::string& style) {
    SynthesisRequest r;
    r.text = "hello";
    r.voice = voice;
    r.avatar_character = character;
    r.avatar_style = style;
    return r;
}

TEST(CatalogTest, DefaultsAreValid) {
    SynthesisRequest r;
    r.text = "hello";
    EXPECT_FALSE(validate_avatar_params(r).has_value());
}

TEST(CatalogTest, EveryCatalogEntryValidates) {
    for (const auto& kv : avatar_catalog()) {
        for (const auto& style : kv.second) {
            EXPECT_FALSE(validate_avatar_params(make("th-TH-AcharaNeural", kv.first, style)).has_value())
                << kv.first << "/" << style;
        }
    }
    EXPECT_EQ(avatar_catalog().size(), 6u);
    EXPECT_EQ(avatar_catalog().at("lisa").size(), 5u);
}

TEST(CatalogTest, VoiceCheckedFirst) {
    auto err = validate_avatar_params(make("th-TH-Unknown", "nobody", "none"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "Invalid voice 'th-TH-Unknown'. See GET /voices for options.");
}

TEST(CatalogTest, UnknownCharacter) {
    auto err = validate_avatar_params(make("th-TH-NiwatNeural", "bob", "casual"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "Invalid character 'bob'. See GET /models for options.");
}

TEST(CatalogTest, StyleMustBelongToCharacter) {
    auto err = validate_avatar_params(make("th-TH-NiwatNeural", "harry", "formal"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "Invalid style 'formal' for character 'harry'. Valid: ['business', 'casual', 'youthful']");
}

} // namespace
