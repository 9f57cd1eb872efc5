#include <gtest/gtest.h>
#include "stt/Language.hpp"

TEST(LanguageTest, DefaultIsAuto) {
    Language l;
    EXPECT_TRUE(l.isAuto());
    EXPECT_EQ(l.code(), "auto");
}

TEST(LanguageTest, CodesRoundTrip) {
    EXPECT_EQ(Language(Language::Id::French).code(), "fr");
    EXPECT_EQ(Language(Language::Id::English).code(), "en");
    EXPECT_EQ(Language(Language::Id::Spanish).code(), "es");
    EXPECT_EQ(Language(Language::Id::German).code(), "de");
    EXPECT_EQ(Language(Language::Id::Italian).code(), "it");
    EXPECT_EQ(Language(Language::Id::Portuguese).code(), "pt");
}

TEST(LanguageTest, FromCodeIsCaseInsensitive) {
    EXPECT_EQ(Language::fromCode("FR"), Language(Language::Id::French));
    EXPECT_EQ(Language::fromCode("French"), Language(Language::Id::French));
    EXPECT_EQ(Language::fromCode("english"), Language(Language::Id::English));
    EXPECT_EQ(Language::fromCode("AUTO"), Language(Language::Id::Auto));
}

TEST(LanguageTest, UnknownCodeBecomesOther) {
    auto l = Language::fromCode("JA");
    EXPECT_EQ(l.id(), Language::Id::Other);
    EXPECT_EQ(l.code(), "ja");
    EXPECT_EQ(l.displayName(), "ja");
    EXPECT_EQ(l, Language::other("ja"));
    EXPECT_NE(l, Language::other("ko"));
}

TEST(LanguageTest, DisplayNames) {
    EXPECT_EQ(Language(Language::Id::German).displayName(), "German");
    EXPECT_EQ(Language().displayName(), "Auto");
}
