#include <gtest/gtest.h>

#include <string>
#include "ptt/title_sanitizer.h"

using ptt::clean_title;

TEST(CleanTitle, DotsBecomeSpacesWhenThereAreNoSpaces) {
    EXPECT_EQ(clean_title("Some.Movie.Name"), "Some Movie Name");
    EXPECT_EQ(clean_title("Movie.Name.2020.1080p-GROUP"), "Movie Name 2020 1080p-GROUP");
    EXPECT_EQ(clean_title("Mr. Robot"), "Mr. Robot");
}

TEST(CleanTitle, UnderscoresBecomeSpaces) {
    EXPECT_EQ(clean_title("Some_Movie"), "Some Movie");
}

TEST(CleanTitle, MovieFlagIsRemoved) {
    EXPECT_EQ(clean_title("Name (Movie)"), "Name");
    EXPECT_EQ(clean_title("[MOVIE] Name"), "Name");
}

TEST(CleanTitle, DisallowedSymbolsAtStartAndEnd) {
    EXPECT_EQ(clean_title("--Title--"), "Title");
    EXPECT_EQ(clean_title("Title:"), "Title");
    EXPECT_EQ(clean_title("Title {}"), "Title");
    EXPECT_EQ(clean_title("#1 Hit"), "#1 Hit");
    EXPECT_EQ(clean_title("Show Name (2019)"), "Show Name (2019)");
}

TEST(CleanTitle, RussianCastIsRemoved) {
    EXPECT_EQ(clean_title("Фильм (Иванов, Петров)"), "Фильм");
    EXPECT_EQ(clean_title("Movie (Иван)"), "Movie");
    EXPECT_EQ(clean_title("Movie / Film (Cast)"), "Movie / Film");
}

TEST(CleanTitle, ReleaseMarkingsAreRemoved) {
    EXPECT_EQ(clean_title("[ReleaseGroup] Show Name (2019)"), "Show Name (2019)");
    EXPECT_EQ(clean_title("【Group】 Title"), "Title");
    EXPECT_EQ(clean_title("★Group★ Title"), "Title");
    EXPECT_EQ(clean_title("Title [Group]"), "Title");
}

TEST(CleanTitle, AltTitlesAreRemoved) {
    EXPECT_EQ(clean_title("Название / Title"), "Title");
    EXPECT_EQ(clean_title("Title | 标题"), "Title");
    EXPECT_EQ(clean_title("Title / タイトル (Cast Info)"), "Title");
}

TEST(CleanTitle, NonEnglishTextIsKeptWhenItIsTheOnlyText) {
    EXPECT_EQ(clean_title("进击的巨人"), "进击的巨人");
    EXPECT_EQ(clean_title("Attack on Titan 进击的巨人"), "Attack on Titan");
    EXPECT_EQ(clean_title("进击的巨人 Attack on Titan"), "Attack on Titan");
}

TEST(CleanTitle, LongTitleIsCut) {
    EXPECT_EQ(clean_title(std::string(100000, 'a')), std::string(ptt::MAX_CLEAN_TITLE_LENGTH, 'a'));
    EXPECT_EQ(clean_title("[Group] " + std::string(200000, 'a') + " (x)"), std::string(504, 'a'));
}

TEST(CleanTitle, EmptyAndInvalidInput) {
    EXPECT_EQ(clean_title(""), "");
    EXPECT_EQ(clean_title("   "), "");

    std::string res;
    EXPECT_NO_THROW(res = clean_title("Title\xff"));
    EXPECT_EQ(res.rfind("Title", 0), 0u);
}

TEST(Trim, IsIdempotent) {
    const std::wstring once = ptt::trim(L"  a b \u3000\t");
    EXPECT_EQ(once, L"a b");
    EXPECT_EQ(ptt::trim(once), once);
    EXPECT_EQ(ptt::trim(L""), L"");
    EXPECT_EQ(ptt::trim(L" \n "), L"");
}
