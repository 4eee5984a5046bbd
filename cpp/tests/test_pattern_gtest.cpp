// ==============================================================================
// test_pattern_gtest.cpp - Тесты сопоставления имён и строк (GoogleTest)
// ==============================================================================

#include "filescanner/pattern.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace filescanner::pattern::test {

// ==============================================================================
// matches_glob
// ==============================================================================

TEST(PatternTest, MatchesGlob_CaseInsensitive) {
    EXPECT_TRUE(matches_glob("my_Password.txt", "*PASSWORD*"));
    EXPECT_TRUE(matches_glob("CONFIG.BAK", "*.bak"));
}

TEST(PatternTest, MatchesGlob_WholeNameOnly) {
    EXPECT_FALSE(matches_glob("config.bak.old", "*.bak"));
    EXPECT_FALSE(matches_glob("xid_rsa", "id_rsa"));
    EXPECT_TRUE(matches_glob("id_rsa", "id_rsa"));
}

TEST(PatternTest, MatchesGlob_QuestionMark) {
    EXPECT_TRUE(matches_glob("a1.log", "a?.log"));
    EXPECT_FALSE(matches_glob("a12.log", "a?.log"));
}

TEST(PatternTest, MatchesGlob_CharacterClass) {
    EXPECT_TRUE(matches_glob("key1.pem", "key[0-9].pem"));
    EXPECT_FALSE(matches_glob("keyx.pem", "key[0-9].pem"));
    EXPECT_TRUE(matches_glob("keyx.pem", "key[!0-9].pem"));
    EXPECT_FALSE(matches_glob("key5.pem", "key[!0-9].pem"));
}

TEST(PatternTest, MatchesGlob_UnclosedBracketIsLiteral) {
    EXPECT_TRUE(matches_glob("[abc", "[abc"));
    EXPECT_FALSE(matches_glob("a", "[abc"));
}

TEST(PatternTest, MatchesGlob_RegexMetacharactersAreLiteral) {
    EXPECT_TRUE(matches_glob("web.config", "web.config"));
    EXPECT_FALSE(matches_glob("webxconfig", "web.config"));
    EXPECT_TRUE(matches_glob("a+b(1).txt", "a+b(1).txt"));
    EXPECT_TRUE(matches_glob("$HOME.env", "$HOME.env"));
}

TEST(PatternTest, MatchesGlob_StarMatchesEmpty) {
    EXPECT_TRUE(matches_glob(".env", "*.env"));
    EXPECT_TRUE(matches_glob("", "*"));
}

TEST(PatternTest, MatchesAny_AnyPattern) {
    std::vector<std::string> globs = {"*.kdbx", "id_rsa", "*.pem"};
    EXPECT_TRUE(matches_any("server.PEM", globs));
    EXPECT_TRUE(matches_any("id_rsa", globs));
    EXPECT_FALSE(matches_any("id_rsa.pub", globs));
    EXPECT_FALSE(matches_any("anything", {}));
}

// ==============================================================================
// glob_to_regex
// ==============================================================================

TEST(PatternTest, GlobToRegex_Anchored) {
    std::string re = glob_to_regex("*.bak");
    EXPECT_EQ(re.front(), '^');
    EXPECT_EQ(re.back(), '$');
    EXPECT_NE(re.find("\\.bak"), std::string::npos);
}

// ==============================================================================
// GlobSet
// ==============================================================================

TEST(PatternTest, GlobSet_CountMatches) {
    auto built = GlobSet::build({"*.txt", "secret*", "*"});
    ASSERT_TRUE(built.ok) << built.error;
    const auto& set = *built.value;

    EXPECT_EQ(set.size(), 3u);
    EXPECT_EQ(set.count_matches("secret.txt"), 3u);
    EXPECT_EQ(set.count_matches("notes.md"), 1u);
    EXPECT_TRUE(set.matches_any("notes.md"));
}

TEST(PatternTest, GlobSet_Empty) {
    auto built = GlobSet::build({});
    ASSERT_TRUE(built.ok);
    EXPECT_TRUE(built.value->empty());
    EXPECT_FALSE(built.value->matches_any("x"));
}

TEST(PatternTest, GlobSet_InvalidRange_Error) {
    auto built = GlobSet::build({"[z-a]"});
    EXPECT_FALSE(built.ok);
    EXPECT_FALSE(built.error.empty());
}

// ==============================================================================
// KeywordMatcher / search_line
// ==============================================================================

TEST(PatternTest, KeywordMatcher_CaseInsensitiveSubstring) {
    auto built = KeywordMatcher::build({"secret", "token"});
    ASSERT_TRUE(built.ok) << built.error;
    const auto& m = *built.value;

    EXPECT_TRUE(m.search("export TOKEN=abc"));
    EXPECT_TRUE(m.search("my_Secret_value"));
    EXPECT_FALSE(m.search("nothing to see here"));
}

TEST(PatternTest, KeywordMatcher_KeywordsAreRegex) {
    auto built = KeywordMatcher::build({"pass(word)?=", "api[_-]key"});
    ASSERT_TRUE(built.ok) << built.error;

    EXPECT_TRUE(built.value->search("PASS=hunter2"));
    EXPECT_TRUE(built.value->search("Api-Key: 123"));
    EXPECT_FALSE(built.value->search("passport"));
}

TEST(PatternTest, KeywordMatcher_LongLineWithQuantifier_NoMatch) {
    auto built = KeywordMatcher::build({"pass.*word"});
    ASSERT_TRUE(built.ok) << built.error;

    // Одна строка в сотни тысяч символов (минифицированный bundle)
    std::string line = "pass" + std::string(200000, 'a');
    EXPECT_FALSE(built.value->search(line));
}

TEST(PatternTest, KeywordMatcher_LongLine_MatchNearEnd) {
    auto built = KeywordMatcher::build({"pass.*word"});
    ASSERT_TRUE(built.ok) << built.error;

    std::string line = std::string(200000, 'a') + "password=hunter2";
    EXPECT_TRUE(built.value->search(line));
}

TEST(PatternTest, KeywordMatcher_LongLine_MatchAcrossWindowBoundary) {
    auto built = KeywordMatcher::build({"api_key=[0-9]+"});
    ASSERT_TRUE(built.ok) << built.error;

    // Совпадение пересекает позицию 2048
    std::string line = std::string(2040, 'x') + "api_key=12345" + std::string(5000, 'y');
    EXPECT_TRUE(built.value->search(line));
}

TEST(PatternTest, KeywordMatcher_LongLine_AnchorsStayAnchored) {
    auto built = KeywordMatcher::build({"^token"});
    ASSERT_TRUE(built.ok) << built.error;

    // "token" в середине строки не должен совпасть с ^
    std::string line = std::string(3000, 'x') + "token" + std::string(3000, 'x');
    EXPECT_FALSE(built.value->search(line));
    EXPECT_TRUE(built.value->search("token" + std::string(6000, 'x')));
}

TEST(PatternTest, SearchLine_LongLine_DoesNotCrash) {
    std::string line = "secret" + std::string(100000, ' ');
    EXPECT_TRUE(search_line(line, "secret.*x|secret"));
}

TEST(PatternTest, KeywordMatcher_EmptyKeywords_Error) {
    auto built = KeywordMatcher::build({});
    EXPECT_FALSE(built.ok);
}

TEST(PatternTest, KeywordMatcher_InvalidRegex_Error) {
    auto built = KeywordMatcher::build({"(unclosed"});
    EXPECT_FALSE(built.ok);
    EXPECT_NE(built.error.find("(unclosed"), std::string::npos);
}

TEST(PatternTest, SearchLine_Alternation) {
    EXPECT_TRUE(search_line("export TOKEN=abc", "secret|token"));
    EXPECT_FALSE(search_line("export PATH=/bin", "secret|token"));
    EXPECT_TRUE(search_line("DB_SECRET", join_alternation({"secret"})));
}

TEST(PatternTest, JoinAlternation_PipeSeparated) {
    EXPECT_EQ(join_alternation({"a", "b", "c"}), "a|b|c");
    EXPECT_EQ(join_alternation({}), "");
}

}  // namespace filescanner::pattern::test
