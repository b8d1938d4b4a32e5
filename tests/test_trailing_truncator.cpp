// ---------------------------------------------------------------------------
// test_trailing_truncator.cpp
//
// find_trailing_cut / truncate_trailing 단위 테스트.
//
// [테스트 범위]
// - \n\n + 대문자 문장 (double-newline-capitalized)
// - 개행 뒤 구문 마커 (This will, Note:)
// - 인라인 구문 마커 (which you)
// - 일반 설명 문장 (The/This + 소문자 단어)
// - 라벨 / 펜스에서 절단
// - 빈 줄 뒤 소문자 산문 (blank-line)
// - 빈 줄 뒤 대문자 절 키워드는 같은 문장으로 유지 (WHERE, UNION, ...)
// - 문자열 리터럴 / 식별자 안의 구문은 절단하지 않음
// - start_offset 이전의 텍스트는 검사하지 않음
// ---------------------------------------------------------------------------

#include "sanitizer/trailing_truncator.hpp"
#include "sanitizer/marker_table.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace {

const MarkerTable& table() {
    return default_marker_table();
}

}  // namespace

// ===========================================================================
// 구문 마커
// ===========================================================================

TEST(TrailingTruncator, DoubleNewlineCapitalized_Cut) {
    const std::string_view text = "SELECT * FROM orders\n\nThis query returns all orders.";
    const auto result = find_trailing_cut(text, table());

    EXPECT_TRUE(result.truncated());
    EXPECT_EQ(result.cut, text.find('\n'));
    EXPECT_EQ(result.marker, "trailing:double-newline-capitalized");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT * FROM orders");
}

TEST(TrailingTruncator, NewlineThisWill_Cut) {
    const auto result = find_trailing_cut("SELECT name FROM users\nThis will list every user", table());
    EXPECT_EQ(result.marker, "trailing:newline-this-will");
}

TEST(TrailingTruncator, NewlineNote_Cut) {
    const std::string_view text = "SELECT a FROM t\nNote: a is indexed";
    EXPECT_EQ(find_trailing_cut(text, table()).marker, "trailing:newline-note");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT a FROM t");
}

TEST(TrailingTruncator, InlineWhichYou_Cut) {
    const std::string_view text = "SELECT * FROM t LIMIT 10 which you could then use";
    const auto result = find_trailing_cut(text, table());

    EXPECT_EQ(result.marker, "trailing:inline-which-you");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT * FROM t LIMIT 10");
}

TEST(TrailingTruncator, TrailingSentence_Cut) {
    const std::string_view text = "SELECT id FROM users; The result has one row per user";
    const auto result = find_trailing_cut(text, table());

    EXPECT_EQ(result.marker, "trailing-sentence");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT id FROM users;");
}

// ===========================================================================
// 라벨 / 펜스 / 빈 줄
// ===========================================================================

TEST(TrailingTruncator, Label_Cut) {
    const std::string_view text = "SELECT 1\nSQLResult: [(1,)]";
    EXPECT_EQ(find_trailing_cut(text, table()).marker, "label");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT 1");
}

TEST(TrailingTruncator, Fence_Cut) {
    const std::string_view text = "SELECT 1\n```\nmore text";
    EXPECT_EQ(find_trailing_cut(text, table()).marker, "fence");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT 1");
}

TEST(TrailingTruncator, BlankLineLowercaseProse_Cut) {
    const std::string_view text = "SELECT a FROM t\n\nreturns the a column";
    EXPECT_EQ(find_trailing_cut(text, table()).marker, "blank-line");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT a FROM t");
}

TEST(TrailingTruncator, BlankLineBeforeClause_Kept) {
    const std::string_view text = "SELECT a\nFROM t\n\nWHERE a > 1";
    const auto result = find_trailing_cut(text, table());
    EXPECT_FALSE(result.truncated()) << "WHERE continues the statement, cut at: " << result.marker;
    EXPECT_EQ(truncate_trailing(text, table()), text);
}

TEST(TrailingTruncator, BlankLineBeforeUnion_Kept) {
    const std::string_view text = "SELECT a FROM t\n\nUNION SELECT a FROM u";
    EXPECT_FALSE(find_trailing_cut(text, table()).truncated());
}

TEST(TrailingTruncator, BlankLineAfterCteBody_Kept) {
    const std::string_view text = "WITH x AS (\n  SELECT 1\n)\n\nSELECT * FROM x";
    EXPECT_FALSE(find_trailing_cut(text, table()).truncated());
}

TEST(TrailingTruncator, BlankLineAfterComma_Kept) {
    const std::string_view text = "SELECT a,\n\nb FROM t";
    EXPECT_FALSE(find_trailing_cut(text, table()).truncated());
}

TEST(TrailingTruncator, BlankLineAfterSemicolon_Cut) {
    const std::string_view text = "SELECT 1;\n\nSELECT 2";
    EXPECT_EQ(find_trailing_cut(text, table()).marker, "blank-line");
    EXPECT_EQ(truncate_trailing(text, table()), "SELECT 1;");
}

// ===========================================================================
// 오탐 방지
// ===========================================================================

TEST(TrailingTruncator, PhraseInsideString_NotCut) {
    const std::string_view text = "SELECT * FROM t WHERE note = 'If you can'";
    EXPECT_FALSE(find_trailing_cut(text, table()).truncated());
}

TEST(TrailingTruncator, PhraseAsIdentifier_NotCut) {
    const std::string_view text = "SELECT based_on FROM t";
    EXPECT_FALSE(find_trailing_cut(text, table()).truncated());
}

TEST(TrailingTruncator, MultiLineQuery_NotCut) {
    const std::string_view text =
        "SELECT c.name, SUM(o.total) AS spent\n"
        "FROM customers c\n"
        "JOIN orders o ON o.customer_id = c.id\n"
        "GROUP BY c.name\n"
        "ORDER BY spent DESC";
    EXPECT_FALSE(find_trailing_cut(text, table()).truncated());
}

TEST(TrailingTruncator, NoTrailer_CutAtEnd) {
    const std::string_view text = "SELECT 1";
    const auto result = find_trailing_cut(text, table());
    EXPECT_FALSE(result.truncated());
    EXPECT_EQ(result.cut, text.size());
    EXPECT_TRUE(result.marker.empty());
}

// ===========================================================================
// start_offset
// ===========================================================================

TEST(TrailingTruncator, StartOffset_SkipsLeadingText) {
    const std::string_view text = "This query: SELECT 1\nThis will return one";
    const auto start  = text.find("SELECT");
    const auto result = find_trailing_cut(text, table(), start);

    EXPECT_EQ(result.cut, text.find("\nThis will"));
    EXPECT_EQ(result.marker, "trailing:newline-this-will");
}

// ===========================================================================
// 사용자 정의 마커
// ===========================================================================

TEST(TrailingTruncator, ConfiguredPhrase_Cut) {
    MarkerRules rules;
    rules.trailing.push_back(TrailingRule{"trailing:in-summary", "In summary", 1, false});
    const auto custom = build_marker_table(rules);

    const std::string_view text = "SELECT a FROM t\nIn summary, this lists a.";
    EXPECT_FALSE(find_trailing_cut(text, table()).truncated());
    EXPECT_EQ(find_trailing_cut(text, custom).marker, "trailing:in-summary");
}

TEST(TrailingTruncator, ConfiguredNewlineThreshold_Respected) {
    MarkerRules rules;
    rules.trailing.push_back(TrailingRule{"trailing:in-summary", "In summary", 1, false});
    const auto custom = build_marker_table(rules);

    EXPECT_FALSE(find_trailing_cut("SELECT a FROM t In summary, this lists a.", custom).truncated())
        << "one newline is required before the phrase";
}
