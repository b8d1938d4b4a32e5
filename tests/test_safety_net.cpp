// ---------------------------------------------------------------------------
// test_safety_net.cpp
//
// apply_safety_net 단위 테스트.
//
// [테스트 범위]
// - 마지막 ')' 뒤 산문 꼬리 제거 (safety:paren-tail)
// - 마지막 LIMIT <정수> 뒤 산문 꼬리 제거 (safety:limit-tail)
// - SQL 연속 (FROM, OFFSET, ;) 은 제거하지 않음
// - 최종 검증: SqlKeyword 로 시작하지 않으면 kEmptyAfterSanitization
//
// [오탐/미탐 트레이드오프]
// - ')' 뒤 꼬리는 설명 단어(this, query, ...) 또는 SQL 이 아닌 소문자 단어
//   두 개가 이어질 때만 산문으로 본다. "COUNT(*) FROM orders" 는 유지된다.
// ---------------------------------------------------------------------------

#include "sanitizer/safety_net.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(SafetyNet, CleanSql_Unchanged) {
    const auto result = apply_safety_net("SELECT COUNT(*) FROM orders");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT COUNT(*) FROM orders");
    EXPECT_EQ(result->keyword, SqlKeyword::kSelect);
    EXPECT_TRUE(result->applied.empty());
}

TEST(SafetyNet, ParenTail_ProseRemoved) {
    const auto result = apply_safety_net(
        "SELECT id FROM orders WHERE id IN (1, 2) this query counts orders");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT id FROM orders WHERE id IN (1, 2)");
    ASSERT_EQ(result->applied.size(), 1u);
    EXPECT_EQ(result->applied[0], "safety:paren-tail");
}

TEST(SafetyNet, ParenTail_TwoProseWords) {
    const auto result = apply_safety_net("SELECT MAX(price) giving you the maximum");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT MAX(price)");
}

TEST(SafetyNet, ParenTail_SqlContinuationKept) {
    const auto result = apply_safety_net("SELECT SUM(total) AS revenue FROM orders o");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT SUM(total) AS revenue FROM orders o");
}

TEST(SafetyNet, ParenTail_SemicolonKept) {
    const auto result = apply_safety_net("INSERT INTO t (a) VALUES (1);");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "INSERT INTO t (a) VALUES (1);");
    EXPECT_EQ(result->keyword, SqlKeyword::kInsert);
}

TEST(SafetyNet, LimitTail_ProseRemoved) {
    const auto result = apply_safety_net("SELECT * FROM t LIMIT 5 rows for you");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT * FROM t LIMIT 5");
    ASSERT_EQ(result->applied.size(), 1u);
    EXPECT_EQ(result->applied[0], "safety:limit-tail");
}

TEST(SafetyNet, LimitTail_OffsetKept) {
    const auto result = apply_safety_net("SELECT * FROM t LIMIT 5 OFFSET 10");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT * FROM t LIMIT 5 OFFSET 10");
    EXPECT_TRUE(result->applied.empty());
}

TEST(SafetyNet, LimitTail_SemicolonKept) {
    const auto result = apply_safety_net("SELECT * FROM t LIMIT 5;");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT * FROM t LIMIT 5;");
}

TEST(SafetyNet, WithStatement_KeywordReported) {
    const auto result = apply_safety_net("WITH x AS (SELECT 1) SELECT * FROM x");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->keyword, SqlKeyword::kWith);
    EXPECT_EQ(result->sql, "WITH x AS (SELECT 1) SELECT * FROM x");
}

TEST(SafetyNet, SurroundingWhitespace_Trimmed) {
    const auto result = apply_safety_net("  \nSELECT 1\n\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sql, "SELECT 1");
}

TEST(SafetyNet, Empty_ReturnsError) {
    const auto result = apply_safety_net("   ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SanitizeErrorCode::kEmptyAfterSanitization);
}

TEST(SafetyNet, NotKeywordStart_ReturnsError) {
    const auto result = apply_safety_net("hello world");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SanitizeErrorCode::kEmptyAfterSanitization);
    EXPECT_EQ(result.error().context, "hello world");
}
