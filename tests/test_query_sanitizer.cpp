// ---------------------------------------------------------------------------
// test_query_sanitizer.cpp
//
// QuerySanitizer 통합 테스트 (전체 파이프라인).
//
// [테스트 범위]
// - preamble + LIMIT 로 끝나는 쿼리
// - \n\n 뒤 설명문 절단
// - 산문 중간에 시작하는 SQL ("Executive Summary: ... SELECT ...")
// - 키워드 없는 응답 → kNoStatementFound
// - Question/SQLQuery/SQLResult/Answer 체인 → 쿼리 + 답변
// - 서브쿼리 / CTE 보존
// - 인라인 설명문 ("LIMIT 10 which you could ...") 절단
// - 마크다운 펜스 + preamble + 설명 문장
// - 줄 필터 / 문자열 리터럴 보호
// - 멱등성: 정리된 SQL 을 다시 넣으면 그대로
// - trace 내용
// - 설정으로 만든 마커 테이블 사용
// - 소문자 SQL / 문자열 리터럴 속 설명 구문은 줄 필터에 걸리지 않음
// - 콜론 없는 매우 긴 서두
// - 문서화된 예시 입력 그대로 (CREATE 가 들어간 서두, 한 줄 체인)
//
// [알려진 한계]
// - 한 응답에 SQL 문이 여러 개면 첫 문장만 반환한다.
// ---------------------------------------------------------------------------

#include "sanitizer/query_sanitizer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

bool has_trace(const SanitizedQuery& query, const std::string& entry) {
    return std::find(query.trace.begin(), query.trace.end(), entry) != query.trace.end();
}

}  // namespace

// ===========================================================================
// 쿼리 경로
// ===========================================================================

TEST(QuerySanitizer, Preamble_RemovedLimitKept) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "I'll help you find the top customers:\n\n"
        "SELECT name FROM customers ORDER BY total DESC LIMIT 10");

    ASSERT_TRUE(query.has_value()) << query.error().message;
    EXPECT_EQ(query->sql, "SELECT name FROM customers ORDER BY total DESC LIMIT 10");
    EXPECT_EQ(query->keyword, SqlKeyword::kSelect);
    ASSERT_EQ(query->trace.size(), 1u);
    EXPECT_EQ(query->trace[0], "preamble:ill-help-you");
}

TEST(QuerySanitizer, DoubleNewlineExplanation_Cut) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query("SELECT * FROM orders\n\nThis query returns all orders.");

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, "SELECT * FROM orders");
    EXPECT_TRUE(has_trace(*query, "trailing:double-newline-capitalized"));
}

TEST(QuerySanitizer, StatementInsideProse_Found) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "Executive Summary: Our database contains SELECT * FROM customers WHERE country = 'USA'");

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, "SELECT * FROM customers WHERE country = 'USA'");
    ASSERT_EQ(query->trace.size(), 1u);
    EXPECT_EQ(query->trace[0], "boundary");
}

TEST(QuerySanitizer, NoKeyword_NoStatementFound) {
    const QuerySanitizer sanitizer;
    const std::string raw = "I'm sorry, I cannot answer that.";
    const auto query = sanitizer.sanitize_query(raw);

    ASSERT_FALSE(query.has_value());
    EXPECT_EQ(query.error().code, SanitizeErrorCode::kNoStatementFound);
    EXPECT_EQ(query.error().context, raw) << "context must preview the raw response";
}

TEST(QuerySanitizer, ProseOnlyWithKeywordWords_NoStatementFound) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query("Please select the region you want to update.");

    ASSERT_FALSE(query.has_value());
    EXPECT_EQ(query.error().code, SanitizeErrorCode::kNoStatementFound);
}

TEST(QuerySanitizer, Subquery_Preserved) {
    const QuerySanitizer sanitizer;
    const std::string sql =
        "SELECT name FROM customers WHERE id IN (SELECT customer_id FROM orders WHERE total > 100)";
    const auto query = sanitizer.sanitize_query(sql);

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, sql);
    EXPECT_TRUE(query->trace.empty());
}

TEST(QuerySanitizer, MultiLineCte_Preserved) {
    const QuerySanitizer sanitizer;
    const std::string sql =
        "WITH monthly AS (\n"
        "  SELECT month, SUM(amount) AS total\n"
        "  FROM payments\n"
        "  GROUP BY month\n"
        ")\n"
        "\n"
        "SELECT month, total\n"
        "FROM monthly\n"
        "ORDER BY total DESC";
    const auto query = sanitizer.sanitize_query(sql);

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->keyword, SqlKeyword::kWith);
    EXPECT_EQ(query->sql, sql) << "blank line after the CTE body must not cut the main SELECT";
}

TEST(QuerySanitizer, InlineWhichYou_Cut) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "SELECT * FROM orders LIMIT 10 which you could then use for charts");

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, "SELECT * FROM orders LIMIT 10");
    EXPECT_TRUE(has_trace(*query, "trailing:inline-which-you"));
}

TEST(QuerySanitizer, FencedWithPreambleAndExplanation) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "Here is the query:\n"
        "```sql\n"
        "SELECT id FROM users;\n"
        "```\n"
        "This returns every user id.");

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, "SELECT id FROM users;");
    const std::vector<std::string> expected{"labels", "preamble:here-is", "trailing-sentence"};
    EXPECT_EQ(query->trace, expected);
}

TEST(QuerySanitizer, ExplanationLine_Filtered) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "SELECT name\nFROM users\nyou can use this to list names");

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, "SELECT name\nFROM users");
    EXPECT_TRUE(has_trace(*query, "line-filter"));
}

TEST(QuerySanitizer, PhraseInsideStringLiteral_Kept) {
    const QuerySanitizer sanitizer;
    const std::string sql = "SELECT * FROM logs WHERE message = 'This query will fail'";
    const auto query = sanitizer.sanitize_query(sql);

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, sql);
}

TEST(QuerySanitizer, ParenTail_SafetyNetApplied) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "SELECT AVG(price) which gives the average price");

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, "SELECT AVG(price)");
    EXPECT_TRUE(has_trace(*query, "safety:paren-tail"));
}

TEST(QuerySanitizer, Idempotent_OnCleanSql) {
    const QuerySanitizer sanitizer;
    const auto first = sanitizer.sanitize_query(
        "Here's the SQL:\nSELECT c.name, COUNT(*) AS n\nFROM customers c\nGROUP BY c.name\n\n"
        "This groups customers by name.");
    ASSERT_TRUE(first.has_value());

    const auto second = sanitizer.sanitize_query(first->sql);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->sql, first->sql);
    EXPECT_TRUE(second->trace.empty()) << "clean SQL must pass through untouched";
}

TEST(QuerySanitizer, LowercaseSql_Idempotent) {
    const QuerySanitizer sanitizer;
    const std::string sql = "select theme from settings";
    const auto query = sanitizer.sanitize_query(sql);

    ASSERT_TRUE(query.has_value()) << query.error().message;
    EXPECT_EQ(query->sql, sql);
    EXPECT_TRUE(query->trace.empty());
}

TEST(QuerySanitizer, LowercaseClauseWithPhraseInString_Kept) {
    const QuerySanitizer sanitizer;
    const std::string sql = "SELECT id\nfrom logs\nwhere msg like '%if you%'";
    const auto query = sanitizer.sanitize_query(sql);

    ASSERT_TRUE(query.has_value()) << query.error().message;
    EXPECT_EQ(query->sql, sql) << "WHERE clause must survive";
}

TEST(QuerySanitizer, CaseExpressionWithPhraseInString_Kept) {
    const QuerySanitizer sanitizer;
    const std::string sql =
        "SELECT\n"
        "  CASE WHEN total > 100 THEN 'based on volume' ELSE 'other' END AS tier\n"
        "FROM orders";
    const auto query = sanitizer.sanitize_query(sql);

    ASSERT_TRUE(query.has_value()) << query.error().message;
    EXPECT_EQ(query->sql, sql);
}

TEST(QuerySanitizer, LongOpenerWithoutColon_Terminates) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "Here is " + std::string(50000, 'a') + " SELECT * FROM t");

    ASSERT_TRUE(query.has_value()) << query.error().message;
    EXPECT_EQ(query->sql, "SELECT * FROM t");
    EXPECT_TRUE(has_trace(*query, "boundary"));
}

// ===========================================================================
// 문서화된 예시 입력
// ===========================================================================

TEST(QuerySanitizer, Example_PreambleMentioningCreate) {
    const QuerySanitizer sanitizer;
    const auto query = sanitizer.sanitize_query(
        "I'll help you create a query to find the top 10 customers:\n\n"
        "SELECT c.id FROM customers c ORDER BY c.total DESC LIMIT 10");

    ASSERT_TRUE(query.has_value()) << query.error().message;
    EXPECT_EQ(query->sql, "SELECT c.id FROM customers c ORDER BY c.total DESC LIMIT 10");
    EXPECT_EQ(query->keyword, SqlKeyword::kSelect) << "'create a query' is prose, not CREATE";
}

TEST(QuerySanitizer, Example_SingleLineChain) {
    const QuerySanitizer sanitizer;
    const auto outcome = sanitizer.process(
        "Question: X? SQLQuery: SELECT 1 SQLResult: [(1,)] Answer: The result is 1.");

    ASSERT_TRUE(outcome.query.has_value()) << outcome.query.error().message;
    EXPECT_EQ(outcome.query->sql, "SELECT 1");
    ASSERT_TRUE(outcome.answer.has_value()) << outcome.answer.error().message;
    EXPECT_EQ(outcome.answer->text, "The result is 1.");
}

// ===========================================================================
// process: 쿼리 + 답변
// ===========================================================================

TEST(QuerySanitizer, Process_LabelledChain) {
    const QuerySanitizer sanitizer;
    const auto outcome = sanitizer.process(
        "Question: What is one?\n"
        "SQLQuery: SELECT 1\n"
        "SQLResult: [(1,)]\n"
        "Answer: The result is 1.");

    ASSERT_TRUE(outcome.query.has_value());
    EXPECT_EQ(outcome.query->sql, "SELECT 1");
    const std::vector<std::string> expected{"labels", "label"};
    EXPECT_EQ(outcome.query->trace, expected);

    ASSERT_TRUE(outcome.answer.has_value());
    EXPECT_EQ(outcome.answer->text, "The result is 1.");
    EXPECT_TRUE(outcome.answer->from_label);
}

TEST(QuerySanitizer, Process_BothFail) {
    const QuerySanitizer sanitizer;
    const auto outcome = sanitizer.process("");

    ASSERT_FALSE(outcome.query.has_value());
    EXPECT_EQ(outcome.query.error().code, SanitizeErrorCode::kNoStatementFound);
    ASSERT_FALSE(outcome.answer.has_value());
    EXPECT_EQ(outcome.answer.error().code, SanitizeErrorCode::kNoAnswerAvailable);
}

// ===========================================================================
// 설정 마커 테이블
// ===========================================================================

TEST(QuerySanitizer, ConfiguredMarkers_Applied) {
    MarkerRules rules;
    rules.preamble.push_back(PreambleRule{"preamble:certainly", R"(^Certainly[!.,]?\s+[\s\S]*?:\s*)"});
    rules.trailing.push_back(TrailingRule{"trailing:in-summary", "In summary", 1, false});

    const QuerySanitizer sanitizer(build_marker_table(rules));
    EXPECT_EQ(sanitizer.markers().preamble.size(), default_marker_table().preamble.size() + 1);

    const auto query = sanitizer.sanitize_query(
        "Certainly! Here you go:\nSELECT a FROM t\nIn summary, this lists a.");

    ASSERT_TRUE(query.has_value());
    EXPECT_EQ(query->sql, "SELECT a FROM t");
    const std::vector<std::string> expected{"preamble:certainly", "trailing:in-summary"};
    EXPECT_EQ(query->trace, expected);
}
