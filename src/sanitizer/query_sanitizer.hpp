#pragma once

// ---------------------------------------------------------------------------
// query_sanitizer.hpp
//
// LLM 응답 → SQL 문 / 답변 추출 파이프라인 진입점.
//
// [쿼리 경로]
//   raw → strip_labels → PreambleRemover::remove → trim_to_statement
//       → truncate_trailing → filter_explanation_lines → apply_safety_net
//
// [답변 경로]
//   raw → extract_answer (쿼리 경로와 독립 실행)
//
// [스레드 안전성]
// 생성 이후 불변이다. const 멤버 함수는 잠금 없이 동시에 호출할 수 있다.
//
// [오류 처리]
// 모든 실패는 std::expected 의 error 로 전달한다. 예외를 던지지 않으며
// 실패를 빈 문자열로 바꾸지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "sanitizer/answer_extractor.hpp"
#include "sanitizer/marker_table.hpp"
#include "sanitizer/preamble_remover.hpp"

// ---------------------------------------------------------------------------
// SanitizedQuery
//   sql:     SqlKeyword 로 시작하는 단일 SQL 문
//   keyword: 문장 시작 키워드
//   trace:   적용된 단계/마커 이름 (로그용)
// ---------------------------------------------------------------------------
struct SanitizedQuery {
    std::string              sql{};
    SqlKeyword               keyword{SqlKeyword::kSelect};
    std::vector<std::string> trace{};
};

// ---------------------------------------------------------------------------
// SanitizeOutcome
//   두 경로 모두 실패하면 query/answer 모두 error 를 가진다.
// ---------------------------------------------------------------------------
struct SanitizeOutcome {
    std::expected<SanitizedQuery, SanitizeError>  query;
    std::expected<SanitizedAnswer, SanitizeError> answer;
};

// ---------------------------------------------------------------------------
// QuerySanitizer
// ---------------------------------------------------------------------------
class QuerySanitizer {
public:
    // 내장 기본 마커 테이블 사용
    QuerySanitizer();

    // 설정에서 만든 마커 테이블 사용
    explicit QuerySanitizer(MarkerTable table);

    ~QuerySanitizer() = default;

    QuerySanitizer(const QuerySanitizer&)            = delete;
    QuerySanitizer& operator=(const QuerySanitizer&) = delete;
    QuerySanitizer(QuerySanitizer&&)                 = default;
    QuerySanitizer& operator=(QuerySanitizer&&)      = default;

    [[nodiscard]] std::expected<SanitizedQuery, SanitizeError>
    sanitize_query(std::string_view raw) const;

    [[nodiscard]] std::expected<SanitizedAnswer, SanitizeError>
    extract_answer(std::string_view raw) const;

    [[nodiscard]] SanitizeOutcome process(std::string_view raw) const;

    [[nodiscard]] const MarkerTable& markers() const noexcept { return table_; }

private:
    MarkerTable     table_;
    PreambleRemover preamble_;
};
