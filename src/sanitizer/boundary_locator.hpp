#pragma once

// ---------------------------------------------------------------------------
// boundary_locator.hpp
//
// SQL 문 시작 위치 탐지기.
// 키워드 토큰 다음에 "그럴듯한 SQL 연속" 이 올 때만 문장 시작으로 인정한다.
// "Select the best option" 같은 산문 속 키워드는 무시한다.
//
// [연속 조건]
// - SELECT [DISTINCT] → *, (, 숫자, 문자열, 식별자
//     식별자가 한정사(the, a, this ...)면 거부.
//     그 외에는 뒤에 , ( 연산자 FROM AS ... 끝/라벨이 오거나
//     키워드가 대문자이고 식별자가 SQL 스럽게 생겼을 때 인정.
// - INSERT → INTO | OR
// - DELETE → FROM
// - UPDATE → 식별자 SET | OR
// - CREATE → TABLE | VIEW | INDEX | UNIQUE | TEMP | TEMPORARY | TRIGGER
//            | VIRTUAL | OR | SCHEMA | DATABASE
// - DROP   → TABLE | VIEW | INDEX | TRIGGER | SCHEMA | DATABASE | IF
// - ALTER  → TABLE | VIEW | INDEX | TRIGGER | SCHEMA | DATABASE
// - WITH   → [RECURSIVE] 식별자 (AS | '(')
//
// [한계]
// - 문법 검증기가 아니다. 연속 토큰 하나 또는 두 개만 본다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "sanitizer/lexer.hpp"

// ---------------------------------------------------------------------------
// StatementStart
//   offset: 원문 기준 키워드 시작 바이트
// ---------------------------------------------------------------------------
struct StatementStart {
    std::size_t offset{0};
    SqlKeyword  keyword{SqlKeyword::kSelect};
};

// tokens[index] 가 그럴듯한 문장 시작 키워드인지 판단한다.
[[nodiscard]] bool is_statement_start(const TokenStream& tokens,
                                      std::string_view   source,
                                      std::size_t        index);

// 첫 번째 문장 시작 위치. 없으면 kNoStatementFound.
[[nodiscard]] std::expected<StatementStart, SanitizeError>
locate_statement(std::string_view text);

// 문장 시작 키워드 앞의 모든 텍스트를 잘라낸다.
[[nodiscard]] std::expected<std::string, SanitizeError>
trim_to_statement(std::string_view text);
