#pragma once

// ---------------------------------------------------------------------------
// safety_net.hpp
//
// 추출 파이프라인 마지막 단계. 앞 단계가 놓친 꼬리 산문을 잘라내고
// 결과가 SQL 키워드로 시작하는지 검증한다.
//
// [규칙]
// 1. 마지막 ')' 뒤 꼬리가 산문이면 ')' 직후에서 절단
//    - 꼬리가 비었거나 ';' 로 시작하면 유지
//    - 꼬리 첫 단어가 SQL 단어(AS, FROM, WHERE, ORDER ...)면 유지
//    - 설명 단어(this, the, will, query, provides ...)나
//      연속된 소문자 비-SQL 단어 두 개가 있어야 산문으로 본다
// 2. 마지막 "LIMIT <정수>" 뒤 꼬리에 소문자 3글자 연속이 있으면 절단
//    - 꼬리가 ';' 또는 ')' 로 시작하거나 첫 단어가 SQL 단어면 유지
//
// 결과가 비었거나 첫 토큰이 SqlKeyword 가 아니면 kEmptyAfterSanitization.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// SafetyNetResult
//   applied: 적용된 규칙 이름 목록 (trace 용). 예: "safety:paren-tail"
// ---------------------------------------------------------------------------
struct SafetyNetResult {
    std::string              sql{};
    SqlKeyword               keyword{SqlKeyword::kSelect};
    std::vector<std::string> applied{};
};

[[nodiscard]] std::expected<SafetyNetResult, SanitizeError> apply_safety_net(std::string_view text);
