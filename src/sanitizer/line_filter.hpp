#pragma once

// ---------------------------------------------------------------------------
// line_filter.hpp
//
// 줄 단위 설명문 필터.
// 줄의 단어 토큰에 kLine 구문이 단어 경계로 들어 있으면 그 줄부터 끝까지를 버린다.
// 문자열 리터럴과 주석 안의 구문은 보지 않는다.
//
// [SQL 줄 면제]
// - 괄호로 시작하는 줄
// - 그럴듯한 문장 시작 키워드로 시작하는 줄 ("Select the ..." 는 산문)
// - FROM, WHERE, GROUP BY, ORDER BY, LIMIT, JOIN 로 시작하는 줄 (대소문자 무관)
// - AND, OR 로 시작하는 줄 (대문자일 때만)
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

#include "sanitizer/marker_table.hpp"

// 남은 줄은 '\n' 으로 다시 잇는다.
[[nodiscard]] std::string filter_explanation_lines(std::string_view text, const MarkerTable& table);
