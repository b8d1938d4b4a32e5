#pragma once

// ---------------------------------------------------------------------------
// trailing_truncator.hpp
//
// SQL 문 뒤에 붙은 설명문/라벨을 잘라내는 단계.
//
// [절단 규칙] 같은 위치에서는 위에서부터 우선
// 1. 라벨 또는 펜스 토큰 (SQLResult:, Answer:, ``` ...)
// 2. kTrailing 마커 (\n\n<대문자 단어>, \nThis query, inline "which you" ...)
// 3. 일반 설명 문장: 공백 + This/The/Note/Explanation + (':' | 소문자 단어)
// 4. 빈 줄. 단, 다음 줄이 대문자 SQL 절(FROM, WHERE, ORDER ...)이나
//    괄호로 이어지면 같은 문장으로 본다. 직전 토큰이 ',' 이거나
//    ')' 뒤에 대문자 문장 키워드가 오는 경우(CTE 본문)도 마찬가지다.
//
// 토큰 단위로 한 번만 훑으므로 가장 앞선 절단 위치가 자동으로 선택된다.
// 문자열 리터럴과 주석 내부는 토큰이 아니므로 절단을 일으키지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

#include "sanitizer/marker_table.hpp"

// ---------------------------------------------------------------------------
// TruncationResult
//   cut:    원문 기준 절단 위치. 절단이 없으면 text.size()
//   marker: 절단을 일으킨 규칙 이름 (trace 용). 없으면 빈 문자열
// ---------------------------------------------------------------------------
struct TruncationResult {
    std::size_t cut{0};
    std::string marker{};

    [[nodiscard]] bool truncated() const noexcept { return !marker.empty(); }
};

// start_offset 위치의 토큰(보통 문장 시작 키워드) 이후에서 첫 절단 지점을 찾는다.
[[nodiscard]] TruncationResult find_trailing_cut(std::string_view   text,
                                                 const MarkerTable& table,
                                                 std::size_t        start_offset = 0);

// 첫 절단 지점 앞까지를 오른쪽 공백 제거 후 반환한다.
[[nodiscard]] std::string truncate_trailing(std::string_view text, const MarkerTable& table);
