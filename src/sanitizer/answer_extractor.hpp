#pragma once

// ---------------------------------------------------------------------------
// answer_extractor.hpp
//
// 사람이 읽을 답변 텍스트 추출기. 쿼리 추출 경로와 독립적으로 원문에서 실행된다.
//
// [동작]
// - Answer: 라벨이 있으면 첫 번째 라벨 뒤 전체를 답변 본문으로 삼는다.
//     Question: / SQLQuery: / SQLResult: 하위 섹션 (라벨 ~ 다음 라벨) 제거
//     뒤따르는 Answer: 라벨과 펜스 제거 (내용은 유지)
// - Answer: 는 없고 SQLQuery: / SQLResult: 만 있으면 kNoAnswerAvailable.
//   체인 디버그 출력을 답변으로 보여주지 않기 위함이다.
// - 라벨이 전혀 없으면 SQL 문 뒤의 산문을, SQL 이 없으면 텍스트 전체를 쓴다.
//
// 공통 정리: SQL 문으로 시작하는 줄은 trailing_truncator 절단 지점까지 제거,
// 연속 빈 줄은 하나로 합치고, 앞뒤 공백을 제거한다.
// 결과가 비면 kNoAnswerAvailable. 호출자는 fallback_answer 로 대체 답변을 만든다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "sanitizer/marker_table.hpp"

// ---------------------------------------------------------------------------
// SanitizedAnswer
//   from_label: Answer: 라벨에서 가져왔는지 (false = 산문 추정)
// ---------------------------------------------------------------------------
struct SanitizedAnswer {
    std::string text{};
    bool        from_label{false};
};

[[nodiscard]] std::expected<SanitizedAnswer, SanitizeError>
extract_answer(std::string_view raw, const MarkerTable& table);
