#pragma once

// ---------------------------------------------------------------------------
// fallback_answer.hpp
//
// 결과 셋 모양으로 만드는 데이터 기반 답변.
// extract_answer 가 kNoAnswerAvailable 을 돌려주었거나, LLM 답변이 지나치게
// 길어 일반적인 채움말로 보일 때 사용한다.
//
// [형식]
// - 0 행            → "No data found for the specified criteria."
// - 1 행 x 1 열     → "The <Column Title> is <value>"
//     컬럼명에 통화 키워드가 있고 값이 숫자면 "$1,234.50"
//     그 외 정수는 "1,234", 실수는 "1,234.57", 문자열은 그대로
// - small_result_rows 이하 → "Query returned N result(s)."
// - 그 이상          → "Found N result(s)."
//
// 질의 실행은 외부 협력자의 몫이다. 이 모듈은 모양(ResultShape)만 받는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/types.hpp"
#include "config/sanitizer_config.hpp"
#include "sanitizer/answer_extractor.hpp"

// 단일 셀 값. monostate = NULL
using CellValue = std::variant<std::monostate, std::int64_t, double, std::string>;

// ---------------------------------------------------------------------------
// ResultShape
//   single_value: 1x1 결과일 때만 채운다.
// ---------------------------------------------------------------------------
struct ResultShape {
    std::vector<std::string> columns{};
    std::size_t              row_count{0};
    std::optional<CellValue> single_value{};
};

// "total_revenue" → "Total Revenue"
[[nodiscard]] std::string title_case_column(std::string_view column);

// 1234567 → "1,234,567"
[[nodiscard]] std::string group_thousands(std::int64_t value);

[[nodiscard]] std::string format_fallback_answer(const ResultShape&    shape,
                                                 const FallbackConfig& config);

// ---------------------------------------------------------------------------
// resolve_answer
//   추출된 답변이 있고 max_answer_chars 이하이면 그대로 쓴다.
//   답변이 없거나 너무 길면 format_fallback_answer 결과로 대체한다.
//   결과가 0 행이면 추출된 답변과 무관하게 "No data found ..." 를 쓴다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string resolve_answer(const std::expected<SanitizedAnswer, SanitizeError>& answer,
                                         const ResultShape&                                   shape,
                                         const FallbackConfig&                                config);
