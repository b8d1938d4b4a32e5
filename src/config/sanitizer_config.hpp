#pragma once

// ---------------------------------------------------------------------------
// sanitizer_config.hpp
//
// 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/sanitizer.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없어도 기본값만으로
//   파이프라인이 동작해야 한다.
// - 마커 규칙은 기본 테이블에 "추가" 되는 것이 기본이다.
//   replace_defaults = true 일 때만 내장 테이블을 대체한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PreambleRule
//   텍스트 시작에 고정된 대화형 서두 정규식.
//   pattern 은 ECMAScript 문법이며 대소문자 무관으로 컴파일된다.
//   '^' 를 생략해도 시작 위치에서만 매칭한다 (match_continuous).
// ---------------------------------------------------------------------------
struct PreambleRule {
    std::string name{};
    std::string pattern{};
};

// ---------------------------------------------------------------------------
// TrailingRule
//   SQL 뒤에서 산문이 다시 시작되는 지점을 나타내는 구문.
//   phrase: "This query", "Note:" 처럼 공백으로 구분된 단어/구두점
//   newlines: 구문 앞에 필요한 최소 개행 수 (0 = 공백이면 충분)
//   capitalized: true 이면 phrase 를 무시하고 대문자 시작 단어에 매칭
// ---------------------------------------------------------------------------
struct TrailingRule {
    std::string  name{};
    std::string  phrase{};
    std::uint8_t newlines{0};
    bool         capitalized{false};
};

// ---------------------------------------------------------------------------
// MarkerRules
//   line_phrases 는 소문자로 정규화되어 저장된다.
// ---------------------------------------------------------------------------
struct MarkerRules {
    bool                      replace_defaults{false};
    std::vector<PreambleRule> preamble{};
    std::vector<TrailingRule> trailing{};
    std::vector<std::string>  line_phrases{};
    std::vector<std::string>  sentence_leads{};
};

// ---------------------------------------------------------------------------
// FallbackConfig
//   NoAnswerAvailable 시 결과 셋 모양으로 답변을 만드는 규칙.
//   currency_keywords: 컬럼명에 포함되면 통화 형식으로 출력
//   max_answer_chars:  이보다 긴 LLM 답변은 데이터 기반 답변으로 교체
//   small_result_rows: 이하 행 수면 "Query returned N result(s)."
// ---------------------------------------------------------------------------
struct FallbackConfig {
    std::string              currency_symbol{"$"};
    std::vector<std::string> currency_keywords{
        "price", "amount", "value", "total", "cost", "revenue", "sales", "payment",
    };
    std::uint32_t            max_answer_chars{500};
    std::uint32_t            small_result_rows{10};
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "debug"|"info"|"warn"|"error"
//   이벤트 로그는 항상 JSON 한 줄이다.
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/sqlsieve.log"};
};

// ---------------------------------------------------------------------------
// SanitizerConfig
//   전체 설정의 루트 구조체. ConfigLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct SanitizerConfig {
    GlobalConfig   global{};
    MarkerRules    markers{};
    FallbackConfig fallback{};
};
