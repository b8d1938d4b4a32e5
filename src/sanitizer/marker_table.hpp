#pragma once

// ---------------------------------------------------------------------------
// marker_table.hpp
//
// SQL 과 산문(preamble / 설명문)의 경계를 나타내는 마커 정의.
// 파이프라인 각 단계는 MarkerTable 을 const 참조로 받는 순수 함수다.
//
// [마커 종류]
// - kPreamble: 텍스트 시작에 고정된 정규식 (ECMAScript, icase)
//              예: "^I'll\s+help\s+you[\s\S]*?:\s*"
// - kTrailing: 토큰 단위 구문 매칭. 앞에 최소 min_newlines 개의 개행이
//              있어야 하며, 0 이면 공백 하나로 충분하다.
//              capitalized_lead 가 true 이면 pattern 대신 "대문자로 시작하는
//              임의의 문장형 단어" 에 매칭한다 (\n\n<Word>).
// - kLine:     소문자 부분 문자열. 한 줄에 포함되면 설명 줄로 본다.
//
// [스레드 안전성]
// default_marker_table() 은 함수 내부 static 으로 한 번만 생성되며
// 이후 읽기 전용이다. 동시 호출자 간 공유해도 안전하다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

#include "config/sanitizer_config.hpp"  // MarkerRules

// ---------------------------------------------------------------------------
// MarkerKind
// ---------------------------------------------------------------------------
enum class MarkerKind : std::uint8_t {
    kPreamble = 0,
    kTrailing = 1,
    kLine     = 2,
};

// ---------------------------------------------------------------------------
// Marker
//   이름이 있는 경계 패턴. 로그/trace 에는 name 만 기록한다.
// ---------------------------------------------------------------------------
struct Marker {
    std::string   name{};
    MarkerKind    kind{MarkerKind::kTrailing};
    std::string   pattern{};             // 정규식 / 구문 / 소문자 부분 문자열 (kind 별)
    std::uint8_t  min_newlines{0};       // kTrailing 전용
    bool          capitalized_lead{false};  // kTrailing 전용
};

// ---------------------------------------------------------------------------
// MarkerTable
//   파이프라인 전체가 공유하는 상수 설정.
//   preamble 은 우선순위 순서대로 나열한다 (첫 매칭 우선).
// ---------------------------------------------------------------------------
struct MarkerTable {
    std::vector<Marker>      preamble{};
    std::vector<Marker>      trailing{};
    std::vector<Marker>      line{};
    // 일반 trailing-sentence 규칙의 문장 시작 단어 (This, The, Note, Explanation)
    std::vector<std::string> sentence_leads{};
};

// 내장 기본 마커 테이블 (process-wide 상수).
[[nodiscard]] const MarkerTable& default_marker_table();

// 설정의 MarkerRules 를 기본 테이블에 합치거나 (replace_defaults=false)
// 기본 테이블을 대체한다 (replace_defaults=true).
[[nodiscard]] MarkerTable build_marker_table(const MarkerRules& rules);
