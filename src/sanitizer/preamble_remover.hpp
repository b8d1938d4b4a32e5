#pragma once

// ---------------------------------------------------------------------------
// preamble_remover.hpp
//
// 정규식 기반 대화형 서두(preamble) 제거기.
//
// [대상 패턴 (기본값, marker_table 에서 로드)]
// - I'll help you ...:   / I can help ...:
// - Here is ...:         / Here's ...:
// - Let me ...:          / This query ...:
// - To ...,              / To ...:
//
// [동작]
// - 입력 앞 공백을 제거한 뒤 우선순위 순서대로 시작 위치에서만 매칭한다.
// - 첫 번째 매칭이 이기며, 나머지 텍스트는 다시 스캔하지 않는다.
// - 매칭 구간이 첫 번째 SQL 문 시작을 넘어서면 그 매칭은 버리고
//   다음 패턴을 시도한다. "Here is the query: SELECT a: ..." 처럼
//   lazy 매칭이 SQL 안의 ':' 까지 먹는 경우를 막는다.
// - 정규식은 문장 시작 전, 최대 1024 바이트 창 안에서만 돈다.
//   더 긴 서두는 남기고 boundary_locator 에 맡긴다.
//
// [오탐/미탐 트레이드오프]
// - "To ..." 패턴은 넓다. "To_date" 같은 식별자는 \s+ 요구로 배제된다.
// - preamble 이 남더라도 boundary_locator 가 키워드 앞 텍스트를 잘라내므로
//   미탐은 결과에 영향이 적다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

#include "sanitizer/marker_table.hpp"

// ---------------------------------------------------------------------------
// PreambleResult
//   matched_marker 는 trace/로그용이다. 제거하지 않았으면 빈 문자열.
// ---------------------------------------------------------------------------
struct PreambleResult {
    std::string text{};
    std::string matched_marker{};
};

// ---------------------------------------------------------------------------
// PreambleRemover
//   생성 시 kPreamble 마커를 정규식으로 컴파일하고, remove() 에서 매칭.
//
//   [성능 고려사항]
//   - 생성자에서 std::regex 컴파일 비용이 발생하므로 인스턴스를 재사용할 것.
//   - remove() 는 const 이며 여러 스레드에서 동시에 호출해도 안전하다.
// ---------------------------------------------------------------------------
class PreambleRemover {
public:
    // markers: kPreamble 마커 목록 (우선순위 순)
    //   - 잘못된 정규식은 생성자에서 로깅 후 건너뛴다.
    explicit PreambleRemover(const std::vector<Marker>& markers);

    ~PreambleRemover();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    PreambleRemover(const PreambleRemover&)            = delete;
    PreambleRemover& operator=(const PreambleRemover&) = delete;
    PreambleRemover(PreambleRemover&&) noexcept;
    PreambleRemover& operator=(PreambleRemover&&) noexcept;

    [[nodiscard]] PreambleResult remove(std::string_view text) const;

    // 유효하게 컴파일된 패턴 수
    [[nodiscard]] std::size_t pattern_count() const noexcept;

private:
    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
};
