#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 추출 결과 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_query_result / on_answer: 여러 스레드에서 동시에 호출해도 안전 (atomic).
// - snapshot(): 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 갱신 실패가 추출 경로로 전파되지 않도록 모든 갱신 메서드는
//   noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

// ---------------------------------------------------------------------------
// AnswerSource
//   kLabel:    Answer: 섹션에서 추출
//   kProse:    라벨 없는 응답의 SQL 밖 산문
//   kFallback: 결과 셋 모양으로 생성한 데이터 기반 답변
// ---------------------------------------------------------------------------
enum class AnswerSource : std::uint8_t {
    kLabel    = 0,
    kProse    = 1,
    kFallback = 2,
};

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   extraction_rate: extracted_queries / total_responses (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_responses{0};
    std::uint64_t                              extracted_queries{0};
    std::uint64_t                              no_statement{0};
    std::uint64_t                              empty_after_sanitization{0};
    std::uint64_t                              labelled_answers{0};
    std::uint64_t                              prose_answers{0};
    std::uint64_t                              fallback_answers{0};
    double                                     extraction_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept = default;

    ~StatsCollector() = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_query_result
    //   응답 하나의 쿼리 추출이 끝났을 때 호출.
    //   error: 실패 코드. 성공이면 std::nullopt
    void on_query_result(std::optional<SanitizeErrorCode> error) noexcept {
        total_responses_.fetch_add(1, std::memory_order_relaxed);
        if (!error.has_value()) {
            extracted_queries_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        switch (*error) {
            case SanitizeErrorCode::kNoStatementFound:
                no_statement_.fetch_add(1, std::memory_order_relaxed);
                break;
            case SanitizeErrorCode::kEmptyAfterSanitization:
                empty_after_sanitization_.fetch_add(1, std::memory_order_relaxed);
                break;
            case SanitizeErrorCode::kNoAnswerAvailable:
                // 쿼리 경로에서는 발생하지 않는다.
                break;
        }
    }

    // on_answer
    //   최종 답변 출처를 기록한다.
    void on_answer(AnswerSource source) noexcept {
        switch (source) {
            case AnswerSource::kLabel:
                labelled_answers_.fetch_add(1, std::memory_order_relaxed);
                break;
            case AnswerSource::kProse:
                prose_answers_.fetch_add(1, std::memory_order_relaxed);
                break;
            case AnswerSource::kFallback:
                fallback_answers_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다.
    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now       = std::chrono::system_clock::now();
        const auto total     = total_responses_.load(std::memory_order_relaxed);
        const auto extracted = extracted_queries_.load(std::memory_order_relaxed);

        double extraction_rate = 0.0;
        if (total > 0) {
            extraction_rate = static_cast<double>(extracted) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_responses          = total,
            .extracted_queries        = extracted,
            .no_statement             = no_statement_.load(std::memory_order_relaxed),
            .empty_after_sanitization = empty_after_sanitization_.load(std::memory_order_relaxed),
            .labelled_answers         = labelled_answers_.load(std::memory_order_relaxed),
            .prose_answers            = prose_answers_.load(std::memory_order_relaxed),
            .fallback_answers         = fallback_answers_.load(std::memory_order_relaxed),
            .extraction_rate          = extraction_rate,
            .captured_at              = now,
        };
    }

private:
    std::atomic<std::uint64_t> total_responses_{0};
    std::atomic<std::uint64_t> extracted_queries_{0};
    std::atomic<std::uint64_t> no_statement_{0};
    std::atomic<std::uint64_t> empty_after_sanitization_{0};
    std::atomic<std::uint64_t> labelled_answers_{0};
    std::atomic<std::uint64_t> prose_answers_{0};
    std::atomic<std::uint64_t> fallback_answers_{0};
};
