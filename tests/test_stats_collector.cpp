// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector 단위 테스트.
//
// [테스트 범위]
// - 초기 상태 검증 (all-zero)
// - on_query_result: 성공 / NoStatementFound / EmptyAfterSanitization
// - on_query_result(kNoAnswerAvailable): total 만 증가
// - on_answer: 출처별 카운터
// - snapshot(): extraction_rate 계산, total == 0 이면 0.0
// - snapshot(): captured_at 이 호출 시각 범위 안에 있는지
// - ConcurrentAccess: 멀티스레드 동시성 (data race 미발생 확인)
//
// [알려진 한계]
// - extraction_rate 부동소수점 비교는 EXPECT_NEAR 으로 허용 오차 1e-9 이내.
// ---------------------------------------------------------------------------

#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// InitialState_AllZero
//   생성 직후 모든 카운터가 0이어야 한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, InitialState_AllZero) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_responses, 0u)          << "total_responses should start at 0";
    EXPECT_EQ(snap.extracted_queries, 0u)        << "extracted_queries should start at 0";
    EXPECT_EQ(snap.no_statement, 0u)             << "no_statement should start at 0";
    EXPECT_EQ(snap.empty_after_sanitization, 0u) << "empty_after_sanitization should start at 0";
    EXPECT_EQ(snap.labelled_answers, 0u);
    EXPECT_EQ(snap.prose_answers, 0u);
    EXPECT_EQ(snap.fallback_answers, 0u);
    EXPECT_DOUBLE_EQ(snap.extraction_rate, 0.0)  << "extraction_rate should be 0.0 with no responses";
}

// ---------------------------------------------------------------------------
// OnQueryResult_Success
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnQueryResult_Success) {
    StatsCollector stats;
    stats.on_query_result(std::nullopt);
    stats.on_query_result(std::nullopt);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_responses, 2u);
    EXPECT_EQ(snap.extracted_queries, 2u);
    EXPECT_EQ(snap.no_statement, 0u);
}

// ---------------------------------------------------------------------------
// OnQueryResult_Failures
//   실패 코드별 카운터가 분리되어 증가해야 한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnQueryResult_Failures) {
    StatsCollector stats;
    stats.on_query_result(SanitizeErrorCode::kNoStatementFound);
    stats.on_query_result(SanitizeErrorCode::kNoStatementFound);
    stats.on_query_result(SanitizeErrorCode::kEmptyAfterSanitization);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_responses, 3u);
    EXPECT_EQ(snap.extracted_queries, 0u);
    EXPECT_EQ(snap.no_statement, 2u);
    EXPECT_EQ(snap.empty_after_sanitization, 1u);
}

TEST(StatsCollector, OnQueryResult_NoAnswerCode_CountsTotalOnly) {
    StatsCollector stats;
    stats.on_query_result(SanitizeErrorCode::kNoAnswerAvailable);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_responses, 1u);
    EXPECT_EQ(snap.extracted_queries, 0u);
    EXPECT_EQ(snap.no_statement, 0u);
    EXPECT_EQ(snap.empty_after_sanitization, 0u);
}

// ---------------------------------------------------------------------------
// OnAnswer_PerSource
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnAnswer_PerSource) {
    StatsCollector stats;
    stats.on_answer(AnswerSource::kLabel);
    stats.on_answer(AnswerSource::kProse);
    stats.on_answer(AnswerSource::kProse);
    stats.on_answer(AnswerSource::kFallback);
    stats.on_answer(AnswerSource::kFallback);
    stats.on_answer(AnswerSource::kFallback);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.labelled_answers, 1u);
    EXPECT_EQ(snap.prose_answers, 2u);
    EXPECT_EQ(snap.fallback_answers, 3u);
    EXPECT_EQ(snap.total_responses, 0u) << "answers must not touch the query counters";
}

// ---------------------------------------------------------------------------
// Snapshot_ExtractionRate
//   extracted / total 비율.
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_ExtractionRate) {
    StatsCollector stats;
    stats.on_query_result(std::nullopt);
    stats.on_query_result(std::nullopt);
    stats.on_query_result(std::nullopt);
    stats.on_query_result(SanitizeErrorCode::kNoStatementFound);

    const auto snap = stats.snapshot();
    EXPECT_NEAR(snap.extraction_rate, 0.75, 1e-9) << "3 of 4 responses extracted";
}

TEST(StatsCollector, Snapshot_AllFailed_RateZero) {
    StatsCollector stats;
    stats.on_query_result(SanitizeErrorCode::kEmptyAfterSanitization);

    EXPECT_DOUBLE_EQ(stats.snapshot().extraction_rate, 0.0);
}

// ---------------------------------------------------------------------------
// Snapshot_CapturedAt
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_CapturedAt) {
    StatsCollector stats;

    const auto before = std::chrono::system_clock::now();
    const auto snap   = stats.snapshot();
    const auto after  = std::chrono::system_clock::now();

    EXPECT_GE(snap.captured_at, before);
    EXPECT_LE(snap.captured_at, after);
}

// ---------------------------------------------------------------------------
// ConcurrentAccess
//   여러 스레드에서 동시에 갱신해도 최종 카운트가 정확해야 한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentAccess) {
    StatsCollector stats;

    constexpr int kThreads    = 8;
    constexpr int kIterations = 1000;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&stats, t]() {
            for (int i = 0; i < kIterations; ++i) {
                if (t % 2 == 0) {
                    stats.on_query_result(std::nullopt);
                    stats.on_answer(AnswerSource::kLabel);
                } else {
                    stats.on_query_result(SanitizeErrorCode::kNoStatementFound);
                    stats.on_answer(AnswerSource::kFallback);
                }
                // 갱신 중 스냅샷 읽기
                (void)stats.snapshot();
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    const auto snap = stats.snapshot();
    constexpr std::uint64_t kHalf = static_cast<std::uint64_t>(kThreads / 2) * kIterations;

    EXPECT_EQ(snap.total_responses, 2 * kHalf);
    EXPECT_EQ(snap.extracted_queries, kHalf);
    EXPECT_EQ(snap.no_statement, kHalf);
    EXPECT_EQ(snap.labelled_answers, kHalf);
    EXPECT_EQ(snap.fallback_answers, kHalf);
    EXPECT_NEAR(snap.extraction_rate, 0.5, 1e-9);
}
