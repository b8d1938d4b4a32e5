#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - SanitizedQuery / SanitizedAnswer 를 직접 include 하지 않는다.
// - 호출자가 to_string(SqlKeyword), to_string(SanitizeErrorCode) 로
//   문자열을 채워 넘긴다.
//
// [민감정보 취급 주의]
// - 원문 응답과 SQL 본문은 기록하지 않고 길이만 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "error" → LogLevel. 알 수 없으면 kInfo.
[[nodiscard]] inline LogLevel parse_log_level(const std::string& name) noexcept {
    if (name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// SanitizeLog
//   쿼리 추출 결과 로그.
//   outcome:    "extracted" | "failed"
//   error_code: 실패 시 "no_statement_found" 등, 성공 시 빈 문자열
//   keyword:    성공 시 "SELECT" 등
//   trace:      적용된 단계/마커 이름
// ---------------------------------------------------------------------------
struct SanitizeLog {
    std::uint64_t                              request_id{0};
    std::string                                outcome{};
    std::string                                error_code{};
    std::string                                keyword{};
    std::size_t                                raw_length{0};
    std::size_t                                sql_length{0};
    std::vector<std::string>                   trace{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};   // 파이프라인 소요 시간
};

// ---------------------------------------------------------------------------
// AnswerLog
//   답변 추출 결과 로그.
//   source: "label" | "prose" | "fallback"
// ---------------------------------------------------------------------------
struct AnswerLog {
    std::uint64_t                              request_id{0};
    std::string                                outcome{};      // "extracted" | "fallback"
    std::string                                source{};
    std::size_t                                answer_length{0};
    std::chrono::system_clock::time_point      timestamp{};
};
