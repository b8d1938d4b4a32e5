#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// - 파이프라인 내부 진단 로그는 spdlog 기본 로거를 쓰고, 이 로거는
//   요청 단위 이벤트(한 줄 JSON)만 기록한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// StructuredLogger
//   SanitizeLog / AnswerLog 를 JSON 포맷으로 기록한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level  : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path   : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   to_stdout  : true 이면 stdout 싱크도 붙인다
    //   실패 시 std::runtime_error
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path,
                              bool to_stdout = true);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_sanitize
    //   성공은 info, 실패는 warn 레벨로 기록한다.
    void log_sanitize(const SanitizeLog& entry);

    // log_answer
    //   info 레벨.
    void log_answer(const AnswerLog& entry);

private:
    [[nodiscard]] int to_spdlog_level(LogLevel level) const;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
