#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// SqlKeyword
//   SQL 문 시작으로 인정하는 키워드 집합.
//   boundary_locator 가 "진짜" 문장 시작을 찾을 때, 그리고 최종 결과가
//   키워드로 시작하는지 검증할 때 사용한다.
// ---------------------------------------------------------------------------
enum class SqlKeyword : std::uint8_t {
    kSelect = 0,
    kInsert = 1,
    kUpdate = 2,
    kDelete = 3,
    kCreate = 4,
    kDrop   = 5,
    kAlter  = 6,
    kWith   = 7,
};

// ---------------------------------------------------------------------------
// SanitizeErrorCode
//   추출 파이프라인이 호출자에게 돌려주는 실패 분류.
//   어떤 경우에도 예외로 던지지 않고 std::expected 의 error 로 전달한다.
// ---------------------------------------------------------------------------
enum class SanitizeErrorCode : std::uint8_t {
    kNoStatementFound       = 0,  // 그럴듯한 SQL 시작 키워드를 찾지 못함
    kEmptyAfterSanitization = 1,  // 모든 단계를 거친 뒤 비었거나 키워드로 시작하지 않음
    kNoAnswerAvailable      = 2,  // Answer: 섹션 없음. 호출자가 fallback 답변 생성
};

// ---------------------------------------------------------------------------
// SanitizeError
//   추출 실패 시 반환되는 오류 정보.
//   std::expected<T, SanitizeError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct SanitizeError {
    SanitizeErrorCode code{SanitizeErrorCode::kNoStatementFound};
    std::string       message{};  // 사람이 읽을 수 있는 오류 설명
    std::string       context{};  // 실패 시점의 입력 단편 (로깅용)
};

// 로그/CLI 출력용 이름. 예: "no_statement_found"
[[nodiscard]] inline const char* to_string(SanitizeErrorCode code) noexcept {
    switch (code) {
        case SanitizeErrorCode::kNoStatementFound:
            return "no_statement_found";
        case SanitizeErrorCode::kEmptyAfterSanitization:
            return "empty_after_sanitization";
        case SanitizeErrorCode::kNoAnswerAvailable:
            return "no_answer_available";
    }
    return "unknown";
}

[[nodiscard]] inline const char* to_string(SqlKeyword keyword) noexcept {
    switch (keyword) {
        case SqlKeyword::kSelect: return "SELECT";
        case SqlKeyword::kInsert: return "INSERT";
        case SqlKeyword::kUpdate: return "UPDATE";
        case SqlKeyword::kDelete: return "DELETE";
        case SqlKeyword::kCreate: return "CREATE";
        case SqlKeyword::kDrop:   return "DROP";
        case SqlKeyword::kAlter:  return "ALTER";
        case SqlKeyword::kWith:   return "WITH";
    }
    return "UNKNOWN";
}
