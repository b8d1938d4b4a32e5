#pragma once

// ---------------------------------------------------------------------------
// lexer.hpp
//
// LLM 응답 텍스트를 타입이 있는 토큰 스트림으로 분해하는 소형 렉서.
// 이후 단계(label_stripper, boundary_locator, trailing_truncator, safety_net,
// answer_extractor)는 원문 정규식 대신 이 토큰 스트림 위에서 경계를 찾는다.
//
// [토큰화 규칙]
// - 펜스: 백틱 3개 이상 + 선택적 언어 태그 (```sql, ```SQL, ```)
// - 라벨: 단어 시작 위치에서만 인식 (대소문자 무관)
//         SQLQuery: / SQL Query: / SQLResult: / SQL Result: / Question: / Answer:
// - 단어: [A-Za-z0-9_$] 와 UTF-8 바이트, 내부 '.' (schema.table, t.*),
//         글자 사이의 아포스트로피 (I'll, Here's)
//         "col" / `col` 처럼 큰따옴표·백틱으로 감싼 식별자도 단어로 취급
// - 문자열: '...' ('' 이스케이프 지원). 닫히지 않으면 kSymbol 로 취급한다.
// - 주석: -- 줄 끝까지, /* ... */
//
// [한계]
// - 닫히지 않은 큰따옴표는 kSymbol 로 떨어지므로 산문 속 인용부호는 안전하다.
// - 중첩 블록 주석은 지원하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // SqlKeyword

// ---------------------------------------------------------------------------
// TokenKind
// ---------------------------------------------------------------------------
enum class TokenKind : std::uint8_t {
    kLabel   = 0,  // 섹션 라벨 (SQLQuery: 등)
    kFence   = 1,  // 마크다운 코드 펜스
    kKeyword = 2,  // SqlKeyword 에 해당하는 단어
    kWord    = 3,  // 그 외 단어/식별자 (산문 포함)
    kNumber  = 4,  // 정수/실수 리터럴
    kString  = 5,  // 작은따옴표 문자열 리터럴
    kComment = 6,  // SQL 주석
    kSymbol  = 7,  // 한 글자 구두점/연산자
    kSpace   = 8,  // 개행을 제외한 공백 연속
    kNewline = 9,  // '\n' 한 글자
};

// ---------------------------------------------------------------------------
// LabelKind
//   kLabel 토큰의 세부 분류.
// ---------------------------------------------------------------------------
enum class LabelKind : std::uint8_t {
    kQuestion  = 0,
    kSqlQuery  = 1,  // "SQLQuery:" 와 "SQL Query:" 모두
    kSqlResult = 2,
    kAnswer    = 3,
};

// ---------------------------------------------------------------------------
// Token
//   원문에 대한 (offset, length) 뷰. 원문 문자열이 토큰보다 오래 살아야 한다.
// ---------------------------------------------------------------------------
struct Token {
    TokenKind   kind{TokenKind::kSymbol};
    std::size_t offset{0};
    std::size_t length{0};
    LabelKind   label{LabelKind::kQuestion};   // kind == kLabel 일 때만 유효
    SqlKeyword  keyword{SqlKeyword::kSelect};  // kind == kKeyword 일 때만 유효

    [[nodiscard]] std::size_t end() const noexcept { return offset + length; }

    [[nodiscard]] std::string_view text(std::string_view source) const {
        return source.substr(offset, length);
    }

    // 공백/개행처럼 의미 없는 토큰인지
    [[nodiscard]] bool is_blank() const noexcept {
        return kind == TokenKind::kSpace || kind == TokenKind::kNewline;
    }

    // 단어 계열 (kWord 또는 kKeyword)
    [[nodiscard]] bool is_wordlike() const noexcept {
        return kind == TokenKind::kWord || kind == TokenKind::kKeyword;
    }
};

using TokenStream = std::vector<Token>;

// text 전체를 토큰화한다. 실패하지 않는다 (모르는 문자는 kSymbol).
[[nodiscard]] TokenStream tokenize(std::string_view text);

// 단어 하나를 SqlKeyword 로 매핑한다 (대소문자 무관). 아니면 nullopt.
[[nodiscard]] std::optional<SqlKeyword> keyword_from_word(std::string_view word);

// tokens[from] 부터 공백/개행을 건너뛴 첫 토큰 인덱스. 없으면 tokens.size().
[[nodiscard]] std::size_t next_significant(const TokenStream& tokens, std::size_t from) noexcept;

// symbol 토큰이 특정 문자인지 확인한다.
[[nodiscard]] bool is_symbol(const Token& token, std::string_view source, char c);
