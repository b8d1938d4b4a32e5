// ---------------------------------------------------------------------------
// lexer.cpp
//
// LLM 응답 텍스트 토크나이저 구현.
// 한 번의 선형 스캔으로 토큰 스트림을 만든다. 상태는 위치 인덱스뿐이다.
// ---------------------------------------------------------------------------

#include "sanitizer/lexer.hpp"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include "common/text_util.hpp"

namespace {

// 단어를 구성할 수 있는 문자인지. UTF-8 멀티바이트는 모두 단어 문자로 본다.
bool is_word_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_' || c == '$' || uc >= 0x80;
}

bool is_word_start(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) != 0 || c == '_' || uc >= 0x80;
}

bool is_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_horizontal_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

// text[pos..] 가 literal 로 시작하는지 (대소문자 무관)
bool starts_with_ci(std::string_view text, std::size_t pos, std::string_view literal) {
    if (pos + literal.size() > text.size()) {
        return false;
    }
    return text::iequals(text.substr(pos, literal.size()), literal);
}

// ---------------------------------------------------------------------------
// 라벨 매칭: 성공 시 (LabelKind, 길이) 반환, 실패 시 길이 0.
// "SQL Query:" 처럼 SQL 과 Query 사이 공백(스페이스/탭)을 허용한다.
// ---------------------------------------------------------------------------
std::pair<LabelKind, std::size_t> match_label(std::string_view text, std::size_t pos) {
    if (starts_with_ci(text, pos, "question:")) {
        return {LabelKind::kQuestion, 9};
    }
    if (starts_with_ci(text, pos, "answer:")) {
        return {LabelKind::kAnswer, 7};
    }
    if (!starts_with_ci(text, pos, "sql")) {
        return {LabelKind::kQuestion, 0};
    }

    std::size_t i = pos + 3;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
        ++i;
    }
    if (starts_with_ci(text, i, "query:")) {
        return {LabelKind::kSqlQuery, i + 6 - pos};
    }
    if (starts_with_ci(text, i, "result:")) {
        return {LabelKind::kSqlResult, i + 7 - pos};
    }
    return {LabelKind::kQuestion, 0};
}

// 펜스 길이를 반환한다. 펜스가 아니면 0.
// ```sql 처럼 바로 붙은 언어 태그까지 포함하되, 태그가 SQL 키워드면
// (```SELECT ...) 태그로 보지 않는다.
std::size_t match_fence(std::string_view text, std::size_t pos) {
    std::size_t i = pos;
    while (i < text.size() && text[i] == '`') {
        ++i;
    }
    if (i - pos < 3) {
        return 0;
    }

    std::size_t tag_end = i;
    while (tag_end < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[tag_end])) != 0 ||
            text[tag_end] == '_' || text[tag_end] == '+' || text[tag_end] == '-')) {
        ++tag_end;
    }
    if (tag_end > i && keyword_from_word(text.substr(i, tag_end - i)).has_value()) {
        return i - pos;
    }
    return tag_end - pos;
}

// 같은 줄 안에서 닫히는 인용 구간 길이를 반환한다. 닫히지 않으면 0.
// 작은따옴표는 '' 와 \' 이스케이프를 처리한다.
std::size_t match_quoted(std::string_view text, std::size_t pos, char quote) {
    std::size_t i = pos + 1;
    while (i < text.size() && text[i] != '\n') {
        const char c = text[i];
        if (c == '\\' && quote == '\'' && i + 1 < text.size()) {
            i += 2;
            continue;
        }
        if (c == quote) {
            if (quote == '\'' && i + 1 < text.size() && text[i + 1] == '\'') {
                i += 2;
                continue;
            }
            return i + 1 - pos;
        }
        ++i;
    }
    return 0;
}

// 단어 길이. schema.table, t.*, I'll, Here's 같은 형태를 하나로 묶는다.
std::size_t match_word(std::string_view text, std::size_t pos) {
    std::size_t i = pos;
    while (i < text.size()) {
        if (is_word_char(text[i])) {
            ++i;
            continue;
        }
        const bool has_next = i + 1 < text.size();
        if (text[i] == '.' && has_next) {
            if (is_word_start(text[i + 1])) {
                ++i;
                continue;
            }
            if (text[i + 1] == '*') {
                i += 2;
                break;
            }
        }
        if (text[i] == '\'' && has_next && i > pos &&
            is_alpha(text[i - 1]) && is_alpha(text[i + 1])) {
            ++i;
            continue;
        }
        break;
    }
    return i - pos;
}

std::size_t match_number(std::string_view text, std::size_t pos) {
    std::size_t i = pos;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
        ++i;
    }
    if (i + 1 < text.size() && text[i] == '.' &&
        std::isdigit(static_cast<unsigned char>(text[i + 1])) != 0) {
        ++i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
            ++i;
        }
    }
    return i - pos;
}

std::size_t match_comment(std::string_view text, std::size_t pos) {
    if (pos + 1 >= text.size()) {
        return 0;
    }
    if (text[pos] == '-' && text[pos + 1] == '-') {
        const auto eol = text.find('\n', pos);
        return (eol == std::string_view::npos ? text.size() : eol) - pos;
    }
    if (text[pos] == '/' && text[pos + 1] == '*') {
        const auto close = text.find("*/", pos + 2);
        return (close == std::string_view::npos ? text.size() : close + 2) - pos;
    }
    return 0;
}

}  // namespace

// ---------------------------------------------------------------------------
// keyword_from_word
// ---------------------------------------------------------------------------
std::optional<SqlKeyword> keyword_from_word(std::string_view word) {
    static constexpr std::array<std::pair<std::string_view, SqlKeyword>, 8> kKeywords{{
        {"SELECT", SqlKeyword::kSelect},
        {"INSERT", SqlKeyword::kInsert},
        {"UPDATE", SqlKeyword::kUpdate},
        {"DELETE", SqlKeyword::kDelete},
        {"CREATE", SqlKeyword::kCreate},
        {"DROP",   SqlKeyword::kDrop},
        {"ALTER",  SqlKeyword::kAlter},
        {"WITH",   SqlKeyword::kWith},
    }};

    for (const auto& [name, keyword] : kKeywords) {
        if (text::iequals(word, name)) {
            return keyword;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// tokenize
// ---------------------------------------------------------------------------
TokenStream tokenize(std::string_view text) {
    TokenStream tokens;
    tokens.reserve(text.size() / 3 + 1);

    std::size_t i = 0;
    const std::size_t len = text.size();

    auto push = [&tokens](TokenKind kind, std::size_t offset, std::size_t length) -> Token& {
        Token tok;
        tok.kind   = kind;
        tok.offset = offset;
        tok.length = length;
        tokens.push_back(tok);
        return tokens.back();
    };

    while (i < len) {
        const char c = text[i];
        const bool at_word_boundary = (i == 0) || !is_word_char(text[i - 1]);

        if (c == '\n') {
            push(TokenKind::kNewline, i, 1);
            ++i;
            continue;
        }

        if (is_horizontal_space(c)) {
            std::size_t j = i;
            while (j < len && is_horizontal_space(text[j])) {
                ++j;
            }
            push(TokenKind::kSpace, i, j - i);
            i = j;
            continue;
        }

        if (c == '`') {
            if (const auto n = match_fence(text, i); n > 0) {
                push(TokenKind::kFence, i, n);
                i += n;
                continue;
            }
            if (const auto n = match_quoted(text, i, '`'); n > 0) {
                push(TokenKind::kWord, i, n);
                i += n;
                continue;
            }
            push(TokenKind::kSymbol, i, 1);
            ++i;
            continue;
        }

        if (const auto n = match_comment(text, i); n > 0) {
            push(TokenKind::kComment, i, n);
            i += n;
            continue;
        }

        if (c == '\'' && at_word_boundary) {
            if (const auto n = match_quoted(text, i, '\''); n > 0) {
                push(TokenKind::kString, i, n);
                i += n;
                continue;
            }
        }

        if (c == '"') {
            if (const auto n = match_quoted(text, i, '"'); n > 0) {
                push(TokenKind::kWord, i, n);
                i += n;
                continue;
            }
        }

        if (is_word_start(c) && at_word_boundary) {
            if (const auto [label, n] = match_label(text, i); n > 0) {
                push(TokenKind::kLabel, i, n).label = label;
                i += n;
                continue;
            }
        }

        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            const auto n = match_number(text, i);
            push(TokenKind::kNumber, i, n);
            i += n;
            continue;
        }

        if (is_word_start(c)) {
            const auto n    = match_word(text, i);
            const auto word = text.substr(i, n);
            if (const auto kw = keyword_from_word(word); kw.has_value()) {
                push(TokenKind::kKeyword, i, n).keyword = *kw;
            } else {
                push(TokenKind::kWord, i, n);
            }
            i += n;
            continue;
        }

        push(TokenKind::kSymbol, i, 1);
        ++i;
    }

    return tokens;
}

std::size_t next_significant(const TokenStream& tokens, std::size_t from) noexcept {
    std::size_t i = from;
    while (i < tokens.size() && tokens[i].is_blank()) {
        ++i;
    }
    return i;
}

bool is_symbol(const Token& token, std::string_view source, char c) {
    return token.kind == TokenKind::kSymbol && token.length == 1 && source[token.offset] == c;
}
