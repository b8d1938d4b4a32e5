// ---------------------------------------------------------------------------
// boundary_locator.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/boundary_locator.hpp"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"

namespace {

// SELECT 바로 뒤에 오면 산문으로 보는 한정사/대명사.
constexpr std::array<std::string_view, 15> kSelectStopwords{
    "the", "a", "an", "this", "that", "these", "those", "your",
    "our", "my", "some", "which", "what", "only", "best",
};

// SELECT <식별자> 뒤에 오면 SQL 로 보는 단어.
constexpr std::array<std::string_view, 7> kSelectFollowWords{
    "FROM", "AS", "INTO", "WHERE", "OVER", "END", "FILTER",
};

constexpr std::array<std::string_view, 11> kCreateObjects{
    "TABLE", "VIEW", "INDEX", "UNIQUE", "TEMP", "TEMPORARY",
    "TRIGGER", "VIRTUAL", "OR", "SCHEMA", "DATABASE",
};

constexpr std::array<std::string_view, 6> kDdlObjects{
    "TABLE", "VIEW", "INDEX", "TRIGGER", "SCHEMA", "DATABASE",
};

template <std::size_t N>
bool word_in(std::string_view word, const std::array<std::string_view, N>& set) {
    for (const auto candidate : set) {
        if (text::iequals(word, candidate)) {
            return true;
        }
    }
    return false;
}

bool is_word(const TokenStream& tokens, std::string_view src, std::size_t i,
             std::string_view expected) {
    return i < tokens.size() && tokens[i].is_wordlike() &&
           text::iequals(tokens[i].text(src), expected);
}

template <std::size_t N>
bool is_word_in(const TokenStream& tokens, std::string_view src, std::size_t i,
                const std::array<std::string_view, N>& set) {
    return i < tokens.size() && tokens[i].is_wordlike() && word_in(tokens[i].text(src), set);
}

// 식별자 모양이 SQL 스러운지: c.name, order_id, t1, "col", COUNT
bool looks_like_sql_identifier(std::string_view word) {
    if (!word.empty() && (word.front() == '"' || word.front() == '`')) {
        return true;
    }
    for (const char c : word) {
        if (c == '_' || c == '.' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
            return true;
        }
    }
    return text::is_upper_word(word);
}

// SELECT 의 첫 항목 뒤에 SQL 연속이 오는지.
bool has_sql_follow(const TokenStream& tokens, std::string_view src, std::size_t after) {
    const std::size_t m = next_significant(tokens, after);
    if (m >= tokens.size()) {
        return true;
    }
    const auto& tok = tokens[m];
    switch (tok.kind) {
        case TokenKind::kLabel:
        case TokenKind::kFence:
            return true;
        case TokenKind::kSymbol: {
            const char c = src[tok.offset];
            for (const char accepted : {',', '(', '*', '+', '-', '/', '|', '=', ';', ')', '<', '>'}) {
                if (c == accepted) {
                    return true;
                }
            }
            return false;
        }
        case TokenKind::kWord:
        case TokenKind::kKeyword:
            return word_in(tok.text(src), kSelectFollowWords);
        default:
            return false;
    }
}

bool select_continues(const TokenStream& tokens, std::string_view src, std::size_t k) {
    const bool upper_keyword = text::is_upper_word(tokens[k].text(src));

    std::size_t j = next_significant(tokens, k + 1);
    if (is_word(tokens, src, j, "DISTINCT")) {
        j = next_significant(tokens, j + 1);
    }
    if (j >= tokens.size()) {
        return false;
    }

    const auto& tok = tokens[j];
    switch (tok.kind) {
        case TokenKind::kSymbol:
            return is_symbol(tok, src, '*') || is_symbol(tok, src, '(');
        case TokenKind::kNumber:
        case TokenKind::kString:
            return upper_keyword || has_sql_follow(tokens, src, j + 1);
        case TokenKind::kWord: {
            const auto word = tok.text(src);
            if (word_in(word, kSelectStopwords)) {
                return false;
            }
            if (has_sql_follow(tokens, src, j + 1)) {
                return true;
            }
            if (!upper_keyword) {
                return false;
            }
            if (looks_like_sql_identifier(word)) {
                return true;
            }
            const std::size_t m = next_significant(tokens, j + 1);
            return m < tokens.size() && tokens[m].is_wordlike() &&
                   text::is_upper_word(tokens[m].text(src));
        }
        default:
            return false;
    }
}

bool update_continues(const TokenStream& tokens, std::string_view src, std::size_t k) {
    const std::size_t j = next_significant(tokens, k + 1);
    if (is_word(tokens, src, j, "OR")) {
        return true;
    }
    if (j >= tokens.size() || tokens[j].kind != TokenKind::kWord) {
        return false;
    }
    return is_word(tokens, src, next_significant(tokens, j + 1), "SET");
}

bool with_continues(const TokenStream& tokens, std::string_view src, std::size_t k) {
    std::size_t j = next_significant(tokens, k + 1);
    if (is_word(tokens, src, j, "RECURSIVE")) {
        j = next_significant(tokens, j + 1);
    }
    if (j >= tokens.size() || tokens[j].kind != TokenKind::kWord) {
        return false;
    }
    const std::size_t m = next_significant(tokens, j + 1);
    return is_word(tokens, src, m, "AS") ||
           (m < tokens.size() && is_symbol(tokens[m], src, '('));
}

}  // namespace

// ---------------------------------------------------------------------------
// is_statement_start
// ---------------------------------------------------------------------------
bool is_statement_start(const TokenStream& tokens, std::string_view source, std::size_t index) {
    if (index >= tokens.size() || tokens[index].kind != TokenKind::kKeyword) {
        return false;
    }

    const std::size_t next = next_significant(tokens, index + 1);

    switch (tokens[index].keyword) {
        case SqlKeyword::kSelect:
            return select_continues(tokens, source, index);
        case SqlKeyword::kInsert:
            return is_word(tokens, source, next, "INTO") || is_word(tokens, source, next, "OR");
        case SqlKeyword::kDelete:
            return is_word(tokens, source, next, "FROM");
        case SqlKeyword::kUpdate:
            return update_continues(tokens, source, index);
        case SqlKeyword::kCreate:
            return is_word_in(tokens, source, next, kCreateObjects);
        case SqlKeyword::kDrop:
            return is_word_in(tokens, source, next, kDdlObjects) ||
                   is_word(tokens, source, next, "IF");
        case SqlKeyword::kAlter:
            return is_word_in(tokens, source, next, kDdlObjects);
        case SqlKeyword::kWith:
            return with_continues(tokens, source, index);
    }
    return false;
}

// ---------------------------------------------------------------------------
// locate_statement
// ---------------------------------------------------------------------------
std::expected<StatementStart, SanitizeError> locate_statement(std::string_view text) {
    const auto tokens = tokenize(text);

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (is_statement_start(tokens, text, i)) {
            return StatementStart{tokens[i].offset, tokens[i].keyword};
        }
    }

    return std::unexpected(SanitizeError{
        SanitizeErrorCode::kNoStatementFound,
        "no plausible SQL statement start found",
        text::preview(text)
    });
}

// ---------------------------------------------------------------------------
// trim_to_statement
// ---------------------------------------------------------------------------
std::expected<std::string, SanitizeError> trim_to_statement(std::string_view text) {
    auto start = locate_statement(text);
    if (!start) {
        return std::unexpected(std::move(start.error()));
    }
    if (start->offset > 0) {
        spdlog::debug("boundary_locator: trimmed {} bytes before {}",
                      start->offset, to_string(start->keyword));
    }
    return std::string(text.substr(start->offset));
}
