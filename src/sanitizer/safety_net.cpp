// ---------------------------------------------------------------------------
// safety_net.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/safety_net.hpp"

#include <array>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"
#include "sanitizer/lexer.hpp"

namespace {

constexpr std::array<std::string_view, 46> kSqlWords{
    "as", "from", "where", "join", "inner", "left", "right", "outer", "full", "cross",
    "on", "and", "or", "not", "order", "group", "by", "having", "limit", "offset",
    "union", "all", "select", "desc", "asc", "in", "is", "null", "like", "between",
    "case", "when", "then", "else", "end", "with", "over", "partition", "except",
    "intersect", "using", "set", "values", "into", "distinct", "returning",
};

constexpr std::array<std::string_view, 11> kExplanationWords{
    "this", "the", "will", "query", "allows", "provides", "helps",
    "calculates", "retrieves", "shows", "aggregates",
};

template <std::size_t N>
bool in_set(std::string_view word, const std::array<std::string_view, N>& set) {
    for (const auto candidate : set) {
        if (text::iequals(word, candidate)) {
            return true;
        }
    }
    return false;
}

bool is_prose_word(std::string_view word) {
    return word.size() >= 3 && text::is_plain_lower_word(word) && !in_set(word, kSqlWords);
}

// tokens[from..] 이 산문으로 읽히는지.
bool reads_as_prose(const TokenStream& tokens, std::string_view src, std::size_t from) {
    bool previous_prose = false;
    for (std::size_t i = next_significant(tokens, from); i < tokens.size();
         i = next_significant(tokens, i + 1)) {
        const auto& tok = tokens[i];
        if (!tok.is_wordlike()) {
            previous_prose = false;
            continue;
        }
        const auto word = tok.text(src);
        if (in_set(word, kExplanationWords)) {
            return true;
        }
        const bool prose = is_prose_word(word);
        if (prose && previous_prose) {
            return true;
        }
        previous_prose = prose;
    }
    return false;
}

// 꼬리의 첫 비공백 토큰이 SQL 단어인지.
bool tail_starts_with_sql_word(const TokenStream& tokens, std::string_view src, std::size_t from) {
    const std::size_t i = next_significant(tokens, from);
    return i < tokens.size() && tokens[i].is_wordlike() && in_set(tokens[i].text(src), kSqlWords);
}

// 규칙 1: 마지막 ')' 뒤의 산문 꼬리. 절단 위치를 반환한다.
std::optional<std::size_t> paren_tail_cut(std::string_view sql) {
    const auto tokens = tokenize(sql);

    std::size_t last = tokens.size();
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (is_symbol(tokens[i], sql, ')')) {
            last = i;
        }
    }
    if (last == tokens.size()) {
        return std::nullopt;
    }

    const auto tail = text::trim(sql.substr(tokens[last].end()));
    if (tail.empty() || tail.front() == ';') {
        return std::nullopt;
    }
    if (tail_starts_with_sql_word(tokens, sql, last + 1)) {
        return std::nullopt;
    }
    if (!reads_as_prose(tokens, sql, last + 1)) {
        return std::nullopt;
    }
    return tokens[last].end();
}

// 규칙 2: 마지막 LIMIT <정수> 뒤의 산문 꼬리.
std::optional<std::size_t> limit_tail_cut(std::string_view sql) {
    const auto tokens = tokenize(sql);

    std::optional<std::size_t> number_index;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (!tokens[i].is_wordlike() || !text::iequals(tokens[i].text(sql), "LIMIT")) {
            continue;
        }
        const std::size_t n = next_significant(tokens, i + 1);
        if (n < tokens.size() && tokens[n].kind == TokenKind::kNumber &&
            tokens[n].text(sql).find('.') == std::string_view::npos) {
            number_index = n;
        }
    }
    if (!number_index) {
        return std::nullopt;
    }

    const std::size_t cut  = tokens[*number_index].end();
    const auto        tail = text::trim(sql.substr(cut));
    if (tail.empty() || tail.front() == ';' || tail.front() == ')') {
        return std::nullopt;
    }
    if (tail_starts_with_sql_word(tokens, sql, *number_index + 1)) {
        return std::nullopt;
    }
    if (!text::has_lowercase_run(tail, 3)) {
        return std::nullopt;
    }
    return cut;
}

}  // namespace

// ---------------------------------------------------------------------------
// apply_safety_net
// ---------------------------------------------------------------------------
std::expected<SafetyNetResult, SanitizeError> apply_safety_net(std::string_view text) {
    SafetyNetResult result;
    result.sql = std::string(text::trim(text));

    if (const auto cut = paren_tail_cut(result.sql); cut.has_value()) {
        spdlog::debug("safety_net: dropped prose after last ')' ({} bytes)", result.sql.size() - *cut);
        result.sql.resize(*cut);
        result.applied.emplace_back("safety:paren-tail");
    }

    if (const auto cut = limit_tail_cut(result.sql); cut.has_value()) {
        spdlog::debug("safety_net: dropped prose after LIMIT ({} bytes)", result.sql.size() - *cut);
        result.sql.resize(*cut);
        result.applied.emplace_back("safety:limit-tail");
    }

    result.sql = std::string(text::trim_right(result.sql));

    const auto tokens = tokenize(result.sql);
    const std::size_t first = next_significant(tokens, 0);
    if (first >= tokens.size() || tokens[first].kind != TokenKind::kKeyword) {
        return std::unexpected(SanitizeError{
            SanitizeErrorCode::kEmptyAfterSanitization,
            result.sql.empty() ? "nothing left after sanitization"
                               : "sanitized text does not start with an SQL keyword",
            text::preview(text)
        });
    }

    result.keyword = tokens[first].keyword;
    return result;
}
