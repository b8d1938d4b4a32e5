// ---------------------------------------------------------------------------
// line_filter.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/line_filter.hpp"

#include <array>
#include <cctype>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"
#include "sanitizer/boundary_locator.hpp"
#include "sanitizer/lexer.hpp"

namespace {

// 대소문자 무관. GROUP / ORDER 는 뒤에 BY 가 와야 한다.
constexpr std::array<std::string_view, 4> kClauseWords{"FROM", "WHERE", "LIMIT", "JOIN"};

// AND / OR 는 산문 접속사와 겹치므로 대문자일 때만 절로 본다.
constexpr std::array<std::string_view, 2> kUpperOnlyClauseWords{"AND", "OR"};

// [begin, end) 범위에서 공백을 건너뛴 첫 토큰. 없으면 end.
std::size_t first_in_line(const TokenStream& tokens, std::size_t begin, std::size_t end) {
    const auto first = next_significant(tokens, begin);
    return first < end ? first : end;
}

bool is_sql_line(const TokenStream& tokens, std::string_view src, std::size_t begin, std::size_t end) {
    const auto first = first_in_line(tokens, begin, end);
    if (first == end) {
        return false;
    }

    const auto& tok = tokens[first];
    if (is_symbol(tok, src, '(') || is_symbol(tok, src, ')')) {
        return true;
    }

    // "select region from sales" 는 면제, "Select the rows you need" 는 산문
    if (tok.kind == TokenKind::kKeyword) {
        return is_statement_start(tokens, src, first);
    }
    if (tok.kind != TokenKind::kWord) {
        return false;
    }

    const auto word = tok.text(src);
    for (const auto clause : kClauseWords) {
        if (text::iequals(word, clause)) {
            return true;
        }
    }
    for (const auto clause : kUpperOnlyClauseWords) {
        if (word == clause) {
            return true;
        }
    }
    if (text::iequals(word, "GROUP") || text::iequals(word, "ORDER")) {
        const auto next = first_in_line(tokens, first + 1, end);
        return next < end && tokens[next].kind == TokenKind::kWord &&
               text::iequals(tokens[next].text(src), "BY");
    }
    return false;
}

// 줄의 산문 부분만 소문자로 이어 붙인다.
// 문자열 리터럴과 주석은 '|' 로 바꿔 구문 매칭에서 빠진다.
std::string prose_of_line(const TokenStream& tokens, std::string_view src,
                          std::size_t begin, std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end; ++i) {
        const auto& tok = tokens[i];
        switch (tok.kind) {
            case TokenKind::kWord:
            case TokenKind::kKeyword:
                out += text::to_lower(tok.text(src));
                break;
            case TokenKind::kString:
            case TokenKind::kComment:
                out += " | ";
                break;
            case TokenKind::kSymbol:
            case TokenKind::kNumber:
                out.append(tok.text(src));
                break;
            case TokenKind::kSpace:
            case TokenKind::kNewline:
            case TokenKind::kLabel:
            case TokenKind::kFence:
                if (!out.empty() && out.back() != ' ') {
                    out += ' ';
                }
                break;
        }
    }
    return out;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// 단어 경계에서만 매칭한다. "select the" 는 "select theme" 에 걸리지 않는다.
bool contains_phrase(std::string_view prose, std::string_view phrase) {
    if (phrase.empty()) {
        return false;
    }
    for (auto pos = prose.find(phrase); pos != std::string_view::npos; pos = prose.find(phrase, pos + 1)) {
        const auto after = pos + phrase.size();
        const bool left  = pos == 0 || !is_word_char(prose[pos - 1]) || !is_word_char(phrase.front());
        const bool right = after == prose.size() || !is_word_char(prose[after]) || !is_word_char(phrase.back());
        if (left && right) {
            return true;
        }
    }
    return false;
}

bool contains_line_phrase(std::string_view prose, const MarkerTable& table, std::string& matched) {
    for (const auto& marker : table.line) {
        if (contains_phrase(prose, marker.pattern)) {
            matched = marker.name;
            return true;
        }
    }
    return false;
}

}  // namespace

// ---------------------------------------------------------------------------
// filter_explanation_lines
// ---------------------------------------------------------------------------
std::string filter_explanation_lines(std::string_view text, const MarkerTable& table) {
    const auto tokens = tokenize(text);

    std::size_t cut   = text.size();
    std::size_t begin = 0;

    while (begin < tokens.size()) {
        std::size_t end = begin;
        while (end < tokens.size() && tokens[end].kind != TokenKind::kNewline) {
            ++end;
        }

        std::string matched;
        if (!is_sql_line(tokens, text, begin, end) &&
            contains_line_phrase(prose_of_line(tokens, text, begin, end), table, matched)) {
            cut = tokens[begin].offset;
            spdlog::debug("line_filter: dropped from line '{}' via '{}'",
                          text::preview(text.substr(cut), 40), matched);
            break;
        }

        begin = end + 1;
    }

    return std::string(text::trim_right(text.substr(0, cut)));
}
