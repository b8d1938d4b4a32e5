// ---------------------------------------------------------------------------
// trailing_truncator.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/trailing_truncator.hpp"

#include <array>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"
#include "sanitizer/lexer.hpp"

namespace {

// 빈 줄 뒤에 와도 같은 문장의 연속으로 보는 대문자 절 키워드.
constexpr std::array<std::string_view, 20> kClauseContinuations{
    "FROM", "WHERE", "GROUP", "ORDER", "HAVING", "LIMIT", "OFFSET", "JOIN",
    "INNER", "LEFT", "RIGHT", "FULL", "CROSS", "UNION", "INTERSECT", "EXCEPT",
    "AND", "OR", "ON", "WINDOW",
};

// 구문 마커를 비공백 토큰 텍스트 목록으로 미리 분해해 둔다.
struct PhraseMarker {
    const Marker*                 marker{nullptr};
    std::vector<std::string_view> pieces{};
};

std::vector<PhraseMarker> split_phrases(const MarkerTable& table) {
    std::vector<PhraseMarker> out;
    out.reserve(table.trailing.size());

    for (const auto& m : table.trailing) {
        PhraseMarker pm;
        pm.marker = &m;
        if (!m.capitalized_lead) {
            const std::string_view phrase(m.pattern);
            for (const auto& tok : tokenize(phrase)) {
                if (!tok.is_blank()) {
                    pm.pieces.push_back(tok.text(phrase));
                }
            }
            if (pm.pieces.empty()) {
                continue;
            }
        }
        out.push_back(std::move(pm));
    }
    return out;
}

// tokens[i] 부터 pieces 가 (공백을 건너뛰며) 순서대로 나타나는지.
bool matches_phrase(const TokenStream& tokens, std::string_view src, std::size_t i,
                    const std::vector<std::string_view>& pieces) {
    std::size_t j = i;
    for (std::size_t k = 0; k < pieces.size(); ++k) {
        if (k > 0) {
            j = next_significant(tokens, j + 1);
        }
        if (j >= tokens.size() || tokens[j].kind == TokenKind::kString ||
            tokens[j].kind == TokenKind::kComment ||
            !text::iequals(tokens[j].text(src), pieces[k])) {
            return false;
        }
    }
    return true;
}

bool is_clause_continuation(const Token& tok, std::string_view src) {
    if (is_symbol(tok, src, '(') || is_symbol(tok, src, ')')) {
        return true;
    }
    if (!tok.is_wordlike()) {
        return false;
    }
    const auto word = tok.text(src);
    if (!text::is_upper_word(word)) {
        return false;
    }
    for (const auto clause : kClauseContinuations) {
        if (word == clause) {
            return true;
        }
    }
    return false;
}

// 직전 토큰 기준 연속: 쉼표 뒤, 또는 ')' 뒤의 대문자 문장 키워드 (CTE 본문).
bool continues_previous(const Token& prev, const Token& tok, std::string_view src) {
    if (is_symbol(prev, src, ',')) {
        return true;
    }
    return is_symbol(prev, src, ')') && tok.kind == TokenKind::kKeyword &&
           text::is_upper_word(tok.text(src));
}

bool is_sentence_lead(const Token& tok, std::string_view src, const MarkerTable& table) {
    if (tok.kind != TokenKind::kWord) {
        return false;
    }
    const auto word = tok.text(src);
    for (const auto& lead : table.sentence_leads) {
        if (word == lead) {
            return true;
        }
    }
    return false;
}

// 문장 시작 단어 뒤가 ':' 이거나 소문자 단어인지.
bool continues_as_sentence(const TokenStream& tokens, std::string_view src, std::size_t i) {
    const std::size_t j = next_significant(tokens, i + 1);
    if (j >= tokens.size()) {
        return false;
    }
    if (is_symbol(tokens[j], src, ':')) {
        return true;
    }
    return tokens[j].kind == TokenKind::kWord && text::is_plain_lower_word(tokens[j].text(src));
}

}  // namespace

// ---------------------------------------------------------------------------
// find_trailing_cut
// ---------------------------------------------------------------------------
TruncationResult find_trailing_cut(std::string_view   text,
                                   const MarkerTable& table,
                                   std::size_t        start_offset) {
    const auto tokens  = tokenize(text);
    const auto phrases = split_phrases(table);

    std::size_t s = 0;
    while (s < tokens.size() && tokens[s].offset < start_offset) {
        ++s;
    }
    if (s >= tokens.size()) {
        return TruncationResult{text.size(), ""};
    }

    constexpr std::size_t kNoRun = static_cast<std::size_t>(-1);
    std::size_t run_begin = kNoRun;
    std::size_t newlines  = 0;
    std::size_t prev      = s;

    for (std::size_t i = s + 1; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];

        if (tok.is_blank()) {
            if (run_begin == kNoRun) {
                run_begin = i;
            }
            if (tok.kind == TokenKind::kNewline) {
                ++newlines;
            }
            continue;
        }

        const bool        has_ws = run_begin != kNoRun;
        const std::size_t cut    = has_ws ? tokens[run_begin].offset : tok.offset;
        const std::size_t nl     = newlines;
        run_begin = kNoRun;
        newlines  = 0;

        // 1. 라벨 / 펜스
        if (tok.kind == TokenKind::kLabel) {
            return TruncationResult{cut, "label"};
        }
        if (tok.kind == TokenKind::kFence) {
            return TruncationResult{cut, "fence"};
        }

        // 2. kTrailing 마커 (공백이 앞에 있어야 함)
        if (has_ws) {
            for (const auto& pm : phrases) {
                if (nl < pm.marker->min_newlines) {
                    continue;
                }
                const bool hit = pm.marker->capitalized_lead
                    ? (tok.kind == TokenKind::kWord && text::is_capitalized_word(tok.text(text)))
                    : matches_phrase(tokens, text, i, pm.pieces);
                if (hit) {
                    return TruncationResult{cut, pm.marker->name};
                }
            }

            // 3. 일반 설명 문장
            if (is_sentence_lead(tok, text, table) && continues_as_sentence(tokens, text, i)) {
                return TruncationResult{cut, "trailing-sentence"};
            }
        }

        // 4. 빈 줄
        if (nl >= 2 && !is_clause_continuation(tok, text) &&
            !continues_previous(tokens[prev], tok, text)) {
            return TruncationResult{cut, "blank-line"};
        }
        prev = i;
    }

    return TruncationResult{text.size(), ""};
}

// ---------------------------------------------------------------------------
// truncate_trailing
// ---------------------------------------------------------------------------
std::string truncate_trailing(std::string_view text, const MarkerTable& table) {
    const auto result = find_trailing_cut(text, table);
    if (result.truncated()) {
        spdlog::debug("trailing_truncator: cut at {} of {} via '{}'",
                      result.cut, text.size(), result.marker);
    }
    return std::string(text::trim_right(text.substr(0, result.cut)));
}
