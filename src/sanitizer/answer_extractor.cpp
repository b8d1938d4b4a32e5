// ---------------------------------------------------------------------------
// answer_extractor.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/answer_extractor.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"
#include "sanitizer/boundary_locator.hpp"
#include "sanitizer/label_stripper.hpp"
#include "sanitizer/lexer.hpp"
#include "sanitizer/trailing_truncator.hpp"

namespace {

SanitizeError no_answer(std::string message, std::string_view raw) {
    return SanitizeError{
        SanitizeErrorCode::kNoAnswerAvailable,
        std::move(message),
        text::preview(raw)
    };
}

// 첫 Answer: 라벨 뒤의 본문. 하위 섹션/추가 라벨/펜스를 제거한다.
std::string answer_section(std::string_view raw, const TokenStream& tokens, std::size_t answer_index) {
    std::string body;
    body.reserve(raw.size() - tokens[answer_index].end());

    bool skipping = false;
    for (std::size_t i = answer_index + 1; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.kind == TokenKind::kLabel) {
            skipping = tok.label != LabelKind::kAnswer;
            continue;
        }
        if (tok.kind == TokenKind::kFence || skipping) {
            continue;
        }
        body.append(tok.text(raw));
    }
    return body;
}

// SQL 문으로 시작하는 줄을 절단 지점까지 제거한다.
std::string drop_embedded_sql(std::string_view body, const MarkerTable& table) {
    const auto tokens = tokenize(body);

    std::string out;
    out.reserve(body.size());

    std::size_t pos = 0;
    std::size_t ti  = 0;
    bool fragment = false;  // 이전 절단 뒤에 남은 같은 줄 조각

    while (pos < body.size()) {
        const auto eol      = body.find('\n', pos);
        const auto line_end = (eol == std::string_view::npos) ? body.size() : eol;

        while (ti < tokens.size() && tokens[ti].offset < pos) {
            ++ti;
        }
        const std::size_t first = next_significant(tokens, ti);
        const bool on_line = first < tokens.size() && tokens[first].offset < line_end;

        if (on_line && tokens[first].kind == TokenKind::kKeyword &&
            (is_statement_start(tokens, body, first) ||
             text::is_upper_word(tokens[first].text(body)))) {
            const auto cut = find_trailing_cut(body, table, tokens[first].offset);
            spdlog::debug("answer_extractor: dropped embedded {} statement ({} bytes)",
                          to_string(tokens[first].keyword), cut.cut - tokens[first].offset);
            pos      = cut.cut;
            fragment = true;
            continue;
        }

        auto line = body.substr(pos, line_end - pos);
        if (fragment) {
            line = text::trim_left(line);
        }
        out.append(text::trim_right(line));
        out += '\n';
        fragment = false;
        pos = line_end + 1;
    }

    return out;
}

// 연속 빈 줄을 하나로 합치고 앞뒤 공백을 제거한다.
std::string collapse_blank_lines(std::string_view body) {
    std::string out;
    out.reserve(body.size());

    bool previous_blank = false;
    std::size_t pos = 0;
    while (pos <= body.size()) {
        const auto eol  = body.find('\n', pos);
        const auto end  = (eol == std::string_view::npos) ? body.size() : eol;
        const auto line = text::trim_right(body.substr(pos, end - pos));

        const bool blank = line.empty();
        if (!(blank && previous_blank)) {
            out.append(line);
            out += '\n';
        }
        previous_blank = blank;

        if (eol == std::string_view::npos) {
            break;
        }
        pos = eol + 1;
    }
    return std::string(text::trim(out));
}

std::string clean_body(std::string_view body, const MarkerTable& table) {
    return collapse_blank_lines(drop_embedded_sql(body, table));
}

}  // namespace

// ---------------------------------------------------------------------------
// extract_answer
// ---------------------------------------------------------------------------
std::expected<SanitizedAnswer, SanitizeError>
extract_answer(std::string_view raw, const MarkerTable& table) {
    const auto tokens = tokenize(raw);

    std::size_t answer_index = tokens.size();
    bool has_chain_label = false;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::kLabel) {
            continue;
        }
        if (tokens[i].label == LabelKind::kAnswer) {
            answer_index = i;
            break;
        }
        if (tokens[i].label == LabelKind::kSqlQuery || tokens[i].label == LabelKind::kSqlResult) {
            has_chain_label = true;
        }
    }

    // 1. Answer: 라벨
    if (answer_index < tokens.size()) {
        auto answer = clean_body(answer_section(raw, tokens, answer_index), table);
        if (answer.empty()) {
            return std::unexpected(no_answer("Answer: section is empty", raw));
        }
        return SanitizedAnswer{std::move(answer), true};
    }

    // 2. 라벨은 있으나 Answer: 없음 (체인 원본 출력)
    if (has_chain_label) {
        return std::unexpected(no_answer("chain output has no Answer: section", raw));
    }

    // 3. 라벨 없는 일반 텍스트
    const std::string cleaned = strip_labels(raw);
    std::string_view  body(cleaned);
    if (const auto start = locate_statement(cleaned); start.has_value()) {
        const auto cut = find_trailing_cut(cleaned, table, start->offset);
        body = body.substr(cut.cut);
    }

    auto answer = clean_body(body, table);
    if (answer.empty()) {
        return std::unexpected(no_answer("no prose outside the SQL statement", raw));
    }
    return SanitizedAnswer{std::move(answer), false};
}
