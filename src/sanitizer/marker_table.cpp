// ---------------------------------------------------------------------------
// marker_table.cpp
//
// 내장 마커 테이블과 설정 병합.
//
// [preamble 우선순위]
//  1. I'll help you ...:     5. Let me ...:
//  2. I can help ...:        6. This query ...:
//  3. Here is ...:           7. To ...,
//  4. Here's ...:            8. To ...:
//
// [오탐/미탐 트레이드오프]
// - "To ...," 는 "To find the top customers, run:" 처럼 쉼표까지만 지운다.
//   나머지 "run:" 은 boundary_locator 가 처리한다.
// - kTrailing 구문은 대소문자 무관 매칭이므로 SQL 안의 식별자와 겹치지 않도록
//   두 단어 이상의 구문 또는 개행 조건을 둔다.
// ---------------------------------------------------------------------------

#include "sanitizer/marker_table.hpp"

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"

namespace {

Marker preamble(std::string name, std::string pattern) {
    return Marker{std::move(name), MarkerKind::kPreamble, std::move(pattern), 0, false};
}

Marker trailing(std::string name, std::string phrase, std::uint8_t newlines) {
    return Marker{std::move(name), MarkerKind::kTrailing, std::move(phrase), newlines, false};
}

Marker line_phrase(std::string phrase) {
    std::string name = "line:" + phrase;
    return Marker{std::move(name), MarkerKind::kLine, std::move(phrase), 0, false};
}

MarkerTable make_default_table() {
    MarkerTable table;

    table.preamble = {
        preamble("preamble:ill-help-you",  R"(^I(?:'|’)ll\s+help\s+you[\s\S]*?:\s*)"),
        preamble("preamble:i-can-help",    R"(^I\s+can\s+help[\s\S]*?:\s*)"),
        preamble("preamble:here-is",       R"(^Here\s+is\s+[\s\S]*?:\s*)"),
        preamble("preamble:heres",         R"(^Here(?:'|’)s\s+[\s\S]*?:\s*)"),
        preamble("preamble:let-me",        R"(^Let\s+me\s+[\s\S]*?:\s*)"),
        preamble("preamble:this-query",    R"(^This\s+query\s+[\s\S]*?:\s*)"),
        preamble("preamble:to-comma",      R"(^To\s+[\s\S]*?,\s*)"),
        preamble("preamble:to-colon",      R"(^To\s+[\s\S]*?:\s*)"),
    };

    Marker blank_line_prose{
        "trailing:double-newline-capitalized", MarkerKind::kTrailing, "", 2, true};

    table.trailing = {
        std::move(blank_line_prose),
        trailing("trailing:newline-this-query",  "This query",   1),
        trailing("trailing:newline-this-will",   "This will",    1),
        trailing("trailing:newline-the-query",   "The query",    1),
        trailing("trailing:newline-note",        "Note:",        1),
        trailing("trailing:newline-explanation", "Explanation:", 1),
        trailing("trailing:newline-if-you",      "If you",       1),
        trailing("trailing:newline-based",       "Based",        1),
        trailing("trailing:inline-this-query",   "This query",   0),
        trailing("trailing:inline-this-will",    "This will",    0),
        trailing("trailing:inline-based-on",     "Based on",     0),
        trailing("trailing:inline-which-you",    "which you",    0),
        trailing("trailing:inline-if-you",       "If you",       0),
        trailing("trailing:inline-that-could",   "that could",   0),
    };

    for (const char* phrase : {
             "this query will", "this will retrieve", "if you", "which you could",
             "that could be", "you can use", "select the", "order the results",
             "limit to the", "provides the", "can then use", "to make the",
             "the query provides", "raw data sorted", "visual representation",
             "looking for", "more readable", "spreadsheet or", "charting tool",
             "this will:", "this query:", "explanation:", "note that", "you can then",
             "which will", "data sorted by", "chart more readable", "based on",
             "based upon", "according to",
         }) {
        table.line.push_back(line_phrase(phrase));
    }

    table.sentence_leads = {"This", "The", "Note", "Explanation"};

    return table;
}

}  // namespace

// ---------------------------------------------------------------------------
// default_marker_table
//   함수 내부 static: C++11 이후 초기화는 thread-safe.
// ---------------------------------------------------------------------------
const MarkerTable& default_marker_table() {
    static const MarkerTable kTable = make_default_table();
    return kTable;
}

// ---------------------------------------------------------------------------
// build_marker_table
//   replace_defaults = true 이면 설정에 항목이 하나 이상 있는 섹션만 대체한다.
//   비어 있는 섹션은 기본값을 유지한다 (빈 테이블로 인한 무방비 상태 방지).
// ---------------------------------------------------------------------------
MarkerTable build_marker_table(const MarkerRules& rules) {
    MarkerTable table = default_marker_table();

    if (rules.replace_defaults) {
        if (!rules.preamble.empty()) {
            table.preamble.clear();
        }
        if (!rules.trailing.empty()) {
            table.trailing.clear();
        }
        if (!rules.line_phrases.empty()) {
            table.line.clear();
        }
        if (!rules.sentence_leads.empty()) {
            table.sentence_leads.clear();
        }
    }

    for (const auto& rule : rules.preamble) {
        if (rule.pattern.empty()) {
            spdlog::warn("marker_table: preamble rule '{}' has empty pattern, skipping", rule.name);
            continue;
        }
        table.preamble.push_back(preamble(rule.name, rule.pattern));
    }

    for (const auto& rule : rules.trailing) {
        if (rule.phrase.empty() && !rule.capitalized) {
            spdlog::warn("marker_table: trailing rule '{}' has empty phrase, skipping", rule.name);
            continue;
        }
        Marker m = trailing(rule.name, rule.phrase, rule.newlines);
        m.capitalized_lead = rule.capitalized;
        table.trailing.push_back(std::move(m));
    }

    for (const auto& phrase : rules.line_phrases) {
        const auto normalized = text::to_lower(text::trim(phrase));
        if (!normalized.empty()) {
            table.line.push_back(line_phrase(normalized));
        }
    }

    for (const auto& lead : rules.sentence_leads) {
        if (!lead.empty()) {
            table.sentence_leads.push_back(lead);
        }
    }

    spdlog::debug("marker_table: built table preamble={}, trailing={}, line={}, sentence_leads={}",
                  table.preamble.size(), table.trailing.size(), table.line.size(),
                  table.sentence_leads.size());

    return table;
}
