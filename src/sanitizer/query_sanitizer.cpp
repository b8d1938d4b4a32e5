// ---------------------------------------------------------------------------
// query_sanitizer.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/query_sanitizer.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"
#include "sanitizer/boundary_locator.hpp"
#include "sanitizer/label_stripper.hpp"
#include "sanitizer/line_filter.hpp"
#include "sanitizer/safety_net.hpp"
#include "sanitizer/trailing_truncator.hpp"

QuerySanitizer::QuerySanitizer()
    : QuerySanitizer(default_marker_table())
{}

QuerySanitizer::QuerySanitizer(MarkerTable table)
    : table_(std::move(table))
    , preamble_(table_.preamble)
{}

// ---------------------------------------------------------------------------
// sanitize_query
// ---------------------------------------------------------------------------
std::expected<SanitizedQuery, SanitizeError>
QuerySanitizer::sanitize_query(std::string_view raw) const {
    std::vector<std::string> trace;

    // 1. 펜스/선행 라벨
    std::string current = strip_labels(raw);
    if (current.size() != raw.size()) {
        trace.emplace_back("labels");
    }

    // 2. preamble
    auto preamble = preamble_.remove(current);
    if (!preamble.matched_marker.empty()) {
        trace.push_back(std::move(preamble.matched_marker));
    }
    current = std::move(preamble.text);

    // 3. 문장 시작
    auto trimmed = trim_to_statement(current);
    if (!trimmed) {
        spdlog::debug("query_sanitizer: {}", trimmed.error().message);
        return std::unexpected(SanitizeError{
            trimmed.error().code,
            trimmed.error().message,
            text::preview(raw)
        });
    }
    if (trimmed->size() != current.size()) {
        trace.emplace_back("boundary");
    }
    current = std::move(*trimmed);

    // 4. 꼬리 설명문
    const auto cut = find_trailing_cut(current, table_);
    if (cut.truncated()) {
        trace.push_back(cut.marker);
        current = std::string(text::trim_right(std::string_view(current).substr(0, cut.cut)));
    }

    // 5. 줄 필터
    const auto before_filter = current.size();
    current = filter_explanation_lines(current, table_);
    if (current.size() != before_filter) {
        trace.emplace_back("line-filter");
    }

    // 6. safety net + 최종 검증
    auto checked = apply_safety_net(current);
    if (!checked) {
        spdlog::debug("query_sanitizer: {}", checked.error().message);
        return std::unexpected(SanitizeError{
            checked.error().code,
            checked.error().message,
            text::preview(raw)
        });
    }

    for (auto& rule : checked->applied) {
        trace.push_back(std::move(rule));
    }

    return SanitizedQuery{std::move(checked->sql), checked->keyword, std::move(trace)};
}

std::expected<SanitizedAnswer, SanitizeError>
QuerySanitizer::extract_answer(std::string_view raw) const {
    return ::extract_answer(raw, table_);
}

SanitizeOutcome QuerySanitizer::process(std::string_view raw) const {
    return SanitizeOutcome{sanitize_query(raw), extract_answer(raw)};
}
