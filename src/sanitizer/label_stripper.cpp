// ---------------------------------------------------------------------------
// label_stripper.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/label_stripper.hpp"

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"
#include "sanitizer/lexer.hpp"

namespace {

// 펜스 토큰과 바로 뒤따르는 공백/개행을 제거한 문자열을 만든다.
std::string remove_fences(std::string_view text) {
    const auto tokens = tokenize(text);

    std::string out;
    out.reserve(text.size());

    bool skipping_blank = false;
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::kFence) {
            skipping_blank = true;
            continue;
        }
        if (skipping_blank && tok.is_blank()) {
            continue;
        }
        skipping_blank = false;
        out.append(tok.text(text));
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// strip_labels
//   펜스 제거 후 선행 라벨 그룹을 반복적으로 벗겨낸다.
//   "Question: ... SQLQuery: SELECT ..." 는
//   Question 섹션 제거 → SQLQuery: 라벨 제거 → "SELECT ..." 가 된다.
// ---------------------------------------------------------------------------
std::string strip_labels(std::string_view text) {
    const std::string unfenced = remove_fences(text);
    const std::string_view view(unfenced);
    const auto tokens = tokenize(view);

    std::size_t i = next_significant(tokens, 0);
    std::size_t start = 0;
    bool stripped = false;

    while (i < tokens.size() && tokens[i].kind == TokenKind::kLabel) {
        const auto label = tokens[i].label;
        stripped = true;

        if (label == LabelKind::kSqlQuery || label == LabelKind::kAnswer) {
            start = tokens[i].end();
            i = next_significant(tokens, i + 1);
            continue;
        }

        // Question: / SQLResult: 섹션은 다음 라벨까지 통째로 버린다.
        std::size_t j = i + 1;
        while (j < tokens.size() && tokens[j].kind != TokenKind::kLabel) {
            ++j;
        }
        if (j == tokens.size()) {
            start = view.size();
            i = j;
            break;
        }
        start = tokens[j].offset;
        i = j;
    }

    if (!stripped) {
        return unfenced;
    }

    spdlog::debug("label_stripper: stripped leading labels ({} bytes)", start);
    return std::string(text::trim_left(view.substr(start)));
}
