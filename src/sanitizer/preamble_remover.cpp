// ---------------------------------------------------------------------------
// preamble_remover.cpp
//
// [CompiledPattern 구현 주의사항]
// 헤더에서 CompiledPattern 은 전방 선언만 되어 있으므로 소멸자와 이동 연산을
// 이 파일에서 정의한다. std::regex 는 shared_ptr 로 보관한다.
// ---------------------------------------------------------------------------

#include "sanitizer/preamble_remover.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"
#include "sanitizer/boundary_locator.hpp"

namespace {

// 정규식이 보는 최대 길이. std::regex 는 재귀 매처라 긴 입력에서 스택이 넘친다.
constexpr std::size_t kMaxPreambleBytes = 1024;

}  // namespace

struct PreambleRemover::CompiledPattern {
    std::string                 name;
    std::string                 source_pattern;
    std::shared_ptr<std::regex> compiled;
};

PreambleRemover::~PreambleRemover()                                = default;
PreambleRemover::PreambleRemover(PreambleRemover&&) noexcept            = default;
PreambleRemover& PreambleRemover::operator=(PreambleRemover&&) noexcept = default;

// ---------------------------------------------------------------------------
// PreambleRemover 생성자
// ---------------------------------------------------------------------------
PreambleRemover::PreambleRemover(const std::vector<Marker>& markers) {
    compiled_patterns_.reserve(markers.size());

    for (const auto& marker : markers) {
        if (marker.kind != MarkerKind::kPreamble) {
            continue;
        }
        try {
            auto re = std::make_shared<std::regex>(
                marker.pattern,
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            compiled_patterns_.push_back(CompiledPattern{marker.name, marker.pattern, std::move(re)});

        } catch (const std::regex_error& e) {
            // 잘못된 정규식은 로그 후 건너뜀. 나머지 패턴은 계속 적용한다.
            spdlog::warn(
                "preamble_remover: invalid regex pattern '{}' ({}), skipping: {}",
                marker.pattern, marker.name, e.what()
            );
        }
    }

    if (compiled_patterns_.empty()) {
        spdlog::warn("preamble_remover: no valid preamble patterns loaded, preamble removal disabled");
    }
}

std::size_t PreambleRemover::pattern_count() const noexcept {
    return compiled_patterns_.size();
}

// ---------------------------------------------------------------------------
// PreambleRemover::remove
// ---------------------------------------------------------------------------
PreambleResult PreambleRemover::remove(std::string_view text) const {
    const std::string input(text::trim_left(text));

    // 매칭이 넘어서는 안 되는 한계. 문장이 없으면 입력 끝.
    std::size_t limit = input.size();
    if (const auto start = locate_statement(input); start.has_value()) {
        limit = start->offset;
    }

    // 문장 시작을 넘는 매칭은 창 밖이므로 처음부터 걸리지 않는다.
    const std::string window = input.substr(0, std::min(limit, kMaxPreambleBytes));

    for (const auto& cp : compiled_patterns_) {
        std::smatch match;
        if (!std::regex_search(window, match, *cp.compiled,
                               std::regex_constants::match_continuous)) {
            continue;
        }

        const auto consumed = static_cast<std::size_t>(match.length(0));
        if (consumed == 0) {
            continue;
        }

        spdlog::debug("preamble_remover: removed {} bytes via '{}'", consumed, cp.name);
        return PreambleResult{input.substr(consumed), cp.name};
    }

    return PreambleResult{input, ""};
}
