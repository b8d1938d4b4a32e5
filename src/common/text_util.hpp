#pragma once

// ---------------------------------------------------------------------------
// text_util.hpp
//
// 파이프라인 전 단계에서 공유하는 ASCII 문자열 헬퍼.
// 모든 함수는 순수 함수이며 로캘에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace text {

// 문자열을 대문자로 변환한다 (ASCII only).
[[nodiscard]] inline std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// 문자열을 소문자로 변환한다 (ASCII only).
[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

[[nodiscard]] inline bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// 문자열의 앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한다.
[[nodiscard]] inline std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

[[nodiscard]] inline std::string_view trim_left(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && is_space(s[i])) {
        ++i;
    }
    return s.substr(i);
}

[[nodiscard]] inline std::string_view trim_right(std::string_view s) {
    std::size_t n = s.size();
    while (n > 0 && is_space(s[n - 1])) {
        --n;
    }
    return s.substr(0, n);
}

// 대소문자 무관 비교 (ASCII only).
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// 알파벳이 하나 이상 있고, 모든 알파벳이 대문자인지 확인한다. 예: "SELECT", "GROUP_BY"
[[nodiscard]] inline bool is_upper_word(std::string_view s) noexcept {
    bool has_alpha = false;
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc) != 0) {
            has_alpha = true;
            if (std::islower(uc) != 0) {
                return false;
            }
        }
    }
    return has_alpha;
}

// 첫 글자가 대문자이고 이후 소문자가 하나 이상 있는 "문장형" 단어인지 확인한다.
// 예: "This" → true, "THIS" → false, "this" → false
[[nodiscard]] inline bool is_capitalized_word(std::string_view s) noexcept {
    if (s.empty() || std::isupper(static_cast<unsigned char>(s.front())) == 0) {
        return false;
    }
    return std::any_of(s.begin() + 1, s.end(),
                       [](unsigned char c) { return std::islower(c) != 0; });
}

// 알파벳으로만 이루어진 소문자 단어인지 확인한다. 예: "which" → true, "c_id" → false
[[nodiscard]] inline bool is_plain_lower_word(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::islower(c) != 0; });
}

// 연속된 소문자가 min_run 개 이상 있는지 확인한다.
[[nodiscard]] inline bool has_lowercase_run(std::string_view s, std::size_t min_run) noexcept {
    std::size_t run = 0;
    for (const char c : s) {
        if (std::islower(static_cast<unsigned char>(c)) != 0) {
            if (++run >= min_run) {
                return true;
            }
        } else {
            run = 0;
        }
    }
    return false;
}

// 로그/오류 컨텍스트용 앞부분 미리보기. max_len 을 넘으면 "..." 을 붙인다.
[[nodiscard]] inline std::string preview(std::string_view s, std::size_t max_len = 80) {
    if (s.size() <= max_len) {
        return std::string(s);
    }
    std::string result(s.substr(0, max_len));
    result += "...";
    return result;
}

}  // namespace text
