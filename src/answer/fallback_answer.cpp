// ---------------------------------------------------------------------------
// fallback_answer.cpp
// ---------------------------------------------------------------------------

#include "answer/fallback_answer.hpp"

#include <cctype>
#include <cmath>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "common/text_util.hpp"

namespace {

constexpr std::string_view kNoData = "No data found for the specified criteria.";

bool is_currency_column(std::string_view column, const FallbackConfig& config) {
    const auto lowered = text::to_lower(column);
    for (const auto& keyword : config.currency_keywords) {
        if (!keyword.empty() && lowered.find(text::to_lower(keyword)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// 숫자 문자열에 천 단위 ',' 를 넣는다. "1234567" → "1,234,567"
std::string insert_separators(std::string_view digits) {
    std::string result;
    result.reserve(digits.size() + digits.size() / 3 + 1);

    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead % 3) {
            result += ',';
        }
        result += digits[i];
    }
    return result;
}

// 소수점 두 자리 + 천 단위 구분. 1234.5 → "1,234.50"
// 정수 변환 없이 문자열로 자르므로 int64 범위를 넘는 값(1e20)도 그대로 출력한다.
std::string format_real(double value) {
    double rounded = std::round(value * 100.0) / 100.0;
    if (!std::isfinite(rounded)) {
        rounded = value;
    }
    if (!std::isfinite(rounded)) {
        return fmt::format("{}", rounded);
    }

    const std::string      fixed = fmt::format("{:.2f}", std::fabs(rounded));
    const std::string_view view  = fixed;
    const auto             dot   = view.find('.');

    std::string result = insert_separators(view.substr(0, dot));
    if (dot != std::string_view::npos) {
        result.append(view.substr(dot));
    }
    if (rounded < 0.0) {
        result.insert(result.begin(), '-');
    }
    return result;
}

std::string format_value(const CellValue& value, bool currency, const FallbackConfig& config) {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        if (currency) {
            return config.currency_symbol + format_real(static_cast<double>(*i));
        }
        return group_thousands(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (currency) {
            return config.currency_symbol + format_real(*d);
        }
        return format_real(*d);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return "NULL";
}

}  // namespace

// ---------------------------------------------------------------------------
// title_case_column
// ---------------------------------------------------------------------------
std::string title_case_column(std::string_view column) {
    std::string result;
    result.reserve(column.size());

    bool word_start = true;
    for (const char c : column) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '_') {
            result += ' ';
            word_start = true;
            continue;
        }
        if (std::isalpha(uc) != 0) {
            result += static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc));
            word_start = false;
        } else {
            result += c;
            word_start = true;
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// group_thousands
// ---------------------------------------------------------------------------
std::string group_thousands(std::int64_t value) {
    const bool negative = value < 0;
    // INT64_MIN 도 안전하게 처리하기 위해 unsigned 로 변환
    auto magnitude = negative ? static_cast<std::uint64_t>(-(value + 1)) + 1
                              : static_cast<std::uint64_t>(value);

    std::string result = insert_separators(std::to_string(magnitude));

    if (negative) {
        result.insert(result.begin(), '-');
    }
    return result;
}

// ---------------------------------------------------------------------------
// format_fallback_answer
// ---------------------------------------------------------------------------
std::string format_fallback_answer(const ResultShape& shape, const FallbackConfig& config) {
    if (shape.row_count == 0) {
        return std::string(kNoData);
    }

    if (shape.row_count == 1 && shape.columns.size() == 1 && shape.single_value.has_value()) {
        const auto& column = shape.columns.front();
        const auto  title  = title_case_column(column);
        const bool  numeric = !std::holds_alternative<std::string>(*shape.single_value) &&
                              !std::holds_alternative<std::monostate>(*shape.single_value);
        const bool  currency = numeric && is_currency_column(column, config);
        return fmt::format("The {} is {}", title, format_value(*shape.single_value, currency, config));
    }

    if (shape.row_count <= config.small_result_rows) {
        return fmt::format("Query returned {} result(s).", shape.row_count);
    }
    return fmt::format("Found {} result(s).", shape.row_count);
}

// ---------------------------------------------------------------------------
// resolve_answer
// ---------------------------------------------------------------------------
std::string resolve_answer(const std::expected<SanitizedAnswer, SanitizeError>& answer,
                           const ResultShape&                                   shape,
                           const FallbackConfig&                                config) {
    if (shape.row_count == 0) {
        return std::string(kNoData);
    }

    if (answer.has_value() && !answer->text.empty()) {
        if (answer->text.size() <= config.max_answer_chars) {
            return answer->text;
        }
        spdlog::warn("fallback_answer: answer is verbose ({} chars), using data-driven answer",
                     answer->text.size());
    }

    return format_fallback_answer(shape, config);
}
