// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 SanitizerConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - trailing[].newlines 는 0~255 범위만 의미가 있다. 그 이상은 255 로 자른다.
// - log_level 이 알 수 없는 값이면 경고 후 "info" 로 되돌린다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <filesystem>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: preamble 정규식이 유효한지 사전 검증하고 경고 로그를 출력한다.
// PreambleRemover 에서도 건너뛰므로 중복 경고가 발생할 수 있다.
// ---------------------------------------------------------------------------
void validate_preamble_patterns(const std::vector<PreambleRule>& rules) {
    for (const auto& rule : rules) {
        try {
            std::regex re(rule.pattern, std::regex_constants::icase | std::regex_constants::ECMAScript);
            (void)re;  // 컴파일만 확인
        } catch (const std::regex_error& e) {
            spdlog::warn(
                "config_loader: preamble rule '{}' pattern '{}' is invalid regex and will be "
                "skipped: {}",
                rule.name, rule.pattern, e.what()
            );
        }
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level  = read_string(global_node["log_level"],  cfg.log_level);
    cfg.log_path   = read_string(global_node["log_path"],   cfg.log_path);

    if (cfg.log_level != "debug" && cfg.log_level != "info" &&
        cfg.log_level != "warn" && cfg.log_level != "error") {
        spdlog::warn("config_loader: unknown log_level '{}', defaulting to 'info'", cfg.log_level);
        cfg.log_level = "info";
    }

    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: MarkerRules 파싱
// markers YAML:
//   replace_defaults: false
//   preamble:  [{name, pattern}]
//   trailing:  [{name, phrase, newlines, capitalized}]
//   line_phrases:   ["..."]
//   sentence_leads: ["..."]
// ---------------------------------------------------------------------------
[[nodiscard]] MarkerRules parse_markers(const YAML::Node& markers_node) {
    MarkerRules rules{};
    if (!markers_node || !markers_node.IsMap()) {
        return rules;
    }

    rules.replace_defaults = read_bool(markers_node["replace_defaults"], rules.replace_defaults);

    const YAML::Node& preamble_node = markers_node["preamble"];
    if (preamble_node && preamble_node.IsSequence()) {
        for (const auto& item : preamble_node) {
            if (!item.IsMap()) {
                continue;
            }
            PreambleRule rule{};
            rule.pattern = read_string(item["pattern"], "");
            rule.name    = read_string(item["name"], "preamble:custom-" + std::to_string(rules.preamble.size()));
            if (rule.pattern.empty()) {
                spdlog::warn("config_loader: preamble rule '{}' has no pattern, ignoring", rule.name);
                continue;
            }
            rules.preamble.push_back(std::move(rule));
        }
    }

    const YAML::Node& trailing_node = markers_node["trailing"];
    if (trailing_node && trailing_node.IsSequence()) {
        for (const auto& item : trailing_node) {
            if (!item.IsMap()) {
                continue;
            }
            TrailingRule rule{};
            rule.phrase      = read_string(item["phrase"], "");
            rule.name        = read_string(item["name"], "trailing:custom-" + std::to_string(rules.trailing.size()));
            rule.newlines    = static_cast<std::uint8_t>(
                std::min<std::uint32_t>(read_uint32(item["newlines"], 0), 255));
            rule.capitalized = read_bool(item["capitalized"], false);
            if (rule.phrase.empty() && !rule.capitalized) {
                spdlog::warn("config_loader: trailing rule '{}' has no phrase, ignoring", rule.name);
                continue;
            }
            rules.trailing.push_back(std::move(rule));
        }
    }

    rules.line_phrases   = read_string_sequence(markers_node["line_phrases"]);
    rules.sentence_leads = read_string_sequence(markers_node["sentence_leads"]);

    return rules;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: FallbackConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] FallbackConfig parse_fallback(const YAML::Node& fb_node) {
    FallbackConfig cfg{};
    if (!fb_node || !fb_node.IsMap()) {
        return cfg;
    }

    cfg.currency_symbol = read_string(fb_node["currency_symbol"], cfg.currency_symbol);
    if (fb_node["currency_keywords"]) {
        // 명시적 빈 목록은 "통화 형식 사용 안 함" 으로 유지한다.
        cfg.currency_keywords = read_string_sequence(fb_node["currency_keywords"]);
    }
    cfg.max_answer_chars  = read_uint32(fb_node["max_answer_chars"],  cfg.max_answer_chars);
    cfg.small_result_rows = read_uint32(fb_node["small_result_rows"], cfg.small_result_rows);

    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<SanitizerConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 각 섹션 파싱 (try-catch per section)
    SanitizerConfig cfg{};

    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'global' section: {}", e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        const YAML::Node& markers_node = root["markers"];
        if (markers_node && !markers_node.IsNull() && !markers_node.IsMap()) {
            const std::string err = "config_loader: 'markers' section must be a map";
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
        cfg.markers = parse_markers(markers_node);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'markers' section: {}", e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        cfg.fallback = parse_fallback(root["fallback"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing 'fallback' section: {}", e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 4. preamble 정규식 사전 검증 (경고만)
    validate_preamble_patterns(cfg.markers.preamble);

    spdlog::info(
        "config_loader: config loaded successfully, "
        "preamble={}, trailing={}, line_phrases={}, replace_defaults={}",
        cfg.markers.preamble.size(),
        cfg.markers.trailing.size(),
        cfg.markers.line_phrases.size(),
        cfg.markers.replace_defaults
    );

    return cfg;
}
