#include "answer/fallback_answer.hpp"
#include "config/config_loader.hpp"
#include "logger/structured_logger.hpp"
#include "sanitizer/marker_table.hpp"
#include "sanitizer/query_sanitizer.hpp"
#include "stats/stats_collector.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// sqlsieve [--rows N] [--scalar COLUMN=VALUE] [FILE...]
//
//   FILE 마다 (없으면 stdin 전체를 하나로) LLM 응답 하나로 보고 추출한다.
//   --rows / --scalar 는 실행 결과 셋 모양을 알려 주며, 답변이 없거나
//   너무 길 때 데이터 기반 답변을 만든다.
//
// 종료 코드: 0 = 모든 입력에서 쿼리 추출, 1 = 하나 이상 실패, 2 = 설정/인자 오류
// ---------------------------------------------------------------------------

namespace {

constexpr int kExitAllExtracted = 0;
constexpr int kExitSomeFailed   = 1;
constexpr int kExitConfigError  = 2;

constexpr const char* kNoQueryMessage = "could not generate a valid query";

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

struct CliOptions {
    std::vector<std::string>   inputs{};
    std::optional<ResultShape> shape{};
};

CellValue parse_cell(const std::string& raw) {
    std::int64_t integer{0};
    const char*  end = raw.data() + raw.size();
    if (auto [ptr, ec] = std::from_chars(raw.data(), end, integer); ec == std::errc{} && ptr == end) {
        return integer;
    }
    double real{0.0};
    if (auto [ptr, ec] = std::from_chars(raw.data(), end, real); ec == std::errc{} && ptr == end) {
        return real;
    }
    return raw;
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--rows" && i + 1 < argc) {
            std::size_t  rows{0};
            const std::string value = argv[++i];
            const char*  end = value.data() + value.size();
            if (auto [ptr, ec] = std::from_chars(value.data(), end, rows); ec != std::errc{} || ptr != end) {
                spdlog::error("--rows: invalid row count '{}'", value);
                return std::nullopt;
            }
            if (!opts.shape) {
                opts.shape = ResultShape{};
            }
            opts.shape->row_count = rows;
            continue;
        }
        if (arg == "--scalar" && i + 1 < argc) {
            const std::string value = argv[++i];
            const auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                spdlog::error("--scalar: expected COLUMN=VALUE, got '{}'", value);
                return std::nullopt;
            }
            opts.shape = ResultShape{
                .columns      = {value.substr(0, eq)},
                .row_count    = 1,
                .single_value = parse_cell(value.substr(eq + 1)),
            };
            continue;
        }
        if (arg.starts_with("--")) {
            spdlog::error("unknown option '{}'", arg);
            return std::nullopt;
        }
        opts.inputs.push_back(arg);
    }
    return opts;
}

std::optional<std::string> read_input(const std::string& name) {
    if (name == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(name, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 진단 로그는 stderr 로 (stdout 은 추출 결과 전용) ───────────────────
    spdlog::set_default_logger(spdlog::stderr_color_mt("sqlsieve-diag"));

    auto opts = parse_args(argc, argv);
    if (!opts) {
        return kExitConfigError;
    }
    if (opts->inputs.empty()) {
        opts->inputs.emplace_back("-");
    }

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    SanitizerConfig config;
    std::string config_path = env_str("SQLSIEVE_CONFIG", "");
    if (config_path.empty() && std::filesystem::exists("config/sanitizer.yaml")) {
        config_path = "config/sanitizer.yaml";
    }
    if (!config_path.empty()) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            std::cerr << "sqlsieve: " << loaded.error() << '\n';
            return kExitConfigError;
        }
        config = std::move(*loaded);
    }
    config.global.log_path  = env_str("LOG_PATH",  config.global.log_path);
    config.global.log_level = env_str("LOG_LEVEL", config.global.log_level);

    const LogLevel level = parse_log_level(config.global.log_level);
    spdlog::set_level(level == LogLevel::kDebug ? spdlog::level::debug : spdlog::level::info);

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    std::optional<StructuredLogger> logger;
    try {
        logger.emplace(level, config.global.log_path, false);
    } catch (const std::runtime_error& e) {
        std::cerr << "sqlsieve: " << e.what() << '\n';
        return kExitConfigError;
    }

    spdlog::debug("sqlsieve: config={}, log_path={}, log_level={}",
                  config_path.empty() ? "(defaults)" : config_path,
                  config.global.log_path, config.global.log_level);

    const QuerySanitizer sanitizer(build_marker_table(config.markers));
    StatsCollector       stats;

    // ── 입력별 추출 ─────────────────────────────────────────────────────
    int exit_code = kExitAllExtracted;
    std::uint64_t request_id = 0;

    for (const auto& name : opts->inputs) {
        ++request_id;
        const auto raw = read_input(name);
        if (!raw) {
            std::cerr << "sqlsieve: cannot read '" << name << "'\n";
            exit_code = kExitSomeFailed;
            continue;
        }

        const auto started = std::chrono::steady_clock::now();
        const auto outcome = sanitizer.process(*raw);
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);

        SanitizeLog entry;
        entry.request_id = request_id;
        entry.raw_length = raw->size();
        entry.timestamp  = std::chrono::system_clock::now();
        entry.duration   = elapsed;

        if (opts->inputs.size() > 1) {
            std::cout << "== " << name << " ==\n";
        }

        if (outcome.query) {
            entry.outcome    = "extracted";
            entry.keyword    = to_string(outcome.query->keyword);
            entry.sql_length = outcome.query->sql.size();
            entry.trace      = outcome.query->trace;
            stats.on_query_result(std::nullopt);
            std::cout << "SQL: " << outcome.query->sql << '\n';
        } else {
            entry.outcome    = "failed";
            entry.error_code = to_string(outcome.query.error().code);
            stats.on_query_result(outcome.query.error().code);
            std::cout << kNoQueryMessage << '\n';
            exit_code = kExitSomeFailed;
        }
        logger->log_sanitize(entry);

        AnswerLog answer_entry;
        answer_entry.request_id = request_id;
        answer_entry.timestamp  = std::chrono::system_clock::now();

        std::string answer_text;
        if (opts->shape) {
            answer_text = resolve_answer(outcome.answer, *opts->shape, config.fallback);
            const bool kept = outcome.answer && answer_text == outcome.answer->text;
            answer_entry.source = kept ? (outcome.answer->from_label ? "label" : "prose") : "fallback";
        } else if (outcome.answer) {
            answer_text         = outcome.answer->text;
            answer_entry.source = outcome.answer->from_label ? "label" : "prose";
        }

        if (answer_entry.source.empty()) {
            answer_entry.outcome = "none";
        } else {
            answer_entry.outcome       = answer_entry.source == "fallback" ? "fallback" : "extracted";
            answer_entry.answer_length = answer_text.size();
            stats.on_answer(answer_entry.source == "label"  ? AnswerSource::kLabel
                            : answer_entry.source == "prose" ? AnswerSource::kProse
                                                             : AnswerSource::kFallback);
            std::cout << "Answer: " << answer_text << '\n';
        }
        logger->log_answer(answer_entry);
    }

    // ── 통계 요약 ───────────────────────────────────────────────────────
    const auto snap = stats.snapshot();
    spdlog::info("sqlsieve: responses={}, extracted={}, no_statement={}, empty={}, "
                 "labelled_answers={}, prose_answers={}, fallback_answers={}, rate={:.2f}",
                 snap.total_responses, snap.extracted_queries, snap.no_statement,
                 snap.empty_after_sanitization, snap.labelled_answers, snap.prose_answers,
                 snap.fallback_answers, snap.extraction_rate);

    return exit_code;
}
