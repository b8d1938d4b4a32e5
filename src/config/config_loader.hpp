#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 SanitizerConfig 로 로드하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 기본 설정으로 계속하지 말고 종료해야 한다 (CLI 종료 코드 2).
// - 설정 파일이 아예 없어도 되는 경우는 호출자가 load() 를 호출하지 않고
//   SanitizerConfig{} 기본값을 쓴다.
//
// [순환 의존성]
// config_loader.hpp → sanitizer_config.hpp (단방향만)
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "config/sanitizer_config.hpp"

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------
class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   성공: SanitizerConfig
    //   실패: std::unexpected(error_message)
    //
    //   [All-or-nothing]
    //   파일 없음, YAML 문법 오류, 섹션 타입 오류 모두 실패로 처리한다.
    //   부분적으로 파싱된 설정을 반환하지 않는다.
    //   잘못된 preamble 정규식은 실패가 아니라 경고다 (PreambleRemover 가 건너뜀).
    [[nodiscard]] static std::expected<SanitizerConfig, std::string>
    load(const std::filesystem::path& config_path);
};
