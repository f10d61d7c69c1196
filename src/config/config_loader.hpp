#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// .dbt-multi-adapter.yml 을 읽어 ProjectConfig 로 변환한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분적으로 파싱된
//   설정은 반환하지 않는다 (all-or-nothing).
// - 필드 누락 시 ProjectConfig 기본값을 적용한다. 단 adapters 는 필수.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "config/project_config.hpp"

inline constexpr const char* kDefaultConfigFile  = ".dbt-multi-adapter.yml";
inline constexpr const char* kDefaultMacroOutput = "macros/portable_functions.sql";

class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   성공: ProjectConfig (경로는 설정 파일 디렉터리 기준으로 해석됨)
    //   실패: 파일 없음, YAML 문법 오류(라인/컬럼 포함), 빈 파일,
    //         최상위가 map 이 아님, adapters 2개 미만.
    [[nodiscard]] static std::expected<ProjectConfig, std::string>
    load(const std::filesystem::path& config_path);
};
