#pragma once

// ---------------------------------------------------------------------------
// project_config.hpp
//
// .dbt-multi-adapter.yml 설정 구조체.
//
// [경로 규칙]
// - macro_output, model_paths, log_file 은 설정 파일 디렉터리(project_root)
//   기준으로 해석된 경로를 담는다.
// - scan_project == false 이면 model_paths 는 비어 있다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct ProjectConfig {
    std::vector<std::string>           adapters{};      // 2개 이상, adapters[0] = 주 방언
    std::filesystem::path              macro_output{};
    bool                               scan_project{true};
    std::vector<std::filesystem::path> model_paths{};
    std::filesystem::path              project_root{};
    std::string                        log_level{"info"};
    std::filesystem::path              log_file{};      // 비어 있으면 구조화 로그 비활성
    std::size_t                        workers{0};      // 0 = 하드웨어 동시성
};
