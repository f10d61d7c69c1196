#pragma once

// ---------------------------------------------------------------------------
// macro_generator.hpp
//
// portable_* 디스패치 매크로 라이브러리(.sql) 를 생성한다.
//
// [생성 구조 (함수 하나당)]
//   portable_<name>(expression)       adapter.dispatch('<name>', 'portable') 호출
//   <dialect>__<name>(expression)     설정된 방언마다 하나
//   default__<name>(expression)       주 방언 구현으로 위임
//
// [인자 전달]
// - 재작성된 호출은 괄호 안 텍스트 전체를 문자열 하나로 넘긴다.
//   {*} 만 쓰는 템플릿은 그 문자열을 그대로 끼워 넣고, {0} {1} 처럼 위치
//   인자를 쓰는 템플릿은 portable_split_args 로 최상위 쉼표 기준 분리한다.
// - 분리된 인자는 주 방언의 표면 순서이므로 주 방언 카탈로그의 arg_order 로
//   정규 순서 인덱스를 환산한다.
// - 방언에 구현이 없으면 exceptions.raise_compiler_error 를 호출하는 매크로를 만든다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "config/project_config.hpp"
#include "dialect/dialect_oracle.hpp"

class MacroGenerator {
public:
    explicit MacroGenerator(DialectOracle oracle);
    ~MacroGenerator() = default;

    MacroGenerator(const MacroGenerator&)            = delete;
    MacroGenerator& operator=(const MacroGenerator&) = delete;

    // render_library
    //   function_names: 대문자 함수 이름 (중복은 한 번만 생성)
    [[nodiscard]] std::string render_library(const std::vector<std::string>& function_names) const;

    // generate
    //   config.macro_output 에 라이브러리를 쓰고 경로를 반환한다.
    //   function_names 가 비어 있으면 파일을 쓰지 않고 경로만 반환한다.
    [[nodiscard]] std::expected<std::filesystem::path, std::string>
    generate(const ProjectConfig& config, const std::vector<std::string>& function_names) const;

private:
    [[nodiscard]] std::string render_function(const std::string& function_name) const;

    DialectOracle oracle_;
};
