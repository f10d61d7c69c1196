#pragma once

// ---------------------------------------------------------------------------
// project_scanner.hpp
//
// 모델 파일 전체를 훑어 방언 간 차이가 있는 함수의 출현 횟수를 집계한다.
//
// [집계 규칙]
// - 파일마다 분류 → 마스킹 → 주 방언 파싱 → 함수 후보 이름을 센다.
// - Unsafe 파일, 읽기 실패, 파싱 실패는 0 회로 기여한다 (집계를 중단하지 않음).
// - 최종 결과는 DialectOracle::catalog_differences() 와 교집합만 남긴다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "config/project_config.hpp"
#include "dialect/dialect_oracle.hpp"
#include "template/template_classifier.hpp"

class StructuredLogger;

using FunctionTally = std::map<std::string, std::size_t>;

class ProjectScanner {
public:
    explicit ProjectScanner(DialectOracle oracle, StructuredLogger* logger = nullptr);
    ~ProjectScanner() = default;

    ProjectScanner(const ProjectScanner&)            = delete;
    ProjectScanner& operator=(const ProjectScanner&) = delete;

    // scan
    //   model_roots 아래 *.sql 을 집계한다. 결과 키는 대문자 함수 이름.
    [[nodiscard]] FunctionTally scan(const std::vector<std::filesystem::path>& model_roots,
                                     std::size_t                               workers = 0) const;

    // scan_project
    //   config.scan_project 가 false 면 빈 결과.
    [[nodiscard]] FunctionTally scan_project(const ProjectConfig& config) const;

    // functions_in
    //   원문 하나에서 찾은 함수 이름 목록 (교집합 적용 전, 중복 포함).
    [[nodiscard]] std::vector<std::string> functions_in(std::string_view source) const;

private:
    DialectOracle      oracle_;
    TemplateClassifier classifier_;
    StructuredLogger*  logger_;
};
