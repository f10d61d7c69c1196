#pragma once

// ---------------------------------------------------------------------------
// model_rewriter.hpp
//
// dbt 모델 파일에서 방언 간 차이가 있는 함수 호출을 portable_* 매크로
// 호출로 치환한다.
//
// [파이프라인 (파일 1개)]
//   1. 읽기 — 읽기 실패 / 빈 파일이면 변경 없음
//   2. 분류 — Unsafe Region 이 있으면 변경 없음 (파일 그대로)
//   3. 마스킹 — Span 이 없으면 변경 없음
//   4. Span 별 주 방언 파싱 — 실패한 Span 은 건너뜀
//   5. 함수 후보 수집 → 적격성 필터 → 이식성 필터
//   6. 긴 호출부터 원문에서 찾아 치환, Span 단위로 오프셋 fold
//   7. 변경이 있고 dry_run 이 아니면 임시 파일 + rename 으로 기록
//
// [적격성 필터]
// - 정규 렌더링에 '*' 가 있으면 제외 (COUNT(*) 등).
// - 인자 없는 COUNT / SUM / MIN / MAX / AVG 는 제외.
//
// [멱등성]
// - 치환 결과 {{ portable_xxx(...) }} 는 허용 목록 밖 템플릿 식이므로
//   다음 실행에서 파일 전체가 Unsafe 로 분류되어 변경되지 않는다.
//
// [스레드 안전성]
// - rewrite_text / rewrite_file 은 const 이며 여러 스레드에서 동시 호출 가능.
//   logger / stats 는 스레드 안전한 구현이어야 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "dialect/dialect_oracle.hpp"
#include "rewrite/span_splicer.hpp"
#include "template/template_classifier.hpp"

class StructuredLogger;
class StatsCollector;

// ---------------------------------------------------------------------------
// RewriteOutcome
//   skip_reason 이 비어 있지 않으면 파일 단위로 처리하지 않은 것이다.
// ---------------------------------------------------------------------------
struct RewriteOutcome {
    std::string              text{};
    bool                     modified{false};
    std::vector<std::string> functions{};  // 치환된 함수 이름 (적용 순)
    std::size_t              spans_failed{0};
    std::string              skip_reason{};
    std::string              detail{};
};

class ModelRewriter {
public:
    // oracle  : 설정된 방언 집합 (primary = dialects()[0])
    // logger  : nullptr 이면 구조화 로그를 남기지 않는다
    // stats   : nullptr 이면 통계를 집계하지 않는다
    explicit ModelRewriter(DialectOracle     oracle,
                           StructuredLogger* logger = nullptr,
                           StatsCollector*   stats  = nullptr);
    ~ModelRewriter() = default;

    ModelRewriter(const ModelRewriter&)            = delete;
    ModelRewriter& operator=(const ModelRewriter&) = delete;

    // rewrite_text
    //   파일 I/O 없이 원문 하나를 처리한다.
    [[nodiscard]] RewriteOutcome rewrite_text(std::string_view source) const;

    // rewrite_file
    //   반환: 원문과 결과가 다르면 true (dry_run 여부와 무관).
    //   I/O 실패는 예외 없이 false 로 처리한다.
    bool rewrite_file(const std::filesystem::path& path, bool dry_run) const;

    // rewrite_models
    //   roots 아래 모든 *.sql 파일을 workers 개 스레드로 처리하고
    //   변경된 파일 목록을 정렬해 반환한다.
    [[nodiscard]] std::vector<std::filesystem::path>
    rewrite_models(const std::vector<std::filesystem::path>& roots,
                   bool                                      dry_run,
                   std::size_t                               workers = 0) const;

    // build_directives
    //   파싱된 Span 트리에서 치환 지시 목록을 만든다.
    [[nodiscard]] std::vector<RewriteDirective> build_directives(const SqlNode& tree) const;

    [[nodiscard]] const DialectOracle& oracle() const { return oracle_; }

private:
    void report_skip(const std::filesystem::path& path,
                     std::string_view             reason,
                     std::string_view             detail) const;

    DialectOracle      oracle_;
    TemplateClassifier classifier_;
    StructuredLogger*  logger_;
    StatsCollector*    stats_;
};
