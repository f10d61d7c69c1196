#pragma once

// ---------------------------------------------------------------------------
// template_classifier.hpp
//
// 템플릿 원문을 Region 목록으로 분할하고, 재작성 가능 여부 판정과
// SQL 파서 입력용 마스킹 텍스트 생성을 담당한다.
//
// [불변식]
// - classify 결과 Region 들은 [0, source.size()) 를 빈틈/겹침 없이 순서대로
//   덮는다. 각 Region.content == source.substr(start, end - start).
// - 토큰화 실패 시 부분 결과 없이 파일 전체가 단일 Unsafe Region 이 된다.
//
// [마스킹 규칙]
//   kStatic          → 원문 그대로
//   kSafeExpression  → " __PLACEHOLDER__ "  (식별자 하나로 파싱됨)
//   kControlFlow     → " __JINJA__, "       (쉼표로 끝나 인자 목록 유효성 유지)
//   kUnsafe          → " __JINJA__, "
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "template/template_lexer.hpp"

// ---------------------------------------------------------------------------
// RegionKind
// ---------------------------------------------------------------------------
enum class RegionKind : std::uint8_t {
    kStatic         = 0,  // 템플릿 외부 SQL 텍스트
    kSafeExpression = 1,  // 허용 목록 호출로 시작하는 {{ ... }}
    kControlFlow    = 2,  // 제어 흐름 키워드로 시작하는 {% ... %}, 또는 {# ... #}
    kUnsafe         = 3,  // 그 외 모든 템플릿 구문 — 재작성 금지
};

// ---------------------------------------------------------------------------
// TemplateRegion
// ---------------------------------------------------------------------------
struct TemplateRegion {
    std::size_t start{0};
    std::size_t end{0};
    RegionKind  kind{RegionKind::kStatic};
    std::string content{};  // source[start, end) 원문
};

// ---------------------------------------------------------------------------
// SafetyVerdict
//   Region 목록에 대한 순수 함수 결과.
//   Unsafe Region 이 하나라도 있으면 can_rewrite == false.
// ---------------------------------------------------------------------------
struct SafetyVerdict {
    bool        can_rewrite{false};
    std::string reason{};
};

// ---------------------------------------------------------------------------
// MaskedSpan
//   원문 [start, end) 구간과 그 구간의 마스킹 텍스트.
// ---------------------------------------------------------------------------
struct MaskedSpan {
    std::size_t start{0};
    std::size_t end{0};
    std::string masked_text{};
};

inline constexpr std::string_view kSafePlaceholder  = " __PLACEHOLDER__ ";
inline constexpr std::string_view kJinjaPlaceholder = " __JINJA__, ";

// ---------------------------------------------------------------------------
// TemplateClassifier
//   상태 없는 분류기. 모든 메서드는 const 이며 스레드 간 공유 가능하다.
// ---------------------------------------------------------------------------
class TemplateClassifier {
public:
    TemplateClassifier()  = default;
    ~TemplateClassifier() = default;

    TemplateClassifier(const TemplateClassifier&)            = default;
    TemplateClassifier& operator=(const TemplateClassifier&) = default;
    TemplateClassifier(TemplateClassifier&&)                 = default;
    TemplateClassifier& operator=(TemplateClassifier&&)      = default;

    // classify
    //   source 를 Region 목록으로 분할한다. 빈 입력은 빈 목록.
    [[nodiscard]] std::vector<TemplateRegion> classify(std::string_view source) const;

    // can_safely_rewrite
    //   Unsafe Region 이 없으면 true. Region 이 0개인 경우도 true.
    [[nodiscard]] SafetyVerdict can_safely_rewrite(const std::vector<TemplateRegion>& regions) const;

    // extract_masked_spans
    //   마스킹 텍스트가 공백뿐이면 빈 목록, 아니면 전체 구간을 덮는 Span 1개.
    [[nodiscard]] std::vector<MaskedSpan>
    extract_masked_spans(const std::vector<TemplateRegion>& regions) const;

private:
    TemplateLexer lexer_;
};
