#pragma once

// ---------------------------------------------------------------------------
// span_splicer.hpp
//
// 원문 텍스트 안에서 정규 렌더링된 함수 호출을 찾아 매크로 호출로 치환한다.
//
// [좌표계]
// - 파서가 보는 것은 마스킹 텍스트지만 치환은 항상 원문 텍스트에서 한다.
//   정규 렌더링 문자열을 원문에서 다시 찾는 방식으로 좌표를 맞춘다.
//
// [위치 탐색 가드] (locate_call)
// - 식별자 경계: 앞 문자가 식별자 문자가 아니어야 한다 (XCOLLECT_LIST 제외).
// - 코드 영역: SQL 문자열 리터럴, 인용 식별자, 주석, 템플릿 태그 밖이어야 한다.
// - 템플릿 가드: 앞쪽의 여는 태그({{ {% {#) 수가 닫는 태그 수보다 많으면
//   열린 템플릿 식 내부로 보고 제외한다.
// - 대소문자 일치 검색을 먼저 하고, 없으면 대소문자 무시 검색을 한다.
//
// [오프셋 fold]
// - SpliceState{text, offset} 는 불변 값으로 다룬다. splice_span 은 새 상태를
//   반환하며 offset 에 누적 길이 변화를 더해 다음 Span 위치를 보정한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// RewriteDirective
// ---------------------------------------------------------------------------
struct RewriteDirective {
    std::string original_text{};     // 주 방언 정규 렌더링
    std::string replacement_text{};  // {{ portable_xxx(...) }}
    std::string function_name{};     // 대문자 함수 이름
    std::size_t depth{0};            // 진단용
};

// ---------------------------------------------------------------------------
// AppliedDirectives
//   apply_directives 결과. functions 는 실제로 치환된 directive 의 이름 (적용 순).
// ---------------------------------------------------------------------------
struct AppliedDirectives {
    std::string              text{};
    std::vector<std::string> functions{};
};

// ---------------------------------------------------------------------------
// SpliceState
// ---------------------------------------------------------------------------
struct SpliceState {
    std::string    text{};
    std::ptrdiff_t offset{0};  // 지금까지의 누적 길이 변화
};

// build_macro_call
//   function_name: 대문자 함수 이름 (COLLECT_LIST)
//   canonical    : 주 방언 정규 렌더링 (COLLECT_LIST(col))
//   반환         : {{ portable_collect_list('col') }}
[[nodiscard]] std::string build_macro_call(std::string_view function_name,
                                           std::string_view canonical);

// is_string_literal
//   text 전체가 하나의 '...' 또는 "..." 리터럴이면 true.
[[nodiscard]] bool is_string_literal(std::string_view text);

// inside_open_template
//   text[0, pos) 에서 여는 템플릿 태그가 닫는 태그보다 많으면 true.
[[nodiscard]] bool inside_open_template(std::string_view text, std::size_t pos);

// code_mask
//   각 바이트가 SQL 코드 영역이면 true, 문자열/주석/템플릿 태그 내부면 false.
[[nodiscard]] std::vector<bool> code_mask(std::string_view text);

// locate_call
//   모든 가드를 통과하는 needle 의 첫 위치. 없으면 std::nullopt.
[[nodiscard]] std::optional<std::size_t> locate_call(std::string_view text,
                                                     std::string_view needle);

// apply_directives
//   directive 를 원문 길이 내림차순으로 정렬해 하나씩 첫 위치만 치환한다.
[[nodiscard]] AppliedDirectives apply_directives(std::string_view              region,
                                                 std::vector<RewriteDirective> directives);

// splice_span
//   원문 좌표 [start, end) 의 현재 내용을 replacement 로 바꾼 새 상태.
[[nodiscard]] SpliceState splice_span(const SpliceState& state,
                                      std::size_t        start,
                                      std::size_t        end,
                                      std::string_view   replacement);

// current_slice
//   원문 좌표 [start, end) 에 해당하는 현재 텍스트.
[[nodiscard]] std::string_view current_slice(const SpliceState& state,
                                             std::size_t        start,
                                             std::size_t        end);
