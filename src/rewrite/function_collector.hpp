#pragma once

// ---------------------------------------------------------------------------
// function_collector.hpp
//
// 파싱된 트리를 깊이 우선으로 순회하며 함수 호출 노드를 수집한다.
//
// [rendered_name]
// - 원문 표기가 아니라 주 방언 정규 렌더링에서 추출한 대문자 이름이다.
//   ("collect_list(x)" 와 "COLLECT_LIST(x)" 는 같은 이름으로 집계된다.)
// - 주 방언에서 렌더링이 실패하면 작성된 이름을 대문자로 사용한다.
//
// [수명]
// - FunctionCandidate::node 는 collect_functions 에 넘긴 트리를 가리킨다.
//   트리보다 오래 보관하지 말 것.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <vector>

#include "dialect/dialect_oracle.hpp"
#include "parser/sql_ast.hpp"

struct FunctionCandidate {
    std::size_t    depth{0};
    std::string    rendered_name{};
    const SqlNode* node{nullptr};
};

// collect_functions
//   방문 순서(전위)대로 후보를 반환한다. 루트의 depth 는 0.
[[nodiscard]] std::vector<FunctionCandidate> collect_functions(const SqlNode&       root,
                                                               const DialectOracle& oracle);

// extract_function_name
//   정규 렌더링 "NAME(...)" 또는 "NAME" 에서 대문자 NAME 을 꺼낸다.
//   형태가 맞지 않으면 빈 문자열.
[[nodiscard]] std::string extract_function_name(const std::string& rendered);
