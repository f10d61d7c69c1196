#pragma once

// ---------------------------------------------------------------------------
// sql_renderer.hpp
//
// SqlNode 트리를 특정 방언의 정규 표면 구문(canonical rendering)으로 출력한다.
//
// [출력 형식]
// - 키워드는 대문자, 식별자는 작성된 대소문자 유지.
// - 함수 호출은 NAME(arg, arg) 형태 (괄호 앞 공백 없음, 쉼표 뒤 공백 하나).
// - 이항 연산자는 앞뒤 공백 하나, 단항 부호는 공백 없음.
//   재작성 엔진은 이 출력을 원문에서 찾으므로 일반적인 작성 습관과 맞춘다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/sql_ast.hpp"

class DialectProfile;

// ---------------------------------------------------------------------------
// SqlRenderer
//   profile 참조는 렌더러 수명 동안 유효해야 한다.
// ---------------------------------------------------------------------------
class SqlRenderer {
public:
    explicit SqlRenderer(const DialectProfile& profile) : profile_(profile) {}
    ~SqlRenderer() = default;

    SqlRenderer(const SqlRenderer&)            = delete;
    SqlRenderer& operator=(const SqlRenderer&) = delete;

    [[nodiscard]] std::expected<std::string, ParseError> render(const SqlNode& node) const;

    // expand_template
    //   {0}, {1}, {*} 자리표시자를 인자 텍스트로 치환한다.
    //   범위를 벗어난 인덱스면 ParseError(kRenderError).
    [[nodiscard]] static std::expected<std::string, ParseError>
    expand_template(std::string_view pattern, const std::vector<std::string>& args);

private:
    const DialectProfile& profile_;
};
