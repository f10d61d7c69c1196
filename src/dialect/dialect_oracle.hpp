#pragma once

// ---------------------------------------------------------------------------
// dialect_oracle.hpp
//
// 설정된 방언 집합에 대해 함수 호출이 이식 가능한지 판정한다.
//
// [판정 규칙]
// - function_differs: 모든 방언에서 렌더링 결과가 같을 때만 false.
//   어느 한 방언에서라도 렌더링이 실패하면 이식 불가(true)로 본다.
// - catalog_differences: 카탈로그 표면 이름의 합집합 중
//   impl_id 가 방언마다 다르거나 일부 방언에 없는 이름.
//
// [미등록 방언]
// - 별칭 정규화 후에도 레지스트리에 없으면 빈 카탈로그로 취급한다.
//   parse / render 는 ParseError(kUnsupportedDialect) 를 반환한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "dialect/dialect_profile.hpp"
#include "parser/sql_ast.hpp"

class DialectOracle {
public:
    // dialect_ids: 설정 순서 그대로. 첫 번째가 주 방언(primary)이다.
    explicit DialectOracle(const std::vector<std::string>& dialect_ids);
    ~DialectOracle() = default;

    DialectOracle(const DialectOracle&)            = default;
    DialectOracle& operator=(const DialectOracle&) = default;
    DialectOracle(DialectOracle&&)                 = default;
    DialectOracle& operator=(DialectOracle&&)      = default;

    [[nodiscard]] static std::string normalize(std::string_view dialect_id);

    // 정규화된 방언 이름 (설정 순서)
    [[nodiscard]] const std::vector<std::string>& dialects() const { return names_; }
    [[nodiscard]] const std::string&              primary() const;

    // parse
    //   주 방언 문법으로 파싱한다.
    [[nodiscard]] std::expected<SqlNode, ParseError> parse(std::string_view sql) const;

    // render
    //   dialect 의 표면 구문으로 출력한다. dialect 는 별칭이어도 된다.
    [[nodiscard]] std::expected<std::string, ParseError>
    render(const SqlNode& node, std::string_view dialect) const;

    // render_primary
    //   주 방언 정규 렌더링.
    [[nodiscard]] std::expected<std::string, ParseError> render_primary(const SqlNode& node) const;

    [[nodiscard]] bool function_differs(const SqlNode& node) const;

    // catalog_differences
    //   정렬된 대문자 함수 이름 목록.
    [[nodiscard]] std::vector<std::string> catalog_differences() const;

    // transpile
    //   read 방언으로 파싱한 문장을 write 방언으로 출력한다.
    [[nodiscard]] static std::expected<std::string, ParseError>
    transpile(std::string_view sql, std::string_view read, std::string_view write);

private:
    std::vector<std::string>           names_;
    std::vector<const DialectProfile*> profiles_;  // 미등록 방언은 nullptr
};
