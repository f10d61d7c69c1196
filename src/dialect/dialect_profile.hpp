#pragma once

// ---------------------------------------------------------------------------
// dialect_profile.hpp
//
// SQL 방언 하나의 문법/카탈로그/렌더링 규칙 인터페이스.
//
// [구성]
// - FunctionCatalog: 대문자 표면 함수 이름 → 구현 식별자(impl_id) + 인자 순서.
//   같은 impl_id 를 공유하는 함수는 방언 간 같은 동작으로 간주한다.
// - RenderTemplate : impl_id 별 출력 패턴. 인자 개수(arity)로 선택한다.
//     {0}, {1} ... : 정규 순서 인자
//     {*}          : 모든 인자를 ", " 로 연결
// - 카탈로그에 없는 함수는 익명 함수로 보고 작성된 이름 그대로 출력한다.
//
// [정규 인자 순서]
//   arg_order 가 비어 있지 않으면 파싱 시 canonical[i] = surface[arg_order[i]]
//   로 재배치한다. 렌더 템플릿은 항상 정규 순서를 기준으로 작성한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/sql_ast.hpp"
#include "parser/sql_lexer.hpp"

// ---------------------------------------------------------------------------
// CatalogEntry
// ---------------------------------------------------------------------------
struct CatalogEntry {
    std::string              impl_id{};
    std::vector<std::size_t> arg_order{};  // 비어 있으면 표면 순서 = 정규 순서
};

using FunctionCatalog = std::map<std::string, CatalogEntry>;

// ---------------------------------------------------------------------------
// RenderTemplate
// ---------------------------------------------------------------------------
inline constexpr int kAnyArity = -1;

struct RenderTemplate {
    int         arity{kAnyArity};  // kAnyArity 면 인자 개수 무관
    std::string pattern{};
};

// ---------------------------------------------------------------------------
// DialectProfile
//   방언 인터페이스. 구현체는 DialectRegistry 의 정적 테이블에 등록된다.
// ---------------------------------------------------------------------------
class DialectProfile {
public:
    virtual ~DialectProfile() = default;

    [[nodiscard]] virtual const std::string&    name() const    = 0;
    [[nodiscard]] virtual const GrammarOptions& grammar() const = 0;

    // parse
    //   이 방언 문법으로 파싱하고 함수 노드의 impl_id 를 카탈로그로 해석한다.
    [[nodiscard]] virtual std::expected<SqlNode, ParseError> parse(std::string_view sql) const = 0;

    // render
    //   트리를 이 방언의 표면 구문으로 출력한다.
    //   지원하지 않는 함수/인자 개수면 ParseError(kRenderError).
    [[nodiscard]] virtual std::expected<std::string, ParseError> render(const SqlNode& node) const = 0;

    [[nodiscard]] virtual const FunctionCatalog& catalog() const = 0;

    // templates_for
    //   impl_id 의 렌더 템플릿 목록. 이 방언에 구현이 없으면 nullptr.
    [[nodiscard]] virtual const std::vector<RenderTemplate>*
    templates_for(std::string_view impl_id) const = 0;

    // try_cast_keyword
    //   TRY_CAST 계열 출력 키워드 (bigquery 는 SAFE_CAST).
    [[nodiscard]] virtual std::string_view try_cast_keyword() const = 0;

protected:
    DialectProfile() = default;
    DialectProfile(const DialectProfile&)            = default;
    DialectProfile& operator=(const DialectProfile&) = default;
};

// ---------------------------------------------------------------------------
// DialectDefinition
//   테이블 기반 방언의 선언적 정의.
// ---------------------------------------------------------------------------
struct DialectDefinition {
    std::string                                               name{};
    GrammarOptions                                            grammar{};
    FunctionCatalog                                           catalog{};
    std::map<std::string, std::vector<RenderTemplate>, std::less<>> renderers{};
    std::string                                               try_cast_keyword{"TRY_CAST"};
};

// ---------------------------------------------------------------------------
// TableDialect
//   DialectDefinition 을 그대로 따르는 DialectProfile 구현.
// ---------------------------------------------------------------------------
class TableDialect final : public DialectProfile {
public:
    explicit TableDialect(DialectDefinition definition);
    ~TableDialect() override = default;

    TableDialect(const TableDialect&)            = delete;
    TableDialect& operator=(const TableDialect&) = delete;

    [[nodiscard]] const std::string&    name() const override { return definition_.name; }
    [[nodiscard]] const GrammarOptions& grammar() const override { return definition_.grammar; }

    [[nodiscard]] std::expected<SqlNode, ParseError> parse(std::string_view sql) const override;
    [[nodiscard]] std::expected<std::string, ParseError> render(const SqlNode& node) const override;

    [[nodiscard]] const FunctionCatalog& catalog() const override { return definition_.catalog; }

    [[nodiscard]] const std::vector<RenderTemplate>*
    templates_for(std::string_view impl_id) const override;

    [[nodiscard]] std::string_view try_cast_keyword() const override {
        return definition_.try_cast_keyword;
    }

private:
    void resolve_functions(SqlNode& node) const;

    DialectDefinition definition_;
};
