#pragma once

// ---------------------------------------------------------------------------
// sql_parser.hpp
//
// 마스킹된 dbt 모델 SQL 을 SqlNode 트리로 변환하는 재귀 하강 파서.
//
// [지원 범위]
// - 단일 SELECT 질의: WITH(CTE), 집합 연산(UNION/INTERSECT/EXCEPT),
//   JOIN / LATERAL VIEW, 서브쿼리, GROUP BY / HAVING / QUALIFY /
//   ORDER BY / LIMIT / OFFSET.
// - 식: 산술/비교/논리 연산, CASE, CAST / TRY_CAST / ::, EXTRACT,
//   INTERVAL, BETWEEN, IN, LIKE 계열, 윈도우 함수(OVER), FILTER, 람다(->).
//
// [마스킹 텍스트 관대 처리]
// - 제어 흐름 플레이스홀더 "__JINJA__," 는 구조적 잡음으로 보고 제거한다.
// - 문장 앞뒤의 "__PLACEHOLDER__" ({{ config(...) }} 등) 는 건너뛴다.
// - 목록 끝의 후행 쉼표(SELECT a, FROM t)는 허용한다.
//
// [설계 한계]
// - 복수 문장(세미콜론 구분)은 파싱 실패로 처리한다.
// - DDL / DML 은 지원하지 않는다 (dbt 모델은 SELECT 문이다).
// - 식의 의미 검증(타입, 이름 해석)은 하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"  // ParseError, ParseErrorCode
#include "parser/sql_ast.hpp"
#include "parser/sql_lexer.hpp"

inline constexpr std::string_view kControlPlaceholderName = "__JINJA__";
inline constexpr std::string_view kValuePlaceholderName   = "__PLACEHOLDER__";

// ---------------------------------------------------------------------------
// SqlParser
//   GrammarOptions 로 방언 어휘 차이를 받는다. 상태 없음 (parse 는 const).
//   실패 시 std::unexpected(ParseError) 를 반환하며 부분 트리는 반환하지 않는다.
// ---------------------------------------------------------------------------
class SqlParser {
public:
    explicit SqlParser(GrammarOptions options = {}) : options_(options) {}
    ~SqlParser() = default;

    // 복사/이동 허용 (stateless)
    SqlParser(const SqlParser&)            = default;
    SqlParser& operator=(const SqlParser&) = default;
    SqlParser(SqlParser&&)                 = default;
    SqlParser& operator=(SqlParser&&)      = default;

    // parse
    //   sql: 마스킹된 SQL 문장 하나 (후행 세미콜론 허용)
    //   반환: 루트 질의 노드 (kSelect / kSetOp / kWith) 또는 ParseError
    [[nodiscard]] std::expected<SqlNode, ParseError> parse(std::string_view sql) const;

    // parse_expression
    //   단일 식을 파싱한다 (테스트 / 부분 렌더링용).
    [[nodiscard]] std::expected<SqlNode, ParseError> parse_expression(std::string_view sql) const;

private:
    GrammarOptions options_;
};
