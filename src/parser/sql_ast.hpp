#pragma once

// ---------------------------------------------------------------------------
// sql_ast.hpp
//
// 마스킹된 SQL 을 파싱한 결과 트리.
//
// [설계 원칙]
// - 방언 독립적인 단일 노드 타입(SqlNode)으로 모든 구문을 표현한다.
//   방언별 표면 구문 차이는 DialectProfile 의 렌더러가 담당한다.
// - 함수 호출 노드는 파싱한 방언의 카탈로그로 impl_id(구현 식별자)가
//   해석된다. impl_id 가 비어 있으면 이름 그대로 렌더링되는 익명 함수다.
//
// [노드별 필드 사용 규칙]
//   kSelect     flag=DISTINCT, children=kClause 목록 (PROJECTION/FROM/WHERE/...)
//   kSetOp      value="UNION ALL" 등, children=[left, right]
//   kWith       flag=RECURSIVE, children=[kCte..., body]
//   kCte        value=이름, children=[query, (컬럼 kIdentifier...)]
//   kSubquery   children=[query]
//   kTable      children=kIdentifier 경로 (db.schema.table)
//   kJoin       value="LEFT JOIN" 등, children=[table_ref, (ON/USING kClause)]
//   kLateralView value="LATERAL VIEW [OUTER]", children=[function, alias, cols...]
//   kAlias      value=별칭, flag=별칭 인용 여부, children=[expr, (컬럼 kIdentifier...)]
//   kColumn     children=kIdentifier / kStar 경로 (t.col, t.*)
//   kIdentifier value=이름, flag=인용 식별자
//   kLiteral    value=이스케이프 해제된 문자열 내용
//   kFunction   value=작성된 이름, impl_id, flag=DISTINCT,
//               children=인자들 + (ORDER BY/FILTER kClause, kWindow)
//   kWindow     value=명명된 윈도우 참조, children=PARTITION BY/ORDER BY/FRAME kClause
//   kBinary     value=연산자 (AND, =, LIKE, IS NOT ...), children=[lhs, rhs]
//   kUnary      value=연산자 (NOT, -, +, ~), children=[operand]
//   kCase       flag=피연산자 존재, children=[(operand), kWhen..., (ELSE kClause)]
//   kCast       value=타입, flag=:: 축약형, children=[expr]
//   kTryCast    value=타입, children=[expr]
//   kInterval   value=단위, children=[expr]
//   kBetween    flag=NOT, children=[expr, low, high]
//   kIn         flag=NOT, children=[expr, item...] 또는 [expr, kSubquery]
//   kOrdered    value="DESC NULLS LAST" 등 후행 수식어, children=[expr]
//   kExtract    value=단위, children=[expr]
//   kTypedLiteral value=타입 키워드 (DATE/TIMESTAMP), children=[kLiteral]
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// NodeKind
// ---------------------------------------------------------------------------
enum class NodeKind : std::uint8_t {
    kSelect       = 0,
    kClause       = 1,
    kSetOp        = 2,
    kWith         = 3,
    kCte          = 4,
    kSubquery     = 5,
    kTable        = 6,
    kJoin         = 7,
    kLateralView  = 8,
    kAlias        = 9,
    kColumn       = 10,
    kIdentifier   = 11,
    kStar         = 12,
    kLiteral      = 13,
    kNumber       = 14,
    kBoolean      = 15,
    kNull         = 16,
    kFunction     = 17,
    kWindow       = 18,
    kBinary       = 19,
    kUnary        = 20,
    kCase         = 21,
    kWhen         = 22,
    kCast         = 23,
    kTryCast      = 24,
    kInterval     = 25,
    kBetween      = 26,
    kIn           = 27,
    kParen        = 28,
    kTuple        = 29,
    kSubscript    = 30,
    kOrdered      = 31,
    kExists       = 32,
    kExtract      = 33,
    kTypedLiteral = 34,
};

// ---------------------------------------------------------------------------
// SqlNode
// ---------------------------------------------------------------------------
struct SqlNode {
    NodeKind             kind{NodeKind::kIdentifier};
    std::string          value{};     // 노드별 의미는 파일 상단 표 참고
    std::string          impl_id{};   // kFunction 전용: 카탈로그 구현 식별자
    bool                 flag{false}; // 노드별 의미는 파일 상단 표 참고
    std::vector<SqlNode> children{};
};

// 함수 인자가 아닌 후행 수식어(ORDER BY / FILTER 절, OVER 윈도우)인지 판정한다.
[[nodiscard]] inline bool is_function_modifier(const SqlNode& node) {
    return node.kind == NodeKind::kClause || node.kind == NodeKind::kWindow;
}

// kFunction 노드의 인자 개수 (후행 수식어 제외).
[[nodiscard]] inline std::size_t function_arity(const SqlNode& node) {
    std::size_t count = 0;
    for (const auto& child : node.children) {
        if (!is_function_modifier(child)) {
            ++count;
        }
    }
    return count;
}
