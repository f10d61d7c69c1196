// ---------------------------------------------------------------------------
// test_sql_parser.cpp
//
// SqlParser 단위 테스트.
//
// [테스트 범위]
// - 질의 구조 (SELECT 절 목록, WITH, 집합 연산, 서브쿼리)
// - 함수 호출 노드 (인자 수, DISTINCT, *, OVER, 점 경로 이름)
// - 마스킹 텍스트 관대 처리 (__JINJA__, / __PLACEHOLDER__ / 후행 쉼표)
// - 방언 문법 옵션 (:: 캐스트, 백틱 인용 식별자)
// - 에러 처리 (빈 입력, 복수 문장, 괄호 불일치)
//
// [알려진 한계]
// - 식의 의미 검증은 하지 않는다. 존재하지 않는 함수도 정상 파싱된다.
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// 헬퍼: 트리에서 첫 번째 함수 노드를 찾는다 (전위 순회)
// ---------------------------------------------------------------------------
static const SqlNode* find_function(const SqlNode& node) {
    if (node.kind == NodeKind::kFunction) {
        return &node;
    }
    for (const auto& child : node.children) {
        if (const SqlNode* found = find_function(child)) {
            return found;
        }
    }
    return nullptr;
}

static std::size_t count_functions(const SqlNode& node) {
    std::size_t n = node.kind == NodeKind::kFunction ? 1 : 0;
    for (const auto& child : node.children) {
        n += count_functions(child);
    }
    return n;
}

// ---------------------------------------------------------------------------
// 질의 구조
// ---------------------------------------------------------------------------

TEST(SqlParser, SelectClauses) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT id, name FROM users WHERE id > 1 ORDER BY name");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->kind, NodeKind::kSelect);
    ASSERT_EQ(result->children.size(), 4u);
    EXPECT_EQ(result->children[0].value, "PROJECTION");
    EXPECT_EQ(result->children[0].children.size(), 2u);
    EXPECT_EQ(result->children[1].value, "FROM");
    EXPECT_EQ(result->children[2].value, "WHERE");
    EXPECT_EQ(result->children[3].value, "ORDER BY");
}

TEST(SqlParser, SelectDistinct) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT DISTINCT a FROM t");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->flag);
}

TEST(SqlParser, WithClause) {
    SqlParser  parser;
    const auto result = parser.parse("WITH a AS (SELECT 1 AS x) SELECT x FROM a");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, NodeKind::kWith);
}

TEST(SqlParser, UnionAll) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT a FROM t UNION ALL SELECT a FROM u");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->kind, NodeKind::kSetOp);
    EXPECT_EQ(result->value, "UNION ALL");
    EXPECT_EQ(result->children.size(), 2u);
}

TEST(SqlParser, JoinAndSubquery) {
    SqlParser  parser;
    const auto result = parser.parse(
        "SELECT o.id FROM orders o LEFT JOIN (SELECT id FROM users) u ON o.user_id = u.id");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, NodeKind::kSelect);
}

TEST(SqlParser, AliasNode) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT a AS b FROM t");
    ASSERT_TRUE(result.has_value());
    const auto& item = result->children[0].children[0];
    EXPECT_EQ(item.kind, NodeKind::kAlias);
    EXPECT_EQ(item.value, "b");
}

// ---------------------------------------------------------------------------
// 함수 호출
// ---------------------------------------------------------------------------

TEST(SqlParser, FunctionCall) {
    SqlParser  parser;
    const auto result = parser.parse_expression("COLLECT_LIST(col)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->kind, NodeKind::kFunction);
    EXPECT_EQ(result->value, "COLLECT_LIST");
    EXPECT_EQ(function_arity(*result), 1u);
}

TEST(SqlParser, FunctionNamePreservesCase) {
    SqlParser  parser;
    const auto result = parser.parse_expression("collect_list(col)");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "collect_list");
}

TEST(SqlParser, CountStar) {
    SqlParser  parser;
    const auto result = parser.parse_expression("COUNT(*)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->children.size(), 1u);
    EXPECT_EQ(result->children[0].kind, NodeKind::kStar);
}

TEST(SqlParser, EmptyArgumentList) {
    SqlParser  parser;
    const auto result = parser.parse_expression("COUNT()");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(function_arity(*result), 0u);
}

TEST(SqlParser, DistinctArgument) {
    SqlParser  parser;
    const auto result = parser.parse_expression("COUNT(DISTINCT user_id)");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->flag);
    EXPECT_EQ(function_arity(*result), 1u);
}

TEST(SqlParser, WindowIsModifierNotArgument) {
    SqlParser  parser;
    const auto result =
        parser.parse_expression("ROW_NUMBER() OVER (PARTITION BY a ORDER BY b DESC)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->kind, NodeKind::kFunction);
    EXPECT_EQ(function_arity(*result), 0u);
    ASSERT_EQ(result->children.size(), 1u);
    EXPECT_EQ(result->children[0].kind, NodeKind::kWindow);
}

TEST(SqlParser, NestedFunctions) {
    SqlParser  parser;
    const auto result =
        parser.parse("SELECT COALESCE(COLLECT_LIST(a), ARRAY()) AS xs FROM t GROUP BY b");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(count_functions(*result), 3u);
    const SqlNode* outer = find_function(*result);
    ASSERT_NE(outer, nullptr);
    EXPECT_EQ(outer->value, "COALESCE");
}

TEST(SqlParser, DottedFunctionName) {
    SqlParser  parser;
    const auto result = parser.parse_expression("my_schema.my_udf(x, y)");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->kind, NodeKind::kFunction);
    EXPECT_EQ(result->value, "my_schema.my_udf");
    EXPECT_EQ(function_arity(*result), 2u);
}

TEST(SqlParser, CurrentDateWithoutParentheses) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT CURRENT_DATE FROM t");
    ASSERT_TRUE(result.has_value());
}

// ---------------------------------------------------------------------------
// 마스킹 텍스트 관대 처리
// ---------------------------------------------------------------------------

TEST(SqlParser, ControlPlaceholdersDropped) {
    SqlParser  parser;
    const auto result = parser.parse(
        "SELECT  __JINJA__,  COLLECT_LIST(col)  __JINJA__,  FROM t");
    ASSERT_TRUE(result.has_value());
    const SqlNode* fn = find_function(*result);
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->value, "COLLECT_LIST");
}

TEST(SqlParser, ValuePlaceholderAsTable) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT a FROM  __PLACEHOLDER__ ");
    ASSERT_TRUE(result.has_value());
}

TEST(SqlParser, LeadingConfigPlaceholderSkipped) {
    SqlParser  parser;
    const auto result = parser.parse(" __PLACEHOLDER__ \nSELECT a FROM t");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, NodeKind::kSelect);
}

TEST(SqlParser, TrailingCommaInSelectList) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT a, b, FROM t");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->children[0].children.size(), 2u);
}

TEST(SqlParser, CommentsIgnored) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT a -- trailing\nFROM t /* block */ WHERE b = 1");
    ASSERT_TRUE(result.has_value());
}

TEST(SqlParser, TrailingSemicolon) {
    SqlParser  parser;
    EXPECT_TRUE(parser.parse("SELECT 1;").has_value());
}

// ---------------------------------------------------------------------------
// 방언 문법 옵션
// ---------------------------------------------------------------------------

TEST(SqlParser, DoubleColonCast) {
    SqlParser  parser{GrammarOptions{.identifier_quote       = '"',
                                     .double_quote_is_string = false,
                                     .backslash_escapes      = false,
                                     .double_colon_cast      = true}};
    const auto result = parser.parse_expression("created_at::date");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, NodeKind::kCast);
    EXPECT_TRUE(result->flag);
}

TEST(SqlParser, BacktickIdentifier) {
    SqlParser  parser{GrammarOptions{.identifier_quote       = '`',
                                     .double_quote_is_string = true,
                                     .backslash_escapes      = true,
                                     .double_colon_cast      = false}};
    const auto result = parser.parse("SELECT `my col` FROM `db`.`t`");
    ASSERT_TRUE(result.has_value());
}

// ---------------------------------------------------------------------------
// 에러 처리
// ---------------------------------------------------------------------------

TEST(SqlParser, EmptyString) {
    SqlParser  parser;
    const auto result = parser.parse("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kInvalidSql);
}

TEST(SqlParser, WhitespaceOnly) {
    SqlParser parser;
    EXPECT_FALSE(parser.parse("   \n\t ").has_value());
}

TEST(SqlParser, MultipleStatementsRejected) {
    SqlParser parser;
    EXPECT_FALSE(parser.parse("SELECT 1; SELECT 2").has_value());
}

TEST(SqlParser, UnbalancedParenthesis) {
    SqlParser  parser;
    const auto result = parser.parse("SELECT COLLECT_LIST(a FROM t");
    ASSERT_FALSE(result.has_value());
    EXPECT_FALSE(result.error().message.empty());
}

TEST(SqlParser, DmlNotSupported) {
    SqlParser parser;
    EXPECT_FALSE(parser.parse("DELETE FROM t WHERE id = 1").has_value());
}

TEST(SqlParser, DeepNestingRejected) {
    std::string sql = "SELECT ";
    for (int i = 0; i < 500; ++i) {
        sql += "(";
    }
    sql += "1";
    for (int i = 0; i < 500; ++i) {
        sql += ")";
    }
    SqlParser parser;
    EXPECT_FALSE(parser.parse(sql).has_value());
}
