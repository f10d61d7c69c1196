// ---------------------------------------------------------------------------
// test_dialect_oracle.cpp
//
// DialectRegistry / DialectOracle 단위 테스트.
//
// [테스트 범위]
// - 방언 이름 정규화 (별칭, 대소문자, 미등록 이름)
// - function_differs: 같은 렌더링이면 false, 렌더 실패/미등록 방언이면 true
// - catalog_differences: 정렬, 균일 함수 제외, 일부 방언에만 있는 이름 포함
// - transpile: 함수 이름 매핑, 인자 순서 재배치, TRY_CAST 키워드
// ---------------------------------------------------------------------------

#include "dialect/dialect_oracle.hpp"
#include "dialect/dialect_registry.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// 헬퍼
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

static bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// 주 방언으로 파싱한 문장의 첫 함수 호출이 방언 간 다른지
static bool differs(const DialectOracle& oracle, const std::string& sql) {
    const auto tree = oracle.parse(sql);
    EXPECT_TRUE(tree.has_value()) << sql;
    if (!tree) {
        return false;
    }
    const SqlNode* fn = find_function(*tree);
    EXPECT_NE(fn, nullptr) << sql;
    return fn != nullptr && oracle.function_differs(*fn);
}

// ---------------------------------------------------------------------------
// 정규화 / 레지스트리
// ---------------------------------------------------------------------------

TEST(DialectRegistry, NormalizeAliases) {
    EXPECT_EQ(DialectRegistry::normalize("postgresql"), "postgres");
    EXPECT_EQ(DialectRegistry::normalize("PostgreSQL"), "postgres");
    EXPECT_EQ(DialectRegistry::normalize("Spark"), "spark");
    EXPECT_EQ(DialectRegistry::normalize("DUCKDB"), "duckdb");
}

TEST(DialectRegistry, UnknownNameIsLowercased) {
    EXPECT_EQ(DialectRegistry::normalize("Oracle"), "oracle");
    EXPECT_EQ(DialectRegistry::find("oracle"), nullptr);
}

TEST(DialectRegistry, BuiltinDialects) {
    const auto names = DialectRegistry::names();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    for (const std::string name : {"bigquery", "databricks", "duckdb", "mysql", "postgres",
                                   "presto", "redshift", "snowflake", "spark", "trino"}) {
        EXPECT_TRUE(contains(names, name)) << name;
        ASSERT_NE(DialectRegistry::find(name), nullptr) << name;
        EXPECT_EQ(DialectRegistry::find(name)->name(), name);
    }
}

TEST(DialectOracle, NormalizeMatchesRegistry) {
    EXPECT_EQ(DialectOracle::normalize("postgresql"), "postgres");
}

TEST(DialectOracle, DialectsKeepConfiguredOrder) {
    DialectOracle oracle{{"DuckDB", "spark", "postgresql"}};
    EXPECT_EQ(oracle.dialects(), (std::vector<std::string>{"duckdb", "spark", "postgres"}));
    EXPECT_EQ(oracle.primary(), "duckdb");
}

// ---------------------------------------------------------------------------
// function_differs
// ---------------------------------------------------------------------------

TEST(DialectOracle, CollectListDiffersBetweenSparkAndDuckdb) {
    DialectOracle oracle{{"spark", "duckdb"}};
    EXPECT_TRUE(differs(oracle, "SELECT COLLECT_LIST(col) FROM t"));
}

TEST(DialectOracle, CountIsPortable) {
    DialectOracle oracle{{"spark", "duckdb"}};
    EXPECT_FALSE(differs(oracle, "SELECT COUNT(col) FROM t"));
}

TEST(DialectOracle, AnonymousFunctionIsPortable) {
    DialectOracle oracle{{"spark", "duckdb", "snowflake"}};
    EXPECT_FALSE(differs(oracle, "SELECT my_udf(a, b) FROM t"));
}

TEST(DialectOracle, SameFamilyDialectsAgree) {
    DialectOracle oracle{{"spark", "databricks"}};
    EXPECT_FALSE(differs(oracle, "SELECT COLLECT_LIST(col) FROM t"));
}

TEST(DialectOracle, MissingImplementationDiffers) {
    DialectOracle oracle{{"spark", "mysql"}};
    EXPECT_TRUE(differs(oracle, "SELECT COLLECT_LIST(col) FROM t"));
}

TEST(DialectOracle, ArgumentOrderDiffers) {
    DialectOracle oracle{{"spark", "snowflake"}};
    EXPECT_TRUE(differs(oracle, "SELECT ARRAY_CONTAINS(tags, 'x') FROM t"));
}

TEST(DialectOracle, UnknownDialectMakesEverythingDiffer) {
    DialectOracle oracle{{"spark", "oracle"}};
    EXPECT_TRUE(differs(oracle, "SELECT COUNT(col) FROM t"));
}

TEST(DialectOracle, UnknownPrimaryCannotParse) {
    DialectOracle oracle{{"oracle", "spark"}};
    const auto    tree = oracle.parse("SELECT 1");
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, ParseErrorCode::kUnsupportedDialect);
}

TEST(DialectOracle, RenderAcceptsAlias) {
    DialectOracle oracle{{"spark", "postgres"}};
    const auto    tree = oracle.parse("SELECT NVL(a, b) FROM t");
    ASSERT_TRUE(tree.has_value());
    const SqlNode* fn = find_function(*tree);
    ASSERT_NE(fn, nullptr);

    const auto rendered = oracle.render(*fn, "PostgreSQL");
    ASSERT_TRUE(rendered.has_value());
    EXPECT_EQ(*rendered, "COALESCE(a, b)");

    const auto primary = oracle.render_primary(*fn);
    ASSERT_TRUE(primary.has_value());
    EXPECT_EQ(*primary, "NVL(a, b)");
}

// ---------------------------------------------------------------------------
// catalog_differences
// ---------------------------------------------------------------------------

TEST(DialectOracle, CatalogDifferencesSparkDuckdb) {
    DialectOracle oracle{{"spark", "duckdb"}};
    const auto    names = oracle.catalog_differences();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_TRUE(contains(names, "COLLECT_LIST"));
    EXPECT_TRUE(contains(names, "LIST"));
    EXPECT_TRUE(contains(names, "NVL"));
    EXPECT_FALSE(contains(names, "COUNT"));
    EXPECT_FALSE(contains(names, "SUM"));
}

TEST(DialectOracle, CatalogDifferencesEmptyForSameDialect) {
    DialectOracle oracle{{"spark", "spark"}};
    EXPECT_TRUE(oracle.catalog_differences().empty());
}

TEST(DialectOracle, CatalogDifferencesWithUnknownDialect) {
    DialectOracle oracle{{"spark", "oracle"}};
    const auto    names = oracle.catalog_differences();
    EXPECT_TRUE(contains(names, "COUNT"));
    EXPECT_TRUE(contains(names, "COLLECT_LIST"));
}

// ---------------------------------------------------------------------------
// transpile
// ---------------------------------------------------------------------------

TEST(DialectOracle, TranspileRenamesFunction) {
    const auto sql = DialectOracle::transpile("SELECT COLLECT_LIST(x) FROM t", "spark", "duckdb");
    ASSERT_TRUE(sql.has_value());
    EXPECT_EQ(*sql, "SELECT ARRAY_AGG(x) FROM t");
}

TEST(DialectOracle, TranspileNvlToCoalesce) {
    const auto sql = DialectOracle::transpile("SELECT NVL(a, b) FROM t", "spark", "duckdb");
    ASSERT_TRUE(sql.has_value());
    EXPECT_EQ(*sql, "SELECT COALESCE(a, b) FROM t");
}

TEST(DialectOracle, TranspileReordersArguments) {
    const auto sql =
        DialectOracle::transpile("SELECT ARRAY_CONTAINS(arr, 1) FROM t", "spark", "snowflake");
    ASSERT_TRUE(sql.has_value());
    EXPECT_EQ(*sql, "SELECT ARRAY_CONTAINS(1, arr) FROM t");
}

TEST(DialectOracle, TranspileDateTruncToBigquery) {
    const auto sql =
        DialectOracle::transpile("SELECT DATE_TRUNC('DAY', ts) FROM t", "spark", "bigquery");
    ASSERT_TRUE(sql.has_value());
    EXPECT_EQ(*sql, "SELECT TIMESTAMP_TRUNC(ts, 'DAY') FROM t");
}

TEST(DialectOracle, TranspileNiladicCurrentDate) {
    const auto to_spark = DialectOracle::transpile("SELECT CURRENT_DATE FROM t", "duckdb", "spark");
    ASSERT_TRUE(to_spark.has_value());
    EXPECT_EQ(*to_spark, "SELECT CURRENT_DATE() FROM t");

    const auto to_duckdb =
        DialectOracle::transpile("SELECT CURRENT_DATE() FROM t", "spark", "duckdb");
    ASSERT_TRUE(to_duckdb.has_value());
    EXPECT_EQ(*to_duckdb, "SELECT CURRENT_DATE FROM t");
}

TEST(DialectOracle, TranspileTryCastKeyword) {
    const auto sql =
        DialectOracle::transpile("SELECT TRY_CAST(x AS INT) FROM t", "spark", "bigquery");
    ASSERT_TRUE(sql.has_value());
    EXPECT_NE(sql->find("SAFE_CAST(x AS "), std::string::npos);
}

TEST(DialectOracle, TranspileUnknownDialect) {
    const auto sql = DialectOracle::transpile("SELECT 1", "spark", "oracle");
    ASSERT_FALSE(sql.has_value());
    EXPECT_EQ(sql.error().code, ParseErrorCode::kUnsupportedDialect);
}

TEST(DialectOracle, TranspileUnsupportedFunction) {
    const auto sql = DialectOracle::transpile("SELECT COLLECT_LIST(x) FROM t", "spark", "mysql");
    ASSERT_FALSE(sql.has_value());
    EXPECT_EQ(sql.error().code, ParseErrorCode::kRenderError);
}

TEST(DialectOracle, TranspileParseError) {
    const auto sql = DialectOracle::transpile("SELECT FROM", "spark", "duckdb");
    EXPECT_FALSE(sql.has_value());
}
