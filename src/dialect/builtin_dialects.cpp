// ---------------------------------------------------------------------------
// builtin_dialects.cpp
//
// 기본 제공 방언의 문법 옵션, 함수 카탈로그, 렌더 템플릿.
//
// [정규 인자 순서 (impl_id 기준)]
//   TimestampTrunc  (unit, expr)
//   DateAdd/DateSub (date, days)
//   DateAddPart     (unit, amount, date)
//   DateAddInterval (date, interval)
//   DateDiff        (end, start)          일 단위
//   DateDiffPart    (unit, start, end)
//   StringAgg       (expr, separator)
//   ArrayContains   (array, value)
//   StrToDate       (text[, format])
//   DateFormat      (expr, format)
//   RegexpExtract   (text, pattern[, group])
//
// [알려진 한계]
// - 날짜 포맷 문자열, 단위 리터럴 표기('day' vs DAY)는 변환하지 않는다.
// ---------------------------------------------------------------------------

#include "dialect/builtin_dialects.hpp"

#include <array>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

// 모든 방언에서 이름과 동작이 같은 함수
constexpr std::array<std::string_view, 37> kUniformFunctions = {
    "COUNT",      "SUM",       "MIN",        "MAX",         "AVG",        "COALESCE",
    "NULLIF",     "LOWER",     "UPPER",      "TRIM",        "LTRIM",      "RTRIM",
    "ABS",        "ROUND",     "FLOOR",      "CEIL",        "SQRT",       "EXP",
    "LN",         "POWER",     "MOD",        "SIGN",        "ROW_NUMBER", "RANK",
    "DENSE_RANK", "NTILE",     "LAG",        "LEAD",        "FIRST_VALUE", "LAST_VALUE",
    "REPLACE",    "CONCAT",    "GREATEST",   "LEAST",       "LPAD",       "RPAD",
    "STDDEV",
};

RenderTemplate any(std::string pattern) {
    return RenderTemplate{.arity = kAnyArity, .pattern = std::move(pattern)};
}

RenderTemplate arity(int count, std::string pattern) {
    return RenderTemplate{.arity = count, .pattern = std::move(pattern)};
}

// impl_id 의 표면 이름들과 렌더 템플릿을 등록한다.
// names 가 비어 있으면 이 방언에서 출력만 가능하고 파싱으로는 해석되지 않는다.
void define(DialectDefinition&                      dialect,
            std::string_view                        impl_id,
            std::initializer_list<std::string_view> names,
            std::vector<RenderTemplate>             templates,
            std::vector<std::size_t>                arg_order = {}) {
    for (const auto name : names) {
        dialect.catalog[std::string(name)] = CatalogEntry{
            .impl_id   = std::string(impl_id),
            .arg_order = arg_order,
        };
    }
    dialect.renderers[std::string(impl_id)] = std::move(templates);
}

DialectDefinition make_base(std::string name, GrammarOptions grammar) {
    DialectDefinition dialect;
    dialect.name    = std::move(name);
    dialect.grammar = grammar;
    for (const auto fn : kUniformFunctions) {
        define(dialect, fn, {fn}, {any(fmt::format("{}({{*}})", fn))});
    }
    return dialect;
}

constexpr GrammarOptions kHiveGrammar{
    .identifier_quote       = '`',
    .double_quote_is_string = true,
    .backslash_escapes      = true,
    .double_colon_cast      = false,
};

constexpr GrammarOptions kAnsiGrammar{
    .identifier_quote       = '"',
    .double_quote_is_string = false,
    .backslash_escapes      = false,
    .double_colon_cast      = true,
};

// ── spark / databricks ──────────────────────────────────────────────────
DialectDefinition spark_family(std::string name, bool double_colon_cast) {
    GrammarOptions grammar    = kHiveGrammar;
    grammar.double_colon_cast = double_colon_cast;
    DialectDefinition d       = make_base(std::move(name), grammar);

    define(d, "ArrayAgg", {"COLLECT_LIST", "ARRAY_AGG"}, {any("COLLECT_LIST({*})")});
    define(d, "SetAgg", {"COLLECT_SET"}, {any("COLLECT_SET({*})")});
    define(d, "TimestampTrunc", {"DATE_TRUNC"}, {arity(2, "DATE_TRUNC({0}, {1})")});
    define(d, "DateAdd", {"DATE_ADD"}, {arity(2, "DATE_ADD({0}, {1})")});
    define(d, "DateSub", {"DATE_SUB"}, {arity(2, "DATE_SUB({0}, {1})")});
    define(d, "DateAddPart", {"DATEADD", "TIMESTAMPADD"}, {arity(3, "DATEADD({0}, {1}, {2})")});
    define(d, "DateAddInterval", {}, {arity(2, "({0} + {1})")});
    define(d, "DateDiff", {"DATEDIFF"}, {arity(2, "DATEDIFF({0}, {1})")});
    define(d, "DateDiffPart", {"TIMESTAMPDIFF"}, {arity(3, "TIMESTAMPDIFF({0}, {1}, {2})")});
    define(d, "CurrentDate", {"CURRENT_DATE"}, {arity(0, "CURRENT_DATE()")});
    define(d, "CurrentTimestamp", {"CURRENT_TIMESTAMP", "NOW"}, {arity(0, "CURRENT_TIMESTAMP()")});
    define(d, "StringAgg", {}, {arity(2, "ARRAY_JOIN(COLLECT_LIST({0}), {1})")});
    define(d, "ArraySize", {"SIZE", "ARRAY_SIZE", "CARDINALITY"}, {arity(1, "SIZE({0})")});
    define(d, "ArrayContains", {"ARRAY_CONTAINS"}, {arity(2, "ARRAY_CONTAINS({0}, {1})")});
    define(d, "RegexpExtract", {"REGEXP_EXTRACT"},
           {arity(2, "REGEXP_EXTRACT({0}, {1})"), arity(3, "REGEXP_EXTRACT({0}, {1}, {2})")});
    define(d, "If", {"IF"}, {arity(3, "IF({0}, {1}, {2})")});
    define(d, "Nvl", {"NVL", "IFNULL"}, {arity(2, "NVL({0}, {1})")});
    define(d, "StrToDate", {"TO_DATE"},
           {arity(1, "TO_DATE({0})"), arity(2, "TO_DATE({0}, {1})")});
    define(d, "DateFormat", {"DATE_FORMAT"}, {arity(2, "DATE_FORMAT({0}, {1})")});
    define(d, "ApproxDistinct", {"APPROX_COUNT_DISTINCT"},
           {arity(1, "APPROX_COUNT_DISTINCT({0})")});
    define(d, "Split", {"SPLIT"}, {arity(2, "SPLIT({0}, {1})")});
    define(d, "RegexpLike", {"RLIKE", "REGEXP_LIKE", "REGEXP"}, {arity(2, "RLIKE({0}, {1})")});
    define(d, "Md5", {"MD5"}, {arity(1, "MD5({0})")});
    define(d, "DayOfWeek", {"DAYOFWEEK"}, {arity(1, "DAYOFWEEK({0})")});
    define(d, "Explode", {"EXPLODE"}, {arity(1, "EXPLODE({0})")});
    define(d, "StartsWith", {"STARTSWITH"}, {arity(2, "STARTSWITH({0}, {1})")});
    define(d, "Length", {"LENGTH", "CHAR_LENGTH", "CHARACTER_LENGTH"}, {arity(1, "LENGTH({0})")});
    define(d, "Substring", {"SUBSTRING", "SUBSTR"}, {any("SUBSTRING({*})")});
    return d;
}

// ── duckdb ──────────────────────────────────────────────────────────────
DialectDefinition duckdb() {
    DialectDefinition d = make_base("duckdb", kAnsiGrammar);

    define(d, "ArrayAgg", {"ARRAY_AGG", "LIST"}, {any("ARRAY_AGG({*})")});
    define(d, "SetAgg", {}, {arity(1, "ARRAY_AGG(DISTINCT {0})")});
    define(d, "TimestampTrunc", {"DATE_TRUNC"}, {arity(2, "DATE_TRUNC({0}, {1})")});
    define(d, "DateAdd", {}, {arity(2, "({0} + INTERVAL ({1}) DAY)")});
    define(d, "DateSub", {}, {arity(2, "({0} - INTERVAL ({1}) DAY)")});
    define(d, "DateAddInterval", {"DATE_ADD"}, {arity(2, "DATE_ADD({0}, {1})")});
    define(d, "DateDiff", {}, {arity(2, "DATE_DIFF('day', {1}, {0})")});
    define(d, "DateDiffPart", {"DATE_DIFF", "DATEDIFF"}, {arity(3, "DATE_DIFF({0}, {1}, {2})")});
    define(d, "CurrentDate", {"CURRENT_DATE", "TODAY"}, {arity(0, "CURRENT_DATE")});
    define(d, "CurrentTimestamp", {"CURRENT_TIMESTAMP", "NOW", "GET_CURRENT_TIMESTAMP"},
           {arity(0, "CURRENT_TIMESTAMP")});
    define(d, "StringAgg", {"STRING_AGG", "LISTAGG", "GROUP_CONCAT"},
           {arity(2, "STRING_AGG({0}, {1})")});
    define(d, "ArraySize", {"ARRAY_LENGTH"}, {arity(1, "ARRAY_LENGTH({0})")});
    define(d, "ArrayContains", {"LIST_CONTAINS", "ARRAY_CONTAINS", "LIST_HAS"},
           {arity(2, "LIST_CONTAINS({0}, {1})")});
    define(d, "RegexpExtract", {"REGEXP_EXTRACT"},
           {arity(2, "REGEXP_EXTRACT({0}, {1})"), arity(3, "REGEXP_EXTRACT({0}, {1}, {2})")});
    define(d, "If", {"IF"}, {arity(3, "IF({0}, {1}, {2})")});
    define(d, "Nvl", {"IFNULL"}, {arity(2, "COALESCE({0}, {1})")});
    define(d, "StrToDate", {},
           {arity(1, "CAST({0} AS DATE)"), arity(2, "CAST(STRPTIME({0}, {1}) AS DATE)")});
    define(d, "DateFormat", {"STRFTIME"}, {arity(2, "STRFTIME({0}, {1})")});
    define(d, "ApproxDistinct", {"APPROX_COUNT_DISTINCT"},
           {arity(1, "APPROX_COUNT_DISTINCT({0})")});
    define(d, "Split", {"STR_SPLIT", "STRING_SPLIT", "STRING_TO_ARRAY", "SPLIT"},
           {arity(2, "STR_SPLIT({0}, {1})")});
    define(d, "RegexpLike", {"REGEXP_MATCHES"}, {arity(2, "REGEXP_MATCHES({0}, {1})")});
    define(d, "Md5", {"MD5"}, {arity(1, "MD5({0})")});
    define(d, "DayOfWeek", {}, {arity(1, "(DAYOFWEEK({0}) + 1)")});
    define(d, "Explode", {"UNNEST"}, {arity(1, "UNNEST({0})")});
    define(d, "StartsWith", {"STARTS_WITH"}, {arity(2, "STARTS_WITH({0}, {1})")});
    define(d, "Length", {"LENGTH"}, {arity(1, "LENGTH({0})")});
    define(d, "Substring", {"SUBSTRING", "SUBSTR"}, {any("SUBSTRING({*})")});
    return d;
}

// ── postgres ────────────────────────────────────────────────────────────
DialectDefinition postgres() {
    DialectDefinition d = make_base("postgres", kAnsiGrammar);

    define(d, "ArrayAgg", {"ARRAY_AGG"}, {any("ARRAY_AGG({*})")});
    define(d, "SetAgg", {}, {arity(1, "ARRAY_AGG(DISTINCT {0})")});
    define(d, "TimestampTrunc", {"DATE_TRUNC"}, {arity(2, "DATE_TRUNC({0}, {1})")});
    define(d, "DateAdd", {}, {arity(2, "({0} + ({1}) * INTERVAL '1 DAY')")});
    define(d, "DateSub", {}, {arity(2, "({0} - ({1}) * INTERVAL '1 DAY')")});
    define(d, "DateAddInterval", {}, {arity(2, "({0} + {1})")});
    define(d, "DateDiff", {}, {arity(2, "(CAST({0} AS DATE) - CAST({1} AS DATE))")});
    define(d, "CurrentDate", {"CURRENT_DATE"}, {arity(0, "CURRENT_DATE")});
    define(d, "CurrentTimestamp", {"CURRENT_TIMESTAMP", "NOW"}, {arity(0, "CURRENT_TIMESTAMP")});
    define(d, "StringAgg", {"STRING_AGG"}, {arity(2, "STRING_AGG({0}, {1})")});
    define(d, "ArraySize", {"CARDINALITY"}, {arity(1, "CARDINALITY({0})")});
    define(d, "ArrayContains", {}, {arity(2, "({1} = ANY({0}))")});
    define(d, "RegexpExtract", {}, {arity(2, "SUBSTRING({0} FROM {1})")});
    define(d, "If", {}, {arity(3, "CASE WHEN {0} THEN {1} ELSE {2} END")});
    define(d, "Nvl", {}, {arity(2, "COALESCE({0}, {1})")});
    define(d, "StrToDate", {"TO_DATE"},
           {arity(1, "CAST({0} AS DATE)"), arity(2, "TO_DATE({0}, {1})")});
    define(d, "DateFormat", {"TO_CHAR"}, {arity(2, "TO_CHAR({0}, {1})")});
    define(d, "Split", {"STRING_TO_ARRAY"}, {arity(2, "STRING_TO_ARRAY({0}, {1})")});
    define(d, "RegexpLike", {}, {arity(2, "({0} ~ {1})")});
    define(d, "Md5", {"MD5"}, {arity(1, "MD5({0})")});
    define(d, "DayOfWeek", {}, {arity(1, "(EXTRACT(DOW FROM {0}) + 1)")});
    define(d, "Explode", {"UNNEST"}, {arity(1, "UNNEST({0})")});
    define(d, "StartsWith", {"STARTS_WITH"}, {arity(2, "STARTS_WITH({0}, {1})")});
    define(d, "Length", {"LENGTH", "CHAR_LENGTH", "CHARACTER_LENGTH"}, {arity(1, "LENGTH({0})")});
    define(d, "Substring", {"SUBSTRING", "SUBSTR"}, {any("SUBSTRING({*})")});
    return d;
}

// ── redshift ────────────────────────────────────────────────────────────
DialectDefinition redshift() {
    DialectDefinition d = make_base("redshift", kAnsiGrammar);

    define(d, "TimestampTrunc", {"DATE_TRUNC"}, {arity(2, "DATE_TRUNC({0}, {1})")});
    define(d, "DateAdd", {}, {arity(2, "DATEADD(DAY, {1}, {0})")});
    define(d, "DateSub", {}, {arity(2, "DATEADD(DAY, -({1}), {0})")});
    define(d, "DateAddPart", {"DATEADD", "DATE_ADD"}, {arity(3, "DATEADD({0}, {1}, {2})")});
    define(d, "DateAddInterval", {}, {arity(2, "({0} + {1})")});
    define(d, "DateDiff", {}, {arity(2, "DATEDIFF(DAY, {1}, {0})")});
    define(d, "DateDiffPart", {"DATEDIFF", "DATE_DIFF"}, {arity(3, "DATEDIFF({0}, {1}, {2})")});
    define(d, "CurrentDate", {"CURRENT_DATE"}, {arity(0, "CURRENT_DATE")});
    define(d, "CurrentTimestamp", {"GETDATE", "SYSDATE", "CURRENT_TIMESTAMP", "NOW"},
           {arity(0, "GETDATE()")});
    define(d, "StringAgg", {"LISTAGG"}, {arity(2, "LISTAGG({0}, {1})")});
    define(d, "ArraySize", {"GET_ARRAY_LENGTH"}, {arity(1, "GET_ARRAY_LENGTH({0})")});
    define(d, "RegexpExtract", {"REGEXP_SUBSTR"}, {arity(2, "REGEXP_SUBSTR({0}, {1})")});
    define(d, "If", {}, {arity(3, "CASE WHEN {0} THEN {1} ELSE {2} END")});
    define(d, "Nvl", {"NVL"}, {arity(2, "NVL({0}, {1})")});
    define(d, "StrToDate", {"TO_DATE"},
           {arity(1, "CAST({0} AS DATE)"), arity(2, "TO_DATE({0}, {1})")});
    define(d, "DateFormat", {"TO_CHAR"}, {arity(2, "TO_CHAR({0}, {1})")});
    define(d, "ApproxDistinct", {}, {arity(1, "APPROXIMATE COUNT(DISTINCT {0})")});
    define(d, "RegexpLike", {}, {arity(2, "({0} ~ {1})")});
    define(d, "Md5", {"MD5"}, {arity(1, "MD5({0})")});
    define(d, "DayOfWeek", {}, {arity(1, "(DATE_PART(dow, {0}) + 1)")});
    define(d, "StartsWith", {}, {arity(2, "({0} LIKE {1} || '%')")});
    define(d, "Length", {"LEN", "LENGTH"}, {arity(1, "LEN({0})")});
    define(d, "Substring", {"SUBSTRING", "SUBSTR"}, {any("SUBSTRING({*})")});
    return d;
}

// ── snowflake ───────────────────────────────────────────────────────────
DialectDefinition snowflake() {
    DialectDefinition d = make_base("snowflake", kAnsiGrammar);

    define(d, "ArrayAgg", {"ARRAY_AGG", "ARRAYAGG"}, {any("ARRAY_AGG({*})")});
    define(d, "SetAgg", {"ARRAY_UNIQUE_AGG"}, {arity(1, "ARRAY_UNIQUE_AGG({0})")});
    define(d, "TimestampTrunc", {"DATE_TRUNC"}, {arity(2, "DATE_TRUNC({0}, {1})")});
    define(d, "DateAdd", {}, {arity(2, "DATEADD(DAY, {1}, {0})")});
    define(d, "DateSub", {}, {arity(2, "DATEADD(DAY, -({1}), {0})")});
    define(d, "DateAddPart", {"DATEADD", "TIMEADD", "TIMESTAMPADD"},
           {arity(3, "DATEADD({0}, {1}, {2})")});
    define(d, "DateAddInterval", {}, {arity(2, "({0} + {1})")});
    define(d, "DateDiff", {}, {arity(2, "DATEDIFF(DAY, {1}, {0})")});
    define(d, "DateDiffPart", {"DATEDIFF", "TIMESTAMPDIFF"},
           {arity(3, "DATEDIFF({0}, {1}, {2})")});
    define(d, "CurrentDate", {"CURRENT_DATE"}, {arity(0, "CURRENT_DATE")});
    define(d, "CurrentTimestamp", {"CURRENT_TIMESTAMP", "GETDATE"}, {arity(0, "CURRENT_TIMESTAMP")});
    define(d, "StringAgg", {"LISTAGG"}, {arity(2, "LISTAGG({0}, {1})")});
    define(d, "ArraySize", {"ARRAY_SIZE"}, {arity(1, "ARRAY_SIZE({0})")});
    define(d, "ArrayContains", {"ARRAY_CONTAINS"}, {arity(2, "ARRAY_CONTAINS({1}, {0})")},
           {1, 0});
    define(d, "RegexpExtract", {"REGEXP_SUBSTR"},
           {arity(2, "REGEXP_SUBSTR({0}, {1})"),
            arity(3, "REGEXP_SUBSTR({0}, {1}, 1, 1, 'c', {2})")});
    define(d, "If", {"IFF"}, {arity(3, "IFF({0}, {1}, {2})")});
    define(d, "Nvl", {"NVL", "IFNULL"}, {arity(2, "NVL({0}, {1})")});
    define(d, "StrToDate", {"TO_DATE", "DATE"},
           {arity(1, "TO_DATE({0})"), arity(2, "TO_DATE({0}, {1})")});
    define(d, "DateFormat", {"TO_CHAR", "TO_VARCHAR"}, {arity(2, "TO_CHAR({0}, {1})")});
    define(d, "ApproxDistinct", {"APPROX_COUNT_DISTINCT", "HLL"},
           {arity(1, "APPROX_COUNT_DISTINCT({0})")});
    define(d, "Split", {"SPLIT"}, {arity(2, "SPLIT({0}, {1})")});
    define(d, "RegexpLike", {"REGEXP_LIKE", "RLIKE"}, {arity(2, "REGEXP_LIKE({0}, {1})")});
    define(d, "Md5", {"MD5"}, {arity(1, "MD5({0})")});
    define(d, "DayOfWeek", {}, {arity(1, "(DAYOFWEEK({0}) + 1)")});
    define(d, "Explode", {"FLATTEN"}, {arity(1, "FLATTEN({0})")});
    define(d, "StartsWith", {"STARTSWITH"}, {arity(2, "STARTSWITH({0}, {1})")});
    define(d, "Length", {"LENGTH", "LEN"}, {arity(1, "LENGTH({0})")});
    define(d, "Substring", {"SUBSTRING", "SUBSTR"}, {any("SUBSTRING({*})")});
    return d;
}

// ── bigquery ────────────────────────────────────────────────────────────
DialectDefinition bigquery() {
    DialectDefinition d = make_base("bigquery", kHiveGrammar);
    d.try_cast_keyword  = "SAFE_CAST";

    define(d, "ArrayAgg", {"ARRAY_AGG"}, {any("ARRAY_AGG({*})")});
    define(d, "SetAgg", {}, {arity(1, "ARRAY_AGG(DISTINCT {0})")});
    define(d, "TimestampTrunc", {"TIMESTAMP_TRUNC", "DATE_TRUNC", "DATETIME_TRUNC"},
           {arity(2, "TIMESTAMP_TRUNC({1}, {0})")}, {1, 0});
    define(d, "DateAdd", {}, {arity(2, "DATE_ADD({0}, INTERVAL {1} DAY)")});
    define(d, "DateSub", {}, {arity(2, "DATE_SUB({0}, INTERVAL {1} DAY)")});
    define(d, "DateAddInterval", {"DATE_ADD", "TIMESTAMP_ADD", "DATETIME_ADD"},
           {arity(2, "DATE_ADD({0}, {1})")});
    define(d, "DateDiff", {}, {arity(2, "DATE_DIFF({0}, {1}, DAY)")});
    define(d, "CurrentDate", {"CURRENT_DATE"}, {arity(0, "CURRENT_DATE()")});
    define(d, "CurrentTimestamp", {"CURRENT_TIMESTAMP"}, {arity(0, "CURRENT_TIMESTAMP()")});
    define(d, "StringAgg", {"STRING_AGG"}, {arity(2, "STRING_AGG({0}, {1})")});
    define(d, "ArraySize", {"ARRAY_LENGTH"}, {arity(1, "ARRAY_LENGTH({0})")});
    define(d, "ArrayContains", {}, {arity(2, "{1} IN UNNEST({0})")});
    define(d, "RegexpExtract", {"REGEXP_EXTRACT"}, {arity(2, "REGEXP_EXTRACT({0}, {1})")});
    define(d, "If", {"IF"}, {arity(3, "IF({0}, {1}, {2})")});
    define(d, "Nvl", {"IFNULL"}, {arity(2, "IFNULL({0}, {1})")});
    define(d, "StrToDate", {"PARSE_DATE"},
           {arity(1, "CAST({0} AS DATE)"), arity(2, "PARSE_DATE({1}, {0})")}, {1, 0});
    define(d, "DateFormat", {"FORMAT_TIMESTAMP", "FORMAT_DATE"},
           {arity(2, "FORMAT_TIMESTAMP({1}, {0})")}, {1, 0});
    define(d, "ApproxDistinct", {"APPROX_COUNT_DISTINCT"},
           {arity(1, "APPROX_COUNT_DISTINCT({0})")});
    define(d, "Split", {"SPLIT"}, {arity(2, "SPLIT({0}, {1})")});
    define(d, "RegexpLike", {"REGEXP_CONTAINS"}, {arity(2, "REGEXP_CONTAINS({0}, {1})")});
    define(d, "Md5", {}, {arity(1, "TO_HEX(MD5({0}))")});
    define(d, "DayOfWeek", {}, {arity(1, "EXTRACT(DAYOFWEEK FROM {0})")});
    define(d, "Explode", {"UNNEST"}, {arity(1, "UNNEST({0})")});
    define(d, "StartsWith", {"STARTS_WITH"}, {arity(2, "STARTS_WITH({0}, {1})")});
    define(d, "Length", {"LENGTH", "CHAR_LENGTH", "CHARACTER_LENGTH"}, {arity(1, "LENGTH({0})")});
    define(d, "Substring", {"SUBSTR", "SUBSTRING"}, {any("SUBSTR({*})")});
    return d;
}

// ── trino / presto ──────────────────────────────────────────────────────
DialectDefinition trino_family(std::string name) {
    GrammarOptions grammar    = kAnsiGrammar;
    grammar.double_colon_cast = false;
    DialectDefinition d       = make_base(std::move(name), grammar);

    define(d, "ArrayAgg", {"ARRAY_AGG"}, {any("ARRAY_AGG({*})")});
    define(d, "SetAgg", {}, {arity(1, "ARRAY_AGG(DISTINCT {0})")});
    define(d, "TimestampTrunc", {"DATE_TRUNC"}, {arity(2, "DATE_TRUNC({0}, {1})")});
    define(d, "DateAdd", {}, {arity(2, "DATE_ADD('day', {1}, {0})")});
    define(d, "DateSub", {}, {arity(2, "DATE_ADD('day', -({1}), {0})")});
    define(d, "DateAddPart", {"DATE_ADD"}, {arity(3, "DATE_ADD({0}, {1}, {2})")});
    define(d, "DateAddInterval", {}, {arity(2, "({0} + {1})")});
    define(d, "DateDiff", {}, {arity(2, "DATE_DIFF('day', {1}, {0})")});
    define(d, "DateDiffPart", {"DATE_DIFF"}, {arity(3, "DATE_DIFF({0}, {1}, {2})")});
    define(d, "CurrentDate", {"CURRENT_DATE"}, {arity(0, "CURRENT_DATE")});
    define(d, "CurrentTimestamp", {"CURRENT_TIMESTAMP", "NOW"}, {arity(0, "CURRENT_TIMESTAMP")});
    define(d, "StringAgg", {}, {arity(2, "ARRAY_JOIN(ARRAY_AGG({0}), {1})")});
    define(d, "ArraySize", {"CARDINALITY"}, {arity(1, "CARDINALITY({0})")});
    define(d, "ArrayContains", {"CONTAINS"}, {arity(2, "CONTAINS({0}, {1})")});
    define(d, "RegexpExtract", {"REGEXP_EXTRACT"},
           {arity(2, "REGEXP_EXTRACT({0}, {1})"), arity(3, "REGEXP_EXTRACT({0}, {1}, {2})")});
    define(d, "If", {"IF"}, {arity(3, "IF({0}, {1}, {2})")});
    define(d, "Nvl", {}, {arity(2, "COALESCE({0}, {1})")});
    define(d, "StrToDate", {},
           {arity(1, "CAST({0} AS DATE)"), arity(2, "CAST(DATE_PARSE({0}, {1}) AS DATE)")});
    define(d, "DateFormat", {"DATE_FORMAT"}, {arity(2, "DATE_FORMAT({0}, {1})")});
    define(d, "ApproxDistinct", {"APPROX_DISTINCT"}, {arity(1, "APPROX_DISTINCT({0})")});
    define(d, "Split", {"SPLIT"}, {arity(2, "SPLIT({0}, {1})")});
    define(d, "RegexpLike", {"REGEXP_LIKE"}, {arity(2, "REGEXP_LIKE({0}, {1})")});
    define(d, "Md5", {}, {arity(1, "LOWER(TO_HEX(MD5(TO_UTF8({0}))))")});
    define(d, "DayOfWeek", {}, {arity(1, "(DAY_OF_WEEK({0}) % 7 + 1)")});
    define(d, "Explode", {"UNNEST"}, {arity(1, "UNNEST({0})")});
    define(d, "StartsWith", {"STARTS_WITH"}, {arity(2, "STARTS_WITH({0}, {1})")});
    define(d, "Length", {"LENGTH"}, {arity(1, "LENGTH({0})")});
    define(d, "Substring", {"SUBSTRING", "SUBSTR"}, {any("SUBSTRING({*})")});
    return d;
}

// ── mysql ───────────────────────────────────────────────────────────────
DialectDefinition mysql() {
    GrammarOptions grammar = kHiveGrammar;
    DialectDefinition d    = make_base("mysql", grammar);

    define(d, "DateAdd", {}, {arity(2, "DATE_ADD({0}, INTERVAL {1} DAY)")});
    define(d, "DateSub", {}, {arity(2, "DATE_SUB({0}, INTERVAL {1} DAY)")});
    define(d, "DateAddInterval", {"DATE_ADD", "ADDDATE"}, {arity(2, "DATE_ADD({0}, {1})")});
    define(d, "DateDiff", {"DATEDIFF"}, {arity(2, "DATEDIFF({0}, {1})")});
    define(d, "DateDiffPart", {"TIMESTAMPDIFF"}, {arity(3, "TIMESTAMPDIFF({0}, {1}, {2})")});
    define(d, "CurrentDate", {"CURRENT_DATE", "CURDATE"}, {arity(0, "CURRENT_DATE")});
    define(d, "CurrentTimestamp", {"CURRENT_TIMESTAMP", "NOW"}, {arity(0, "CURRENT_TIMESTAMP")});
    define(d, "StringAgg", {"GROUP_CONCAT"},
           {arity(1, "GROUP_CONCAT({0})"), arity(2, "GROUP_CONCAT({0} SEPARATOR {1})")});
    define(d, "ArraySize", {"JSON_LENGTH"}, {arity(1, "JSON_LENGTH({0})")});
    define(d, "RegexpExtract", {"REGEXP_SUBSTR"}, {arity(2, "REGEXP_SUBSTR({0}, {1})")});
    define(d, "If", {"IF"}, {arity(3, "IF({0}, {1}, {2})")});
    define(d, "Nvl", {"IFNULL"}, {arity(2, "IFNULL({0}, {1})")});
    define(d, "StrToDate", {"STR_TO_DATE"},
           {arity(1, "CAST({0} AS DATE)"), arity(2, "STR_TO_DATE({0}, {1})")});
    define(d, "DateFormat", {"DATE_FORMAT"}, {arity(2, "DATE_FORMAT({0}, {1})")});
    define(d, "RegexpLike", {"REGEXP_LIKE"}, {arity(2, "REGEXP_LIKE({0}, {1})")});
    define(d, "Md5", {"MD5"}, {arity(1, "MD5({0})")});
    define(d, "DayOfWeek", {"DAYOFWEEK"}, {arity(1, "DAYOFWEEK({0})")});
    define(d, "StartsWith", {}, {arity(2, "({0} LIKE CONCAT({1}, '%'))")});
    define(d, "Length", {"CHAR_LENGTH", "CHARACTER_LENGTH"}, {arity(1, "CHAR_LENGTH({0})")});
    define(d, "Substring", {"SUBSTRING", "SUBSTR"}, {any("SUBSTRING({*})")});
    return d;
}

} // namespace

std::vector<DialectDefinition> builtin_dialect_definitions() {
    std::vector<DialectDefinition> dialects;
    dialects.push_back(spark_family("spark", false));
    dialects.push_back(spark_family("databricks", true));
    dialects.push_back(duckdb());
    dialects.push_back(postgres());
    dialects.push_back(redshift());
    dialects.push_back(snowflake());
    dialects.push_back(bigquery());
    dialects.push_back(trino_family("trino"));
    dialects.push_back(trino_family("presto"));
    dialects.push_back(mysql());
    return dialects;
}
