// ---------------------------------------------------------------------------
// sql_parser.cpp
//
// 재귀 하강 SQL 파서 구현.
//
// [오류 처리]
// - 첫 번째 오류를 error_ 에 기록하고(sticky), 이후 peek() 는 kEnd 를 반환해
//   모든 루프가 즉시 종료되도록 한다. parse() 는 error_ 가 있으면
//   부분 트리 대신 std::unexpected 를 반환한다.
// - 식 중첩 깊이는 kMaxDepth 로 제한한다 (스택 고갈 방지).
//
// [연산자 우선순위 (낮음 → 높음)]
//   OR < AND < NOT < 비교/IS/BETWEEN/IN/LIKE < + - || & | ^ < * / % < 단항 < 후위(:: [])
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kMaxDepth = 200;

// 문자열을 대문자로 변환한다 (ASCII only).
std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::toupper(x) == std::toupper(y);
           });
}

// 별칭/식별자로 쓸 수 없는 키워드 (대문자)
const std::unordered_set<std::string>& reserved_words() {
    static const std::unordered_set<std::string> kReserved = {
        "SELECT", "FROM",    "WHERE",   "GROUP",  "BY",      "HAVING", "QUALIFY", "ORDER",
        "LIMIT",  "OFFSET",  "UNION",   "INTERSECT", "EXCEPT", "MINUS", "WINDOW", "ON",
        "USING",  "JOIN",    "INNER",   "LEFT",   "RIGHT",   "FULL",   "CROSS",   "OUTER",
        "NATURAL", "LATERAL", "SEMI",   "ANTI",   "AND",     "OR",     "NOT",     "AS",
        "WHEN",   "THEN",    "ELSE",    "END",    "IS",      "IN",     "BETWEEN", "LIKE",
        "ILIKE",  "RLIKE",   "REGEXP",  "ASC",    "DESC",    "NULLS",  "WITH",    "CASE",
        "OVER",   "DISTINCT", "ALL",    "FETCH",  "INTO",    "VALUES", "ESCAPE",
    };
    return kReserved;
}

// 목록(SELECT 항목, GROUP BY 등) 종료를 나타내는 절 키워드 (대문자)
const std::unordered_set<std::string>& clause_keywords() {
    static const std::unordered_set<std::string> kClauses = {
        "FROM",  "WHERE",  "GROUP",  "HAVING",    "QUALIFY", "ORDER", "LIMIT",
        "OFFSET", "UNION", "INTERSECT", "EXCEPT", "MINUS",   "WINDOW",
    };
    return kClauses;
}

const std::unordered_set<std::string>& date_part_units() {
    static const std::unordered_set<std::string> kUnits = {
        "YEAR",   "YEARS",   "QUARTER", "QUARTERS", "MONTH",  "MONTHS",
        "WEEK",   "WEEKS",   "DAY",     "DAYS",     "HOUR",   "HOURS",
        "MINUTE", "MINUTES", "SECOND",  "SECONDS",  "MILLISECOND", "MILLISECONDS",
        "MICROSECOND", "MICROSECONDS",
    };
    return kUnits;
}

// 인자 없이 호출되는 키워드 함수 (CURRENT_DATE 등)
const std::unordered_set<std::string>& niladic_functions() {
    static const std::unordered_set<std::string> kNiladic = {
        "CURRENT_DATE", "CURRENT_TIMESTAMP", "CURRENT_TIME", "LOCALTIMESTAMP", "LOCALTIME",
    };
    return kNiladic;
}

SqlNode make_node(NodeKind kind, std::string value = {}) {
    SqlNode node;
    node.kind  = kind;
    node.value = std::move(value);
    return node;
}

SqlNode make_clause(std::string name, std::vector<SqlNode> children) {
    SqlNode node    = make_node(NodeKind::kClause, std::move(name));
    node.children   = std::move(children);
    return node;
}

// ---------------------------------------------------------------------------
// ParserImpl
//   토큰 목록 하나에 대한 1회성 파서 상태.
// ---------------------------------------------------------------------------
class ParserImpl {
public:
    explicit ParserImpl(std::vector<SqlToken> tokens)
        : tokens_(std::move(tokens)) {}

    std::expected<SqlNode, ParseError> parse_statement() {
        skip_value_placeholders();
        if (at_end()) {
            return std::unexpected(ParseError{
                .code    = ParseErrorCode::kInvalidSql,
                .message = "empty statement",
                .context = {},
            });
        }
        SqlNode root = parse_query();
        skip_value_placeholders();
        accept_operator(";");
        skip_value_placeholders();
        if (ok() && !at_end()) {
            fail("unexpected token after end of statement");
        }
        if (error_) {
            return std::unexpected(*error_);
        }
        return root;
    }

    std::expected<SqlNode, ParseError> parse_single_expression() {
        SqlNode expr = parse_expression();
        if (ok() && !at_end()) {
            fail("unexpected token after expression");
        }
        if (error_) {
            return std::unexpected(*error_);
        }
        return expr;
    }

private:
    // ── 토큰 헬퍼 ─────────────────────────────────────────────────────────
    [[nodiscard]] bool ok() const { return !error_.has_value(); }

    [[nodiscard]] const SqlToken& peek(std::size_t ahead = 0) const {
        if (error_) {
            return tokens_.back();
        }
        const std::size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[idx];
    }

    [[nodiscard]] bool at_end() const { return peek().type == SqlTokenType::kEnd; }

    [[nodiscard]] bool is_keyword(std::string_view keyword, std::size_t ahead = 0) const {
        const auto& tok = peek(ahead);
        return tok.type == SqlTokenType::kIdentifier && iequals(tok.value, keyword);
    }

    [[nodiscard]] bool is_operator(std::string_view op, std::size_t ahead = 0) const {
        const auto& tok = peek(ahead);
        return tok.type == SqlTokenType::kOperator && tok.value == op;
    }

    [[nodiscard]] bool is_reserved(std::size_t ahead = 0) const {
        const auto& tok = peek(ahead);
        return tok.type == SqlTokenType::kIdentifier
            && reserved_words().contains(to_upper(tok.value));
    }

    // 별칭으로 쓸 수 있는 토큰인지 (인용 식별자, 또는 예약어가 아닌 식별자)
    [[nodiscard]] bool is_alias_candidate(std::size_t ahead = 0) const {
        const auto& tok = peek(ahead);
        if (tok.type == SqlTokenType::kQuotedIdentifier) {
            return true;
        }
        return tok.type == SqlTokenType::kIdentifier && !is_reserved(ahead);
    }

    // SELECT 항목 / GROUP BY 등 목록이 끝나는 지점인지 (후행 쉼표 허용용)
    [[nodiscard]] bool at_list_end() const {
        const auto& tok = peek();
        if (tok.type == SqlTokenType::kEnd) {
            return true;
        }
        if (tok.type == SqlTokenType::kOperator) {
            return tok.value == ")" || tok.value == ";";
        }
        return tok.type == SqlTokenType::kIdentifier
            && clause_keywords().contains(to_upper(tok.value));
    }

    SqlToken advance() {
        SqlToken tok = peek();
        if (!error_ && pos_ < tokens_.size() - 1) {
            ++pos_;
        }
        return tok;
    }

    bool accept_keyword(std::string_view keyword) {
        if (is_keyword(keyword)) {
            advance();
            return true;
        }
        return false;
    }

    bool accept_operator(std::string_view op) {
        if (is_operator(op)) {
            advance();
            return true;
        }
        return false;
    }

    void expect_keyword(std::string_view keyword) {
        if (!accept_keyword(keyword)) {
            fail(fmt::format("expected {}", keyword));
        }
    }

    void expect_operator(std::string_view op) {
        if (!accept_operator(op)) {
            fail(fmt::format("expected '{}'", op));
        }
    }

    SqlNode fail(std::string message) {
        if (!error_) {
            const auto& tok = tokens_[std::min(pos_, tokens_.size() - 1)];
            error_ = ParseError{
                .code    = ParseErrorCode::kUnexpectedToken,
                .message = std::move(message),
                .context = fmt::format("offset {}: '{}'", tok.offset, tok.value),
            };
        }
        return SqlNode{};
    }

    void skip_value_placeholders() {
        while (peek().type == SqlTokenType::kIdentifier && peek().value == kValuePlaceholderName) {
            advance();
        }
    }

    // ── 질의 ─────────────────────────────────────────────────────────────
    SqlNode parse_query() {
        if (!accept_keyword("WITH")) {
            return parse_query_body();
        }

        SqlNode with = make_node(NodeKind::kWith);
        with.flag    = accept_keyword("RECURSIVE");
        do {
            if (is_keyword("SELECT")) {
                break;  // WITH a AS (...), SELECT ... 후행 쉼표
            }
            with.children.push_back(parse_cte());
        } while (ok() && accept_operator(","));

        with.children.push_back(parse_query_body());
        return with;
    }

    SqlNode parse_cte() {
        const SqlToken name = advance();
        if (name.type != SqlTokenType::kIdentifier && name.type != SqlTokenType::kQuotedIdentifier) {
            return fail("expected CTE name");
        }
        SqlNode cte = make_node(NodeKind::kCte, name.value);

        std::vector<SqlNode> columns;
        if (accept_operator("(")) {
            columns = parse_identifier_list();
            expect_operator(")");
        }
        expect_keyword("AS");
        expect_operator("(");
        cte.children.push_back(parse_query());
        expect_operator(")");
        for (auto& col : columns) {
            cte.children.push_back(std::move(col));
        }
        return cte;
    }

    SqlNode parse_query_body() {
        SqlNode left = parse_query_term();

        while (ok()) {
            std::string op;
            if (is_keyword("UNION") || is_keyword("INTERSECT") || is_keyword("EXCEPT")
                || is_keyword("MINUS")) {
                op = to_upper(advance().value);
            } else {
                break;
            }
            if (accept_keyword("ALL")) {
                op += " ALL";
            } else if (accept_keyword("DISTINCT")) {
                op += " DISTINCT";
            }

            SqlNode set_op = make_node(NodeKind::kSetOp, std::move(op));
            set_op.children.push_back(std::move(left));
            set_op.children.push_back(parse_query_term());
            left = std::move(set_op);
        }
        return left;
    }

    SqlNode parse_query_term() {
        if (is_keyword("SELECT")) {
            return parse_select();
        }
        if (is_operator("(")) {
            advance();
            SqlNode sub = make_node(NodeKind::kSubquery);
            sub.children.push_back(parse_query());
            expect_operator(")");
            return sub;
        }
        return fail("expected SELECT");
    }

    SqlNode parse_select() {
        expect_keyword("SELECT");
        SqlNode select = make_node(NodeKind::kSelect);
        if (accept_keyword("DISTINCT")) {
            select.flag = true;
        } else {
            accept_keyword("ALL");
        }

        std::vector<SqlNode> items;
        do {
            if (at_list_end()) {
                break;
            }
            items.push_back(parse_select_item());
        } while (ok() && accept_operator(","));
        if (items.empty()) {
            return fail("empty select list");
        }
        select.children.push_back(make_clause("PROJECTION", std::move(items)));

        if (accept_keyword("FROM")) {
            select.children.push_back(make_clause("FROM", parse_from_items()));
        }
        if (accept_keyword("WHERE")) {
            select.children.push_back(make_clause("WHERE", {parse_expression()}));
        }
        if (is_keyword("GROUP") && is_keyword("BY", 1)) {
            advance();
            advance();
            select.children.push_back(make_clause("GROUP BY", parse_expression_list()));
        }
        if (accept_keyword("HAVING")) {
            select.children.push_back(make_clause("HAVING", {parse_expression()}));
        }
        if (accept_keyword("QUALIFY")) {
            select.children.push_back(make_clause("QUALIFY", {parse_expression()}));
        }
        if (is_keyword("ORDER") && is_keyword("BY", 1)) {
            advance();
            advance();
            select.children.push_back(make_clause("ORDER BY", parse_order_list()));
        }
        if (accept_keyword("LIMIT")) {
            select.children.push_back(make_clause("LIMIT", {parse_expression()}));
        }
        if (accept_keyword("OFFSET")) {
            select.children.push_back(make_clause("OFFSET", {parse_expression()}));
            if (!accept_keyword("ROWS")) {
                accept_keyword("ROW");
            }
        }
        return select;
    }

    SqlNode parse_select_item() {
        if (is_operator("*")) {
            advance();
            return make_node(NodeKind::kStar, "*");
        }
        SqlNode expr = parse_expression();
        return parse_optional_alias(std::move(expr), /*allow_columns=*/false);
    }

    // [AS] alias [(col, ...)]
    SqlNode parse_optional_alias(SqlNode expr, bool allow_columns) {
        std::optional<SqlToken> alias;
        if (accept_keyword("AS")) {
            const SqlToken tok = advance();
            if (tok.type != SqlTokenType::kIdentifier && tok.type != SqlTokenType::kQuotedIdentifier
                && tok.type != SqlTokenType::kString) {
                return fail("expected alias after AS");
            }
            alias = tok;
        } else if (is_alias_candidate()) {
            alias = advance();
        }
        if (!alias) {
            return expr;
        }

        SqlNode node = make_node(NodeKind::kAlias, alias->value);
        node.flag    = alias->type != SqlTokenType::kIdentifier;
        node.children.push_back(std::move(expr));
        if (allow_columns && accept_operator("(")) {
            for (auto& col : parse_identifier_list()) {
                node.children.push_back(std::move(col));
            }
            expect_operator(")");
        }
        return node;
    }

    std::vector<SqlNode> parse_identifier_list() {
        std::vector<SqlNode> result;
        do {
            result.push_back(parse_identifier());
        } while (ok() && accept_operator(","));
        return result;
    }

    SqlNode parse_identifier() {
        const SqlToken tok = advance();
        if (tok.type == SqlTokenType::kIdentifier) {
            return make_node(NodeKind::kIdentifier, tok.value);
        }
        if (tok.type == SqlTokenType::kQuotedIdentifier) {
            SqlNode node = make_node(NodeKind::kIdentifier, tok.value);
            node.flag    = true;
            return node;
        }
        return fail("expected identifier");
    }

    // ── FROM / JOIN ──────────────────────────────────────────────────────
    std::vector<SqlNode> parse_from_items() {
        std::vector<SqlNode> items;
        do {
            if (!items.empty() && at_list_end()) {
                break;
            }
            items.push_back(parse_table_ref());
            while (ok() && at_join()) {
                items.push_back(parse_join());
            }
        } while (ok() && accept_operator(","));
        return items;
    }

    [[nodiscard]] bool at_join() const {
        if (is_keyword("LATERAL") && is_keyword("VIEW", 1)) {
            return true;
        }
        return is_keyword("JOIN") || is_keyword("INNER") || is_keyword("LEFT")
            || is_keyword("RIGHT") || is_keyword("FULL") || is_keyword("CROSS")
            || is_keyword("NATURAL") || is_keyword("SEMI") || is_keyword("ANTI");
    }

    SqlNode parse_join() {
        if (is_keyword("LATERAL")) {
            return parse_lateral_view();
        }

        std::string kind;
        while (ok() && !is_keyword("JOIN")) {
            if (!(is_keyword("INNER") || is_keyword("LEFT") || is_keyword("RIGHT")
                  || is_keyword("FULL") || is_keyword("CROSS") || is_keyword("NATURAL")
                  || is_keyword("OUTER") || is_keyword("SEMI") || is_keyword("ANTI"))) {
                return fail("expected JOIN");
            }
            kind += to_upper(advance().value);
            kind += ' ';
        }
        expect_keyword("JOIN");
        kind += "JOIN";

        SqlNode join = make_node(NodeKind::kJoin, std::move(kind));
        join.children.push_back(parse_table_ref());
        if (accept_keyword("ON")) {
            join.children.push_back(make_clause("ON", {parse_expression()}));
        } else if (accept_keyword("USING")) {
            expect_operator("(");
            join.children.push_back(make_clause("USING", parse_identifier_list()));
            expect_operator(")");
        }
        return join;
    }

    // LATERAL VIEW [OUTER] func(args) table_alias [AS] col [, col ...]
    SqlNode parse_lateral_view() {
        expect_keyword("LATERAL");
        expect_keyword("VIEW");
        std::string kind = "LATERAL VIEW";
        if (accept_keyword("OUTER")) {
            kind += " OUTER";
        }
        SqlNode view = make_node(NodeKind::kLateralView, std::move(kind));

        const SqlToken name = advance();
        if (name.type != SqlTokenType::kIdentifier || !is_operator("(")) {
            return fail("expected generator function in LATERAL VIEW");
        }
        view.children.push_back(parse_function(name.value));
        view.children.push_back(parse_identifier());
        accept_keyword("AS");
        view.children.push_back(parse_identifier());
        while (ok() && is_operator(",") && is_alias_candidate(1) && lateral_column_follows()) {
            advance();
            view.children.push_back(parse_identifier());
        }
        return view;
    }

    // "AS k, v" 의 v 가 다음 테이블이 아니라 컬럼 별칭인지 판정 (2토큰 전방 확인)
    [[nodiscard]] bool lateral_column_follows() const {
        const auto& after = peek(2);
        if (after.type == SqlTokenType::kEnd) {
            return true;
        }
        if (after.type == SqlTokenType::kOperator) {
            return after.value == "," || after.value == ")" || after.value == ";";
        }
        return after.type == SqlTokenType::kIdentifier && is_reserved(2);
    }

    SqlNode parse_table_ref() {
        SqlNode table;
        if (is_operator("(")) {
            advance();
            if (!(is_keyword("SELECT") || is_keyword("WITH") || is_operator("("))) {
                return fail("expected subquery");
            }
            table = make_node(NodeKind::kSubquery);
            table.children.push_back(parse_query());
            expect_operator(")");
        } else {
            if (peek().type == SqlTokenType::kIdentifier && is_reserved()) {
                return fail(fmt::format("unexpected keyword {}", peek().value));
            }
            std::vector<SqlNode> parts;
            parts.push_back(parse_identifier());
            while (ok() && is_operator(".")) {
                advance();
                parts.push_back(parse_identifier());
            }
            if (is_operator("(")) {
                table = parse_function(join_path(parts));
            } else {
                table          = make_node(NodeKind::kTable);
                table.children = std::move(parts);
            }
        }
        return parse_optional_alias(std::move(table), /*allow_columns=*/true);
    }

    static std::string join_path(const std::vector<SqlNode>& parts) {
        std::string name;
        for (const auto& part : parts) {
            if (!name.empty()) {
                name += '.';
            }
            name += part.value;
        }
        return name;
    }

    // ── 목록 ─────────────────────────────────────────────────────────────
    std::vector<SqlNode> parse_expression_list() {
        std::vector<SqlNode> result;
        do {
            if (!result.empty() && at_list_end()) {
                break;
            }
            result.push_back(parse_expression());
        } while (ok() && accept_operator(","));
        return result;
    }

    std::vector<SqlNode> parse_order_list() {
        std::vector<SqlNode> result;
        do {
            if (!result.empty() && at_list_end()) {
                break;
            }
            result.push_back(parse_ordered());
        } while (ok() && accept_operator(","));
        return result;
    }

    SqlNode parse_ordered() {
        SqlNode expr = parse_expression();
        std::string suffix;
        if (is_keyword("ASC") || is_keyword("DESC")) {
            suffix = to_upper(advance().value);
        }
        if (accept_keyword("NULLS")) {
            if (!(is_keyword("FIRST") || is_keyword("LAST"))) {
                return fail("expected FIRST or LAST after NULLS");
            }
            if (!suffix.empty()) {
                suffix += ' ';
            }
            suffix += "NULLS " + to_upper(advance().value);
        }
        if (suffix.empty()) {
            return expr;
        }
        SqlNode ordered = make_node(NodeKind::kOrdered, std::move(suffix));
        ordered.children.push_back(std::move(expr));
        return ordered;
    }

    // ── 식 ───────────────────────────────────────────────────────────────
    SqlNode parse_expression() {
        if (++depth_ > kMaxDepth) {
            --depth_;
            return fail("expression nesting too deep");
        }
        SqlNode left = parse_and();
        while (ok() && accept_keyword("OR")) {
            left = make_binary("OR", std::move(left), parse_and());
        }
        --depth_;
        return left;
    }

    SqlNode parse_and() {
        SqlNode left = parse_not();
        while (ok() && accept_keyword("AND")) {
            left = make_binary("AND", std::move(left), parse_not());
        }
        return left;
    }

    SqlNode parse_not() {
        if (is_keyword("NOT") && !is_keyword("EXISTS", 1)) {
            advance();
            SqlNode node = make_node(NodeKind::kUnary, "NOT");
            node.children.push_back(parse_not());
            return node;
        }
        return parse_comparison();
    }

    SqlNode parse_comparison() {
        SqlNode left = parse_additive();

        while (ok()) {
            const auto& tok = peek();
            if (tok.type == SqlTokenType::kOperator
                && (tok.value == "=" || tok.value == "==" || tok.value == "<>"
                    || tok.value == "!=" || tok.value == "<" || tok.value == ">"
                    || tok.value == "<=" || tok.value == ">=" || tok.value == "<=>")) {
                const std::string op = advance().value;
                left = make_binary(op, std::move(left), parse_additive());
                continue;
            }

            if (accept_keyword("IS")) {
                std::string op = "IS";
                if (accept_keyword("NOT")) {
                    op += " NOT";
                }
                if (accept_keyword("DISTINCT")) {
                    expect_keyword("FROM");
                    op += " DISTINCT FROM";
                    left = make_binary(op, std::move(left), parse_additive());
                } else if (accept_keyword("NULL")) {
                    left = make_binary(op, std::move(left), make_node(NodeKind::kNull, "NULL"));
                } else if (is_keyword("TRUE") || is_keyword("FALSE")) {
                    SqlNode boolean = make_node(NodeKind::kBoolean, to_upper(advance().value));
                    left            = make_binary(op, std::move(left), std::move(boolean));
                } else {
                    return fail("expected NULL, TRUE, FALSE or DISTINCT FROM after IS");
                }
                continue;
            }

            const bool negated = is_keyword("NOT")
                && (is_keyword("BETWEEN", 1) || is_keyword("IN", 1) || is_keyword("LIKE", 1)
                    || is_keyword("ILIKE", 1) || is_keyword("RLIKE", 1) || is_keyword("REGEXP", 1));
            if (negated) {
                advance();
            }

            if (accept_keyword("BETWEEN")) {
                SqlNode between = make_node(NodeKind::kBetween);
                between.flag    = negated;
                between.children.push_back(std::move(left));
                between.children.push_back(parse_additive());
                expect_keyword("AND");
                between.children.push_back(parse_additive());
                left = std::move(between);
                continue;
            }

            if (accept_keyword("IN")) {
                SqlNode in = make_node(NodeKind::kIn);
                in.flag    = negated;
                in.children.push_back(std::move(left));
                expect_operator("(");
                if (is_keyword("SELECT") || is_keyword("WITH")) {
                    SqlNode sub = make_node(NodeKind::kSubquery);
                    sub.children.push_back(parse_query());
                    in.children.push_back(std::move(sub));
                } else {
                    for (auto& item : parse_expression_list()) {
                        in.children.push_back(std::move(item));
                    }
                }
                expect_operator(")");
                left = std::move(in);
                continue;
            }

            if (is_keyword("LIKE") || is_keyword("ILIKE") || is_keyword("RLIKE")
                || is_keyword("REGEXP")) {
                std::string op = to_upper(advance().value);
                if (negated) {
                    op = "NOT " + op;
                }
                left = make_binary(op, std::move(left), parse_additive());
                if (accept_keyword("ESCAPE")) {
                    left = make_binary("ESCAPE", std::move(left), parse_primary());
                }
                continue;
            }

            if (negated) {
                return fail("expected BETWEEN, IN or LIKE after NOT");
            }
            break;
        }
        return left;
    }

    SqlNode parse_additive() {
        SqlNode left = parse_multiplicative();
        while (ok()) {
            if (is_operator("+") || is_operator("-") || is_operator("||") || is_operator("&")
                || is_operator("|") || is_operator("^")) {
                const std::string op = advance().value;
                left = make_binary(op, std::move(left), parse_multiplicative());
                continue;
            }
            break;
        }
        return left;
    }

    SqlNode parse_multiplicative() {
        SqlNode left = parse_unary();
        while (ok()) {
            if (is_operator("*") || is_operator("/") || is_operator("%")) {
                const std::string op = advance().value;
                left = make_binary(op, std::move(left), parse_unary());
                continue;
            }
            break;
        }
        return left;
    }

    SqlNode parse_unary() {
        if (is_operator("-") || is_operator("+") || is_operator("~")) {
            SqlNode node = make_node(NodeKind::kUnary, advance().value);
            node.children.push_back(parse_unary());
            return node;
        }
        return parse_postfix();
    }

    SqlNode parse_postfix() {
        SqlNode expr = parse_primary();
        while (ok()) {
            if (accept_operator("::")) {
                SqlNode cast = make_node(NodeKind::kCast, parse_type_name());
                cast.flag    = true;
                cast.children.push_back(std::move(expr));
                expr = std::move(cast);
                continue;
            }
            if (accept_operator("[")) {
                SqlNode subscript = make_node(NodeKind::kSubscript);
                subscript.children.push_back(std::move(expr));
                subscript.children.push_back(parse_expression());
                expect_operator("]");
                expr = std::move(subscript);
                continue;
            }
            break;
        }
        return expr;
    }

    SqlNode parse_primary() {
        const SqlToken& tok = peek();

        switch (tok.type) {
            case SqlTokenType::kEnd:
                return fail("unexpected end of input");
            case SqlTokenType::kNumber:
                return make_node(NodeKind::kNumber, advance().value);
            case SqlTokenType::kString:
                return make_node(NodeKind::kLiteral, advance().value);
            case SqlTokenType::kOperator:
                if (tok.value == "(") {
                    return parse_parenthesized();
                }
                return fail(fmt::format("unexpected '{}'", tok.value));
            case SqlTokenType::kQuotedIdentifier:
                return parse_identifier_chain();
            case SqlTokenType::kIdentifier:
                break;
        }

        const std::string upper = to_upper(tok.value);

        if (upper == "NULL") {
            advance();
            return make_node(NodeKind::kNull, "NULL");
        }
        if (upper == "TRUE" || upper == "FALSE") {
            advance();
            return make_node(NodeKind::kBoolean, upper);
        }
        if (upper == "CASE") {
            return parse_case();
        }
        if ((upper == "CAST" || upper == "TRY_CAST" || upper == "SAFE_CAST") && is_operator("(", 1)) {
            return parse_cast(upper == "CAST" ? NodeKind::kCast : NodeKind::kTryCast);
        }
        if (upper == "EXTRACT" && is_operator("(", 1)) {
            return parse_extract();
        }
        if (upper == "INTERVAL") {
            return parse_interval();
        }
        if (upper == "EXISTS" || (upper == "NOT" && is_keyword("EXISTS", 1))) {
            const bool negated = upper == "NOT";
            if (negated) {
                advance();
            }
            advance();
            expect_operator("(");
            SqlNode exists = make_node(NodeKind::kExists);
            exists.children.push_back(parse_query());
            expect_operator(")");
            if (!negated) {
                return exists;
            }
            SqlNode node = make_node(NodeKind::kUnary, "NOT");
            node.children.push_back(std::move(exists));
            return node;
        }
        if ((upper == "DATE" || upper == "TIMESTAMP" || upper == "TIME")
            && peek(1).type == SqlTokenType::kString) {
            advance();
            SqlNode typed = make_node(NodeKind::kTypedLiteral, upper);
            typed.children.push_back(make_node(NodeKind::kLiteral, advance().value));
            return typed;
        }
        if (niladic_functions().contains(upper) && !is_operator("(", 1)) {
            return make_node(NodeKind::kFunction, advance().value);
        }
        if ((upper == "LEFT" || upper == "RIGHT") && is_operator("(", 1)) {
            const std::string name = advance().value;
            return parse_function(name);
        }
        if (reserved_words().contains(upper)) {
            return fail(fmt::format("unexpected keyword {}", tok.value));
        }
        return parse_identifier_chain();
    }

    // ident [. ident]* [. *]  또는  name(args)
    SqlNode parse_identifier_chain() {
        std::vector<SqlNode> parts;
        parts.push_back(parse_identifier());
        while (ok() && is_operator(".")) {
            advance();
            if (accept_operator("*")) {
                parts.push_back(make_node(NodeKind::kStar, "*"));
                break;
            }
            parts.push_back(parse_identifier());
        }

        if (is_operator("(") && parts.back().kind == NodeKind::kIdentifier) {
            return parse_function(join_path(parts));
        }
        SqlNode column  = make_node(NodeKind::kColumn);
        column.children = std::move(parts);
        return column;
    }

    // ( query ) | ( expr ) | ( expr, expr, ... )
    SqlNode parse_parenthesized() {
        expect_operator("(");
        if (is_keyword("SELECT") || is_keyword("WITH")) {
            SqlNode sub = make_node(NodeKind::kSubquery);
            sub.children.push_back(parse_query());
            expect_operator(")");
            return sub;
        }
        std::vector<SqlNode> items = parse_expression_list();
        expect_operator(")");
        if (items.size() == 1) {
            SqlNode paren = make_node(NodeKind::kParen);
            paren.children.push_back(std::move(items.front()));
            return paren;
        }
        SqlNode tuple  = make_node(NodeKind::kTuple);
        tuple.children = std::move(items);
        return tuple;
    }

    SqlNode parse_function(std::string name) {
        expect_operator("(");
        SqlNode fn = make_node(NodeKind::kFunction, std::move(name));
        if (accept_keyword("DISTINCT")) {
            fn.flag = true;
        } else {
            accept_keyword("ALL");
        }

        if (!is_operator(")")) {
            do {
                if (is_operator(")")) {
                    break;  // 후행 쉼표
                }
                if (is_operator("*") && (is_operator(")", 1) || is_operator(",", 1))) {
                    advance();
                    fn.children.push_back(make_node(NodeKind::kStar, "*"));
                    continue;
                }
                fn.children.push_back(parse_function_argument());
            } while (ok() && accept_operator(","));
        }

        if (is_keyword("ORDER") && is_keyword("BY", 1)) {
            advance();
            advance();
            fn.children.push_back(make_clause("ORDER BY", parse_order_list()));
        }
        if ((is_keyword("IGNORE") || is_keyword("RESPECT")) && is_keyword("NULLS", 1)) {
            const std::string which = to_upper(advance().value);
            advance();
            fn.children.push_back(make_clause(which + " NULLS", {}));
        }
        expect_operator(")");

        if (is_keyword("WITHIN") && is_keyword("GROUP", 1)) {
            advance();
            advance();
            expect_operator("(");
            expect_keyword("ORDER");
            expect_keyword("BY");
            fn.children.push_back(make_clause("WITHIN GROUP", parse_order_list()));
            expect_operator(")");
        }
        if (is_keyword("FILTER") && is_operator("(", 1)) {
            advance();
            advance();
            expect_keyword("WHERE");
            fn.children.push_back(make_clause("FILTER", {parse_expression()}));
            expect_operator(")");
        }
        if (accept_keyword("OVER")) {
            fn.children.push_back(parse_window());
        }
        return fn;
    }

    // 함수 인자: 일반 식, 람다(x -> ...), 이름 있는 인자(name => ...)
    SqlNode parse_function_argument() {
        SqlNode arg = parse_expression();
        if (accept_operator("->")) {
            return make_binary("->", std::move(arg), parse_expression());
        }
        if (accept_operator("=>")) {
            return make_binary("=>", std::move(arg), parse_expression());
        }
        return arg;
    }

    SqlNode parse_window() {
        SqlNode window = make_node(NodeKind::kWindow);
        if (peek().type == SqlTokenType::kIdentifier && !is_operator("(")) {
            window.value = advance().value;
            return window;
        }
        expect_operator("(");
        if (is_keyword("PARTITION") && is_keyword("BY", 1)) {
            advance();
            advance();
            window.children.push_back(make_clause("PARTITION BY", parse_expression_list()));
        }
        if (is_keyword("ORDER") && is_keyword("BY", 1)) {
            advance();
            advance();
            window.children.push_back(make_clause("ORDER BY", parse_order_list()));
        }
        if (is_keyword("ROWS") || is_keyword("RANGE") || is_keyword("GROUPS")) {
            std::string frame;
            int         depth = 0;
            while (ok() && !at_end() && !(depth == 0 && is_operator(")"))) {
                const SqlToken tok = advance();
                if (tok.type == SqlTokenType::kOperator && tok.value == "(") {
                    ++depth;
                } else if (tok.type == SqlTokenType::kOperator && tok.value == ")") {
                    --depth;
                }
                if (!frame.empty()) {
                    frame += ' ';
                }
                frame += tok.type == SqlTokenType::kIdentifier ? to_upper(tok.value) : tok.value;
            }
            window.children.push_back(make_clause("FRAME", {make_node(NodeKind::kIdentifier, frame)}));
        }
        expect_operator(")");
        return window;
    }

    SqlNode parse_case() {
        expect_keyword("CASE");
        SqlNode node = make_node(NodeKind::kCase);
        if (!is_keyword("WHEN")) {
            node.flag = true;
            node.children.push_back(parse_expression());
        }
        while (ok() && accept_keyword("WHEN")) {
            SqlNode when = make_node(NodeKind::kWhen);
            when.children.push_back(parse_expression());
            expect_keyword("THEN");
            when.children.push_back(parse_expression());
            node.children.push_back(std::move(when));
        }
        if (accept_keyword("ELSE")) {
            node.children.push_back(make_clause("ELSE", {parse_expression()}));
        }
        expect_keyword("END");
        return node;
    }

    SqlNode parse_cast(NodeKind kind) {
        advance();
        expect_operator("(");
        SqlNode expr = parse_expression();
        expect_keyword("AS");
        SqlNode cast = make_node(kind, parse_type_name());
        cast.children.push_back(std::move(expr));
        expect_operator(")");
        return cast;
    }

    SqlNode parse_extract() {
        advance();
        expect_operator("(");
        const SqlToken unit = advance();
        if (unit.type != SqlTokenType::kIdentifier && unit.type != SqlTokenType::kString) {
            return fail("expected date part in EXTRACT");
        }
        expect_keyword("FROM");
        SqlNode extract = make_node(NodeKind::kExtract, to_upper(unit.value));
        extract.children.push_back(parse_expression());
        expect_operator(")");
        return extract;
    }

    // INTERVAL '30 days' | INTERVAL 30 DAY | INTERVAL '1' MONTH
    SqlNode parse_interval() {
        expect_keyword("INTERVAL");
        SqlNode interval = make_node(NodeKind::kInterval);
        if (peek().type == SqlTokenType::kString) {
            interval.children.push_back(make_node(NodeKind::kLiteral, advance().value));
        } else if (peek().type == SqlTokenType::kNumber) {
            interval.children.push_back(make_node(NodeKind::kNumber, advance().value));
        } else {
            interval.children.push_back(parse_primary());
        }
        if (peek().type == SqlTokenType::kIdentifier
            && date_part_units().contains(to_upper(peek().value))) {
            interval.value = to_upper(advance().value);
        }
        return interval;
    }

    // INT, VARCHAR(10), DECIMAL(10, 2), DOUBLE PRECISION, ARRAY<STRING>, TEXT[]
    std::string parse_type_name() {
        const SqlToken first = advance();
        if (first.type != SqlTokenType::kIdentifier) {
            fail("expected type name");
            return {};
        }
        std::string type = first.value;
        while (is_keyword("PRECISION") || is_keyword("VARYING")
               || ((is_keyword("WITH") || is_keyword("WITHOUT")) && is_keyword("TIME", 1))
               || (is_keyword("TIME") && is_keyword("ZONE", 1)) || is_keyword("ZONE")) {
            type += ' ';
            type += advance().value;
        }
        if (accept_operator("(")) {
            type += '(';
            bool first_arg = true;
            do {
                if (!first_arg) {
                    type += ", ";
                }
                first_arg = false;
                type += advance().value;
            } while (ok() && accept_operator(","));
            expect_operator(")");
            type += ')';
        }
        if (is_operator("<")) {
            int depth = 0;
            do {
                const SqlToken tok = advance();
                if (tok.value == "<") {
                    ++depth;
                } else if (tok.value == ">") {
                    --depth;
                } else if (tok.value == ",") {
                    type += ", ";
                    continue;
                }
                type += tok.value;
            } while (ok() && depth > 0 && !at_end());
        }
        while (is_operator("[") && is_operator("]", 1)) {
            advance();
            advance();
            type += "[]";
        }
        return type;
    }

    static SqlNode make_binary(std::string op, SqlNode lhs, SqlNode rhs) {
        SqlNode node = make_node(NodeKind::kBinary, std::move(op));
        node.children.push_back(std::move(lhs));
        node.children.push_back(std::move(rhs));
        return node;
    }

    std::vector<SqlToken>     tokens_;
    std::size_t               pos_{0};
    int                       depth_{0};
    std::optional<ParseError> error_;
};

// 제어 흐름 플레이스홀더(__JINJA__ 와 뒤따르는 쉼표)를 토큰 목록에서 제거한다.
std::vector<SqlToken> drop_control_placeholders(std::vector<SqlToken> tokens) {
    std::vector<SqlToken> result;
    result.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.type == SqlTokenType::kIdentifier && tok.value == kControlPlaceholderName) {
            if (i + 1 < tokens.size() && tokens[i + 1].type == SqlTokenType::kOperator
                && tokens[i + 1].value == ",") {
                ++i;
            }
            continue;
        }
        result.push_back(std::move(tokens[i]));
    }
    return result;
}

} // namespace

// ---------------------------------------------------------------------------
// SqlParser::parse
// ---------------------------------------------------------------------------
std::expected<SqlNode, ParseError> SqlParser::parse(std::string_view sql) const {
    SqlLexer lexer{options_};
    auto     tokens = lexer.tokenize(sql);
    if (!tokens) {
        spdlog::debug("sql_parser: tokenize failed: {} ({})", tokens.error().message,
                      tokens.error().context);
        return std::unexpected(tokens.error());
    }

    ParserImpl impl{drop_control_placeholders(std::move(*tokens))};
    auto       result = impl.parse_statement();
    if (!result) {
        spdlog::debug("sql_parser: parse failed: {} ({})", result.error().message,
                      result.error().context);
    }
    return result;
}

// ---------------------------------------------------------------------------
// SqlParser::parse_expression
// ---------------------------------------------------------------------------
std::expected<SqlNode, ParseError> SqlParser::parse_expression(std::string_view sql) const {
    SqlLexer lexer{options_};
    auto     tokens = lexer.tokenize(sql);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    ParserImpl impl{drop_control_placeholders(std::move(*tokens))};
    return impl.parse_single_expression();
}
