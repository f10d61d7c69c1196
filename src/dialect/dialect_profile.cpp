// ---------------------------------------------------------------------------
// dialect_profile.cpp
//
// TableDialect 구현: 파싱 후 카탈로그 해석, 렌더러 위임.
// ---------------------------------------------------------------------------

#include "dialect/dialect_profile.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include "dialect/sql_renderer.hpp"
#include "parser/sql_parser.hpp"

namespace {

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

TableDialect::TableDialect(DialectDefinition definition)
    : definition_(std::move(definition)) {}

// ---------------------------------------------------------------------------
// parse
// ---------------------------------------------------------------------------
std::expected<SqlNode, ParseError> TableDialect::parse(std::string_view sql) const {
    SqlParser parser{definition_.grammar};
    auto      tree = parser.parse(sql);
    if (!tree) {
        return tree;
    }
    resolve_functions(*tree);
    return tree;
}

// ---------------------------------------------------------------------------
// resolve_functions
//   함수 노드에 impl_id 를 기록하고 인자를 정규 순서로 재배치한다.
//   DISTINCT 플래그나 ORDER BY 등 후행 수식어는 그대로 유지된다.
// ---------------------------------------------------------------------------
void TableDialect::resolve_functions(SqlNode& node) const {
    for (auto& child : node.children) {
        resolve_functions(child);
    }
    if (node.kind != NodeKind::kFunction) {
        return;
    }

    const auto it = definition_.catalog.find(to_upper(node.value));
    if (it == definition_.catalog.end()) {
        return;
    }
    node.impl_id = it->second.impl_id;

    const auto& order = it->second.arg_order;
    if (order.empty() || order.size() != function_arity(node)) {
        return;
    }

    std::vector<SqlNode> args;
    std::vector<SqlNode> modifiers;
    for (auto& child : node.children) {
        if (is_function_modifier(child)) {
            modifiers.push_back(std::move(child));
        } else {
            args.push_back(std::move(child));
        }
    }

    std::vector<SqlNode> reordered;
    reordered.reserve(args.size() + modifiers.size());
    for (const std::size_t index : order) {
        reordered.push_back(std::move(args[index]));
    }
    for (auto& modifier : modifiers) {
        reordered.push_back(std::move(modifier));
    }
    node.children = std::move(reordered);
}

// ---------------------------------------------------------------------------
// render
// ---------------------------------------------------------------------------
std::expected<std::string, ParseError> TableDialect::render(const SqlNode& node) const {
    SqlRenderer renderer{*this};
    return renderer.render(node);
}

// ---------------------------------------------------------------------------
// templates_for
// ---------------------------------------------------------------------------
const std::vector<RenderTemplate>* TableDialect::templates_for(std::string_view impl_id) const {
    const auto it = definition_.renderers.find(impl_id);
    if (it == definition_.renderers.end()) {
        return nullptr;
    }
    return &it->second;
}
