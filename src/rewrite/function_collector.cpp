// ---------------------------------------------------------------------------
// function_collector.cpp
// ---------------------------------------------------------------------------

#include "rewrite/function_collector.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

void walk(const SqlNode&                  node,
          std::size_t                     depth,
          const DialectOracle&            oracle,
          std::vector<FunctionCandidate>& out) {
    if (node.kind == NodeKind::kFunction) {
        std::string name;
        if (auto rendered = oracle.render_primary(node)) {
            name = extract_function_name(*rendered);
        } else {
            name = to_upper(node.value);
        }
        if (!name.empty()) {
            out.push_back(FunctionCandidate{
                .depth         = depth,
                .rendered_name = std::move(name),
                .node          = &node,
            });
        }
    }
    for (const auto& child : node.children) {
        walk(child, depth + 1, oracle, out);
    }
}

} // namespace

std::vector<FunctionCandidate> collect_functions(const SqlNode& root, const DialectOracle& oracle) {
    std::vector<FunctionCandidate> out;
    walk(root, 0, oracle, out);
    return out;
}

std::string extract_function_name(const std::string& rendered) {
    static const std::regex kCallRe(R"(^\s*([A-Za-z_][A-Za-z0-9_]*)\s*\()");
    static const std::regex kBareRe(R"(^\s*([A-Za-z_][A-Za-z0-9_]*)\s*$)");

    std::smatch match;
    if (std::regex_search(rendered, match, kCallRe) || std::regex_match(rendered, match, kBareRe)) {
        return to_upper(match[1].str());
    }
    return {};
}
