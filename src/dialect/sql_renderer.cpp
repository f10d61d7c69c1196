// ---------------------------------------------------------------------------
// sql_renderer.cpp
//
// 방언별 정규 구문 출력 구현.
//
// [오류 처리]
// - 첫 렌더 오류를 error_ 에 기록(sticky)하고 빈 문자열로 계속 진행한다.
//   render() 는 오류가 있으면 부분 출력 대신 std::unexpected 를 반환한다.
// ---------------------------------------------------------------------------

#include "dialect/sql_renderer.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "dialect/dialect_profile.hpp"

namespace {

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += sep;
        }
        result += parts[i];
    }
    return result;
}

ParseError render_error(std::string message, std::string context = {}) {
    return ParseError{
        .code    = ParseErrorCode::kRenderError,
        .message = std::move(message),
        .context = std::move(context),
    };
}

// ---------------------------------------------------------------------------
// RenderImpl
//   트리 한 번 출력에 대한 1회성 상태.
// ---------------------------------------------------------------------------
class RenderImpl {
public:
    explicit RenderImpl(const DialectProfile& profile) : profile_(profile) {}

    std::expected<std::string, ParseError> run(const SqlNode& node) {
        std::string out = emit(node);
        if (error_) {
            return std::unexpected(*error_);
        }
        return out;
    }

private:
    std::string fail(ParseError error) {
        if (!error_) {
            error_ = std::move(error);
        }
        return {};
    }

    std::vector<std::string> emit_all(const std::vector<SqlNode>& nodes) {
        std::vector<std::string> out;
        out.reserve(nodes.size());
        for (const auto& node : nodes) {
            out.push_back(emit(node));
        }
        return out;
    }

    std::string quote_identifier(const std::string& name) const {
        const char  q = profile_.grammar().identifier_quote;
        std::string out(1, q);
        for (const char c : name) {
            if (c == q) {
                out.push_back(q);
            }
            out.push_back(c);
        }
        out.push_back(q);
        return out;
    }

    std::string quote_string(const std::string& value) const {
        const bool  backslash = profile_.grammar().backslash_escapes;
        std::string out       = "'";
        for (const char c : value) {
            if (c == '\'') {
                out += backslash ? "\\'" : "''";
            } else if (c == '\\' && backslash) {
                out += "\\\\";
            } else {
                out.push_back(c);
            }
        }
        out.push_back('\'');
        return out;
    }

    std::string emit(const SqlNode& node) {
        if (error_) {
            return {};
        }
        switch (node.kind) {
            case NodeKind::kSelect:       return emit_select(node);
            case NodeKind::kClause:       return join(emit_all(node.children), ", ");
            case NodeKind::kSetOp:
                return fmt::format("{} {} {}", emit(node.children.at(0)), node.value,
                                   emit(node.children.at(1)));
            case NodeKind::kWith:         return emit_with(node);
            case NodeKind::kCte:          return emit_cte(node);
            case NodeKind::kSubquery:     return "(" + emit(node.children.at(0)) + ")";
            case NodeKind::kTable:
            case NodeKind::kColumn:       return join(emit_all(node.children), ".");
            case NodeKind::kJoin:         return emit_join(node);
            case NodeKind::kLateralView:  return emit_lateral_view(node);
            case NodeKind::kAlias:        return emit_alias(node);
            case NodeKind::kIdentifier:
                return node.flag ? quote_identifier(node.value) : node.value;
            case NodeKind::kStar:         return "*";
            case NodeKind::kLiteral:      return quote_string(node.value);
            case NodeKind::kNumber:
            case NodeKind::kBoolean:      return node.value;
            case NodeKind::kNull:         return "NULL";
            case NodeKind::kFunction:     return emit_function(node);
            case NodeKind::kWindow:       return emit_window(node);
            case NodeKind::kBinary:
                return fmt::format("{} {} {}", emit(node.children.at(0)), node.value,
                                   emit(node.children.at(1)));
            case NodeKind::kUnary:
                if (node.value == "NOT") {
                    return "NOT " + emit(node.children.at(0));
                }
                return node.value + emit(node.children.at(0));
            case NodeKind::kCase:         return emit_case(node);
            case NodeKind::kWhen:
                return fmt::format("WHEN {} THEN {}", emit(node.children.at(0)),
                                   emit(node.children.at(1)));
            case NodeKind::kCast:
                if (node.flag && profile_.grammar().double_colon_cast) {
                    return emit(node.children.at(0)) + "::" + node.value;
                }
                return fmt::format("CAST({} AS {})", emit(node.children.at(0)), node.value);
            case NodeKind::kTryCast:
                return fmt::format("{}({} AS {})", profile_.try_cast_keyword(),
                                   emit(node.children.at(0)), node.value);
            case NodeKind::kInterval:
                if (node.value.empty()) {
                    return "INTERVAL " + emit(node.children.at(0));
                }
                return fmt::format("INTERVAL {} {}", emit(node.children.at(0)), node.value);
            case NodeKind::kBetween:
                return fmt::format("{} {}BETWEEN {} AND {}", emit(node.children.at(0)),
                                   node.flag ? "NOT " : "", emit(node.children.at(1)),
                                   emit(node.children.at(2)));
            case NodeKind::kIn:           return emit_in(node);
            case NodeKind::kParen:        return "(" + emit(node.children.at(0)) + ")";
            case NodeKind::kTuple:        return "(" + join(emit_all(node.children), ", ") + ")";
            case NodeKind::kSubscript:
                return fmt::format("{}[{}]", emit(node.children.at(0)), emit(node.children.at(1)));
            case NodeKind::kOrdered:
                return fmt::format("{} {}", emit(node.children.at(0)), node.value);
            case NodeKind::kExists:
                return "EXISTS (" + emit(node.children.at(0)) + ")";
            case NodeKind::kExtract:
                return fmt::format("EXTRACT({} FROM {})", node.value, emit(node.children.at(0)));
            case NodeKind::kTypedLiteral:
                return fmt::format("{} {}", node.value, emit(node.children.at(0)));
        }
        return fail(render_error("unknown node kind"));
    }

    std::string emit_select(const SqlNode& node) {
        std::string out = node.flag ? "SELECT DISTINCT " : "SELECT ";
        for (const auto& clause : node.children) {
            if (clause.value == "PROJECTION") {
                out += join(emit_all(clause.children), ", ");
            } else if (clause.value == "FROM") {
                out += " FROM " + emit_from(clause);
            } else {
                out += fmt::format(" {} {}", clause.value, emit(clause));
            }
        }
        return out;
    }

    // FROM 항목: JOIN / LATERAL VIEW 는 공백, 그 외 테이블은 쉼표로 연결
    std::string emit_from(const SqlNode& clause) {
        std::string out;
        for (std::size_t i = 0; i < clause.children.size(); ++i) {
            const auto& item = clause.children[i];
            if (i > 0) {
                const bool joined =
                    item.kind == NodeKind::kJoin || item.kind == NodeKind::kLateralView;
                out += joined ? " " : ", ";
            }
            out += emit(item);
        }
        return out;
    }

    std::string emit_with(const SqlNode& node) {
        std::vector<std::string> ctes;
        for (std::size_t i = 0; i + 1 < node.children.size(); ++i) {
            ctes.push_back(emit(node.children[i]));
        }
        return fmt::format("WITH {}{} {}", node.flag ? "RECURSIVE " : "", join(ctes, ", "),
                           emit(node.children.back()));
    }

    std::string emit_cte(const SqlNode& node) {
        std::string out = node.value;
        if (node.children.size() > 1) {
            std::vector<std::string> cols;
            for (std::size_t i = 1; i < node.children.size(); ++i) {
                cols.push_back(emit(node.children[i]));
            }
            out += " (" + join(cols, ", ") + ")";
        }
        return out + " AS (" + emit(node.children.at(0)) + ")";
    }

    std::string emit_join(const SqlNode& node) {
        std::string out = node.value + " " + emit(node.children.at(0));
        if (node.children.size() > 1) {
            const auto& cond = node.children[1];
            if (cond.value == "USING") {
                out += " USING (" + emit(cond) + ")";
            } else {
                out += " ON " + emit(cond);
            }
        }
        return out;
    }

    std::string emit_lateral_view(const SqlNode& node) {
        std::vector<std::string> cols;
        for (std::size_t i = 2; i < node.children.size(); ++i) {
            cols.push_back(emit(node.children[i]));
        }
        return fmt::format("{} {} {} AS {}", node.value, emit(node.children.at(0)),
                           emit(node.children.at(1)), join(cols, ", "));
    }

    std::string emit_alias(const SqlNode& node) {
        std::string out = emit(node.children.at(0)) + " AS "
                        + (node.flag ? quote_identifier(node.value) : node.value);
        if (node.children.size() > 1) {
            std::vector<std::string> cols;
            for (std::size_t i = 1; i < node.children.size(); ++i) {
                cols.push_back(emit(node.children[i]));
            }
            out += " (" + join(cols, ", ") + ")";
        }
        return out;
    }

    std::string emit_in(const SqlNode& node) {
        const std::string lhs = emit(node.children.at(0));
        const char*       op  = node.flag ? "NOT IN" : "IN";
        if (node.children.size() == 2 && node.children[1].kind == NodeKind::kSubquery) {
            return fmt::format("{} {} {}", lhs, op, emit(node.children[1]));
        }
        std::vector<std::string> items;
        for (std::size_t i = 1; i < node.children.size(); ++i) {
            items.push_back(emit(node.children[i]));
        }
        return fmt::format("{} {} ({})", lhs, op, join(items, ", "));
    }

    std::string emit_case(const SqlNode& node) {
        std::string out = "CASE";
        for (const auto& child : node.children) {
            if (child.kind == NodeKind::kClause && child.value == "ELSE") {
                out += " ELSE " + emit(child);
            } else {
                out += " " + emit(child);
            }
        }
        return out + " END";
    }

    std::string emit_window(const SqlNode& node) {
        if (!node.value.empty()) {
            return "OVER " + node.value;
        }
        std::vector<std::string> parts;
        for (const auto& clause : node.children) {
            if (clause.value == "FRAME") {
                parts.push_back(emit(clause));
            } else {
                parts.push_back(clause.value + " " + emit(clause));
            }
        }
        return "OVER (" + join(parts, " ") + ")";
    }

    // 함수 호출: 카탈로그 구현이면 템플릿, 익명 함수면 NAME(args)
    std::string emit_function(const SqlNode& node) {
        std::vector<std::string> args;
        std::vector<std::string> inner_modifiers;
        std::vector<std::string> outer_modifiers;

        for (const auto& child : node.children) {
            if (!is_function_modifier(child)) {
                args.push_back(emit(child));
                continue;
            }
            if (child.kind == NodeKind::kWindow) {
                outer_modifiers.push_back(emit(child));
            } else if (child.value == "WITHIN GROUP") {
                outer_modifiers.push_back("WITHIN GROUP (ORDER BY " + emit(child) + ")");
            } else if (child.value == "FILTER") {
                outer_modifiers.push_back("FILTER (WHERE " + emit(child) + ")");
            } else if (child.children.empty()) {
                inner_modifiers.push_back(child.value);  // IGNORE NULLS / RESPECT NULLS
            } else {
                inner_modifiers.push_back(child.value + " " + emit(child));
            }
        }
        if (error_) {
            return {};
        }
        if (node.flag && !args.empty()) {
            args.front() = "DISTINCT " + args.front();
        }

        std::string call;
        if (node.impl_id.empty()) {
            call = node.value + "(" + join(args, ", ") + ")";
        } else {
            const auto* templates = profile_.templates_for(node.impl_id);
            if (templates == nullptr) {
                return fail(render_error(
                    fmt::format("function {} is not supported by dialect {}", node.impl_id,
                                profile_.name()),
                    node.value));
            }
            const RenderTemplate* chosen = nullptr;
            for (const auto& tmpl : *templates) {
                if (tmpl.arity == static_cast<int>(args.size())) {
                    chosen = &tmpl;
                    break;
                }
            }
            if (chosen == nullptr) {
                for (const auto& tmpl : *templates) {
                    if (tmpl.arity == kAnyArity) {
                        chosen = &tmpl;
                        break;
                    }
                }
            }
            if (chosen == nullptr) {
                return fail(render_error(
                    fmt::format("function {} with {} argument(s) is not supported by dialect {}",
                                node.impl_id, args.size(), profile_.name()),
                    node.value));
            }
            auto expanded = SqlRenderer::expand_template(chosen->pattern, args);
            if (!expanded) {
                return fail(expanded.error());
            }
            call = std::move(*expanded);
        }

        if (!inner_modifiers.empty()) {
            if (!call.empty() && call.back() == ')') {
                call.insert(call.size() - 1, " " + join(inner_modifiers, " "));
            } else {
                return fail(render_error(
                    fmt::format("cannot attach {} to {}", join(inner_modifiers, " "), call)));
            }
        }
        for (const auto& modifier : outer_modifiers) {
            call += " " + modifier;
        }
        return call;
    }

    const DialectProfile&     profile_;
    std::optional<ParseError> error_;
};

} // namespace

// ---------------------------------------------------------------------------
// SqlRenderer::render
// ---------------------------------------------------------------------------
std::expected<std::string, ParseError> SqlRenderer::render(const SqlNode& node) const {
    RenderImpl impl{profile_};
    return impl.run(node);
}

// ---------------------------------------------------------------------------
// SqlRenderer::expand_template
// ---------------------------------------------------------------------------
std::expected<std::string, ParseError>
SqlRenderer::expand_template(std::string_view pattern, const std::vector<std::string>& args) {
    std::string out;
    out.reserve(pattern.size() + 16);

    std::size_t i = 0;
    while (i < pattern.size()) {
        if (pattern[i] != '{') {
            out.push_back(pattern[i]);
            ++i;
            continue;
        }
        const std::size_t close = pattern.find('}', i);
        if (close == std::string_view::npos) {
            return std::unexpected(render_error("unterminated placeholder", std::string(pattern)));
        }
        const std::string_view key = pattern.substr(i + 1, close - i - 1);
        if (key == "*") {
            out += join(args, ", ");
        } else {
            if (key.empty()
                || !std::all_of(key.begin(), key.end(),
                                [](unsigned char c) { return std::isdigit(c) != 0; })) {
                return std::unexpected(render_error(
                    fmt::format("invalid placeholder '{{{}}}'", key), std::string(pattern)));
            }
            const std::size_t index = static_cast<std::size_t>(std::stoul(std::string(key)));
            if (index >= args.size()) {
                return std::unexpected(render_error(
                    fmt::format("placeholder {} out of range ({} argument(s))", index, args.size()),
                    std::string(pattern)));
            }
            out += args[index];
        }
        i = close + 1;
    }
    return out;
}
