// ---------------------------------------------------------------------------
// dialect_oracle.cpp
// ---------------------------------------------------------------------------

#include "dialect/dialect_oracle.hpp"

#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "dialect/dialect_registry.hpp"

namespace {

ParseError unsupported_dialect(std::string_view name) {
    return ParseError{
        .code    = ParseErrorCode::kUnsupportedDialect,
        .message = fmt::format("unsupported dialect '{}'", name),
        .context = std::string(name),
    };
}

} // namespace

DialectOracle::DialectOracle(const std::vector<std::string>& dialect_ids) {
    names_.reserve(dialect_ids.size());
    profiles_.reserve(dialect_ids.size());
    for (const auto& id : dialect_ids) {
        std::string name    = DialectRegistry::normalize(id);
        const auto* profile = DialectRegistry::find(name);
        if (profile == nullptr) {
            spdlog::warn("dialect_oracle: unknown dialect '{}', treated as empty catalog", id);
        }
        names_.push_back(std::move(name));
        profiles_.push_back(profile);
    }
}

std::string DialectOracle::normalize(std::string_view dialect_id) {
    return DialectRegistry::normalize(dialect_id);
}

const std::string& DialectOracle::primary() const {
    static const std::string kNone;
    return names_.empty() ? kNone : names_.front();
}

// ---------------------------------------------------------------------------
// parse / render
// ---------------------------------------------------------------------------
std::expected<SqlNode, ParseError> DialectOracle::parse(std::string_view sql) const {
    if (profiles_.empty() || profiles_.front() == nullptr) {
        return std::unexpected(unsupported_dialect(primary()));
    }
    return profiles_.front()->parse(sql);
}

std::expected<std::string, ParseError> DialectOracle::render(const SqlNode&   node,
                                                             std::string_view dialect) const {
    const auto* profile = DialectRegistry::find(dialect);
    if (profile == nullptr) {
        return std::unexpected(unsupported_dialect(dialect));
    }
    return profile->render(node);
}

std::expected<std::string, ParseError> DialectOracle::render_primary(const SqlNode& node) const {
    if (profiles_.empty() || profiles_.front() == nullptr) {
        return std::unexpected(unsupported_dialect(primary()));
    }
    return profiles_.front()->render(node);
}

// ---------------------------------------------------------------------------
// function_differs
//   렌더링 실패는 오류로 전파하지 않고 "다름" 으로 판정한다.
// ---------------------------------------------------------------------------
bool DialectOracle::function_differs(const SqlNode& node) const {
    std::set<std::string> renderings;
    for (std::size_t i = 0; i < profiles_.size(); ++i) {
        if (profiles_[i] == nullptr) {
            return true;
        }
        auto rendered = profiles_[i]->render(node);
        if (!rendered) {
            spdlog::debug("dialect_oracle: {} not renderable in {}: {}", node.value, names_[i],
                          rendered.error().message);
            return true;
        }
        renderings.insert(std::move(*rendered));
    }
    return renderings.size() > 1;
}

// ---------------------------------------------------------------------------
// catalog_differences
// ---------------------------------------------------------------------------
std::vector<std::string> DialectOracle::catalog_differences() const {
    std::set<std::string> all_names;
    for (const auto* profile : profiles_) {
        if (profile == nullptr) {
            continue;
        }
        for (const auto& [name, entry] : profile->catalog()) {
            all_names.insert(name);
        }
    }

    std::vector<std::string> differing;
    for (const auto& name : all_names) {
        std::set<std::string> implementations;
        std::size_t           present = 0;
        for (const auto* profile : profiles_) {
            if (profile == nullptr) {
                continue;
            }
            const auto it = profile->catalog().find(name);
            if (it != profile->catalog().end()) {
                implementations.insert(it->second.impl_id);
                ++present;
            }
        }
        if (implementations.size() > 1 || present < profiles_.size()) {
            differing.push_back(name);
        }
    }
    return differing;  // std::set 순회 순서 = 정렬 순서
}

// ---------------------------------------------------------------------------
// transpile
// ---------------------------------------------------------------------------
std::expected<std::string, ParseError> DialectOracle::transpile(std::string_view sql,
                                                                std::string_view read,
                                                                std::string_view write) {
    const auto* reader = DialectRegistry::find(read);
    if (reader == nullptr) {
        return std::unexpected(unsupported_dialect(read));
    }
    const auto* writer = DialectRegistry::find(write);
    if (writer == nullptr) {
        return std::unexpected(unsupported_dialect(write));
    }
    auto tree = reader->parse(sql);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    return writer->render(*tree);
}
