// ---------------------------------------------------------------------------
// dialect_registry.cpp
// ---------------------------------------------------------------------------

#include "dialect/dialect_registry.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "dialect/builtin_dialects.hpp"

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// 사용자 표기 → 정규 이름
const std::map<std::string, std::string, std::less<>>& alias_table() {
    static const std::map<std::string, std::string, std::less<>> kAliases = {
        {"postgres", "postgres"},     {"postgresql", "postgres"},
        {"snowflake", "snowflake"},   {"bigquery", "bigquery"},
        {"spark", "spark"},           {"databricks", "databricks"},
        {"redshift", "redshift"},     {"duckdb", "duckdb"},
        {"trino", "trino"},           {"presto", "presto"},
        {"mysql", "mysql"},
    };
    return kAliases;
}

using ProfileTable = std::map<std::string, std::unique_ptr<DialectProfile>, std::less<>>;

const ProfileTable& profile_table() {
    static const ProfileTable kProfiles = [] {
        ProfileTable table;
        for (auto& definition : builtin_dialect_definitions()) {
            std::string name = definition.name;
            table.emplace(std::move(name), std::make_unique<TableDialect>(std::move(definition)));
        }
        return table;
    }();
    return kProfiles;
}

} // namespace

std::string DialectRegistry::normalize(std::string_view dialect_id) {
    std::string lowered = to_lower(dialect_id);
    const auto& aliases = alias_table();
    const auto  it      = aliases.find(lowered);
    if (it == aliases.end()) {
        return lowered;
    }
    return it->second;
}

const DialectProfile* DialectRegistry::find(std::string_view dialect_id) {
    const auto& table = profile_table();
    const auto  it    = table.find(normalize(dialect_id));
    if (it == table.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> DialectRegistry::names() {
    std::vector<std::string> result;
    for (const auto& [name, profile] : profile_table()) {
        result.push_back(name);
    }
    return result;
}
