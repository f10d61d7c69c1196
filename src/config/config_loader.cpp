// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 ProjectConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - 상대 경로는 설정 파일이 있는 디렉터리 기준으로 해석한다.
//
// [알려진 한계]
// - 등록되지 않은 adapter 이름은 오류가 아니라 경고다. 해당 방언은 빈
//   카탈로그로 취급되어 모든 함수가 이식 불가로 판정된다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "dialect/dialect_registry.hpp"

namespace {

constexpr std::array<const char*, 5> kLogLevels = {"trace", "debug", "info", "warn", "error"};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 bool 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: expected boolean, got '{}', using default",
                     node.Scalar());
        return fallback;
    }
}

[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: expected non-negative integer, got '{}', using default",
                     node.Scalar());
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

[[nodiscard]] std::string validate_log_level(const std::string& level) {
    for (const char* known : kLogLevels) {
        if (level == known) {
            return level;
        }
    }
    spdlog::warn("config_loader: unknown log_level '{}', defaulting to 'info'", level);
    return "info";
}

std::unexpected<std::string> fail(std::string message) {
    spdlog::error("config_loader: {}", message);
    return std::unexpected(std::move(message));
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<ProjectConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return fail(fmt::format("Config file not found: {}", config_path.string()));
    }

    spdlog::debug("config_loader: loading '{}'", config_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(fmt::format("cannot open config file '{}': {}", config_path.string(),
                                e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format("YAML parse error in '{}' at line {}, col {}: {}",
                                config_path.string(),
                                e.mark.line + 1,  // yaml-cpp는 0-based
                                e.mark.column + 1, e.msg));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("YAML error in '{}': {}", config_path.string(), e.what()));
    }

    if (!root || root.IsNull()) {
        return fail("Config file is empty");
    }
    if (!root.IsMap()) {
        return fail(fmt::format("'{}' is not a valid YAML map (top-level)", config_path.string()));
    }

    ProjectConfig cfg{};
    cfg.project_root = config_path.parent_path();
    if (cfg.project_root.empty()) {
        cfg.project_root = ".";
    }

    try {
        cfg.adapters = read_string_sequence(root["adapters"]);
        if (cfg.adapters.size() < 2) {
            return fail("At least 2 adapters must be specified");
        }
        for (const auto& adapter : cfg.adapters) {
            if (DialectRegistry::find(adapter) == nullptr) {
                spdlog::warn("config_loader: adapter '{}' is not a known dialect", adapter);
            }
        }

        cfg.macro_output =
            cfg.project_root / read_string(root["macro_output"], kDefaultMacroOutput);
        cfg.scan_project = read_bool(root["scan_project"], cfg.scan_project);

        if (cfg.scan_project) {
            std::vector<std::string> raw_paths{"models"};
            if (root["model_paths"]) {
                raw_paths = read_string_sequence(root["model_paths"]);
            }
            for (const auto& raw : raw_paths) {
                cfg.model_paths.push_back(cfg.project_root / raw);
            }
        }

        cfg.log_level = validate_log_level(read_string(root["log_level"], cfg.log_level));
        if (root["log_file"]) {
            const std::string log_file = read_string(root["log_file"], "");
            if (!log_file.empty()) {
                cfg.log_file = cfg.project_root / log_file;
            }
        }
        cfg.workers = read_uint32(root["workers"], 0);
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("error parsing '{}': {}", config_path.string(), e.what()));
    }

    spdlog::info("config_loader: loaded adapters={} model_paths={} macro_output={}",
                 fmt::join(cfg.adapters, ","), cfg.model_paths.size(),
                 cfg.macro_output.string());
    return cfg;
}
