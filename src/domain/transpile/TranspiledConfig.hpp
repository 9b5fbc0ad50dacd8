/**
 * @file TranspiledConfig.hpp
 * @brief Per-target configuration shapes produced by the transpilers.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace polyglot::domain::transpile {

struct DockerConfig {
    std::string dockerfile;
    std::string imageTag;
    std::string buildCommand;
};

struct TerraformConfig {
    std::string configuration;
    std::map<std::string, std::string> variables;
    std::string planCommand;
    std::string applyCommand;
};

struct KubernetesConfig {
    std::vector<std::string> manifests;
    std::string namespaceName;
    std::string applyCommand;
};

struct GitConfig {
    std::map<std::string, std::string> files;   ///< path -> content
    std::vector<std::string> initCommands;
};

struct BashConfig {
    std::string script;
    std::string shebang;
    std::map<std::string, std::string> environment;
};

struct SqlConfig {
    std::vector<std::string> statements;
    std::string database;
    std::string client;
};

using TranspiledConfig = std::variant<DockerConfig, TerraformConfig, KubernetesConfig, GitConfig, BashConfig, SqlConfig>;

/**
 * @struct TranspileError
 * @brief Returned, never thrown, when the target's artifact type is absent.
 */
struct TranspileError {
    std::string code;      ///< e.g. "no_dockerfile_found"
    std::string message;
};

struct TranspileResult {
    std::optional<TranspiledConfig> config;
    std::optional<TranspileError> error;

    bool ok() const { return config.has_value(); }

    static TranspileResult Success(TranspiledConfig value) {
        TranspileResult r;
        r.config = std::move(value);
        return r;
    }

    static TranspileResult Failure(const std::string& code, const std::string& message) {
        TranspileResult r;
        r.error = TranspileError{code, message};
        return r;
    }

    /** @brief The config as a concrete type; nullptr on failure or type mismatch. */
    template <typename T>
    const T* as() const {
        return config ? std::get_if<T>(&*config) : nullptr;
    }
};

} // namespace polyglot::domain::transpile
