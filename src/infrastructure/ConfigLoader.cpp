/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>

namespace polyglot::infrastructure {

namespace {

template <typename T>
void readKey(const nlohmann::json& section, const char* key, T& out) {
    if (!section.is_object() || !section.contains(key)) return;
    try {
        out = section.at(key).get<T>();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.contains(name) && j.at(name).is_object()) return j.at(name);
    return empty;
}

} // namespace

PipelineConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    PipelineConfig config;
    config.documentsRoot = PathUtils::GetDocumentsDir().string();
    config.resultsRoot = PathUtils::GetResultsDir().string();
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
        return config;
    }

    readKey(j, "workspace_root", config.workspaceRoot);
    readKey(j, "documents_root", config.documentsRoot);
    readKey(j, "results_root", config.resultsRoot);

    long long timeoutMs = config.processTimeout.count();
    readKey(j, "process_timeout_ms", timeoutMs);
    if (timeoutMs > 0) {
        config.processTimeout = std::chrono::milliseconds(timeoutMs);
    } else {
        std::cerr << "[ConfigLoader] process_timeout_ms must be positive, keeping "
                  << config.processTimeout.count() << std::endl;
    }

    const auto& docker = section(j, "docker");
    readKey(docker, "image_tag", config.dockerImageTag);
    readKey(docker, "build_context", config.dockerBuildContext);

    const auto& sql = section(j, "sql");
    readKey(sql, "client", config.sqlClient);
    readKey(sql, "database", config.sqlDatabase);

    const auto& remote = section(j, "remote");
    readKey(remote, "host", config.remoteHost);
    readKey(remote, "port", config.remotePort);

    return config;
}

PipelineConfig ConfigLoader::Load(const std::filesystem::path& settingsPath) {
    std::error_code ec;
    if (!std::filesystem::exists(settingsPath, ec)) {
        return FromJson(nlohmann::json::object());
    }

    try {
        std::ifstream f(settingsPath);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return FromJson(nlohmann::json::object());
}

PipelineConfig ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetSettingsPath());
}

} // namespace polyglot::infrastructure
