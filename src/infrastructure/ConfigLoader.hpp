/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the pipeline configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; everything else receives a
 * plain PipelineConfig.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace polyglot::infrastructure {

/**
 * @struct PipelineConfig
 * @brief Effective settings. Defaults apply to every key the file omits.
 */
struct PipelineConfig {
    std::string workspaceRoot;                                ///< Empty: system temp directory.
    std::chrono::milliseconds processTimeout{300000};
    std::string dockerImageTag = "polyglot:latest";
    std::string dockerBuildContext = ".";
    std::string sqlClient = "psql";
    std::string sqlDatabase = "polyglot_db";
    std::string documentsRoot;
    std::string resultsRoot;
    std::string remoteHost;                                   ///< Empty: file provider/sink.
    int remotePort = 80;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from the given file.
     * A missing file yields defaults silently; a malformed file is logged and
     * yields defaults.
     */
    static PipelineConfig Load(const std::filesystem::path& settingsPath);

    /** @brief Load() from $XDG_CONFIG_HOME/polyglot/settings.json. */
    static PipelineConfig LoadDefault();

    /** @brief Applies recognized keys over defaults. Wrongly typed keys are logged and skipped. */
    static PipelineConfig FromJson(const nlohmann::json& j);
};

} // namespace polyglot::infrastructure
