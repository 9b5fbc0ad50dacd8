/**
 * @file ExecutionSettings.hpp
 * @brief Knobs shared by every executor.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include "domain/transpile/Transpilers.hpp"

namespace polyglot::application::execution {

struct ExecutionSettings {
    std::filesystem::path workspaceRoot;              ///< Empty: system temp directory.
    std::chrono::milliseconds timeout{300000};
    domain::transpile::TranspileOptions transpile;
    std::string dockerBuildContext = ".";
};

} // namespace polyglot::application::execution
