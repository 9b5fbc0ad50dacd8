/**
 * @file Language.hpp
 * @brief Dominant classification of a polyglot document.
 */

#pragma once
#include <array>
#include <optional>
#include <string>

namespace polyglot::domain {

/**
 * @enum Language
 * @brief What the document "really is". Exactly one per document.
 */
enum class Language {
    Dockerfile,
    Terraform,
    Kubernetes,
    Executable,
    Git,
    Sql,
    None      ///< Plain Markdown.
};

inline constexpr std::array<Language, 7> kAllLanguages = {
    Language::Dockerfile, Language::Terraform, Language::Kubernetes,
    Language::Executable, Language::Git,       Language::Sql,
    Language::None
};

inline const char* LanguageToString(Language language) {
    switch (language) {
        case Language::Dockerfile: return "dockerfile";
        case Language::Terraform: return "terraform";
        case Language::Kubernetes: return "kubernetes";
        case Language::Executable: return "executable";
        case Language::Git: return "git";
        case Language::Sql: return "sql";
        case Language::None: return "none";
    }
    return "none";
}

inline std::optional<Language> LanguageFromString(const std::string& name) {
    for (Language language : kAllLanguages) {
        if (name == LanguageToString(language)) return language;
    }
    return std::nullopt;
}

} // namespace polyglot::domain
