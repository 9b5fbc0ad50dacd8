/**
 * @file Transpilers.hpp
 * @brief Pure conversions from artifacts + metadata to target configuration.
 */

#pragma once
#include <string>
#include "domain/PolyglotDocument.hpp"
#include "domain/transpile/Target.hpp"
#include "domain/transpile/TranspiledConfig.hpp"

namespace polyglot::domain::transpile {

/**
 * @struct TranspileOptions
 * @brief Defaults used when the document does not say otherwise.
 */
struct TranspileOptions {
    std::string imageTag = "polyglot:latest";
    std::string database = "polyglot_db";
    std::string sqlClient = "psql";
    std::string commitMessage = "Initial commit from polyglot markdown";
};

/**
 * @brief Stateless transpilers, one per target. No I/O, no exceptions.
 *
 * Document-level overrides are read from directive metadata:
 *   polyglot:image=<tag>, polyglot:terraform_vars k=v ..., polyglot:commit_message="...",
 *   polyglot:environment K=V ..., polyglot:database=<name>
 */
class Transpilers {
public:
    static TranspileResult Transpile(Target target, const ArtifactList& artifacts, const Metadata& metadata,
                                     const TranspileOptions& options = {});

    static TranspileResult Docker(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options);
    static TranspileResult Terraform(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options);
    static TranspileResult Kubernetes(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options);
    static TranspileResult Git(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options);
    static TranspileResult Bash(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options);
    static TranspileResult Sql(const ArtifactList& artifacts, const Metadata& metadata, const TranspileOptions& options);

    /** @brief Splits on ';' outside quotes and comments; blank statements are dropped. */
    static std::vector<std::string> SplitSqlStatements(const std::string& sql);

    /** @brief POSIX single-quote escaping for sh -c. */
    static std::string ShellQuote(const std::string& value);
};

} // namespace polyglot::domain::transpile
