/**
 * @file PolyglotService.hpp
 * @brief Entry point for parsing, sanitizing, transpiling and executing polyglot documents.
 */

#pragma once

#include <memory>
#include <string>
#include "application/execution/ExecutionSettings.hpp"
#include "domain/ContentProvider.hpp"
#include "domain/ExecutionResult.hpp"
#include "domain/PolyglotDocument.hpp"
#include "domain/ProcessRunner.hpp"
#include "domain/ResultSink.hpp"
#include "domain/transpile/Transpilers.hpp"

namespace polyglot::application {

/**
 * @class PolyglotService
 * @brief Wires the markdown passes to the executors.
 *
 * Parsing, sanitizing and transpiling are pure. Execute and ProcessDocument
 * launch external tools through the injected ProcessRunner.
 */
class PolyglotService {
public:
    PolyglotService(std::shared_ptr<domain::ProcessRunner> runner,
                    execution::ExecutionSettings settings,
                    std::shared_ptr<domain::ContentProvider> provider = nullptr,
                    std::shared_ptr<domain::ResultSink> sink = nullptr);

    /** @brief Tokenize, build, classify and enhance. */
    domain::PolyglotDocument Parse(const std::string& text) const;

    /** @brief True if the text contains any polyglot marker. */
    bool IsPolyglot(const std::string& text) const;

    /** @brief Removes hidden content; idempotent. */
    std::string Sanitize(const std::string& text) const;

    domain::transpile::TranspileResult Transpile(const domain::PolyglotDocument& document,
                                                 domain::transpile::Target target) const;

    /** @brief Routes by document language. Never throws. */
    domain::ExecutionResult Execute(const domain::PolyglotDocument& document);

    /**
     * @brief Fetch, parse, execute and store.
     * Unknown ids yield {ok:false, reason:"not_found"}; details.stored reports
     * whether the sink accepted the result.
     */
    domain::ExecutionResult ProcessDocument(const std::string& id);

    const execution::ExecutionSettings& GetSettings() const { return m_settings; }

private:
    std::shared_ptr<domain::ProcessRunner> m_runner;
    execution::ExecutionSettings m_settings;
    std::shared_ptr<domain::ContentProvider> m_provider;
    std::shared_ptr<domain::ResultSink> m_sink;
};

} // namespace polyglot::application
