/**
 * @file PolyglotService.cpp
 * @brief Implementation of PolyglotService.
 */

#include "application/PolyglotService.hpp"
#include "application/execution/Executors.hpp"
#include "domain/markdown/AstBuilder.hpp"
#include "domain/markdown/AstEnhancer.hpp"
#include "domain/markdown/MetadataExtractor.hpp"
#include "domain/markdown/Sanitizer.hpp"
#include "domain/markdown/Tokenizer.hpp"
#include <iostream>

namespace polyglot::application {

using namespace polyglot::domain;
namespace md = polyglot::domain::markdown;

PolyglotService::PolyglotService(std::shared_ptr<ProcessRunner> runner,
                                 execution::ExecutionSettings settings,
                                 std::shared_ptr<ContentProvider> provider,
                                 std::shared_ptr<ResultSink> sink)
    : m_runner(std::move(runner)),
      m_settings(std::move(settings)),
      m_provider(std::move(provider)),
      m_sink(std::move(sink)) {}

PolyglotDocument PolyglotService::Parse(const std::string& text) const {
    const auto tokens = md::Tokenizer::Tokenize(text);
    const auto extraction = md::MetadataExtractor::Extract(text);

    PolyglotDocument document;
    document.source = text;
    document.ast = md::AstEnhancer::Enhance(md::AstBuilder::Build(tokens), extraction);
    document.language = extraction.language;
    document.artifacts = extraction.artifacts;
    document.metadata = extraction.metadata;
    document.directives = extraction.directives;
    document.contentLinks = extraction.contentLinks;
    return document;
}

bool PolyglotService::IsPolyglot(const std::string& text) const {
    return md::MetadataExtractor::IsPolyglot(text);
}

std::string PolyglotService::Sanitize(const std::string& text) const {
    return md::Sanitizer::Sanitize(text);
}

transpile::TranspileResult PolyglotService::Transpile(const PolyglotDocument& document, transpile::Target target) const {
    return transpile::Transpilers::Transpile(target, document.artifacts, document.metadata, m_settings.transpile);
}

ExecutionResult PolyglotService::Execute(const PolyglotDocument& document) {
    std::cout << "[PolyglotService] Executing " << LanguageToString(document.language) << " document via "
              << execution::ExecutorKindToString(execution::ExecutorKindFor(document.language)) << std::endl;
    return execution::ExecuteDocument(document, *m_runner, m_settings);
}

ExecutionResult PolyglotService::ProcessDocument(const std::string& id) {
    if (!m_provider) {
        std::cerr << "[PolyglotService] No content provider configured" << std::endl;
        return ExecutionResult::Failure("none", {{"reason", "no_provider"}, {"id", id}});
    }

    const auto text = m_provider->getDocument(id);
    if (!text) {
        std::cerr << "[PolyglotService] Document not found: " << id << std::endl;
        return ExecutionResult::Failure("none", {{"reason", "not_found"}, {"id", id}});
    }

    auto result = Execute(Parse(*text));
    result.details["id"] = id;

    bool stored = false;
    if (m_sink) {
        try {
            stored = m_sink->storeResult(id, result);
            if (!stored) {
                std::cerr << "[PolyglotService] Result sink rejected " << id << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "[PolyglotService] Failed to store result for " << id << ": " << e.what() << std::endl;
        }
    }
    result.details["stored"] = stored;
    return result;
}

} // namespace polyglot::application
