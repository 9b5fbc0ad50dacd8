/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/PolyglotService.hpp"
#include "domain/ContentProvider.hpp"
#include "domain/ProcessRunner.hpp"
#include "domain/ResultSink.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace polyglot::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::ProcessRunner> processRunner;
    std::shared_ptr<domain::ContentProvider> contentProvider;
    std::shared_ptr<domain::ResultSink> resultSink;
    std::unique_ptr<PolyglotService> polyglotService;
};

} // namespace polyglot::application
