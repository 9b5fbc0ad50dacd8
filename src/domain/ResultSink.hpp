/**
 * @file ResultSink.hpp
 * @brief Interface for storing execution results.
 */

#pragma once
#include <string>
#include "domain/ExecutionResult.hpp"

namespace polyglot::domain {

class ResultSink {
public:
    virtual ~ResultSink() = default;

    /**
     * @brief Stores the result under the document id.
     * @return False if the result could not be accepted.
     */
    virtual bool storeResult(const std::string& id, const ExecutionResult& result) = 0;
};

} // namespace polyglot::domain
