#pragma once

#include "Errors.hpp"
#include "models.hpp"

#include <cstdint>
#include <memory>

namespace resilient_http {

/**
 * Strategy consulted when an attempt fails at the network level
 * (connection refused, DNS failure, reset, retryable timeout).
 *
 * response is the attempt's response if one was received, nullptr otherwise.
 * attempt is 1-based. Implementations may be shared between executors and
 * threads, so shouldRetry must be safe to call concurrently.
 */
class RetryPredicate {
public:
    virtual ~RetryPredicate() = default;

    virtual bool shouldRetry(const HttpResponse* response, const HttpError& error, uint32_t attempt) const = 0;
};

using RetryPredicatePtr = std::shared_ptr<const RetryPredicate>;

} // namespace resilient_http
