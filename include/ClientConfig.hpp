#pragma once

#include "ConcurrencyGate.hpp"
#include "RetryPolicy.hpp"
#include "models.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

namespace resilient_http {

/**
 * Options of one RequestExecutor.
 *
 * A config is a plain value: per-call overrides are made by copying it,
 * changing the copy and building a transient executor from it
 * (RequestExecutor::withConfig), never by mutating a shared instance.
 */
struct ClientConfig {
	// Bounds one attempt, not the whole call. nullopt disables the limit
	std::optional<std::chrono::milliseconds> timeout = std::chrono::milliseconds(15000);

	// Retries after the first attempt: total attempts = retryCount + 1
	uint32_t retryCount = 2;

	// Logical requests in flight when no sharedGate is given (clamped to >= 1)
	size_t concurrencyLimit = 2;

	std::set<long> retryableStatuses{408, 413, 429, 500, 502, 503, 504};
	// Statuses for which a Retry-After directive takes priority over backoff
	std::set<long> retryAfterStatuses{413, 429, 503};

	std::optional<std::chrono::milliseconds> maxRetryAfter;
	std::optional<std::chrono::milliseconds> backoffLimit;

	bool retryOnTimeout = false;

	// Consulted on network failures; nullptr means always retry
	RetryPredicatePtr retryPredicate;

	std::set<HttpRequest::Method> allowedMethods{std::begin(HttpRequest::AllMethods), std::end(HttpRequest::AllMethods)};

	// Externally owned pool shared by several executors
	std::shared_ptr<ConcurrencyGate> sharedGate;

	bool deterministicMode = false;
	bool jitterDisabled = false;

	// Waits at or above this release the permit before sleeping
	std::chrono::milliseconds permitReleaseThreshold{2000};
	std::chrono::milliseconds reacquireTimeout{200};

	size_t snippetLimit = 1024;

	uint32_t maxAttempts() const {
		return retryCount == UINT32_MAX ? retryCount : retryCount + 1;
	}
	bool allows(HttpRequest::Method method) const {
		return allowedMethods.count(method) > 0;
	}

	static const ClientConfig& getDefault();

	/**
	 * Build a config from a JSON object, starting from the defaults.
	 * Keys: timeout_ms (null disables), retry, concurrency_limit,
	 * retryable_statuses, retry_after_statuses, max_retry_after_ms,
	 * backoff_limit_ms, retry_on_timeout, allowed_methods, deterministic_mode,
	 * jitter_disabled, permit_release_threshold_ms, reacquire_timeout_ms,
	 * snippet_limit.
	 * @throws ConfigError on wrong types, unknown methods or invalid statuses
	 */
	static ClientConfig fromJson(const nlohmann::json& document);
};

} // namespace resilient_http
