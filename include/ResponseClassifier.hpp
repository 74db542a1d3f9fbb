#pragma once

#include "BackoffPolicy.hpp"
#include "ClientConfig.hpp"
#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <random>

namespace resilient_http {

/**
 * Decides what follows a completed attempt.
 *
 * Accept            2xx, the caller decodes the body
 * RetryAfterServer  a Retry-After directive on a retryAfterStatuses response; extendsBudget is
 *                   set when the configured attempts are used up and the one extra attempt is granted
 * RetryWithBackoff  retryable status or retryable network failure with attempts left
 * ReturnResponse    non-2xx that ends the call without an error
 * FailImmediately   timeout while retryOnTimeout is off
 * FailExhausted     network failure that is not retried any more
 */
class ResponseClassifier {
public:
	enum class Action { Accept, RetryAfterServer, RetryWithBackoff, ReturnResponse, FailImmediately, FailExhausted };

	struct Decision {
		Action action = Action::ReturnResponse;
		std::chrono::milliseconds delay{0};
		bool extendsBudget = false;
	};

	ResponseClassifier(const ClientConfig& config, const BackoffPolicy& backoff);

	/**
	 * @param attempt            1-based number of the attempt that produced response
	 * @param maxAttempts        configured attempts (retryCount + 1)
	 * @param extensionAvailable whether the final Retry-After extension is still unused
	 */
	Decision classify(const HttpResponse& response, HttpRequest::Method method, uint32_t attempt,
					  uint32_t maxAttempts, bool extensionAvailable, std::mt19937_64& rng) const;

	static const char* actionName(Action action);

private:
	Decision classifyStatus(const HttpResponse& response, HttpRequest::Method method, uint32_t attempt,
							uint32_t maxAttempts, bool extensionAvailable, std::mt19937_64& rng) const;
	Decision classifyNetworkFailure(const HttpResponse& response, uint32_t attempt, uint32_t maxAttempts,
									std::mt19937_64& rng) const;

	const ClientConfig& config_;
	const BackoffPolicy& backoff_;
};

} // namespace resilient_http
