#include "ResponseClassifier.hpp"
#include "Errors.hpp"
#include "RetryAfter.hpp"

namespace resilient_http {

ResponseClassifier::ResponseClassifier(const ClientConfig& config, const BackoffPolicy& backoff)
	: config_(config), backoff_(backoff) {}

const char* ResponseClassifier::actionName(Action action) {
	switch (action) {
		case Action::Accept: return "accept";
		case Action::RetryAfterServer: return "retry_after_server";
		case Action::RetryWithBackoff: return "retry_with_backoff";
		case Action::ReturnResponse: return "return_response";
		case Action::FailImmediately: return "fail_immediately";
		case Action::FailExhausted: return "fail_exhausted";
	}
	return "unknown";
}

ResponseClassifier::Decision ResponseClassifier::classify(const HttpResponse& response, HttpRequest::Method method,
														  uint32_t attempt, uint32_t maxAttempts,
														  bool extensionAvailable, std::mt19937_64& rng) const {
	if (!response.completed())
		return this->classifyNetworkFailure(response, attempt, maxAttempts, rng);
	if (response.success())
		return Decision{Action::Accept};
	return this->classifyStatus(response, method, attempt, maxAttempts, extensionAvailable, rng);
}

ResponseClassifier::Decision ResponseClassifier::classifyStatus(const HttpResponse& response,
																HttpRequest::Method method, uint32_t attempt,
																uint32_t maxAttempts, bool extensionAvailable,
																std::mt19937_64& rng) const {
	const bool attemptsRemain = attempt < maxAttempts;

	// An explicit server wait wins over computed backoff, even on the last configured attempt
	if (this->config_.retryAfterStatuses.count(response.status)) {
		if (auto retryAfter = retry_after::parse(response.headers)) {
			auto delay = this->backoff_.capServerDelay(*retryAfter);
			if (attemptsRemain)
				return Decision{Action::RetryAfterServer, delay, false};
			if (extensionAvailable)
				return Decision{Action::RetryAfterServer, delay, true};
			return Decision{Action::ReturnResponse};
		}
	}

	// Every allowed method is treated as idempotent at the call sites
	const bool retryEligible = this->config_.allows(method);
	if (this->config_.retryableStatuses.count(response.status) && retryEligible && attemptsRemain)
		return Decision{Action::RetryWithBackoff, this->backoff_.compute(attempt, rng)};

	return Decision{Action::ReturnResponse};
}

ResponseClassifier::Decision ResponseClassifier::classifyNetworkFailure(const HttpResponse& response,
																		uint32_t attempt, uint32_t maxAttempts,
																		std::mt19937_64& rng) const {
	if (response.timedOut() && !this->config_.retryOnTimeout)
		return Decision{Action::FailImmediately};

	bool retry = true;
	if (this->config_.retryPredicate) {
		HttpError error(response.error.empty() ? curl_easy_strerror(response.curlCode) : response.error,
						response.curlCode);
		retry = this->config_.retryPredicate->shouldRetry(nullptr, error, attempt);
	}

	if (retry && attempt < maxAttempts)
		return Decision{Action::RetryWithBackoff, this->backoff_.compute(attempt, rng)};
	return Decision{Action::FailExhausted};
}

} // namespace resilient_http
