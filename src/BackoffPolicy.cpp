#include "BackoffPolicy.hpp"
#include "ClientConfig.hpp"
#include "utils.hpp"

#include <algorithm>
#include <limits>

namespace resilient_http {

// Keeps base * 2^n far from overflowing int64 milliseconds
constexpr uint32_t MAX_DOUBLINGS = 40;

BackoffPolicy::BackoffPolicy(const ClientConfig& config)
	: BackoffPolicy(config.backoffLimit, config.maxRetryAfter, config.jitterDisabled, config.deterministicMode) {}

BackoffPolicy::BackoffPolicy(std::optional<std::chrono::milliseconds> backoffLimit,
							 std::optional<std::chrono::milliseconds> maxRetryAfter,
							 bool jitterDisabled, bool deterministic)
	: backoffLimit_(backoffLimit), maxRetryAfter_(maxRetryAfter),
	  jitterDisabled_(jitterDisabled), deterministic_(deterministic) {}

std::chrono::milliseconds BackoffPolicy::baseDelay(uint32_t attempt) const {
	uint32_t doublings = std::min(attempt > 0 ? attempt - 1 : 0, MAX_DOUBLINGS);
	std::chrono::milliseconds delay(BaseDelay.count() << doublings);

	if (this->backoffLimit_ && delay > *this->backoffLimit_)
		delay = *this->backoffLimit_;
	return delay;
}

std::chrono::milliseconds BackoffPolicy::compute(uint32_t attempt, std::mt19937_64& rng) const {
	const uint64_t base = static_cast<uint64_t>(this->baseDelay(attempt).count());

	uint64_t jitter = 0;
	if (!this->jitterDisabled_) {
		uint64_t jitterMax = std::max<uint64_t>(base / 10, 1);
		if (this->deterministic_)
			jitterMax = std::min(jitterMax, DeterministicJitterMax);
		std::uniform_int_distribution<uint64_t> dist(0, jitterMax);
		jitter = dist(rng);
	}

	std::chrono::milliseconds candidate(static_cast<int64_t>(base + jitter));
	if (this->maxRetryAfter_ && candidate > *this->maxRetryAfter_)
		candidate = *this->maxRetryAfter_;
	if (this->backoffLimit_ && candidate > *this->backoffLimit_)
		candidate = *this->backoffLimit_;
	return candidate;
}

std::chrono::milliseconds BackoffPolicy::capServerDelay(std::chrono::milliseconds delay) const {
	if (this->maxRetryAfter_ && delay > *this->maxRetryAfter_)
		delay = *this->maxRetryAfter_;
	if (this->backoffLimit_ && delay > *this->backoffLimit_)
		delay = *this->backoffLimit_;
	return delay;
}

std::mt19937_64 BackoffPolicy::makeGenerator(bool deterministic) {
	if (deterministic)
		return std::mt19937_64(DeterministicSeed);
	return util::entropy_generator();
}

} // namespace resilient_http
