#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace resilient_http {

struct ClientConfig;

/**
 * Exponential backoff with optional jitter and caps.
 *
 * base  = 300ms * 2^(attempt - 1), capped by backoffLimit
 * delay = min(base + jitter, maxRetryAfter, backoffLimit)
 * jitter is uniform in [0, max(1, base / 10)] ms, narrowed to [0, 5] ms in deterministic mode.
 */
class BackoffPolicy {
public:
	static constexpr std::chrono::milliseconds BaseDelay{300};
	static constexpr uint64_t DeterministicSeed = 0xC0FFEE;
	static constexpr uint64_t DeterministicJitterMax = 5; // ms

	explicit BackoffPolicy(const ClientConfig& config);
	BackoffPolicy(std::optional<std::chrono::milliseconds> backoffLimit,
				  std::optional<std::chrono::milliseconds> maxRetryAfter,
				  bool jitterDisabled = false, bool deterministic = false);

	// Delay before jitter, attempt is 1-based
	std::chrono::milliseconds baseDelay(uint32_t attempt) const;

	// Delay to wait after the given failed attempt (1-based)
	std::chrono::milliseconds compute(uint32_t attempt, std::mt19937_64& rng) const;

	// Apply maxRetryAfter then backoffLimit to a server supplied wait
	std::chrono::milliseconds capServerDelay(std::chrono::milliseconds delay) const;

	// Per-call generator: fixed seed in deterministic mode, entropy otherwise
	static std::mt19937_64 makeGenerator(bool deterministic);

private:
	std::optional<std::chrono::milliseconds> backoffLimit_;
	std::optional<std::chrono::milliseconds> maxRetryAfter_;
	bool jitterDisabled_;
	bool deterministic_;
};

} // namespace resilient_http
