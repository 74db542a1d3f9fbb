#pragma once

#include "models.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace resilient_http {

/**
 * Diagnostic state carried across the attempts of one logical call.
 * Only used to build the error message when every attempt failed.
 */
class DiagnosticsAccumulator {
public:
	static constexpr size_t DefaultSnippetLimit = 1024;

	explicit DiagnosticsAccumulator(size_t snippetLimit = DefaultSnippetLimit);

	// Count one attempt and remember its status / body snippet or its network error
	void record(const HttpResponse& response);
	void recordError(const std::string& error);

	uint32_t attempts() const { return attempts_; }
	std::optional<long> lastStatus() const { return lastStatus_; }
	const std::optional<std::string>& lastBodySnippet() const { return lastBodySnippet_; }
	const std::optional<std::string>& lastError() const { return lastError_; }

	// e.g. status=503, body="busy", attempts=3, last_err="HTTP error: Status: 503"
	std::string compose() const;

	// Body truncated to limit bytes, marked with "...[truncated]"
	static std::string snippet(const std::string& body, size_t limit);

private:
	size_t snippetLimit_;
	uint32_t attempts_ = 0;
	std::optional<long> lastStatus_;
	std::optional<std::string> lastBodySnippet_;
	std::optional<std::string> lastError_;
};

} // namespace resilient_http
