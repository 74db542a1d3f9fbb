#include "Diagnostics.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <vector>

namespace resilient_http {

DiagnosticsAccumulator::DiagnosticsAccumulator(size_t snippetLimit) : snippetLimit_(snippetLimit) {}

std::string DiagnosticsAccumulator::snippet(const std::string& body, size_t limit) {
	if (body.size() <= limit)
		return body;
	return body.substr(0, limit) + "...[truncated]";
}

void DiagnosticsAccumulator::record(const HttpResponse& response) {
	++this->attempts_;

	if (!response.completed()) {
		this->recordError(HttpError(response.error.empty() ? curl_easy_strerror(response.curlCode) : response.error,
									response.curlCode).what());
		return;
	}
	if (response.success())
		return;

	this->lastStatus_ = response.status;
	this->lastBodySnippet_ = snippet(response.body, this->snippetLimit_);
	this->lastError_ = HttpError("Status: " + std::to_string(response.status)).what();
}

void DiagnosticsAccumulator::recordError(const std::string& error) {
	this->lastError_ = error;
}

static std::string quoted(std::string value) {
	std::replace(value.begin(), value.end(), '"', '\'');
	return "\"" + value + "\"";
}

std::string DiagnosticsAccumulator::compose() const {
	std::vector<std::string> parts;
	if (this->lastStatus_)
		parts.push_back("status=" + std::to_string(*this->lastStatus_));
	if (this->lastBodySnippet_)
		parts.push_back("body=" + quoted(*this->lastBodySnippet_));
	parts.push_back("attempts=" + std::to_string(this->attempts_));
	if (this->lastError_)
		parts.push_back("last_err=" + quoted(*this->lastError_));

	std::string out;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i)
			out += ", ";
		out += parts[i];
	}
	return out;
}

} // namespace resilient_http
