#pragma once

#include <stdexcept>
#include <string>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace resilient_http {

/**
 * Base of every error the library throws.
 * A non-2xx response is not an error: it comes back as ApiResponse with success == false.
 */
class Error : public std::runtime_error {
public:
	enum class Kind { Config, Http, Internal };

	Error(Kind kind, const std::string& message)
		: std::runtime_error(prefix(kind) + message), kind_(kind), detail_(message) {}

	Kind kind() const { return kind_; }
	// Message without the "<Kind> error: " prefix
	const std::string& detail() const { return detail_; }

	static std::string prefix(Kind kind) {
		switch (kind) {
			case Kind::Config: return "Configuration error: ";
			case Kind::Http: return "HTTP error: ";
			case Kind::Internal: return "Internal error: ";
		}
		return "Error: ";
	}

private:
	Kind kind_;
	std::string detail_;
};

// Invalid client setup, e.g. a malformed configuration document
class ConfigError : public Error {
public:
	explicit ConfigError(const std::string& message) : Error(Kind::Config, message) {}
};

// Transport failure, undecodable 2xx body, or exhausted retries
class HttpError : public Error {
public:
	explicit HttpError(const std::string& message, CURLcode curlCode = CURLE_OK)
		: Error(Kind::Http, message), curlCode_(curlCode) {}

	CURLcode curlCode() const { return curlCode_; }
	bool timedOut() const { return curlCode_ == CURLE_OPERATION_TIMEDOUT; }

private:
	CURLcode curlCode_;
};

// Disallowed method or a broken internal invariant (closed gate, stopped client)
class InternalError : public Error {
public:
	explicit InternalError(const std::string& message) : Error(Kind::Internal, message) {}
};

} // namespace resilient_http
