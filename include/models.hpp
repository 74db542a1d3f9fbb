#pragma once

#include "utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace resilient_http {

struct RequestPolicy {
	float timeout = 0;		// optional per-attempt timeout in seconds (<=0 means wait indefinitely)
	float connTimeout = 0;	// optional connection (DNS + handshake) timeout in seconds (<=0 means default 300 second)

	uint32_t lowSpeedLimit = 0;	// in bytes
	uint32_t lowSpeedTime = 0;	// in seconds

	uint32_t curlBufferSize = CURL_MAX_WRITE_SIZE; // in bytes
};

// Fuck you, <winnt.h>
#ifdef _WIN32
#ifdef DELETE
#undef DELETE
#endif
#endif

struct HttpRequest {
public:
#define HTTP_METHODS                                                                                                   \
	HTTP_METHOD(GET)                                                                                                   \
	HTTP_METHOD(POST)                                                                                                  \
	HTTP_METHOD(HEAD)                                                                                                  \
	HTTP_METHOD(PATCH)                                                                                                 \
	HTTP_METHOD(PUT)                                                                                                   \
	HTTP_METHOD(DELETE)                                                                                                \
	HTTP_METHOD(OPTIONS)                                                                                               \
	HTTP_METHOD(TRACE)

	enum Method : uint8_t {
#define HTTP_METHOD(methodName) methodName,
		HTTP_METHODS
#undef HTTP_METHOD
			OTHER = 255
	};
	static constexpr std::string_view MethodStr[] = {
#define HTTP_METHOD(methodName) #methodName,
		HTTP_METHODS
#undef HTTP_METHOD
	};
	static constexpr Method AllMethods[] = {
#define HTTP_METHOD(methodName) Method::methodName,
		HTTP_METHODS
#undef HTTP_METHOD
	};
	static Method method2Enum(const std::string& methodName) {
#define HTTP_METHOD(name)                                                                                              \
	if (util::toupper(methodName) == #name) {                                                                          \
		return Method::name;                                                                                           \
	}
		HTTP_METHODS
#undef HTTP_METHOD

		return Method::OTHER;
	};
	static std::string_view method2Str(Method method) {
		return method == Method::OTHER ? std::string_view("OTHER") : MethodStr[method];
	}

	std::string url;
	std::string methodName;
	std::vector<std::string> headers; // e.g. "Content-Type: application/json"
	std::string body;				  // request body, empty for none
};

struct TransferInfo {
	// In second, measured from the start of the attempt
	float connect = 0, startTransfer = 0, total = 0, redir = 0;
};

/**
 * Result of a single attempt.
 * A network-level failure leaves status at 0 and reports the cause in curlCode / error.
 */
struct HttpResponse {
	long status = 0;

	std::vector<std::string> headers; // final response only, e.g. "Retry-After: 3"
	std::string body;
	std::string error; // non-empty on network error
	CURLcode curlCode = CURLE_OK;

	TransferInfo transferInfo;

	bool completed() const { return curlCode == CURLE_OK; }
	bool timedOut() const { return curlCode == CURLE_OPERATION_TIMEDOUT; }
	bool success() const { return completed() && status >= 200 && status < 300; }
};

/**
 * Outcome of a logical call that reached the server.
 * success == false still means the call completed: the status and a bounded
 * snippet of the body are kept for the caller to interpret.
 */
template <typename T>
struct ApiResponse {
	std::optional<T> data;				  // parsed body on 2xx
	std::optional<std::string> errorBody; // body snippet on non-2xx, absent when the body was empty
	long status = 0;
	bool success = false;
	std::vector<std::string> headers;
};

} // namespace resilient_http
