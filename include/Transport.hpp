#pragma once

#include "models.hpp"

namespace resilient_http {

/**
 * Issues exactly one HTTP attempt.
 *
 * The response body is read completely before perform returns. Network-level
 * failures (DNS, connect, reset, timeout) are reported through
 * HttpResponse::curlCode and HttpResponse::error, not thrown.
 */
class Transport {
public:
	virtual ~Transport() = default;

	virtual HttpResponse perform(const HttpRequest& request, const RequestPolicy& policy) = 0;
};

} // namespace resilient_http
