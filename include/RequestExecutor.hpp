#pragma once

#include "ClientConfig.hpp"
#include "ConcurrencyGate.hpp"
#include "Diagnostics.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Transport.hpp"
#include "models.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace resilient_http {

/**
 * Retrying JSON-over-HTTP client.
 *
 * Each logical call takes one permit from the gate, then runs attempts through
 * the transport until the response is accepted, returned as a non-2xx outcome,
 * or the retry budget runs out. Waits between attempts come from the server's
 * Retry-After directive or from the backoff policy; long waits give the permit
 * back for their duration.
 *
 * One executor may be used from many threads at once.
 */
class RequestExecutor {
public:
	using Headers = std::vector<std::string>; // "Name: value" lines
	using Body = std::optional<nlohmann::json>;

	// A null transport means the process wide HttpClient::getDefault()
	explicit RequestExecutor(Logger logger, ClientConfig config = ClientConfig::getDefault(),
							 std::shared_ptr<Transport> transport = nullptr);

	/**
	 * Run the attempt loop and return the final response.
	 * A non-2xx response is returned, not thrown.
	 * @throws InternalError if the method is not allowed or the gate was closed
	 * @throws HttpError on a network failure that is not retried any more
	 */
	HttpResponse execute(const std::string& methodName, const std::string& url, const Headers& headers = {},
						 const Body& body = std::nullopt) const;
	HttpResponse execute(HttpRequest::Method method, const std::string& url, const Headers& headers = {},
						 const Body& body = std::nullopt) const {
		return this->execute(std::string(HttpRequest::method2Str(method)), url, headers, body);
	}

	/**
	 * execute() and decode a 2xx body into T.
	 * @throws HttpError("JSON decode: ...") when a 2xx body does not decode, never retried
	 */
	template <typename T>
	ApiResponse<T> request(HttpRequest::Method method, const std::string& url, const Headers& headers = {},
						   const Body& body = std::nullopt) const {
		return this->decode<T>(this->execute(method, url, headers, body), false);
	}

	template <typename T>
	ApiResponse<T> get(const std::string& url, const Headers& headers = {}) const {
		return this->request<T>(HttpRequest::GET, url, headers);
	}
	template <typename T>
	ApiResponse<T> post(const std::string& url, const Body& body, const Headers& headers = {}) const {
		return this->request<T>(HttpRequest::POST, url, headers, body);
	}
	template <typename T>
	ApiResponse<T> put(const std::string& url, const Body& body, const Headers& headers = {}) const {
		return this->request<T>(HttpRequest::PUT, url, headers, body);
	}
	template <typename T>
	ApiResponse<T> patch(const std::string& url, const Body& body, const Headers& headers = {}) const {
		return this->request<T>(HttpRequest::PATCH, url, headers, body);
	}
	template <typename T>
	ApiResponse<T> del(const std::string& url, const Headers& headers = {}) const {
		return this->request<T>(HttpRequest::DELETE, url, headers);
	}
	template <typename T>
	ApiResponse<T> options(const std::string& url, const Headers& headers = {}) const {
		return this->request<T>(HttpRequest::OPTIONS, url, headers);
	}
	template <typename T>
	ApiResponse<T> trace(const std::string& url, const Headers& headers = {}) const {
		return this->request<T>(HttpRequest::TRACE, url, headers);
	}

	// HEAD responses carry no body: data is JSON null on an empty 2xx
	ApiResponse<nlohmann::json> head(const std::string& url, const Headers& headers = {}) const {
		return this->decode<nlohmann::json>(this->execute(HttpRequest::HEAD, url, headers), true);
	}

	// Transient executor with other options, sharing transport and logger
	RequestExecutor withConfig(ClientConfig config) const;

	const ClientConfig& config() const { return config_; }
	const std::shared_ptr<ConcurrencyGate>& gate() const { return gate_; }
	const Logger& logger() const { return logger_; }

private:
	using PermitSlot = std::optional<ConcurrencyGate::Permit>;

	HttpRequest buildRequest(const std::string& methodName, const std::string& url, const Headers& headers,
							 const Body& body) const;
	RequestPolicy buildPolicy() const;

	void sleepWithPermitPolicy(PermitSlot& permit, std::chrono::milliseconds delay, const std::string& url) const;

	template <typename T>
	ApiResponse<T> decode(HttpResponse response, bool emptyBodyIsNull) const {
		ApiResponse<T> result;
		result.status = response.status;
		result.headers = std::move(response.headers);

		if (!response.success()) {
			if (!response.body.empty())
				result.errorBody = DiagnosticsAccumulator::snippet(response.body, this->config_.snippetLimit);
			return result;
		}

		try {
			if (emptyBodyIsNull && response.body.empty())
				result.data = nlohmann::json(nullptr).template get<T>();
			else
				result.data = nlohmann::json::parse(response.body).template get<T>();
		} catch (const nlohmann::json::exception& e) {
			this->logger_.error("Response decode failure", {{"status", response.status}, {"error", e.what()}});
			throw HttpError(std::string("JSON decode: ") + e.what());
		}
		result.success = true;
		return result;
	}

	Logger logger_;
	ClientConfig config_;
	std::shared_ptr<Transport> transport_;
	std::shared_ptr<ConcurrencyGate> gate_;
};

} // namespace resilient_http
