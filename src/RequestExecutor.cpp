#include "RequestExecutor.hpp"
#include "BackoffPolicy.hpp"
#include "HttpClient.hpp"
#include "ResponseClassifier.hpp"
#include "utils.hpp"

#include <thread>

namespace resilient_http {

RequestExecutor::RequestExecutor(Logger logger, ClientConfig config, std::shared_ptr<Transport> transport)
	: logger_(std::move(logger)), config_(std::move(config)), transport_(std::move(transport)) {
	if (!this->transport_) {
		// The default client lives until exit, do not take ownership of it
		this->transport_ = std::shared_ptr<Transport>(&HttpClient::getDefault(), [](Transport*) {});
	}
	this->gate_ = this->config_.sharedGate ? this->config_.sharedGate
										   : ConcurrencyGate::create(this->config_.concurrencyLimit);
}

RequestExecutor RequestExecutor::withConfig(ClientConfig config) const {
	return RequestExecutor(this->logger_, std::move(config), this->transport_);
}

HttpRequest RequestExecutor::buildRequest(const std::string& methodName, const std::string& url,
										  const Headers& headers, const Body& body) const {
	HttpRequest request;
	request.url = url;
	request.methodName = methodName;
	request.headers = headers;
	if (body) {
		request.body = body->dump();
		if (!util::hasHeader(request.headers, "content-type"))
			request.headers.emplace_back("Content-Type: application/json");
	}
	return request;
}

RequestPolicy RequestExecutor::buildPolicy() const {
	RequestPolicy policy;
	if (this->config_.timeout)
		policy.timeout = std::chrono::duration<float>(*this->config_.timeout).count();
	return policy;
}

void RequestExecutor::sleepWithPermitPolicy(PermitSlot& permit, std::chrono::milliseconds delay,
											const std::string& url) const {
	if (delay < this->config_.permitReleaseThreshold) {
		std::this_thread::sleep_for(delay);
		return;
	}

	// Long wait: let other calls use the slot meanwhile
	if (permit) {
		permit->release();
		permit.reset();
	}
	std::this_thread::sleep_for(delay);

	permit = this->gate_->tryAcquireFor(this->config_.reacquireTimeout);
	if (!permit)
		this->logger_.warn("Proceeding without concurrency permit",
						   {{"url", url}, {"reacquire_timeout_ms", this->config_.reacquireTimeout.count()}});
}

HttpResponse RequestExecutor::execute(const std::string& methodName, const std::string& url, const Headers& headers,
									  const Body& body) const {
	const std::string upperName = util::toupper(methodName);
	const HttpRequest::Method method = HttpRequest::method2Enum(upperName);
	if (method == HttpRequest::OTHER || !this->config_.allows(method)) {
		this->logger_.error("Method not allowed", {{"method", upperName}, {"url", url}});
		throw InternalError("Method " + upperName + " not allowed");
	}

	this->logger_.info("Request start", {{"method", upperName}, {"url", url}});

	const HttpRequest request = this->buildRequest(upperName, url, headers, body);
	const RequestPolicy policy = this->buildPolicy();

	PermitSlot permit(this->gate_->acquire());

	const BackoffPolicy backoff(this->config_);
	const ResponseClassifier classifier(this->config_, backoff);
	std::mt19937_64 rng = BackoffPolicy::makeGenerator(this->config_.deterministicMode);
	DiagnosticsAccumulator diagnostics(this->config_.snippetLimit);

	const uint32_t maxAttempts = this->config_.maxAttempts();
	bool extensionUsed = false;

	for (uint32_t attempt = 1;; ++attempt) {
		if (attempt > 1)
			this->logger_.info("Retry attempt", {{"url", url}, {"attempt", attempt}});

		HttpResponse response = this->transport_->perform(request, policy);
		diagnostics.record(response);

		if (!response.completed()) {
			this->logger_.error("Network failure",
								{{"url", url}, {"attempt", attempt}, {"error", response.error}});
		}

		auto decision = classifier.classify(response, method, attempt, maxAttempts, !extensionUsed, rng);
		this->logger_.debug("Attempt classified", {{"url", url},
												   {"attempt", attempt},
												   {"status", response.status},
												   {"elapsed_s", response.transferInfo.total},
												   {"action", ResponseClassifier::actionName(decision.action)}});

		switch (decision.action) {
			case ResponseClassifier::Action::Accept:
			case ResponseClassifier::Action::ReturnResponse: {
				permit.reset();
				return response;
			}
			case ResponseClassifier::Action::RetryAfterServer: {
				this->logger_.info("Respecting Retry-After header", {{"url", url},
																	 {"retry_after_ms", decision.delay.count()},
																	 {"final_extension", decision.extendsBudget}});
				if (decision.extendsBudget)
					extensionUsed = true;
				this->sleepWithPermitPolicy(permit, decision.delay, url);
				break;
			}
			case ResponseClassifier::Action::RetryWithBackoff: {
				this->sleepWithPermitPolicy(permit, decision.delay, url);
				break;
			}
			case ResponseClassifier::Action::FailImmediately: {
				throw HttpError(response.error.empty() ? curl_easy_strerror(response.curlCode) : response.error,
								response.curlCode);
			}
			case ResponseClassifier::Action::FailExhausted: {
				throw HttpError(diagnostics.compose(), response.curlCode);
			}
		}
	}
}

} // namespace resilient_http
