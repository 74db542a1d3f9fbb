#pragma once

#include "ConcurrencyGate.hpp"
#include "Transport.hpp"
#include "models.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace resilient_http {

struct HttpClientSettings {
	long maxConnections = 8;		// simultaneous transfers, also the connection cache size
	long maxHostConnections = 0;	// 0 means unlimited
	long maxTotalConnections = 0;	// 0 means unlimited
	int pollMs = 100;				// worker wake-up interval when curl has no timeout for us

	static const HttpClientSettings& getDefault();

	void applyCurlEasySettings(CURL* handle) const;
	void applyCurlMultiSettings(CURLM* handle) const;
};

class HttpTransfer {
public:
	explicit HttpTransfer(HttpRequest request, RequestPolicy policy = RequestPolicy(),
						  const HttpClientSettings& settings = HttpClientSettings::getDefault());
	~HttpTransfer();

	// Moveable, Not copyable
	HttpTransfer(const HttpTransfer&) = delete;
	HttpTransfer& operator=(const HttpTransfer&) = delete;
	HttpTransfer(HttpTransfer&& other) noexcept;
	HttpTransfer& operator=(HttpTransfer&& other) noexcept;

	const HttpResponse& getResponse() const;
	HttpResponse detachResponse();
	void finalize_transfer(CURLcode code);
	void perform_blocking();

private:
	friend class HttpClient;

	void reset();
	void set_body();

	CURL* curlEasy = nullptr;
	struct curl_slist* headers_ = nullptr;
	size_t contentLength = 0;
	char errorBuffer_[CURL_ERROR_SIZE] = {0};

	HttpRequest request;
	HttpResponse response;
	RequestPolicy policy;
	const HttpClientSettings& settings_;

	static size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data);
};

/**
 * libcurl multi-handle transport.
 *
 * One worker thread drives every transfer; callers wait on a shared future.
 * The number of simultaneous transfers is bounded by settings.maxConnections.
 */
class HttpClient : public Transport {
public:
	class TransferState {
	public:
		enum State { Pending, Ongoing, Completed, Failed };
		std::shared_future<HttpResponse> future;

		State get_state() const;

	private:
		std::atomic<State> state = State::Pending;

		explicit TransferState(std::shared_future<HttpResponse>&& future);

		friend class HttpClient;
	};

	static HttpClient& getDefault();

	HttpClient();
	explicit HttpClient(const HttpClientSettings& settings);
	~HttpClient() override;

	HttpClient(const HttpClient&) = delete;
	HttpClient& operator=(const HttpClient&) = delete;

	void stop();

	HttpResponse request(HttpRequest request, RequestPolicy policy = RequestPolicy());
	std::shared_ptr<TransferState> send_request(HttpRequest request, RequestPolicy policy = RequestPolicy());

	HttpResponse perform(const HttpRequest& request, const RequestPolicy& policy) override;

private:
	void init();
	void worker_loop();
	void fail_all(const std::string& reason);

	class TransferTask {
	private:
		HttpTransfer transfer;
		std::promise<HttpResponse> promise;
		std::shared_ptr<TransferState> state;
		ConcurrencyGate::Permit slot;

		explicit TransferTask(HttpRequest r, RequestPolicy p, ConcurrencyGate::Permit slot, HttpClient* client);

		friend class HttpClient;
	};

	using TaskIter = std::list<TransferTask>::iterator;

	const HttpClientSettings settings_;

	std::thread worker_;

	std::queue<TransferTask> requests;
	std::list<TransferTask> transfers;
	std::map<CURL*, TaskIter> curl2Task;

	CURLM* multi_ = nullptr;

	std::atomic<bool> stop_{false};
	bool drained_ = false; // guarded by mutex_, set once the worker failed the queue for good
	std::mutex mutex_;
	std::shared_ptr<ConcurrencyGate> slots_;
};

} // namespace resilient_http
