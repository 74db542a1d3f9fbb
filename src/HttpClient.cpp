#include "HttpClient.hpp"
#include "Errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace resilient_http {

// HttpClientSettings implementation
const HttpClientSettings& HttpClientSettings::getDefault() {
	static HttpClientSettings defaultSettings;
	return defaultSettings;
}

void HttpClientSettings::applyCurlEasySettings(CURL* handle) const {
	curl_easy_setopt(handle, CURLOPT_CA_CACHE_TIMEOUT, 604800L);
	curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_NONE);
	curl_easy_setopt(handle, CURLOPT_FORBID_REUSE, 0L);
	curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 1L);
	curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
	curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(handle, CURLOPT_MAXCONNECTS, this->maxConnections);
	curl_easy_setopt(handle, CURLOPT_USE_SSL, CURLUSESSL_TRY);
}

void HttpClientSettings::applyCurlMultiSettings(CURLM* handle) const {
#if LIBCURL_VERSION_NUM >= 0x081000
	curl_multi_setopt(handle, CURLMOPT_NETWORK_CHANGED, CURLMNWC_CLEAR_CONNS | CURLMNWC_CLEAR_DNS);
#endif
	curl_multi_setopt(handle, CURLMOPT_MAX_HOST_CONNECTIONS, this->maxHostConnections);
	curl_multi_setopt(handle, CURLMOPT_MAX_TOTAL_CONNECTIONS, this->maxTotalConnections);
	curl_multi_setopt(handle, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
	curl_multi_setopt(handle, CURLMOPT_MAXCONNECTS, this->maxConnections);
}

static void ensure_curl_global() {
	static std::once_flag inited;

	std::call_once(inited, []() {
		auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) throw InternalError("curl_global_init failed");
		std::atexit([]{ curl_global_cleanup(); });
	});
}

// HttpTransfer implementation
HttpTransfer::HttpTransfer(HttpRequest request, RequestPolicy policy, const HttpClientSettings& settings) :
	request(std::move(request)), policy(std::move(policy)), settings_(settings) {

	ensure_curl_global();

	this->curlEasy = curl_easy_init();
	if (!this->curlEasy)
		throw InternalError("curl_easy_init failed");
	this->reset();
};

HttpTransfer::~HttpTransfer() {
	curl_easy_cleanup(this->curlEasy);
	curl_slist_free_all(this->headers_);
}

HttpTransfer::HttpTransfer(HttpTransfer&& other) noexcept
	: curlEasy(std::exchange(other.curlEasy, nullptr)),
	  headers_(std::exchange(other.headers_, nullptr)),
	  contentLength(other.contentLength),
	  request(std::move(other.request)),
	  response(std::move(other.response)),
	  policy(std::move(other.policy)),
	  settings_(other.settings_) {
	std::copy(std::begin(other.errorBuffer_), std::end(other.errorBuffer_), std::begin(this->errorBuffer_));
	if (curlEasy) {
		curl_easy_setopt(curlEasy, CURLOPT_WRITEDATA, this);
		curl_easy_setopt(curlEasy, CURLOPT_HEADERDATA, this);
		curl_easy_setopt(curlEasy, CURLOPT_ERRORBUFFER, this->errorBuffer_);
	}
}

HttpTransfer& HttpTransfer::operator=(HttpTransfer&& other) noexcept {
	if (this != &other) {
		// Clean up current resources
		curl_easy_cleanup(this->curlEasy);
		curl_slist_free_all(this->headers_);

		// Move from other
		this->curlEasy = std::exchange(other.curlEasy, nullptr);
		this->headers_ = std::exchange(other.headers_, nullptr);
		this->contentLength = other.contentLength;
		this->request = std::move(other.request);
		this->response = std::move(other.response);
		this->policy = std::move(other.policy);
		std::copy(std::begin(other.errorBuffer_), std::end(other.errorBuffer_), std::begin(this->errorBuffer_));
		// Note: settings_ is a reference, cannot be reassigned

		// Update callback data pointers to this
		if (this->curlEasy) {
			curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
			curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
			curl_easy_setopt(this->curlEasy, CURLOPT_ERRORBUFFER, this->errorBuffer_);
		}
	}
	return *this;
}

const HttpResponse& HttpTransfer::getResponse() const {
	return this->response;
}

HttpResponse HttpTransfer::detachResponse() {
	return std::move(this->response);
}

void HttpTransfer::finalize_transfer(CURLcode code) {
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &this->response.status);

	this->response.curlCode = code;
	if (code != CURLE_OK)
		this->response.error = this->errorBuffer_[0] ? std::string(this->errorBuffer_) : curl_easy_strerror(code);

	curl_off_t connect = 0, startTransfer = 0, total = 0, redir = 0;
	curl_easy_getinfo(this->curlEasy, CURLINFO_CONNECT_TIME_T, &connect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_STARTTRANSFER_TIME_T, &startTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_TOTAL_TIME_T, &total);
	curl_easy_getinfo(this->curlEasy, CURLINFO_REDIRECT_TIME_T, &redir);

	constexpr float us2s = 1e-6f;
	this->response.transferInfo.connect = connect * us2s;
	this->response.transferInfo.startTransfer = startTransfer * us2s;
	this->response.transferInfo.total = total * us2s;
	this->response.transferInfo.redir = redir * us2s;
}

void HttpTransfer::perform_blocking() {
	CURLcode code = curl_easy_perform(this->curlEasy);
	this->finalize_transfer(code);
}

void HttpTransfer::reset() {
	if(!this->curlEasy)
		this->curlEasy = curl_easy_init();
	else
		curl_easy_reset(this->curlEasy);

	this->response = HttpResponse();
	this->contentLength = 0;
	this->errorBuffer_[0] = '\0';

	this->settings_.applyCurlEasySettings(this->curlEasy);

	curl_easy_setopt(this->curlEasy, CURLOPT_URL, this->request.url.c_str());
	curl_easy_setopt(this->curlEasy, CURLOPT_ERRORBUFFER, this->errorBuffer_);
	if (this->policy.timeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_TIMEOUT_MS, static_cast<long>(this->policy.timeout * 1000));
	if (this->policy.connTimeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(this->policy.connTimeout * 1000));
	if (this->policy.lowSpeedLimit && this->policy.lowSpeedTime) {
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_TIME, static_cast<long>(this->policy.lowSpeedTime));
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(this->policy.lowSpeedLimit));
	}
	if (this->policy.curlBufferSize) {
		long buf_size = std::clamp(this->policy.curlBufferSize, 1024u, static_cast<unsigned int>(CURL_MAX_READ_SIZE));
		curl_easy_setopt(this->curlEasy, CURLOPT_BUFFERSIZE, buf_size);
	}

	if(this->headers_) {
		curl_slist_free_all(this->headers_);
		this->headers_ = nullptr;
	}
	for (const auto& header : this->request.headers) {
		this->headers_ = curl_slist_append(this->headers_, header.c_str());
	}
	curl_easy_setopt(this->curlEasy, CURLOPT_HTTPHEADER, this->headers_);

	switch (HttpRequest::method2Enum(this->request.methodName)) {
		case HttpRequest::HEAD: {
			curl_easy_setopt(this->curlEasy, CURLOPT_NOBODY, 1L);
			break;
		}
		case HttpRequest::GET: {
			curl_easy_setopt(this->curlEasy, CURLOPT_HTTPGET, 1L);
			break;
		}
		case HttpRequest::POST: {
			curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
			this->set_body();
			break;
		}
		default: {
			curl_easy_setopt(this->curlEasy, CURLOPT_CUSTOMREQUEST, util::toupper(this->request.methodName).c_str());
			if (this->request.body.size())
				this->set_body();
		}
	}

	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEFUNCTION, HttpTransfer::body_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERFUNCTION, HttpTransfer::header_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
}

// The transfer moves between queues before it runs, so libcurl gets its own copy of the body
void HttpTransfer::set_body() {
	curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE, static_cast<long>(this->request.body.size()));
	curl_easy_setopt(this->curlEasy, CURLOPT_COPYPOSTFIELDS, this->request.body.c_str());
}

size_t HttpTransfer::body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	if(transfer->contentLength > transfer->response.body.capacity())
		transfer->response.body.reserve(transfer->contentLength);

	transfer->response.body.append((char*)ptr, size * nmemb);
	return size * nmemb;
}

size_t HttpTransfer::header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv(static_cast<const char*>(ptr), len);

	if (!sv.empty() && sv.back() == '\n')
		sv.remove_suffix(1);
	if (!sv.empty() && sv.back() == '\r')
		sv.remove_suffix(1);

	if (sv.empty())
		return len;
	if (sv.rfind("HTTP/", 0) == 0) {
		// A new status line: redirect hop or interim response, keep only the last header block
		transfer->response.headers.clear();
		transfer->contentLength = 0;
		return len;
	}

	transfer->response.headers.emplace_back(sv);

	// Parse content-length for pre-allocation
	static const std::regex contentLengthRegex("^content-length:\\s*(\\d+)", std::regex::icase);
	std::match_results<std::string_view::const_iterator> match;
	if (std::regex_search(sv.begin(), sv.end(), match, contentLengthRegex)) {
		transfer->contentLength = std::strtoul(match[1].str().c_str(), nullptr, 10);
	}

	return len;
}

// HttpClient::TransferState implementation
HttpClient::TransferState::TransferState(std::shared_future<HttpResponse>&& future)
	: future(std::move(future)) {}

HttpClient::TransferState::State HttpClient::TransferState::get_state() const {
	return this->state.load(std::memory_order_acquire);
}

// HttpClient::TransferTask implementation
HttpClient::TransferTask::TransferTask(HttpRequest r, RequestPolicy p, ConcurrencyGate::Permit slot, HttpClient* client)
	: transfer(std::move(r), std::move(p), client->settings_),
	  state(std::shared_ptr<TransferState>(new TransferState(this->promise.get_future().share()))),
	  slot(std::move(slot)) {};

// HttpClient implementation
HttpClient& HttpClient::getDefault() {
	static HttpClient instance;
	return instance;
}

void HttpClient::stop() {
	if (!this->stop_.exchange(true)) {
		this->slots_->close();
		if (this->multi_)
			curl_multi_wakeup(this->multi_);
	}
}

void HttpClient::init() {
	ensure_curl_global();
	this->multi_ = curl_multi_init();
	if (!this->multi_)
		throw InternalError("curl_multi_init failed");
	this->settings_.applyCurlMultiSettings(this->multi_);
	this->worker_ = std::thread(&HttpClient::worker_loop, this);
}

HttpClient::HttpClient()
	: HttpClient(HttpClientSettings::getDefault()) {}

HttpClient::HttpClient(const HttpClientSettings& settings)
	: settings_(settings),
	  slots_(ConcurrencyGate::create(static_cast<size_t>(std::max(settings.maxConnections, 1L)))) {
	init();
}

HttpClient::~HttpClient() {
	this->stop();
	if (this->worker_.joinable())
		this->worker_.join();

	this->curl2Task.clear();
	this->transfers.clear();
	while (!this->requests.empty())
		this->requests.pop();
	curl_multi_cleanup(this->multi_);
}

HttpResponse HttpClient::request(HttpRequest request, RequestPolicy policy) {
	std::shared_ptr<TransferState> state = this->send_request(std::move(request), std::move(policy));

	return state->future.get();
}

HttpResponse HttpClient::perform(const HttpRequest& request, const RequestPolicy& policy) {
	return this->request(request, policy);
}

std::shared_ptr<HttpClient::TransferState> HttpClient::send_request(HttpRequest request, RequestPolicy policy) {
	if (this->stop_.load())
		throw InternalError("The HttpClient is stopped.");

	// Throws InternalError once stop() closed the slots
	ConcurrencyGate::Permit slot = this->slots_->acquire();

	TransferTask task(std::move(request), std::move(policy), std::move(slot), this);
	std::shared_ptr<TransferState> state = task.state;

	{
		std::unique_lock lk(this->mutex_);
		// stop() may have raced with the checks above, the worker would never pick this up
		if (this->drained_ || this->stop_.load())
			throw InternalError("The HttpClient is stopped.");
		this->requests.emplace(std::move(task));
	}
	curl_multi_wakeup(this->multi_);

	return state;
}

void HttpClient::fail_all(const std::string& reason) {
	std::unique_lock<std::mutex> lk(this->mutex_);
	this->drained_ = true;

	for (auto it = this->transfers.begin(); it != this->transfers.end(); ++it) {
		curl_multi_remove_handle(this->multi_, it->transfer.curlEasy);
		it->state->state.store(TransferState::State::Failed, std::memory_order_release);
		it->promise.set_exception(std::make_exception_ptr(InternalError(reason)));
	}
	this->curl2Task.clear();
	this->transfers.clear();

	while (!this->requests.empty()) {
		this->requests.front().state->state.store(TransferState::State::Failed, std::memory_order_release);
		this->requests.front().promise.set_exception(std::make_exception_ptr(InternalError(reason)));
		this->requests.pop();
	}
}

void HttpClient::worker_loop() {
	while (1) {
		int still_running = 0;
		CURLMcode mc;
		do {
			mc = curl_multi_perform(multi_, &still_running);
		} while (mc == CURLM_CALL_MULTI_PERFORM);

		// Harvest results
		CURLMsg* msg;
		do {
			int msgq = 0;
			msg = curl_multi_info_read(this->multi_, &msgq);
			if (msg && (msg->msg == CURLMSG_DONE)) {
				// msg does not survive curl_multi_remove_handle
				CURL* easy = msg->easy_handle;
				CURLcode curlCode = msg->data.result;
				curl_multi_remove_handle(this->multi_, easy);

				auto mit = this->curl2Task.find(easy);
				if (mit != this->curl2Task.end()) {
					auto it = mit->second;

					it->transfer.finalize_transfer(curlCode);
					it->state->state.store(curlCode == CURLE_OK ? TransferState::State::Completed
																: TransferState::State::Failed,
										   std::memory_order_release);
					it->promise.set_value(it->transfer.detachResponse());

					// Destroying the task gives its slot back
					this->curl2Task.erase(mit);
					this->transfers.erase(it);
				}
			}
		} while (msg);

		long t = -1;
		curl_multi_timeout(multi_, &t);

		int poll_timeout;
		if (t < 0)
			poll_timeout = this->settings_.pollMs;
		else if (t == 0)
			poll_timeout = 0;
		else
			poll_timeout = (int)std::min<long>(t, this->settings_.pollMs);

		curl_multi_poll(multi_, nullptr, 0, poll_timeout, NULL);

		// Handle stop
		if (this->stop_.load()) [[unlikely]] {
			this->fail_all("The HttpClient stopped while task in the pool.");

			// Exit the worker loop
			break;
		}

		// Add new request
		std::vector<TransferTask> pendingTasks;
		{
			std::unique_lock<std::mutex> lk(this->mutex_);

			pendingTasks.reserve(this->requests.size());
			while (!this->requests.empty()) {
				pendingTasks.emplace_back(std::move(this->requests.front()));
				this->requests.pop();
			}
		}

		for (auto&& task : pendingTasks) {
			this->transfers.emplace_back(std::move(task));
			auto it = std::prev(this->transfers.end());
			this->curl2Task[it->transfer.curlEasy] = it;
			it->state->state.store(TransferState::State::Ongoing, std::memory_order_release);

			curl_multi_add_handle(this->multi_, it->transfer.curlEasy);
		}
	}
}

} // namespace resilient_http
