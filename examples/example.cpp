#include "HttpClient.hpp"
#include "RequestExecutor.hpp"
#include "RetryStrategies.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using resilient_http::ApiResponse;
using resilient_http::ClientConfig;
using resilient_http::HttpRequest;
using resilient_http::Logger;
using resilient_http::RequestExecutor;

template <typename T>
void printResponse(const ApiResponse<T>& response) {
	std::cout << "Status: " << response.status << std::endl;
	std::cout << "Success: " << std::boolalpha << response.success << std::endl;
	std::cout << "Headers:" << std::endl;
	for (const auto& h : response.headers) {
		std::cout << "  " << h << std::endl;
	}
	if (response.data)
		std::cout << "Data: " << std::endl << nlohmann::json(*response.data).dump(2) << std::endl;
	if (response.errorBody)
		std::cout << "Error body: " << std::endl << *response.errorBody << std::endl;
};

void testGET(const RequestExecutor& executor) {
	std::cout << "GET request..." << std::endl;

	auto response = executor.get<nlohmann::json>("https://httpbin.org/get", {"Accept: application/json"});
	printResponse(response);
}

void testPOST(const RequestExecutor& executor) {
	std::cout << "POST request..." << std::endl;

	// JSON body to send, Content-Type is added by the executor
	nlohmann::json body = {{"name", "test"}, {"value", "123"}};

	auto response = executor.post<nlohmann::json>("https://httpbin.org/post", body);
	printResponse(response);
}

// Global mutex for protecting cout in multi-threaded tests
std::mutex cout_mutex;

void testConcurrent(const RequestExecutor& executor) {
	std::cout << "\n========================================" << std::endl;
	std::cout << "Concurrent Requests through one gate..." << std::endl;
	std::cout << "========================================" << std::endl;

	const int numRequests = 5;

	std::cout << "\nLaunching " << numRequests << " requests with concurrency limit "
			  << executor.gate()->limit() << "..." << std::endl;

	auto startTime = std::chrono::high_resolution_clock::now();

	std::vector<std::thread> threads;
	for (int i = 0; i < numRequests; ++i) {
		threads.emplace_back([&executor, i]() {
			try {
				auto response = executor.get<nlohmann::json>("https://httpbin.org/delay/1?thread=" + std::to_string(i));

				std::lock_guard<std::mutex> lock(cout_mutex);
				std::cout << "[Thread " << i << "] Status: " << response.status << std::endl;
			} catch (const std::exception& e) {
				std::lock_guard<std::mutex> lock(cout_mutex);
				std::cerr << "[Thread " << i << "] Exception: " << e.what() << std::endl;
			}
		});
	}

	for (auto& thread : threads) {
		thread.join();
	}

	auto endTime = std::chrono::high_resolution_clock::now();
	auto totalDuration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

	std::cout << "\n----------------------------------------" << std::endl;
	std::cout << "Total requests: " << numRequests << std::endl;
	std::cout << "Total wall-clock time: " << totalDuration.count() / 1000.0 << "s" << std::endl;
	std::cout << "----------------------------------------" << std::endl;
}

void testRetry(const RequestExecutor& executor) {
	std::cout << "\n========================================" << std::endl;
	std::cout << "Retry Request Test..." << std::endl;
	std::cout << "========================================" << std::endl;

	ClientConfig config = executor.config();
	config.retryCount = 3;
	config.backoffLimit = std::chrono::milliseconds(2000);
	config.retryPredicate = resilient_http::retry::anyOf(resilient_http::retry::onCurlCodes(),
														 resilient_http::retry::upToAttempt(2));

	auto startTime = std::chrono::high_resolution_clock::now();

	// 503 is retried, then handed back as a non-2xx outcome
	auto response = executor.withConfig(config).get<nlohmann::json>("https://httpbin.org/status/503");

	auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::high_resolution_clock::now() - startTime);

	std::cout << "Request completed after " << duration.count() / 1000.0 << "s" << std::endl;
	printResponse(response);
}

void testNotAllowed(const RequestExecutor& executor) {
	ClientConfig config = executor.config();
	config.allowedMethods.erase(HttpRequest::POST);

	try {
		executor.withConfig(config).post<nlohmann::json>("https://httpbin.org/post", nlohmann::json::object());
	} catch (const resilient_http::InternalError& e) {
		std::cout << "Rejected: " << e.what() << std::endl;
	}
}

int main() {
	std::cout << "========================================" << std::endl;
	std::cout << "   RequestExecutor Example" << std::endl;
	std::cout << "========================================" << std::endl << std::endl;

	std::cout << "Note: These examples require internet connection" << std::endl;
	std::cout << "      to reach https://httpbin.org/" << std::endl << std::endl;

	try {
		Logger logger("example", resilient_http::LogLevel::Info);
		RequestExecutor executor(logger);

		std::cout << "\n[1] GET" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testGET(executor);

		std::cout << "\n[2] POST" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testPOST(executor);

		std::cout << "\n[3] Concurrent Requests" << std::endl;
		testConcurrent(executor);

		std::cout << "\n[4] Retry Request" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testRetry(executor);

		std::cout << "\n[5] Disallowed Method" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testNotAllowed(executor);

		logger.flush();
		return 0;
	} catch (const std::exception& e) {
		std::cerr << "Failed with exception: " << e.what() << std::endl;
		return 1;
	}
}
