#include "ClientConfig.hpp"
#include "Errors.hpp"

#include <string>

namespace resilient_http {

const ClientConfig& ClientConfig::getDefault() {
	static const ClientConfig defaultConfig;
	return defaultConfig;
}

static std::set<long> readStatuses(const nlohmann::json& value, const std::string& key) {
	if (!value.is_array())
		throw ConfigError("'" + key + "' must be an array of status codes");

	std::set<long> statuses;
	for (const auto& item : value) {
		if (!item.is_number_integer())
			throw ConfigError("'" + key + "' must contain integers");
		long status = item.get<long>();
		if (status < 100 || status > 599)
			throw ConfigError("'" + key + "' contains invalid status " + std::to_string(status));
		statuses.insert(status);
	}
	return statuses;
}

static std::chrono::milliseconds readMillis(const nlohmann::json& value, const std::string& key) {
	if (!value.is_number_integer() || value.get<long long>() < 0)
		throw ConfigError("'" + key + "' must be a non-negative integer of milliseconds");
	return std::chrono::milliseconds(value.get<long long>());
}

static std::optional<std::chrono::milliseconds> readOptionalMillis(const nlohmann::json& value, const std::string& key) {
	if (value.is_null())
		return std::nullopt;
	return readMillis(value, key);
}

static bool readBool(const nlohmann::json& value, const std::string& key) {
	if (!value.is_boolean())
		throw ConfigError("'" + key + "' must be a boolean");
	return value.get<bool>();
}

static uint64_t readCount(const nlohmann::json& value, const std::string& key) {
	if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<long long>() >= 0))
		throw ConfigError("'" + key + "' must be a non-negative integer");
	return value.get<uint64_t>();
}

ClientConfig ClientConfig::fromJson(const nlohmann::json& document) {
	if (!document.is_object())
		throw ConfigError("client configuration must be a JSON object");

	ClientConfig config = ClientConfig::getDefault();

	if (document.contains("timeout_ms"))
		config.timeout = readOptionalMillis(document["timeout_ms"], "timeout_ms");
	if (document.contains("retry")) {
		uint64_t retry = readCount(document["retry"], "retry");
		if (retry >= UINT32_MAX)
			throw ConfigError("'retry' is out of range");
		config.retryCount = static_cast<uint32_t>(retry);
	}
	if (document.contains("concurrency_limit")) {
		uint64_t limit = readCount(document["concurrency_limit"], "concurrency_limit");
		config.concurrencyLimit = limit == 0 ? 1 : static_cast<size_t>(limit);
	}
	if (document.contains("retryable_statuses"))
		config.retryableStatuses = readStatuses(document["retryable_statuses"], "retryable_statuses");
	if (document.contains("retry_after_statuses"))
		config.retryAfterStatuses = readStatuses(document["retry_after_statuses"], "retry_after_statuses");
	if (document.contains("max_retry_after_ms"))
		config.maxRetryAfter = readOptionalMillis(document["max_retry_after_ms"], "max_retry_after_ms");
	if (document.contains("backoff_limit_ms"))
		config.backoffLimit = readOptionalMillis(document["backoff_limit_ms"], "backoff_limit_ms");
	if (document.contains("retry_on_timeout"))
		config.retryOnTimeout = readBool(document["retry_on_timeout"], "retry_on_timeout");
	if (document.contains("allowed_methods")) {
		const auto& methods = document["allowed_methods"];
		if (!methods.is_array())
			throw ConfigError("'allowed_methods' must be an array of method names");
		config.allowedMethods.clear();
		for (const auto& item : methods) {
			if (!item.is_string())
				throw ConfigError("'allowed_methods' must contain strings");
			auto method = HttpRequest::method2Enum(item.get<std::string>());
			if (method == HttpRequest::OTHER)
				throw ConfigError("unknown HTTP method '" + item.get<std::string>() + "'");
			config.allowedMethods.insert(method);
		}
	}
	if (document.contains("deterministic_mode"))
		config.deterministicMode = readBool(document["deterministic_mode"], "deterministic_mode");
	if (document.contains("jitter_disabled"))
		config.jitterDisabled = readBool(document["jitter_disabled"], "jitter_disabled");
	if (document.contains("permit_release_threshold_ms"))
		config.permitReleaseThreshold = readMillis(document["permit_release_threshold_ms"], "permit_release_threshold_ms");
	if (document.contains("reacquire_timeout_ms"))
		config.reacquireTimeout = readMillis(document["reacquire_timeout_ms"], "reacquire_timeout_ms");
	if (document.contains("snippet_limit"))
		config.snippetLimit = static_cast<size_t>(readCount(document["snippet_limit"], "snippet_limit"));

	return config;
}

} // namespace resilient_http
