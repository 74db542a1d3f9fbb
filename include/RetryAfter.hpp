#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resilient_http {
namespace retry_after {

// Smallest wait returned for "0" and for dates at or before now
constexpr std::chrono::seconds MinimumWait{1};

/**
 * Parse a Retry-After value.
 * Accepted forms, in order: delay-seconds, IMF-fixdate
 * ("Sun, 06 Nov 1994 08:49:37 GMT"), RFC 2822 dates with any zone,
 * RFC 3339 timestamps. Returns nullopt when the value matches none.
 */
std::optional<std::chrono::milliseconds> parseValue(
	std::string_view value,
	std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/**
 * Look up the Retry-After header (case-insensitive) in "Name: value" lines and parse it.
 */
std::optional<std::chrono::milliseconds> parse(
	const std::vector<std::string>& headers,
	std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// Individual formats, each returning seconds since the epoch
std::optional<std::time_t> parseImfFixdate(std::string_view value);
std::optional<std::time_t> parseRfc2822(std::string_view value);
std::optional<std::time_t> parseRfc3339(std::string_view value);

} // namespace retry_after
} // namespace resilient_http
