#include "RetryAfter.hpp"
#include "utils.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace resilient_http {
namespace retry_after {

static std::optional<std::time_t> toUtcEpoch(std::tm& tm) {
#ifdef _WIN32
	std::time_t t = _mkgmtime(&tm);
#else
	std::time_t t = timegm(&tm);
#endif
	if (t == static_cast<std::time_t>(-1))
		return std::nullopt;
	return t;
}

static bool allDigits(std::string_view sv) {
	if (sv.empty())
		return false;
	for (char c : sv)
		if (c < '0' || c > '9')
			return false;
	return true;
}

static bool readInt(std::string_view sv, size_t pos, size_t len, int& out) {
	if (pos + len > sv.size() || !allDigits(sv.substr(pos, len)))
		return false;
	auto [ptr, ec] = std::from_chars(sv.data() + pos, sv.data() + pos + len, out);
	return ec == std::errc();
}

std::optional<std::time_t> parseImfFixdate(std::string_view value) {
	std::istringstream ss{std::string(value)};
	ss.imbue(std::locale::classic());

	std::tm tm{};
	ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
	if (ss.fail())
		return std::nullopt;
	ss >> std::ws;
	if (!ss.eof())
		return std::nullopt;
	return toUtcEpoch(tm);
}

std::optional<std::time_t> parseRfc2822(std::string_view value) {
	// An RFC 2822 date always names its month; curl_getdate is lenient about everything else
	static constexpr std::array<std::string_view, 12> months = {
		"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
	const std::string lower = util::tolower(value);
	bool hasMonth = false;
	for (auto month : months)
		if (lower.find(month) != std::string::npos)
			hasMonth = true;
	if (!hasMonth)
		return std::nullopt;

	std::time_t t = curl_getdate(std::string(value).c_str(), nullptr);
	if (t == static_cast<std::time_t>(-1))
		return std::nullopt;
	return t;
}

std::optional<std::time_t> parseRfc3339(std::string_view value) {
	// YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)
	std::tm tm{};
	int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
	if (!readInt(value, 0, 4, year) || value.size() < 20 || value[4] != '-' || !readInt(value, 5, 2, month) ||
		value[7] != '-' || !readInt(value, 8, 2, day))
		return std::nullopt;
	if (value[10] != 'T' && value[10] != 't' && value[10] != ' ')
		return std::nullopt;
	if (!readInt(value, 11, 2, hour) || value[13] != ':' || !readInt(value, 14, 2, minute) || value[16] != ':' ||
		!readInt(value, 17, 2, second))
		return std::nullopt;
	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
		return std::nullopt;

	size_t pos = 19;
	if (pos < value.size() && value[pos] == '.') {
		++pos;
		size_t digits = 0;
		while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
			++pos;
			++digits;
		}
		if (digits == 0)
			return std::nullopt;
	}

	long offsetSeconds = 0;
	std::string_view zone = value.substr(pos);
	if (zone == "Z" || zone == "z") {
		offsetSeconds = 0;
	} else if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
		int offHour = 0, offMinute = 0;
		if (!readInt(zone, 1, 2, offHour) || !readInt(zone, 4, 2, offMinute) || offHour > 23 || offMinute > 59)
			return std::nullopt;
		offsetSeconds = (offHour * 3600L + offMinute * 60L) * (zone[0] == '-' ? -1 : 1);
	} else {
		return std::nullopt;
	}

	tm.tm_year = year - 1900;
	tm.tm_mon = month - 1;
	tm.tm_mday = day;
	tm.tm_hour = hour;
	tm.tm_min = minute;
	tm.tm_sec = second;
	auto t = toUtcEpoch(tm);
	if (!t)
		return std::nullopt;
	return *t - offsetSeconds;
}

static std::chrono::milliseconds untilInstant(std::time_t instant, std::chrono::system_clock::time_point now) {
	auto target = std::chrono::system_clock::from_time_t(instant);
	if (target <= now)
		return MinimumWait;
	auto wait = std::chrono::duration_cast<std::chrono::seconds>(target - now);
	return std::max<std::chrono::milliseconds>(wait, MinimumWait);
}

std::optional<std::chrono::milliseconds> parseValue(std::string_view value, std::chrono::system_clock::time_point now) {
	value = util::trim(value);
	if (value.empty())
		return std::nullopt;

	if (allDigits(value)) {
		uint64_t seconds = 0;
		auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
		if (ec == std::errc()) {
			constexpr uint64_t maxSeconds = std::numeric_limits<int64_t>::max() / 1000;
			if (seconds == 0)
				return MinimumWait;
			return std::chrono::seconds(static_cast<int64_t>(std::min(seconds, maxSeconds)));
		}
		// Too large to represent: not a usable directive
		return std::nullopt;
	}

	if (auto t = parseImfFixdate(value))
		return untilInstant(*t, now);
	if (auto t = parseRfc2822(value))
		return untilInstant(*t, now);
	if (auto t = parseRfc3339(value))
		return untilInstant(*t, now);

	return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse(const std::vector<std::string>& headers,
											   std::chrono::system_clock::time_point now) {
	auto value = util::findHeader(headers, "retry-after");
	if (!value)
		return std::nullopt;
	return parseValue(*value, now);
}

} // namespace retry_after
} // namespace resilient_http
