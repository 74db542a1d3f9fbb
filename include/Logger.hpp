#pragma once

#include <atomic>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace resilient_http {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

std::string_view logLevelName(LogLevel level);
LogLevel logLevelFromName(std::string_view name); // throws ConfigError

/**
 * Structured event sink.
 *
 * Every event is one JSON object line: ts, level, component, msg and a ctx
 * object holding the key/value pairs. Delivery goes through an spdlog async
 * logger that drops the oldest record instead of blocking when its queue is
 * full; a failing sink never reaches the caller.
 *
 * Copies share the same underlying spdlog logger and level.
 */
class Logger {
public:
	using Field = std::pair<std::string, nlohmann::json>;
	using Fields = std::initializer_list<Field>;

	explicit Logger(const std::string& component, LogLevel level = LogLevel::Info);
	// Route events to an existing spdlog logger, e.g. one with an ostream sink in tests
	Logger(std::shared_ptr<spdlog::logger> sink, LogLevel level = LogLevel::Info);

	void log(LogLevel level, std::string_view message, Fields ctx = {}) const noexcept;

	void trace(std::string_view message, Fields ctx = {}) const noexcept { log(LogLevel::Trace, message, ctx); }
	void debug(std::string_view message, Fields ctx = {}) const noexcept { log(LogLevel::Debug, message, ctx); }
	void info(std::string_view message, Fields ctx = {}) const noexcept { log(LogLevel::Info, message, ctx); }
	void warn(std::string_view message, Fields ctx = {}) const noexcept { log(LogLevel::Warn, message, ctx); }
	void error(std::string_view message, Fields ctx = {}) const noexcept { log(LogLevel::Error, message, ctx); }
	void fatal(std::string_view message, Fields ctx = {}) const noexcept { log(LogLevel::Fatal, message, ctx); }

	void setLevel(LogLevel level);
	LogLevel level() const;
	bool enabled(LogLevel level) const;

	const std::string& component() const;
	void flush() const noexcept;

	// Render one event as the JSON object body written to the sink
	static std::string render(std::string_view message, Fields ctx);

private:
	struct State {
		std::shared_ptr<spdlog::logger> sink;
		std::atomic<LogLevel> level;
		std::string component;
	};
	std::shared_ptr<State> state_;

	static std::shared_ptr<spdlog::logger> makeAsyncSink(const std::string& component);
};

} // namespace resilient_http
