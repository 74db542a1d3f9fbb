#include "Logger.hpp"
#include "Errors.hpp"
#include "utils.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace resilient_http {

std::string_view logLevelName(LogLevel level) {
	switch (level) {
		case LogLevel::Trace: return "trace";
		case LogLevel::Debug: return "debug";
		case LogLevel::Info: return "info";
		case LogLevel::Warn: return "warn";
		case LogLevel::Error: return "error";
		case LogLevel::Fatal: return "fatal";
	}
	return "info";
}

LogLevel logLevelFromName(std::string_view name) {
	const std::string lower = util::tolower(util::trim(name));
	if (lower == "trace") return LogLevel::Trace;
	if (lower == "debug") return LogLevel::Debug;
	if (lower == "info") return LogLevel::Info;
	if (lower == "warn" || lower == "warning") return LogLevel::Warn;
	if (lower == "error") return LogLevel::Error;
	if (lower == "fatal" || lower == "critical") return LogLevel::Fatal;
	throw ConfigError("Unknown log level: " + std::string(name));
}

static spdlog::level::level_enum toSpdlog(LogLevel level) {
	switch (level) {
		case LogLevel::Trace: return spdlog::level::trace;
		case LogLevel::Debug: return spdlog::level::debug;
		case LogLevel::Info: return spdlog::level::info;
		case LogLevel::Warn: return spdlog::level::warn;
		case LogLevel::Error: return spdlog::level::err;
		case LogLevel::Fatal: return spdlog::level::critical;
	}
	return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> Logger::makeAsyncSink(const std::string& component) {
	if (auto existing = spdlog::get(component))
		return existing;

	std::shared_ptr<spdlog::logger> sink;
	try {
		// Non-blocking: a full queue overwrites the oldest record
		sink = spdlog::create_async_nb<spdlog::sinks::stdout_sink_mt>(component);
	} catch (const spdlog::spdlog_ex&) {
		// Registered concurrently by another Logger with the same component
		sink = spdlog::get(component);
	}
	if (sink) {
		sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%fZ","level":"%l","component":"%n",%v})",
						  spdlog::pattern_time_type::utc);
		sink->set_level(spdlog::level::trace);
	}
	return sink;
}

Logger::Logger(const std::string& component, LogLevel level)
	: state_(std::make_shared<State>()) {
	this->state_->sink = makeAsyncSink(component);
	this->state_->level.store(level);
	this->state_->component = component;
}

Logger::Logger(std::shared_ptr<spdlog::logger> sink, LogLevel level)
	: state_(std::make_shared<State>()) {
	this->state_->component = sink ? sink->name() : std::string("resilient_http");
	this->state_->sink = std::move(sink);
	this->state_->level.store(level);
}

std::string Logger::render(std::string_view message, Fields ctx) {
	nlohmann::json object = nlohmann::json::object();
	for (const auto& [key, value] : ctx)
		object[key] = value;

	std::string out = "\"msg\":";
	out += nlohmann::json(std::string(message)).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	out += ",\"ctx\":";
	out += object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	return out;
}

void Logger::log(LogLevel level, std::string_view message, Fields ctx) const noexcept {
	if (!this->enabled(level) || !this->state_->sink)
		return;

	try {
		this->state_->sink->log(toSpdlog(level), "{}", render(message, ctx));
	} catch (const std::exception& e) {
		// Logging is best-effort: report to stderr through spdlog's own handler and go on
		spdlog::default_logger_raw()->log(spdlog::level::err, "resilient_http log failure: {}", e.what());
	}
}

void Logger::setLevel(LogLevel level) {
	this->state_->level.store(level);
}

LogLevel Logger::level() const {
	return this->state_->level.load();
}

bool Logger::enabled(LogLevel level) const {
	return static_cast<int>(level) >= static_cast<int>(this->state_->level.load());
}

const std::string& Logger::component() const {
	return this->state_->component;
}

void Logger::flush() const noexcept {
	if (this->state_->sink)
		this->state_->sink->flush();
}

} // namespace resilient_http
