#include "IngestLogger.h"

#include "JSONUtils.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

void IngestLogger::setSinkLevel(shared_ptr<spdlog::sinks::sink> sink, string logLevel)
{
	if (logLevel == "debug")
		sink->set_level(spdlog::level::debug);
	else if (logLevel == "info")
		sink->set_level(spdlog::level::info);
	else if (logLevel == "warn")
		sink->set_level(spdlog::level::warn);
	else if (logLevel == "err")
		sink->set_level(spdlog::level::err);
	else if (logLevel == "critical")
		sink->set_level(spdlog::level::critical);
}

shared_ptr<spdlog::sinks::sink> IngestLogger::buildErrorSink(const json &logRoot)
{
	string logErrorPathName = JSONUtils::asString(logRoot, "errorPathName", "");
	string logType = JSONUtils::asString(logRoot, "type", "");

	shared_ptr<spdlog::sinks::sink> errorSink;
	if (logErrorPathName == "")
		return errorSink;

	if (logType == "daily")
	{
		json dailyRoot = JSONUtils::asJson(logRoot, "daily", json::object());
		int logRotationHour = JSONUtils::asInt(dailyRoot, "rotationHour", 1);
		int logRotationMinute = JSONUtils::asInt(dailyRoot, "rotationMinute", 1);

		errorSink = make_shared<spdlog::sinks::daily_file_sink_mt>(logErrorPathName, logRotationHour, logRotationMinute);
	}
	else
	{
		json rotatingRoot = JSONUtils::asJson(logRoot, "rotating", json::object());
		int64_t maxSizeInKBytes = JSONUtils::asInt64(rotatingRoot, "maxSizeInKBytes", 1000);
		int maxFiles = JSONUtils::asInt(rotatingRoot, "maxFiles", 10);

		errorSink = make_shared<spdlog::sinks::rotating_file_sink_mt>(logErrorPathName, maxSizeInKBytes * 1000, maxFiles);
	}
	errorSink->set_level(spdlog::level::err);

	return errorSink;
}

shared_ptr<spdlog::logger> IngestLogger::setMainLogger(const json &configurationRoot, string loggerName)
{
	json logRoot = JSONUtils::asJson(JSONUtils::asJson(configurationRoot, "log", json::object()), loggerName, json::object());

	string logPathName = JSONUtils::asString(logRoot, "pathName", "");
	string logType = JSONUtils::asString(logRoot, "type", "");
	string logLevel = JSONUtils::asString(logRoot, "level", "info");
	bool stdout = JSONUtils::asBool(logRoot, "stdout", logPathName == "");

	vector<spdlog::sink_ptr> sinks;
	if (logPathName != "")
	{
		if (logType == "daily")
		{
			json dailyRoot = JSONUtils::asJson(logRoot, "daily", json::object());
			int logRotationHour = JSONUtils::asInt(dailyRoot, "rotationHour", 1);
			int logRotationMinute = JSONUtils::asInt(dailyRoot, "rotationMinute", 1);

			auto dailySink = make_shared<spdlog::sinks::daily_file_sink_mt>(logPathName, logRotationHour, logRotationMinute);
			setSinkLevel(dailySink, logLevel);
			sinks.push_back(dailySink);
		}
		else
		{
			json rotatingRoot = JSONUtils::asJson(logRoot, "rotating", json::object());
			int64_t maxSizeInKBytes = JSONUtils::asInt64(rotatingRoot, "maxSizeInKBytes", 1000);
			int maxFiles = JSONUtils::asInt(rotatingRoot, "maxFiles", 10);

			auto rotatingSink = make_shared<spdlog::sinks::rotating_file_sink_mt>(logPathName, maxSizeInKBytes * 1000, maxFiles);
			setSinkLevel(rotatingSink, logLevel);
			sinks.push_back(rotatingSink);
		}
	}

	shared_ptr<spdlog::sinks::sink> errorSink = buildErrorSink(logRoot);
	if (errorSink != nullptr)
		sinks.push_back(errorSink);

	if (stdout)
	{
		auto stdoutSink = make_shared<spdlog::sinks::stdout_color_sink_mt>();
		setSinkLevel(stdoutSink, logLevel);
		sinks.push_back(stdoutSink);
	}

	auto logger = make_shared<spdlog::logger>(fmt::format("{}-log", loggerName), begin(sinks), end(sinks));
	spdlog::register_logger(logger);

	logger->flush_on(spdlog::level::trace);

	// every message reaches the sinks, each sink filters on its own level
	logger->set_level(spdlog::level::trace);

	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::trace);

	string pattern = JSONUtils::asString(logRoot, "pattern", "");
	if (pattern != "")
		spdlog::set_pattern(pattern);

	return logger;
}
