#include "ProcessingTrigger.h"

#include "CurlWrapper.h"
#include "IngestErrors.h"
#include "JSONUtils.h"
#include "spdlog/spdlog.h"

HTTPProcessingTrigger::HTTPProcessingTrigger(const json &configurationRoot)
{
	json processingRoot = JSONUtils::asJson(configurationRoot, "processing", json::object());

	_endpoint = JSONUtils::asString(processingRoot, "endpoint", "");
	SPDLOG_INFO(
		"Configuration item"
		", processing->endpoint: {}",
		_endpoint
	);
	_webhookSecret = JSONUtils::asString(processingRoot, "webhookSecret", "");
	_timeoutInSeconds = JSONUtils::asInt(processingRoot, "timeoutInSeconds", 30);
	SPDLOG_INFO(
		"Configuration item"
		", processing->timeoutInSeconds: {}",
		_timeoutInSeconds
	);
	_maxRetryNumber = JSONUtils::asInt(processingRoot, "maxRetryNumber", 2);
	SPDLOG_INFO(
		"Configuration item"
		", processing->maxRetryNumber: {}",
		_maxRetryNumber
	);
	_secondsToWaitBeforeToRetry = JSONUtils::asInt(processingRoot, "secondsToWaitBeforeToRetry", 5);
	SPDLOG_INFO(
		"Configuration item"
		", processing->secondsToWaitBeforeToRetry: {}",
		_secondsToWaitBeforeToRetry
	);
}

void HTTPProcessingTrigger::trigger(int64_t jobKey)
{
	string api = "processingTrigger";

	if (_endpoint == "")
	{
		string errorMessage = fmt::format(
			"{}. Processing endpoint is not configured"
			", jobKey: {}",
			api, jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw ProcessingError(errorMessage);
	}

	json triggerRoot;
	triggerRoot["job_id"] = jobKey;
	triggerRoot["webhook_secret"] = _webhookSecret;

	try
	{
		CurlWrapper::httpPostString(
			_endpoint, _timeoutInSeconds, "", JSONUtils::toString(triggerRoot), "application/json", vector<string>(),
			fmt::format(", jobKey: {}", jobKey), _maxRetryNumber, _secondsToWaitBeforeToRetry
		);
	}
	catch (exception &e)
	{
		string errorMessage = fmt::format(
			"{} failed"
			", jobKey: {}"
			", exception: {}",
			api, jobKey, e.what()
		);
		SPDLOG_ERROR(errorMessage);

		throw ProcessingError(errorMessage);
	}

	SPDLOG_INFO(
		"{} success"
		", jobKey: {}",
		api, jobKey
	);
}
