#include "IngestAPI.h"

#include <thread>
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include "IngestErrors.h"
#include "JSONUtils.h"
#include "spdlog/spdlog.h"

IngestAPI::IngestAPI(json configurationRoot, mutex *fcgiAcceptMutex, shared_ptr<IngestionEngine> ingestionEngine, string webhookSecret)
	: FastCGIAPI(configurationRoot, fcgiAcceptMutex)
{
	_ingestionEngine = ingestionEngine;
	_webhookSecret = webhookSecret;

	json apiRoot = JSONUtils::asJson(configurationRoot, "api", json::object());
	json usersRoot = JSONUtils::asJson(apiRoot, "users", json::array());
	for (const json &userRoot : usersRoot)
	{
		IngestAPIUser user;
		user.userName = JSONUtils::asString(userRoot, "userName", "", true);
		user.password = JSONUtils::asString(userRoot, "password", "", true);
		user.ownerKey = JSONUtils::asInt64(userRoot, "ownerKey", -1, true);

		_users.push_back(user);
	}
	SPDLOG_INFO(
		"Configuration item"
		", api->users: {}",
		_users.size()
	);

	registerHandlers();
}

IngestAPI::~IngestAPI() = default;

void IngestAPI::registerHandler(string method, Handler handler) { _handlers[method] = handler; }

void IngestAPI::registerHandlers()
{
	registerHandler(
		"status", [this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ status(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"createIngestionJob",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ createIngestionJob(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"getIngestionJob",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ getIngestionJob(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"ingestionJobList",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ ingestionJobList(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"fetchSourceMetadata",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ fetchSourceMetadata(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"confirmRights",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ confirmRights(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"startUpload",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ startUpload(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"signParts",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ signParts(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"acknowledgePart",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ acknowledgePart(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"completeUpload",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ completeUpload(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"cancelUpload",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ cancelUpload(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"importRemoteStream",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ importRemoteStream(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"relayPart",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ relayPart(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"processingProgress",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ processingProgress(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"processingFailed",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ processingFailed(sThreadId, requestIdentifier, request, requestData); }
	);
	registerHandler(
		"processingReady",
		[this](const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
		{ processingReady(sThreadId, requestIdentifier, request, requestData); }
	);
}

void IngestAPI::manageRequestAndResponse(
	string sThreadId, int64_t requestIdentifier, FCGX_Request &request, string requestURI, string requestMethod,
	unordered_map<string, string> queryParameters, bool authorizationPresent, string userName, string password, unsigned long contentLength,
	string requestBody, unordered_map<string, string> &requestDetails
)
{
	string method = getQueryParameter(queryParameters, "method", string(""), false);

	SPDLOG_INFO(
		"Received manageRequestAndResponse"
		", requestIdentifier: {}"
		", requestURI: {}"
		", requestMethod: {}"
		", method: {}"
		", contentLength: {}"
		", userName: {}",
		requestIdentifier, requestURI, requestMethod, method, contentLength, userName
	);

	try
	{
		auto handlerIt = _handlers.find(method);
		if (handlerIt == _handlers.end())
		{
			string errorMessage = fmt::format(
				"No API is matched"
				", requestURI: {}"
				", method: {}",
				requestURI, method
			);
			SPDLOG_ERROR(errorMessage);

			throw invalid_argument(errorMessage);
		}

		IngestRequestData requestData;
		requestData.requestURI = requestURI;
		requestData.requestMethod = requestMethod;
		requestData.queryParameters = queryParameters;
		requestData.requestBody = requestBody;
		requestData.requestDetails = requestDetails;
		requestData.ownerKey = authorizationPresent ? ownerKeyOf(userName) : -1;

		handlerIt->second(sThreadId, requestIdentifier, request, requestData);
	}
	catch (exception &e)
	{
		int responseCode = htmlResponseCode(e);

		SPDLOG_ERROR(
			"manage request failed"
			", method: {}"
			", htmlResponseCode: {}"
			", e.what(): {}",
			method, responseCode, e.what()
		);

		sendError(request, responseCode, e.what());
	}
}

int IngestAPI::htmlResponseCode(exception &e)
{
	if (dynamic_cast<InvalidInputError *>(&e) || dynamic_cast<invalid_argument *>(&e) || dynamic_cast<JsonFieldNotFound *>(&e))
		return 400;
	else if (dynamic_cast<CheckAuthorizationFailed *>(&e))
		return 401;
	else if (dynamic_cast<ConsentRequiredError *>(&e))
		return 403;
	else if (dynamic_cast<JobNotFound *>(&e))
		return 404;
	else if (dynamic_cast<IncompleteUploadError *>(&e) || dynamic_cast<InvalidTransition *>(&e))
		return 409;
	else if (dynamic_cast<TransportError *>(&e))
		return 502;
	else if (dynamic_cast<StorageUnavailableError *>(&e))
		return 503;
	else
		return 500;
}

void IngestAPI::checkAuthorization(string sThreadId, string userName, string password)
{
	for (const IngestAPIUser &user : _users)
	{
		if (user.userName == userName && user.password == password)
			return;
	}

	SPDLOG_WARN(
		"Wrong credentials"
		", threadId: {}"
		", userName: {}",
		sThreadId, userName
	);

	throw CheckAuthorizationFailed();
}

bool IngestAPI::basicAuthenticationRequired(string requestURI, unordered_map<string, string> queryParameters)
{
	bool basicAuthenticationRequired = true;

	string method = getQueryParameter(queryParameters, "method", string(""), false);
	if (method == "")
	{
		SPDLOG_ERROR("The 'method' parameter is not found");

		return basicAuthenticationRequired;
	}

	// the processing callbacks carry the webhook secret
	if (method == "status" // often used as healthy check
		|| method == "processingProgress" || method == "processingFailed" || method == "processingReady")
		basicAuthenticationRequired = false;

	return basicAuthenticationRequired;
}

int64_t IngestAPI::ownerKeyOf(string userName)
{
	for (const IngestAPIUser &user : _users)
	{
		if (user.userName == userName)
			return user.ownerKey;
	}

	throw CheckAuthorizationFailed();
}

IngestionJob IngestAPI::ownedIngestionJob(int64_t jobKey, int64_t ownerKey)
{
	IngestionJob ingestionJob = _ingestionEngine->getIngestionJob(jobKey);
	if (ingestionJob.ownerKey != ownerKey)
	{
		string errorMessage = fmt::format(
			"Ingestion job was not found"
			", jobKey: {}"
			", ownerKey: {}",
			jobKey, ownerKey
		);
		SPDLOG_WARN(errorMessage);

		throw JobNotFound(errorMessage);
	}

	return ingestionJob;
}

void IngestAPI::checkWebhookSecret(const json &bodyRoot)
{
	string webhookSecret = JSONUtils::asString(bodyRoot, "webhook_secret", "");
	if (_webhookSecret == "" || webhookSecret != _webhookSecret)
	{
		SPDLOG_WARN(
			"Wrong webhook secret"
			", job_id: {}",
			JSONUtils::asInt64(bodyRoot, "job_id", -1)
		);

		throw CheckAuthorizationFailed();
	}
}

json IngestAPI::requestBodyToJson(const string &requestBody)
{
	try
	{
		return JSONUtils::toJson(requestBody);
	}
	catch (runtime_error &e)
	{
		throw InvalidInputError(fmt::format("The request body is not a valid json, e.what(): {}", e.what()));
	}
}

json IngestAPI::signedPartURLsToJson(const vector<SignedPartURL> &signedPartURLs)
{
	json signedPartURLsRoot = json::array();
	for (const SignedPartURL &signedPartURL : signedPartURLs)
	{
		json signedPartURLRoot;
		signedPartURLRoot["partNumber"] = signedPartURL.partNumber;
		signedPartURLRoot["url"] = signedPartURL.url;
		signedPartURLRoot["expiresAt"] = chrono::duration_cast<chrono::seconds>(signedPartURL.expiresAt.time_since_epoch()).count();

		signedPartURLsRoot.push_back(signedPartURLRoot);
	}

	return signedPartURLsRoot;
}

void IngestAPI::status(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	json statusRoot;
	statusRoot["status"] = "Ingest API server up and running";

	sendSuccess(sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(statusRoot));
}

void IngestAPI::createIngestionJob(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	string api = "createIngestionJob";

	SPDLOG_INFO(
		"Received {}"
		", ownerKey: {}"
		", requestBody: {}",
		api, requestData.ownerKey, requestData.requestBody
	);

	try
	{
		json bodyRoot = requestBodyToJson(requestData.requestBody);

		SourceKind sourceKind;
		try
		{
			sourceKind = IngestionJob::toSourceKind(JSONUtils::asString(bodyRoot, "sourceKind", "", true));
		}
		catch (JsonFieldNotFound &e)
		{
			throw;
		}
		catch (runtime_error &e)
		{
			throw InvalidInputError(e.what());
		}

		IngestionJob ingestionJob;
		if (sourceKind == SourceKind::BrowserUpload)
			ingestionJob = _ingestionEngine->createBrowserUploadJob(
				requestData.ownerKey, JSONUtils::asString(bodyRoot, "fileName", "", true), JSONUtils::asString(bodyRoot, "contentType", "video/mp4")
			);
		else
			ingestionJob = _ingestionEngine->createRemoteStreamJob(requestData.ownerKey, JSONUtils::asString(bodyRoot, "sourceURL", "", true));

		sendSuccess(
			sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 201, JSONUtils::toString(ingestionJob.toJson())
		);
	}
	catch (exception &e)
	{
		SPDLOG_ERROR(
			"API failed"
			", API: {}"
			", requestBody: {}"
			", e.what(): {}",
			api, requestData.requestBody, e.what()
		);

		throw;
	}
}

void IngestAPI::getIngestionJob(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

	IngestionJob ingestionJob = ownedIngestionJob(jobKey, requestData.ownerKey);

	json responseRoot = ingestionJob.toJson();
	optional<UploadSession> uploadSession = _ingestionEngine->getActiveUploadSession(jobKey);
	if (uploadSession)
		responseRoot["uploadSession"] = uploadSession->toJson();

	sendSuccess(sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(responseRoot));
}

void IngestAPI::ingestionJobList(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	string api = "ingestionJobList";

	try
	{
		JobStatus jobStatus;
		try
		{
			jobStatus = IngestionJob::toJobStatus(getQueryParameter(requestData.queryParameters, "status", string(""), true));
		}
		catch (runtime_error &e)
		{
			throw InvalidInputError(e.what());
		}

		json jobsRoot = json::array();
		for (const IngestionJob &ingestionJob : _ingestionEngine->getIngestionJobsByStatus(jobStatus))
		{
			if (ingestionJob.ownerKey == requestData.ownerKey)
				jobsRoot.push_back(ingestionJob.toJson());
		}

		json responseRoot;
		responseRoot["jobs"] = jobsRoot;

		sendSuccess(sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(responseRoot));
	}
	catch (exception &e)
	{
		SPDLOG_ERROR(
			"API failed"
			", API: {}"
			", e.what(): {}",
			api, e.what()
		);

		throw;
	}
}

void IngestAPI::fetchSourceMetadata(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

	ownedIngestionJob(jobKey, requestData.ownerKey);

	IngestionJob ingestionJob;
	json bodyRoot = requestData.requestBody == "" ? json::object() : requestBodyToJson(requestData.requestBody);
	if (JSONUtils::isMetadataPresent(bodyRoot, "title"))
	{
		SourceMetadata sourceMetadata;
		sourceMetadata.title = JSONUtils::asString(bodyRoot, "title", "");
		sourceMetadata.author = JSONUtils::asString(bodyRoot, "author", "");
		sourceMetadata.thumbnailURL = JSONUtils::asString(bodyRoot, "thumbnailURL", "");

		ingestionJob = _ingestionEngine->setSourceMetadata(jobKey, sourceMetadata);
	}
	else
		ingestionJob = _ingestionEngine->fetchSourceMetadata(jobKey);

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(ingestionJob.toJson())
	);
}

void IngestAPI::confirmRights(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

	ownedIngestionJob(jobKey, requestData.ownerKey);

	IngestionJob ingestionJob = _ingestionEngine->confirmRights(jobKey);

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(ingestionJob.toJson())
	);
}

void IngestAPI::startUpload(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	string api = "startUpload";

	SPDLOG_INFO(
		"Received {}"
		", requestBody: {}",
		api, requestData.requestBody
	);

	try
	{
		int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

		ownedIngestionJob(jobKey, requestData.ownerKey);

		json bodyRoot = requestBodyToJson(requestData.requestBody);
		int64_t totalBytes = JSONUtils::asInt64(bodyRoot, "totalBytes", 0, true);
		string contentType = JSONUtils::asString(bodyRoot, "contentType", "");
		int64_t partSizeBytes = JSONUtils::asInt64(bodyRoot, "partSizeBytes", 0);

		UploadSession uploadSession = _ingestionEngine->startUpload(jobKey, totalBytes, contentType, partSizeBytes);

		json responseRoot;
		responseRoot["uploadSession"] = uploadSession.toJson();

		vector<int> missingPartNumbers = uploadSession.missingPartNumbers();
		responseRoot["missingParts"] = missingPartNumbers;

		// first batch of signed URLs, the client asks signParts for the next ones
		if (!missingPartNumbers.empty())
		{
			int signBatchSize = JSONUtils::asInt(JSONUtils::asJson(_configurationRoot, "upload", json::object()), "signBatchSize", 20);
			int firstPartNumber = missingPartNumbers.front();
			int lastPartNumber = min(firstPartNumber + signBatchSize - 1, uploadSession.totalParts);

			responseRoot["signedPartURLs"] = signedPartURLsToJson(_ingestionEngine->signParts(jobKey, firstPartNumber, lastPartNumber));
		}
		else
			responseRoot["signedPartURLs"] = json::array();

		sendSuccess(sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 201, JSONUtils::toString(responseRoot));
	}
	catch (exception &e)
	{
		SPDLOG_ERROR(
			"API failed"
			", API: {}"
			", requestBody: {}"
			", e.what(): {}",
			api, requestData.requestBody, e.what()
		);

		throw;
	}
}

void IngestAPI::signParts(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);
	int32_t firstPartNumber = getQueryParameter(requestData.queryParameters, "firstPartNumber", static_cast<int32_t>(-1), true);
	int32_t lastPartNumber = getQueryParameter(requestData.queryParameters, "lastPartNumber", firstPartNumber, false);

	ownedIngestionJob(jobKey, requestData.ownerKey);

	json responseRoot;
	responseRoot["signedPartURLs"] = signedPartURLsToJson(_ingestionEngine->signParts(jobKey, firstPartNumber, lastPartNumber));

	sendSuccess(sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(responseRoot));
}

void IngestAPI::acknowledgePart(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

	ownedIngestionJob(jobKey, requestData.ownerKey);

	json bodyRoot = requestBodyToJson(requestData.requestBody);
	int partNumber = JSONUtils::asInt(bodyRoot, "partNumber", 0, true);
	string etag = JSONUtils::asString(bodyRoot, "etag", "", true);
	int64_t byteLength = JSONUtils::asInt64(bodyRoot, "byteLength", 0, true);

	int progressPercent = _ingestionEngine->acknowledgePart(jobKey, partNumber, etag, byteLength);

	json responseRoot;
	responseRoot["partNumber"] = partNumber;
	responseRoot["progressPercent"] = progressPercent;

	sendSuccess(sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(responseRoot));
}

void IngestAPI::completeUpload(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

	ownedIngestionJob(jobKey, requestData.ownerKey);

	IngestionJob ingestionJob = _ingestionEngine->completeUpload(jobKey);

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(ingestionJob.toJson())
	);
}

void IngestAPI::cancelUpload(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

	ownedIngestionJob(jobKey, requestData.ownerKey);

	IngestionJob ingestionJob = _ingestionEngine->cancelUpload(jobKey);

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(ingestionJob.toJson())
	);
}

void IngestAPI::importRemoteStream(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	string api = "importRemoteStream";

	int64_t jobKey = getQueryParameter(requestData.queryParameters, "jobKey", static_cast<int64_t>(-1), true);

	IngestionJob ingestionJob = ownedIngestionJob(jobKey, requestData.ownerKey);

	// the checks done synchronously by importRemoteStream are anticipated here, the import itself outlives the request
	if (ingestionJob.sourceKind != SourceKind::RemoteStream)
	{
		string errorMessage = fmt::format(
			"importRemoteStream is only for remote streams"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}
	if (!ingestionJob.rightsConfirmedAt)
	{
		string errorMessage = fmt::format(
			"Rights confirmation is required before the import"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw ConsentRequiredError(errorMessage);
	}
	if (ingestionJob.status != JobStatus::MetaReady && ingestionJob.status != JobStatus::UploadReady)
	{
		string errorMessage = fmt::format(
			"The job cannot be imported"
			", jobKey: {}"
			", status: {}",
			jobKey, IngestionJob::toString(ingestionJob.status)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}

	shared_ptr<IngestionEngine> ingestionEngine = _ingestionEngine;
	thread importThread(
		[ingestionEngine, jobKey, api]()
		{
			try
			{
				ingestionEngine->importRemoteStream(jobKey);
			}
			catch (exception &e)
			{
				// the job is already FAILED with stage import
				SPDLOG_ERROR(
					"API failed"
					", API: {}"
					", jobKey: {}"
					", e.what(): {}",
					api, jobKey, e.what()
				);
			}
		}
	);
	importThread.detach();

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 202, JSONUtils::toString(ingestionJob.toJson())
	);
}

void IngestAPI::relayPart(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	string api = "relayPart";

	string uploadURL = getHeaderValue(requestData.requestDetails, "X-Upload-Url", "");
	string sPartNumber = getHeaderValue(requestData.requestDetails, "X-Part-Number", "");

	SPDLOG_INFO(
		"Received {}"
		", partNumber: {}"
		", bytes: {}",
		api, sPartNumber, requestData.requestBody.size()
	);

	if (uploadURL == "" || sPartNumber == "")
	{
		string errorMessage = fmt::format(
			"X-Upload-Url and X-Part-Number headers are mandatory"
			", API: {}",
			api
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	int partNumber;
	try
	{
		partNumber = stoi(sPartNumber);
	}
	catch (exception &e)
	{
		string errorMessage = fmt::format(
			"X-Part-Number is not a number"
			", X-Part-Number: {}",
			sPartNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	vector<uint8_t> bytes(requestData.requestBody.begin(), requestData.requestBody.end());

	string etag = _ingestionEngine->relayPart(partNumber, uploadURL, bytes);

	json responseRoot;
	responseRoot["etag"] = etag;

	sendSuccess(sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(responseRoot));
}

void IngestAPI::processingProgress(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	json bodyRoot = requestBodyToJson(requestData.requestBody);
	checkWebhookSecret(bodyRoot);

	int64_t jobKey = JSONUtils::asInt64(bodyRoot, "job_id", -1, true);
	int progressPercent = JSONUtils::asInt(bodyRoot, "progress", 0, true);

	IngestionJob ingestionJob = _ingestionEngine->updateProcessingProgress(jobKey, progressPercent);

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(ingestionJob.toJson())
	);
}

void IngestAPI::processingFailed(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	json bodyRoot = requestBodyToJson(requestData.requestBody);
	checkWebhookSecret(bodyRoot);

	int64_t jobKey = JSONUtils::asInt64(bodyRoot, "job_id", -1, true);
	string errorMessage = JSONUtils::asString(bodyRoot, "error", "Processing failed");

	IngestionJob ingestionJob = _ingestionEngine->markProcessingFailed(jobKey, errorMessage);

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(ingestionJob.toJson())
	);
}

void IngestAPI::processingReady(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)
{
	json bodyRoot = requestBodyToJson(requestData.requestBody);
	checkWebhookSecret(bodyRoot);

	int64_t jobKey = JSONUtils::asInt64(bodyRoot, "job_id", -1, true);

	IngestionJob ingestionJob = _ingestionEngine->markReady(jobKey);

	sendSuccess(
		sThreadId, requestIdentifier, request, requestData.requestURI, requestData.requestMethod, 200, JSONUtils::toString(ingestionJob.toJson())
	);
}
