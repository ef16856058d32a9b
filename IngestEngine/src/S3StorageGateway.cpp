#include "S3StorageGateway.h"

#include "CurlWrapper.h"
#include "IngestErrors.h"
#include "JSONUtils.h"
#include "spdlog/spdlog.h"

#include <libxml/entities.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>

S3StorageGateway::S3StorageGateway(const json &configurationRoot)
{
	json storageRoot = JSONUtils::asJson(configurationRoot, "storage", json::object());

	string endpoint = JSONUtils::asString(storageRoot, "endpoint", "");
	SPDLOG_INFO(
		"Configuration item"
		", storage->endpoint: {}",
		endpoint
	);
	{
		size_t protocolSeparatorIndex = endpoint.find("://");
		if (protocolSeparatorIndex == string::npos)
		{
			_protocol = "https";
			_endpointHost = endpoint;
		}
		else
		{
			_protocol = endpoint.substr(0, protocolSeparatorIndex);
			_endpointHost = endpoint.substr(protocolSeparatorIndex + 3);
		}
		while (!_endpointHost.empty() && _endpointHost.back() == '/')
			_endpointHost.pop_back();
	}
	_bucket = JSONUtils::asString(storageRoot, "bucket", "");
	SPDLOG_INFO(
		"Configuration item"
		", storage->bucket: {}",
		_bucket
	);
	_accessKeyId = JSONUtils::asString(storageRoot, "accessKeyId", "");
	SPDLOG_INFO(
		"Configuration item"
		", storage->accessKeyId: {}",
		_accessKeyId
	);
	_secretAccessKey = JSONUtils::asString(storageRoot, "secretAccessKey", "");
	_region = JSONUtils::asString(storageRoot, "region", "auto");
	SPDLOG_INFO(
		"Configuration item"
		", storage->region: {}",
		_region
	);
	_pathStyle = JSONUtils::asBool(storageRoot, "pathStyle", true);
	SPDLOG_INFO(
		"Configuration item"
		", storage->pathStyle: {}",
		_pathStyle
	);
	_presignExpirationInSeconds = JSONUtils::asInt(storageRoot, "presignExpirationInSeconds", 3600);
	SPDLOG_INFO(
		"Configuration item"
		", storage->presignExpirationInSeconds: {}",
		_presignExpirationInSeconds
	);
	_timeoutInSeconds = JSONUtils::asInt(storageRoot, "timeoutInSeconds", 120);
	SPDLOG_INFO(
		"Configuration item"
		", storage->timeoutInSeconds: {}",
		_timeoutInSeconds
	);
	_uploadPartTimeoutInSeconds = JSONUtils::asInt(storageRoot, "uploadPartTimeoutInSeconds", 600);
	SPDLOG_INFO(
		"Configuration item"
		", storage->uploadPartTimeoutInSeconds: {}",
		_uploadPartTimeoutInSeconds
	);
	_maxRetryNumber = JSONUtils::asInt(storageRoot, "maxRetryNumber", 2);
	SPDLOG_INFO(
		"Configuration item"
		", storage->maxRetryNumber: {}",
		_maxRetryNumber
	);
	_secondsToWaitBeforeToRetry = JSONUtils::asInt(storageRoot, "secondsToWaitBeforeToRetry", 5);
	SPDLOG_INFO(
		"Configuration item"
		", storage->secondsToWaitBeforeToRetry: {}",
		_secondsToWaitBeforeToRetry
	);

	if (isConfigured())
		_awsSigner = make_unique<AWSSigner>(_accessKeyId, _secretAccessKey, _region);
	else
		SPDLOG_WARN("Object storage is not configured, every upload will fail");
}

bool S3StorageGateway::isConfigured() const { return _endpointHost != "" && _bucket != "" && _accessKeyId != "" && _secretAccessKey != ""; }

void S3StorageGateway::checkConfiguration(string api)
{
	if (!isConfigured())
	{
		string errorMessage = fmt::format(
			"{}. Object storage is not configured"
			", endpointHost: {}"
			", bucket: {}"
			", accessKeyId present: {}"
			", secretAccessKey present: {}",
			api, _endpointHost, _bucket, _accessKeyId != "", _secretAccessKey != ""
		);
		SPDLOG_ERROR(errorMessage);

		throw StorageUnavailableError(errorMessage);
	}
}

string S3StorageGateway::presign(string method, string objectKey, map<string, string> queryParameters)
{
	string host;
	string canonicalURI;
	if (_pathStyle)
	{
		host = _endpointHost;
		canonicalURI = fmt::format("/{}/{}", _bucket, objectKey);
	}
	else
	{
		host = fmt::format("{}.{}", _bucket, _endpointHost);
		canonicalURI = fmt::format("/{}", objectKey);
	}

	return _awsSigner->presignURL(method, _protocol, host, canonicalURI, queryParameters, _presignExpirationInSeconds);
}

string S3StorageGateway::createMultipartUpload(string objectKey, string contentType)
{
	string api = "createMultipartUpload";

	checkConfiguration(api);

	string referenceToLog = fmt::format(", objectKey: {}", objectKey);
	string url = presign("POST", objectKey, {{"uploads", ""}});

	string responseBody;
	try
	{
		responseBody = CurlWrapper::httpPostString(
						   url, _timeoutInSeconds, "", "", contentType, vector<string>(), referenceToLog, _maxRetryNumber, _secondsToWaitBeforeToRetry
		)
						   .second;
	}
	catch (HTTPError &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), false, e.httpErrorCode);
	}
	catch (CurlException &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), true);
	}

	string uploadId = getXmlElementValue(responseBody, "UploadId");
	if (uploadId == "")
	{
		string errorMessage = fmt::format(
			"{} failed, UploadId is missing"
			"{}"
			", responseBody: {}",
			api, referenceToLog, responseBody
		);
		SPDLOG_ERROR(errorMessage);

		throw TransportError(errorMessage, false);
	}

	SPDLOG_INFO(
		"{} success"
		"{}"
		", contentType: {}"
		", uploadId: {}",
		api, referenceToLog, contentType, uploadId
	);

	return uploadId;
}

vector<SignedPartURL> S3StorageGateway::signPartUploads(string uploadId, string objectKey, int firstPartNumber, int lastPartNumber)
{
	string api = "signPartUploads";

	checkConfiguration(api);

	if (firstPartNumber < 1 || lastPartNumber < firstPartNumber)
	{
		string errorMessage = fmt::format(
			"{}. Wrong part range"
			", uploadId: {}"
			", firstPartNumber: {}"
			", lastPartNumber: {}",
			api, uploadId, firstPartNumber, lastPartNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	chrono::system_clock::time_point expiresAt = chrono::system_clock::now() + chrono::seconds(_presignExpirationInSeconds);

	vector<SignedPartURL> signedPartURLs;
	for (int partNumber = firstPartNumber; partNumber <= lastPartNumber; partNumber++)
	{
		SignedPartURL signedPartURL;
		signedPartURL.partNumber = partNumber;
		signedPartURL.url = presign("PUT", objectKey, {{"partNumber", to_string(partNumber)}, {"uploadId", uploadId}});
		signedPartURL.expiresAt = expiresAt;

		signedPartURLs.push_back(signedPartURL);
	}

	SPDLOG_DEBUG(
		"{} success"
		", uploadId: {}"
		", objectKey: {}"
		", firstPartNumber: {}"
		", lastPartNumber: {}",
		api, uploadId, objectKey, firstPartNumber, lastPartNumber
	);

	return signedPartURLs;
}

string S3StorageGateway::uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled)
{
	string api = "uploadPart";

	string referenceToLog = fmt::format(", partNumber: {}", signedPartURL.partNumber);

	string responseHeader;
	try
	{
		// retries and fallback are up to the caller
		responseHeader =
			CurlWrapper::httpPutBinary(signedPartURL.url, _uploadPartTimeoutInSeconds, bytes, "", vector<string>(), referenceToLog, 0, 0, cancelled);
	}
	catch (TransferCancelled &e)
	{
		throw UploadCancelled(e.what());
	}
	catch (ServerNotReachable &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), true);
	}
	catch (HTTPError &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), false, e.httpErrorCode);
	}
	catch (CurlException &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), true);
	}

	string etag = CurlWrapper::getHeaderValue(responseHeader, "ETag");
	if (etag == "")
	{
		// the store accepted the bytes but the ETag is not readable (i.e.: header not exposed),
		// the relay path is the way to get it
		string errorMessage = fmt::format(
			"{} failed, ETag is missing"
			"{}"
			", responseHeader: {}",
			api, referenceToLog, responseHeader
		);
		SPDLOG_ERROR(errorMessage);

		throw TransportError(errorMessage, true);
	}

	return etag;
}

string S3StorageGateway::completeMultipartUpload(string uploadId, string objectKey, const vector<AcknowledgedPart> &orderedParts)
{
	string api = "completeMultipartUpload";

	checkConfiguration(api);

	StorageGateway::checkOrderedParts(uploadId, orderedParts);

	string referenceToLog = fmt::format(", uploadId: {}, objectKey: {}", uploadId, objectKey);
	string url = presign("POST", objectKey, {{"uploadId", uploadId}});
	string body = buildCompleteMultipartUploadBody(orderedParts);

	string responseBody;
	try
	{
		responseBody = CurlWrapper::httpPostString(
						   url, _timeoutInSeconds, "", body, "application/xml", vector<string>(), referenceToLog, _maxRetryNumber,
						   _secondsToWaitBeforeToRetry
		)
						   .second;
	}
	catch (HTTPError &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), false, e.httpErrorCode);
	}
	catch (CurlException &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), true);
	}

	// S3 may answer 200 and report the failure in the body
	string errorCode = getXmlElementValue(responseBody, "Code");
	if (errorCode != "" && responseBody.find("<Error") != string::npos)
	{
		string errorMessage = fmt::format(
			"{} failed"
			"{}"
			", code: {}"
			", message: {}",
			api, referenceToLog, errorCode, getXmlElementValue(responseBody, "Message")
		);
		SPDLOG_ERROR(errorMessage);

		if (errorCode == "InvalidPart" || errorCode == "InvalidPartOrder")
			throw IncompleteUploadError(errorMessage);
		throw TransportError(errorMessage, false);
	}

	SPDLOG_INFO(
		"{} success"
		"{}"
		", partsNumber: {}",
		api, referenceToLog, orderedParts.size()
	);

	return objectKey;
}

void S3StorageGateway::abortMultipartUpload(string uploadId, string objectKey)
{
	string api = "abortMultipartUpload";

	try
	{
		checkConfiguration(api);

		string referenceToLog = fmt::format(", uploadId: {}, objectKey: {}", uploadId, objectKey);
		string url = presign("DELETE", objectKey, {{"uploadId", uploadId}});

		CurlWrapper::httpDelete(url, _timeoutInSeconds, "", vector<string>(), referenceToLog, _maxRetryNumber, _secondsToWaitBeforeToRetry);

		SPDLOG_INFO(
			"{} success"
			"{}",
			api, referenceToLog
		);
	}
	catch (exception &e)
	{
		// cleanup must not hide the error that caused it
		SPDLOG_ERROR(
			"{} failed"
			", uploadId: {}"
			", objectKey: {}"
			", exception: {}",
			api, uploadId, objectKey, e.what()
		);
	}
}

bool S3StorageGateway::isStorageURL(const string &url)
{
	if (!isConfigured())
		return false;

	string host = _pathStyle ? _endpointHost : fmt::format("{}.{}", _bucket, _endpointHost);
	string prefix = fmt::format("{}://{}/", _protocol, host);
	if (_pathStyle)
		prefix += _bucket + "/";

	return url.size() > prefix.size() && url.compare(0, prefix.size(), prefix) == 0;
}

string S3StorageGateway::buildCompleteMultipartUploadBody(const vector<AcknowledgedPart> &orderedParts)
{
	string body = "<CompleteMultipartUpload>";
	for (const AcknowledgedPart &acknowledgedPart : orderedParts)
		body += fmt::format(
			"<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>", acknowledgedPart.partNumber, xmlEscape(acknowledgedPart.etag)
		);
	body += "</CompleteMultipartUpload>";

	return body;
}

string S3StorageGateway::xmlEscape(const string &value)
{
	// the etags are quoted, i.e.: "0a1b" becomes &quot;0a1b&quot;
	xmlChar *encoded = xmlEncodeSpecialChars(nullptr, (const xmlChar *)value.c_str());
	if (encoded == nullptr)
	{
		string errorMessage = fmt::format(
			"xmlEncodeSpecialChars failed"
			", value: {}",
			value
		);
		SPDLOG_ERROR(errorMessage);

		throw runtime_error(errorMessage);
	}

	string escaped((const char *)encoded);
	xmlFree(encoded);

	return escaped;
}

string S3StorageGateway::getXmlElementValue(const string &xml, const string &elementName)
{
	if (xml == "")
		return "";

	xmlDocPtr doc = xmlReadMemory(xml.data(), (int)xml.size(), "response.xml", nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
	if (doc == nullptr)
	{
		SPDLOG_WARN(
			"xmlReadMemory failed"
			", xml: {}",
			xml
		);

		return "";
	}

	xmlXPathContextPtr xpathCtx = xmlXPathNewContext(doc);
	if (xpathCtx == nullptr)
	{
		xmlFreeDoc(doc);

		SPDLOG_ERROR("xmlXPathNewContext failed");

		return "";
	}

	// S3 replies carry the http://s3.amazonaws.com/doc/2006-03-01/ default namespace
	string xpathExpr = fmt::format("//*[local-name()='{}']", elementName);
	xmlXPathObjectPtr xpathObj = xmlXPathEvalExpression(BAD_CAST xpathExpr.c_str(), xpathCtx);
	if (xpathObj == nullptr)
	{
		xmlXPathFreeContext(xpathCtx);
		xmlFreeDoc(doc);

		SPDLOG_ERROR(
			"xmlXPathEvalExpression failed"
			", xpathExpr: {}",
			xpathExpr
		);

		return "";
	}

	string value;
	xmlNodeSetPtr nodes = xpathObj->nodesetval;
	if (nodes != nullptr && nodes->nodeNr > 0)
	{
		xmlChar *content = xmlNodeGetContent(nodes->nodeTab[0]);
		if (content != nullptr)
		{
			value = (const char *)content;
			xmlFree(content);
		}
	}

	xmlXPathFreeObject(xpathObj);
	xmlXPathFreeContext(xpathCtx);
	xmlFreeDoc(doc);

	return value;
}
