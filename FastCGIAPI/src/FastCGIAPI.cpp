#include "FastCGIAPI.h"

#include <openssl/evp.h>
#include <sstream>
#include <thread>
#include <tuple>
#include "JSONUtils.h"
#include "spdlog/spdlog.h"

extern char **environ;

FastCGIAPI::FastCGIAPI(json configurationRoot, mutex *fcgiAcceptMutex)
{
	_configurationRoot = configurationRoot;
	_fcgiAcceptMutex = fcgiAcceptMutex;
	_shutdown = false;
	_fcgxFinishDone = false;
	_requestIdentifier = 0;

	json apiRoot = JSONUtils::asJson(_configurationRoot, "api", json::object());
	// a part of the relay carries up to partSizeBytes
	_maxAPIContentLength = JSONUtils::asInt64(apiRoot, "maxContentLength", 64 * 1024 * 1024);
	SPDLOG_INFO(
		"Configuration item"
		", api->maxContentLength: {}",
		_maxAPIContentLength
	);
}

FastCGIAPI::~FastCGIAPI() = default;

int FastCGIAPI::operator()()
{
	string sThreadId;
	{
		stringstream ss;
		ss << this_thread::get_id();
		sThreadId = ss.str();
	}

	FCGX_Request request;

	// 0 is the FastCGI socket inherited from spawn-fcgi
	FCGX_InitRequest(&request, 0, 0);

	while (!_shutdown)
	{
		int returnAcceptCode;
		{
			lock_guard<mutex> locker(*_fcgiAcceptMutex);

			returnAcceptCode = FCGX_Accept_r(&request);
		}

		if (returnAcceptCode != 0)
		{
			SPDLOG_WARN(
				"FCGX_Accept_r failed, the accept loop ends"
				", threadId: {}"
				", returnAcceptCode: {}",
				sThreadId, returnAcceptCode
			);

			_shutdown = true;
			FCGX_Finish_r(&request);

			continue;
		}

		_requestIdentifier++;
		_fcgxFinishDone = false;

		manageRequest(sThreadId, request);

		if (!_fcgxFinishDone)
			FCGX_Finish_r(&request);
	}

	SPDLOG_INFO(
		"FastCGIAPI shutdown"
		", threadId: {}",
		sThreadId
	);

	return 0;
}

void FastCGIAPI::manageRequest(string sThreadId, FCGX_Request &request)
{
	unordered_map<string, string> requestDetails;
	fillEnvironmentDetails(request.envp, requestDetails);
	fillEnvironmentDetails(environ, requestDetails);

	string requestURI;
	string requestMethod;
	string queryString;
	{
		auto it = requestDetails.find("REQUEST_URI");
		if (it != requestDetails.end())
			requestURI = it->second;
		if ((it = requestDetails.find("REQUEST_METHOD")) != requestDetails.end())
			requestMethod = it->second;
		if ((it = requestDetails.find("QUERY_STRING")) != requestDetails.end())
			queryString = it->second;
	}
	unordered_map<string, string> queryParameters = parseQueryString(queryString);

	string requestBody;
	try
	{
		requestBody = readRequestBody(sThreadId, request, requestDetails);
	}
	catch (exception &e)
	{
		sendError(request, 400, e.what());

		return;
	}

	bool authorizationPresent = basicAuthenticationRequired(requestURI, queryParameters);
	string userName;
	string password;
	if (authorizationPresent)
	{
		try
		{
			auto it = requestDetails.find("HTTP_AUTHORIZATION");
			if (it == requestDetails.end())
			{
				SPDLOG_ERROR(
					"No 'Basic' authorization is present into the request"
					", _requestIdentifier: {}"
					", threadId: {}",
					_requestIdentifier, sThreadId
				);

				throw CheckAuthorizationFailed();
			}

			tie(userName, password) = basicCredentials(it->second);

			checkAuthorization(sThreadId, userName, password);
		}
		catch (CheckAuthorizationFailed &e)
		{
			SPDLOG_ERROR(
				"checkAuthorization failed"
				", _requestIdentifier: {}"
				", threadId: {}"
				", userName: {}",
				_requestIdentifier, sThreadId, userName
			);

			sendError(request, 401, e.what());

			return;
		}
		catch (exception &e)
		{
			SPDLOG_ERROR(
				"checkAuthorization failed"
				", _requestIdentifier: {}"
				", threadId: {}"
				", e.what(): {}",
				_requestIdentifier, sThreadId, e.what()
			);

			sendError(request, 500, "Internal server error");

			return;
		}
	}

	chrono::system_clock::time_point startManageRequest = chrono::system_clock::now();
	try
	{
		manageRequestAndResponse(
			sThreadId, _requestIdentifier, request, requestURI, requestMethod, queryParameters, authorizationPresent, userName, password,
			requestBody.size(), requestBody, requestDetails
		);
	}
	catch (exception &e)
	{
		SPDLOG_ERROR(
			"manageRequestAndResponse failed"
			", _requestIdentifier: {}"
			", threadId: {}"
			", e.what(): {}",
			_requestIdentifier, sThreadId, e.what()
		);

		sendError(request, 500, e.what());
	}

	SPDLOG_INFO(
		"Request managed"
		", _requestIdentifier: {}"
		", threadId: {}"
		", clientIPAddress: {}"
		", method: {}"
		", requestMethod: {}"
		", userName: {}"
		", elapsed (millisecs): {}",
		_requestIdentifier, sThreadId, getClientIPAddress(requestDetails), getQueryParameter(queryParameters, "method", string(""), false),
		requestMethod, userName, chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now() - startManageRequest).count()
	);
}

string FastCGIAPI::readRequestBody(string sThreadId, FCGX_Request &request, const unordered_map<string, string> &requestDetails)
{
	auto methodIt = requestDetails.find("REQUEST_METHOD");
	if (methodIt == requestDetails.end() || (methodIt->second != "POST" && methodIt->second != "PUT"))
		return "";

	auto contentLengthIt = requestDetails.find("CONTENT_LENGTH");
	if (contentLengthIt == requestDetails.end() || contentLengthIt->second == "")
		return "";

	int64_t contentLength;
	try
	{
		contentLength = stoll(contentLengthIt->second);
	}
	catch (exception &e)
	{
		throw invalid_argument(fmt::format("Wrong CONTENT_LENGTH: {}", contentLengthIt->second));
	}
	if (contentLength > _maxAPIContentLength)
	{
		string errorMessage = fmt::format(
			"ContentLength too long"
			", _requestIdentifier: {}"
			", threadId: {}"
			", contentLength: {}"
			", _maxAPIContentLength: {}",
			_requestIdentifier, sThreadId, contentLength, _maxAPIContentLength
		);
		SPDLOG_ERROR(errorMessage);

		throw invalid_argument(errorMessage);
	}
	if (contentLength <= 0)
		return "";

	// binary safe: the relay receives the raw bytes of a part
	string requestBody(contentLength, '\0');
	int bytesRead = FCGX_GetStr(requestBody.data(), contentLength, request.in);
	requestBody.resize(bytesRead < 0 ? 0 : bytesRead);

	return requestBody;
}

bool FastCGIAPI::basicAuthenticationRequired(string requestURI, unordered_map<string, string> queryParameters) { return true; }

void FastCGIAPI::sendSuccess(
	string sThreadId, int64_t requestIdentifier, FCGX_Request &request, string requestURI, string requestMethod, int htmlResponseCode,
	string responseBody, string contentType
)
{
	if (_fcgxFinishDone)
	{
		// a second response on the same request would write on a finished stream
		SPDLOG_ERROR(
			"response was already done"
			", requestIdentifier: {}"
			", threadId: {}"
			", requestURI: {}",
			requestIdentifier, sThreadId, requestURI
		);

		return;
	}

	string endLine = "\r\n";

	string contentTypeHeader;
	if (responseBody != "")
		contentTypeHeader = fmt::format("Content-Type: {}{}", contentType == "" ? "application/json; charset=utf-8" : contentType, endLine);

	string headResponse = fmt::format(
		"Status: {} {}{}"
		"{}"
		"Content-Length: {}{}"
		"{}",
		htmlResponseCode, getHtmlStandardMessage(htmlResponseCode), endLine, contentTypeHeader, responseBody.size(), endLine, endLine
	);

	SPDLOG_DEBUG(
		"sendSuccess"
		", requestIdentifier: {}"
		", threadId: {}"
		", requestMethod: {}"
		", htmlResponseCode: {}"
		", responseBody.size: {}",
		requestIdentifier, sThreadId, requestMethod, htmlResponseCode, responseBody.size()
	);

	FCGX_PutStr(headResponse.data(), headResponse.size(), request.out);
	FCGX_PutStr(responseBody.data(), responseBody.size(), request.out);

	FCGX_Finish_r(&request);
	_fcgxFinishDone = true;
}

void FastCGIAPI::sendError(FCGX_Request &request, int htmlResponseCode, string errorMessage)
{
	if (_fcgxFinishDone)
	{
		SPDLOG_ERROR(
			"response was already done"
			", errorMessage: {}",
			errorMessage
		);

		return;
	}

	json responseBodyRoot;
	responseBodyRoot["status"] = htmlResponseCode;
	responseBodyRoot["error"] = errorMessage;
	string responseBody = JSONUtils::toString(responseBodyRoot);

	string endLine = "\r\n";
	string completeHttpResponse = fmt::format(
		"Status: {} {}{}"
		"Content-Type: application/json; charset=utf-8{}"
		"Content-Length: {}{}"
		"{}"
		"{}",
		htmlResponseCode, getHtmlStandardMessage(htmlResponseCode), endLine, endLine, responseBody.size(), endLine, endLine, responseBody
	);

	SPDLOG_INFO(
		"sendError"
		", htmlResponseCode: {}"
		", errorMessage: {}",
		htmlResponseCode, errorMessage
	);

	FCGX_PutStr(completeHttpResponse.data(), completeHttpResponse.size(), request.out);

	FCGX_Finish_r(&request);
	_fcgxFinishDone = true;
}

string FastCGIAPI::getClientIPAddress(const unordered_map<string, string> &requestDetails)
{
	// behind the web server REMOTE_ADDR is the proxy
	auto it = requestDetails.find("HTTP_X_FORWARDED_FOR");
	if (it != requestDetails.end())
		return it->second;
	if ((it = requestDetails.find("REMOTE_ADDR")) != requestDetails.end())
		return it->second;

	return "";
}

string FastCGIAPI::getHeaderValue(const unordered_map<string, string> &requestDetails, string headerName, string defaultValue)
{
	// X-Part-Number is received as HTTP_X_PART_NUMBER
	string variableName = "HTTP_";
	for (char c : headerName)
		variableName.push_back(c == '-' ? '_' : (char)toupper((unsigned char)c));

	auto it = requestDetails.find(variableName);
	if (it == requestDetails.end())
		return defaultValue;

	return it->second;
}

string FastCGIAPI::getHtmlStandardMessage(int htmlResponseCode)
{
	switch (htmlResponseCode)
	{
	case 200:
		return "OK";
	case 201:
		return "Created";
	case 202:
		return "Accepted";
	case 400:
		return "Bad Request";
	case 401:
		return "Unauthorized";
	case 403:
		return "Forbidden";
	case 404:
		return "Not Found";
	case 409:
		return "Conflict";
	case 502:
		return "Bad Gateway";
	case 503:
		return "Service Unavailable";
	default:
		return "Internal Server Error";
	}
}

int32_t FastCGIAPI::getQueryParameter(const unordered_map<string, string> &queryParameters, string parameterName, int32_t defaultParameter, bool mandatory)
{
	return (int32_t)getQueryParameter(queryParameters, parameterName, (int64_t)defaultParameter, mandatory);
}

int64_t FastCGIAPI::getQueryParameter(const unordered_map<string, string> &queryParameters, string parameterName, int64_t defaultParameter, bool mandatory)
{
	string parameterValue = getQueryParameter(queryParameters, parameterName, string(""), mandatory);
	if (parameterValue == "")
		return defaultParameter;

	size_t parsedCharacters = 0;
	int64_t value = 0;
	try
	{
		value = stoll(parameterValue, &parsedCharacters);
	}
	catch (exception &e)
	{
		parsedCharacters = 0;
	}
	if (parsedCharacters == parameterValue.size())
		return value;

	string errorMessage = fmt::format(
		"The {} query parameter is not a number"
		", value: {}",
		parameterName, parameterValue
	);
	SPDLOG_ERROR(errorMessage);

	throw invalid_argument(errorMessage);
}

string FastCGIAPI::getQueryParameter(const unordered_map<string, string> &queryParameters, string parameterName, string defaultParameter, bool mandatory)
{
	auto it = queryParameters.find(parameterName);
	if (it != queryParameters.end() && it->second != "")
		return it->second;

	if (mandatory)
	{
		string errorMessage = fmt::format("The {} query parameter is missing", parameterName);
		SPDLOG_ERROR(errorMessage);

		throw invalid_argument(errorMessage);
	}

	return defaultParameter;
}

pair<string, string> FastCGIAPI::basicCredentials(const string &authorization)
{
	string authorizationPrefix = "Basic ";
	if (authorization.compare(0, authorizationPrefix.size(), authorizationPrefix) != 0)
		throw CheckAuthorizationFailed();

	string encoded = authorization.substr(authorizationPrefix.size());
	if (encoded.empty() || encoded.size() % 4 != 0)
		throw CheckAuthorizationFailed();

	string decoded(encoded.size() / 4 * 3, '\0');
	int decodedLength = EVP_DecodeBlock((unsigned char *)decoded.data(), (const unsigned char *)encoded.data(), encoded.size());
	if (decodedLength < 0)
		throw CheckAuthorizationFailed();

	// EVP_DecodeBlock counts the padding as zero bytes
	if (encoded[encoded.size() - 1] == '=')
		decodedLength--;
	if (encoded[encoded.size() - 2] == '=')
		decodedLength--;
	decoded.resize(decodedLength);

	size_t userNameSeparator = decoded.find(':');
	if (userNameSeparator == string::npos)
		throw CheckAuthorizationFailed();

	return make_pair(decoded.substr(0, userNameSeparator), decoded.substr(userNameSeparator + 1));
}

unordered_map<string, string> FastCGIAPI::parseQueryString(const string &queryString)
{
	auto percentDecode = [](const string &value)
	{
		string decoded;
		for (size_t index = 0; index < value.size(); index++)
		{
			if (value[index] == '+')
				decoded.push_back(' ');
			else if (value[index] == '%' && index + 2 < value.size() && isxdigit((unsigned char)value[index + 1]) &&
					 isxdigit((unsigned char)value[index + 2]))
			{
				decoded.push_back((char)stoi(value.substr(index + 1, 2), nullptr, 16));
				index += 2;
			}
			else
				decoded.push_back(value[index]);
		}

		return decoded;
	};

	unordered_map<string, string> queryParameters;

	stringstream ss(queryString);
	string token;
	while (getline(ss, token, '&'))
	{
		if (token.empty())
			continue;

		size_t keySeparator = token.find('=');
		if (keySeparator == string::npos)
			queryParameters[percentDecode(token)] = "";
		else
			queryParameters[percentDecode(token.substr(0, keySeparator))] = percentDecode(token.substr(keySeparator + 1));
	}

	return queryParameters;
}

void FastCGIAPI::fillEnvironmentDetails(const char *const *envp, unordered_map<string, string> &requestDetails)
{
	for (; *envp; ++envp)
	{
		string environmentKeyValue = *envp;

		size_t valueIndex = environmentKeyValue.find('=');
		if (valueIndex == string::npos)
			continue;

		requestDetails[environmentKeyValue.substr(0, valueIndex)] = environmentKeyValue.substr(valueIndex + 1);
	}
}
