#ifndef CurlWrapper_h
#define CurlWrapper_h

#include <atomic>
#include <cstdint>
#include <functional>
#include <stdexcept>
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include <curl/curl.h>
#include <string>
#include <utility>
#include <vector>

using namespace std;

using json = nlohmann::json;
using orderd_json = nlohmann::ordered_json;
using namespace nlohmann::literals;

struct CurlException : public runtime_error
{
	CurlException(string message) : runtime_error(message) {};
	virtual string type() { return "CurlException"; };
};

// no HTTP status was received: DNS, connection, TLS or timeout
struct ServerNotReachable : public CurlException
{
	ServerNotReachable(string message) : CurlException(message) {};
	virtual string type() { return "ServerNotReachable"; }
};

struct HTTPError : public CurlException
{
	int16_t httpErrorCode;
	HTTPError(int httpErrorCode, string message) : CurlException(message), httpErrorCode(httpErrorCode) {};
	virtual string type() { return "HTTPError"; }
};

struct TransferCancelled : public CurlException
{
	TransferCancelled(string message) : CurlException(message) {};
	virtual string type() { return "TransferCancelled"; }
};

class CurlWrapper
{

  public:
	struct CurlStreamData
	{
		string referenceToLog;
		function<void(const char *, size_t)> chunkReceived;
		int64_t bytesReceived;
		string errorMessage;
	};

	static void globalInitialize();

	static void globalTerminate();

	static string escape(const string &url);

	// value of the Authorization header: "Basic " + base64(userName:password)
	static string basicAuthorization(const string &userName, const string &password);

	static string getHeaderValue(const string &responseHeader, const string &headerName);

	static string httpGet(
		string url, long timeoutInSeconds, string authorization = "", vector<string> otherHeaders = vector<string>(), string referenceToLog = "",
		int maxRetryNumber = 0, int secondsToWaitBeforeToRetry = 15
	);

	static json httpGetJson(
		string url, long timeoutInSeconds, string authorization = "", vector<string> otherHeaders = vector<string>(), string referenceToLog = "",
		int maxRetryNumber = 0, int secondsToWaitBeforeToRetry = 15
	);

	static string httpDelete(
		string url, long timeoutInSeconds, string authorization = "", vector<string> otherHeaders = vector<string>(), string referenceToLog = "",
		int maxRetryNumber = 0, int secondsToWaitBeforeToRetry = 15
	);

	static pair<string, string> httpPostString(
		string url, long timeoutInSeconds, string authorization, string body, string contentType = "application/json",
		vector<string> otherHeaders = vector<string>(), string referenceToLog = "", int maxRetryNumber = 0, int secondsToWaitBeforeToRetry = 15
	);

	// returns the response header, the caller reads the ETag from it
	static string httpPutBinary(
		string url, long timeoutInSeconds, const vector<uint8_t> &binary, string contentType = "", vector<string> otherHeaders = vector<string>(),
		string referenceToLog = "", int maxRetryNumber = 0, int secondsToWaitBeforeToRetry = 15, const atomic<bool> *cancelled = nullptr
	);

	static json httpPostBinaryAndGetJson(
		string url, long timeoutInSeconds, string authorization, const vector<uint8_t> &binary, vector<string> otherHeaders = vector<string>(),
		string referenceToLog = "", int maxRetryNumber = 0, int secondsToWaitBeforeToRetry = 15, const atomic<bool> *cancelled = nullptr
	);

	// the body is delivered to chunkReceived as it arrives, nothing is retried
	static int64_t httpGetStream(
		string url, long connectTimeoutInSeconds, function<void(const char *, size_t)> chunkReceived, string referenceToLog = "",
		const atomic<bool> *cancelled = nullptr
	);

  private:
	static pair<string, string> httpRequest(
		string url,
		string requestType, // GET, POST, PUT or DELETE
		long timeoutInSeconds, string authorization, const char *body, size_t bodySize,
		string contentType, // i.e.: application/json
		vector<string> otherHeaders, string referenceToLog, int maxRetryNumber, int secondsToWaitBeforeToRetry, const atomic<bool> *cancelled
	);
};

#endif
