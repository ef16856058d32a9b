#include "CurlWrapper.h"

#include "JSONUtils.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <openssl/evp.h>
#include <chrono>
#include <exception>
#include <sstream>
#include <thread>

size_t curlWriteStringCallback(char *ptr, size_t size, size_t nmemb, void *f)
{
	try
	{
		string *response = (string *)f;

		response->append(ptr, size * nmemb);

		return size * nmemb;
	}
	catch (exception &e)
	{
		SPDLOG_ERROR(
			"curlWriteStringCallback failed"
			", size: {}"
			", nmemb: {}"
			", exception: {}",
			size, nmemb, e.what()
		);
		// Docs: Returning 0 will signal end-of-file to the library and cause it to
		// stop the current transfer
		return 0;
	}
};

size_t curlWriteStreamCallback(char *ptr, size_t size, size_t nmemb, void *f)
{
	CurlWrapper::CurlStreamData *curlStreamData = (CurlWrapper::CurlStreamData *)f;

	try
	{
		curlStreamData->chunkReceived(ptr, size * nmemb);
		curlStreamData->bytesReceived += (size * nmemb);

		return size * nmemb;
	}
	catch (exception &e)
	{
		// the consumer failed (i.e.: part upload), the transfer has to stop
		SPDLOG_ERROR(
			"curlWriteStreamCallback failed"
			"{}"
			", bytesReceived: {}"
			", exception: {}",
			curlStreamData->referenceToLog, curlStreamData->bytesReceived, e.what()
		);
		curlStreamData->errorMessage = e.what();

		return 0;
	}
};

// returning a non-zero value aborts the transfer (CURLE_ABORTED_BY_CALLBACK)
int curlCancelCallback(void *clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
{
	const atomic<bool> *cancelled = (const atomic<bool> *)clientp;

	return cancelled != nullptr && cancelled->load() ? 1 : 0;
}

void CurlWrapper::globalInitialize() { curl_global_init(CURL_GLOBAL_DEFAULT); }

void CurlWrapper::globalTerminate() { curl_global_cleanup(); }

string CurlWrapper::basicAuthorization(const string &userName, const string &password)
{
	string credentials = fmt::format("{}:{}", userName, password);

	// 4 output bytes every 3 input bytes plus the terminator
	vector<unsigned char> encoded(4 * ((credentials.size() + 2) / 3) + 1);
	int encodedLength = EVP_EncodeBlock(encoded.data(), reinterpret_cast<const unsigned char *>(credentials.data()), credentials.size());

	return fmt::format("Basic {}", string(reinterpret_cast<const char *>(encoded.data()), encodedLength));
}

string CurlWrapper::escape(const string &url)
{
	CURL *curl = curl_easy_init();
	if (!curl)
		throw runtime_error("curl_easy_init failed");

	char *encoded = curl_easy_escape(curl, url.c_str(), url.size());
	if (!encoded)
	{
		curl_easy_cleanup(curl);
		throw runtime_error("curl_easy_escape failed");
	}

	string buffer = encoded;

	curl_free(encoded);

	curl_easy_cleanup(curl);

	return buffer;
}

string CurlWrapper::getHeaderValue(const string &responseHeader, const string &headerName)
{
	string lowerHeaderName = headerName;
	transform(lowerHeaderName.begin(), lowerHeaderName.end(), lowerHeaderName.begin(), [](unsigned char c) { return tolower(c); });

	stringstream ss(responseHeader);
	string line;
	while (getline(ss, line))
	{
		if (!line.empty() && line.back() == '\r')
			line.pop_back();

		size_t separatorIndex = line.find(':');
		if (separatorIndex == string::npos)
			continue;

		string name = line.substr(0, separatorIndex);
		transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return tolower(c); });
		if (name != lowerHeaderName)
			continue;

		string value = line.substr(separatorIndex + 1);
		value.erase(0, value.find_first_not_of(" \t"));
		while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
			value.pop_back();

		return value;
	}

	return "";
}

string CurlWrapper::httpGet(
	string url, long timeoutInSeconds, string authorization, vector<string> otherHeaders, string referenceToLog, int maxRetryNumber,
	int secondsToWaitBeforeToRetry
)
{
	return CurlWrapper::httpRequest(
			   url, "GET", timeoutInSeconds, authorization, nullptr, 0, "", otherHeaders, referenceToLog, maxRetryNumber, secondsToWaitBeforeToRetry,
			   nullptr
	)
		.second;
}

json CurlWrapper::httpGetJson(
	string url, long timeoutInSeconds, string authorization, vector<string> otherHeaders, string referenceToLog, int maxRetryNumber,
	int secondsToWaitBeforeToRetry
)
{
	string response =
		CurlWrapper::httpGet(url, timeoutInSeconds, authorization, otherHeaders, referenceToLog, maxRetryNumber, secondsToWaitBeforeToRetry);

	return JSONUtils::toJson(response);
}

string CurlWrapper::httpDelete(
	string url, long timeoutInSeconds, string authorization, vector<string> otherHeaders, string referenceToLog, int maxRetryNumber,
	int secondsToWaitBeforeToRetry
)
{
	return CurlWrapper::httpRequest(
			   url, "DELETE", timeoutInSeconds, authorization, nullptr, 0, "", otherHeaders, referenceToLog, maxRetryNumber,
			   secondsToWaitBeforeToRetry, nullptr
	)
		.second;
}

pair<string, string> CurlWrapper::httpPostString(
	string url, long timeoutInSeconds, string authorization, string body,
	string contentType, // i.e.: application/json
	vector<string> otherHeaders, string referenceToLog, int maxRetryNumber, int secondsToWaitBeforeToRetry
)
{
	return CurlWrapper::httpRequest(
		url, "POST", timeoutInSeconds, authorization, body.data(), body.size(), contentType, otherHeaders, referenceToLog, maxRetryNumber,
		secondsToWaitBeforeToRetry, nullptr
	);
}

string CurlWrapper::httpPutBinary(
	string url, long timeoutInSeconds, const vector<uint8_t> &binary, string contentType, vector<string> otherHeaders, string referenceToLog,
	int maxRetryNumber, int secondsToWaitBeforeToRetry, const atomic<bool> *cancelled
)
{
	return CurlWrapper::httpRequest(
			   url, "PUT", timeoutInSeconds, "", (const char *)binary.data(), binary.size(), contentType, otherHeaders, referenceToLog,
			   maxRetryNumber, secondsToWaitBeforeToRetry, cancelled
	)
		.first;
}

json CurlWrapper::httpPostBinaryAndGetJson(
	string url, long timeoutInSeconds, string authorization, const vector<uint8_t> &binary, vector<string> otherHeaders, string referenceToLog,
	int maxRetryNumber, int secondsToWaitBeforeToRetry, const atomic<bool> *cancelled
)
{
	string response = CurlWrapper::httpRequest(
						  url, "POST", timeoutInSeconds, authorization, (const char *)binary.data(), binary.size(), "application/octet-stream",
						  otherHeaders, referenceToLog, maxRetryNumber, secondsToWaitBeforeToRetry, cancelled
	)
						  .second;

	return JSONUtils::toJson(response);
}

int64_t CurlWrapper::httpGetStream(
	string url, long connectTimeoutInSeconds, function<void(const char *, size_t)> chunkReceived, string referenceToLog,
	const atomic<bool> *cancelled
)
{
	string api = "httpGetStream";

	CURL *curl = curl_easy_init();
	if (!curl)
	{
		string errorMessage = fmt::format("{}. curl_easy_init failed", api);
		SPDLOG_ERROR(errorMessage);

		throw CurlException(errorMessage);
	}

	CurlStreamData curlStreamData;
	curlStreamData.referenceToLog = referenceToLog;
	curlStreamData.chunkReceived = chunkReceived;
	curlStreamData.bytesReceived = 0;

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connectTimeoutInSeconds);
	curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

	// a stalled source (less than 1KB/sec for 60 secs) is considered broken
	curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
	curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);

	curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void *)&curlStreamData);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteStreamCallback);

	curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
	curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curlCancelCallback);
	curl_easy_setopt(curl, CURLOPT_XFERINFODATA, (void *)cancelled);

	SPDLOG_INFO(
		"{} started"
		"{}"
		", url: {}",
		api, referenceToLog, url
	);

	chrono::system_clock::time_point start = chrono::system_clock::now();
	CURLcode curlCode = curl_easy_perform(curl);
	chrono::system_clock::time_point end = chrono::system_clock::now();

	long responseCode = 0;
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);

	curl_easy_cleanup(curl);

	if (curlCode == CURLE_ABORTED_BY_CALLBACK)
	{
		string errorMessage = fmt::format(
			"{} cancelled"
			"{}"
			", url: {}"
			", bytesReceived: {}",
			api, referenceToLog, url, curlStreamData.bytesReceived
		);
		SPDLOG_WARN(errorMessage);

		throw TransferCancelled(errorMessage);
	}
	else if (curlCode == CURLE_WRITE_ERROR && curlStreamData.errorMessage != "")
	{
		// rethrow the failure of the consumer, it is more meaningful than the curl one
		throw runtime_error(curlStreamData.errorMessage);
	}
	else if (curlCode == CURLE_HTTP_RETURNED_ERROR)
	{
		string errorMessage = fmt::format(
			"{} failed, wrong return status"
			"{}"
			", url: {}"
			", responseCode: {}",
			api, referenceToLog, url, responseCode
		);
		SPDLOG_ERROR(errorMessage);

		throw HTTPError(responseCode, errorMessage);
	}
	else if (curlCode != CURLE_OK)
	{
		string errorMessage = fmt::format(
			"{}. curl_easy_perform failed"
			"{}"
			", curlCode message: {}"
			", url: {}"
			", bytesReceived: {}",
			api, referenceToLog, curl_easy_strerror(curlCode), url, curlStreamData.bytesReceived
		);
		SPDLOG_ERROR(errorMessage);

		throw ServerNotReachable(errorMessage);
	}

	SPDLOG_INFO(
		"{} success"
		"{}"
		", bytesReceived: {}"
		", @statistics@ - elapsed (secs): @{}@",
		api, referenceToLog, curlStreamData.bytesReceived, chrono::duration_cast<chrono::seconds>(end - start).count()
	);

	return curlStreamData.bytesReceived;
}

pair<string, string> CurlWrapper::httpRequest(
	string url,
	string requestType, // GET, POST, PUT or DELETE
	long timeoutInSeconds, string authorization, const char *body, size_t bodySize,
	string contentType, // i.e.: application/json
	vector<string> otherHeaders, string referenceToLog, int maxRetryNumber, int secondsToWaitBeforeToRetry, const atomic<bool> *cancelled
)
{
	string api = fmt::format("http{}", requestType);

	string responseHeaderAndBody;
	string responseHeader;
	string responseBody;
	int retryNumber = -1;

	while (retryNumber < maxRetryNumber)
	{
		retryNumber++;

		CURL *curl = nullptr;
		struct curl_slist *headersList = nullptr;

		responseHeaderAndBody.clear();

		try
		{
			try
			{
				curl = curl_easy_init();
				if (!curl)
				{
					string errorMessage = fmt::format("{}. curl_easy_init failed", api);
					SPDLOG_ERROR(errorMessage);

					throw runtime_error(errorMessage);
				}

				curl_easy_setopt(curl, CURLOPT_URL, url.c_str());

				if (requestType == "GET")
					curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
				else
					curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, requestType.c_str());

				if (requestType == "POST" || requestType == "PUT")
				{
					curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)bodySize);
					curl_easy_setopt(curl, CURLOPT_POSTFIELDS, bodySize > 0 ? body : "");
				}

				// timeout consistent with nginx configuration
				// (fastcgi_read_timeout)
				curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutInSeconds);

				{
					if (contentType != "")
						headersList = curl_slist_append(headersList, fmt::format("Content-Type: {}", contentType).c_str());
					if (authorization != "")
						headersList = curl_slist_append(headersList, fmt::format("Authorization: {}", authorization).c_str());
					// no 'Expect: 100-continue' round trip for the big bodies
					headersList = curl_slist_append(headersList, "Expect:");

					for (string header : otherHeaders)
						headersList = curl_slist_append(headersList, header.c_str());

					curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headersList);
				}

				curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void *)&responseHeaderAndBody);
				curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteStringCallback);

				// store response headers in the response, You simply have to set next option to prefix the header to the
				// normal body output.
				curl_easy_setopt(curl, CURLOPT_HEADER, 1L);

				if (cancelled != nullptr)
				{
					curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
					curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curlCancelCallback);
					curl_easy_setopt(curl, CURLOPT_XFERINFODATA, (void *)cancelled);
				}

				SPDLOG_DEBUG(
					"{} details"
					"{}"
					", url: {}"
					", contentType: {}"
					", otherHeaders.size: {}"
					", bodySize: {}",
					api, referenceToLog, url, contentType, otherHeaders.size(), bodySize
				);

				chrono::system_clock::time_point start = chrono::system_clock::now();
				CURLcode curlCode = curl_easy_perform(curl);
				chrono::system_clock::time_point end = chrono::system_clock::now();
				if (curlCode == CURLE_ABORTED_BY_CALLBACK)
				{
					string errorMessage = fmt::format(
						"{} cancelled"
						"{}"
						", url: {}",
						api, referenceToLog, url
					);

					throw TransferCancelled(errorMessage);
				}
				else if (curlCode != CURLE_OK)
				{
					string errorMessage = fmt::format(
						"{}. curl_easy_perform failed"
						", curlCode message: {}"
						", url: {}",
						api, curl_easy_strerror(curlCode), url
					);

					throw ServerNotReachable(errorMessage);
				}

				long responseCode;
				curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);
				if (responseCode >= 200 && responseCode < 300)
				{
					SPDLOG_DEBUG(
						"{} success"
						"{}"
						", @statistics@ - elapsed (secs): @{}@"
						", responseCode: {}",
						api, referenceToLog, chrono::duration_cast<chrono::seconds>(end - start).count(), responseCode
					);
				}
				else
				{
					string errorMessage = fmt::format(
						"{} failed, wrong return status"
						"{}"
						", @statistics@ - elapsed (secs): @{}@"
						", responseHeaderAndBody: {}"
						", responseCode: {}",
						api, referenceToLog, chrono::duration_cast<chrono::seconds>(end - start).count(), responseHeaderAndBody, responseCode
					);

					throw HTTPError(responseCode, errorMessage);
				}

				// eventuali HTTP/1.1 100 Continue\r\n\r\n vengono scartate
				string prefix("HTTP/1.1 100 Continue\r\n\r\n");
				while (responseHeaderAndBody.starts_with(prefix))
					responseHeaderAndBody = responseHeaderAndBody.substr(prefix.size());

				size_t beginOfHeaderBodySeparatorIndex;
				if ((beginOfHeaderBodySeparatorIndex = responseHeaderAndBody.find("\r\n\r\n")) == string::npos)
				{
					// header only response (i.e.: 204 No Content)
					responseHeader = responseHeaderAndBody;
					responseBody = "";
				}
				else
				{
					responseHeader = responseHeaderAndBody.substr(0, beginOfHeaderBodySeparatorIndex);
					responseBody = responseHeaderAndBody.substr(beginOfHeaderBodySeparatorIndex + 4);
				}

				// LF and CR create problems to the json parser...
				while (responseBody.size() > 0 && (responseBody.back() == 10 || responseBody.back() == 13))
					responseBody.pop_back();

				if (headersList)
				{
					curl_slist_free_all(headersList); /* free the list */
					headersList = nullptr;
				}
				if (curl)
				{
					curl_easy_cleanup(curl);
					curl = nullptr;
				}

				break;
			}
			catch (CurlException &e)
			{
				throw;
			}
			catch (exception &e)
			{
				throw CurlException(e.what());
			}
		}
		catch (CurlException &e)
		{
			if (headersList)
			{
				curl_slist_free_all(headersList); /* free the list */
				headersList = nullptr;
			}
			if (curl)
			{
				curl_easy_cleanup(curl);
				curl = nullptr;
			}

			if (e.type() == "TransferCancelled")
			{
				SPDLOG_WARN(e.what());

				throw;
			}

			SPDLOG_ERROR(e.what());

			if (e.type() == "HTTPError")
			{
				HTTPError *exception = dynamic_cast<HTTPError *>(&e);
				if (exception->httpErrorCode == 404)
					throw;
			}

			if (retryNumber < maxRetryNumber)
			{
				SPDLOG_WARN(
					"{} retry"
					"{}"
					", url: {}"
					", timeoutInSeconds: {}"
					", exception: {}"
					", retryNumber: {}"
					", maxRetryNumber: {}"
					", secondsToWaitBeforeToRetry: {}",
					api, referenceToLog, url, timeoutInSeconds, e.what(), retryNumber, maxRetryNumber, secondsToWaitBeforeToRetry * (retryNumber + 1)
				);
				this_thread::sleep_for(chrono::seconds(secondsToWaitBeforeToRetry * (retryNumber + 1)));
			}
			else
			{
				SPDLOG_ERROR(
					"{} failed"
					"{}"
					", url: {}"
					", timeoutInSeconds: {}"
					", exception: {}",
					api, referenceToLog, url, timeoutInSeconds, e.what()
				);

				if (e.type() == "HTTPError")
				{
					HTTPError *exception = dynamic_cast<HTTPError *>(&e);
					if (exception->httpErrorCode == 502)
						throw ServerNotReachable(e.what());
					else
						throw;
				}
				else
					throw;
			}
		}
	}

	return make_pair(responseHeader, responseBody);
}
