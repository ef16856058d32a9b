#include "AWSSigner.h"

#include <ctime>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

#include "spdlog/spdlog.h"

AWSSigner::AWSSigner(string accessKeyId, string secretAccessKey, string region, string service)
{
	_accessKeyId = accessKeyId;
	_secretAccessKey = secretAccessKey;
	_region = region;
	_service = service;
}

AWSSigner::~AWSSigner(void) {}

string AWSSigner::presignURL(
	string method, string protocol, string host, string canonicalURI, map<string, string> queryParameters, int expirationInSeconds,
	chrono::system_clock::time_point requestTime
)
{
	string algorithm = "AWS4-HMAC-SHA256";
	string amzDate = formatUTC(requestTime, "%Y%m%dT%H%M%SZ");
	string dateStamp = formatUTC(requestTime, "%Y%m%d");
	string credentialScope = fmt::format("{}/{}/{}/aws4_request", dateStamp, _region, _service);

	queryParameters["X-Amz-Algorithm"] = algorithm;
	queryParameters["X-Amz-Credential"] = fmt::format("{}/{}", _accessKeyId, credentialScope);
	queryParameters["X-Amz-Date"] = amzDate;
	queryParameters["X-Amz-Expires"] = to_string(expirationInSeconds);
	queryParameters["X-Amz-SignedHeaders"] = "host";

	// sorted by encoded key; the parameter names used here do not change order once encoded
	map<string, string> encodedQueryParameters;
	for (const auto &[name, value] : queryParameters)
		encodedQueryParameters[uriEncode(name, true)] = uriEncode(value, true);

	string canonicalQueryString;
	for (const auto &[name, value] : encodedQueryParameters)
	{
		if (canonicalQueryString != "")
			canonicalQueryString += "&";
		canonicalQueryString += (name + "=" + value);
	}

	string encodedURI = uriEncode(canonicalURI.empty() ? "/" : canonicalURI, false);

	string canonicalRequest = fmt::format(
		"{}\n"
		"{}\n"
		"{}\n"
		"host:{}\n"
		"\n"
		"host\n"
		"UNSIGNED-PAYLOAD",
		method, encodedURI, canonicalQueryString, host
	);

	string stringToSign = fmt::format(
		"{}\n"
		"{}\n"
		"{}\n"
		"{}",
		algorithm, amzDate, credentialScope, sha256Hex(canonicalRequest)
	);

	string signingKey = hmacSha256("AWS4" + _secretAccessKey, dateStamp);
	signingKey = hmacSha256(signingKey, _region);
	signingKey = hmacSha256(signingKey, _service);
	signingKey = hmacSha256(signingKey, "aws4_request");

	string rawSignature = hmacSha256(signingKey, stringToSign);
	string signature = toHex((const unsigned char *)rawSignature.data(), rawSignature.size());

	SPDLOG_TRACE(
		"presignURL"
		", method: {}"
		", host: {}"
		", canonicalURI: {}"
		", canonicalRequest: {}"
		", stringToSign: {}",
		method, host, encodedURI, canonicalRequest, stringToSign
	);

	return fmt::format("{}://{}{}?{}&X-Amz-Signature={}", protocol, host, encodedURI, canonicalQueryString, signature);
}

string AWSSigner::uriEncode(const string &value, bool encodeSlash)
{
	static const char *hexDigits = "0123456789ABCDEF";

	string encoded;
	encoded.reserve(value.size() * 3);
	for (unsigned char c : value)
	{
		if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~')
			encoded.push_back(c);
		else if (c == '/' && !encodeSlash)
			encoded.push_back(c);
		else
		{
			encoded.push_back('%');
			encoded.push_back(hexDigits[c >> 4]);
			encoded.push_back(hexDigits[c & 0x0F]);
		}
	}

	return encoded;
}

string AWSSigner::sha256Hex(const string &message)
{
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digestLength = 0;

	if (EVP_Digest(message.data(), message.size(), digest, &digestLength, EVP_sha256(), nullptr) != 1)
	{
		string errorMessage = "EVP_Digest failed";
		SPDLOG_ERROR(errorMessage);

		throw runtime_error(errorMessage);
	}

	return toHex(digest, digestLength);
}

string AWSSigner::hmacSha256(const string &key, const string &message)
{
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digestLength = 0;

	if (HMAC(
			EVP_sha256(), key.data(), (int)key.size(), (const unsigned char *)message.data(), message.size(), digest, &digestLength
		) == nullptr)
	{
		string errorMessage = "HMAC failed";
		SPDLOG_ERROR(errorMessage);

		throw runtime_error(errorMessage);
	}

	return string((const char *)digest, digestLength);
}

string AWSSigner::toHex(const unsigned char *buffer, size_t bufferLength)
{
	static const char *hexDigits = "0123456789abcdef";

	string hex;
	hex.reserve(bufferLength * 2);
	for (size_t index = 0; index < bufferLength; index++)
	{
		hex.push_back(hexDigits[buffer[index] >> 4]);
		hex.push_back(hexDigits[buffer[index] & 0x0F]);
	}

	return hex;
}

string AWSSigner::formatUTC(chrono::system_clock::time_point timePoint, const char *format)
{
	time_t utcTime = chrono::system_clock::to_time_t(timePoint);

	tm tmUTC;
	gmtime_r(&utcTime, &tmUTC);

	char buffer[64];
	strftime(buffer, sizeof(buffer), format, &tmUTC);

	return buffer;
}
