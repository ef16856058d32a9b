#ifndef AWSSigner_h
#define AWSSigner_h

#include <chrono>
#include <map>
#include <string>

using namespace std;

// AWS Signature Version 4, query string (presigned URL) flavour
class AWSSigner
{
  public:
	AWSSigner(string accessKeyId, string secretAccessKey, string region, string service = "s3");

	~AWSSigner(void);

	// host has to include the port when it is not the default one.
	// canonicalURI is the not-encoded path (i.e.: /bucket/users/1/jobs/2/source/source.mp4)
	string presignURL(
		string method, string protocol, string host, string canonicalURI, map<string, string> queryParameters, int expirationInSeconds,
		chrono::system_clock::time_point requestTime = chrono::system_clock::now()
	);

	static string uriEncode(const string &value, bool encodeSlash);

	static string sha256Hex(const string &message);

  private:
	string _accessKeyId;
	string _secretAccessKey;
	string _region;
	string _service;

	static string hmacSha256(const string &key, const string &message);

	static string toHex(const unsigned char *buffer, size_t bufferLength);

	static string formatUTC(chrono::system_clock::time_point timePoint, const char *format);
};

#endif
