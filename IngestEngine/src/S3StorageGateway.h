#ifndef S3StorageGateway_h
#define S3StorageGateway_h

#include <memory>

#include "AWSSigner.h"
#include "StorageGateway.h"

#include "nlohmann/json.hpp"

using json = nlohmann::json;

// S3 compatible object store (AWS, R2, MinIO) reached through SigV4 presigned URLs
class S3StorageGateway : public StorageGateway
{
  public:
	S3StorageGateway(const json &configurationRoot);

	~S3StorageGateway() override = default;

	string createMultipartUpload(string objectKey, string contentType) override;

	vector<SignedPartURL> signPartUploads(string uploadId, string objectKey, int firstPartNumber, int lastPartNumber) override;

	string uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled = nullptr) override;

	string completeMultipartUpload(string uploadId, string objectKey, const vector<AcknowledgedPart> &orderedParts) override;

	void abortMultipartUpload(string uploadId, string objectKey) override;

	bool isStorageURL(const string &url) override;

	bool isConfigured() const;

	// first element named elementName (namespace ignored), "" if missing
	static string getXmlElementValue(const string &xml, const string &elementName);

	static string buildCompleteMultipartUploadBody(const vector<AcknowledgedPart> &orderedParts);

  private:
	string _protocol;
	string _endpointHost;
	string _bucket;
	string _accessKeyId;
	string _secretAccessKey;
	string _region;
	bool _pathStyle;
	int _presignExpirationInSeconds;
	long _timeoutInSeconds;
	long _uploadPartTimeoutInSeconds;
	int _maxRetryNumber;
	int _secondsToWaitBeforeToRetry;

	unique_ptr<AWSSigner> _awsSigner;

	void checkConfiguration(string api);

	string presign(string method, string objectKey, map<string, string> queryParameters);

	static string xmlEscape(const string &value);
};

#endif
