#ifndef StorageGateway_h
#define StorageGateway_h

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "UploadSession.h"

using namespace std;

// short lived credential, never persisted
struct SignedPartURL
{
	int partNumber;
	string url;
	chrono::system_clock::time_point expiresAt;
};

class StorageGateway
{
  public:
	virtual ~StorageGateway() = default;

	virtual string createMultipartUpload(string objectKey, string contentType) = 0;

	// contiguous range firstPartNumber..lastPartNumber, both included
	virtual vector<SignedPartURL> signPartUploads(string uploadId, string objectKey, int firstPartNumber, int lastPartNumber) = 0;

	// direct PUT of one part through its presigned URL, returns the ETag
	virtual string uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled = nullptr) = 0;

	// returns the final object key
	virtual string completeMultipartUpload(string uploadId, string objectKey, const vector<AcknowledgedPart> &orderedParts) = 0;

	// best effort, never throws
	virtual void abortMultipartUpload(string uploadId, string objectKey) = 0;

	// true if url addresses this store, the relay forwards nothing else
	virtual bool isStorageURL(const string &url) { return true; }

	// throws IncompleteUploadError unless the parts are 1..N ascending, without gaps or duplicates
	static void checkOrderedParts(string uploadId, const vector<AcknowledgedPart> &orderedParts);
};

#endif
