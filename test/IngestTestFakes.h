#ifndef IngestTestFakes_h
#define IngestTestFakes_h

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>

#include "IngestErrors.h"
#include "PartSource.h"
#include "ProcessingTrigger.h"
#include "ProgressObserver.h"
#include "SourceMetadataLookup.h"
#include "StorageGateway.h"
#include "Transport.h"
#include "spdlog/spdlog.h"

using namespace std;

// object store kept in memory, part uploads may be made to fail through failUploadPart
class FakeStorageGateway : public StorageGateway
{
  public:
	string storagePrefix = "https://store.test/videoingest/";
	chrono::seconds signExpiration = chrono::seconds(3600);

	// called before every part upload, it may throw
	function<void(int partNumber)> failUploadPart;
	// called outside the lock, i.e.: to slow down the creation
	function<void()> beforeCreateMultipartUpload;

	mutex fakeMutex;
	int createdUploads = 0;
	vector<string> contentTypes;
	vector<pair<int, int>> signedRanges;
	map<int, int> uploadAttempts;
	map<int, int64_t> uploadedPartBytes;
	vector<AcknowledgedPart> completedParts;
	vector<string> completedUploadIds;
	vector<string> abortedUploadIds;

	string createMultipartUpload(string objectKey, string contentType) override
	{
		if (beforeCreateMultipartUpload)
			beforeCreateMultipartUpload();

		lock_guard<mutex> locker(fakeMutex);

		contentTypes.push_back(contentType);

		return fmt::format("upload-{}", ++createdUploads);
	}

	vector<SignedPartURL> signPartUploads(string uploadId, string objectKey, int firstPartNumber, int lastPartNumber) override
	{
		lock_guard<mutex> locker(fakeMutex);

		signedRanges.push_back(make_pair(firstPartNumber, lastPartNumber));

		vector<SignedPartURL> signedPartURLs;
		for (int partNumber = firstPartNumber; partNumber <= lastPartNumber; partNumber++)
			signedPartURLs.push_back(SignedPartURL{
				partNumber, fmt::format("{}{}?partNumber={}&uploadId={}", storagePrefix, objectKey, partNumber, uploadId),
				chrono::system_clock::now() + signExpiration
			});

		return signedPartURLs;
	}

	string uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled = nullptr) override
	{
		{
			lock_guard<mutex> locker(fakeMutex);

			uploadAttempts[signedPartURL.partNumber]++;
		}

		if (failUploadPart)
			failUploadPart(signedPartURL.partNumber);

		lock_guard<mutex> locker(fakeMutex);

		uploadedPartBytes[signedPartURL.partNumber] = bytes.size();

		return fmt::format("\"etag-{}\"", signedPartURL.partNumber);
	}

	string completeMultipartUpload(string uploadId, string objectKey, const vector<AcknowledgedPart> &orderedParts) override
	{
		checkOrderedParts(uploadId, orderedParts);

		lock_guard<mutex> locker(fakeMutex);

		completedUploadIds.push_back(uploadId);
		completedParts = orderedParts;

		return objectKey;
	}

	void abortMultipartUpload(string uploadId, string objectKey) override
	{
		lock_guard<mutex> locker(fakeMutex);

		abortedUploadIds.push_back(uploadId);
	}

	bool isStorageURL(const string &url) override { return url.compare(0, storagePrefix.size(), storagePrefix) == 0; }

	int attemptsOf(int partNumber)
	{
		lock_guard<mutex> locker(fakeMutex);

		return uploadAttempts[partNumber];
	}
};

class FakeRelayTransport : public Transport
{
  public:
	function<void(int partNumber)> failUploadPart;

	mutex fakeMutex;
	vector<int> relayedParts;

	string uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled) override
	{
		if (failUploadPart)
			failUploadPart(signedPartURL.partNumber);

		lock_guard<mutex> locker(fakeMutex);

		relayedParts.push_back(signedPartURL.partNumber);

		return fmt::format("\"relay-etag-{}\"", signedPartURL.partNumber);
	}

	string name() override { return "fakeRelay"; }

	set<int> relayedPartSet()
	{
		lock_guard<mutex> locker(fakeMutex);

		return set<int>(relayedParts.begin(), relayedParts.end());
	}
};

// bytes generated from the offset, nothing is kept in memory
class FakePartSource : public PartSource
{
  public:
	FakePartSource(int64_t size) : _size(size) {}

	int64_t size() override { return _size; }

	vector<uint8_t> read(int64_t offset, int64_t length) override
	{
		vector<uint8_t> bytes(length);
		for (int64_t index = 0; index < length; index++)
			bytes[index] = (uint8_t)((offset + index) % 251);

		return bytes;
	}

  private:
	int64_t _size;
};

class RecordingProgressObserver : public ProgressObserver
{
  public:
	mutex observerMutex;
	vector<int> progress;
	vector<JobStatus> stages;
	// called after a progress is recorded, i.e. to pause the upload
	function<void(int progressPercent)> onProgressHook;

	void onProgress(int64_t jobKey, int progressPercent) override
	{
		{
			lock_guard<mutex> locker(observerMutex);

			progress.push_back(progressPercent);
		}

		if (onProgressHook)
			onProgressHook(progressPercent);
	}

	void onStageChange(int64_t jobKey, JobStatus jobStatus) override
	{
		lock_guard<mutex> locker(observerMutex);

		stages.push_back(jobStatus);
	}
};

class FakeProcessingTrigger : public ProcessingTrigger
{
  public:
	bool fail = false;
	vector<int64_t> triggeredJobKeys;

	void trigger(int64_t jobKey) override
	{
		if (fail)
			throw ProcessingError(fmt::format("processing endpoint unavailable, jobKey: {}", jobKey));

		triggeredJobKeys.push_back(jobKey);
	}
};

class FakeMetadataLookup : public SourceMetadataLookup
{
  public:
	optional<SourceMetadata> sourceMetadata;

	optional<SourceMetadata> lookup(string sourceURL) override { return sourceMetadata; }
};

#endif
