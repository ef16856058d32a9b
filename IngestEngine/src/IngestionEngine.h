#ifndef IngestionEngine_h
#define IngestionEngine_h

#include <map>
#include <memory>
#include <mutex>

#include "CancellationToken.h"
#include "JobLedger.h"
#include "PartSource.h"
#include "ProcessingTrigger.h"
#include "ProgressObserver.h"
#include "SourceMetadataLookup.h"
#include "StorageGateway.h"
#include "Transport.h"
#include "YouTubeIngestAdapter.h"

using namespace std;

// owns the lifecycle of the ingestion jobs:
// CREATED -> META_READY -> UPLOAD_READY -> UPLOADING -> UPLOADED -> PROCESSING -> READY, FAILED from any not final state
class IngestionEngine
{
  public:
	// relayTransport, sourceMetadataLookup, processingTrigger and youTubeIngestAdapter may be null
	IngestionEngine(
		const json &configurationRoot, shared_ptr<JobLedger> jobLedger, shared_ptr<StorageGateway> storageGateway,
		shared_ptr<Transport> relayTransport, shared_ptr<SourceMetadataLookup> sourceMetadataLookup, shared_ptr<ProcessingTrigger> processingTrigger,
		shared_ptr<YouTubeIngestAdapter> youTubeIngestAdapter
	);

	void setProgressObserver(shared_ptr<ProgressObserver> progressObserver) { _progressObserver = progressObserver; }

	IngestionJob createBrowserUploadJob(int64_t ownerKey, string fileName, string contentType = "video/mp4");

	// throws InvalidInputError if sourceURL is not a YouTube video URL
	IngestionJob createRemoteStreamJob(int64_t ownerKey, string sourceURL);

	IngestionJob getIngestionJob(int64_t jobKey);

	vector<IngestionJob> getIngestionJobsByStatus(JobStatus jobStatus);

	// best effort: the job moves to META_READY only if metadata was found, it is never failed
	IngestionJob fetchSourceMetadata(int64_t jobKey);

	// metadata supplied by the client (i.e.: title of a browser upload)
	IngestionJob setSourceMetadata(int64_t jobKey, const SourceMetadata &sourceMetadata);

	IngestionJob confirmRights(int64_t jobKey);

	// re-entrant: while the job is UPLOADING the active session is returned, no new upload is created
	UploadSession startUpload(int64_t jobKey, int64_t totalBytes, string contentType = "", int64_t partSizeBytes = 0);

	optional<UploadSession> getActiveUploadSession(int64_t jobKey);

	// uploads the missing parts of the active session reading them from partSource, then completes.
	// A part failing on every transport fails the job (stage upload) and aborts the multipart upload.
	// pauseUpload stops it leaving the job UPLOADING, UploadCancelled is thrown
	IngestionJob runUpload(int64_t jobKey, PartSource &partSource);

	// stops a running upload, acknowledged parts are kept for a later runUpload
	bool pauseUpload(int64_t jobKey);

	vector<SignedPartURL> signParts(int64_t jobKey, int firstPartNumber, int lastPartNumber);

	// returns the progress of the job
	int acknowledgePart(int64_t jobKey, int partNumber, string etag, int64_t byteLength);

	// throws IncompleteUploadError (the job stays UPLOADING) until every part is acknowledged
	IngestionJob completeUpload(int64_t jobKey);

	IngestionJob cancelUpload(int64_t jobKey);

	// forwards a part on behalf of a client that cannot reach the store, returns the ETag
	string relayPart(int partNumber, string uploadURL, const vector<uint8_t> &bytes);

	// remote stream path, synchronous: returns once the job is UPLOADED (or FAILED, stage import)
	IngestionJob importRemoteStream(int64_t jobKey);

	// callbacks of the processing collaborator
	IngestionJob updateProcessingProgress(int64_t jobKey, int progressPercent);

	IngestionJob markProcessingFailed(int64_t jobKey, string errorMessage);

	IngestionJob markReady(int64_t jobKey);

  private:
	shared_ptr<JobLedger> _jobLedger;
	shared_ptr<StorageGateway> _storageGateway;
	shared_ptr<Transport> _directTransport;
	shared_ptr<Transport> _relayTransport;
	shared_ptr<SourceMetadataLookup> _sourceMetadataLookup;
	shared_ptr<ProcessingTrigger> _processingTrigger;
	shared_ptr<YouTubeIngestAdapter> _youTubeIngestAdapter;
	shared_ptr<ProgressObserver> _progressObserver;

	int64_t _uploadPartSizeBytes;
	int _maxConcurrency;
	int _retryCount;
	int _retryDelayInMilliSeconds;
	int _signBatchSize;
	int _expirationSafetyMarginInSeconds;

	mutex _runningJobsMutex;
	map<int64_t, shared_ptr<CancellationToken>> _runningJobs;

	shared_ptr<CancellationToken> registerRunningJob(int64_t jobKey);
	void unregisterRunningJob(int64_t jobKey);
	bool cancelRunningJob(int64_t jobKey);

	UploadSession activeUploadSession(int64_t jobKey);

	void transition(int64_t jobKey, const vector<JobStatus> &allowedFrom, JobStatus to);

	void notifyStageChange(int64_t jobKey, JobStatus jobStatus);

	void triggerProcessing(int64_t jobKey);

	void failJob(int64_t jobKey, string errorMessage, string errorStage, const optional<UploadSession> &uploadSession);
};

#endif
