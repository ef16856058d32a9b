#include "IngestionEngine.h"

#include "IngestErrors.h"
#include "JSONUtils.h"
#include "PartPlanner.h"
#include "SignedURLCache.h"
#include "TransportPolicy.h"
#include "TransportWorkerPool.h"
#include "YouTubeURL.h"
#include "spdlog/spdlog.h"

IngestionEngine::IngestionEngine(
	const json &configurationRoot, shared_ptr<JobLedger> jobLedger, shared_ptr<StorageGateway> storageGateway, shared_ptr<Transport> relayTransport,
	shared_ptr<SourceMetadataLookup> sourceMetadataLookup, shared_ptr<ProcessingTrigger> processingTrigger,
	shared_ptr<YouTubeIngestAdapter> youTubeIngestAdapter
)
{
	_jobLedger = jobLedger;
	_storageGateway = storageGateway;
	_directTransport = make_shared<DirectTransport>(storageGateway);
	_relayTransport = relayTransport;
	_sourceMetadataLookup = sourceMetadataLookup;
	_processingTrigger = processingTrigger;
	_youTubeIngestAdapter = youTubeIngestAdapter;

	json uploadRoot = JSONUtils::asJson(configurationRoot, "upload", json::object());

	_uploadPartSizeBytes = JSONUtils::asInt64(uploadRoot, "partSizeBytes", PartPlanner::defaultUploadPartSizeBytes);
	SPDLOG_INFO(
		"Configuration item"
		", upload->partSizeBytes: {}",
		_uploadPartSizeBytes
	);
	_maxConcurrency = JSONUtils::asInt(uploadRoot, "maxConcurrency", TransportWorkerPool::defaultMaxConcurrency);
	SPDLOG_INFO(
		"Configuration item"
		", upload->maxConcurrency: {}",
		_maxConcurrency
	);
	_retryCount = JSONUtils::asInt(uploadRoot, "retryCount", 3);
	SPDLOG_INFO(
		"Configuration item"
		", upload->retryCount: {}",
		_retryCount
	);
	_retryDelayInMilliSeconds = JSONUtils::asInt(uploadRoot, "retryDelayInMilliSeconds", 1000);
	SPDLOG_INFO(
		"Configuration item"
		", upload->retryDelayInMilliSeconds: {}",
		_retryDelayInMilliSeconds
	);
	_signBatchSize = JSONUtils::asInt(uploadRoot, "signBatchSize", 20);
	SPDLOG_INFO(
		"Configuration item"
		", upload->signBatchSize: {}",
		_signBatchSize
	);
	_expirationSafetyMarginInSeconds = JSONUtils::asInt(uploadRoot, "expirationSafetyMarginInSeconds", 60);
	SPDLOG_INFO(
		"Configuration item"
		", upload->expirationSafetyMarginInSeconds: {}",
		_expirationSafetyMarginInSeconds
	);
}

IngestionJob IngestionEngine::createBrowserUploadJob(int64_t ownerKey, string fileName, string contentType)
{
	if (fileName == "")
	{
		string errorMessage = fmt::format(
			"fileName is missing"
			", ownerKey: {}",
			ownerKey
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	IngestionJob ingestionJob = _jobLedger->addIngestionJob(ownerKey, SourceKind::BrowserUpload, fileName, contentType == "" ? "video/mp4" : contentType);

	SPDLOG_INFO(
		"Ingestion job created"
		", jobKey: {}"
		", ownerKey: {}"
		", sourceKind: {}"
		", fileName: {}",
		ingestionJob.jobKey, ownerKey, IngestionJob::toString(ingestionJob.sourceKind), fileName
	);

	return ingestionJob;
}

IngestionJob IngestionEngine::createRemoteStreamJob(int64_t ownerKey, string sourceURL)
{
	YouTubeURL::videoId(sourceURL);

	IngestionJob ingestionJob = _jobLedger->addIngestionJob(ownerKey, SourceKind::RemoteStream, sourceURL, "video/mp4");

	SPDLOG_INFO(
		"Ingestion job created"
		", jobKey: {}"
		", ownerKey: {}"
		", sourceKind: {}"
		", sourceURL: {}",
		ingestionJob.jobKey, ownerKey, IngestionJob::toString(ingestionJob.sourceKind), sourceURL
	);

	return ingestionJob;
}

IngestionJob IngestionEngine::getIngestionJob(int64_t jobKey) { return _jobLedger->getIngestionJob(jobKey); }

vector<IngestionJob> IngestionEngine::getIngestionJobsByStatus(JobStatus jobStatus) { return _jobLedger->getIngestionJobsByStatus(jobStatus); }

optional<UploadSession> IngestionEngine::getActiveUploadSession(int64_t jobKey) { return _jobLedger->getActiveUploadSession(jobKey); }

IngestionJob IngestionEngine::fetchSourceMetadata(int64_t jobKey)
{
	IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);
	if (ingestionJob.status != JobStatus::Created)
		return ingestionJob;

	optional<SourceMetadata> sourceMetadata;
	if (ingestionJob.sourceKind == SourceKind::RemoteStream && _sourceMetadataLookup != nullptr)
		sourceMetadata = _sourceMetadataLookup->lookup(ingestionJob.sourceReference);
	else if (ingestionJob.sourceKind == SourceKind::BrowserUpload)
	{
		// the file name, without extension, is the title until the client says otherwise
		SourceMetadata fileMetadata;
		fileMetadata.title = ingestionJob.sourceReference.substr(0, ingestionJob.sourceReference.find_last_of('.'));
		sourceMetadata = fileMetadata;
	}

	if (!sourceMetadata)
	{
		SPDLOG_WARN(
			"Source metadata not found, the job stays CREATED"
			", jobKey: {}"
			", sourceReference: {}",
			jobKey, ingestionJob.sourceReference
		);

		return ingestionJob;
	}

	return setSourceMetadata(jobKey, *sourceMetadata);
}

IngestionJob IngestionEngine::setSourceMetadata(int64_t jobKey, const SourceMetadata &sourceMetadata)
{
	_jobLedger->setSourceMetadata(jobKey, sourceMetadata);
	if (_jobLedger->transitionJob(jobKey, {JobStatus::Created}, JobStatus::MetaReady))
		notifyStageChange(jobKey, JobStatus::MetaReady);

	return _jobLedger->getIngestionJob(jobKey);
}

IngestionJob IngestionEngine::confirmRights(int64_t jobKey)
{
	IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);
	if (ingestionJob.rightsConfirmedAt && ingestionJob.status != JobStatus::Created && ingestionJob.status != JobStatus::MetaReady)
		return ingestionJob;

	_jobLedger->recordRightsConfirmation(jobKey);
	transition(jobKey, {JobStatus::Created, JobStatus::MetaReady}, JobStatus::UploadReady);

	SPDLOG_INFO(
		"Rights confirmed"
		", jobKey: {}",
		jobKey
	);

	return _jobLedger->getIngestionJob(jobKey);
}

UploadSession IngestionEngine::startUpload(int64_t jobKey, int64_t totalBytes, string contentType, int64_t partSizeBytes)
{
	IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);

	if (ingestionJob.sourceKind != SourceKind::BrowserUpload)
	{
		string errorMessage = fmt::format(
			"startUpload is only for browser uploads"
			", jobKey: {}"
			", sourceKind: {}",
			jobKey, IngestionJob::toString(ingestionJob.sourceKind)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	if (ingestionJob.status == JobStatus::Uploading)
	{
		optional<UploadSession> uploadSession = _jobLedger->getActiveUploadSession(jobKey);
		if (uploadSession)
		{
			SPDLOG_INFO(
				"Upload resumed"
				", jobKey: {}"
				", sessionKey: {}"
				", acknowledgedParts: {}/{}",
				jobKey, uploadSession->sessionKey, uploadSession->acknowledgedParts.size(), uploadSession->totalParts
			);

			return *uploadSession;
		}
	}

	if (!ingestionJob.rightsConfirmedAt)
	{
		string errorMessage = fmt::format(
			"Rights confirmation is required before the upload"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw ConsentRequiredError(errorMessage);
	}

	vector<JobStatus> allowedFrom = {JobStatus::MetaReady, JobStatus::UploadReady, JobStatus::Uploading};
	if (find(allowedFrom.begin(), allowedFrom.end(), ingestionJob.status) == allowedFrom.end())
	{
		string errorMessage = fmt::format(
			"Upload cannot start"
			", jobKey: {}"
			", status: {}",
			jobKey, IngestionJob::toString(ingestionJob.status)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}

	PartPlanner::Plan plan = PartPlanner::plan(totalBytes, partSizeBytes > 0 ? partSizeBytes : _uploadPartSizeBytes);

	if (contentType == "")
		contentType = ingestionJob.contentType == "" ? "video/mp4" : ingestionJob.contentType;
	string uploadId = _storageGateway->createMultipartUpload(ingestionJob.objectKey, contentType);

	UploadSession uploadSession;
	uploadSession.jobKey = jobKey;
	uploadSession.objectKey = ingestionJob.objectKey;
	uploadSession.uploadId = uploadId;
	uploadSession.partSizeBytes = plan.partSizeBytes;
	uploadSession.totalParts = plan.totalParts;
	uploadSession.totalBytes = plan.totalBytes;
	try
	{
		uploadSession = _jobLedger->addUploadSession(uploadSession);
	}
	catch (exception &e)
	{
		// i.e.: a concurrent startUpload registered its session first
		SPDLOG_WARN(
			"addUploadSession failed, the multipart upload is aborted"
			", jobKey: {}"
			", uploadId: {}"
			", e.what(): {}",
			jobKey, uploadId, e.what()
		);

		_storageGateway->abortMultipartUpload(uploadId, ingestionJob.objectKey);

		optional<UploadSession> concurrentUploadSession = _jobLedger->getActiveUploadSession(jobKey);
		if (!concurrentUploadSession)
			throw;

		SPDLOG_INFO(
			"Upload already started by a concurrent request"
			", jobKey: {}"
			", sessionKey: {}",
			jobKey, concurrentUploadSession->sessionKey
		);

		return *concurrentUploadSession;
	}

	if (!_jobLedger->transitionJob(jobKey, allowedFrom, JobStatus::Uploading))
	{
		// the job changed meanwhile (i.e.: cancelled)
		_storageGateway->abortMultipartUpload(uploadId, ingestionJob.objectKey);
		_jobLedger->closeUploadSession(uploadSession.sessionKey, SessionStatus::Aborted);

		string errorMessage = fmt::format(
			"Upload cannot start, status changed"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}
	notifyStageChange(jobKey, JobStatus::Uploading);

	SPDLOG_INFO(
		"Upload started"
		", jobKey: {}"
		", sessionKey: {}"
		", uploadId: {}"
		", totalBytes: {}"
		", partSizeBytes: {}"
		", totalParts: {}",
		jobKey, uploadSession.sessionKey, uploadId, plan.totalBytes, plan.partSizeBytes, plan.totalParts
	);

	return uploadSession;
}

IngestionJob IngestionEngine::runUpload(int64_t jobKey, PartSource &partSource)
{
	UploadSession uploadSession = activeUploadSession(jobKey);

	// a wrong source leaves the job resumable, only a failed part fails it
	if (partSource.size() != uploadSession.totalBytes)
	{
		string errorMessage = fmt::format(
			"The source size does not match the upload session"
			", jobKey: {}"
			", sessionKey: {}"
			", sourceSize: {}"
			", totalBytes: {}",
			jobKey, uploadSession.sessionKey, partSource.size(), uploadSession.totalBytes
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	shared_ptr<CancellationToken> cancellationToken = registerRunningJob(jobKey);

	SignedURLCache signedURLCache(
		_storageGateway, uploadSession.uploadId, uploadSession.objectKey, uploadSession.totalParts, _signBatchSize,
		chrono::seconds(_expirationSafetyMarginInSeconds)
	);
	TransportPolicy transportPolicy(_directTransport, _relayTransport, _retryCount, _retryDelayInMilliSeconds);
	TransportWorkerPool transportWorkerPool(_jobLedger, _maxConcurrency);

	try
	{
		transportWorkerPool.upload(uploadSession.sessionKey, partSource, signedURLCache, transportPolicy, _progressObserver.get(), *cancellationToken);
	}
	catch (UploadCancelled &e)
	{
		unregisterRunningJob(jobKey);

		SPDLOG_WARN(
			"Upload stopped, the job can be resumed"
			", jobKey: {}"
			", sessionKey: {}",
			jobKey, uploadSession.sessionKey
		);

		throw;
	}
	catch (InvalidInputError &e)
	{
		// rejected before any part was sent (i.e.: the session was closed meanwhile)
		unregisterRunningJob(jobKey);

		throw;
	}
	catch (exception &e)
	{
		unregisterRunningJob(jobKey);

		failJob(jobKey, e.what(), "upload", uploadSession);

		throw;
	}
	unregisterRunningJob(jobKey);

	return completeUpload(jobKey);
}

bool IngestionEngine::pauseUpload(int64_t jobKey) { return cancelRunningJob(jobKey); }

vector<SignedPartURL> IngestionEngine::signParts(int64_t jobKey, int firstPartNumber, int lastPartNumber)
{
	UploadSession uploadSession = activeUploadSession(jobKey);

	if (firstPartNumber < 1 || lastPartNumber < firstPartNumber || lastPartNumber > uploadSession.totalParts)
	{
		string errorMessage = fmt::format(
			"Wrong part range"
			", jobKey: {}"
			", firstPartNumber: {}"
			", lastPartNumber: {}"
			", totalParts: {}",
			jobKey, firstPartNumber, lastPartNumber, uploadSession.totalParts
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	return _storageGateway->signPartUploads(uploadSession.uploadId, uploadSession.objectKey, firstPartNumber, lastPartNumber);
}

int IngestionEngine::acknowledgePart(int64_t jobKey, int partNumber, string etag, int64_t byteLength)
{
	UploadSession uploadSession = activeUploadSession(jobKey);

	if (partNumber >= 1 && partNumber <= uploadSession.totalParts)
	{
		PartPlanner::Plan plan{uploadSession.totalBytes, uploadSession.partSizeBytes, uploadSession.totalParts};
		if (plan.partLength(partNumber) != byteLength)
		{
			string errorMessage = fmt::format(
				"Wrong part length"
				", jobKey: {}"
				", partNumber: {}"
				", byteLength: {}"
				", expected: {}",
				jobKey, partNumber, byteLength, plan.partLength(partNumber)
			);
			SPDLOG_ERROR(errorMessage);

			throw InvalidInputError(errorMessage);
		}
	}

	int64_t uploadedBytes = _jobLedger->acknowledgePart(uploadSession.sessionKey, AcknowledgedPart{partNumber, etag, byteLength});

	int progressPercent = TransportWorkerPool::progressPercent(uploadedBytes, uploadSession.totalBytes);
	_jobLedger->updateJobProgress(jobKey, progressPercent);

	return _jobLedger->getIngestionJob(jobKey).progressPercent;
}

IngestionJob IngestionEngine::completeUpload(int64_t jobKey)
{
	IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);
	if (ingestionJob.status == JobStatus::Uploaded)
		return ingestionJob;

	UploadSession uploadSession = activeUploadSession(jobKey);
	if (!uploadSession.isEligibleForCompletion())
	{
		vector<int> missingPartNumbers = uploadSession.missingPartNumbers();

		string missingParts;
		for (int partNumber : missingPartNumbers)
			missingParts += (missingParts == "" ? "" : ",") + to_string(partNumber);

		string errorMessage = fmt::format(
			"Upload is not complete"
			", jobKey: {}"
			", acknowledgedParts: {}/{}"
			", missingParts: {}",
			jobKey, uploadSession.acknowledgedParts.size(), uploadSession.totalParts, missingParts
		);
		SPDLOG_ERROR(errorMessage);

		throw IncompleteUploadError(errorMessage);
	}

	string finalKey = _storageGateway->completeMultipartUpload(uploadSession.uploadId, uploadSession.objectKey, uploadSession.orderedParts());

	_jobLedger->closeUploadSession(uploadSession.sessionKey, SessionStatus::Completed);
	transition(jobKey, {JobStatus::Uploading}, JobStatus::Uploaded);

	SPDLOG_INFO(
		"Upload completed"
		", jobKey: {}"
		", sessionKey: {}"
		", objectKey: {}"
		", totalBytes: {}",
		jobKey, uploadSession.sessionKey, finalKey, uploadSession.totalBytes
	);

	triggerProcessing(jobKey);

	return _jobLedger->getIngestionJob(jobKey);
}

IngestionJob IngestionEngine::cancelUpload(int64_t jobKey)
{
	cancelRunningJob(jobKey);

	IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);
	if (IngestionJob::isJobStatusFinalState(ingestionJob.status) || ingestionJob.status == JobStatus::Uploaded ||
		ingestionJob.status == JobStatus::Processing)
	{
		string errorMessage = fmt::format(
			"Upload cannot be cancelled"
			", jobKey: {}"
			", status: {}",
			jobKey, IngestionJob::toString(ingestionJob.status)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}

	failJob(
		jobKey, "Cancelled by user", ingestionJob.sourceKind == SourceKind::RemoteStream ? "import" : "upload", _jobLedger->getActiveUploadSession(jobKey)
	);

	return _jobLedger->getIngestionJob(jobKey);
}

string IngestionEngine::relayPart(int partNumber, string uploadURL, const vector<uint8_t> &bytes)
{
	if (partNumber < 1 || partNumber > PartPlanner::maxPartsNumber || uploadURL == "" || bytes.empty())
	{
		string errorMessage = fmt::format(
			"Wrong relay request"
			", partNumber: {}"
			", bytes: {}",
			partNumber, bytes.size()
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}
	if (!_storageGateway->isStorageURL(uploadURL))
	{
		string errorMessage = fmt::format(
			"The upload URL does not address the object storage"
			", partNumber: {}",
			partNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	SignedPartURL signedPartURL;
	signedPartURL.partNumber = partNumber;
	signedPartURL.url = uploadURL;

	return _storageGateway->uploadPart(signedPartURL, bytes);
}

IngestionJob IngestionEngine::importRemoteStream(int64_t jobKey)
{
	IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);

	if (ingestionJob.sourceKind != SourceKind::RemoteStream || _youTubeIngestAdapter == nullptr)
	{
		string errorMessage = fmt::format(
			"importRemoteStream is only for remote streams"
			", jobKey: {}"
			", sourceKind: {}",
			jobKey, IngestionJob::toString(ingestionJob.sourceKind)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}
	if (!ingestionJob.rightsConfirmedAt)
	{
		string errorMessage = fmt::format(
			"Rights confirmation is required before the import"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw ConsentRequiredError(errorMessage);
	}

	transition(jobKey, {JobStatus::MetaReady, JobStatus::UploadReady}, JobStatus::Uploading);

	shared_ptr<CancellationToken> cancellationToken = registerRunningJob(jobKey);

	try
	{
		_youTubeIngestAdapter->ingest(
			ingestionJob.sourceReference, ingestionJob.objectKey,
			[this, jobKey](int progressPercent)
			{
				_jobLedger->updateJobProgress(jobKey, progressPercent);
				if (_progressObserver != nullptr)
					_progressObserver->onProgress(jobKey, progressPercent);
			},
			*cancellationToken
		);
	}
	catch (exception &e)
	{
		unregisterRunningJob(jobKey);

		// the multipart upload was already aborted by the adapter
		failJob(jobKey, e.what(), "import", nullopt);

		throw;
	}
	unregisterRunningJob(jobKey);

	transition(jobKey, {JobStatus::Uploading}, JobStatus::Uploaded);

	triggerProcessing(jobKey);

	return _jobLedger->getIngestionJob(jobKey);
}

IngestionJob IngestionEngine::updateProcessingProgress(int64_t jobKey, int progressPercent)
{
	IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);
	if (ingestionJob.status == JobStatus::Uploaded)
	{
		if (_jobLedger->transitionJob(jobKey, {JobStatus::Uploaded}, JobStatus::Processing))
			notifyStageChange(jobKey, JobStatus::Processing);
	}
	else if (ingestionJob.status != JobStatus::Processing)
	{
		string errorMessage = fmt::format(
			"Job is not being processed"
			", jobKey: {}"
			", status: {}",
			jobKey, IngestionJob::toString(ingestionJob.status)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}

	// 100 is reached only through markReady
	_jobLedger->updateJobProgress(jobKey, max(0, min(progressPercent, 99)));

	return _jobLedger->getIngestionJob(jobKey);
}

IngestionJob IngestionEngine::markProcessingFailed(int64_t jobKey, string errorMessage)
{
	if (!_jobLedger->markJobFailed(jobKey, errorMessage, "processing"))
	{
		string transitionErrorMessage = fmt::format(
			"Job is already in a final state"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(transitionErrorMessage);

		throw InvalidTransition(transitionErrorMessage);
	}
	notifyStageChange(jobKey, JobStatus::Failed);

	SPDLOG_ERROR(
		"Processing failed"
		", jobKey: {}"
		", errorMessage: {}",
		jobKey, errorMessage
	);

	return _jobLedger->getIngestionJob(jobKey);
}

IngestionJob IngestionEngine::markReady(int64_t jobKey)
{
	transition(jobKey, {JobStatus::Uploaded, JobStatus::Processing}, JobStatus::Ready);

	SPDLOG_INFO(
		"Job ready"
		", jobKey: {}",
		jobKey
	);

	return _jobLedger->getIngestionJob(jobKey);
}

UploadSession IngestionEngine::activeUploadSession(int64_t jobKey)
{
	optional<UploadSession> uploadSession = _jobLedger->getActiveUploadSession(jobKey);
	if (!uploadSession)
	{
		string errorMessage = fmt::format(
			"No active upload session"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}

	return *uploadSession;
}

void IngestionEngine::transition(int64_t jobKey, const vector<JobStatus> &allowedFrom, JobStatus to)
{
	if (!_jobLedger->transitionJob(jobKey, allowedFrom, to))
	{
		IngestionJob ingestionJob = _jobLedger->getIngestionJob(jobKey);

		string errorMessage = fmt::format(
			"Transition not allowed"
			", jobKey: {}"
			", status: {}"
			", to: {}",
			jobKey, IngestionJob::toString(ingestionJob.status), IngestionJob::toString(to)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}

	notifyStageChange(jobKey, to);
}

void IngestionEngine::notifyStageChange(int64_t jobKey, JobStatus jobStatus)
{
	SPDLOG_INFO(
		"Job status changed"
		", jobKey: {}"
		", status: {}",
		jobKey, IngestionJob::toString(jobStatus)
	);

	if (_progressObserver != nullptr)
		_progressObserver->onStageChange(jobKey, jobStatus);
}

void IngestionEngine::triggerProcessing(int64_t jobKey)
{
	if (_processingTrigger == nullptr)
	{
		SPDLOG_WARN(
			"Processing is not configured, the job stays UPLOADED"
			", jobKey: {}",
			jobKey
		);

		return;
	}

	try
	{
		_processingTrigger->trigger(jobKey);
	}
	catch (exception &e)
	{
		// the upload is done but nobody is going to process it
		failJob(jobKey, e.what(), "processing", nullopt);
	}
}

void IngestionEngine::failJob(int64_t jobKey, string errorMessage, string errorStage, const optional<UploadSession> &uploadSession)
{
	if (uploadSession)
	{
		_storageGateway->abortMultipartUpload(uploadSession->uploadId, uploadSession->objectKey);

		try
		{
			_jobLedger->closeUploadSession(uploadSession->sessionKey, SessionStatus::Aborted);
		}
		catch (exception &e)
		{
			SPDLOG_ERROR(
				"closeUploadSession failed"
				", jobKey: {}"
				", sessionKey: {}"
				", exception: {}",
				jobKey, uploadSession->sessionKey, e.what()
			);
		}
	}

	if (_jobLedger->markJobFailed(jobKey, errorMessage, errorStage))
		notifyStageChange(jobKey, JobStatus::Failed);

	SPDLOG_ERROR(
		"Job failed"
		", jobKey: {}"
		", errorStage: {}"
		", errorMessage: {}",
		jobKey, errorStage, errorMessage
	);
}

shared_ptr<CancellationToken> IngestionEngine::registerRunningJob(int64_t jobKey)
{
	lock_guard<mutex> locker(_runningJobsMutex);

	if (_runningJobs.find(jobKey) != _runningJobs.end())
	{
		string errorMessage = fmt::format(
			"The job is already running"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}

	shared_ptr<CancellationToken> cancellationToken = make_shared<CancellationToken>();
	_runningJobs[jobKey] = cancellationToken;

	return cancellationToken;
}

void IngestionEngine::unregisterRunningJob(int64_t jobKey)
{
	lock_guard<mutex> locker(_runningJobsMutex);

	_runningJobs.erase(jobKey);
}

bool IngestionEngine::cancelRunningJob(int64_t jobKey)
{
	lock_guard<mutex> locker(_runningJobsMutex);

	auto it = _runningJobs.find(jobKey);
	if (it == _runningJobs.end())
		return false;

	it->second->cancel();

	return true;
}
