#include "TransportWorkerPool.h"

#include "IngestErrors.h"
#include "PartPlanner.h"
#include "spdlog/spdlog.h"

#include <cmath>
#include <thread>

TransportWorkerPool::TransportWorkerPool(shared_ptr<JobLedger> jobLedger, int maxConcurrency)
{
	_jobLedger = jobLedger;
	_maxConcurrency = maxConcurrency < 1 ? 1 : maxConcurrency;
}

int TransportWorkerPool::progressPercent(int64_t uploadedBytes, int64_t totalBytes)
{
	if (totalBytes <= 0)
		return 0;
	if (uploadedBytes >= totalBytes)
		return 100;

	int percent = (int)llround(((double)uploadedBytes / (double)totalBytes) * 100);

	return min(percent, 99);
}

UploadSession TransportWorkerPool::upload(
	int64_t sessionKey, PartSource &partSource, SignedURLCache &signedURLCache, TransportPolicy &transportPolicy, ProgressObserver *progressObserver,
	CancellationToken &cancellationToken
)
{
	UploadRun uploadRun;
	uploadRun.uploadSession = _jobLedger->getUploadSession(sessionKey);
	uploadRun.partSource = &partSource;
	uploadRun.signedURLCache = &signedURLCache;
	uploadRun.transportPolicy = &transportPolicy;
	uploadRun.progressObserver = progressObserver;
	uploadRun.cancellationToken = &cancellationToken;

	const UploadSession &uploadSession = uploadRun.uploadSession;
	if (uploadSession.status != SessionStatus::Active)
	{
		string errorMessage = fmt::format(
			"UploadSession is not active"
			", sessionKey: {}"
			", status: {}",
			sessionKey, UploadSession::toString(uploadSession.status)
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}
	if (partSource.size() != uploadSession.totalBytes)
	{
		string errorMessage = fmt::format(
			"Source size does not match the session"
			", sessionKey: {}"
			", source size: {}"
			", totalBytes: {}",
			sessionKey, partSource.size(), uploadSession.totalBytes
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	vector<int> missingPartNumbers = uploadSession.missingPartNumbers();
	uploadRun.partsToBeUploaded.assign(missingPartNumbers.begin(), missingPartNumbers.end());
	uploadRun.lastProgressPercent = progressPercent(uploadSession.uploadedBytes(), uploadSession.totalBytes);

	int workersNumber = min(_maxConcurrency, (int)missingPartNumbers.size());

	SPDLOG_INFO(
		"Upload started"
		", jobKey: {}"
		", sessionKey: {}"
		", uploadId: {}"
		", totalParts: {}"
		", partsToBeUploaded: {}"
		", workersNumber: {}",
		uploadSession.jobKey, sessionKey, uploadSession.uploadId, uploadSession.totalParts, missingPartNumbers.size(), workersNumber
	);

	vector<thread> workers;
	for (int workerIndex = 0; workerIndex < workersNumber; workerIndex++)
		workers.push_back(thread(&TransportWorkerPool::worker, this, ref(uploadRun)));
	for (thread &workerThread : workers)
		workerThread.join();

	if (uploadRun.firstError != nullptr)
		rethrow_exception(uploadRun.firstError);

	if (cancellationToken.isCancelled())
	{
		string errorMessage = fmt::format(
			"Upload cancelled"
			", jobKey: {}"
			", sessionKey: {}",
			uploadSession.jobKey, sessionKey
		);
		SPDLOG_WARN(errorMessage);

		throw UploadCancelled(errorMessage);
	}

	UploadSession updatedUploadSession = _jobLedger->getUploadSession(sessionKey);

	SPDLOG_INFO(
		"Upload finished"
		", jobKey: {}"
		", sessionKey: {}"
		", uploadedBytes: {}"
		", totalBytes: {}",
		uploadSession.jobKey, sessionKey, updatedUploadSession.uploadedBytes(), updatedUploadSession.totalBytes
	);

	return updatedUploadSession;
}

void TransportWorkerPool::worker(UploadRun &uploadRun)
{
	const UploadSession &uploadSession = uploadRun.uploadSession;
	PartPlanner::Plan plan{uploadSession.totalBytes, uploadSession.partSizeBytes, uploadSession.totalParts};

	while (true)
	{
		int partNumber;
		{
			lock_guard<mutex> locker(uploadRun.queueMutex);

			if (uploadRun.stopped || uploadRun.cancellationToken->isCancelled() || uploadRun.partsToBeUploaded.empty())
				return;

			partNumber = uploadRun.partsToBeUploaded.front();
			uploadRun.partsToBeUploaded.pop_front();

			if (!uploadRun.partsInFlight.insert(partNumber).second)
				continue;
		}

		try
		{
			auto [offset, length] = plan.partRange(partNumber);
			vector<uint8_t> bytes = uploadRun.partSource->read(offset, length);

			string etag = uploadPartWithRetries(uploadRun, partNumber, bytes);

			int64_t uploadedBytes = _jobLedger->acknowledgePart(uploadSession.sessionKey, AcknowledgedPart{partNumber, etag, length});

			reportProgress(uploadRun, uploadedBytes);
		}
		catch (UploadCancelled &e)
		{
			lock_guard<mutex> locker(uploadRun.queueMutex);

			uploadRun.partsInFlight.erase(partNumber);
			uploadRun.stopped = true;

			return;
		}
		catch (exception &e)
		{
			SPDLOG_ERROR(
				"Part upload failed, the session stops"
				", jobKey: {}"
				", sessionKey: {}"
				", partNumber: {}"
				", exception: {}",
				uploadSession.jobKey, uploadSession.sessionKey, partNumber, e.what()
			);

			lock_guard<mutex> locker(uploadRun.queueMutex);

			uploadRun.partsInFlight.erase(partNumber);
			uploadRun.stopped = true;
			if (uploadRun.firstError == nullptr)
				uploadRun.firstError = current_exception();

			return;
		}

		{
			lock_guard<mutex> locker(uploadRun.queueMutex);

			uploadRun.partsInFlight.erase(partNumber);
		}
	}
}

string TransportWorkerPool::uploadPartWithRetries(UploadRun &uploadRun, int partNumber, const vector<uint8_t> &bytes)
{
	TransportPolicy *transportPolicy = uploadRun.transportPolicy;
	CancellationToken *cancellationToken = uploadRun.cancellationToken;

	bool onRelay = transportPolicy->isRelayActive();
	shared_ptr<Transport> transport = transportPolicy->current();
	int failedAttempts = 0;

	while (true)
	{
		if (cancellationToken->isCancelled())
			throw UploadCancelled(fmt::format("Upload cancelled, partNumber: {}", partNumber));

		// another worker may have moved the session to the relay
		if (!onRelay && transportPolicy->isRelayActive())
		{
			onRelay = true;
			transport = transportPolicy->current();
			failedAttempts = 0;
		}

		try
		{
			SignedPartURL signedPartURL = uploadRun.signedURLCache->get(partNumber);

			string etag = transport->uploadPart(signedPartURL, bytes, cancellationToken->flag());

			SPDLOG_DEBUG(
				"Part uploaded"
				", sessionKey: {}"
				", partNumber: {}"
				", transport: {}"
				", etag: {}",
				uploadRun.uploadSession.sessionKey, partNumber, transport->name(), etag
			);

			return etag;
		}
		catch (TransportError &e)
		{
			failedAttempts++;

			SPDLOG_WARN(
				"Part upload attempt failed"
				", sessionKey: {}"
				", partNumber: {}"
				", transport: {}"
				", attempt: {}/{}"
				", networkFailure: {}"
				", httpStatus: {}"
				", exception: {}",
				uploadRun.uploadSession.sessionKey, partNumber, transport->name(), failedAttempts, transportPolicy->retryCount(), e.networkFailure,
				e.httpStatus, e.what()
			);

			if (e.httpStatus == 403)
				uploadRun.signedURLCache->invalidate(partNumber);

			if (!onRelay && transportPolicy->shouldSwitchToRelay(e, failedAttempts))
			{
				transportPolicy->switchToRelay();
				onRelay = true;
				transport = transportPolicy->current();
				failedAttempts = 0;

				continue;
			}

			if (failedAttempts >= transportPolicy->retryCount())
				throw;

			waitBeforeToRetry(uploadRun, transportPolicy->backoff(failedAttempts - 1));
		}
	}
}

void TransportWorkerPool::waitBeforeToRetry(UploadRun &uploadRun, chrono::milliseconds delay)
{
	chrono::system_clock::time_point end = chrono::system_clock::now() + delay;
	while (chrono::system_clock::now() < end && !uploadRun.cancellationToken->isCancelled())
	{
		chrono::milliseconds toBeWaited = chrono::duration_cast<chrono::milliseconds>(end - chrono::system_clock::now());
		this_thread::sleep_for(min(toBeWaited, chrono::milliseconds(100)));
	}
}

void TransportWorkerPool::reportProgress(UploadRun &uploadRun, int64_t uploadedBytes)
{
	int percent = progressPercent(uploadedBytes, uploadRun.uploadSession.totalBytes);

	lock_guard<mutex> locker(uploadRun.progressMutex);

	if (percent <= uploadRun.lastProgressPercent)
		return;
	uploadRun.lastProgressPercent = percent;

	_jobLedger->updateJobProgress(uploadRun.uploadSession.jobKey, percent);

	if (uploadRun.progressObserver != nullptr)
		uploadRun.progressObserver->onProgress(uploadRun.uploadSession.jobKey, percent);
}
