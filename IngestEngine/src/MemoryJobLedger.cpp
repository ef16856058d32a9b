#include "MemoryJobLedger.h"
#include "IngestErrors.h"
#include "spdlog/spdlog.h"

MemoryJobLedger::MemoryJobLedger()
{
	_lastJobKey = 0;
	_lastSessionKey = 0;
}

IngestionJob &MemoryJobLedger::job(int64_t jobKey)
{
	auto it = _jobs.find(jobKey);
	if (it == _jobs.end())
	{
		string errorMessage = fmt::format(
			"IngestionJob is not found"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw JobNotFound(errorMessage);
	}

	return it->second;
}

UploadSession &MemoryJobLedger::session(int64_t sessionKey)
{
	auto it = _sessions.find(sessionKey);
	if (it == _sessions.end())
	{
		string errorMessage = fmt::format(
			"UploadSession is not found"
			", sessionKey: {}",
			sessionKey
		);
		SPDLOG_ERROR(errorMessage);

		throw JobNotFound(errorMessage);
	}

	return it->second;
}

IngestionJob MemoryJobLedger::addIngestionJob(int64_t ownerKey, SourceKind sourceKind, string sourceReference, string contentType)
{
	lock_guard<mutex> locker(_mutex);

	IngestionJob ingestionJob;
	ingestionJob.jobKey = ++_lastJobKey;
	ingestionJob.ownerKey = ownerKey;
	ingestionJob.sourceKind = sourceKind;
	ingestionJob.status = JobStatus::Created;
	ingestionJob.sourceReference = sourceReference;
	ingestionJob.contentType = contentType;
	ingestionJob.objectKey = IngestionJob::sourceObjectKey(ownerKey, ingestionJob.jobKey);
	ingestionJob.createdAt = chrono::system_clock::now();
	ingestionJob.updatedAt = ingestionJob.createdAt;

	_jobs[ingestionJob.jobKey] = ingestionJob;

	return ingestionJob;
}

IngestionJob MemoryJobLedger::getIngestionJob(int64_t jobKey)
{
	lock_guard<mutex> locker(_mutex);

	return job(jobKey);
}

vector<IngestionJob> MemoryJobLedger::getIngestionJobsByStatus(JobStatus status)
{
	lock_guard<mutex> locker(_mutex);

	vector<IngestionJob> ingestionJobs;
	for (const auto &[jobKey, ingestionJob] : _jobs)
	{
		if (ingestionJob.status == status)
			ingestionJobs.push_back(ingestionJob);
	}

	return ingestionJobs;
}

bool MemoryJobLedger::transitionJob(int64_t jobKey, const vector<JobStatus> &allowedFrom, JobStatus to)
{
	lock_guard<mutex> locker(_mutex);

	IngestionJob &ingestionJob = job(jobKey);
	if (find(allowedFrom.begin(), allowedFrom.end(), ingestionJob.status) == allowedFrom.end())
		return false;

	if (to == JobStatus::Uploaded)
		ingestionJob.progressPercent = 100;
	else if (to == JobStatus::Uploading && ingestionJob.status != JobStatus::Uploading)
		ingestionJob.progressPercent = 0;
	else if (to == JobStatus::Processing && ingestionJob.status != JobStatus::Processing)
		ingestionJob.progressPercent = 0;
	else if (to == JobStatus::Ready)
		ingestionJob.progressPercent = 100;

	ingestionJob.status = to;
	ingestionJob.updatedAt = chrono::system_clock::now();

	return true;
}

void MemoryJobLedger::setSourceMetadata(int64_t jobKey, const SourceMetadata &sourceMetadata)
{
	lock_guard<mutex> locker(_mutex);

	IngestionJob &ingestionJob = job(jobKey);
	ingestionJob.metadata = sourceMetadata;
	ingestionJob.updatedAt = chrono::system_clock::now();
}

void MemoryJobLedger::recordRightsConfirmation(int64_t jobKey)
{
	lock_guard<mutex> locker(_mutex);

	IngestionJob &ingestionJob = job(jobKey);
	ingestionJob.rightsConfirmedAt = chrono::system_clock::now();
	ingestionJob.updatedAt = *ingestionJob.rightsConfirmedAt;
}

void MemoryJobLedger::updateJobProgress(int64_t jobKey, int progressPercent)
{
	lock_guard<mutex> locker(_mutex);

	IngestionJob &ingestionJob = job(jobKey);
	if (progressPercent > ingestionJob.progressPercent)
	{
		ingestionJob.progressPercent = min(progressPercent, 100);
		ingestionJob.updatedAt = chrono::system_clock::now();
	}
}

bool MemoryJobLedger::markJobFailed(int64_t jobKey, string errorMessage, string errorStage)
{
	lock_guard<mutex> locker(_mutex);

	IngestionJob &ingestionJob = job(jobKey);
	if (IngestionJob::isJobStatusFinalState(ingestionJob.status))
		return false;

	ingestionJob.status = JobStatus::Failed;
	ingestionJob.errorMessage = errorMessage;
	ingestionJob.errorStage = errorStage;
	ingestionJob.updatedAt = chrono::system_clock::now();

	return true;
}

UploadSession MemoryJobLedger::addUploadSession(const UploadSession &uploadSession)
{
	lock_guard<mutex> locker(_mutex);

	job(uploadSession.jobKey);

	for (const auto &[sessionKey, existingUploadSession] : _sessions)
	{
		if (existingUploadSession.jobKey == uploadSession.jobKey && existingUploadSession.status == SessionStatus::Active)
		{
			string errorMessage = fmt::format(
				"The job has already an active upload session"
				", jobKey: {}"
				", sessionKey: {}",
				uploadSession.jobKey, sessionKey
			);
			SPDLOG_ERROR(errorMessage);

			throw InvalidTransition(errorMessage);
		}
	}

	UploadSession newUploadSession = uploadSession;
	newUploadSession.sessionKey = ++_lastSessionKey;
	newUploadSession.status = SessionStatus::Active;
	newUploadSession.createdAt = chrono::system_clock::now();
	newUploadSession.updatedAt = newUploadSession.createdAt;

	_sessions[newUploadSession.sessionKey] = newUploadSession;

	return newUploadSession;
}

UploadSession MemoryJobLedger::getUploadSession(int64_t sessionKey)
{
	lock_guard<mutex> locker(_mutex);

	return session(sessionKey);
}

optional<UploadSession> MemoryJobLedger::getActiveUploadSession(int64_t jobKey)
{
	lock_guard<mutex> locker(_mutex);

	for (const auto &[sessionKey, uploadSession] : _sessions)
	{
		if (uploadSession.jobKey == jobKey && uploadSession.status == SessionStatus::Active)
			return uploadSession;
	}

	return nullopt;
}

int64_t MemoryJobLedger::acknowledgePart(int64_t sessionKey, const AcknowledgedPart &acknowledgedPart)
{
	lock_guard<mutex> locker(_mutex);

	UploadSession &uploadSession = session(sessionKey);
	if (uploadSession.status != SessionStatus::Active)
	{
		string errorMessage = fmt::format(
			"UploadSession is not active"
			", sessionKey: {}"
			", status: {}"
			", partNumber: {}",
			sessionKey, UploadSession::toString(uploadSession.status), acknowledgedPart.partNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	uploadSession.acknowledgePart(acknowledgedPart);
	uploadSession.updatedAt = chrono::system_clock::now();

	return uploadSession.uploadedBytes();
}

void MemoryJobLedger::closeUploadSession(int64_t sessionKey, SessionStatus status)
{
	lock_guard<mutex> locker(_mutex);

	UploadSession &uploadSession = session(sessionKey);
	uploadSession.status = status;
	uploadSession.updatedAt = chrono::system_clock::now();
}
