#ifndef JobLedger_h
#define JobLedger_h

#include <optional>
#include <vector>

#include "IngestionJob.h"
#include "UploadSession.h"

// durable record of the ingestion jobs and of their upload sessions.
// Every method is a single atomic operation at the storage layer.
class JobLedger
{
  public:
	virtual ~JobLedger() = default;

	// assigns jobKey, objectKey and the timestamps, status is Created
	virtual IngestionJob addIngestionJob(int64_t ownerKey, SourceKind sourceKind, string sourceReference, string contentType) = 0;

	// throws JobNotFound
	virtual IngestionJob getIngestionJob(int64_t jobKey) = 0;

	virtual vector<IngestionJob> getIngestionJobsByStatus(JobStatus status) = 0;

	// compare and set: the status changes only if the current one is in allowedFrom.
	// Returns false (nothing changed) otherwise
	virtual bool transitionJob(int64_t jobKey, const vector<JobStatus> &allowedFrom, JobStatus to) = 0;

	virtual void setSourceMetadata(int64_t jobKey, const SourceMetadata &sourceMetadata) = 0;

	virtual void recordRightsConfirmation(int64_t jobKey) = 0;

	// never lowers the persisted value
	virtual void updateJobProgress(int64_t jobKey, int progressPercent) = 0;

	// moves any not final job to Failed, returns false if the job was already final
	virtual bool markJobFailed(int64_t jobKey, string errorMessage, string errorStage) = 0;

	// assigns sessionKey and the timestamps
	virtual UploadSession addUploadSession(const UploadSession &uploadSession) = 0;

	// throws JobNotFound
	virtual UploadSession getUploadSession(int64_t sessionKey) = 0;

	virtual optional<UploadSession> getActiveUploadSession(int64_t jobKey) = 0;

	// idempotent upsert by part number on an Active session, returns the uploaded bytes of the session
	virtual int64_t acknowledgePart(int64_t sessionKey, const AcknowledgedPart &acknowledgedPart) = 0;

	virtual void closeUploadSession(int64_t sessionKey, SessionStatus status) = 0;
};

#endif
