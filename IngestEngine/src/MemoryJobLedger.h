#ifndef MemoryJobLedger_h
#define MemoryJobLedger_h

#include <map>
#include <mutex>

#include "JobLedger.h"

// process local ledger: tests and one shot uploads where nothing has to survive a restart
class MemoryJobLedger : public JobLedger
{
  public:
	MemoryJobLedger();

	~MemoryJobLedger() override = default;

	IngestionJob addIngestionJob(int64_t ownerKey, SourceKind sourceKind, string sourceReference, string contentType) override;

	IngestionJob getIngestionJob(int64_t jobKey) override;

	vector<IngestionJob> getIngestionJobsByStatus(JobStatus status) override;

	bool transitionJob(int64_t jobKey, const vector<JobStatus> &allowedFrom, JobStatus to) override;

	void setSourceMetadata(int64_t jobKey, const SourceMetadata &sourceMetadata) override;

	void recordRightsConfirmation(int64_t jobKey) override;

	void updateJobProgress(int64_t jobKey, int progressPercent) override;

	bool markJobFailed(int64_t jobKey, string errorMessage, string errorStage) override;

	UploadSession addUploadSession(const UploadSession &uploadSession) override;

	UploadSession getUploadSession(int64_t sessionKey) override;

	optional<UploadSession> getActiveUploadSession(int64_t jobKey) override;

	int64_t acknowledgePart(int64_t sessionKey, const AcknowledgedPart &acknowledgedPart) override;

	void closeUploadSession(int64_t sessionKey, SessionStatus status) override;

  private:
	mutex _mutex;
	int64_t _lastJobKey;
	int64_t _lastSessionKey;
	map<int64_t, IngestionJob> _jobs;
	map<int64_t, UploadSession> _sessions;

	IngestionJob &job(int64_t jobKey);
	UploadSession &session(int64_t sessionKey);
};

#endif
