#ifndef PostgresJobLedger_h
#define PostgresJobLedger_h

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include "JobLedger.h"

#include <pqxx/pqxx>

class PostgresJobLedger : public JobLedger
{
  public:
	PostgresJobLedger(const json &configurationRoot);

	~PostgresJobLedger() override = default;

	void createTablesIfNeeded();

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
	struct PostgresConnection
	{
		int connectionId;
		unique_ptr<pqxx::connection> sqlConnection;
	};

	// borrow/unborrow of the connections of the pool, a broken connection is reopened at the next borrow
	struct PostgresConnTrans
	{
		PostgresConnTrans(PostgresJobLedger *ledger);
		~PostgresConnTrans();

		PostgresJobLedger *ledger;
		shared_ptr<PostgresConnection> connection;
		unique_ptr<pqxx::work> transaction;
	};

	string _connectionString;
	int _poolSize;

	mutex _poolMutex;
	condition_variable _poolCondition;
	deque<shared_ptr<PostgresConnection>> _freeConnections;

	shared_ptr<PostgresConnection> borrow();
	void unborrow(shared_ptr<PostgresConnection> connection);

	pqxx::result exec(PostgresConnTrans &trans, string sqlStatement);

	IngestionJob getIngestionJob(PostgresConnTrans &trans, int64_t jobKey);
	IngestionJob toIngestionJob(const pqxx::row &row);
	UploadSession getUploadSession(PostgresConnTrans &trans, int64_t sessionKey, bool forUpdate);
	void logQueryFailure(PostgresConnTrans &trans, const exception &e);

	static string ingestionJobColumns();
	static string uploadSessionColumns();
};

#endif
