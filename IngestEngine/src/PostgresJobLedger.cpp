#include "PostgresJobLedger.h"

#include "IngestErrors.h"
#include "JSONUtils.h"
#include "spdlog/spdlog.h"

using namespace pqxx;

PostgresJobLedger::PostgresConnTrans::PostgresConnTrans(PostgresJobLedger *ledger)
{
	this->ledger = ledger;
	connection = ledger->borrow();
	transaction = make_unique<work>(*(connection->sqlConnection));
}

PostgresJobLedger::PostgresConnTrans::~PostgresConnTrans()
{
	// a transaction not committed is rolled back by its destructor
	transaction.reset();
	ledger->unborrow(connection);
}

PostgresJobLedger::PostgresJobLedger(const json &configurationRoot)
{
	json postgresRoot = JSONUtils::asJson(configurationRoot, "postgres", json::object());

	string host = JSONUtils::asString(postgresRoot, "host", "localhost");
	SPDLOG_INFO(
		"Configuration item"
		", postgres->host: {}",
		host
	);
	int port = JSONUtils::asInt(postgresRoot, "port", 5432);
	SPDLOG_INFO(
		"Configuration item"
		", postgres->port: {}",
		port
	);
	string dbName = JSONUtils::asString(postgresRoot, "dbName", "videoingest");
	SPDLOG_INFO(
		"Configuration item"
		", postgres->dbName: {}",
		dbName
	);
	string user = JSONUtils::asString(postgresRoot, "user", "videoingest");
	SPDLOG_INFO(
		"Configuration item"
		", postgres->user: {}",
		user
	);
	string password = JSONUtils::asString(postgresRoot, "password", "");
	_poolSize = JSONUtils::asInt(postgresRoot, "poolSize", 5);
	SPDLOG_INFO(
		"Configuration item"
		", postgres->poolSize: {}",
		_poolSize
	);
	if (_poolSize < 1)
		_poolSize = 1;

	_connectionString = fmt::format("host={} port={} dbname={} user={} password={}", host, port, dbName, user, password);

	for (int connectionId = 0; connectionId < _poolSize; connectionId++)
	{
		shared_ptr<PostgresConnection> connection = make_shared<PostgresConnection>();
		connection->connectionId = connectionId;
		connection->sqlConnection = make_unique<pqxx::connection>(_connectionString);

		_freeConnections.push_back(connection);
	}
}

shared_ptr<PostgresJobLedger::PostgresConnection> PostgresJobLedger::borrow()
{
	shared_ptr<PostgresConnection> connection;
	{
		unique_lock<mutex> locker(_poolMutex);

		_poolCondition.wait(locker, [this] { return !_freeConnections.empty(); });

		connection = _freeConnections.front();
		_freeConnections.pop_front();
	}

	if (!connection->sqlConnection->is_open())
	{
		SPDLOG_WARN(
			"Postgres connection is not open, reconnecting"
			", connectionId: {}",
			connection->connectionId
		);

		try
		{
			connection->sqlConnection = make_unique<pqxx::connection>(_connectionString);
		}
		catch (exception &e)
		{
			unborrow(connection);

			throw;
		}
	}

	return connection;
}

void PostgresJobLedger::unborrow(shared_ptr<PostgresConnection> connection)
{
	{
		lock_guard<mutex> locker(_poolMutex);

		_freeConnections.push_back(connection);
	}
	_poolCondition.notify_one();
}

pqxx::result PostgresJobLedger::exec(PostgresConnTrans &trans, string sqlStatement)
{
	chrono::system_clock::time_point startSql = chrono::system_clock::now();
	result res = trans.transaction->exec(sqlStatement);
	SPDLOG_DEBUG(
		"SQL statement"
		", sqlStatement: @{}@"
		", getConnectionId: @{}@"
		", elapsed (millisecs): @{}@",
		sqlStatement, trans.connection->connectionId,
		chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now() - startSql).count()
	);

	return res;
}

void PostgresJobLedger::logQueryFailure(PostgresConnTrans &trans, const exception &e)
{
	sql_error const *se = dynamic_cast<sql_error const *>(&e);
	if (se != nullptr)
		SPDLOG_ERROR(
			"query failed"
			", query: {}"
			", exceptionMessage: {}"
			", conn: {}",
			se->query(), se->what(), trans.connection->connectionId
		);
	else
		SPDLOG_ERROR(
			"query failed"
			", exception: {}"
			", conn: {}",
			e.what(), trans.connection->connectionId
		);
}

void PostgresJobLedger::createTablesIfNeeded()
{
	PostgresConnTrans trans(this);
	try
	{
		{
			string sqlStatement = "create table if not exists VI_IngestionJob ("
								  "jobKey					bigint GENERATED ALWAYS AS IDENTITY, "
								  "ownerKey				bigint not null, "
								  "sourceKind				text not null, "
								  "status					text not null, "
								  "sourceReference			text not null, "
								  "objectKey				text null, "
								  "contentType				text null, "
								  "progressPercent			smallint not null default 0, "
								  "title					text null, "
								  "author					text null, "
								  "thumbnailURL				text null, "
								  "rightsConfirmedAt		timestamp with time zone null, "
								  "errorMessage				text null, "
								  "errorStage				text null, "
								  "createdAt				timestamp with time zone not null default now(), "
								  "updatedAt				timestamp with time zone not null default now(), "
								  "constraint VI_IngestionJob_PK PRIMARY KEY (jobKey))";
			exec(trans, sqlStatement);
		}

		{
			string sqlStatement = "create index if not exists VI_IngestionJob_idx1 on VI_IngestionJob (status)";
			exec(trans, sqlStatement);
		}

		{
			string sqlStatement = "create table if not exists VI_UploadSession ("
								  "sessionKey				bigint GENERATED ALWAYS AS IDENTITY, "
								  "jobKey					bigint not null, "
								  "objectKey				text not null, "
								  "uploadId					text not null, "
								  "partSizeBytes			bigint not null, "
								  "totalParts				integer not null, "
								  "totalBytes				bigint not null, "
								  "status					text not null, "
								  "createdAt				timestamp with time zone not null default now(), "
								  "updatedAt				timestamp with time zone not null default now(), "
								  "constraint VI_UploadSession_PK PRIMARY KEY (sessionKey), "
								  "constraint VI_UploadSession_FK foreign key (jobKey) "
								  "references VI_IngestionJob (jobKey) on delete cascade)";
			exec(trans, sqlStatement);
		}

		{
			// at most one active session per job
			string sqlStatement = "create unique index if not exists VI_UploadSession_idx1 on VI_UploadSession (jobKey) "
								  "where status = 'ACTIVE'";
			exec(trans, sqlStatement);
		}

		{
			string sqlStatement = "create table if not exists VI_UploadSessionPart ("
								  "sessionKey				bigint not null, "
								  "partNumber				integer not null, "
								  "etag						text not null, "
								  "byteLength				bigint not null, "
								  "acknowledgedAt			timestamp with time zone not null default now(), "
								  "constraint VI_UploadSessionPart_PK PRIMARY KEY (sessionKey, partNumber), "
								  "constraint VI_UploadSessionPart_FK foreign key (sessionKey) "
								  "references VI_UploadSession (sessionKey) on delete cascade)";
			exec(trans, sqlStatement);
		}

		trans.transaction->commit();
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

string PostgresJobLedger::ingestionJobColumns()
{
	return "jobKey, ownerKey, sourceKind, status, sourceReference, objectKey, contentType, progressPercent, "
		   "title, author, thumbnailURL, "
		   "extract(epoch from rightsConfirmedAt)::bigint as rightsConfirmedAt, "
		   "errorMessage, errorStage, "
		   "extract(epoch from createdAt)::bigint as createdAt, "
		   "extract(epoch from updatedAt)::bigint as updatedAt";
}

string PostgresJobLedger::uploadSessionColumns()
{
	return "sessionKey, jobKey, objectKey, uploadId, partSizeBytes, totalParts, totalBytes, status, "
		   "extract(epoch from createdAt)::bigint as createdAt, "
		   "extract(epoch from updatedAt)::bigint as updatedAt";
}

IngestionJob PostgresJobLedger::toIngestionJob(const pqxx::row &row)
{
	IngestionJob ingestionJob;

	ingestionJob.jobKey = row["jobKey"].as<int64_t>();
	ingestionJob.ownerKey = row["ownerKey"].as<int64_t>();
	ingestionJob.sourceKind = IngestionJob::toSourceKind(row["sourceKind"].as<string>());
	ingestionJob.status = IngestionJob::toJobStatus(row["status"].as<string>());
	ingestionJob.sourceReference = row["sourceReference"].as<string>();
	if (!row["objectKey"].is_null())
		ingestionJob.objectKey = row["objectKey"].as<string>();
	if (!row["contentType"].is_null())
		ingestionJob.contentType = row["contentType"].as<string>();
	ingestionJob.progressPercent = row["progressPercent"].as<int>();
	if (!row["title"].is_null())
		ingestionJob.metadata.title = row["title"].as<string>();
	if (!row["author"].is_null())
		ingestionJob.metadata.author = row["author"].as<string>();
	if (!row["thumbnailURL"].is_null())
		ingestionJob.metadata.thumbnailURL = row["thumbnailURL"].as<string>();
	if (!row["rightsConfirmedAt"].is_null())
		ingestionJob.rightsConfirmedAt = chrono::system_clock::from_time_t(row["rightsConfirmedAt"].as<int64_t>());
	if (!row["errorMessage"].is_null())
		ingestionJob.errorMessage = row["errorMessage"].as<string>();
	if (!row["errorStage"].is_null())
		ingestionJob.errorStage = row["errorStage"].as<string>();
	ingestionJob.createdAt = chrono::system_clock::from_time_t(row["createdAt"].as<int64_t>());
	ingestionJob.updatedAt = chrono::system_clock::from_time_t(row["updatedAt"].as<int64_t>());

	return ingestionJob;
}

IngestionJob PostgresJobLedger::getIngestionJob(PostgresConnTrans &trans, int64_t jobKey)
{
	string sqlStatement = fmt::format("select {} from VI_IngestionJob where jobKey = {}", ingestionJobColumns(), jobKey);
	result res = exec(trans, sqlStatement);
	if (res.empty())
	{
		string errorMessage = fmt::format(
			"IngestionJob is not found"
			", jobKey: {}",
			jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw JobNotFound(errorMessage);
	}

	return toIngestionJob(res[0]);
}

UploadSession PostgresJobLedger::getUploadSession(PostgresConnTrans &trans, int64_t sessionKey, bool forUpdate)
{
	UploadSession uploadSession;
	{
		string sqlStatement =
			fmt::format("select {} from VI_UploadSession where sessionKey = {}{}", uploadSessionColumns(), sessionKey, forUpdate ? " for update" : "");
		result res = exec(trans, sqlStatement);
		if (res.empty())
		{
			string errorMessage = fmt::format(
				"UploadSession is not found"
				", sessionKey: {}",
				sessionKey
			);
			SPDLOG_ERROR(errorMessage);

			throw JobNotFound(errorMessage);
		}

		uploadSession.sessionKey = res[0]["sessionKey"].as<int64_t>();
		uploadSession.jobKey = res[0]["jobKey"].as<int64_t>();
		uploadSession.objectKey = res[0]["objectKey"].as<string>();
		uploadSession.uploadId = res[0]["uploadId"].as<string>();
		uploadSession.partSizeBytes = res[0]["partSizeBytes"].as<int64_t>();
		uploadSession.totalParts = res[0]["totalParts"].as<int>();
		uploadSession.totalBytes = res[0]["totalBytes"].as<int64_t>();
		uploadSession.status = UploadSession::toSessionStatus(res[0]["status"].as<string>());
		uploadSession.createdAt = chrono::system_clock::from_time_t(res[0]["createdAt"].as<int64_t>());
		uploadSession.updatedAt = chrono::system_clock::from_time_t(res[0]["updatedAt"].as<int64_t>());
	}

	{
		string sqlStatement = fmt::format("select partNumber, etag, byteLength from VI_UploadSessionPart where sessionKey = {}", sessionKey);
		result res = exec(trans, sqlStatement);
		for (auto row : res)
		{
			AcknowledgedPart acknowledgedPart{row["partNumber"].as<int>(), row["etag"].as<string>(), row["byteLength"].as<int64_t>()};
			uploadSession.acknowledgedParts[acknowledgedPart.partNumber] = acknowledgedPart;
		}
	}

	return uploadSession;
}

IngestionJob PostgresJobLedger::addIngestionJob(int64_t ownerKey, SourceKind sourceKind, string sourceReference, string contentType)
{
	PostgresConnTrans trans(this);
	try
	{
		int64_t jobKey;
		{
			string sqlStatement = fmt::format(
				"insert into VI_IngestionJob (ownerKey, sourceKind, status, sourceReference, contentType) "
				"values ({}, {}, {}, {}, {}) returning jobKey",
				ownerKey, trans.transaction->quote(IngestionJob::toString(sourceKind)),
				trans.transaction->quote(IngestionJob::toString(JobStatus::Created)), trans.transaction->quote(sourceReference),
				trans.transaction->quote(contentType)
			);
			jobKey = exec(trans, sqlStatement)[0][0].as<int64_t>();
		}

		{
			string sqlStatement = fmt::format(
				"update VI_IngestionJob set objectKey = {} where jobKey = {}", trans.transaction->quote(IngestionJob::sourceObjectKey(ownerKey, jobKey)),
				jobKey
			);
			exec(trans, sqlStatement);
		}

		IngestionJob ingestionJob = getIngestionJob(trans, jobKey);

		trans.transaction->commit();

		return ingestionJob;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

IngestionJob PostgresJobLedger::getIngestionJob(int64_t jobKey)
{
	PostgresConnTrans trans(this);
	try
	{
		IngestionJob ingestionJob = getIngestionJob(trans, jobKey);

		trans.transaction->commit();

		return ingestionJob;
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

vector<IngestionJob> PostgresJobLedger::getIngestionJobsByStatus(JobStatus status)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format(
			"select {} from VI_IngestionJob where status = {} order by jobKey", ingestionJobColumns(), trans.transaction->quote(IngestionJob::toString(status))
		);
		result res = exec(trans, sqlStatement);

		vector<IngestionJob> ingestionJobs;
		for (auto row : res)
			ingestionJobs.push_back(toIngestionJob(row));

		trans.transaction->commit();

		return ingestionJobs;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

bool PostgresJobLedger::transitionJob(int64_t jobKey, const vector<JobStatus> &allowedFrom, JobStatus to)
{
	if (allowedFrom.empty())
		return false;

	PostgresConnTrans trans(this);
	try
	{
		string allowedStatuses;
		for (JobStatus jobStatus : allowedFrom)
			allowedStatuses += (allowedStatuses == "" ? "" : ", ") + trans.transaction->quote(IngestionJob::toString(jobStatus));

		string newToStatus = trans.transaction->quote(IngestionJob::toString(to));

		// same progress rules of the memory ledger: entering a running state resets it, a done state fills it
		string progressPercent = "progressPercent";
		if (to == JobStatus::Uploaded || to == JobStatus::Ready)
			progressPercent = "100";
		else if (to == JobStatus::Uploading || to == JobStatus::Processing)
			progressPercent = fmt::format("case when status = {} then progressPercent else 0 end", newToStatus);

		string sqlStatement = fmt::format(
			"update VI_IngestionJob set status = {}, progressPercent = {}, updatedAt = now() "
			"where jobKey = {} and status in ({})",
			newToStatus, progressPercent, jobKey, allowedStatuses
		);
		result res = exec(trans, sqlStatement);
		bool transitioned = res.affected_rows() == 1;

		if (!transitioned)
			getIngestionJob(trans, jobKey);

		trans.transaction->commit();

		return transitioned;
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

void PostgresJobLedger::setSourceMetadata(int64_t jobKey, const SourceMetadata &sourceMetadata)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format(
			"update VI_IngestionJob set title = {}, author = {}, thumbnailURL = {}, updatedAt = now() where jobKey = {}",
			trans.transaction->quote(sourceMetadata.title), trans.transaction->quote(sourceMetadata.author),
			trans.transaction->quote(sourceMetadata.thumbnailURL), jobKey
		);
		if (exec(trans, sqlStatement).affected_rows() != 1)
			getIngestionJob(trans, jobKey);

		trans.transaction->commit();
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

void PostgresJobLedger::recordRightsConfirmation(int64_t jobKey)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format("update VI_IngestionJob set rightsConfirmedAt = now(), updatedAt = now() where jobKey = {}", jobKey);
		if (exec(trans, sqlStatement).affected_rows() != 1)
			getIngestionJob(trans, jobKey);

		trans.transaction->commit();
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

void PostgresJobLedger::updateJobProgress(int64_t jobKey, int progressPercent)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format(
			"update VI_IngestionJob set progressPercent = greatest(progressPercent, {}), updatedAt = now() where jobKey = {}",
			min(progressPercent, 100), jobKey
		);
		if (exec(trans, sqlStatement).affected_rows() != 1)
			getIngestionJob(trans, jobKey);

		trans.transaction->commit();
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

bool PostgresJobLedger::markJobFailed(int64_t jobKey, string errorMessage, string errorStage)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format(
			"update VI_IngestionJob set status = {}, errorMessage = {}, errorStage = {}, updatedAt = now() "
			"where jobKey = {} and status not in ({}, {})",
			trans.transaction->quote(IngestionJob::toString(JobStatus::Failed)), trans.transaction->quote(errorMessage),
			trans.transaction->quote(errorStage), jobKey, trans.transaction->quote(IngestionJob::toString(JobStatus::Ready)),
			trans.transaction->quote(IngestionJob::toString(JobStatus::Failed))
		);
		bool failed = exec(trans, sqlStatement).affected_rows() == 1;
		if (!failed)
			getIngestionJob(trans, jobKey);

		trans.transaction->commit();

		return failed;
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

UploadSession PostgresJobLedger::addUploadSession(const UploadSession &uploadSession)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format(
			"insert into VI_UploadSession (jobKey, objectKey, uploadId, partSizeBytes, totalParts, totalBytes, status) "
			"values ({}, {}, {}, {}, {}, {}, {}) returning sessionKey",
			uploadSession.jobKey, trans.transaction->quote(uploadSession.objectKey), trans.transaction->quote(uploadSession.uploadId),
			uploadSession.partSizeBytes, uploadSession.totalParts, uploadSession.totalBytes,
			trans.transaction->quote(UploadSession::toString(SessionStatus::Active))
		);
		int64_t sessionKey = exec(trans, sqlStatement)[0][0].as<int64_t>();

		UploadSession newUploadSession = getUploadSession(trans, sessionKey, false);

		trans.transaction->commit();

		return newUploadSession;
	}
	catch (pqxx::unique_violation const &e)
	{
		string errorMessage = fmt::format(
			"The job has already an active upload session"
			", jobKey: {}",
			uploadSession.jobKey
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidTransition(errorMessage);
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

UploadSession PostgresJobLedger::getUploadSession(int64_t sessionKey)
{
	PostgresConnTrans trans(this);
	try
	{
		UploadSession uploadSession = getUploadSession(trans, sessionKey, false);

		trans.transaction->commit();

		return uploadSession;
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

optional<UploadSession> PostgresJobLedger::getActiveUploadSession(int64_t jobKey)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format(
			"select sessionKey from VI_UploadSession where jobKey = {} and status = {}", jobKey,
			trans.transaction->quote(UploadSession::toString(SessionStatus::Active))
		);
		result res = exec(trans, sqlStatement);

		optional<UploadSession> uploadSession;
		if (!res.empty())
			uploadSession = getUploadSession(trans, res[0]["sessionKey"].as<int64_t>(), false);

		trans.transaction->commit();

		return uploadSession;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

int64_t PostgresJobLedger::acknowledgePart(int64_t sessionKey, const AcknowledgedPart &acknowledgedPart)
{
	PostgresConnTrans trans(this);
	try
	{
		// the row lock serializes the acknowledgements against closeUploadSession
		UploadSession uploadSession = getUploadSession(trans, sessionKey, true);
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
		// range, etag and length checks
		uploadSession.acknowledgePart(acknowledgedPart);

		{
			string sqlStatement = fmt::format(
				"insert into VI_UploadSessionPart (sessionKey, partNumber, etag, byteLength) values ({}, {}, {}, {}) "
				"on conflict (sessionKey, partNumber) do update "
				"set etag = EXCLUDED.etag, byteLength = EXCLUDED.byteLength, acknowledgedAt = now()",
				sessionKey, acknowledgedPart.partNumber, trans.transaction->quote(acknowledgedPart.etag), acknowledgedPart.byteLength
			);
			exec(trans, sqlStatement);
		}

		{
			string sqlStatement = fmt::format("update VI_UploadSession set updatedAt = now() where sessionKey = {}", sessionKey);
			exec(trans, sqlStatement);
		}

		trans.transaction->commit();

		return uploadSession.uploadedBytes();
	}
	catch (IngestException &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}

void PostgresJobLedger::closeUploadSession(int64_t sessionKey, SessionStatus status)
{
	PostgresConnTrans trans(this);
	try
	{
		string sqlStatement = fmt::format(
			"update VI_UploadSession set status = {}, updatedAt = now() where sessionKey = {}",
			trans.transaction->quote(UploadSession::toString(status)), sessionKey
		);
		if (exec(trans, sqlStatement).affected_rows() != 1)
			getUploadSession(trans, sessionKey, false);

		trans.transaction->commit();
	}
	catch (JobNotFound &e)
	{
		throw;
	}
	catch (exception const &e)
	{
		logQueryFailure(trans, e);

		throw;
	}
}
