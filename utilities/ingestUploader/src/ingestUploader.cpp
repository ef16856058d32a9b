#include <iostream>
#include <libxml/parser.h>

#include "CurlWrapper.h"
#include "IngestErrors.h"
#include "IngestLogger.h"
#include "IngestionEngine.h"
#include "JSONUtils.h"
#include "MemoryJobLedger.h"
#ifdef __POSTGRES__
#include "PostgresJobLedger.h"
#endif
#include "S3StorageGateway.h"
#include "spdlog/spdlog.h"

class LogProgressObserver : public ProgressObserver
{
  public:
	void onProgress(int64_t jobKey, int progressPercent) override
	{
		SPDLOG_INFO(
			"Upload progress"
			", jobKey: {}"
			", progressPercent: {}",
			jobKey, progressPercent
		);
	}

	void onStageChange(int64_t jobKey, JobStatus jobStatus) override
	{
		SPDLOG_INFO(
			"Stage changed"
			", jobKey: {}"
			", status: {}",
			jobKey, IngestionJob::toString(jobStatus)
		);
	}
};

int main(int iArgc, char *pArgv[])
{
	if (iArgc != 4 && iArgc != 5)
	{
		cerr << "Usage: " << pArgv[0] << " config-path-name ownerKey file-path-name [jobKey to resume]" << endl;

		return 1;
	}

	string configurationPathName = pArgv[1];
	int64_t ownerKey = stoll(pArgv[2]);
	string filePathName = pArgv[3];
	int64_t jobKey = iArgc == 5 ? stoll(pArgv[4]) : -1;

	json configurationRoot = JSONUtils::loadConfigurationFile(configurationPathName);

	IngestLogger::setMainLogger(configurationRoot, "uploader");

	CurlWrapper::globalInitialize();
	xmlInitParser();

	int returnCode = 0;
	try
	{
		shared_ptr<JobLedger> jobLedger;
#ifdef __POSTGRES__
		if (JSONUtils::asString(configurationRoot, "ledger", "postgres") == "postgres")
		{
			shared_ptr<PostgresJobLedger> postgresJobLedger = make_shared<PostgresJobLedger>(configurationRoot);
			postgresJobLedger->createTablesIfNeeded();
			jobLedger = postgresJobLedger;
		}
		else
#endif
		{
			if (jobKey != -1)
			{
				cerr << "A job can be resumed only with the postgres ledger" << endl;

				return 1;
			}
			jobLedger = make_shared<MemoryJobLedger>();
		}

		shared_ptr<StorageGateway> storageGateway = make_shared<S3StorageGateway>(configurationRoot);

		json uploadRoot = JSONUtils::asJson(configurationRoot, "upload", json::object());
		string relayURL = JSONUtils::asString(uploadRoot, "relayURL", "");
		SPDLOG_INFO(
			"Configuration item"
			", upload->relayURL: {}",
			relayURL
		);
		shared_ptr<Transport> relayTransport;
		if (relayURL != "")
		{
			string relayUserName = JSONUtils::asString(uploadRoot, "relayUserName", "");
			string relayPassword = JSONUtils::asString(uploadRoot, "relayPassword", "");
			long relayTimeoutInSeconds = JSONUtils::asInt(uploadRoot, "relayTimeoutInSeconds", 120);

			relayTransport = make_shared<RelayTransport>(
				relayURL, relayTimeoutInSeconds, relayUserName == "" ? "" : CurlWrapper::basicAuthorization(relayUserName, relayPassword)
			);
		}

		shared_ptr<ProcessingTrigger> processingTrigger = make_shared<HTTPProcessingTrigger>(configurationRoot);

		IngestionEngine ingestionEngine(configurationRoot, jobLedger, storageGateway, relayTransport, nullptr, processingTrigger, nullptr);
		ingestionEngine.setProgressObserver(make_shared<LogProgressObserver>());

		FilePartSource filePartSource(filePathName);

		if (jobKey == -1)
		{
			string fileName = filePathName;
			size_t fileNameIndex = filePathName.find_last_of('/');
			if (fileNameIndex != string::npos)
				fileName = filePathName.substr(fileNameIndex + 1);

			IngestionJob ingestionJob = ingestionEngine.createBrowserUploadJob(ownerKey, fileName);
			jobKey = ingestionJob.jobKey;

			ingestionEngine.fetchSourceMetadata(jobKey);
			// whoever runs the tool owns the file
			ingestionEngine.confirmRights(jobKey);
		}
		else if (ingestionEngine.getIngestionJob(jobKey).ownerKey != ownerKey)
		{
			cerr << "The job does not belong to the owner" << endl;

			return 1;
		}

		UploadSession uploadSession = ingestionEngine.startUpload(jobKey, filePartSource.size());
		SPDLOG_INFO(
			"Upload started"
			", jobKey: {}"
			", uploadId: {}"
			", totalParts: {}"
			", missingParts: {}",
			jobKey, uploadSession.uploadId, uploadSession.totalParts, uploadSession.missingPartNumbers().size()
		);

		IngestionJob ingestionJob = ingestionEngine.runUpload(jobKey, filePartSource);

		cout << JSONUtils::toString(ingestionJob.toJson()) << endl;
	}
	catch (exception &e)
	{
		SPDLOG_ERROR(
			"ingestUploader failed"
			", jobKey: {}"
			", e.what(): {}",
			jobKey, e.what()
		);

		returnCode = 1;
	}

	xmlCleanupParser();
	CurlWrapper::globalTerminate();

	return returnCode;
}
