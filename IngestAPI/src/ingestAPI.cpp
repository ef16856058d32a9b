#include <chrono>
#include <csignal>
#include <iostream>
#include <libxml/parser.h>
#include <thread>

#include "CurlWrapper.h"
#include "IngestAPI.h"
#include "IngestLogger.h"
#include "JSONUtils.h"
#include "MemoryJobLedger.h"
#ifdef __POSTGRES__
#include "PostgresJobLedger.h"
#endif
#include "S3StorageGateway.h"
#include "spdlog/spdlog.h"

chrono::system_clock::time_point lastSIGSEGVSignal = chrono::system_clock::now();

void signalHandler(int signal)
{
	if (signal == 11) // SIGSEGV
	{
		long elapsedInSeconds = chrono::duration_cast<chrono::seconds>(chrono::system_clock::now() - lastSIGSEGVSignal).count();
		// one log every 60 seconds is enough
		if (elapsedInSeconds > 60)
		{
			lastSIGSEGVSignal = chrono::system_clock::now();
			SPDLOG_ERROR(
				"Received a signal"
				", signal: {}",
				signal
			);
		}
	}
	else
		SPDLOG_ERROR(
			"Received a signal"
			", signal: {}",
			signal
		);
}

shared_ptr<JobLedger> buildJobLedger(const json &configurationRoot)
{
	string ledger = JSONUtils::asString(configurationRoot, "ledger", "postgres");
	SPDLOG_INFO(
		"Configuration item"
		", ledger: {}",
		ledger
	);

#ifdef __POSTGRES__
	if (ledger == "postgres")
	{
		SPDLOG_INFO("Creating PostgresJobLedger");
		shared_ptr<PostgresJobLedger> postgresJobLedger = make_shared<PostgresJobLedger>(configurationRoot);
		postgresJobLedger->createTablesIfNeeded();

		return postgresJobLedger;
	}
#else
	if (ledger == "postgres")
		SPDLOG_WARN("Built without PostgreSQL, jobs are kept in memory");
#endif

	// jobs do not survive a restart
	return make_shared<MemoryJobLedger>();
}

int main(int argc, char **argv)
{
	try
	{
		const char *configurationPathName = getenv("VIDEOINGEST_CONFIGPATHNAME");
		if (configurationPathName == nullptr)
		{
			cerr << "Ingest API: the VIDEOINGEST_CONFIGPATHNAME environment variable is not defined" << endl;

			return 1;
		}

		json configurationRoot = JSONUtils::loadConfigurationFile(configurationPathName);

		IngestLogger::setMainLogger(configurationRoot, "api");

		signal(SIGSEGV, signalHandler);
		signal(SIGINT, signalHandler);
		signal(SIGABRT, signalHandler);

		CurlWrapper::globalInitialize();

		{
			xmlInitParser();
			LIBXML_TEST_VERSION
		}

		shared_ptr<JobLedger> jobLedger = buildJobLedger(configurationRoot);

		SPDLOG_INFO("Creating S3StorageGateway");
		shared_ptr<StorageGateway> storageGateway = make_shared<S3StorageGateway>(configurationRoot);

		shared_ptr<HTTPProcessingTrigger> processingTrigger = make_shared<HTTPProcessingTrigger>(configurationRoot);
		shared_ptr<SourceMetadataLookup> sourceMetadataLookup = make_shared<OEmbedMetadataLookup>(configurationRoot);
		shared_ptr<StreamResolver> streamResolver = make_shared<StreamResolver>(configurationRoot);
		shared_ptr<YouTubeIngestAdapter> youTubeIngestAdapter = make_shared<YouTubeIngestAdapter>(configurationRoot, streamResolver, storageGateway);

		// the relay is served here, server side runs upload directly
		shared_ptr<IngestionEngine> ingestionEngine = make_shared<IngestionEngine>(
			configurationRoot, jobLedger, storageGateway, nullptr, sourceMetadataLookup, processingTrigger, youTubeIngestAdapter
		);

		FCGX_Init();

		int threadsNumber = JSONUtils::asInt(JSONUtils::asJson(configurationRoot, "api", json::object()), "threadsNumber", 1);
		SPDLOG_INFO(
			"Configuration item"
			", api->threadsNumber: {}",
			threadsNumber
		);

		mutex fcgiAcceptMutex;

		vector<shared_ptr<IngestAPI>> apis;
		vector<thread> apiThreads;

		for (int threadIndex = 0; threadIndex < threadsNumber; threadIndex++)
		{
			shared_ptr<IngestAPI> api = make_shared<IngestAPI>(configurationRoot, &fcgiAcceptMutex, ingestionEngine, processingTrigger->webhookSecret());

			apis.push_back(api);
			apiThreads.push_back(thread(&IngestAPI::operator(), api));
		}

		for (thread &apiThread : apiThreads)
			apiThread.join();

		SPDLOG_INFO("Ingest API shutdown");

		xmlCleanupParser();

		CurlWrapper::globalTerminate();
	}
	catch (exception &e)
	{
		cerr << "main failed"
			 << ", exception: " << e.what() << endl;

		return 1;
	}

	return 0;
}
