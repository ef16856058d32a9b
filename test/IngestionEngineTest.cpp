#include "IngestTestFakes.h"
#include "IngestionEngine.h"
#include "MemoryJobLedger.h"
#include "PartPlanner.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <thread>

namespace
{
// stream of streamBytes bytes delivered in 1 MiB chunks
YouTubeIngestAdapter::StreamOpener fakeStreamOpener(int64_t streamBytes)
{
	return [streamBytes](string url, function<void(const char *, size_t)> chunkReceived, const atomic<bool> *cancelled)
	{
		vector<char> chunk(PartPlanner::MiB, 's');
		int64_t sentBytes = 0;
		while (sentBytes < streamBytes)
		{
			size_t size = (size_t)min<int64_t>(chunk.size(), streamBytes - sentBytes);
			chunkReceived(chunk.data(), size);
			sentBytes += size;
		}

		return sentBytes;
	};
}

// the ledger refuses every new upload session
class FailingSessionJobLedger : public MemoryJobLedger
{
  public:
	UploadSession addUploadSession(const UploadSession &uploadSession) override { throw runtime_error("database unavailable"); }
};

struct EngineFixture
{
	shared_ptr<MemoryJobLedger> jobLedger = make_shared<MemoryJobLedger>();
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	shared_ptr<FakeRelayTransport> relayTransport = make_shared<FakeRelayTransport>();
	shared_ptr<FakeMetadataLookup> metadataLookup = make_shared<FakeMetadataLookup>();
	shared_ptr<FakeProcessingTrigger> processingTrigger = make_shared<FakeProcessingTrigger>();
	shared_ptr<RecordingProgressObserver> progressObserver = make_shared<RecordingProgressObserver>();
	shared_ptr<IngestionEngine> ingestionEngine;

	EngineFixture(int maxConcurrency = 3, int64_t streamBytes = 18 * PartPlanner::MiB, shared_ptr<MemoryJobLedger> customJobLedger = nullptr)
	{
		if (customJobLedger != nullptr)
			jobLedger = customJobLedger;

		json configurationRoot;
		configurationRoot["upload"]["partSizeBytes"] = 8 * PartPlanner::MiB;
		configurationRoot["upload"]["maxConcurrency"] = maxConcurrency;
		configurationRoot["upload"]["retryCount"] = 3;
		configurationRoot["upload"]["retryDelayInMilliSeconds"] = 1;

		shared_ptr<StreamResolver> streamResolver = make_shared<StreamResolver>(
			vector<string>{"https://resolver.test"},
			[streamBytes](string url)
			{
				return json::parse(fmt::format(
					R"({{"videoStreams": [{{"url": "https://media.test/v.mp4", "mimeType": "video/mp4", "contentLength": {}}}]}})", streamBytes
				));
			}
		);
		shared_ptr<YouTubeIngestAdapter> youTubeIngestAdapter = make_shared<YouTubeIngestAdapter>(
			streamResolver, storageGateway, fakeStreamOpener(streamBytes), 5 * PartPlanner::MiB, 2, 2, 1
		);

		ingestionEngine = make_shared<IngestionEngine>(
			configurationRoot, jobLedger, storageGateway, relayTransport, metadataLookup, processingTrigger, youTubeIngestAdapter
		);
		ingestionEngine->setProgressObserver(progressObserver);
	}

	// a browser upload ready to start
	int64_t uploadReadyJob(int64_t ownerKey = 1)
	{
		int64_t jobKey = ingestionEngine->createBrowserUploadJob(ownerKey, "holiday.mp4").jobKey;
		ingestionEngine->fetchSourceMetadata(jobKey);
		ingestionEngine->confirmRights(jobKey);

		return jobKey;
	}
};
} // namespace

TEST(IngestionEngineTest, BrowserUploadEndToEnd)
{
	EngineFixture fixture;
	FakePartSource partSource(100 * PartPlanner::MiB);

	int64_t jobKey = fixture.uploadReadyJob();
	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).metadata.title, "holiday");

	UploadSession uploadSession = fixture.ingestionEngine->startUpload(jobKey, partSource.size());
	ASSERT_EQ(uploadSession.totalParts, 13);
	ASSERT_EQ(uploadSession.uploadId, "upload-1");

	IngestionJob ingestionJob = fixture.ingestionEngine->runUpload(jobKey, partSource);

	ASSERT_EQ(ingestionJob.status, JobStatus::Uploaded);
	ASSERT_EQ(ingestionJob.progressPercent, 100);
	ASSERT_EQ(ingestionJob.objectKey, IngestionJob::sourceObjectKey(1, jobKey));
	ASSERT_EQ(
		fixture.progressObserver->stages, vector<JobStatus>({JobStatus::MetaReady, JobStatus::UploadReady, JobStatus::Uploading, JobStatus::Uploaded})
	);
	ASSERT_EQ(fixture.processingTrigger->triggeredJobKeys, vector<int64_t>({jobKey}));

	ASSERT_EQ(fixture.storageGateway->completedUploadIds, vector<string>({"upload-1"}));
	ASSERT_EQ(fixture.storageGateway->completedParts.size(), 13u);
	for (size_t index = 0; index < fixture.storageGateway->completedParts.size(); index++)
		ASSERT_EQ(fixture.storageGateway->completedParts[index].partNumber, (int)index + 1);

	ASSERT_FALSE(fixture.ingestionEngine->getActiveUploadSession(jobKey));
	ASSERT_EQ(fixture.ingestionEngine->getIngestionJobsByStatus(JobStatus::Uploaded).size(), 1u);
}

TEST(IngestionEngineTest, UploadRequiresRightsConfirmation)
{
	EngineFixture fixture;

	int64_t jobKey = fixture.ingestionEngine->createBrowserUploadJob(1, "holiday.mp4").jobKey;
	fixture.ingestionEngine->fetchSourceMetadata(jobKey);

	ASSERT_THROW(fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB), ConsentRequiredError);
	ASSERT_EQ(fixture.storageGateway->createdUploads, 0);
	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).status, JobStatus::MetaReady);

	ASSERT_THROW(fixture.ingestionEngine->createBrowserUploadJob(1, ""), InvalidInputError);
}

TEST(IngestionEngineTest, StartUploadIsReentrant)
{
	EngineFixture fixture;
	int64_t jobKey = fixture.uploadReadyJob();

	UploadSession uploadSession = fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB);
	UploadSession sameUploadSession = fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB);

	ASSERT_EQ(sameUploadSession.sessionKey, uploadSession.sessionKey);
	ASSERT_EQ(sameUploadSession.uploadId, uploadSession.uploadId);
	ASSERT_EQ(fixture.storageGateway->createdUploads, 1);
}

TEST(IngestionEngineTest, ConcurrentStartUploadsShareOneSession)
{
	EngineFixture fixture;
	int64_t jobKey = fixture.uploadReadyJob();

	// both requests pass the status check before any session exists
	fixture.storageGateway->beforeCreateMultipartUpload = []() { this_thread::sleep_for(chrono::milliseconds(100)); };

	UploadSession uploadSessions[2];
	string errors[2];
	vector<thread> requests;
	for (int requestIndex = 0; requestIndex < 2; requestIndex++)
		requests.push_back(thread(
			[&, requestIndex]()
			{
				try
				{
					uploadSessions[requestIndex] = fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB);
				}
				catch (exception &e)
				{
					errors[requestIndex] = e.what();
				}
			}
		));
	for (thread &request : requests)
		request.join();

	ASSERT_EQ(errors[0], "");
	ASSERT_EQ(errors[1], "");
	ASSERT_EQ(uploadSessions[0].sessionKey, uploadSessions[1].sessionKey);
	ASSERT_EQ(uploadSessions[0].uploadId, uploadSessions[1].uploadId);

	// every multipart upload but the one of the session is aborted
	vector<string> &abortedUploadIds = fixture.storageGateway->abortedUploadIds;
	ASSERT_EQ(fixture.storageGateway->createdUploads - (int)abortedUploadIds.size(), 1);
	ASSERT_EQ(find(abortedUploadIds.begin(), abortedUploadIds.end(), uploadSessions[0].uploadId), abortedUploadIds.end());

	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).status, JobStatus::Uploading);
	ASSERT_EQ(fixture.ingestionEngine->getActiveUploadSession(jobKey)->sessionKey, uploadSessions[0].sessionKey);
}

TEST(IngestionEngineTest, SessionNotRecordedAbortsTheMultipartUpload)
{
	EngineFixture fixture(3, 18 * PartPlanner::MiB, make_shared<FailingSessionJobLedger>());
	int64_t jobKey = fixture.uploadReadyJob();

	ASSERT_THROW(fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB), runtime_error);

	ASSERT_EQ(fixture.storageGateway->createdUploads, 1);
	ASSERT_EQ(fixture.storageGateway->abortedUploadIds, vector<string>({"upload-1"}));
	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).status, JobStatus::UploadReady);
}

TEST(IngestionEngineTest, ResumeWithTheWrongSourceKeepsTheJobResumable)
{
	EngineFixture fixture;
	int64_t jobKey = fixture.uploadReadyJob();

	UploadSession uploadSession = fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB);
	fixture.ingestionEngine->acknowledgePart(jobKey, 1, "etag-1", 8 * PartPlanner::MiB);

	FakePartSource wrongPartSource(19 * PartPlanner::MiB);
	ASSERT_THROW(fixture.ingestionEngine->runUpload(jobKey, wrongPartSource), InvalidInputError);

	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).status, JobStatus::Uploading);
	ASSERT_TRUE(fixture.storageGateway->abortedUploadIds.empty());
	optional<UploadSession> activeUploadSession = fixture.ingestionEngine->getActiveUploadSession(jobKey);
	ASSERT_TRUE(activeUploadSession);
	ASSERT_EQ(activeUploadSession->sessionKey, uploadSession.sessionKey);
	ASSERT_EQ(activeUploadSession->acknowledgedParts.size(), 1u);

	// the right file completes the same session
	FakePartSource partSource(20 * PartPlanner::MiB);
	IngestionJob ingestionJob = fixture.ingestionEngine->runUpload(jobKey, partSource);
	ASSERT_EQ(ingestionJob.status, JobStatus::Uploaded);
	ASSERT_EQ(fixture.storageGateway->completedUploadIds, vector<string>({uploadSession.uploadId}));
}

TEST(IngestionEngineTest, ClientDrivenUpload)
{
	EngineFixture fixture;
	int64_t jobKey = fixture.uploadReadyJob();

	UploadSession uploadSession = fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB);
	ASSERT_EQ(uploadSession.totalParts, 3);

	vector<SignedPartURL> signedPartURLs = fixture.ingestionEngine->signParts(jobKey, 1, 3);
	ASSERT_EQ(signedPartURLs.size(), 3u);
	ASSERT_EQ(signedPartURLs[2].partNumber, 3);
	ASSERT_THROW(fixture.ingestionEngine->signParts(jobKey, 0, 2), InvalidInputError);
	ASSERT_THROW(fixture.ingestionEngine->signParts(jobKey, 2, 4), InvalidInputError);

	ASSERT_EQ(fixture.ingestionEngine->acknowledgePart(jobKey, 1, "\"e1\"", 8 * PartPlanner::MiB), 40);
	// the last part is 4 MiB
	ASSERT_THROW(fixture.ingestionEngine->acknowledgePart(jobKey, 3, "\"e3\"", 8 * PartPlanner::MiB), InvalidInputError);

	ASSERT_THROW(fixture.ingestionEngine->completeUpload(jobKey), IncompleteUploadError);
	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).status, JobStatus::Uploading);

	// acknowledged twice, counted once
	ASSERT_EQ(fixture.ingestionEngine->acknowledgePart(jobKey, 1, "\"e1\"", 8 * PartPlanner::MiB), 40);
	ASSERT_EQ(fixture.ingestionEngine->acknowledgePart(jobKey, 3, "\"e3\"", 4 * PartPlanner::MiB), 60);
	ASSERT_EQ(fixture.ingestionEngine->acknowledgePart(jobKey, 2, "\"e2\"", 8 * PartPlanner::MiB), 100);

	IngestionJob ingestionJob = fixture.ingestionEngine->completeUpload(jobKey);
	ASSERT_EQ(ingestionJob.status, JobStatus::Uploaded);

	vector<AcknowledgedPart> &completedParts = fixture.storageGateway->completedParts;
	ASSERT_EQ(completedParts.size(), 3u);
	ASSERT_EQ(completedParts[1].etag, "\"e2\"");

	// a second completion changes nothing
	ASSERT_EQ(fixture.ingestionEngine->completeUpload(jobKey).status, JobStatus::Uploaded);
	ASSERT_EQ(fixture.storageGateway->completedUploadIds.size(), 1u);
}

TEST(IngestionEngineTest, PartFailingOnEveryTransportFailsTheJob)
{
	EngineFixture fixture;
	FakePartSource partSource(100 * PartPlanner::MiB);

	auto failPart7 = [](int partNumber)
	{
		if (partNumber == 7)
			throw TransportError("internal error", false, 500);
	};
	fixture.storageGateway->failUploadPart = failPart7;
	fixture.relayTransport->failUploadPart = failPart7;

	int64_t jobKey = fixture.uploadReadyJob();
	fixture.ingestionEngine->startUpload(jobKey, partSource.size());

	ASSERT_THROW(fixture.ingestionEngine->runUpload(jobKey, partSource), TransportError);

	IngestionJob ingestionJob = fixture.ingestionEngine->getIngestionJob(jobKey);
	ASSERT_EQ(ingestionJob.status, JobStatus::Failed);
	ASSERT_EQ(ingestionJob.errorStage, "upload");
	ASSERT_EQ(fixture.storageGateway->abortedUploadIds, vector<string>({"upload-1"}));
	ASSERT_TRUE(fixture.storageGateway->completedUploadIds.empty());
	ASSERT_FALSE(fixture.ingestionEngine->getActiveUploadSession(jobKey));
	ASSERT_TRUE(fixture.processingTrigger->triggeredJobKeys.empty());
}

TEST(IngestionEngineTest, DirectFailureFallsBackToTheRelay)
{
	EngineFixture fixture(1);
	FakePartSource partSource(40 * PartPlanner::MiB);

	fixture.storageGateway->failUploadPart = [](int partNumber)
	{
		if (partNumber >= 2)
			throw TransportError("connection reset", true);
	};

	int64_t jobKey = fixture.uploadReadyJob();
	fixture.ingestionEngine->startUpload(jobKey, partSource.size());

	IngestionJob ingestionJob = fixture.ingestionEngine->runUpload(jobKey, partSource);

	ASSERT_EQ(ingestionJob.status, JobStatus::Uploaded);
	ASSERT_EQ(fixture.relayTransport->relayedPartSet(), set<int>({2, 3, 4, 5}));
	ASSERT_EQ(fixture.storageGateway->completedParts[0].etag, "\"etag-1\"");
	ASSERT_EQ(fixture.storageGateway->completedParts[4].etag, "\"relay-etag-5\"");
}

TEST(IngestionEngineTest, PausedUploadResumesFromTheMissingParts)
{
	EngineFixture fixture(1);
	FakePartSource partSource(80 * PartPlanner::MiB);

	int64_t jobKey = fixture.uploadReadyJob();
	UploadSession uploadSession = fixture.ingestionEngine->startUpload(jobKey, partSource.size());

	shared_ptr<IngestionEngine> ingestionEngine = fixture.ingestionEngine;
	fixture.progressObserver->onProgressHook = [ingestionEngine, jobKey](int progressPercent)
	{
		if (progressPercent >= 40)
			ingestionEngine->pauseUpload(jobKey);
	};

	ASSERT_THROW(fixture.ingestionEngine->runUpload(jobKey, partSource), UploadCancelled);
	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).status, JobStatus::Uploading);
	ASSERT_EQ(fixture.ingestionEngine->getIngestionJob(jobKey).progressPercent, 40);
	ASSERT_TRUE(fixture.storageGateway->abortedUploadIds.empty());
	ASSERT_FALSE(fixture.ingestionEngine->pauseUpload(jobKey));

	fixture.progressObserver->onProgressHook = nullptr;

	// the client comes back: same session, only the missing parts
	UploadSession resumedUploadSession = fixture.ingestionEngine->startUpload(jobKey, partSource.size());
	ASSERT_EQ(resumedUploadSession.sessionKey, uploadSession.sessionKey);
	ASSERT_EQ(resumedUploadSession.missingPartNumbers(), vector<int>({5, 6, 7, 8, 9, 10}));

	IngestionJob ingestionJob = fixture.ingestionEngine->runUpload(jobKey, partSource);

	ASSERT_EQ(ingestionJob.status, JobStatus::Uploaded);
	for (int partNumber = 1; partNumber <= 10; partNumber++)
		ASSERT_EQ(fixture.storageGateway->attemptsOf(partNumber), 1);
	ASSERT_EQ(fixture.storageGateway->createdUploads, 1);
}

TEST(IngestionEngineTest, CancelUpload)
{
	EngineFixture fixture;
	int64_t jobKey = fixture.uploadReadyJob();
	fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB);
	fixture.ingestionEngine->acknowledgePart(jobKey, 1, "\"e1\"", 8 * PartPlanner::MiB);

	IngestionJob ingestionJob = fixture.ingestionEngine->cancelUpload(jobKey);

	ASSERT_EQ(ingestionJob.status, JobStatus::Failed);
	ASSERT_EQ(ingestionJob.errorStage, "upload");
	ASSERT_EQ(fixture.storageGateway->abortedUploadIds, vector<string>({"upload-1"}));
	ASSERT_FALSE(fixture.ingestionEngine->getActiveUploadSession(jobKey));

	ASSERT_THROW(fixture.ingestionEngine->cancelUpload(jobKey), InvalidTransition);
	ASSERT_THROW(fixture.ingestionEngine->acknowledgePart(jobKey, 2, "\"e2\"", 8 * PartPlanner::MiB), InvalidTransition);
}

TEST(IngestionEngineTest, ProcessingCallbacks)
{
	EngineFixture fixture;
	FakePartSource partSource(10 * PartPlanner::MiB);

	int64_t jobKey = fixture.uploadReadyJob();
	fixture.ingestionEngine->startUpload(jobKey, partSource.size());
	fixture.ingestionEngine->runUpload(jobKey, partSource);

	IngestionJob ingestionJob = fixture.ingestionEngine->updateProcessingProgress(jobKey, 40);
	ASSERT_EQ(ingestionJob.status, JobStatus::Processing);
	ASSERT_EQ(ingestionJob.progressPercent, 40);

	ASSERT_EQ(fixture.ingestionEngine->updateProcessingProgress(jobKey, 20).progressPercent, 40);
	ASSERT_EQ(fixture.ingestionEngine->updateProcessingProgress(jobKey, 150).progressPercent, 99);

	ingestionJob = fixture.ingestionEngine->markReady(jobKey);
	ASSERT_EQ(ingestionJob.status, JobStatus::Ready);
	ASSERT_EQ(ingestionJob.progressPercent, 100);

	ASSERT_THROW(fixture.ingestionEngine->markProcessingFailed(jobKey, "too late"), InvalidTransition);
	ASSERT_THROW(fixture.ingestionEngine->updateProcessingProgress(jobKey, 50), InvalidTransition);

	// a second job fails while processing
	int64_t failingJobKey = fixture.uploadReadyJob();
	fixture.ingestionEngine->startUpload(failingJobKey, partSource.size());
	fixture.ingestionEngine->runUpload(failingJobKey, partSource);
	fixture.ingestionEngine->updateProcessingProgress(failingJobKey, 10);

	ingestionJob = fixture.ingestionEngine->markProcessingFailed(failingJobKey, "unsupported codec");
	ASSERT_EQ(ingestionJob.status, JobStatus::Failed);
	ASSERT_EQ(ingestionJob.errorStage, "processing");
	ASSERT_EQ(ingestionJob.errorMessage, "unsupported codec");
}

TEST(IngestionEngineTest, ProcessingTriggerFailureFailsTheJob)
{
	EngineFixture fixture;
	fixture.processingTrigger->fail = true;
	FakePartSource partSource(10 * PartPlanner::MiB);

	int64_t jobKey = fixture.uploadReadyJob();
	fixture.ingestionEngine->startUpload(jobKey, partSource.size());

	IngestionJob ingestionJob = fixture.ingestionEngine->runUpload(jobKey, partSource);

	ASSERT_EQ(ingestionJob.status, JobStatus::Failed);
	ASSERT_EQ(ingestionJob.errorStage, "processing");
	// the object is in the store
	ASSERT_EQ(fixture.storageGateway->completedUploadIds.size(), 1u);
}

TEST(IngestionEngineTest, RemoteStreamImport)
{
	EngineFixture fixture;
	SourceMetadata sourceMetadata;
	sourceMetadata.title = "Never Gonna Give You Up";
	sourceMetadata.author = "Rick Astley";
	fixture.metadataLookup->sourceMetadata = sourceMetadata;

	ASSERT_THROW(fixture.ingestionEngine->createRemoteStreamJob(1, "https://vimeo.com/1"), InvalidInputError);

	int64_t jobKey = fixture.ingestionEngine->createRemoteStreamJob(2, "https://www.youtube.com/watch?v=dQw4w9WgXcQ").jobKey;
	IngestionJob ingestionJob = fixture.ingestionEngine->fetchSourceMetadata(jobKey);
	ASSERT_EQ(ingestionJob.status, JobStatus::MetaReady);
	ASSERT_EQ(ingestionJob.metadata.author, "Rick Astley");

	ASSERT_THROW(fixture.ingestionEngine->importRemoteStream(jobKey), ConsentRequiredError);
	// browser uploads only
	ASSERT_THROW(fixture.ingestionEngine->startUpload(jobKey, 20 * PartPlanner::MiB), InvalidInputError);

	fixture.ingestionEngine->confirmRights(jobKey);
	ingestionJob = fixture.ingestionEngine->importRemoteStream(jobKey);

	ASSERT_EQ(ingestionJob.status, JobStatus::Uploaded);
	ASSERT_EQ(ingestionJob.progressPercent, 100);
	ASSERT_EQ(ingestionJob.objectKey, IngestionJob::sourceObjectKey(2, jobKey));
	// 18 MiB in 5 MiB parts
	ASSERT_EQ(fixture.storageGateway->completedParts.size(), 4u);
	ASSERT_EQ(fixture.storageGateway->completedParts.back().byteLength, 3 * PartPlanner::MiB);
	ASSERT_EQ(fixture.processingTrigger->triggeredJobKeys, vector<int64_t>({jobKey}));

	vector<int> &progress = fixture.progressObserver->progress;
	ASSERT_FALSE(progress.empty());
	ASSERT_TRUE(is_sorted(progress.begin(), progress.end()));
}

TEST(IngestionEngineTest, RemoteStreamWithoutMetadata)
{
	EngineFixture fixture;

	int64_t jobKey = fixture.ingestionEngine->createRemoteStreamJob(1, "https://youtu.be/dQw4w9WgXcQ").jobKey;

	// best effort: nothing found, nothing failed
	ASSERT_EQ(fixture.ingestionEngine->fetchSourceMetadata(jobKey).status, JobStatus::Created);
	ASSERT_EQ(fixture.ingestionEngine->confirmRights(jobKey).status, JobStatus::UploadReady);
}

TEST(IngestionEngineTest, EmptyRemoteStreamFailsTheImport)
{
	EngineFixture fixture(3, 0);

	int64_t jobKey = fixture.ingestionEngine->createRemoteStreamJob(1, "https://youtu.be/dQw4w9WgXcQ").jobKey;
	fixture.ingestionEngine->confirmRights(jobKey);

	ASSERT_THROW(fixture.ingestionEngine->importRemoteStream(jobKey), ResolutionError);

	IngestionJob ingestionJob = fixture.ingestionEngine->getIngestionJob(jobKey);
	ASSERT_EQ(ingestionJob.status, JobStatus::Failed);
	ASSERT_EQ(ingestionJob.errorStage, "import");
	ASSERT_EQ(fixture.storageGateway->abortedUploadIds, vector<string>({"upload-1"}));
}

TEST(IngestionEngineTest, RelayForwardsOnlyToTheStore)
{
	EngineFixture fixture;
	vector<uint8_t> bytes(1024, 'r');

	string etag = fixture.ingestionEngine->relayPart(3, fixture.storageGateway->storagePrefix + "users/1/jobs/1/source/source.mp4?partNumber=3", bytes);
	ASSERT_EQ(etag, "\"etag-3\"");
	ASSERT_EQ(fixture.storageGateway->uploadedPartBytes[3], 1024);

	ASSERT_THROW(fixture.ingestionEngine->relayPart(3, "https://attacker.test/steal", bytes), InvalidInputError);
	ASSERT_THROW(fixture.ingestionEngine->relayPart(0, fixture.storageGateway->storagePrefix + "x", bytes), InvalidInputError);
	ASSERT_THROW(fixture.ingestionEngine->relayPart(3, fixture.storageGateway->storagePrefix + "x", vector<uint8_t>()), InvalidInputError);
}
