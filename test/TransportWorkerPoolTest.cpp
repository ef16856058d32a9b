#include "IngestTestFakes.h"
#include "MemoryJobLedger.h"
#include "PartPlanner.h"
#include "TransportWorkerPool.h"
#include <algorithm>
#include <gtest/gtest.h>

namespace
{
struct WorkerPoolFixture
{
	shared_ptr<MemoryJobLedger> jobLedger = make_shared<MemoryJobLedger>();
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	shared_ptr<FakeRelayTransport> relayTransport = make_shared<FakeRelayTransport>();
	RecordingProgressObserver progressObserver;
	CancellationToken cancellationToken;

	int64_t jobKey;
	UploadSession uploadSession;

	WorkerPoolFixture(int64_t totalBytes, int64_t partSizeBytes)
	{
		jobKey = jobLedger->addIngestionJob(1, SourceKind::BrowserUpload, "movie.mp4", "video/mp4").jobKey;
		jobLedger->transitionJob(jobKey, {JobStatus::Created}, JobStatus::Uploading);

		PartPlanner::Plan plan = PartPlanner::plan(totalBytes, partSizeBytes);

		UploadSession newUploadSession;
		newUploadSession.jobKey = jobKey;
		newUploadSession.objectKey = IngestionJob::sourceObjectKey(1, jobKey);
		newUploadSession.uploadId = storageGateway->createMultipartUpload(newUploadSession.objectKey, "video/mp4");
		newUploadSession.partSizeBytes = plan.partSizeBytes;
		newUploadSession.totalParts = plan.totalParts;
		newUploadSession.totalBytes = plan.totalBytes;
		uploadSession = jobLedger->addUploadSession(newUploadSession);
	}

	UploadSession upload(int maxConcurrency, FakePartSource &partSource, CancellationToken *runCancellationToken = nullptr)
	{
		SignedURLCache signedURLCache(storageGateway, uploadSession.uploadId, uploadSession.objectKey, uploadSession.totalParts);
		TransportPolicy transportPolicy(make_shared<DirectTransport>(storageGateway), relayTransport, 3, 1);
		TransportWorkerPool transportWorkerPool(jobLedger, maxConcurrency);

		return transportWorkerPool.upload(
			uploadSession.sessionKey, partSource, signedURLCache, transportPolicy, &progressObserver,
			runCancellationToken == nullptr ? cancellationToken : *runCancellationToken
		);
	}
};
} // namespace

TEST(TransportWorkerPoolTest, ProgressPercent)
{
	ASSERT_EQ(TransportWorkerPool::progressPercent(0, 100), 0);
	ASSERT_EQ(TransportWorkerPool::progressPercent(1, 200), 1);
	ASSERT_EQ(TransportWorkerPool::progressPercent(995, 1000), 99);
	ASSERT_EQ(TransportWorkerPool::progressPercent(999, 1000), 99);
	ASSERT_EQ(TransportWorkerPool::progressPercent(1000, 1000), 100);
	ASSERT_EQ(TransportWorkerPool::progressPercent(0, 0), 0);
}

TEST(TransportWorkerPoolTest, UploadsEveryPartWithMonotonicProgress)
{
	WorkerPoolFixture fixture(100 * PartPlanner::MiB, 8 * PartPlanner::MiB);
	FakePartSource partSource(100 * PartPlanner::MiB);

	UploadSession uploadSession = fixture.upload(3, partSource);

	ASSERT_TRUE(uploadSession.isEligibleForCompletion());
	ASSERT_EQ(uploadSession.uploadedBytes(), 100 * PartPlanner::MiB);
	ASSERT_EQ(fixture.storageGateway->uploadedPartBytes.size(), 13u);
	ASSERT_EQ(fixture.storageGateway->uploadedPartBytes[13], 4 * PartPlanner::MiB);
	ASSERT_EQ(uploadSession.acknowledgedParts.at(7).etag, "\"etag-7\"");
	ASSERT_TRUE(fixture.relayTransport->relayedParts.empty());

	vector<int> &progress = fixture.progressObserver.progress;
	ASSERT_FALSE(progress.empty());
	ASSERT_TRUE(is_sorted(progress.begin(), progress.end()));
	ASSERT_EQ(adjacent_find(progress.begin(), progress.end()), progress.end());
	ASSERT_EQ(progress.back(), 100);
	for (size_t index = 0; index + 1 < progress.size(); index++)
		ASSERT_LT(progress[index], 100);
	ASSERT_EQ(fixture.jobLedger->getIngestionJob(fixture.jobKey).progressPercent, 100);
}

TEST(TransportWorkerPoolTest, ResumeUploadsOnlyTheMissingParts)
{
	WorkerPoolFixture fixture(30 * PartPlanner::MiB, 5 * PartPlanner::MiB);
	FakePartSource partSource(30 * PartPlanner::MiB);

	for (int partNumber : {1, 2, 4})
		fixture.jobLedger->acknowledgePart(fixture.uploadSession.sessionKey, AcknowledgedPart{partNumber, "earlier", 5 * PartPlanner::MiB});

	UploadSession uploadSession = fixture.upload(2, partSource);

	ASSERT_TRUE(uploadSession.isEligibleForCompletion());
	set<int> uploadedParts;
	for (auto [partNumber, bytes] : fixture.storageGateway->uploadedPartBytes)
		uploadedParts.insert(partNumber);
	ASSERT_EQ(uploadedParts, set<int>({3, 5, 6}));
	ASSERT_EQ(uploadSession.acknowledgedParts.at(1).etag, "earlier");

	// the progress restarts from what was already acknowledged
	ASSERT_GT(fixture.progressObserver.progress.front(), 50);
}

TEST(TransportWorkerPoolTest, NetworkFailureMovesTheSessionToTheRelay)
{
	WorkerPoolFixture fixture(30 * PartPlanner::MiB, 5 * PartPlanner::MiB);
	FakePartSource partSource(30 * PartPlanner::MiB);

	fixture.storageGateway->failUploadPart = [](int partNumber)
	{
		if (partNumber >= 3)
			throw TransportError("blocked by the browser", true);
	};

	UploadSession uploadSession = fixture.upload(1, partSource);

	ASSERT_TRUE(uploadSession.isEligibleForCompletion());
	// switched at the first network failure, without retrying on direct
	ASSERT_EQ(fixture.storageGateway->attemptsOf(3), 1);
	ASSERT_EQ(fixture.storageGateway->attemptsOf(4), 0);
	ASSERT_EQ(fixture.relayTransport->relayedPartSet(), set<int>({3, 4, 5, 6}));
	ASSERT_EQ(uploadSession.acknowledgedParts.at(2).etag, "\"etag-2\"");
	ASSERT_EQ(uploadSession.acknowledgedParts.at(3).etag, "\"relay-etag-3\"");
}

TEST(TransportWorkerPoolTest, HTTPFailuresAreRetriedBeforeTheRelay)
{
	WorkerPoolFixture fixture(15 * PartPlanner::MiB, 5 * PartPlanner::MiB);
	FakePartSource partSource(15 * PartPlanner::MiB);

	atomic<int> part2Failures(0);
	fixture.storageGateway->failUploadPart = [&part2Failures](int partNumber)
	{
		// a transient error: the second attempt succeeds
		if (partNumber == 2 && part2Failures++ == 0)
			throw TransportError("slow down", false, 503);
	};

	UploadSession uploadSession = fixture.upload(1, partSource);

	ASSERT_TRUE(uploadSession.isEligibleForCompletion());
	ASSERT_EQ(fixture.storageGateway->attemptsOf(2), 2);
	ASSERT_TRUE(fixture.relayTransport->relayedParts.empty());
}

TEST(TransportWorkerPoolTest, ForbiddenInvalidatesTheSignedURL)
{
	WorkerPoolFixture fixture(10 * PartPlanner::MiB, 5 * PartPlanner::MiB);
	FakePartSource partSource(10 * PartPlanner::MiB);

	atomic<int> part1Failures(0);
	fixture.storageGateway->failUploadPart = [&part1Failures](int partNumber)
	{
		if (partNumber == 1 && part1Failures++ == 0)
			throw TransportError("expired", false, 403);
	};

	fixture.upload(1, partSource);

	// 1..2 at the start, then 1 again after the 403
	ASSERT_EQ(fixture.storageGateway->signedRanges, (vector<pair<int, int>>({{1, 2}, {1, 1}})));
}

TEST(TransportWorkerPoolTest, PartFailingOnEveryTransportStopsTheSession)
{
	WorkerPoolFixture fixture(100 * PartPlanner::MiB, 8 * PartPlanner::MiB);
	FakePartSource partSource(100 * PartPlanner::MiB);

	auto failPart7 = [](int partNumber)
	{
		if (partNumber == 7)
			throw TransportError("internal error", false, 500);
	};
	fixture.storageGateway->failUploadPart = failPart7;
	fixture.relayTransport->failUploadPart = failPart7;

	try
	{
		fixture.upload(3, partSource);
		FAIL() << "upload should fail";
	}
	catch (TransportError &e)
	{
		ASSERT_EQ(e.httpStatus, 500);
	}

	ASSERT_EQ(fixture.storageGateway->attemptsOf(7), 3);

	UploadSession uploadSession = fixture.jobLedger->getUploadSession(fixture.uploadSession.sessionKey);
	ASSERT_EQ(uploadSession.status, SessionStatus::Active);
	ASSERT_EQ(uploadSession.acknowledgedParts.count(7), 0u);
	ASSERT_LT(uploadSession.acknowledgedParts.size(), 13u);
}

TEST(TransportWorkerPoolTest, CancelledUploadKeepsTheAcknowledgedParts)
{
	WorkerPoolFixture fixture(50 * PartPlanner::MiB, 5 * PartPlanner::MiB);
	FakePartSource partSource(50 * PartPlanner::MiB);

	CancellationToken &cancellationToken = fixture.cancellationToken;
	fixture.progressObserver.onProgressHook = [&cancellationToken](int progressPercent)
	{
		if (progressPercent >= 30)
			cancellationToken.cancel();
	};

	ASSERT_THROW(fixture.upload(1, partSource), UploadCancelled);

	UploadSession uploadSession = fixture.jobLedger->getUploadSession(fixture.uploadSession.sessionKey);
	ASSERT_EQ(uploadSession.status, SessionStatus::Active);
	ASSERT_EQ(uploadSession.acknowledgedParts.size(), 3u);

	// a new run carries on from part 4
	fixture.progressObserver.onProgressHook = nullptr;
	CancellationToken resumeCancellationToken;

	uploadSession = fixture.upload(1, partSource, &resumeCancellationToken);
	ASSERT_TRUE(uploadSession.isEligibleForCompletion());
	ASSERT_EQ(fixture.storageGateway->attemptsOf(1), 1);
	ASSERT_EQ(fixture.storageGateway->attemptsOf(4), 1);
}

TEST(TransportWorkerPoolTest, SourceSizeMustMatchTheSession)
{
	WorkerPoolFixture fixture(10 * PartPlanner::MiB, 5 * PartPlanner::MiB);
	FakePartSource partSource(10 * PartPlanner::MiB - 1);

	ASSERT_THROW(fixture.upload(1, partSource), InvalidInputError);
}
