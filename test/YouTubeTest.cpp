#include "CurlWrapper.h"
#include "IngestTestFakes.h"
#include "PartPlanner.h"
#include "StreamRechunker.h"
#include "StreamResolver.h"
#include "YouTubeIngestAdapter.h"
#include "YouTubeURL.h"
#include <algorithm>
#include <gtest/gtest.h>

TEST(YouTubeURLTest, AcceptedForms)
{
	ASSERT_EQ(YouTubeURL::videoId("https://www.youtube.com/watch?v=dQw4w9WgXcQ"), "dQw4w9WgXcQ");
	ASSERT_EQ(YouTubeURL::videoId("https://youtube.com/watch?feature=share&v=dQw4w9WgXcQ&t=42"), "dQw4w9WgXcQ");
	ASSERT_EQ(YouTubeURL::videoId("http://m.youtube.com/watch?v=dQw4w9WgXcQ"), "dQw4w9WgXcQ");
	ASSERT_EQ(YouTubeURL::videoId("https://youtu.be/dQw4w9WgXcQ?si=abc"), "dQw4w9WgXcQ");
	ASSERT_EQ(YouTubeURL::videoId("https://www.youtube.com/shorts/aBc_1-2dE3f"), "aBc_1-2dE3f");
	ASSERT_EQ(YouTubeURL::videoId("https://www.youtube.com/embed/dQw4w9WgXcQ"), "dQw4w9WgXcQ");
	ASSERT_EQ(YouTubeURL::videoId("https://www.youtube.com/v/dQw4w9WgXcQ"), "dQw4w9WgXcQ");
	ASSERT_EQ(YouTubeURL::videoId("HTTPS://WWW.YOUTUBE.COM:443/watch?v=dQw4w9WgXcQ"), "dQw4w9WgXcQ");
}

TEST(YouTubeURLTest, RejectedForms)
{
	ASSERT_FALSE(YouTubeURL::isYouTubeURL("https://vimeo.com/123456"));
	ASSERT_FALSE(YouTubeURL::isYouTubeURL("ftp://youtube.com/watch?v=dQw4w9WgXcQ"));
	ASSERT_FALSE(YouTubeURL::isYouTubeURL("https://youtube.com.evil.test/watch?v=dQw4w9WgXcQ"));
	ASSERT_FALSE(YouTubeURL::isYouTubeURL("youtube.com/watch?v=dQw4w9WgXcQ"));

	ASSERT_THROW(YouTubeURL::videoId("https://vimeo.com/watch?v=dQw4w9WgXcQ"), InvalidInputError);
	// too short
	ASSERT_THROW(YouTubeURL::videoId("https://www.youtube.com/watch?v=dQw4w9"), InvalidInputError);
	// too long
	ASSERT_THROW(YouTubeURL::videoId("https://youtu.be/dQw4w9WgXcQQ"), InvalidInputError);
	ASSERT_THROW(YouTubeURL::videoId("https://www.youtube.com/channel/UCxyz"), InvalidInputError);
}

TEST(StreamRechunkerTest, OddChunksBecomeFixedSizeParts)
{
	vector<pair<int, size_t>> parts;
	vector<uint8_t> joined;
	StreamRechunker streamRechunker(
		10,
		[&](int partNumber, vector<uint8_t> bytes)
		{
			parts.push_back(make_pair(partNumber, bytes.size()));
			joined.insert(joined.end(), bytes.begin(), bytes.end());
		}
	);

	string data = "abcdefghijklmnopqrstuvwxyz0123456789ABCDEFG";
	size_t offset = 0;
	for (size_t chunkSize : {3, 1, 17, 0, 9, 13})
	{
		streamRechunker.push(data.data() + offset, chunkSize);
		offset += chunkSize;
	}
	ASSERT_EQ(offset, data.size());

	ASSERT_EQ(streamRechunker.finish(), 5);
	ASSERT_EQ(parts, (vector<pair<int, size_t>>({{1, 10}, {2, 10}, {3, 10}, {4, 10}, {5, 3}})));
	ASSERT_EQ(string(joined.begin(), joined.end()), data);
	ASSERT_EQ(streamRechunker.bytesReceived(), (int64_t)data.size());

	// finish is idempotent
	ASSERT_EQ(streamRechunker.finish(), 5);
	ASSERT_THROW(streamRechunker.push("x", 1), runtime_error);
}

TEST(StreamRechunkerTest, ExactMultipleAndEmptyStream)
{
	int partsReady = 0;
	StreamRechunker exactStreamRechunker(4, [&partsReady](int partNumber, vector<uint8_t> bytes) { partsReady++; });
	exactStreamRechunker.push("12345678", 8);
	ASSERT_EQ(exactStreamRechunker.finish(), 2);
	ASSERT_EQ(partsReady, 2);

	StreamRechunker emptyStreamRechunker(4, [](int partNumber, vector<uint8_t> bytes) { FAIL() << "no part expected"; });
	ASSERT_EQ(emptyStreamRechunker.finish(), 0);

	ASSERT_THROW(StreamRechunker(0, [](int partNumber, vector<uint8_t> bytes) {}), InvalidInputError);
}

TEST(StreamRechunkerTest, PartsBeyondTheMaximumAreRejected)
{
	vector<int> partNumbers;
	StreamRechunker streamRechunker(4, [&partNumbers](int partNumber, vector<uint8_t> bytes) { partNumbers.push_back(partNumber); }, 3);

	streamRechunker.push("123456789012", 12);
	ASSERT_EQ(partNumbers, vector<int>({1, 2, 3}));

	// the fourth part is produced by the remainder
	streamRechunker.push("1", 1);
	ASSERT_THROW(streamRechunker.finish(), InvalidInputError);
	ASSERT_EQ(partNumbers.size(), 3u);

	StreamRechunker fullStreamRechunker(4, [](int partNumber, vector<uint8_t> bytes) {}, 2);
	ASSERT_THROW(fullStreamRechunker.push("123456789012", 12), InvalidInputError);
}

namespace
{
json resolverDocument(string url, string mimeType, int64_t contentLength)
{
	json videoStreamRoot;
	videoStreamRoot["url"] = url;
	videoStreamRoot["mimeType"] = mimeType;
	videoStreamRoot["contentLength"] = contentLength;

	json resolverRoot;
	resolverRoot["title"] = "a video";
	resolverRoot["videoStreams"].push_back(videoStreamRoot);

	return resolverRoot;
}
} // namespace

TEST(StreamResolverTest, ParseResolverDocument)
{
	json resolverRoot = resolverDocument("https://media.test/v.webm", "video/webm", 0);
	json mp4StreamRoot;
	mp4StreamRoot["url"] = "https://media.test/v.mp4";
	mp4StreamRoot["mimeType"] = "video/mp4; codecs=\"avc1.640028\"";
	mp4StreamRoot["contentLength"] = 123456;
	resolverRoot["videoStreams"].push_back(mp4StreamRoot);

	StreamInfo streamInfo = StreamResolver::parseResolverDocument(resolverRoot);
	ASSERT_EQ(streamInfo.url, "https://media.test/v.mp4");
	ASSERT_EQ(streamInfo.contentLength, 123456);

	// no mp4, the first one, unknown length
	streamInfo = StreamResolver::parseResolverDocument(resolverDocument("https://media.test/v.webm", "video/webm", 0));
	ASSERT_EQ(streamInfo.url, "https://media.test/v.webm");
	ASSERT_EQ(streamInfo.contentLength, -1);

	ASSERT_THROW(StreamResolver::parseResolverDocument(json::parse(R"({"error": "Video unavailable"})")), runtime_error);
	ASSERT_THROW(StreamResolver::parseResolverDocument(json::parse(R"({"message": "rate limited"})")), runtime_error);
	ASSERT_THROW(StreamResolver::parseResolverDocument(json::parse(R"({"videoStreams": []})")), runtime_error);
	ASSERT_THROW(StreamResolver::parseResolverDocument(json::parse(R"([1, 2])")), runtime_error);
	ASSERT_THROW(StreamResolver::parseResolverDocument(resolverDocument("", "video/mp4", 10)), runtime_error);
}

TEST(StreamResolverTest, ResolversAreTriedInOrder)
{
	vector<string> fetchedURLs;
	StreamResolver streamResolver(
		vector<string>{"https://first.test", "https://second.test", "https://third.test"},
		[&fetchedURLs](string url)
		{
			fetchedURLs.push_back(url);
			if (url.find("first") != string::npos)
				throw ServerNotReachable("connection refused");

			return resolverDocument("https://media.test/v.mp4", "video/mp4", 1000);
		}
	);

	StreamInfo streamInfo = streamResolver.resolve("dQw4w9WgXcQ");

	ASSERT_EQ(streamInfo.url, "https://media.test/v.mp4");
	ASSERT_EQ(fetchedURLs, vector<string>({"https://first.test/streams/dQw4w9WgXcQ", "https://second.test/streams/dQw4w9WgXcQ"}));
}

TEST(StreamResolverTest, EveryResolverFailing)
{
	StreamResolver streamResolver(
		vector<string>{"https://first.test", "https://second.test"},
		[](string url)
		{
			if (url.find("first") != string::npos)
				throw ServerNotReachable("connection refused");

			return json::parse(R"({"error": "Video unavailable"})");
		}
	);

	try
	{
		streamResolver.resolve("dQw4w9WgXcQ");
		FAIL() << "resolve should fail";
	}
	catch (ResolutionError &e)
	{
		string message = e.what();
		ASSERT_NE(message.find("connection refused"), string::npos);
		ASSERT_NE(message.find("Video unavailable"), string::npos);
	}

	ASSERT_FALSE(StreamResolver::defaultResolverBaseURLs().empty());
}

namespace
{
// stream of streamBytes bytes delivered in chunks of chunkBytes
YouTubeIngestAdapter::StreamOpener fakeStreamOpener(int64_t streamBytes, size_t chunkBytes, string *openedURL)
{
	return [streamBytes, chunkBytes, openedURL](string url, function<void(const char *, size_t)> chunkReceived, const atomic<bool> *cancelled)
	{
		*openedURL = url;

		vector<char> chunk(chunkBytes, 'v');
		int64_t sentBytes = 0;
		while (sentBytes < streamBytes)
		{
			if (cancelled != nullptr && *cancelled)
				throw TransferCancelled("cancelled");

			size_t size = (size_t)min<int64_t>(chunkBytes, streamBytes - sentBytes);
			chunkReceived(chunk.data(), size);
			sentBytes += size;
		}

		return sentBytes;
	};
}

shared_ptr<StreamResolver> fakeStreamResolver(int64_t contentLength)
{
	return make_shared<StreamResolver>(
		vector<string>{"https://resolver.test"},
		[contentLength](string url) { return resolverDocument("https://media.test/v.mp4", "video/mp4; codecs=\"avc1\"", contentLength); }
	);
}
} // namespace

TEST(YouTubeIngestAdapterTest, StreamIsUploadedInAscendingParts)
{
	int64_t streamBytes = 23 * PartPlanner::MiB + 11;
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	string openedURL;

	YouTubeIngestAdapter youTubeIngestAdapter(
		fakeStreamResolver(streamBytes), storageGateway, fakeStreamOpener(streamBytes, 1024 * 1024 + 7, &openedURL), 5 * PartPlanner::MiB, 2, 3, 1
	);

	vector<int> progress;
	CancellationToken cancellationToken;
	string finalKey = youTubeIngestAdapter.ingest(
		"https://youtu.be/dQw4w9WgXcQ", "sources/1/7/source", [&progress](int progressPercent) { progress.push_back(progressPercent); },
		cancellationToken
	);

	ASSERT_EQ(finalKey, "sources/1/7/source");
	ASSERT_EQ(openedURL, "https://media.test/v.mp4");
	ASSERT_EQ(storageGateway->contentTypes, vector<string>({"video/mp4"}));
	ASSERT_EQ(storageGateway->completedUploadIds, vector<string>({"upload-1"}));
	ASSERT_TRUE(storageGateway->abortedUploadIds.empty());

	const vector<AcknowledgedPart> &completedParts = storageGateway->completedParts;
	ASSERT_EQ(completedParts.size(), 5u);
	int64_t completedBytes = 0;
	for (size_t index = 0; index < completedParts.size(); index++)
	{
		ASSERT_EQ(completedParts[index].partNumber, (int)index + 1);
		completedBytes += completedParts[index].byteLength;
	}
	ASSERT_EQ(completedBytes, streamBytes);
	ASSERT_EQ(completedParts.back().byteLength, 3 * PartPlanner::MiB + 11);

	ASSERT_FALSE(progress.empty());
	ASSERT_TRUE(is_sorted(progress.begin(), progress.end()));
	ASSERT_LE(progress.back(), 99);
}

TEST(YouTubeIngestAdapterTest, UnknownLengthHasNoProgress)
{
	int64_t streamBytes = 12 * PartPlanner::MiB;
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	string openedURL;

	YouTubeIngestAdapter youTubeIngestAdapter(
		fakeStreamResolver(0), storageGateway, fakeStreamOpener(streamBytes, 64 * 1024, &openedURL), 5 * PartPlanner::MiB, 3, 3, 1
	);

	int progressCalls = 0;
	CancellationToken cancellationToken;
	youTubeIngestAdapter.ingest(
		"https://www.youtube.com/watch?v=dQw4w9WgXcQ", "sources/1/8/source", [&progressCalls](int progressPercent) { progressCalls++; },
		cancellationToken
	);

	ASSERT_EQ(progressCalls, 0);
	ASSERT_EQ(storageGateway->completedParts.size(), 3u);
}

TEST(YouTubeIngestAdapterTest, FailingPartAbortsTheUpload)
{
	int64_t streamBytes = 20 * PartPlanner::MiB;
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	storageGateway->failUploadPart = [](int partNumber)
	{
		if (partNumber == 2)
			throw TransportError("internal error", false, 500);
	};
	string openedURL;

	YouTubeIngestAdapter youTubeIngestAdapter(
		fakeStreamResolver(streamBytes), storageGateway, fakeStreamOpener(streamBytes, 256 * 1024, &openedURL), 5 * PartPlanner::MiB, 1, 2, 1
	);

	CancellationToken cancellationToken;
	ASSERT_THROW(
		youTubeIngestAdapter.ingest("https://youtu.be/dQw4w9WgXcQ", "sources/1/9/source", nullptr, cancellationToken), TransportError
	);

	ASSERT_EQ(storageGateway->attemptsOf(2), 2);
	ASSERT_EQ(storageGateway->abortedUploadIds, vector<string>({"upload-1"}));
	ASSERT_TRUE(storageGateway->completedUploadIds.empty());
}

TEST(YouTubeIngestAdapterTest, EmptyStreamAbortsTheUpload)
{
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	string openedURL;

	YouTubeIngestAdapter youTubeIngestAdapter(
		fakeStreamResolver(0), storageGateway, fakeStreamOpener(0, 1024, &openedURL), 5 * PartPlanner::MiB, 1, 1, 1
	);

	CancellationToken cancellationToken;
	ASSERT_THROW(
		youTubeIngestAdapter.ingest("https://youtu.be/dQw4w9WgXcQ", "sources/1/10/source", nullptr, cancellationToken), ResolutionError
	);
	ASSERT_EQ(storageGateway->abortedUploadIds, vector<string>({"upload-1"}));
}

TEST(YouTubeIngestAdapterTest, NotAYouTubeURL)
{
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	string openedURL;

	YouTubeIngestAdapter youTubeIngestAdapter(
		fakeStreamResolver(0), storageGateway, fakeStreamOpener(0, 1024, &openedURL), 5 * PartPlanner::MiB, 1, 1, 1
	);

	CancellationToken cancellationToken;
	ASSERT_THROW(youTubeIngestAdapter.ingest("https://vimeo.com/1", "sources/1/11/source", nullptr, cancellationToken), InvalidInputError);
	ASSERT_EQ(storageGateway->createdUploads, 0);
}

TEST(YouTubeIngestAdapterTest, StreamTooLongForThePartSize)
{
	int64_t contentLength = 5 * PartPlanner::MiB * PartPlanner::maxPartsNumber + 1;
	shared_ptr<FakeStorageGateway> storageGateway = make_shared<FakeStorageGateway>();
	string openedURL;

	YouTubeIngestAdapter youTubeIngestAdapter(
		fakeStreamResolver(contentLength), storageGateway, fakeStreamOpener(0, 1024, &openedURL), 5 * PartPlanner::MiB, 1, 1, 1
	);

	CancellationToken cancellationToken;
	ASSERT_THROW(
		youTubeIngestAdapter.ingest("https://youtu.be/dQw4w9WgXcQ", "sources/1/12/source", nullptr, cancellationToken), InvalidInputError
	);
	ASSERT_EQ(storageGateway->createdUploads, 0);
	ASSERT_EQ(openedURL, "");
}
