#ifndef YouTubeIngestAdapter_h
#define YouTubeIngestAdapter_h

#include <deque>
#include <functional>
#include <future>
#include <memory>

#include "CancellationToken.h"
#include "StorageGateway.h"
#include "StreamResolver.h"

using namespace std;

// server side import: the source is read once, as a stream, and re-chunked into parts
// while it arrives. Nothing is persisted about the parts, an interrupted import starts over
class YouTubeIngestAdapter
{
  public:
	// url, consumer of the body chunks, cancellation flag. Returns the bytes received
	using StreamOpener = function<int64_t(string url, function<void(const char *, size_t)> chunkReceived, const atomic<bool> *cancelled)>;

	YouTubeIngestAdapter(
		shared_ptr<StreamResolver> streamResolver, shared_ptr<StorageGateway> storageGateway, StreamOpener streamOpener, int64_t partSizeBytes,
		int maxConcurrency, int retryCount, int retryDelayInMilliSeconds
	);

	// streamOpener from CurlWrapper::httpGetStream, the rest from the stream configuration section
	YouTubeIngestAdapter(const json &configurationRoot, shared_ptr<StreamResolver> streamResolver, shared_ptr<StorageGateway> storageGateway);

	// returns the final object key. Any failure after the multipart upload is created aborts it
	string ingest(
		string sourceURL, string objectKey, function<void(int progressPercent)> progressCallback, CancellationToken &cancellationToken
	);

  private:
	shared_ptr<StreamResolver> _streamResolver;
	shared_ptr<StorageGateway> _storageGateway;
	StreamOpener _streamOpener;
	int64_t _partSizeBytes;
	int _maxConcurrency;
	int _retryCount;
	int _retryDelayInMilliSeconds;

	AcknowledgedPart uploadStreamPart(string uploadId, string objectKey, int partNumber, vector<uint8_t> bytes, CancellationToken *cancellationToken);
};

#endif
