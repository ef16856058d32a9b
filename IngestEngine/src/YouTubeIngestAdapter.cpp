#include "YouTubeIngestAdapter.h"

#include "CurlWrapper.h"
#include "IngestErrors.h"
#include "JSONUtils.h"
#include "PartPlanner.h"
#include "StreamRechunker.h"
#include "TransportWorkerPool.h"
#include "YouTubeURL.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <thread>

YouTubeIngestAdapter::YouTubeIngestAdapter(
	shared_ptr<StreamResolver> streamResolver, shared_ptr<StorageGateway> storageGateway, StreamOpener streamOpener, int64_t partSizeBytes,
	int maxConcurrency, int retryCount, int retryDelayInMilliSeconds
)
{
	_streamResolver = streamResolver;
	_storageGateway = storageGateway;
	_streamOpener = streamOpener;
	_partSizeBytes = partSizeBytes;
	_maxConcurrency = maxConcurrency < 1 ? 1 : maxConcurrency;
	_retryCount = retryCount < 1 ? 1 : retryCount;
	_retryDelayInMilliSeconds = retryDelayInMilliSeconds;

	// same floor of the client uploads
	PartPlanner::plan(_partSizeBytes, _partSizeBytes);
}

YouTubeIngestAdapter::YouTubeIngestAdapter(
	const json &configurationRoot, shared_ptr<StreamResolver> streamResolver, shared_ptr<StorageGateway> storageGateway
)
{
	json streamRoot = JSONUtils::asJson(configurationRoot, "stream", json::object());

	_streamResolver = streamResolver;
	_storageGateway = storageGateway;

	_partSizeBytes = JSONUtils::asInt64(streamRoot, "partSizeBytes", PartPlanner::defaultStreamPartSizeBytes);
	SPDLOG_INFO(
		"Configuration item"
		", stream->partSizeBytes: {}",
		_partSizeBytes
	);
	PartPlanner::plan(_partSizeBytes, _partSizeBytes);
	_maxConcurrency = JSONUtils::asInt(streamRoot, "maxConcurrency", 3);
	SPDLOG_INFO(
		"Configuration item"
		", stream->maxConcurrency: {}",
		_maxConcurrency
	);
	if (_maxConcurrency < 1)
		_maxConcurrency = 1;
	_retryCount = JSONUtils::asInt(streamRoot, "retryCount", 3);
	SPDLOG_INFO(
		"Configuration item"
		", stream->retryCount: {}",
		_retryCount
	);
	if (_retryCount < 1)
		_retryCount = 1;
	_retryDelayInMilliSeconds = JSONUtils::asInt(streamRoot, "retryDelayInMilliSeconds", 1000);
	SPDLOG_INFO(
		"Configuration item"
		", stream->retryDelayInMilliSeconds: {}",
		_retryDelayInMilliSeconds
	);
	long connectTimeoutInSeconds = JSONUtils::asInt(streamRoot, "connectTimeoutInSeconds", 30);
	SPDLOG_INFO(
		"Configuration item"
		", stream->connectTimeoutInSeconds: {}",
		connectTimeoutInSeconds
	);

	_streamOpener = [connectTimeoutInSeconds](string url, function<void(const char *, size_t)> chunkReceived, const atomic<bool> *cancelled)
	{ return CurlWrapper::httpGetStream(url, connectTimeoutInSeconds, chunkReceived, "", cancelled); };
}

string YouTubeIngestAdapter::ingest(
	string sourceURL, string objectKey, function<void(int progressPercent)> progressCallback, CancellationToken &cancellationToken
)
{
	string videoId = YouTubeURL::videoId(sourceURL);

	StreamInfo streamInfo = _streamResolver->resolve(videoId);

	string contentType = streamInfo.mimeType.find("mp4") != string::npos ? "video/mp4" : streamInfo.mimeType;
	if (contentType == "")
		contentType = "video/mp4";
	else
	{
		// i.e.: video/mp4; codecs="avc1.640028"
		size_t parametersIndex = contentType.find(';');
		if (parametersIndex != string::npos)
			contentType = contentType.substr(0, parametersIndex);
	}

	// a known length that cannot fit in maxPartsNumber parts fails before the upload is created
	if (streamInfo.contentLength > 0)
		PartPlanner::plan(streamInfo.contentLength, _partSizeBytes);

	string uploadId = _storageGateway->createMultipartUpload(objectKey, contentType);

	deque<future<AcknowledgedPart>> partsInFlight;
	vector<AcknowledgedPart> acknowledgedParts;
	int64_t uploadedBytes = 0;
	int lastProgressPercent = 0;
	// failure of a part upload, raised inside the stream consumer
	exception_ptr partError;

	// runs on the thread reading the stream
	auto collectOldestPart = [&]()
	{
		future<AcknowledgedPart> oldestPart = move(partsInFlight.front());
		partsInFlight.pop_front();

		AcknowledgedPart acknowledgedPart = oldestPart.get();
		acknowledgedParts.push_back(acknowledgedPart);
		uploadedBytes += acknowledgedPart.byteLength;

		if (streamInfo.contentLength > 0 && progressCallback)
		{
			int progressPercent = TransportWorkerPool::progressPercent(uploadedBytes, streamInfo.contentLength);
			// the resolver length may be inaccurate, 100 is reserved to the completion
			progressPercent = min(progressPercent, 99);
			if (progressPercent > lastProgressPercent)
			{
				lastProgressPercent = progressPercent;
				progressCallback(progressPercent);
			}
		}
	};

	StreamRechunker streamRechunker(
		_partSizeBytes,
		[&](int partNumber, vector<uint8_t> bytes)
		{
			while ((int)partsInFlight.size() >= _maxConcurrency)
				collectOldestPart();

			partsInFlight.push_back(
				async(launch::async, &YouTubeIngestAdapter::uploadStreamPart, this, uploadId, objectKey, partNumber, move(bytes), &cancellationToken)
			);
		}
	);

	try
	{
		_streamOpener(
			streamInfo.url,
			[&](const char *data, size_t size)
			{
				try
				{
					streamRechunker.push(data, size);
				}
				catch (exception &e)
				{
					partError = current_exception();
					throw;
				}
			},
			cancellationToken.flag()
		);

		int totalParts = streamRechunker.finish();
		while (!partsInFlight.empty())
			collectOldestPart();

		if (totalParts == 0)
		{
			string errorMessage = fmt::format(
				"The source stream is empty"
				", sourceURL: {}",
				sourceURL
			);
			SPDLOG_ERROR(errorMessage);

			throw ResolutionError(errorMessage);
		}

		sort(
			acknowledgedParts.begin(), acknowledgedParts.end(),
			[](const AcknowledgedPart &a, const AcknowledgedPart &b) { return a.partNumber < b.partNumber; }
		);

		string finalKey = _storageGateway->completeMultipartUpload(uploadId, objectKey, acknowledgedParts);

		SPDLOG_INFO(
			"Stream imported"
			", sourceURL: {}"
			", objectKey: {}"
			", totalParts: {}"
			", bytes: {}",
			sourceURL, finalKey, totalParts, streamRechunker.bytesReceived()
		);

		return finalKey;
	}
	catch (exception &e)
	{
		SPDLOG_ERROR(
			"Stream import failed"
			", sourceURL: {}"
			", uploadId: {}"
			", exception: {}",
			sourceURL, uploadId, e.what()
		);

		// the parts still running have to end before the abort
		while (!partsInFlight.empty())
		{
			try
			{
				partsInFlight.front().get();
			}
			catch (exception &partException)
			{
				SPDLOG_WARN(
					"Part in flight failed during the abort"
					", uploadId: {}"
					", exception: {}",
					uploadId, partException.what()
				);
			}
			partsInFlight.pop_front();
		}

		_storageGateway->abortMultipartUpload(uploadId, objectKey);

		if (partError != nullptr)
			rethrow_exception(partError);
		if (cancellationToken.isCancelled())
			throw UploadCancelled(fmt::format("Stream import cancelled, sourceURL: {}", sourceURL));

		throw;
	}
}

AcknowledgedPart
YouTubeIngestAdapter::uploadStreamPart(string uploadId, string objectKey, int partNumber, vector<uint8_t> bytes, CancellationToken *cancellationToken)
{
	for (int attempt = 0;; attempt++)
	{
		if (cancellationToken->isCancelled())
			throw UploadCancelled(fmt::format("Stream import cancelled, partNumber: {}", partNumber));

		try
		{
			vector<SignedPartURL> signedPartURLs = _storageGateway->signPartUploads(uploadId, objectKey, partNumber, partNumber);
			if (signedPartURLs.empty())
				throw TransportError(fmt::format("signPartUploads returned nothing, partNumber: {}", partNumber), false);

			string etag = _storageGateway->uploadPart(signedPartURLs[0], bytes, cancellationToken->flag());

			return AcknowledgedPart{partNumber, etag, (int64_t)bytes.size()};
		}
		catch (TransportError &e)
		{
			SPDLOG_WARN(
				"Stream part upload attempt failed"
				", uploadId: {}"
				", partNumber: {}"
				", attempt: {}/{}"
				", exception: {}",
				uploadId, partNumber, attempt + 1, _retryCount, e.what()
			);

			if (attempt + 1 >= _retryCount)
				throw;

			this_thread::sleep_for(chrono::milliseconds(_retryDelayInMilliSeconds * (attempt + 1)));
		}
	}
}
