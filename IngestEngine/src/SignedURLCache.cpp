#include "SignedURLCache.h"

#include "IngestErrors.h"
#include "spdlog/spdlog.h"

SignedURLCache::SignedURLCache(
	shared_ptr<StorageGateway> storageGateway, string uploadId, string objectKey, int totalParts, int signBatchSize,
	chrono::seconds expirationSafetyMargin
)
{
	_storageGateway = storageGateway;
	_uploadId = uploadId;
	_objectKey = objectKey;
	_totalParts = totalParts;
	_signBatchSize = signBatchSize < 1 ? 1 : signBatchSize;
	_expirationSafetyMargin = expirationSafetyMargin;
}

bool SignedURLCache::isValid(int partNumber, chrono::system_clock::time_point now)
{
	auto it = _signedPartURLs.find(partNumber);
	if (it == _signedPartURLs.end())
		return false;

	return it->second.expiresAt - _expirationSafetyMargin > now;
}

SignedPartURL SignedURLCache::get(int partNumber)
{
	if (partNumber < 1 || partNumber > _totalParts)
	{
		string errorMessage = fmt::format(
			"Wrong partNumber"
			", uploadId: {}"
			", partNumber: {}"
			", totalParts: {}",
			_uploadId, partNumber, _totalParts
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	// contiguous runs of parts to be signed
	vector<pair<int, int>> ranges;
	{
		lock_guard<mutex> locker(_mutex);

		chrono::system_clock::time_point now = chrono::system_clock::now();
		if (isValid(partNumber, now))
			return _signedPartURLs[partNumber];

		int lastPartNumber = min(partNumber + _signBatchSize - 1, _totalParts);
		for (int currentPartNumber = partNumber; currentPartNumber <= lastPartNumber; currentPartNumber++)
		{
			if (isValid(currentPartNumber, now))
				continue;

			if (!ranges.empty() && ranges.back().second == currentPartNumber - 1)
				ranges.back().second = currentPartNumber;
			else
				ranges.push_back(make_pair(currentPartNumber, currentPartNumber));
		}
	}

	// two workers may sign the same parts at the same time, the later one wins
	vector<SignedPartURL> signedPartURLs;
	for (auto [firstPartNumber, lastPartNumber] : ranges)
	{
		vector<SignedPartURL> rangeURLs = _storageGateway->signPartUploads(_uploadId, _objectKey, firstPartNumber, lastPartNumber);
		signedPartURLs.insert(signedPartURLs.end(), rangeURLs.begin(), rangeURLs.end());
	}

	lock_guard<mutex> locker(_mutex);

	for (const SignedPartURL &signedPartURL : signedPartURLs)
		_signedPartURLs[signedPartURL.partNumber] = signedPartURL;

	auto it = _signedPartURLs.find(partNumber);
	if (it == _signedPartURLs.end())
	{
		string errorMessage = fmt::format(
			"signPartUploads did not return the requested part"
			", uploadId: {}"
			", partNumber: {}",
			_uploadId, partNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw TransportError(errorMessage, false);
	}

	return it->second;
}

void SignedURLCache::invalidate(int partNumber)
{
	lock_guard<mutex> locker(_mutex);

	_signedPartURLs.erase(partNumber);
}

void SignedURLCache::put(const vector<SignedPartURL> &signedPartURLs)
{
	lock_guard<mutex> locker(_mutex);

	for (const SignedPartURL &signedPartURL : signedPartURLs)
		_signedPartURLs[signedPartURL.partNumber] = signedPartURL;
}
