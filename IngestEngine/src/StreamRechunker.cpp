#include "StreamRechunker.h"

#include "IngestErrors.h"
#include "spdlog/spdlog.h"

StreamRechunker::StreamRechunker(int64_t partSizeBytes, function<void(int partNumber, vector<uint8_t> bytes)> partReady, int maxPartsNumber)
{
	if (partSizeBytes <= 0)
	{
		string errorMessage = fmt::format(
			"Wrong partSizeBytes"
			", partSizeBytes: {}",
			partSizeBytes
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	_partSizeBytes = partSizeBytes;
	_partReady = partReady;
	_maxPartsNumber = maxPartsNumber;
	_lastPartNumber = 0;
	_bytesReceived = 0;
	_finished = false;

	_buffer.reserve(_partSizeBytes);
}

void StreamRechunker::push(const char *data, size_t size)
{
	if (_finished)
		throw runtime_error("StreamRechunker::push called after finish");

	_bytesReceived += size;

	while (size > 0)
	{
		size_t toBeCopied = min(size, (size_t)(_partSizeBytes - (int64_t)_buffer.size()));
		_buffer.insert(_buffer.end(), (const uint8_t *)data, (const uint8_t *)data + toBeCopied);
		data += toBeCopied;
		size -= toBeCopied;

		if ((int64_t)_buffer.size() == _partSizeBytes)
			flush();
	}
}

int StreamRechunker::finish()
{
	if (!_finished)
	{
		_finished = true;
		if (!_buffer.empty())
			flush();
	}

	return _lastPartNumber;
}

void StreamRechunker::flush()
{
	if (_lastPartNumber >= _maxPartsNumber)
	{
		string errorMessage = fmt::format(
			"Too many parts, increase the part size"
			", partSizeBytes: {}"
			", bytesReceived: {}"
			", maxPartsNumber: {}",
			_partSizeBytes, _bytesReceived, _maxPartsNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	vector<uint8_t> bytes;
	bytes.swap(_buffer);
	_buffer.reserve(_partSizeBytes);

	_partReady(++_lastPartNumber, move(bytes));
}
