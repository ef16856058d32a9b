#include "PartSource.h"

#include "IngestErrors.h"
#include "spdlog/spdlog.h"

#include <filesystem>
#include <fstream>

FilePartSource::FilePartSource(string pathName)
{
	if (!filesystem::exists(pathName) || !filesystem::is_regular_file(pathName))
	{
		string errorMessage = fmt::format(
			"File to be uploaded does not exist"
			", pathName: {}",
			pathName
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	_pathName = pathName;
	_size = filesystem::file_size(pathName);
}

vector<uint8_t> FilePartSource::read(int64_t offset, int64_t length)
{
	if (offset < 0 || length < 0 || offset + length > _size)
	{
		string errorMessage = fmt::format(
			"Wrong range"
			", pathName: {}"
			", offset: {}"
			", length: {}"
			", size: {}",
			_pathName, offset, length, _size
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	// one stream per read, workers read different ranges at the same time
	ifstream sourceFile(_pathName, ifstream::binary);
	if (!sourceFile)
	{
		string errorMessage = fmt::format(
			"open failed"
			", pathName: {}",
			_pathName
		);
		SPDLOG_ERROR(errorMessage);

		throw runtime_error(errorMessage);
	}

	vector<uint8_t> bytes(length);
	sourceFile.seekg(offset, ios::beg);
	sourceFile.read((char *)bytes.data(), length);
	if (sourceFile.gcount() != length)
	{
		string errorMessage = fmt::format(
			"read failed"
			", pathName: {}"
			", offset: {}"
			", length: {}"
			", read: {}",
			_pathName, offset, length, sourceFile.gcount()
		);
		SPDLOG_ERROR(errorMessage);

		throw runtime_error(errorMessage);
	}

	return bytes;
}
