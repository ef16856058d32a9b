#include "PartPlanner.h"
#include "IngestErrors.h"
#include "spdlog/spdlog.h"

PartPlanner::Plan PartPlanner::plan(int64_t totalBytes, int64_t partSizeBytes)
{
	if (totalBytes <= 0)
	{
		string errorMessage = fmt::format(
			"Wrong total bytes"
			", totalBytes: {}",
			totalBytes
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	if (partSizeBytes < minPartSizeBytes)
	{
		string errorMessage = fmt::format(
			"Part size is below the minimum"
			", partSizeBytes: {}"
			", minPartSizeBytes: {}",
			partSizeBytes, minPartSizeBytes
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	if (partSizeBytes > maxPartSizeBytes)
	{
		string errorMessage = fmt::format(
			"Part size is above the maximum"
			", partSizeBytes: {}"
			", maxPartSizeBytes: {}",
			partSizeBytes, maxPartSizeBytes
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	int64_t totalParts = totalBytes / partSizeBytes;
	if (totalBytes % partSizeBytes != 0)
		totalParts++;

	if (totalParts > maxPartsNumber)
	{
		string errorMessage = fmt::format(
			"Too many parts, increase the part size"
			", totalBytes: {}"
			", partSizeBytes: {}"
			", totalParts: {}"
			", maxPartsNumber: {}",
			totalBytes, partSizeBytes, totalParts, maxPartsNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	Plan plan;
	plan.totalBytes = totalBytes;
	plan.partSizeBytes = partSizeBytes;
	plan.totalParts = static_cast<int>(totalParts);

	return plan;
}

pair<int64_t, int64_t> PartPlanner::Plan::partRange(int partNumber) const
{
	if (partNumber < 1 || partNumber > totalParts)
	{
		string errorMessage = fmt::format(
			"Part number out of range"
			", partNumber: {}"
			", totalParts: {}",
			partNumber, totalParts
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	int64_t offset = (partNumber - 1) * partSizeBytes;
	int64_t length = partNumber < totalParts ? partSizeBytes : totalBytes - offset;

	return make_pair(offset, length);
}
