#include "UploadSession.h"
#include "IngestErrors.h"
#include "spdlog/spdlog.h"

void UploadSession::acknowledgePart(const AcknowledgedPart &acknowledgedPart)
{
	if (acknowledgedPart.partNumber < 1 || acknowledgedPart.partNumber > totalParts)
	{
		string errorMessage = fmt::format(
			"Part number out of range"
			", sessionKey: {}"
			", partNumber: {}"
			", totalParts: {}",
			sessionKey, acknowledgedPart.partNumber, totalParts
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}
	if (acknowledgedPart.etag == "" || acknowledgedPart.byteLength <= 0)
	{
		string errorMessage = fmt::format(
			"Wrong acknowledged part"
			", sessionKey: {}"
			", partNumber: {}"
			", etag: {}"
			", byteLength: {}",
			sessionKey, acknowledgedPart.partNumber, acknowledgedPart.etag, acknowledgedPart.byteLength
		);
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	acknowledgedParts[acknowledgedPart.partNumber] = acknowledgedPart;
}

int64_t UploadSession::uploadedBytes() const
{
	int64_t uploadedBytes = 0;
	for (const auto &[partNumber, acknowledgedPart] : acknowledgedParts)
		uploadedBytes += acknowledgedPart.byteLength;

	return uploadedBytes;
}

bool UploadSession::isEligibleForCompletion() const
{
	if (totalParts <= 0 || acknowledgedParts.size() != (size_t)totalParts)
		return false;

	// the map is ordered and unique by key, so the size check plus the range check covers 1..totalParts
	return acknowledgedParts.begin()->first == 1 && acknowledgedParts.rbegin()->first == totalParts;
}

vector<int> UploadSession::missingPartNumbers() const
{
	vector<int> missingPartNumbers;
	for (int partNumber = 1; partNumber <= totalParts; partNumber++)
	{
		if (acknowledgedParts.find(partNumber) == acknowledgedParts.end())
			missingPartNumbers.push_back(partNumber);
	}

	return missingPartNumbers;
}

vector<AcknowledgedPart> UploadSession::orderedParts() const
{
	vector<AcknowledgedPart> orderedParts;
	orderedParts.reserve(acknowledgedParts.size());
	for (const auto &[partNumber, acknowledgedPart] : acknowledgedParts)
		orderedParts.push_back(acknowledgedPart);

	return orderedParts;
}

json UploadSession::toJson() const
{
	json sessionRoot;

	sessionRoot["sessionKey"] = sessionKey;
	sessionRoot["jobKey"] = jobKey;
	sessionRoot["objectKey"] = objectKey;
	sessionRoot["uploadId"] = uploadId;
	sessionRoot["partSizeBytes"] = partSizeBytes;
	sessionRoot["totalParts"] = totalParts;
	sessionRoot["totalBytes"] = totalBytes;
	sessionRoot["status"] = UploadSession::toString(status);
	sessionRoot["uploadedBytes"] = uploadedBytes();

	json partsRoot = json::array();
	for (const auto &[partNumber, acknowledgedPart] : acknowledgedParts)
	{
		json partRoot;
		partRoot["partNumber"] = partNumber;
		partRoot["etag"] = acknowledgedPart.etag;
		partRoot["byteLength"] = acknowledgedPart.byteLength;
		partsRoot.push_back(partRoot);
	}
	sessionRoot["acknowledgedParts"] = partsRoot;

	return sessionRoot;
}
