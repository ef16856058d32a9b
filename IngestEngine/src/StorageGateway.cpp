#include "StorageGateway.h"
#include "IngestErrors.h"
#include "spdlog/spdlog.h"

void StorageGateway::checkOrderedParts(string uploadId, const vector<AcknowledgedPart> &orderedParts)
{
	if (orderedParts.empty())
	{
		string errorMessage = fmt::format(
			"No parts to complete the multipart upload"
			", uploadId: {}",
			uploadId
		);
		SPDLOG_ERROR(errorMessage);

		throw IncompleteUploadError(errorMessage);
	}

	for (size_t partIndex = 0; partIndex < orderedParts.size(); partIndex++)
	{
		if (orderedParts[partIndex].partNumber != (int)partIndex + 1)
		{
			string errorMessage = fmt::format(
				"Parts are not ordered or have gaps"
				", uploadId: {}"
				", position: {}"
				", partNumber: {}",
				uploadId, partIndex + 1, orderedParts[partIndex].partNumber
			);
			SPDLOG_ERROR(errorMessage);

			throw IncompleteUploadError(errorMessage);
		}
	}
}
