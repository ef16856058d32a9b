#include "IngestionJob.h"
#include "spdlog/fmt/fmt.h"

static int64_t toMilliseconds(chrono::system_clock::time_point timePoint)
{
	return chrono::duration_cast<chrono::milliseconds>(timePoint.time_since_epoch()).count();
}

string IngestionJob::sourceObjectKey(int64_t ownerKey, int64_t jobKey) { return fmt::format("users/{}/jobs/{}/source/source.mp4", ownerKey, jobKey); }

json IngestionJob::toJson() const
{
	json jobRoot;

	jobRoot["jobKey"] = jobKey;
	jobRoot["ownerKey"] = ownerKey;
	jobRoot["sourceKind"] = IngestionJob::toString(sourceKind);
	jobRoot["status"] = IngestionJob::toString(status);
	jobRoot["sourceReference"] = sourceReference;
	jobRoot["objectKey"] = objectKey;
	jobRoot["contentType"] = contentType;
	jobRoot["progressPercent"] = progressPercent;
	jobRoot["title"] = metadata.title;
	jobRoot["author"] = metadata.author;
	jobRoot["thumbnailURL"] = metadata.thumbnailURL;
	if (rightsConfirmedAt)
		jobRoot["rightsConfirmedAt"] = toMilliseconds(*rightsConfirmedAt);
	else
		jobRoot["rightsConfirmedAt"] = nullptr;
	if (status == JobStatus::Failed)
	{
		jobRoot["errorMessage"] = errorMessage;
		jobRoot["errorStage"] = errorStage;
	}
	jobRoot["createdAt"] = toMilliseconds(createdAt);
	jobRoot["updatedAt"] = toMilliseconds(updatedAt);

	return jobRoot;
}
