#ifndef IngestionJob_h
#define IngestionJob_h

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

using namespace std;

using json = nlohmann::json;

enum class SourceKind
{
	BrowserUpload,
	RemoteStream
};

enum class JobStatus
{
	Created,
	MetaReady,
	UploadReady,
	Uploading,
	Uploaded,
	Processing,
	Ready,
	Failed
};

struct SourceMetadata
{
	string title;
	string author;
	string thumbnailURL;
};

struct IngestionJob
{
	int64_t jobKey = -1;
	int64_t ownerKey = -1;
	SourceKind sourceKind = SourceKind::BrowserUpload;
	JobStatus status = JobStatus::Created;
	// original file name or source URL
	string sourceReference;
	string objectKey;
	string contentType;
	int progressPercent = 0;

	SourceMetadata metadata;
	optional<chrono::system_clock::time_point> rightsConfirmedAt;

	// only when status is Failed
	string errorMessage;
	string errorStage;

	chrono::system_clock::time_point createdAt;
	chrono::system_clock::time_point updatedAt;

	json toJson() const;

	static const char *toString(const JobStatus &jobStatus)
	{
		switch (jobStatus)
		{
		case JobStatus::Created:
			return "CREATED";
		case JobStatus::MetaReady:
			return "META_READY";
		case JobStatus::UploadReady:
			return "UPLOAD_READY";
		case JobStatus::Uploading:
			return "UPLOADING";
		case JobStatus::Uploaded:
			return "UPLOADED";
		case JobStatus::Processing:
			return "PROCESSING";
		case JobStatus::Ready:
			return "READY";
		case JobStatus::Failed:
			return "FAILED";
		default:
			throw runtime_error(string("Wrong JobStatus: ") + to_string(static_cast<int>(jobStatus)));
		}
	}
	static JobStatus toJobStatus(const string &jobStatus)
	{
		string lowerCase;
		lowerCase.resize(jobStatus.size());
		transform(jobStatus.begin(), jobStatus.end(), lowerCase.begin(), [](unsigned char c) { return tolower(c); });

		if (lowerCase == "created")
			return JobStatus::Created;
		else if (lowerCase == "meta_ready")
			return JobStatus::MetaReady;
		else if (lowerCase == "upload_ready")
			return JobStatus::UploadReady;
		else if (lowerCase == "uploading")
			return JobStatus::Uploading;
		else if (lowerCase == "uploaded")
			return JobStatus::Uploaded;
		else if (lowerCase == "processing")
			return JobStatus::Processing;
		else if (lowerCase == "ready")
			return JobStatus::Ready;
		else if (lowerCase == "failed")
			return JobStatus::Failed;
		else
			throw runtime_error(string("Wrong JobStatus") + ", jobStatus: " + jobStatus);
	}
	static bool isJobStatusFinalState(const JobStatus &jobStatus) { return jobStatus == JobStatus::Ready || jobStatus == JobStatus::Failed; }
	// progressPercent may only grow while the job is in one of these
	static bool isJobStatusInProgress(const JobStatus &jobStatus)
	{
		return jobStatus == JobStatus::Uploading || jobStatus == JobStatus::Processing;
	}

	static const char *toString(const SourceKind &sourceKind)
	{
		switch (sourceKind)
		{
		case SourceKind::BrowserUpload:
			return "BROWSER_UPLOAD";
		case SourceKind::RemoteStream:
			return "REMOTE_STREAM";
		default:
			throw runtime_error(string("Wrong SourceKind: ") + to_string(static_cast<int>(sourceKind)));
		}
	}
	static SourceKind toSourceKind(const string &sourceKind)
	{
		string lowerCase;
		lowerCase.resize(sourceKind.size());
		transform(sourceKind.begin(), sourceKind.end(), lowerCase.begin(), [](unsigned char c) { return tolower(c); });

		if (lowerCase == "browser_upload")
			return SourceKind::BrowserUpload;
		else if (lowerCase == "remote_stream")
			return SourceKind::RemoteStream;
		else
			throw runtime_error(string("Wrong SourceKind") + ", sourceKind: " + sourceKind);
	}

	// users/{ownerKey}/jobs/{jobKey}/source/source.mp4, same layout for every source kind
	static string sourceObjectKey(int64_t ownerKey, int64_t jobKey);
};

#endif
