#ifndef UploadSession_h
#define UploadSession_h

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

using namespace std;

using json = nlohmann::json;

enum class SessionStatus
{
	Active,
	Completed,
	Aborted
};

struct AcknowledgedPart
{
	int partNumber;
	string etag;
	int64_t byteLength;
};

struct UploadSession
{
	int64_t sessionKey = -1;
	int64_t jobKey = -1;
	string objectKey;
	string uploadId;
	int64_t partSizeBytes = 0;
	int totalParts = 0;
	int64_t totalBytes = 0;
	SessionStatus status = SessionStatus::Active;

	// keyed by part number: re-acknowledging a part replaces the previous entry
	map<int, AcknowledgedPart> acknowledgedParts;

	chrono::system_clock::time_point createdAt;
	chrono::system_clock::time_point updatedAt;

	void acknowledgePart(const AcknowledgedPart &acknowledgedPart);

	int64_t uploadedBytes() const;

	bool isEligibleForCompletion() const;

	// {1..totalParts} - acknowledgedParts, ascending
	vector<int> missingPartNumbers() const;

	// ascending by part number, as required by CompleteMultipartUpload
	vector<AcknowledgedPart> orderedParts() const;

	json toJson() const;

	static const char *toString(const SessionStatus &sessionStatus)
	{
		switch (sessionStatus)
		{
		case SessionStatus::Active:
			return "ACTIVE";
		case SessionStatus::Completed:
			return "COMPLETED";
		case SessionStatus::Aborted:
			return "ABORTED";
		default:
			throw runtime_error(string("Wrong SessionStatus: ") + to_string(static_cast<int>(sessionStatus)));
		}
	}
	static SessionStatus toSessionStatus(const string &sessionStatus)
	{
		string lowerCase;
		lowerCase.resize(sessionStatus.size());
		transform(sessionStatus.begin(), sessionStatus.end(), lowerCase.begin(), [](unsigned char c) { return tolower(c); });

		if (lowerCase == "active")
			return SessionStatus::Active;
		else if (lowerCase == "completed")
			return SessionStatus::Completed;
		else if (lowerCase == "aborted")
			return SessionStatus::Aborted;
		else
			throw runtime_error(string("Wrong SessionStatus") + ", sessionStatus: " + sessionStatus);
	}
};

#endif
