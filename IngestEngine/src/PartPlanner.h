#ifndef PartPlanner_h
#define PartPlanner_h

#include <cstdint>
#include <utility>

using namespace std;

class PartPlanner
{
  public:
	static constexpr int64_t MiB = 1024 * 1024;
	// every part but the last must be at least 5 MiB (S3 multipart constraint)
	static constexpr int64_t minPartSizeBytes = 5 * MiB;
	static constexpr int64_t maxPartSizeBytes = 5 * 1024 * MiB;
	static constexpr int maxPartsNumber = 10000;
	static constexpr int64_t defaultStreamPartSizeBytes = 8 * MiB;
	static constexpr int64_t defaultUploadPartSizeBytes = 10 * MiB;

	struct Plan
	{
		int64_t totalBytes;
		int64_t partSizeBytes;
		int totalParts;

		// offset and length of a part, partNumber starts from 1
		pair<int64_t, int64_t> partRange(int partNumber) const;
		int64_t partLength(int partNumber) const { return partRange(partNumber).second; }
	};

	static Plan plan(int64_t totalBytes, int64_t partSizeBytes);
};

#endif
