#ifndef ProgressObserver_h
#define ProgressObserver_h

#include <cstdint>

#include "IngestionJob.h"

// onProgress may be called from the worker threads, never concurrently and with non decreasing values.
// onStageChange is called from the thread driving the job
class ProgressObserver
{
  public:
	virtual ~ProgressObserver() = default;

	virtual void onProgress(int64_t jobKey, int progressPercent) = 0;

	virtual void onStageChange(int64_t jobKey, JobStatus jobStatus) = 0;
};

#endif
