#ifndef TransportWorkerPool_h
#define TransportWorkerPool_h

#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <set>

#include "CancellationToken.h"
#include "JobLedger.h"
#include "PartSource.h"
#include "ProgressObserver.h"
#include "SignedURLCache.h"
#include "TransportPolicy.h"

using namespace std;

class TransportWorkerPool
{
  public:
	static constexpr int defaultMaxConcurrency = 3;

	TransportWorkerPool(shared_ptr<JobLedger> jobLedger, int maxConcurrency = defaultMaxConcurrency);

	// uploads every part of the session not yet acknowledged.
	// Throws the last error of the first part exhausting every transport, or UploadCancelled.
	// In both cases the acknowledged parts stay valid and the session stays Active
	UploadSession upload(
		int64_t sessionKey, PartSource &partSource, SignedURLCache &signedURLCache, TransportPolicy &transportPolicy, ProgressObserver *progressObserver,
		CancellationToken &cancellationToken
	);

	// round(uploadedBytes / totalBytes * 100), 100 only once every byte is acknowledged
	static int progressPercent(int64_t uploadedBytes, int64_t totalBytes);

  private:
	shared_ptr<JobLedger> _jobLedger;
	int _maxConcurrency;

	struct UploadRun
	{
		UploadSession uploadSession;
		PartSource *partSource;
		SignedURLCache *signedURLCache;
		TransportPolicy *transportPolicy;
		ProgressObserver *progressObserver;
		CancellationToken *cancellationToken;

		mutex queueMutex;
		deque<int> partsToBeUploaded;
		// parts claimed by a worker, released after their last attempt
		set<int> partsInFlight;
		bool stopped = false;
		exception_ptr firstError;

		mutex progressMutex;
		int lastProgressPercent = 0;
	};

	void worker(UploadRun &uploadRun);

	string uploadPartWithRetries(UploadRun &uploadRun, int partNumber, const vector<uint8_t> &bytes);

	void reportProgress(UploadRun &uploadRun, int64_t uploadedBytes);

	void waitBeforeToRetry(UploadRun &uploadRun, chrono::milliseconds delay);
};

#endif
