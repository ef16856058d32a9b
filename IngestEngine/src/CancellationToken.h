#ifndef CancellationToken_h
#define CancellationToken_h

#include <atomic>

using namespace std;

class CancellationToken
{
  public:
	CancellationToken() : _cancelled(false) {}

	void cancel() { _cancelled = true; }

	bool isCancelled() const { return _cancelled; }

	// handed to the curl transfers, they abort as soon as it becomes true
	const atomic<bool> *flag() const { return &_cancelled; }

  private:
	atomic<bool> _cancelled;
};

#endif
