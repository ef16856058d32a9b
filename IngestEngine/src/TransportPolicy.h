#ifndef TransportPolicy_h
#define TransportPolicy_h

#include <atomic>
#include <chrono>
#include <memory>

#include "IngestErrors.h"
#include "Transport.h"

using namespace std;

// retry and fallback rules of one upload session.
// The session starts on the direct transport and, once moved to the relay, never goes back
class TransportPolicy
{
  public:
	TransportPolicy(shared_ptr<Transport> directTransport, shared_ptr<Transport> relayTransport, int retryCount, int retryDelayInMilliSeconds);

	shared_ptr<Transport> current();

	bool isRelayActive() { return _relayActive; }

	bool isRelayAvailable() { return _relayTransport != nullptr; }

	// attemptsOnDirect: failed attempts of the part on the direct transport, the current one included.
	// A network failure switches at once, HTTP failures once the attempts are exhausted
	bool shouldSwitchToRelay(const TransportError &e, int attemptsOnDirect);

	void switchToRelay();

	int retryCount() { return _retryCount; }

	// linear: retryDelay * (attempt + 1), attempt starts from 0
	chrono::milliseconds backoff(int attempt);

  private:
	shared_ptr<Transport> _directTransport;
	shared_ptr<Transport> _relayTransport;
	int _retryCount;
	int _retryDelayInMilliSeconds;

	atomic<bool> _relayActive;
};

#endif
