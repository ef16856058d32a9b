#include "TransportPolicy.h"

#include "spdlog/spdlog.h"

TransportPolicy::TransportPolicy(
	shared_ptr<Transport> directTransport, shared_ptr<Transport> relayTransport, int retryCount, int retryDelayInMilliSeconds
)
{
	if (directTransport == nullptr && relayTransport == nullptr)
	{
		string errorMessage = "TransportPolicy needs at least one transport";
		SPDLOG_ERROR(errorMessage);

		throw InvalidInputError(errorMessage);
	}

	_directTransport = directTransport;
	_relayTransport = relayTransport;
	_retryCount = retryCount < 1 ? 1 : retryCount;
	_retryDelayInMilliSeconds = retryDelayInMilliSeconds < 0 ? 0 : retryDelayInMilliSeconds;

	_relayActive = _directTransport == nullptr;
}

shared_ptr<Transport> TransportPolicy::current()
{
	if (_relayActive)
		return _relayTransport;
	else
		return _directTransport;
}

bool TransportPolicy::shouldSwitchToRelay(const TransportError &e, int attemptsOnDirect)
{
	if (_relayActive || _relayTransport == nullptr)
		return false;

	return e.networkFailure || attemptsOnDirect >= _retryCount;
}

void TransportPolicy::switchToRelay()
{
	if (_relayTransport == nullptr)
		return;

	bool expected = false;
	if (_relayActive.compare_exchange_strong(expected, true))
		SPDLOG_WARN("Upload session switched to the relay transport");
}

chrono::milliseconds TransportPolicy::backoff(int attempt) { return chrono::milliseconds(_retryDelayInMilliSeconds * (attempt + 1)); }
