#ifndef ProcessingTrigger_h
#define ProcessingTrigger_h

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"

using namespace std;

using json = nlohmann::json;

// hands an uploaded job to the processing collaborator
class ProcessingTrigger
{
  public:
	virtual ~ProcessingTrigger() = default;

	// throws ProcessingError
	virtual void trigger(int64_t jobKey) = 0;
};

// POST {"job_id": ..., "webhook_secret": ...} to the processing endpoint
class HTTPProcessingTrigger : public ProcessingTrigger
{
  public:
	HTTPProcessingTrigger(const json &configurationRoot);

	~HTTPProcessingTrigger() override = default;

	void trigger(int64_t jobKey) override;

	string webhookSecret() { return _webhookSecret; }

  private:
	string _endpoint;
	string _webhookSecret;
	long _timeoutInSeconds;
	int _maxRetryNumber;
	int _secondsToWaitBeforeToRetry;
};

#endif
