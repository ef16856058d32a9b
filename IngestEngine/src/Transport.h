#ifndef Transport_h
#define Transport_h

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "StorageGateway.h"

using namespace std;

// one way to move the bytes of a part into the object store.
// Failures are reported as TransportError, a cancelled transfer as UploadCancelled
class Transport
{
  public:
	virtual ~Transport() = default;

	// returns the ETag assigned by the store
	virtual string uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled) = 0;

	virtual string name() = 0;
};

// PUT straight to the presigned URL
class DirectTransport : public Transport
{
  public:
	DirectTransport(shared_ptr<StorageGateway> storageGateway);

	~DirectTransport() override = default;

	string uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled) override;

	string name() override { return "direct"; }

  private:
	shared_ptr<StorageGateway> _storageGateway;
};

// the relay endpoint receives the bytes and performs the PUT on our behalf,
// used when the client cannot reach the store (or cannot read the ETag)
class RelayTransport : public Transport
{
  public:
	RelayTransport(string relayURL, long timeoutInSeconds, string authorization = "");

	~RelayTransport() override = default;

	string uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled) override;

	string name() override { return "relay"; }

  private:
	string _relayURL;
	long _timeoutInSeconds;
	string _authorization;
};

#endif
