#ifndef SignedURLCache_h
#define SignedURLCache_h

#include <chrono>
#include <map>
#include <memory>
#include <mutex>

#include "StorageGateway.h"

using namespace std;

// presigned part URLs of one upload session, kept in memory only
class SignedURLCache
{
  public:
	SignedURLCache(
		shared_ptr<StorageGateway> storageGateway, string uploadId, string objectKey, int totalParts, int signBatchSize = 20,
		chrono::seconds expirationSafetyMargin = chrono::seconds(60)
	);

	// when the URL of partNumber is missing or about to expire, the parts without a valid URL
	// in partNumber..partNumber+signBatchSize-1 are signed together
	SignedPartURL get(int partNumber);

	// i.e.: the store answered 403 with this URL
	void invalidate(int partNumber);

	void put(const vector<SignedPartURL> &signedPartURLs);

	string uploadId() { return _uploadId; }

  private:
	shared_ptr<StorageGateway> _storageGateway;
	string _uploadId;
	string _objectKey;
	int _totalParts;
	int _signBatchSize;
	chrono::seconds _expirationSafetyMargin;

	mutex _mutex;
	map<int, SignedPartURL> _signedPartURLs;

	bool isValid(int partNumber, chrono::system_clock::time_point now);
};

#endif
