#ifndef StreamRechunker_h
#define StreamRechunker_h

#include <cstdint>
#include <functional>
#include <vector>

#include "PartPlanner.h"

using namespace std;

// turns a byte stream of arbitrary chunks into numbered parts of partSizeBytes,
// the last one possibly shorter. A part beyond maxPartsNumber throws InvalidInputError
class StreamRechunker
{
  public:
	StreamRechunker(
		int64_t partSizeBytes, function<void(int partNumber, vector<uint8_t> bytes)> partReady, int maxPartsNumber = PartPlanner::maxPartsNumber
	);

	void push(const char *data, size_t size);

	// flushes the remainder as the last part, returns the number of parts produced
	int finish();

	int64_t bytesReceived() { return _bytesReceived; }

  private:
	int64_t _partSizeBytes;
	function<void(int partNumber, vector<uint8_t> bytes)> _partReady;
	int _maxPartsNumber;

	vector<uint8_t> _buffer;
	int _lastPartNumber;
	int64_t _bytesReceived;
	bool _finished;

	void flush();
};

#endif
