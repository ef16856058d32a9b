#ifndef PartSource_h
#define PartSource_h

#include <cstdint>
#include <string>
#include <vector>

using namespace std;

// random access to the bytes being uploaded, read() is called concurrently by the workers
class PartSource
{
  public:
	virtual ~PartSource() = default;

	virtual int64_t size() = 0;

	virtual vector<uint8_t> read(int64_t offset, int64_t length) = 0;
};

class FilePartSource : public PartSource
{
  public:
	FilePartSource(string pathName);

	~FilePartSource() override = default;

	int64_t size() override { return _size; }

	vector<uint8_t> read(int64_t offset, int64_t length) override;

  private:
	string _pathName;
	int64_t _size;
};

#endif
