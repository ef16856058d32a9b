#ifndef StreamResolver_h
#define StreamResolver_h

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

using namespace std;

using json = nlohmann::json;

struct StreamInfo
{
	string url;
	string mimeType;
	// -1 when the resolver does not know it
	int64_t contentLength = -1;
};

// turns a video id into a direct media URL asking, in order, a list of resolver services
class StreamResolver
{
  public:
	StreamResolver(vector<string> resolverBaseURLs, function<json(string url)> fetch);

	// the configured resolvers or, when missing, the default ones
	StreamResolver(const json &configurationRoot);

	// throws ResolutionError with the messages of every resolver
	StreamInfo resolve(string videoId);

	// throws runtime_error when the document is an error or has no video stream
	static StreamInfo parseResolverDocument(const json &resolverRoot);

	static vector<string> defaultResolverBaseURLs();

  private:
	vector<string> _resolverBaseURLs;
	function<json(string url)> _fetch;
};

#endif
