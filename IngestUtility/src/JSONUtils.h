#ifndef JSONUtils_h
#define JSONUtils_h

#include "nlohmann/json.hpp"
#include <stdexcept>
#include <string>

using namespace std;

using json = nlohmann::json;
using orderd_json = nlohmann::ordered_json;
using namespace nlohmann::literals;

struct JsonFieldNotFound : public runtime_error
{
	JsonFieldNotFound(string errorMessage) : runtime_error(errorMessage) {};
	virtual string type() { return "JsonFieldNotFound"; };
};

class JSONUtils
{

  public:
	static bool isMetadataPresent(const json &root, string field);

	static bool isNull(const json &root, string field);

	static string asString(const json &root, string field = "", string defaultValue = "", bool notFoundAsException = false);

	static int asInt(const json &root, string field = "", int defaultValue = 0, bool notFoundAsException = false);

	static int64_t asInt64(const json &root, string field = "", int64_t defaultValue = 0, bool notFoundAsException = false);

	static bool asBool(const json &root, string field, bool defaultValue = false, bool notFoundAsException = false);

	static json asJson(const json &root, string field, json defaultValue = json(), bool notFoundAsException = false);

	static json toJson(string j, bool warningIfError = false);

	static string toString(const json &root);

	static json loadConfigurationFile(string configurationPathName);

  private:
	static void fieldNotFound(string field);
};

#endif
