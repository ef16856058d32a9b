#ifndef FastCGIAPI_h
#define FastCGIAPI_h

#include "fcgi_config.h"
#include "fcgiapp.h"
#include "nlohmann/json.hpp"
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>

using namespace std;

using json = nlohmann::json;

struct CheckAuthorizationFailed : public runtime_error
{
	CheckAuthorizationFailed() : runtime_error("Wrong Basic Authentication present into the Request") {};
	virtual string type() { return "CheckAuthorizationFailed"; }
};

// accept loop of one thread: many instances share the FastCGI socket through fcgiAcceptMutex
class FastCGIAPI
{
  public:
	FastCGIAPI(json configurationRoot, mutex *fcgiAcceptMutex);

	virtual ~FastCGIAPI();

	int operator()();

	// "Basic dXNlcjpwYXNzd29yZA==" -> (user, password), throws CheckAuthorizationFailed
	static pair<string, string> basicCredentials(const string &authorization);

	// a=1&b=x%2Fy -> {a: 1, b: x/y}
	static unordered_map<string, string> parseQueryString(const string &queryString);

  protected:
	json _configurationRoot;
	int64_t _maxAPIContentLength;

	virtual void manageRequestAndResponse(
		string sThreadId, int64_t requestIdentifier, FCGX_Request &request, string requestURI, string requestMethod,
		unordered_map<string, string> queryParameters, bool authorizationPresent, string userName, string password, unsigned long contentLength,
		string requestBody, unordered_map<string, string> &requestDetails
	) = 0;

	virtual void checkAuthorization(string sThreadId, string userName, string password) = 0;

	virtual bool basicAuthenticationRequired(string requestURI, unordered_map<string, string> queryParameters);

	void sendSuccess(
		string sThreadId, int64_t requestIdentifier, FCGX_Request &request, string requestURI, string requestMethod, int htmlResponseCode,
		string responseBody = "", string contentType = ""
	);
	void sendError(FCGX_Request &request, int htmlResponseCode, string errorMessage);

	string getClientIPAddress(const unordered_map<string, string> &requestDetails);

	string getHeaderValue(const unordered_map<string, string> &requestDetails, string headerName, string defaultValue = "");

	int32_t getQueryParameter(const unordered_map<string, string> &queryParameters, string parameterName, int32_t defaultParameter, bool mandatory);
	int64_t getQueryParameter(const unordered_map<string, string> &queryParameters, string parameterName, int64_t defaultParameter, bool mandatory);
	string getQueryParameter(const unordered_map<string, string> &queryParameters, string parameterName, string defaultParameter, bool mandatory);

  private:
	mutex *_fcgiAcceptMutex;
	bool _shutdown;
	bool _fcgxFinishDone;
	int64_t _requestIdentifier;

	void manageRequest(string sThreadId, FCGX_Request &request);

	string readRequestBody(string sThreadId, FCGX_Request &request, const unordered_map<string, string> &requestDetails);

	static void fillEnvironmentDetails(const char *const *envp, unordered_map<string, string> &requestDetails);

	static string getHtmlStandardMessage(int htmlResponseCode);
};

#endif
