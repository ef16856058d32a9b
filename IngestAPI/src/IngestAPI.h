#ifndef IngestAPI_h
#define IngestAPI_h

#include <functional>
#include <memory>

#include "FastCGIAPI.h"
#include "IngestionEngine.h"

struct IngestAPIUser
{
	string userName;
	string password;
	int64_t ownerKey;
};

struct IngestRequestData
{
	string requestURI;
	string requestMethod;
	unordered_map<string, string> queryParameters;
	string requestBody;
	unordered_map<string, string> requestDetails;
	// -1 when the method does not require basic authentication
	int64_t ownerKey;
};

class IngestAPI : public FastCGIAPI
{
  public:
	IngestAPI(json configurationRoot, mutex *fcgiAcceptMutex, shared_ptr<IngestionEngine> ingestionEngine, string webhookSecret);

	~IngestAPI() override;

	static int htmlResponseCode(exception &e);

  protected:
	void manageRequestAndResponse(
		string sThreadId, int64_t requestIdentifier, FCGX_Request &request, string requestURI, string requestMethod,
		unordered_map<string, string> queryParameters, bool authorizationPresent, string userName, string password, unsigned long contentLength,
		string requestBody, unordered_map<string, string> &requestDetails
	) override;

	void checkAuthorization(string sThreadId, string userName, string password) override;

	bool basicAuthenticationRequired(string requestURI, unordered_map<string, string> queryParameters) override;

  private:
	using Handler = function<void(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData)>;

	shared_ptr<IngestionEngine> _ingestionEngine;
	string _webhookSecret;
	vector<IngestAPIUser> _users;
	unordered_map<string, Handler> _handlers;

	void registerHandler(string method, Handler handler);

	void registerHandlers();

	int64_t ownerKeyOf(string userName);

	// the job has to belong to the caller, otherwise it does not exist for him
	IngestionJob ownedIngestionJob(int64_t jobKey, int64_t ownerKey);

	void checkWebhookSecret(const json &bodyRoot);

	void status(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void createIngestionJob(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void getIngestionJob(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void ingestionJobList(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void fetchSourceMetadata(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void confirmRights(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void startUpload(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void signParts(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void acknowledgePart(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void completeUpload(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void cancelUpload(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void importRemoteStream(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void relayPart(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void processingProgress(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void processingFailed(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	void processingReady(const string &sThreadId, int64_t requestIdentifier, FCGX_Request &request, const IngestRequestData &requestData);

	static json requestBodyToJson(const string &requestBody);

	static json signedPartURLsToJson(const vector<SignedPartURL> &signedPartURLs);
};

#endif
