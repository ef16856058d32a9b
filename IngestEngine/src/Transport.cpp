#include "Transport.h"

#include "CurlWrapper.h"
#include "IngestErrors.h"
#include "JSONUtils.h"
#include "spdlog/spdlog.h"

DirectTransport::DirectTransport(shared_ptr<StorageGateway> storageGateway) { _storageGateway = storageGateway; }

string DirectTransport::uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled)
{
	return _storageGateway->uploadPart(signedPartURL, bytes, cancelled);
}

RelayTransport::RelayTransport(string relayURL, long timeoutInSeconds, string authorization)
{
	_relayURL = relayURL;
	_timeoutInSeconds = timeoutInSeconds;
	_authorization = authorization;
}

string RelayTransport::uploadPart(const SignedPartURL &signedPartURL, const vector<uint8_t> &bytes, const atomic<bool> *cancelled)
{
	string api = "relayUploadPart";

	if (_relayURL == "")
	{
		string errorMessage = fmt::format(
			"{}. Relay endpoint is not configured"
			", partNumber: {}",
			api, signedPartURL.partNumber
		);
		SPDLOG_ERROR(errorMessage);

		throw TransportError(errorMessage, true);
	}

	string referenceToLog = fmt::format(", partNumber: {}", signedPartURL.partNumber);
	vector<string> otherHeaders;
	otherHeaders.push_back(fmt::format("X-Upload-Url: {}", signedPartURL.url));
	otherHeaders.push_back(fmt::format("X-Part-Number: {}", signedPartURL.partNumber));

	json relayRoot;
	try
	{
		relayRoot =
			CurlWrapper::httpPostBinaryAndGetJson(_relayURL, _timeoutInSeconds, _authorization, bytes, otherHeaders, referenceToLog, 0, 0, cancelled);
	}
	catch (TransferCancelled &e)
	{
		throw UploadCancelled(e.what());
	}
	catch (ServerNotReachable &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), true);
	}
	catch (HTTPError &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), false, e.httpErrorCode);
	}
	catch (CurlException &e)
	{
		throw TransportError(fmt::format("{} failed: {}", api, e.what()), true);
	}
	catch (runtime_error &e)
	{
		// reply is not json
		throw TransportError(fmt::format("{} failed, wrong reply: {}", api, e.what()), false);
	}

	string etag = JSONUtils::asString(relayRoot, "etag", "");
	if (etag == "")
	{
		string errorMessage = fmt::format(
			"{} failed, etag is missing"
			"{}"
			", reply: {}",
			api, referenceToLog, JSONUtils::toString(relayRoot)
		);
		SPDLOG_ERROR(errorMessage);

		throw TransportError(errorMessage, false);
	}

	return etag;
}
