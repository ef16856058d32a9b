#include "StreamResolver.h"

#include "CurlWrapper.h"
#include "IngestErrors.h"
#include "JSONUtils.h"
#include "spdlog/spdlog.h"

StreamResolver::StreamResolver(vector<string> resolverBaseURLs, function<json(string url)> fetch)
{
	_resolverBaseURLs = resolverBaseURLs;
	_fetch = fetch;
}

StreamResolver::StreamResolver(const json &configurationRoot)
{
	json streamRoot = JSONUtils::asJson(configurationRoot, "stream", json::object());

	json resolversRoot = JSONUtils::asJson(streamRoot, "resolvers", json::array());
	for (const auto &resolverRoot : resolversRoot)
		_resolverBaseURLs.push_back(JSONUtils::asString(resolverRoot, "", ""));
	if (_resolverBaseURLs.empty())
		_resolverBaseURLs = defaultResolverBaseURLs();
	for (const string &resolverBaseURL : _resolverBaseURLs)
		SPDLOG_INFO(
			"Configuration item"
			", stream->resolvers: {}",
			resolverBaseURL
		);

	long resolverTimeoutInSeconds = JSONUtils::asInt(streamRoot, "resolverTimeoutInSeconds", 15);
	SPDLOG_INFO(
		"Configuration item"
		", stream->resolverTimeoutInSeconds: {}",
		resolverTimeoutInSeconds
	);

	_fetch = [resolverTimeoutInSeconds](string url) { return CurlWrapper::httpGetJson(url, resolverTimeoutInSeconds); };
}

vector<string> StreamResolver::defaultResolverBaseURLs()
{
	return vector<string>{
		"https://pipedapi.kavin.rocks", "https://pipedapi.adminforge.de", "https://api.piped.yt", "https://pipedapi.in.projectsegfau.lt"
	};
}

StreamInfo StreamResolver::parseResolverDocument(const json &resolverRoot)
{
	if (!resolverRoot.is_object())
		throw runtime_error("reply is not a json object");

	if (!JSONUtils::isNull(resolverRoot, "error"))
		throw runtime_error(fmt::format("resolver error: {}", JSONUtils::asString(resolverRoot, "error", "")));
	if (!JSONUtils::isNull(resolverRoot, "message"))
		throw runtime_error(fmt::format("resolver error: {}", JSONUtils::asString(resolverRoot, "message", "")));

	json videoStreamsRoot = JSONUtils::asJson(resolverRoot, "videoStreams", json::array());
	if (!videoStreamsRoot.is_array() || videoStreamsRoot.empty())
		throw runtime_error("no video streams");

	// mp4 first, otherwise whatever comes first
	json chosenStreamRoot = videoStreamsRoot[0];
	for (const auto &videoStreamRoot : videoStreamsRoot)
	{
		if (JSONUtils::asString(videoStreamRoot, "mimeType", "").find("mp4") != string::npos)
		{
			chosenStreamRoot = videoStreamRoot;
			break;
		}
	}

	StreamInfo streamInfo;
	streamInfo.url = JSONUtils::asString(chosenStreamRoot, "url", "");
	streamInfo.mimeType = JSONUtils::asString(chosenStreamRoot, "mimeType", "");
	streamInfo.contentLength = JSONUtils::asInt64(chosenStreamRoot, "contentLength", -1);
	if (streamInfo.contentLength <= 0)
		streamInfo.contentLength = -1;

	if (streamInfo.url == "")
		throw runtime_error("chosen video stream has no url");

	return streamInfo;
}

StreamInfo StreamResolver::resolve(string videoId)
{
	vector<string> errors;
	for (const string &resolverBaseURL : _resolverBaseURLs)
	{
		string url = fmt::format("{}/streams/{}", resolverBaseURL, videoId);
		try
		{
			json resolverRoot = _fetch(url);

			StreamInfo streamInfo = parseResolverDocument(resolverRoot);

			SPDLOG_INFO(
				"Stream resolved"
				", videoId: {}"
				", resolver: {}"
				", mimeType: {}"
				", contentLength: {}",
				videoId, resolverBaseURL, streamInfo.mimeType, streamInfo.contentLength
			);

			return streamInfo;
		}
		catch (exception &e)
		{
			SPDLOG_WARN(
				"Resolver failed"
				", videoId: {}"
				", resolver: {}"
				", exception: {}",
				videoId, resolverBaseURL, e.what()
			);

			errors.push_back(fmt::format("{}: {}", resolverBaseURL, e.what()));
		}
	}

	string joinedErrors;
	for (const string &error : errors)
		joinedErrors += (joinedErrors == "" ? "" : "; ") + error;

	string errorMessage = fmt::format(
		"Every resolver failed"
		", videoId: {}"
		", errors: {}",
		videoId, joinedErrors
	);
	SPDLOG_ERROR(errorMessage);

	throw ResolutionError(errorMessage);
}
