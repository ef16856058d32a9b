#include "SourceMetadataLookup.h"

#include "CurlWrapper.h"
#include "JSONUtils.h"
#include "YouTubeURL.h"
#include "spdlog/spdlog.h"

OEmbedMetadataLookup::OEmbedMetadataLookup(const json &configurationRoot)
{
	json metadataRoot = JSONUtils::asJson(configurationRoot, "metadata", json::object());

	_oEmbedURL = JSONUtils::asString(metadataRoot, "oEmbedURL", "https://www.youtube.com/oembed");
	SPDLOG_INFO(
		"Configuration item"
		", metadata->oEmbedURL: {}",
		_oEmbedURL
	);
	_timeoutInSeconds = JSONUtils::asInt(metadataRoot, "timeoutInSeconds", 10);
	SPDLOG_INFO(
		"Configuration item"
		", metadata->timeoutInSeconds: {}",
		_timeoutInSeconds
	);
}

optional<SourceMetadata> OEmbedMetadataLookup::lookup(string sourceURL)
{
	if (!YouTubeURL::isYouTubeURL(sourceURL))
		return nullopt;

	string url = fmt::format("{}?url={}&format=json", _oEmbedURL, CurlWrapper::escape(sourceURL));
	try
	{
		json oEmbedRoot = CurlWrapper::httpGetJson(url, _timeoutInSeconds);

		SourceMetadata sourceMetadata;
		sourceMetadata.title = JSONUtils::asString(oEmbedRoot, "title", "");
		sourceMetadata.author = JSONUtils::asString(oEmbedRoot, "author_name", "");
		sourceMetadata.thumbnailURL = JSONUtils::asString(oEmbedRoot, "thumbnail_url", "");

		return sourceMetadata;
	}
	catch (exception &e)
	{
		SPDLOG_WARN(
			"oEmbed lookup failed"
			", sourceURL: {}"
			", exception: {}",
			sourceURL, e.what()
		);

		return nullopt;
	}
}
