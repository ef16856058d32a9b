#include "YouTubeURL.h"

#include "IngestErrors.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <regex>

string YouTubeURL::host(const string &url)
{
	size_t protocolSeparatorIndex = url.find("://");
	if (protocolSeparatorIndex == string::npos)
		return "";

	string protocol = url.substr(0, protocolSeparatorIndex);
	transform(protocol.begin(), protocol.end(), protocol.begin(), [](unsigned char c) { return tolower(c); });
	if (protocol != "http" && protocol != "https")
		return "";

	size_t hostStartIndex = protocolSeparatorIndex + 3;
	size_t hostEndIndex = url.find_first_of("/?#", hostStartIndex);
	string host = hostEndIndex == string::npos ? url.substr(hostStartIndex) : url.substr(hostStartIndex, hostEndIndex - hostStartIndex);

	size_t portSeparatorIndex = host.find(':');
	if (portSeparatorIndex != string::npos)
		host = host.substr(0, portSeparatorIndex);
	transform(host.begin(), host.end(), host.begin(), [](unsigned char c) { return tolower(c); });

	return host;
}

bool YouTubeURL::isYouTubeURL(const string &url)
{
	string urlHost = host(url);

	return urlHost == "youtube.com" || urlHost == "www.youtube.com" || urlHost == "m.youtube.com" || urlHost == "youtu.be";
}

string YouTubeURL::videoId(const string &url)
{
	if (isYouTubeURL(url))
	{
		static const regex videoIdRegex(
			R"((?:youtube\.com/watch\?(?:[^#]*&)?v=|youtu\.be/|youtube\.com/shorts/|youtube\.com/embed/|youtube\.com/v/)([a-zA-Z0-9_-]{11})(?![a-zA-Z0-9_-]))",
			regex::icase
		);

		smatch match;
		if (regex_search(url, match, videoIdRegex))
			return match[1].str();
	}

	string errorMessage = fmt::format(
		"Not a valid YouTube video URL"
		", url: {}",
		url
	);
	SPDLOG_ERROR(errorMessage);

	throw InvalidInputError(errorMessage);
}
