#ifndef YouTubeURL_h
#define YouTubeURL_h

#include <string>

using namespace std;

class YouTubeURL
{
  public:
	// scheme http(s) and host youtube.com, www.youtube.com, m.youtube.com or youtu.be
	static bool isYouTubeURL(const string &url);

	// 11 characters id from the watch?v=, youtu.be/, shorts/, embed/ and v/ forms.
	// Throws InvalidInputError for anything else
	static string videoId(const string &url);

  private:
	static string host(const string &url);
};

#endif
