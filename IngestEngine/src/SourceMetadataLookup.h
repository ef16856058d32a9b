#ifndef SourceMetadataLookup_h
#define SourceMetadataLookup_h

#include <optional>

#include "IngestionJob.h"

class SourceMetadataLookup
{
  public:
	virtual ~SourceMetadataLookup() = default;

	// nullopt when the source is unknown or the lookup failed, it never throws
	virtual optional<SourceMetadata> lookup(string sourceURL) = 0;
};

// YouTube oEmbed endpoint: title, author_name and thumbnail_url
class OEmbedMetadataLookup : public SourceMetadataLookup
{
  public:
	OEmbedMetadataLookup(const json &configurationRoot);

	~OEmbedMetadataLookup() override = default;

	optional<SourceMetadata> lookup(string sourceURL) override;

  private:
	string _oEmbedURL;
	long _timeoutInSeconds;
};

#endif
