#ifndef IngestLogger_h
#define IngestLogger_h

#include <memory>
#include <string>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

using namespace std;

using json = nlohmann::json;

class IngestLogger
{
  public:
	// builds the sinks described by log->{loggerName} (daily or rotating file, error only file, stdout)
	// and installs the logger as the spdlog default one
	static shared_ptr<spdlog::logger> setMainLogger(const json &configurationRoot, string loggerName);

  private:
	static shared_ptr<spdlog::sinks::sink> buildErrorSink(const json &logRoot);

	static void setSinkLevel(shared_ptr<spdlog::sinks::sink> sink, string logLevel);
};

#endif
