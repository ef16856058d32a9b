#ifndef IngestErrors_h
#define IngestErrors_h

#include <stdexcept>
#include <string>

using namespace std;

struct IngestException : public runtime_error
{
	IngestException(string message) : runtime_error(message) {};
	virtual string type() { return "IngestException"; };
};

// bad sizes or arguments, never retried
struct InvalidInputError : public IngestException
{
	InvalidInputError(string message) : IngestException(message) {};
	virtual string type() { return "InvalidInputError"; }
};

struct ConsentRequiredError : public IngestException
{
	ConsentRequiredError(string message) : IngestException(message) {};
	virtual string type() { return "ConsentRequiredError"; }
};

// object storage is not configured (endpoint, bucket or credentials)
struct StorageUnavailableError : public IngestException
{
	StorageUnavailableError(string message) : IngestException(message) {};
	virtual string type() { return "StorageUnavailableError"; }
};

struct TransportError : public IngestException
{
	// true when no HTTP status was received (connection, TLS, blocked request)
	bool networkFailure;
	// 0 when networkFailure is true
	int httpStatus;

	TransportError(string message, bool networkFailure, int httpStatus = 0)
		: IngestException(message), networkFailure(networkFailure), httpStatus(httpStatus) {};
	virtual string type() { return "TransportError"; }
};

struct ResolutionError : public IngestException
{
	ResolutionError(string message) : IngestException(message) {};
	virtual string type() { return "ResolutionError"; }
};

struct IncompleteUploadError : public IngestException
{
	IncompleteUploadError(string message) : IngestException(message) {};
	virtual string type() { return "IncompleteUploadError"; }
};

struct ProcessingError : public IngestException
{
	ProcessingError(string message) : IngestException(message) {};
	virtual string type() { return "ProcessingError"; }
};

struct JobNotFound : public IngestException
{
	JobNotFound(string message) : IngestException(message) {};
	virtual string type() { return "JobNotFound"; }
};

struct InvalidTransition : public IngestException
{
	InvalidTransition(string message) : IngestException(message) {};
	virtual string type() { return "InvalidTransition"; }
};

struct UploadCancelled : public IngestException
{
	UploadCancelled(string message) : IngestException(message) {};
	virtual string type() { return "UploadCancelled"; }
};

#endif
