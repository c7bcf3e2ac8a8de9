#ifndef TIMELAPSE_ERRORS_H
#define TIMELAPSE_ERRORS_H

#include <stdexcept>
#include <string>

//
// Everything that can go wrong during a render is fatal for the whole run.
// Each stage throws one of these, carrying the offending path or timestamp
// in the message, and nothing catches them until main().
//
class TimelapseError : public std::runtime_error
{
public:
	explicit TimelapseError( const std::string &msg ) : std::runtime_error(msg) {}
};

// a discovered image name did not start with YYYYMMDDHHMM
class MalformedFilename : public TimelapseError
{
public:
	explicit MalformedFilename( const std::string &msg ) : TimelapseError(msg) {}
};

// nearest-image lookup against an index with nothing in it.
class EmptyIndex : public TimelapseError
{
public:
	explicit EmptyIndex( const std::string &msg ) : TimelapseError(msg) {}
};

class CropOutOfBounds : public TimelapseError
{
public:
	explicit CropOutOfBounds( const std::string &msg ) : TimelapseError(msg) {}
};

class DecodeFailure : public TimelapseError
{
public:
	explicit DecodeFailure( const std::string &msg ) : TimelapseError(msg) {}
};

// all source images are expected to share the size of the first one we decode.
class DimensionMismatch : public DecodeFailure
{
public:
	explicit DimensionMismatch( const std::string &msg ) : DecodeFailure(msg) {}
};

class SinkWriteFailure : public TimelapseError
{
public:
	explicit SinkWriteFailure( const std::string &msg ) : TimelapseError(msg) {}
};

#endif
